#pragma once

#include "core/strategy/recommendation_strategy.h"

#include <QHash>

#include <map>
#include <memory>
#include <vector>

namespace folio {

class RewardStore;
class SimilarityEngine;

// Sorts by score descending then bookId ascending, truncates to limit and
// assigns 1-based ranks.
QVector<RankedBook> finalizeRanking(QVector<RankedBook> scored, int limit);

// Non-personalised fallback: candidates by popularity.
QVector<RankedBook> rankByPopularity(const QVector<BookCandidate>& candidates, int limit);

// Free-text description of a context used for semantic matching.
QString contextQueryText(const ContextAttributes& context);

// Content-based: TF-IDF cosine between the context text and each book.
class SemanticSimilarityStrategy : public RecommendationStrategy {
public:
    explicit SemanticSimilarityStrategy(const SimilarityEngine& engine);
    QString armId() const override;
    QVector<RankedBook> rank(const StrategyInput& input) const override;

private:
    const SimilarityEngine& m_engine;
};

// Mood-based: cosine between the context's mood block and the mood tags of
// each book, plus situation and goal tag matches.
class ContextualMoodStrategy : public RecommendationStrategy {
public:
    QString armId() const override;
    QVector<RankedBook> rank(const StrategyInput& input) const override;
};

// Trending: popularity only.
class TrendingPopularStrategy : public RecommendationStrategy {
public:
    QString armId() const override;
    QVector<RankedBook> rank(const StrategyInput& input) const override;
};

// Collaborative: books saved by people who saved the same books.
class CollaborativeFilteringStrategy : public RecommendationStrategy {
public:
    explicit CollaborativeFilteringStrategy(RewardStore* store);
    QString armId() const override;
    QVector<RankedBook> rank(const StrategyInput& input) const override;

private:
    RewardStore* m_store = nullptr;
};

// Basic contextual: similarity blended with normalised popularity.
class ContextualBasicStrategy : public RecommendationStrategy {
public:
    explicit ContextualBasicStrategy(const SimilarityEngine& engine);
    QString armId() const override;
    QVector<RankedBook> rank(const StrategyInput& input) const override;

private:
    SemanticSimilarityStrategy m_semantic;
};

// Personalized mix: reciprocal rank fusion over the other strategies.
class PersonalizedMixStrategy : public RecommendationStrategy {
public:
    struct Component {
        std::shared_ptr<const RecommendationStrategy> strategy;
        double weight = 1.0;
    };

    explicit PersonalizedMixStrategy(std::vector<Component> components, int rrfK = 60);
    QString armId() const override;
    QVector<RankedBook> rank(const StrategyInput& input) const override;

private:
    std::vector<Component> m_components;
    int m_rrfK = 60;
};

using StrategySet = std::map<QString, std::shared_ptr<const RecommendationStrategy>>;

// The six built-in arms keyed by arm id. store may be null, in which case the
// collaborative arm sees no co-save data.
StrategySet createDefaultStrategies(const SimilarityEngine& engine, RewardStore* store);

} // namespace folio
