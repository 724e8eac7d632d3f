#include "core/strategy/strategies.h"
#include "core/context/context_encoder.h"
#include "core/similarity/similarity_engine.h"
#include "core/store/reward_store.h"
#include "core/shared/logging.h"

#include <QSet>

#include <algorithm>
#include <cmath>

namespace folio {

namespace {

constexpr double kMoodWeight = 0.6;
constexpr double kSituationWeight = 0.2;
constexpr double kGoalWeight = 0.2;
constexpr double kBasicSimilarityWeight = 0.7;
constexpr double kBasicPopularityWeight = 0.3;
constexpr double kGlobalSaveWeight = 0.1;

double computeRrfContribution(double weight, int rank, int rrfK)
{
    if (rank <= 0) {
        return 0.0;
    }
    const int denom = std::max(1, rrfK) + rank;
    return weight / static_cast<double>(denom);
}

double blockCosine(const QVector<double>& a, const QVector<double>& b)
{
    if (a.isEmpty() || b.isEmpty() || a.size() != b.size()) {
        return 0.0;
    }
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (int i = 0; i < a.size(); ++i) {
        dot += a[i] * b[i];
        normA += a[i] * a[i];
        normB += b[i] * b[i];
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(normA) * std::sqrt(normB));
}

QSet<QString> normalizedTags(const BookCandidate& book)
{
    QSet<QString> tags;
    for (const QString& tag : book.tags) {
        const QString normalized = tag.trimmed().toLower();
        if (!normalized.isEmpty()) {
            tags.insert(normalized);
        }
    }
    return tags;
}

double maxPopularity(const QVector<BookCandidate>& candidates)
{
    double maxValue = 0.0;
    for (const BookCandidate& book : candidates) {
        maxValue = std::max(maxValue, book.popularity);
    }
    return maxValue;
}

} // namespace

QVector<RankedBook> finalizeRanking(QVector<RankedBook> scored, int limit)
{
    std::stable_sort(scored.begin(), scored.end(), [](const RankedBook& lhs, const RankedBook& rhs) {
        if (lhs.score != rhs.score) {
            return lhs.score > rhs.score;
        }
        return lhs.bookId < rhs.bookId;
    });
    if (limit >= 0 && scored.size() > limit) {
        scored.resize(limit);
    }
    for (int i = 0; i < scored.size(); ++i) {
        scored[i].rank = i + 1;
    }
    return scored;
}

QVector<RankedBook> rankByPopularity(const QVector<BookCandidate>& candidates, int limit)
{
    QVector<RankedBook> scored;
    scored.reserve(candidates.size());
    for (const BookCandidate& book : candidates) {
        RankedBook ranked;
        ranked.bookId = book.bookId;
        ranked.score = std::isfinite(book.popularity) ? book.popularity : 0.0;
        scored.append(ranked);
    }
    return finalizeRanking(std::move(scored), limit);
}

QString contextQueryText(const ContextAttributes& context)
{
    QStringList parts;
    for (const QString& value : {context.mood, context.situation, context.goal}) {
        const QString words = value.trimmed().toLower().replace(QLatin1Char('_'), QLatin1Char(' '));
        if (!words.isEmpty()) {
            parts.append(words);
        }
    }
    return parts.join(QLatin1Char(' '));
}

// ── Semantic similarity ─────────────────────────────────────

SemanticSimilarityStrategy::SemanticSimilarityStrategy(const SimilarityEngine& engine)
    : m_engine(engine)
{
}

QString SemanticSimilarityStrategy::armId() const
{
    return QStringLiteral("semantic_similarity");
}

QVector<RankedBook> SemanticSimilarityStrategy::rank(const StrategyInput& input) const
{
    const std::shared_ptr<const SimilarityIndex> index = m_engine.snapshot();
    const SparseVector queryVector = index->vectorize(contextQueryText(input.context));

    QVector<RankedBook> scored;
    scored.reserve(input.candidates.size());
    for (const BookCandidate& book : input.candidates) {
        SparseVector bookVector;
        if (const std::optional<SparseVector> indexed = index->vectorFor(book.bookId)) {
            bookVector = *indexed;
        } else {
            bookVector = index->vectorize(book.title + QLatin1Char(' ') + book.author
                                          + QLatin1Char(' ') + book.text + QLatin1Char(' ')
                                          + book.tags.join(QLatin1Char(' ')));
        }
        RankedBook ranked;
        ranked.bookId = book.bookId;
        ranked.score = SimilarityIndex::cosine(queryVector, bookVector);
        scored.append(ranked);
    }
    return finalizeRanking(std::move(scored), input.limit);
}

// ── Contextual mood ─────────────────────────────────────────

QString ContextualMoodStrategy::armId() const
{
    return QStringLiteral("contextual_mood");
}

QVector<RankedBook> ContextualMoodStrategy::rank(const StrategyInput& input) const
{
    const QVector<double> contextMood = ContextEncoder::moodBlock(input.context.mood);
    const QString situation = input.context.situation.trimmed().toLower();
    const QString goal = input.context.goal.trimmed().toLower();

    QVector<RankedBook> scored;
    scored.reserve(input.candidates.size());
    for (const BookCandidate& book : input.candidates) {
        const QSet<QString> tags = normalizedTags(book);

        double moodScore = 0.0;
        for (const QString& tag : tags) {
            moodScore = std::max(moodScore, blockCosine(contextMood, ContextEncoder::moodBlock(tag)));
        }

        RankedBook ranked;
        ranked.bookId = book.bookId;
        ranked.score = kMoodWeight * moodScore
            + (!situation.isEmpty() && tags.contains(situation) ? kSituationWeight : 0.0)
            + (!goal.isEmpty() && tags.contains(goal) ? kGoalWeight : 0.0);
        scored.append(ranked);
    }
    return finalizeRanking(std::move(scored), input.limit);
}

// ── Trending ────────────────────────────────────────────────

QString TrendingPopularStrategy::armId() const
{
    return QStringLiteral("trending_popular");
}

QVector<RankedBook> TrendingPopularStrategy::rank(const StrategyInput& input) const
{
    return rankByPopularity(input.candidates, input.limit);
}

// ── Collaborative filtering ─────────────────────────────────

CollaborativeFilteringStrategy::CollaborativeFilteringStrategy(RewardStore* store)
    : m_store(store)
{
}

QString CollaborativeFilteringStrategy::armId() const
{
    return QStringLiteral("collaborative_filtering");
}

QVector<RankedBook> CollaborativeFilteringStrategy::rank(const StrategyInput& input) const
{
    QHash<QString, int> coSaves;
    QHash<QString, int> saves;
    if (m_store) {
        if (input.identity.isValid()) {
            coSaves = m_store->coSaveCounts(input.identity);
        }
        saves = m_store->saveCounts();
    }

    QVector<RankedBook> scored;
    scored.reserve(input.candidates.size());
    for (const BookCandidate& book : input.candidates) {
        RankedBook ranked;
        ranked.bookId = book.bookId;
        ranked.score = coSaves.value(book.bookId, 0)
            + kGlobalSaveWeight * saves.value(book.bookId, 0);
        scored.append(ranked);
    }
    return finalizeRanking(std::move(scored), input.limit);
}

// ── Basic contextual ────────────────────────────────────────

ContextualBasicStrategy::ContextualBasicStrategy(const SimilarityEngine& engine)
    : m_semantic(engine)
{
}

QString ContextualBasicStrategy::armId() const
{
    return QStringLiteral("contextual_basic");
}

QVector<RankedBook> ContextualBasicStrategy::rank(const StrategyInput& input) const
{
    StrategyInput all = input;
    all.limit = input.candidates.size();
    const QVector<RankedBook> similarity = m_semantic.rank(all);

    QHash<QString, double> similarityById;
    for (const RankedBook& book : similarity) {
        similarityById.insert(book.bookId, book.score);
    }

    const double popularityCeiling = maxPopularity(input.candidates);
    QVector<RankedBook> scored;
    scored.reserve(input.candidates.size());
    for (const BookCandidate& book : input.candidates) {
        const double popularity = popularityCeiling > 0.0
            ? std::max(0.0, book.popularity) / popularityCeiling : 0.0;
        RankedBook ranked;
        ranked.bookId = book.bookId;
        ranked.score = kBasicSimilarityWeight * similarityById.value(book.bookId, 0.0)
            + kBasicPopularityWeight * popularity;
        scored.append(ranked);
    }
    return finalizeRanking(std::move(scored), input.limit);
}

// ── Personalized mix ────────────────────────────────────────

PersonalizedMixStrategy::PersonalizedMixStrategy(std::vector<Component> components, int rrfK)
    : m_components(std::move(components))
    , m_rrfK(rrfK)
{
}

QString PersonalizedMixStrategy::armId() const
{
    return QStringLiteral("personalized_mix");
}

QVector<RankedBook> PersonalizedMixStrategy::rank(const StrategyInput& input) const
{
    StrategyInput all = input;
    all.limit = input.candidates.size();

    QHash<QString, double> fused;
    for (const BookCandidate& book : input.candidates) {
        fused.insert(book.bookId, 0.0);
    }
    for (const Component& component : m_components) {
        if (!component.strategy) {
            continue;
        }
        for (const RankedBook& book : component.strategy->rank(all)) {
            fused[book.bookId] += computeRrfContribution(component.weight, book.rank, m_rrfK);
        }
    }

    QVector<RankedBook> scored;
    scored.reserve(fused.size());
    for (auto it = fused.constBegin(); it != fused.constEnd(); ++it) {
        RankedBook ranked;
        ranked.bookId = it.key();
        ranked.score = it.value();
        scored.append(ranked);
    }
    return finalizeRanking(std::move(scored), input.limit);
}

StrategySet createDefaultStrategies(const SimilarityEngine& engine, RewardStore* store)
{
    auto semantic = std::make_shared<const SemanticSimilarityStrategy>(engine);
    auto mood = std::make_shared<const ContextualMoodStrategy>();
    auto trending = std::make_shared<const TrendingPopularStrategy>();
    auto collaborative = std::make_shared<const CollaborativeFilteringStrategy>(store);
    auto basic = std::make_shared<const ContextualBasicStrategy>(engine);
    auto mix = std::make_shared<const PersonalizedMixStrategy>(
        std::vector<PersonalizedMixStrategy::Component>{
            {semantic, 1.0},
            {mood, 1.0},
            {collaborative, 0.8},
            {trending, 0.6},
        });

    StrategySet strategies;
    for (const std::shared_ptr<const RecommendationStrategy>& strategy :
         std::vector<std::shared_ptr<const RecommendationStrategy>>{
             semantic, mood, trending, collaborative, mix, basic}) {
        strategies.emplace(strategy->armId(), strategy);
    }
    LOG_DEBUG(folioCore, "Created %d recommendation strategies", static_cast<int>(strategies.size()));
    return strategies;
}

} // namespace folio
