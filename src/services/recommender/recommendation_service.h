#pragma once

#include "core/bandit/arm_registry.h"
#include "core/bandit/linucb_selector.h"
#include "core/bandit/model_updater.h"
#include "core/bandit/stats_aggregator.h"
#include "core/feedback/attribution_engine.h"
#include "core/feedback/reward_recorder.h"
#include "core/shared/errors.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"
#include "core/similarity/similarity_engine.h"
#include "core/store/reward_store.h"
#include "core/strategy/strategies.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>

#include <atomic>
#include <optional>

namespace folio {

class BookCatalog;

// Arm id reported when the non-personalised ranking was served.
constexpr const char* kFallbackArmId = "fallback_popular";

struct RecommendationResult {
    QVector<RankedBook> books;     // impressionId set when the page was recorded
    QString armUsed;
    bool fallback = false;
    QJsonObject diagnostics;

    QJsonObject toJson() const;
};

struct InteractionAck {
    bool accepted = false;
    int64_t actionId = 0;
    ErrorInfo error;

    QJsonObject toJson() const;
};

// RecommendationService -- caller-facing API of the recommender core.
//
// Composes the context encoder, arm registry, LinUCB selector, strategies,
// recorder, attribution batch and statistics over one RewardStore. Every
// method is safe to call from several threads; the attribution batch may run
// on a background thread while selections and recordings continue.
class RecommendationService {
public:
    RecommendationService(RewardStore& store, Settings settings);

    // Picks an arm for the context, ranks the candidates with it and records
    // one impression per returned book. Never fails: invalid input, storage
    // errors and cancellation all yield the popularity ranking with the cause
    // in diagnostics. limit <= 0 uses the configured recommendation limit.
    RecommendationResult selectRecommendation(const ContextAttributes& context,
                                              const QVector<BookCandidate>& candidates,
                                              const QString& userId,
                                              const QString& sessionId,
                                              int limit = 0,
                                              const std::atomic<bool>* cancelFlag = nullptr);

    InteractionAck recordInteraction(const QString& bookId,
                                     const QString& actionType,
                                     std::optional<double> actionValue,
                                     const QString& userId,
                                     const QString& sessionId,
                                     const QDateTime& timestamp = QDateTime());

    // windowHours <= 0 uses the configured batch window.
    AttributionSummary runAttributionBatch(double windowHours = 0.0, qint64 nowMs = 0);
    void requestAttributionStop();

    // Statistics of the user's arms, or of the anonymous scope when empty.
    BanditStatistics getArmStatistics(const QString& userId = QString());

    std::optional<RewardStore::MergeCounts> mergeIdentities(const QString& sessionId,
                                                            const QString& userId,
                                                            ErrorInfo* errorOut = nullptr);

    SimilarityStats rebuildSimilarityIndex(BookCatalog& catalog);

    // Resets the arms of one user, or of every scope when userId is empty.
    bool resetArms(const QString& userId = QString(), ErrorInfo* errorOut = nullptr);

    const Settings& settings() const { return m_settings; }
    SimilarityEngine& similarity() { return m_similarity; }
    ArmRegistry& registry() { return m_registry; }
    AttributionEngine& attribution() { return m_attribution; }

private:
    RecommendationResult fallbackResult(const QVector<BookCandidate>& candidates,
                                        int limit,
                                        const ErrorInfo& cause,
                                        QJsonObject diagnostics) const;
    QStringList selectableArms() const;

    RewardStore& m_store;
    Settings m_settings;
    ArmRegistry m_registry;
    LinUCBSelector m_selector;
    ModelUpdater m_updater;
    StatsAggregator m_stats;
    RewardRecorder m_recorder;
    AttributionEngine m_attribution;
    SimilarityEngine m_similarity;
    StrategySet m_strategies;
};

} // namespace folio
