#include "services/recommender/recommendation_service.h"
#include "core/catalog/book_catalog.h"
#include "core/context/context_encoder.h"
#include "core/feedback/reward_policy.h"
#include "core/shared/logging.h"

#include <QJsonArray>

namespace folio {

namespace {

QJsonObject errorToJson(const ErrorInfo& error)
{
    QJsonObject json;
    json[QStringLiteral("kind")] = errorKindToString(error.kind);
    json[QStringLiteral("code")] = error.code;
    if (!error.message.isEmpty()) {
        json[QStringLiteral("message")] = error.message;
    }
    return json;
}

bool isCancelled(const std::atomic<bool>* cancelFlag)
{
    return cancelFlag && cancelFlag->load();
}

StatsAggregator::Config statsConfig(const Settings& settings)
{
    StatsAggregator::Config config;
    config.alpha = settings.alpha;
    config.confidenceZ = settings.confidenceZ;
    config.minSamplesForBest = settings.minSamplesForBest;
    config.minInteractionsForActive = settings.minInteractionsForActive;
    return config;
}

} // namespace

QJsonObject RecommendationResult::toJson() const
{
    QJsonArray bookArray;
    for (const RankedBook& book : books) {
        QJsonObject entry;
        entry[QStringLiteral("bookId")] = book.bookId;
        entry[QStringLiteral("rank")] = book.rank;
        entry[QStringLiteral("score")] = book.score;
        if (book.impressionId > 0) {
            entry[QStringLiteral("impressionId")] = static_cast<double>(book.impressionId);
        }
        bookArray.append(entry);
    }

    QJsonObject json;
    json[QStringLiteral("books")] = bookArray;
    json[QStringLiteral("armUsed")] = armUsed;
    json[QStringLiteral("fallback")] = fallback;
    json[QStringLiteral("diagnostics")] = diagnostics;
    return json;
}

QJsonObject InteractionAck::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("accepted")] = accepted;
    if (accepted) {
        json[QStringLiteral("actionId")] = static_cast<double>(actionId);
    } else {
        json[QStringLiteral("error")] = errorToJson(error);
    }
    return json;
}

RecommendationService::RecommendationService(RewardStore& store, Settings settings)
    : m_store(store)
    , m_settings(std::move(settings))
    , m_registry(&store, m_settings.arms, kContextDim, m_settings.maxCachedScopes)
    , m_selector(m_settings.alpha)
    , m_updater(m_registry, &store)
    , m_stats(statsConfig(m_settings))
    , m_recorder(store)
    , m_attribution(store, RewardPolicy::fromSettings(m_settings), &m_updater)
    , m_strategies(createDefaultStrategies(m_similarity, &store))
{
    LOG_INFO(folioCore, "Recommendation service ready (%d arms, alpha=%.3f)",
             static_cast<int>(m_settings.arms.size()), m_settings.alpha);
}

QStringList RecommendationService::selectableArms() const
{
    QStringList arms;
    for (const QString& armId : m_settings.arms) {
        if (m_strategies.count(armId) > 0) {
            arms.append(armId);
        }
    }
    return arms;
}

RecommendationResult RecommendationService::fallbackResult(const QVector<BookCandidate>& candidates,
                                                           int limit,
                                                           const ErrorInfo& cause,
                                                           QJsonObject diagnostics) const
{
    RecommendationResult result;
    result.books = rankByPopularity(candidates, limit);
    result.armUsed = QString::fromLatin1(kFallbackArmId);
    result.fallback = true;
    if (cause.isError()) {
        diagnostics[QStringLiteral("error")] = errorToJson(cause);
    }
    diagnostics[QStringLiteral("impressionsRecorded")] = false;
    result.diagnostics = diagnostics;
    return result;
}

RecommendationResult RecommendationService::selectRecommendation(
    const ContextAttributes& context,
    const QVector<BookCandidate>& candidates,
    const QString& userId,
    const QString& sessionId,
    int limit,
    const std::atomic<bool>* cancelFlag)
{
    if (limit <= 0) {
        limit = m_settings.recommendationLimit;
    }

    Identity identity;
    identity.userId = userId.trimmed();
    identity.sessionId = sessionId.trimmed();

    QJsonObject diagnostics;
    diagnostics[QStringLiteral("scope")] = identity.modelScope();
    diagnostics[QStringLiteral("candidateCount")] = candidates.size();

    ErrorInfo error;
    if (!ContextEncoder::validate(context, &error)) {
        LOG_WARN(folioCore, "Rejected context (%s), serving popularity ranking",
                 qUtf8Printable(error.code));
        return fallbackResult(candidates, limit, error, diagnostics);
    }

    const ContextVector contextVector = ContextEncoder::encode(context, !identity.userId.isEmpty());
    diagnostics[QStringLiteral("contextSignature")] = ContextEncoder::signature(context);

    if (isCancelled(cancelFlag)) {
        diagnostics[QStringLiteral("cancelled")] = true;
        return fallbackResult(candidates, limit, ErrorInfo(), diagnostics);
    }

    const std::optional<ArmSelection> selection =
        m_selector.selectArm(m_registry, contextVector, selectableArms(), identity.userId, &error);
    if (!selection) {
        LOG_WARN(folioBandit, "Arm selection failed (%s), serving popularity ranking",
                 qUtf8Printable(error.code));
        return fallbackResult(candidates, limit, error, diagnostics);
    }
    diagnostics[QStringLiteral("selection")] = selection->toJson();

    const auto strategyIt = m_strategies.find(selection->armId);
    if (strategyIt == m_strategies.end()) {
        fail(&error, ErrorKind::NotFound, QStringLiteral("unknown_strategy"), selection->armId);
        return fallbackResult(candidates, limit, error, diagnostics);
    }

    StrategyInput input;
    input.context = context;
    input.contextVector = contextVector;
    input.identity = identity;
    input.candidates = candidates;
    input.limit = limit;
    QVector<RankedBook> ranked = strategyIt->second->rank(input);

    if (isCancelled(cancelFlag)) {
        diagnostics[QStringLiteral("cancelled")] = true;
        return fallbackResult(candidates, limit, ErrorInfo(), diagnostics);
    }

    RecommendationResult result;
    result.armUsed = selection->armId;

    if (!identity.isValid()) {
        // Nothing to attribute actions to; serve the page unrecorded.
        diagnostics[QStringLiteral("impressionsRecorded")] = false;
        result.books = ranked;
        result.diagnostics = diagnostics;
        return result;
    }

    QVector<ImpressionRecord> impressions;
    impressions.reserve(ranked.size());
    for (const RankedBook& book : ranked) {
        ImpressionRecord impression;
        impression.identity = identity;
        impression.bookId = book.bookId;
        impression.contextVector = contextVector;
        impression.armId = selection->armId;
        impression.rank = book.rank;
        impression.score = book.score;
        QJsonObject metadata;
        metadata[QStringLiteral("ucbScore")] = selection->ucbScore;
        metadata[QStringLiteral("predictedReward")] = selection->predictedReward;
        metadata[QStringLiteral("explorationLevel")] = selection->explorationLevel;
        impression.metadata = metadata;
        impressions.append(impression);
    }

    const std::optional<QVector<int64_t>> ids = m_recorder.recordImpressions(impressions, &error);
    if (!ids) {
        LOG_ERROR(folioCore, "Failed to record impressions (%s), serving popularity ranking",
                  qUtf8Printable(error.code));
        return fallbackResult(candidates, limit, error, diagnostics);
    }
    for (int i = 0; i < ranked.size() && i < ids->size(); ++i) {
        ranked[i].impressionId = ids->at(i);
    }

    diagnostics[QStringLiteral("impressionsRecorded")] = true;
    result.books = ranked;
    result.diagnostics = diagnostics;
    LOG_DEBUG(folioCore, "Served %d books from arm %s for scope %s",
              static_cast<int>(ranked.size()), qUtf8Printable(result.armUsed),
              qUtf8Printable(identity.modelScope()));
    return result;
}

InteractionAck RecommendationService::recordInteraction(const QString& bookId,
                                                        const QString& actionType,
                                                        std::optional<double> actionValue,
                                                        const QString& userId,
                                                        const QString& sessionId,
                                                        const QDateTime& timestamp)
{
    Identity identity;
    identity.userId = userId.trimmed();
    identity.sessionId = sessionId.trimmed();

    InteractionAck ack;
    const std::optional<int64_t> actionId =
        m_recorder.recordAction(identity, bookId, actionType, actionValue, timestamp, &ack.error);
    if (!actionId) {
        return ack;
    }
    ack.accepted = true;
    ack.actionId = *actionId;
    return ack;
}

AttributionSummary RecommendationService::runAttributionBatch(double windowHours, qint64 nowMs)
{
    if (windowHours <= 0.0) {
        windowHours = m_settings.batchWindowHours;
    }
    return m_attribution.attributeRewards(windowHours, nowMs);
}

void RecommendationService::requestAttributionStop()
{
    m_attribution.requestStop();
}

BanditStatistics RecommendationService::getArmStatistics(const QString& userId)
{
    Identity identity;
    identity.userId = userId.trimmed();
    const QString scope = identity.modelScope();
    return m_stats.aggregate(scope, m_registry.snapshot(scope));
}

std::optional<RewardStore::MergeCounts> RecommendationService::mergeIdentities(
    const QString& sessionId, const QString& userId, ErrorInfo* errorOut)
{
    if (sessionId.trimmed().isEmpty() || userId.trimmed().isEmpty()) {
        fail(errorOut, ErrorKind::Validation, QStringLiteral("identity_required"),
             QStringLiteral("merge needs both a session id and a user id"));
        return std::nullopt;
    }

    const std::optional<RewardStore::MergeCounts> counts =
        m_store.mergeIdentities(sessionId.trimmed(), userId.trimmed(), errorOut);
    if (!counts) {
        return std::nullopt;
    }

    // Events that moved scope are applied to the user's arms right away.
    if (counts->rewardEvents > 0) {
        const ApplySummary applied = m_updater.applyPendingRewards();
        LOG_INFO(folioReward, "Applied %d merged reward events (%d errors)",
                 applied.applied, applied.errors);
    }
    return counts;
}

SimilarityStats RecommendationService::rebuildSimilarityIndex(BookCatalog& catalog)
{
    m_similarity.rebuildFromCatalog(catalog);
    return m_similarity.stats();
}

bool RecommendationService::resetArms(const QString& userId, ErrorInfo* errorOut)
{
    return m_registry.reset(userId.trimmed(), errorOut);
}

} // namespace folio
