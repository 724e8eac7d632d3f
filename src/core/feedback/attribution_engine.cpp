#include "core/feedback/attribution_engine.h"
#include "core/store/reward_store.h"
#include "core/shared/logging.h"

#include <QDateTime>

#include <cmath>
#include <optional>
#include <utility>

namespace folio {

namespace {

constexpr int kPageSize = 500;
constexpr qint64 kMsPerHour = 3600LL * 1000LL;

const QString kCheckpointKey = QStringLiteral("attribution_checkpoint_ms");
const QString kCheckpointIdKey = QStringLiteral("attribution_checkpoint_id");
const QString kResumeKey = QStringLiteral("attribution_resume_pending");
const QString kLastRunKey = QStringLiteral("last_attribution_run_ms");

const QString kNoImpressionCode = QStringLiteral("no_qualifying_impression");

struct Checkpoint {
    qint64 createdAtMs = 0;
    int64_t actionId = 0;
};

// Cursor left behind by a batch that did not finish, if any.
std::optional<Checkpoint> pendingCheckpoint(RewardStore& store)
{
    if (store.getSetting(kResumeKey).value_or(QString()) != QLatin1String("1")) {
        return std::nullopt;
    }
    bool msOk = false;
    bool idOk = false;
    Checkpoint checkpoint;
    checkpoint.createdAtMs = store.getSetting(kCheckpointKey).value_or(QString()).toLongLong(&msOk);
    checkpoint.actionId = store.getSetting(kCheckpointIdKey).value_or(QString()).toLongLong(&idOk);
    if (!msOk || !idOk || checkpoint.createdAtMs <= 0) {
        return std::nullopt;
    }
    return checkpoint;
}

bool isWellFormed(const ActionRecord& action)
{
    if (!action.identity.isValid() || action.bookId.isEmpty() || action.createdAtMs <= 0) {
        return false;
    }
    if (action.actionType == ActionType::Rate) {
        return action.actionValue.has_value() && *action.actionValue >= 1.0
            && *action.actionValue <= 5.0;
    }
    return true;
}

} // namespace

QJsonObject AttributionSummary::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("processed")] = processed;
    json[QStringLiteral("updated")] = updated;
    json[QStringLiteral("unmatched")] = unmatched;
    json[QStringLiteral("conflicts")] = conflicts;
    json[QStringLiteral("errors")] = errors;
    json[QStringLiteral("interrupted")] = interrupted;
    json[QStringLiteral("resumed")] = resumed;
    json[QStringLiteral("alreadyRunning")] = alreadyRunning;
    json[QStringLiteral("checkpointMs")] = static_cast<double>(checkpointMs);
    json[QStringLiteral("modelUpdates")] = modelUpdates.toJson();
    return json;
}

AttributionEngine::AttributionEngine(RewardStore& store, RewardPolicy policy, ModelUpdater* updater)
    : m_store(store)
    , m_policy(policy)
    , m_updater(updater)
{
}

void AttributionEngine::requestStop()
{
    m_stopRequested.store(true);
}

void AttributionEngine::setProgressCallback(ProgressCallback callback)
{
    m_progressCallback = std::move(callback);
}

bool AttributionEngine::attributeAction(const ActionRecord& action, qint64 nowMs,
                                        ErrorInfo* errorOut)
{
    if (!isWellFormed(action)) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("malformed_action"),
                    QStringLiteral("Action %1 is malformed").arg(action.id));
    }

    ErrorInfo lookupError;
    const std::optional<ImpressionRecord> impression = m_store.findAttributionCandidate(
        action.identity, action.bookId, action.createdAtMs, m_policy.windowMs(), &lookupError);
    if (lookupError.isError()) {
        if (errorOut) {
            *errorOut = lookupError;
        }
        return false;
    }
    if (!impression.has_value()) {
        return fail(errorOut, ErrorKind::NotFound, kNoImpressionCode);
    }

    const qint64 elapsedMs = action.createdAtMs - impression->createdAtMs;
    const RewardContribution contribution =
        m_policy.contribution(action, impression->saveCredit, elapsedMs);

    RewardStore::AttributionWrite write;
    write.actionId = action.id;
    write.impressionId = impression->id;
    write.contribution = contribution.reward;
    write.saveCreditDelta = contribution.saveCreditDelta;
    write.scope = impression->identity.modelScope();
    write.armId = impression->armId;
    write.attributedAtMs = nowMs;
    write.queueRewardEvent = contribution.reward != 0.0;

    if (!m_store.commitAttribution(write, errorOut).has_value()) {
        return false;
    }

    LOG_DEBUG(folioReward, "Attributed %s %lld to impression %lld (arm %s, %+.4f after %.2f h)",
              qUtf8Printable(actionTypeToString(action.actionType)),
              static_cast<long long>(action.id), static_cast<long long>(impression->id),
              qUtf8Printable(impression->armId), contribution.reward,
              static_cast<double>(elapsedMs) / kMsPerHour);
    return true;
}

AttributionSummary AttributionEngine::attributeRewards(double windowHours, qint64 nowMs)
{
    AttributionSummary summary;

    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        LOG_WARN(folioReward, "Attribution batch already running; skipping");
        summary.alreadyRunning = true;
        return summary;
    }
    m_stopRequested.store(false);

    if (nowMs <= 0) {
        nowMs = QDateTime::currentMSecsSinceEpoch();
    }
    const qint64 sinceMs = nowMs - static_cast<qint64>(std::llround(windowHours * kMsPerHour));

    LOG_INFO(folioReward, "Attribution batch started (window %.1f h)", windowHours);

    qint64 cursorMs = sinceMs;
    int64_t cursorId = 0;
    const std::optional<Checkpoint> checkpoint = pendingCheckpoint(m_store);
    if (checkpoint.has_value() && checkpoint->createdAtMs >= sinceMs) {
        cursorMs = checkpoint->createdAtMs;
        cursorId = checkpoint->actionId;
        summary.resumed = true;
        summary.checkpointMs = cursorMs;
        LOG_INFO(folioReward, "Resuming unfinished batch after action %lld (%lld)",
                 static_cast<long long>(cursorId), static_cast<long long>(cursorMs));
    }
    if (!m_store.setSetting(kResumeKey, QStringLiteral("1"))) {
        LOG_WARN(folioReward, "Failed to mark attribution batch as started");
    }

    bool scanComplete = false;
    while (!summary.interrupted) {
        ErrorInfo pageError;
        const QVector<ActionRecord> page =
            m_store.unattributedActionsSince(sinceMs, cursorMs, cursorId, kPageSize, &pageError);
        if (pageError.isError()) {
            LOG_ERROR(folioReward, "Failed to read pending actions: %s",
                      qUtf8Printable(pageError.message));
            summary.errors += 1;
            break;
        }
        if (page.isEmpty()) {
            scanComplete = true;
            break;
        }

        for (const ActionRecord& action : page) {
            if (m_stopRequested.load()) {
                summary.interrupted = true;
                break;
            }

            summary.processed += 1;
            cursorMs = action.createdAtMs;
            cursorId = action.id;

            ErrorInfo error;
            if (attributeAction(action, nowMs, &error)) {
                summary.updated += 1;
            } else {
                switch (error.kind) {
                case ErrorKind::NotFound:
                    if (error.code == kNoImpressionCode) {
                        summary.unmatched += 1;
                    } else {
                        LOG_WARN(folioReward, "Impression for action %lld vanished before commit (%s)",
                                 static_cast<long long>(action.id), qUtf8Printable(error.code));
                        summary.errors += 1;
                    }
                    break;
                case ErrorKind::AttributionConflict:
                    LOG_WARN(folioReward, "Action %lld was already attributed",
                             static_cast<long long>(action.id));
                    summary.conflicts += 1;
                    break;
                case ErrorKind::Validation:
                    LOG_WARN(folioReward, "Skipping malformed action %lld",
                             static_cast<long long>(action.id));
                    summary.errors += 1;
                    break;
                default:
                    LOG_ERROR(folioReward, "Attribution of action %lld failed: %s",
                              static_cast<long long>(action.id), qUtf8Printable(error.message));
                    summary.errors += 1;
                    break;
                }
            }
            summary.checkpointMs = cursorMs;

            if (m_progressCallback) {
                m_progressCallback(summary);
            }
        }

        if (cursorId > 0
            && !(m_store.setSetting(kCheckpointKey, QString::number(cursorMs))
                 && m_store.setSetting(kCheckpointIdKey, QString::number(cursorId)))) {
            LOG_WARN(folioReward, "Failed to persist attribution checkpoint");
        }
        if (!summary.interrupted && page.size() < kPageSize) {
            scanComplete = true;
            break;
        }
    }

    if (scanComplete && !m_store.setSetting(kResumeKey, QStringLiteral("0"))) {
        LOG_WARN(folioReward, "Failed to clear attribution resume marker");
    }
    if (!summary.interrupted && m_updater) {
        summary.modelUpdates = m_updater->applyPendingRewards(1000, &m_stopRequested);
    }
    if (!m_store.setSetting(kLastRunKey, QString::number(nowMs))) {
        LOG_WARN(folioReward, "Failed to record attribution run time");
    }

    LOG_INFO(folioReward,
             "Attribution batch done: processed=%d updated=%d unmatched=%d conflicts=%d errors=%d%s%s",
             summary.processed, summary.updated, summary.unmatched, summary.conflicts,
             summary.errors, summary.resumed ? " (resumed)" : "",
             summary.interrupted ? " (interrupted)" : "");

    m_running.store(false);
    return summary;
}

} // namespace folio
