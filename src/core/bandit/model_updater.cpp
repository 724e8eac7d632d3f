#include "core/bandit/model_updater.h"
#include "core/bandit/arm_registry.h"
#include "core/store/reward_store.h"
#include "core/shared/logging.h"

#include <QDateTime>

namespace folio {

namespace {

RewardStore::ArmRow toRow(const QString& scope, const ArmModel& model)
{
    RewardStore::ArmRow row;
    row.scope = scope;
    row.armId = model.armId();
    row.dimension = model.dimension();

    const int d = model.dimension();
    row.aMatrix.resize(d * d);
    Eigen::Map<Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>(
        row.aMatrix.data(), d, d) = model.a();
    row.bVector.resize(d);
    Eigen::Map<Eigen::VectorXd>(row.bVector.data(), d) = model.b();

    row.interactionCount = model.interactionCount();
    row.cumulativeReward = model.cumulativeReward();
    row.cumulativeSquaredReward = model.cumulativeSquaredReward();
    row.degraded = model.isDegraded();
    row.updatedAtMs = model.updatedAtMs();
    return row;
}

} // namespace

QJsonObject ApplySummary::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("applied")] = applied;
    json[QStringLiteral("conflicts")] = conflicts;
    json[QStringLiteral("degraded")] = degraded;
    json[QStringLiteral("errors")] = errors;
    return json;
}

ModelUpdater::ModelUpdater(ArmRegistry& registry, RewardStore* store)
    : m_registry(registry)
    , m_store(store)
{
}

bool ModelUpdater::applyReward(const QString& scope, const QString& armId,
                               const ContextVector& x, double reward, ErrorInfo* errorOut)
{
    return applyAndPersist(scope, armId, x, reward, 0, errorOut);
}

bool ModelUpdater::applyAndPersist(const QString& scope, const QString& armId,
                                   const ContextVector& x, double reward,
                                   int64_t rewardEventId, ErrorInfo* errorOut)
{
    ErrorInfo updateError;
    const bool ok = m_registry.withArm(scope, armId, [&](ArmModel& model) {
        ArmModel next = model;
        ErrorInfo numericError;
        if (!next.update(toEigen(x), reward, &numericError)
            && numericError.kind != ErrorKind::NumericInstability) {
            updateError = numericError;
            return false;
        }

        if (m_store) {
            const RewardStore::ArmRow row = toRow(scope, next);
            const bool persisted = rewardEventId > 0
                ? m_store->saveArmAndMarkApplied(row, rewardEventId,
                                                 QDateTime::currentMSecsSinceEpoch(), &updateError)
                : m_store->saveArm(row, &updateError);
            if (!persisted) {
                return false;
            }
        }

        model = next;
        // Recorded, but the arm now sits out selection.
        if (numericError.isError()) {
            updateError = numericError;
            return false;
        }
        return true;
    }, &updateError);

    if (!ok) {
        if (errorOut) {
            *errorOut = updateError;
        }
        return false;
    }
    if (errorOut) {
        errorOut->clear();
    }
    return true;
}

ApplySummary ModelUpdater::applyPendingRewards(int limit, const std::atomic<bool>* stopFlag)
{
    ApplySummary summary;
    if (!m_store) {
        return summary;
    }

    ErrorInfo error;
    const QVector<RewardEvent> events = m_store->pendingRewardEvents(limit, &error);
    if (error.isError()) {
        LOG_ERROR(folioBandit, "Failed to read pending reward events: %s",
                  qUtf8Printable(error.message));
        summary.errors += 1;
        return summary;
    }

    for (const RewardEvent& event : events) {
        if (stopFlag && stopFlag->load()) {
            LOG_INFO(folioBandit, "Reward application stopped after %d events", summary.applied);
            break;
        }

        ErrorInfo eventError;
        if (applyAndPersist(event.scope, event.armId, event.contextVector, event.reward, event.id,
                            &eventError)) {
            summary.applied += 1;
            continue;
        }

        switch (eventError.kind) {
        case ErrorKind::NumericInstability:
            summary.applied += 1;
            summary.degraded += 1;
            break;
        case ErrorKind::AttributionConflict:
            LOG_WARN(folioBandit, "Reward event %lld already applied",
                     static_cast<long long>(event.id));
            summary.conflicts += 1;
            break;
        default:
            LOG_WARN(folioBandit, "Failed to apply reward event %lld to %s/%s: %s",
                     static_cast<long long>(event.id), qUtf8Printable(event.scope),
                     qUtf8Printable(event.armId), qUtf8Printable(eventError.message));
            summary.errors += 1;
            break;
        }
    }

    LOG_INFO(folioBandit, "Applied %d reward events (%d conflicts, %d degraded, %d errors)",
             summary.applied, summary.conflicts, summary.degraded, summary.errors);
    return summary;
}

} // namespace folio
