#include "core/bandit/stats_aggregator.h"
#include "core/bandit/arm_registry.h"

#include <QDateTime>
#include <QJsonArray>

#include <algorithm>
#include <cmath>

namespace folio {

namespace {

constexpr double kConfidenceSaturation = 50.0;

} // namespace

QJsonObject ArmStatistics::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("armId")] = armId;
    json[QStringLiteral("armName")] = armName;
    json[QStringLiteral("interactionCount")] = static_cast<double>(interactionCount);
    json[QStringLiteral("totalReward")] = totalReward;
    json[QStringLiteral("averageReward")] = averageReward;
    json[QStringLiteral("confidenceInterval")] = QJsonArray{confidenceLower, confidenceUpper};
    json[QStringLiteral("rewardVariance")] = rewardVariance;
    json[QStringLiteral("modelConfidence")] = modelConfidence;
    json[QStringLiteral("lifecycle")] = armLifecycleToString(lifecycle);
    json[QStringLiteral("degraded")] = degraded;
    json[QStringLiteral("lastUpdated")] = updatedAtMs > 0
        ? QDateTime::fromMSecsSinceEpoch(updatedAtMs).toUTC().toString(Qt::ISODateWithMs)
        : QString();
    return json;
}

QJsonObject BanditStatistics::toJson() const
{
    QJsonArray armArray;
    for (const ArmStatistics& arm : arms) {
        armArray.append(arm.toJson());
    }
    QJsonObject json;
    json[QStringLiteral("scope")] = scope;
    json[QStringLiteral("arms")] = armArray;
    json[QStringLiteral("totalInteractions")] = static_cast<double>(totalInteractions);
    json[QStringLiteral("explorationRate")] = explorationRate;
    json[QStringLiteral("bestPerformingArm")] = bestArm.has_value()
        ? QJsonValue(*bestArm) : QJsonValue(QJsonValue::Null);
    return json;
}

StatsAggregator::StatsAggregator() = default;

StatsAggregator::StatsAggregator(Config config)
    : m_config(config)
{
}

ArmStatistics StatsAggregator::armStatistics(const ArmSnapshot& arm) const
{
    ArmStatistics stats;
    stats.armId = arm.armId;
    stats.armName = armDisplayName(arm.armId);
    stats.interactionCount = arm.interactionCount;
    stats.totalReward = arm.cumulativeReward;
    stats.lifecycle = arm.lifecycle(m_config.minInteractionsForActive);
    stats.degraded = arm.degraded;
    stats.updatedAtMs = arm.updatedAtMs;

    const double n = static_cast<double>(arm.interactionCount);
    stats.averageReward = arm.interactionCount > 0 ? arm.cumulativeReward / n : 0.0;
    stats.modelConfidence = std::min(1.0, n / kConfidenceSaturation);

    if (arm.interactionCount >= 2) {
        const double centered = arm.cumulativeSquaredReward - n * stats.averageReward * stats.averageReward;
        stats.rewardVariance = std::max(0.0, centered / (n - 1.0));
    } else {
        stats.rewardVariance = 1.0;
    }

    const double d = static_cast<double>(std::max<Eigen::Index>(1, arm.aInverse.rows()));
    const double trace = std::max(0.0, arm.aInverse.trace());
    const double halfWidth = m_config.confidenceZ * std::sqrt(stats.rewardVariance * trace / d);
    stats.confidenceLower = std::max(0.0, stats.averageReward - halfWidth);
    stats.confidenceUpper = stats.averageReward + halfWidth;
    return stats;
}

BanditStatistics StatsAggregator::aggregate(const QString& scope,
                                            const QVector<ArmSnapshot>& arms) const
{
    BanditStatistics result;
    result.scope = scope;
    result.explorationRate = m_config.alpha;
    result.arms.reserve(arms.size());

    const ArmStatistics* best = nullptr;
    for (const ArmSnapshot& arm : arms) {
        result.arms.append(armStatistics(arm));
        result.totalInteractions += arm.interactionCount;
    }
    for (const ArmStatistics& stats : result.arms) {
        if (stats.interactionCount < m_config.minSamplesForBest) {
            continue;
        }
        if (!best || stats.averageReward > best->averageReward
            || (stats.averageReward == best->averageReward && stats.armId < best->armId)) {
            best = &stats;
        }
    }
    if (best) {
        result.bestArm = best->armId;
    }
    return result;
}

} // namespace folio
