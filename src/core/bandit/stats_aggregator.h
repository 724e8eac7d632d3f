#pragma once

#include "core/bandit/arm_model.h"

#include <QJsonObject>
#include <QString>
#include <QVector>

#include <optional>

namespace folio {

struct ArmStatistics {
    QString armId;
    QString armName;
    int64_t interactionCount = 0;
    double totalReward = 0.0;
    double averageReward = 0.0;
    double confidenceLower = 0.0;
    double confidenceUpper = 0.0;
    double rewardVariance = 1.0;
    double modelConfidence = 0.0;   // min(1, n / 50)
    ArmLifecycle lifecycle = ArmLifecycle::Uninitialized;
    bool degraded = false;
    qint64 updatedAtMs = 0;

    QJsonObject toJson() const;
};

struct BanditStatistics {
    QString scope;
    QVector<ArmStatistics> arms;
    int64_t totalInteractions = 0;
    double explorationRate = 0.0;   // alpha
    std::optional<QString> bestArm;

    QJsonObject toJson() const;
};

// StatsAggregator -- per-arm performance summaries.
//
// averageReward = cumulativeReward / n (0 when n == 0). The interval is
//   average +/- z * sqrt(variance * tr(A^-1) / D)
// with the sample variance of the observed rewards (1 with fewer than two
// observations) and the lower bound clamped at 0. The best arm is the highest
// average among arms with at least minSamplesForBest observations.
class StatsAggregator {
public:
    struct Config {
        double alpha = 0.1;
        double confidenceZ = 1.96;
        int minSamplesForBest = 5;
        int minInteractionsForActive = 5;
    };

    StatsAggregator();
    explicit StatsAggregator(Config config);

    ArmStatistics armStatistics(const ArmSnapshot& arm) const;
    BanditStatistics aggregate(const QString& scope, const QVector<ArmSnapshot>& arms) const;

private:
    Config m_config;
};

} // namespace folio
