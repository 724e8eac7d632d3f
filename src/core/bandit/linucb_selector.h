#pragma once

#include "core/bandit/arm_model.h"
#include "core/shared/errors.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace folio {

class ArmRegistry;

struct ArmScore {
    QString armId;
    double predictedReward = 0.0;
    double confidenceBonus = 0.0;
    double ucbScore = 0.0;
    double explorationLevel = 0.0;
    int64_t interactionCount = 0;
    bool degraded = false;

    QJsonObject toJson() const;
};

struct ArmSelection {
    QString armId;
    QString scope;
    double predictedReward = 0.0;
    double confidenceBonus = 0.0;
    double ucbScore = 0.0;
    double explorationLevel = 0.0;
    QVector<ArmScore> scores; // every considered arm, in input order

    QJsonObject toJson() const;
};

// LinUCBSelector -- picks the arm with the highest upper confidence bound.
//
//   predictedReward = theta . x
//   confidenceBonus = sqrt(x^T A^-1 x)
//   ucbScore        = predictedReward + alpha * confidenceBonus
//
// Ties go to the arm with fewer interactions, then to the lexically smaller
// arm id, so a fixed snapshot always yields the same choice. Degraded arms are
// scored for diagnostics but never chosen. Cost is O(K * D^2).
class LinUCBSelector {
public:
    explicit LinUCBSelector(double alpha = 0.1);

    double alpha() const { return m_alpha; }

    ArmScore score(const Eigen::VectorXd& x, const ArmSnapshot& arm) const;

    // Fails with NumericInstability when every arm is degraded, and with
    // Validation on an empty arm set or a context of the wrong dimension.
    std::optional<ArmSelection> select(const ContextVector& context,
                                       const QVector<ArmSnapshot>& arms,
                                       ErrorInfo* errorOut = nullptr) const;

    // Snapshots the scope of userId ("anonymous" when empty) restricted to
    // armIds (all configured arms when empty) and selects among them.
    std::optional<ArmSelection> selectArm(ArmRegistry& registry,
                                          const ContextVector& context,
                                          const QStringList& armIds,
                                          const QString& userId,
                                          ErrorInfo* errorOut = nullptr) const;

private:
    double m_alpha = 0.1;
};

} // namespace folio
