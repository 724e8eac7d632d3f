#pragma once

#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <Eigen/Dense>

#include <QString>

#include <cstdint>

namespace folio {

enum class ArmLifecycle {
    Uninitialized, // no observations yet
    Warm,          // at least one observation
    Active,        // at least minInteractionsForActive observations
};

QString armLifecycleToString(ArmLifecycle lifecycle);

// Read-only copy of the parts of an arm the selector and stats need.
struct ArmSnapshot {
    QString scope;
    QString armId;
    Eigen::VectorXd theta;
    Eigen::MatrixXd aInverse;
    int64_t interactionCount = 0;
    double cumulativeReward = 0.0;
    double cumulativeSquaredReward = 0.0;
    bool degraded = false;
    qint64 updatedAtMs = 0;

    ArmLifecycle lifecycle(int minInteractionsForActive) const;
};

Eigen::VectorXd toEigen(const ContextVector& vector);

// ArmModel -- disjoint LinUCB parameters of one arm.
//
//   A = I + sum(x x^T)     b = sum(r x)     theta = A^-1 b
//
// A stays symmetric positive-definite under the additive outer-product
// updates, so the Cholesky inverse normally succeeds. When it does not, the
// inverse falls back to a pseudo-inverse and the arm is flagged degraded
// until a later refresh succeeds again.
class ArmModel {
public:
    explicit ArmModel(QString armId = QString(), int dimension = kContextDim);

    const QString& armId() const { return m_armId; }
    int dimension() const { return static_cast<int>(m_b.size()); }

    // Rank-one update. Returns false (NumericInstability) when the refreshed
    // inverse had to fall back to the pseudo-inverse; the observation itself
    // is recorded either way. Fails without change on a dimension mismatch
    // or non-finite input.
    bool update(const Eigen::VectorXd& x, double reward, ErrorInfo* errorOut = nullptr);

    // Replaces all parameters, e.g. when loading from the store.
    bool restore(const Eigen::MatrixXd& a, const Eigen::VectorXd& b, int64_t interactionCount,
                 double cumulativeReward, double cumulativeSquaredReward, qint64 updatedAtMs,
                 ErrorInfo* errorOut = nullptr);

    // Back to A = I, b = 0.
    void reset();

    double predict(const Eigen::VectorXd& x) const;
    double confidenceBonus(const Eigen::VectorXd& x) const;

    const Eigen::MatrixXd& a() const { return m_a; }
    const Eigen::MatrixXd& aInverse() const { return m_aInverse; }
    const Eigen::VectorXd& b() const { return m_b; }
    const Eigen::VectorXd& theta() const { return m_theta; }

    int64_t interactionCount() const { return m_interactionCount; }
    double cumulativeReward() const { return m_cumulativeReward; }
    double cumulativeSquaredReward() const { return m_cumulativeSquaredReward; }
    bool isDegraded() const { return m_degraded; }
    qint64 updatedAtMs() const { return m_updatedAtMs; }

    ArmSnapshot snapshot(const QString& scope) const;

private:
    bool refreshInverse(ErrorInfo* errorOut);

    QString m_armId;
    Eigen::MatrixXd m_a;
    Eigen::MatrixXd m_aInverse;
    Eigen::VectorXd m_b;
    Eigen::VectorXd m_theta;
    int64_t m_interactionCount = 0;
    double m_cumulativeReward = 0.0;
    double m_cumulativeSquaredReward = 0.0;
    bool m_degraded = false;
    qint64 m_updatedAtMs = 0;
};

} // namespace folio
