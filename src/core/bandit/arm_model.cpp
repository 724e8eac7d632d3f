#include "core/bandit/arm_model.h"
#include "core/shared/logging.h"

#include <QDateTime>

#include <algorithm>
#include <cmath>

namespace folio {

QString armLifecycleToString(ArmLifecycle lifecycle)
{
    switch (lifecycle) {
    case ArmLifecycle::Uninitialized: return QStringLiteral("uninitialized");
    case ArmLifecycle::Warm:          return QStringLiteral("warm");
    case ArmLifecycle::Active:        return QStringLiteral("active");
    }
    return QStringLiteral("uninitialized");
}

ArmLifecycle ArmSnapshot::lifecycle(int minInteractionsForActive) const
{
    if (interactionCount <= 0) {
        return ArmLifecycle::Uninitialized;
    }
    if (interactionCount < minInteractionsForActive) {
        return ArmLifecycle::Warm;
    }
    return ArmLifecycle::Active;
}

Eigen::VectorXd toEigen(const ContextVector& vector)
{
    Eigen::VectorXd out(vector.size());
    for (int i = 0; i < vector.size(); ++i) {
        out(i) = vector.at(i);
    }
    return out;
}

ArmModel::ArmModel(QString armId, int dimension)
    : m_armId(std::move(armId))
{
    m_a = Eigen::MatrixXd::Identity(dimension, dimension);
    m_aInverse = Eigen::MatrixXd::Identity(dimension, dimension);
    m_b = Eigen::VectorXd::Zero(dimension);
    m_theta = Eigen::VectorXd::Zero(dimension);
}

void ArmModel::reset()
{
    const int d = dimension();
    m_a = Eigen::MatrixXd::Identity(d, d);
    m_aInverse = Eigen::MatrixXd::Identity(d, d);
    m_b = Eigen::VectorXd::Zero(d);
    m_theta = Eigen::VectorXd::Zero(d);
    m_interactionCount = 0;
    m_cumulativeReward = 0.0;
    m_cumulativeSquaredReward = 0.0;
    m_degraded = false;
    m_updatedAtMs = QDateTime::currentMSecsSinceEpoch();
}

bool ArmModel::update(const Eigen::VectorXd& x, double reward, ErrorInfo* errorOut)
{
    if (x.size() != dimension()) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("context_dimension_mismatch"),
                    QStringLiteral("Expected %1 features, got %2")
                        .arg(dimension()).arg(static_cast<int>(x.size())));
    }
    if (!x.allFinite() || !std::isfinite(reward)) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("non_finite_update"));
    }

    // x_i * x_j == x_j * x_i in floating point, so A stays exactly symmetric.
    m_a.noalias() += x * x.transpose();
    m_b.noalias() += reward * x;
    m_interactionCount += 1;
    m_cumulativeReward += reward;
    m_cumulativeSquaredReward += reward * reward;
    m_updatedAtMs = QDateTime::currentMSecsSinceEpoch();

    return refreshInverse(errorOut);
}

bool ArmModel::restore(const Eigen::MatrixXd& a, const Eigen::VectorXd& b,
                       int64_t interactionCount, double cumulativeReward,
                       double cumulativeSquaredReward, qint64 updatedAtMs, ErrorInfo* errorOut)
{
    if (a.rows() != a.cols() || a.rows() != b.size() || b.size() == 0) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("arm_shape_mismatch"));
    }
    m_a = a;
    m_b = b;
    m_interactionCount = std::max<int64_t>(0, interactionCount);
    m_cumulativeReward = cumulativeReward;
    m_cumulativeSquaredReward = cumulativeSquaredReward;
    m_updatedAtMs = updatedAtMs;
    return refreshInverse(errorOut);
}

bool ArmModel::refreshInverse(ErrorInfo* errorOut)
{
    const int d = dimension();
    Eigen::LLT<Eigen::MatrixXd> llt(m_a);
    if (llt.info() == Eigen::Success) {
        Eigen::MatrixXd inverse = llt.solve(Eigen::MatrixXd::Identity(d, d));
        if (inverse.allFinite()) {
            m_aInverse = std::move(inverse);
            m_theta = m_aInverse * m_b;
            if (m_degraded) {
                LOG_INFO(folioBandit, "Arm %s recovered a valid inverse", qUtf8Printable(m_armId));
            }
            m_degraded = false;
            return true;
        }
    }

    Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(m_a);
    m_aInverse = cod.pseudoInverse();
    if (!m_aInverse.allFinite()) {
        m_aInverse = Eigen::MatrixXd::Identity(d, d);
    }
    m_theta = m_aInverse * m_b;
    if (!m_theta.allFinite()) {
        m_theta = Eigen::VectorXd::Zero(d);
    }
    m_degraded = true;

    LOG_ERROR(folioBandit, "Cholesky inversion failed for arm %s; using pseudo-inverse and "
              "excluding the arm from selection", qUtf8Printable(m_armId));
    return fail(errorOut, ErrorKind::NumericInstability, QStringLiteral("arm_inversion_failed"),
                QStringLiteral("Arm %1 matrix is not positive-definite").arg(m_armId));
}

double ArmModel::predict(const Eigen::VectorXd& x) const
{
    return m_theta.dot(x);
}

double ArmModel::confidenceBonus(const Eigen::VectorXd& x) const
{
    const double quad = x.dot(m_aInverse * x);
    return std::sqrt(std::max(0.0, quad));
}

ArmSnapshot ArmModel::snapshot(const QString& scope) const
{
    ArmSnapshot snap;
    snap.scope = scope;
    snap.armId = m_armId;
    snap.theta = m_theta;
    snap.aInverse = m_aInverse;
    snap.interactionCount = m_interactionCount;
    snap.cumulativeReward = m_cumulativeReward;
    snap.cumulativeSquaredReward = m_cumulativeSquaredReward;
    snap.degraded = m_degraded;
    snap.updatedAtMs = m_updatedAtMs;
    return snap;
}

} // namespace folio
