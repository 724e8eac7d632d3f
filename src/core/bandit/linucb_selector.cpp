#include "core/bandit/linucb_selector.h"
#include "core/bandit/arm_registry.h"
#include "core/shared/logging.h"

#include <QJsonArray>

#include <algorithm>
#include <cmath>

namespace folio {

namespace {

constexpr double kExplorationEpsilon = 1e-9;

// True when a should be preferred over b.
bool preferred(const ArmScore& a, const ArmScore& b)
{
    if (a.ucbScore != b.ucbScore) {
        return a.ucbScore > b.ucbScore;
    }
    if (a.interactionCount != b.interactionCount) {
        return a.interactionCount < b.interactionCount;
    }
    return a.armId < b.armId;
}

} // namespace

QJsonObject ArmScore::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("armId")] = armId;
    json[QStringLiteral("predictedReward")] = predictedReward;
    json[QStringLiteral("confidenceBonus")] = confidenceBonus;
    json[QStringLiteral("ucbScore")] = ucbScore;
    json[QStringLiteral("explorationLevel")] = explorationLevel;
    json[QStringLiteral("interactionCount")] = static_cast<double>(interactionCount);
    json[QStringLiteral("degraded")] = degraded;
    return json;
}

QJsonObject ArmSelection::toJson() const
{
    QJsonArray arms;
    for (const ArmScore& s : scores) {
        arms.append(s.toJson());
    }
    QJsonObject json;
    json[QStringLiteral("armId")] = armId;
    json[QStringLiteral("scope")] = scope;
    json[QStringLiteral("predictedReward")] = predictedReward;
    json[QStringLiteral("confidenceBonus")] = confidenceBonus;
    json[QStringLiteral("ucbScore")] = ucbScore;
    json[QStringLiteral("explorationLevel")] = explorationLevel;
    json[QStringLiteral("arms")] = arms;
    return json;
}

LinUCBSelector::LinUCBSelector(double alpha)
    : m_alpha(alpha)
{
}

ArmScore LinUCBSelector::score(const Eigen::VectorXd& x, const ArmSnapshot& arm) const
{
    ArmScore s;
    s.armId = arm.armId;
    s.interactionCount = arm.interactionCount;
    s.degraded = arm.degraded;
    s.predictedReward = arm.theta.dot(x);
    s.confidenceBonus = std::sqrt(std::max(0.0, x.dot(arm.aInverse * x)));
    s.ucbScore = s.predictedReward + m_alpha * s.confidenceBonus;

    // A negative prediction can push the raw ratio past 1 or flip its sign.
    const double denom = s.predictedReward + s.confidenceBonus + kExplorationEpsilon;
    s.explorationLevel =
        denom > kExplorationEpsilon ? std::clamp(s.confidenceBonus / denom, 0.0, 1.0) : 1.0;
    return s;
}

std::optional<ArmSelection> LinUCBSelector::select(const ContextVector& context,
                                                   const QVector<ArmSnapshot>& arms,
                                                   ErrorInfo* errorOut) const
{
    if (arms.isEmpty()) {
        fail(errorOut, ErrorKind::Validation, QStringLiteral("no_arms"));
        return std::nullopt;
    }

    const Eigen::VectorXd x = toEigen(context);
    ArmSelection selection;
    const ArmScore* best = nullptr;
    selection.scores.reserve(arms.size());

    for (const ArmSnapshot& arm : arms) {
        if (arm.theta.size() != x.size() || arm.aInverse.rows() != x.size()) {
            fail(errorOut, ErrorKind::Validation, QStringLiteral("context_dimension_mismatch"),
                 QStringLiteral("Arm %1 expects %2 features, got %3")
                     .arg(arm.armId).arg(static_cast<int>(arm.theta.size()))
                     .arg(static_cast<int>(x.size())));
            return std::nullopt;
        }
        selection.scores.append(score(x, arm));
    }

    for (const ArmScore& candidate : selection.scores) {
        if (candidate.degraded) {
            continue;
        }
        if (!best || preferred(candidate, *best)) {
            best = &candidate;
        }
    }

    if (!best) {
        LOG_ERROR(folioBandit, "All %d arms are degraded; no arm can be selected",
                  static_cast<int>(arms.size()));
        fail(errorOut, ErrorKind::NumericInstability, QStringLiteral("all_arms_degraded"));
        return std::nullopt;
    }

    selection.armId = best->armId;
    selection.scope = arms.first().scope;
    selection.predictedReward = best->predictedReward;
    selection.confidenceBonus = best->confidenceBonus;
    selection.ucbScore = best->ucbScore;
    selection.explorationLevel = best->explorationLevel;

    LOG_DEBUG(folioBandit, "Selected arm %s (ucb=%.4f, pred=%.4f, bonus=%.4f)",
              qUtf8Printable(selection.armId), selection.ucbScore, selection.predictedReward,
              selection.confidenceBonus);
    if (errorOut) {
        errorOut->clear();
    }
    return selection;
}

std::optional<ArmSelection> LinUCBSelector::selectArm(ArmRegistry& registry,
                                                      const ContextVector& context,
                                                      const QStringList& armIds,
                                                      const QString& userId,
                                                      ErrorInfo* errorOut) const
{
    const QString scope = userId.isEmpty() ? QString::fromLatin1(kAnonymousScope) : userId;
    QVector<ArmSnapshot> snapshots = registry.snapshot(scope);
    if (!armIds.isEmpty()) {
        QVector<ArmSnapshot> filtered;
        for (const ArmSnapshot& snap : snapshots) {
            if (armIds.contains(snap.armId)) {
                filtered.append(snap);
            }
        }
        snapshots = filtered;
    }
    return select(context, snapshots, errorOut);
}

} // namespace folio
