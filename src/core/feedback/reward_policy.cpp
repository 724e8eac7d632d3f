#include "core/feedback/reward_policy.h"

#include <algorithm>
#include <cmath>

namespace folio {

namespace {

constexpr double kMsPerHour = 3600.0 * 1000.0;

} // namespace

RewardPolicy RewardPolicy::fromSettings(const Settings& settings)
{
    RewardPolicy policy;
    policy.clickPoints = settings.clickPoints;
    policy.savePoints = settings.savePoints;
    policy.unsavePoints = settings.unsavePoints;
    policy.decayLambdaPerHour = settings.decayLambdaPerHour;
    policy.attributionWindowHours = settings.attributionWindowHours;
    return policy;
}

double RewardPolicy::points(ActionType type, const std::optional<double>& actionValue) const
{
    switch (type) {
    case ActionType::Click:  return clickPoints;
    case ActionType::Save:   return savePoints;
    case ActionType::Unsave: return unsavePoints;
    case ActionType::Rate:   return actionValue.value_or(0.0);
    }
    return 0.0;
}

double RewardPolicy::decayWeight(qint64 elapsedMs) const
{
    const double hours = std::max<qint64>(0, elapsedMs) / kMsPerHour;
    return std::exp(-decayLambdaPerHour * hours);
}

qint64 RewardPolicy::windowMs() const
{
    return static_cast<qint64>(std::llround(attributionWindowHours * kMsPerHour));
}

RewardContribution RewardPolicy::contribution(const ActionRecord& action,
                                              double impressionSaveCredit,
                                              qint64 elapsedMs) const
{
    RewardContribution result;
    const double weight = decayWeight(elapsedMs);

    switch (action.actionType) {
    case ActionType::Save:
        result.reward = savePoints * weight;
        result.saveCreditDelta = result.reward;
        break;
    case ActionType::Unsave: {
        const double reversal = std::min(std::abs(unsavePoints) * weight,
                                         std::max(0.0, impressionSaveCredit));
        result.reward = -reversal;
        result.saveCreditDelta = -reversal;
        break;
    }
    case ActionType::Click:
    case ActionType::Rate:
        result.reward = points(action.actionType, action.actionValue) * weight;
        break;
    }
    return result;
}

} // namespace folio
