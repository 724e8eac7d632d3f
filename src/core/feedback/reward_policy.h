#pragma once

#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QtGlobal>

namespace folio {

struct RewardContribution {
    double reward = 0.0;           // signed amount added to the impression
    double saveCreditDelta = 0.0;  // change of the impression's save credit
};

// RewardPolicy -- points per action type and time decay of attributed credit.
//
//   click = +1, save = +3, unsave = -3 (reverses save credit), rate = value
//   weight = exp(-lambda * hours between impression and action)
//
// An unsave never removes more than the save credit the impression still
// holds, so impression rewards stay non-negative.
class RewardPolicy {
public:
    double clickPoints = 1.0;
    double savePoints = 3.0;
    double unsavePoints = -3.0;
    double decayLambdaPerHour = 1.0 / 48.0;
    double attributionWindowHours = 168.0;

    static RewardPolicy fromSettings(const Settings& settings);

    // Undecayed points of an action.
    double points(ActionType type, const std::optional<double>& actionValue) const;

    double decayWeight(qint64 elapsedMs) const;

    qint64 windowMs() const;

    RewardContribution contribution(const ActionRecord& action,
                                    double impressionSaveCredit,
                                    qint64 elapsedMs) const;
};

} // namespace folio
