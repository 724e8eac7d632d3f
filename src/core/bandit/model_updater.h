#pragma once

#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <atomic>

namespace folio {

class ArmRegistry;
class RewardStore;

struct ApplySummary {
    int applied = 0;
    int conflicts = 0;
    int degraded = 0;
    int errors = 0;

    QJsonObject toJson() const;
};

// ModelUpdater -- folds attributed rewards into arm models.
//
// Updates of one arm are serialised by the registry's slot lock. With a store
// attached, the new parameters are persisted before the in-memory model is
// replaced, and applyPendingRewards() marks each reward event applied in the
// same transaction as the arm write, so every event reaches its arm exactly
// once even across crashes and repeated batches.
class ModelUpdater {
public:
    ModelUpdater(ArmRegistry& registry, RewardStore* store);

    // A += x x^T, b += r x, theta = A^-1 b. Persists the arm when a store is
    // attached. A NumericInstability error means the update was recorded but
    // the arm is now degraded.
    bool applyReward(const QString& scope, const QString& armId, const ContextVector& x,
                     double reward, ErrorInfo* errorOut = nullptr);

    // Applies queued reward events, oldest first. Stops early once stopFlag
    // is raised; events left behind are applied by a later call.
    ApplySummary applyPendingRewards(int limit = 1000, const std::atomic<bool>* stopFlag = nullptr);

private:
    bool applyAndPersist(const QString& scope, const QString& armId, const ContextVector& x,
                         double reward, int64_t rewardEventId, ErrorInfo* errorOut);

    ArmRegistry& m_registry;
    RewardStore* m_store = nullptr;
};

} // namespace folio
