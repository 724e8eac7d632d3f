#pragma once

#include "core/bandit/model_updater.h"
#include "core/feedback/reward_policy.h"
#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QJsonObject>

#include <atomic>
#include <functional>

namespace folio {

class RewardStore;

struct AttributionSummary {
    int processed = 0;
    int updated = 0;      // actions attributed to an impression
    int unmatched = 0;    // no qualifying impression; left unattributed
    int conflicts = 0;    // already attributed by a concurrent or earlier run
    int errors = 0;       // malformed rows, vanished impressions and storage failures
    bool interrupted = false;
    bool resumed = false; // started from the checkpoint of an unfinished run
    bool alreadyRunning = false;
    qint64 checkpointMs = 0;
    ApplySummary modelUpdates;

    QJsonObject toJson() const;
};

// AttributionEngine -- links recorded actions to the impressions that caused
// them and turns them into decayed rewards.
//
// An action attributes to the most recent impression of the same identity
// (user id or session id) and book with
//   impression.createdAt <= action.createdAt <= impression.createdAt + window
// Each attribution commits in its own transaction together with the
// idempotency marker on the action, so re-running a batch never double counts.
//
// The (created_at, id) cursor is checkpointed in the settings table after every
// page. A batch that did not finish, because it was stopped or the process
// died, leaves a resume marker and the next batch continues from the
// checkpoint instead of rescanning the window.
class AttributionEngine {
public:
    // Invoked on the batch thread after each processed action.
    using ProgressCallback = std::function<void(const AttributionSummary& progress)>;

    // updater may be null; pending reward events are then left for a later
    // ModelUpdater::applyPendingRewards() call.
    AttributionEngine(RewardStore& store, RewardPolicy policy, ModelUpdater* updater = nullptr);

    // Processes unattributed actions created within the last windowHours.
    // nowMs = 0 means the current time.
    AttributionSummary attributeRewards(double windowHours, qint64 nowMs = 0);

    // Attributes one action. Returns false with NotFound when no impression
    // qualifies, AttributionConflict when the action is already attributed,
    // Validation for a malformed row.
    bool attributeAction(const ActionRecord& action, qint64 nowMs, ErrorInfo* errorOut = nullptr);

    // Asks a running batch to stop after the current action.
    void requestStop();
    bool isRunning() const { return m_running.load(); }

    // Must not be called while a batch is running.
    void setProgressCallback(ProgressCallback callback);

    const RewardPolicy& policy() const { return m_policy; }

private:
    RewardStore& m_store;
    RewardPolicy m_policy;
    ModelUpdater* m_updater = nullptr;
    ProgressCallback m_progressCallback;
    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_running{false};
};

} // namespace folio
