#pragma once

#include "core/bandit/arm_model.h"
#include "core/shared/errors.h"

#include <QString>
#include <QStringList>
#include <QVector>

#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace folio {

class RewardStore;

// Human-readable name of a known arm id; the id itself otherwise.
QString armDisplayName(const QString& armId);

QStringList defaultArmIds();

// ArmRegistry -- per-(scope, arm) LinUCB models.
//
// A scope is a user id, or "anonymous". The configured arm set is created for
// a scope on first reference, loading persisted parameters from the store
// when it has them. Each (scope, arm) slot has its own mutex: model updates
// run under it via withArm() and snapshot() copies under the same brief lock.
//
// At most maxCachedScopes scopes are kept in memory. Past that, the least
// recently used scope with no slot in use is dropped and reloaded from the
// store on its next reference. Every committed update is persisted, so only
// a registry without a store loses state on eviction.
class ArmRegistry {
public:
    static constexpr int kDefaultMaxCachedScopes = 256;

    // store may be null for a purely in-memory registry.
    ArmRegistry(RewardStore* store, QStringList armIds, int dimension = kContextDim,
                int maxCachedScopes = kDefaultMaxCachedScopes);

    const QStringList& armIds() const { return m_armIds; }
    int dimension() const { return m_dimension; }
    bool hasArm(const QString& armId) const { return m_armIds.contains(armId); }

    void ensureScope(const QString& scope);

    // Snapshots of every configured arm of the scope, in configured order.
    QVector<ArmSnapshot> snapshot(const QString& scope);
    std::optional<ArmSnapshot> snapshotArm(const QString& scope, const QString& armId);

    // Runs fn on the live model while holding the slot lock. Fails with
    // NotFound for an arm outside the configured set.
    bool withArm(const QString& scope, const QString& armId,
                 const std::function<bool(ArmModel&)>& fn, ErrorInfo* errorOut = nullptr);

    // Resets the models of one scope, or of every scope when empty, in
    // memory and in the store. Holds the affected slot locks across the
    // delete so no concurrent update can persist a pre-reset model.
    bool reset(const QString& scope, ErrorInfo* errorOut = nullptr);

    // Cached scopes and persisted scopes, sorted.
    QStringList knownScopes() const;

    struct CacheStats {
        uint64_t loads = 0;
        uint64_t evictions = 0;
        int cachedScopes = 0;
    };
    CacheStats cacheStats() const;
    bool isCached(const QString& scope) const;

private:
    struct Slot {
        std::mutex mutex;
        ArmModel model;
    };
    struct ScopeEntry {
        std::map<QString, std::shared_ptr<Slot>> arms;
        std::list<QString>::iterator recency;
    };

    std::shared_ptr<Slot> slotFor(const QString& scope, const QString& armId);
    std::shared_ptr<Slot> loadSlot(const QString& scope, const QString& armId) const;
    void touchUnlocked(ScopeEntry& entry);
    void evictIdleUnlocked(const QString& keepScope);

    RewardStore* m_store = nullptr;
    QStringList m_armIds;
    int m_dimension = kContextDim;
    int m_maxCachedScopes = kDefaultMaxCachedScopes;

    mutable std::mutex m_mutex;
    std::map<QString, ScopeEntry> m_scopes;
    std::list<QString> m_recency;  // front = most recently used
    uint64_t m_generation = 0;     // bumped on every eviction and reset
    uint64_t m_loads = 0;
    uint64_t m_evictions = 0;
};

} // namespace folio
