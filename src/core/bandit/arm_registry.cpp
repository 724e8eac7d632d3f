#include "core/bandit/arm_registry.h"
#include "core/store/reward_store.h"
#include "core/shared/logging.h"

#include <QSet>

#include <algorithm>
#include <utility>
#include <vector>

namespace folio {

namespace {

struct ArmName {
    const char* id;
    const char* name;
};

constexpr ArmName kArmNames[] = {
    {"semantic_similarity", "Content-Based"},
    {"contextual_mood", "Mood-Based"},
    {"trending_popular", "Trending"},
    {"collaborative_filtering", "Collaborative"},
    {"personalized_mix", "Personalized Mix"},
    {"contextual_basic", "Basic Contextual"},
};

} // namespace

QString armDisplayName(const QString& armId)
{
    for (const ArmName& entry : kArmNames) {
        if (armId == QLatin1String(entry.id)) {
            return QString::fromLatin1(entry.name);
        }
    }
    return armId;
}

QStringList defaultArmIds()
{
    QStringList ids;
    for (const ArmName& entry : kArmNames) {
        ids.append(QString::fromLatin1(entry.id));
    }
    return ids;
}

ArmRegistry::ArmRegistry(RewardStore* store, QStringList armIds, int dimension,
                         int maxCachedScopes)
    : m_store(store)
    , m_armIds(std::move(armIds))
    , m_dimension(dimension)
    , m_maxCachedScopes(std::max(1, maxCachedScopes))
{
    m_armIds.removeDuplicates();
}

std::shared_ptr<ArmRegistry::Slot> ArmRegistry::loadSlot(const QString& scope,
                                                         const QString& armId) const
{
    auto slot = std::make_shared<Slot>();
    slot->model = ArmModel(armId, m_dimension);

    if (m_store) {
        const std::optional<RewardStore::ArmRow> row = m_store->loadArm(scope, armId);
        const int d = m_dimension;
        if (row.has_value()) {
            if (row->dimension != d || row->aMatrix.size() != d * d || row->bVector.size() != d) {
                LOG_WARN(folioBandit, "Discarding persisted arm %s/%s with dimension %d (expected %d)",
                         qUtf8Printable(scope), qUtf8Printable(armId), row->dimension, d);
            } else {
                const Eigen::MatrixXd a = Eigen::Map<const Eigen::Matrix<double, Eigen::Dynamic,
                    Eigen::Dynamic, Eigen::RowMajor>>(row->aMatrix.constData(), d, d);
                const Eigen::VectorXd b = Eigen::Map<const Eigen::VectorXd>(row->bVector.constData(), d);
                ErrorInfo error;
                if (!slot->model.restore(a, b, row->interactionCount, row->cumulativeReward,
                                         row->cumulativeSquaredReward, row->updatedAtMs, &error)) {
                    LOG_WARN(folioBandit, "Restored arm %s/%s is degraded: %s",
                             qUtf8Printable(scope), qUtf8Printable(armId),
                             qUtf8Printable(error.code));
                }
            }
        }
    }
    return slot;
}

void ArmRegistry::touchUnlocked(ScopeEntry& entry)
{
    if (entry.recency != m_recency.begin()) {
        m_recency.splice(m_recency.begin(), m_recency, entry.recency);
    }
}

void ArmRegistry::evictIdleUnlocked(const QString& keepScope)
{
    // Walk from the least recently used end; scopes with a slot still held
    // by a caller stay cached until a later insertion.
    auto it = m_recency.end();
    while (static_cast<int>(m_scopes.size()) > m_maxCachedScopes && it != m_recency.begin()) {
        --it;
        if (*it == keepScope) {
            continue;
        }
        auto scopeIt = m_scopes.find(*it);
        bool idle = true;
        for (const auto& arm : scopeIt->second.arms) {
            if (arm.second.use_count() > 1) {
                idle = false;
                break;
            }
        }
        if (!idle) {
            continue;
        }

        LOG_DEBUG(folioBandit, "Evicting arm models of scope %s", qUtf8Printable(*it));
        m_scopes.erase(scopeIt);
        it = m_recency.erase(it);
        ++m_generation;
        ++m_evictions;
    }
}

std::shared_ptr<ArmRegistry::Slot> ArmRegistry::slotFor(const QString& scope, const QString& armId)
{
    for (;;) {
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto scopeIt = m_scopes.find(scope);
            if (scopeIt != m_scopes.end()) {
                touchUnlocked(scopeIt->second);
                auto armIt = scopeIt->second.arms.find(armId);
                if (armIt != scopeIt->second.arms.end()) {
                    return armIt->second;
                }
            }
            generation = m_generation;
        }

        std::shared_ptr<Slot> loaded = loadSlot(scope, armId);

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_generation != generation) {
            // An eviction or reset ran during the load; the row may be stale.
            continue;
        }
        auto inserted = m_scopes.try_emplace(scope);
        ScopeEntry& entry = inserted.first->second;
        if (inserted.second) {
            m_recency.push_front(scope);
            entry.recency = m_recency.begin();
        } else {
            touchUnlocked(entry);
        }
        auto armInserted = entry.arms.try_emplace(armId, std::move(loaded));
        if (armInserted.second) {
            ++m_loads;
        }
        std::shared_ptr<Slot> slot = armInserted.first->second;
        if (inserted.second) {
            evictIdleUnlocked(scope);
        }
        return slot;
    }
}

void ArmRegistry::ensureScope(const QString& scope)
{
    for (const QString& armId : m_armIds) {
        slotFor(scope, armId);
    }
}

QVector<ArmSnapshot> ArmRegistry::snapshot(const QString& scope)
{
    QVector<ArmSnapshot> snapshots;
    snapshots.reserve(m_armIds.size());
    for (const QString& armId : m_armIds) {
        std::shared_ptr<Slot> slot = slotFor(scope, armId);
        std::lock_guard<std::mutex> slotLock(slot->mutex);
        snapshots.append(slot->model.snapshot(scope));
    }
    return snapshots;
}

std::optional<ArmSnapshot> ArmRegistry::snapshotArm(const QString& scope, const QString& armId)
{
    if (!hasArm(armId)) {
        return std::nullopt;
    }
    std::shared_ptr<Slot> slot = slotFor(scope, armId);
    std::lock_guard<std::mutex> slotLock(slot->mutex);
    return slot->model.snapshot(scope);
}

bool ArmRegistry::withArm(const QString& scope, const QString& armId,
                          const std::function<bool(ArmModel&)>& fn, ErrorInfo* errorOut)
{
    if (!hasArm(armId)) {
        LOG_WARN(folioBandit, "Unknown arm '%s' for scope %s", qUtf8Printable(armId),
                 qUtf8Printable(scope));
        return fail(errorOut, ErrorKind::NotFound, QStringLiteral("unknown_arm"),
                    QStringLiteral("Arm %1 is not configured").arg(armId));
    }
    std::shared_ptr<Slot> slot = slotFor(scope, armId);
    std::lock_guard<std::mutex> slotLock(slot->mutex);
    return fn(slot->model);
}

bool ArmRegistry::reset(const QString& scope, ErrorInfo* errorOut)
{
    // The registry lock keeps loaders from caching rows that are about to go.
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::shared_ptr<Slot>> slots;
    for (const auto& entry : m_scopes) {
        if (scope.isEmpty() || entry.first == scope) {
            for (const auto& arm : entry.second.arms) {
                slots.push_back(arm.second);
            }
        }
    }

    // Map order, so concurrent resets lock in the same order.
    std::vector<std::unique_lock<std::mutex>> slotLocks;
    slotLocks.reserve(slots.size());
    for (const std::shared_ptr<Slot>& slot : slots) {
        slotLocks.emplace_back(slot->mutex);
    }
    ++m_generation;

    if (m_store && !m_store->deleteArms(scope, errorOut)) {
        LOG_ERROR(folioBandit, "Failed to delete persisted arms for scope '%s'",
                  qUtf8Printable(scope));
        return false;
    }
    for (const std::shared_ptr<Slot>& slot : slots) {
        slot->model.reset();
    }

    LOG_INFO(folioBandit, "Reset %d arm models (scope: %s)", static_cast<int>(slots.size()),
             scope.isEmpty() ? "all" : qUtf8Printable(scope));
    if (errorOut) {
        errorOut->clear();
    }
    return true;
}

QStringList ArmRegistry::knownScopes() const
{
    QSet<QString> scopes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_scopes) {
            scopes.insert(entry.first);
        }
    }
    if (m_store) {
        for (const QString& scope : m_store->armScopes()) {
            scopes.insert(scope);
        }
    }
    QStringList sorted = scopes.values();
    sorted.sort();
    return sorted;
}

ArmRegistry::CacheStats ArmRegistry::cacheStats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_loads, m_evictions, static_cast<int>(m_scopes.size())};
}

bool ArmRegistry::isCached(const QString& scope) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_scopes.count(scope) > 0;
}

} // namespace folio
