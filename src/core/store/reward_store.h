#pragma once

#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QVector>

#include <cstdint>
#include <mutex>
#include <optional>

#include <sqlite3.h>

namespace folio {

// RewardStore -- owner of the recommender's SQLite database.
//
// Holds impressions, actions, reward events, arm model parameters, the book
// corpus and the settings table. Every public method takes the store mutex
// for its whole duration; multi-statement writes run inside one transaction,
// so a reader never observes half of an attribution or a model update.
class RewardStore {
public:
    ~RewardStore();

    // Move-only (owns sqlite3* handle). The mutex is not transferred; moving a
    // store that is in use by another thread is not supported.
    RewardStore(RewardStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    RewardStore& operator=(RewardStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    RewardStore(const RewardStore&) = delete;
    RewardStore& operator=(const RewardStore&) = delete;

    // Open or create the database at the given path.
    // Creates schema and sets pragmas on first open.
    static std::optional<RewardStore> open(const QString& dbPath, ErrorInfo* errorOut = nullptr);

    // ── Impressions ─────────────────────────────────────────

    std::optional<int64_t> insertImpression(const ImpressionRecord& impression,
                                            ErrorInfo* errorOut = nullptr);
    // All-or-nothing insert of one recommendation page.
    std::optional<QVector<int64_t>> insertImpressions(const QVector<ImpressionRecord>& impressions,
                                                      ErrorInfo* errorOut = nullptr);
    std::optional<ImpressionRecord> getImpression(int64_t impressionId);

    // Impressions of one identity (user id or session id match) in [fromMs, toMs].
    QVector<ImpressionRecord> impressionsFor(const Identity& identity, qint64 fromMs, qint64 toMs);

    // Most recent impression of the same identity and book with
    //   created_at <= actionAtMs <= created_at + windowMs
    std::optional<ImpressionRecord> findAttributionCandidate(const Identity& identity,
                                                             const QString& bookId,
                                                             qint64 actionAtMs,
                                                             qint64 windowMs,
                                                             ErrorInfo* errorOut = nullptr);

    // ── Actions ─────────────────────────────────────────────

    std::optional<int64_t> insertAction(const ActionRecord& action, ErrorInfo* errorOut = nullptr);
    std::optional<ActionRecord> getAction(int64_t actionId);
    QVector<ActionRecord> actionsFor(const Identity& identity, qint64 fromMs, qint64 toMs);

    // Unattributed actions created at or after sinceMs, oldest first, that
    // sort after the (afterMs, afterId) cursor. Pass afterMs = sinceMs and
    // afterId = 0 for the first page.
    QVector<ActionRecord> unattributedActionsSince(qint64 sinceMs, qint64 afterMs, int64_t afterId,
                                                   int limit, ErrorInfo* errorOut = nullptr);

    // ── Attribution ─────────────────────────────────────────

    struct AttributionWrite {
        int64_t actionId = 0;
        int64_t impressionId = 0;
        double contribution = 0.0;      // signed reward added to the impression
        double saveCreditDelta = 0.0;   // change of the impression's save credit
        QString scope;
        QString armId;
        qint64 attributedAtMs = 0;
        bool queueRewardEvent = true;   // false when the contribution is zero
    };

    // Atomic mark-attributed primitive. In one transaction: claims the action
    // (only while it is still unattributed), accumulates the contribution on
    // the impression and queues a reward event. Returns the reward event id
    // (0 when no event was queued).
    // A second attempt for the same action fails with AttributionConflict and
    // leaves the database unchanged.
    std::optional<int64_t> commitAttribution(const AttributionWrite& write,
                                             ErrorInfo* errorOut = nullptr);

    // Reward events not yet applied to an arm model, oldest first, joined
    // with the context snapshot of their impression.
    QVector<RewardEvent> pendingRewardEvents(int limit, ErrorInfo* errorOut = nullptr);
    int pendingRewardEventCount();

    // ── Arm models ──────────────────────────────────────────

    struct ArmRow {
        QString scope;
        QString armId;
        int dimension = 0;
        QVector<double> aMatrix;   // row-major dimension x dimension
        QVector<double> bVector;
        int64_t interactionCount = 0;
        double cumulativeReward = 0.0;
        double cumulativeSquaredReward = 0.0;
        bool degraded = false;
        qint64 updatedAtMs = 0;
    };

    std::optional<ArmRow> loadArm(const QString& scope, const QString& armId);
    QVector<ArmRow> loadArms(const QString& scope);
    QStringList armScopes();
    bool saveArm(const ArmRow& arm, ErrorInfo* errorOut = nullptr);

    // Persists the updated arm and marks the reward event applied in one
    // transaction. Fails with AttributionConflict if the event was already
    // applied.
    bool saveArmAndMarkApplied(const ArmRow& arm, int64_t rewardEventId, qint64 appliedAtMs,
                               ErrorInfo* errorOut = nullptr);

    // Deletes persisted arm models of one scope, or of every scope when empty.
    bool deleteArms(const QString& scope, ErrorInfo* errorOut = nullptr);

    // ── Identity merge ──────────────────────────────────────

    struct MergeCounts {
        int impressions = 0;
        int actions = 0;
        int rewardEvents = 0;
    };

    // Assigns userId to the session's rows that have no user yet. Pending
    // reward events of those impressions move to the user's model scope.
    std::optional<MergeCounts> mergeIdentities(const QString& sessionId, const QString& userId,
                                               ErrorInfo* errorOut = nullptr);

    // ── Collaborative signals ───────────────────────────────

    // Save counts per book across all identities.
    QHash<QString, int> saveCounts();

    // For books saved by the identity, counts how many other identities that
    // saved any of them also saved each further book.
    QHash<QString, int> coSaveCounts(const Identity& identity);

    // ── Books ───────────────────────────────────────────────

    bool upsertBook(const CatalogBook& book, ErrorInfo* errorOut = nullptr);
    QVector<CatalogBook> books();
    QVector<CatalogBook> booksChangedSince(qint64 sinceMs);

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    // ── Counters ────────────────────────────────────────────

    int impressionCount();
    int actionCount();

private:
    RewardStore() = default;
    bool init(const QString& dbPath, ErrorInfo* errorOut);
    bool execSql(const char* sql);
    std::optional<int64_t> insertImpressionUnlocked(const ImpressionRecord& impression,
                                                    ErrorInfo* errorOut);
    static ImpressionRecord readImpressionRow(sqlite3_stmt* stmt);
    static ActionRecord readActionRow(sqlite3_stmt* stmt);
    bool upsertArmUnlocked(const ArmRow& arm, ErrorInfo* errorOut);
    int countRows(const char* sql);

    sqlite3* m_db = nullptr;
    mutable std::mutex m_mutex;
};

// Raw (native byte order) double array blobs used for vectors and matrices.
QByteArray doublesToBlob(const QVector<double>& values);
QVector<double> blobToDoubles(const void* data, int bytes);

} // namespace folio
