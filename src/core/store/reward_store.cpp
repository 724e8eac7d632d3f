#include "core/store/reward_store.h"
#include "core/store/migration.h"
#include "core/store/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QFile>
#include <QJsonDocument>

#include <cstring>

namespace folio {

namespace {

constexpr const char* kImpressionColumns = R"(
    id, user_id, session_id, book_id, context_vector, arm_id, rank, score,
    metadata, created_at, reward, save_credit, attributed_at
)";

constexpr const char* kActionColumns = R"(
    id, user_id, session_id, book_id, action_type, action_value, created_at,
    attributed_impression_id, attributed_reward
)";

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL so identity columns compare cleanly.
void bindNullableText(sqlite3_stmt* stmt, int index, const QString& value)
{
    if (value.isEmpty()) {
        sqlite3_bind_null(stmt, index);
    } else {
        bindText(stmt, index, value);
    }
}

void bindBlob(sqlite3_stmt* stmt, int index, const QByteArray& blob)
{
    sqlite3_bind_blob(stmt, index, blob.constData(), blob.size(), SQLITE_TRANSIENT);
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return QString();
    }
    return QString::fromUtf8(reinterpret_cast<const char*>(text),
                             sqlite3_column_bytes(stmt, column));
}

QVector<double> columnDoubles(sqlite3_stmt* stmt, int column)
{
    const void* data = sqlite3_column_blob(stmt, column);
    const int bytes = sqlite3_column_bytes(stmt, column);
    return blobToDoubles(data, bytes);
}

CatalogBook readBookRow(sqlite3_stmt* stmt)
{
    CatalogBook book;
    book.bookId = columnText(stmt, 0);
    book.title = columnText(stmt, 1);
    book.author = columnText(stmt, 2);
    book.text = columnText(stmt, 3);
    book.updatedAtMs = sqlite3_column_int64(stmt, 4);
    return book;
}

RewardStore::ArmRow readArmRow(sqlite3_stmt* stmt)
{
    RewardStore::ArmRow arm;
    arm.scope = columnText(stmt, 0);
    arm.armId = columnText(stmt, 1);
    arm.dimension = sqlite3_column_int(stmt, 2);
    arm.aMatrix = columnDoubles(stmt, 3);
    arm.bVector = columnDoubles(stmt, 4);
    arm.interactionCount = sqlite3_column_int64(stmt, 5);
    arm.cumulativeReward = sqlite3_column_double(stmt, 6);
    arm.cumulativeSquaredReward = sqlite3_column_double(stmt, 7);
    arm.degraded = sqlite3_column_int(stmt, 8) != 0;
    arm.updatedAtMs = sqlite3_column_int64(stmt, 9);
    return arm;
}

} // namespace

QByteArray doublesToBlob(const QVector<double>& values)
{
    QByteArray blob;
    blob.resize(values.size() * static_cast<int>(sizeof(double)));
    if (!values.isEmpty()) {
        std::memcpy(blob.data(), values.constData(), static_cast<size_t>(blob.size()));
    }
    return blob;
}

QVector<double> blobToDoubles(const void* data, int bytes)
{
    QVector<double> values;
    if (!data || bytes <= 0 || bytes % static_cast<int>(sizeof(double)) != 0) {
        return values;
    }
    values.resize(bytes / static_cast<int>(sizeof(double)));
    std::memcpy(values.data(), data, static_cast<size_t>(bytes));
    return values;
}

RewardStore::~RewardStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<RewardStore> RewardStore::open(const QString& dbPath, ErrorInfo* errorOut)
{
    RewardStore store;
    if (!store.init(dbPath, errorOut)) {
        return std::nullopt;
    }
    return store;
}

bool RewardStore::init(const QString& dbPath, ErrorInfo* errorOut)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(folioStore, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("db_open_failed"),
                    QString::fromUtf8(sqlite3_errmsg(m_db)));
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(folioStore, "Failed to set connection pragmas");
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("db_pragmas_failed"));
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='impressions'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(folioStore, "Failed to set database pragmas");
            return fail(errorOut, ErrorKind::Storage, QStringLiteral("db_pragmas_failed"));
        }

        if (!execSql(kSchema)) {
            LOG_ERROR(folioStore, "Failed to create schema");
            return fail(errorOut, ErrorKind::Storage, QStringLiteral("schema_create_failed"));
        }

        if (!execSql(kDefaultSettings)) {
            LOG_ERROR(folioStore, "Failed to insert default settings");
            return fail(errorOut, ErrorKind::Storage, QStringLiteral("default_settings_failed"));
        }
    }

    if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        LOG_ERROR(folioStore, "Migration failed");
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("migration_failed"));
    }

    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_INFO(folioStore, "Database opened successfully: %s", qUtf8Printable(dbPath));
    if (errorOut) {
        errorOut->clear();
    }
    return true;
}

bool RewardStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(folioStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

int RewardStore::countRows(const char* sql)
{
    sqlite3_stmt* stmt = nullptr;
    int count = 0;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

// ── Impressions ─────────────────────────────────────────────

ImpressionRecord RewardStore::readImpressionRow(sqlite3_stmt* stmt)
{
    ImpressionRecord impression;
    impression.id = sqlite3_column_int64(stmt, 0);
    impression.identity.userId = columnText(stmt, 1);
    impression.identity.sessionId = columnText(stmt, 2);
    impression.bookId = columnText(stmt, 3);
    impression.contextVector = columnDoubles(stmt, 4);
    impression.armId = columnText(stmt, 5);
    impression.rank = sqlite3_column_int(stmt, 6);
    impression.score = sqlite3_column_double(stmt, 7);
    impression.metadata = QJsonDocument::fromJson(columnText(stmt, 8).toUtf8()).object();
    impression.createdAtMs = sqlite3_column_int64(stmt, 9);
    if (sqlite3_column_type(stmt, 10) != SQLITE_NULL) {
        impression.reward = sqlite3_column_double(stmt, 10);
    }
    impression.saveCredit = sqlite3_column_double(stmt, 11);
    if (sqlite3_column_type(stmt, 12) != SQLITE_NULL) {
        impression.attributedAtMs = sqlite3_column_int64(stmt, 12);
    }
    return impression;
}

std::optional<int64_t> RewardStore::insertImpressionUnlocked(const ImpressionRecord& impression,
                                                             ErrorInfo* errorOut)
{
    static constexpr const char* kSql = R"(
        INSERT INTO impressions (user_id, session_id, book_id, context_vector, arm_id,
                                 rank, score, metadata, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(folioStore, "prepare impression insert failed: %s", sqlite3_errmsg(m_db));
        fail(errorOut, ErrorKind::Storage, QStringLiteral("prepare_impression_insert_failed"),
             QString::fromUtf8(sqlite3_errmsg(m_db)));
        return std::nullopt;
    }

    bindNullableText(stmt, 1, impression.identity.userId);
    bindNullableText(stmt, 2, impression.identity.sessionId);
    bindText(stmt, 3, impression.bookId);
    bindBlob(stmt, 4, doublesToBlob(impression.contextVector));
    bindText(stmt, 5, impression.armId);
    sqlite3_bind_int(stmt, 6, impression.rank);
    sqlite3_bind_double(stmt, 7, impression.score);
    bindText(stmt, 8, QString::fromUtf8(
        QJsonDocument(impression.metadata).toJson(QJsonDocument::Compact)));
    sqlite3_bind_int64(stmt, 9, impression.createdAtMs);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(folioStore, "impression insert failed: %s", sqlite3_errmsg(m_db));
        fail(errorOut, ErrorKind::Storage, QStringLiteral("impression_insert_failed"),
             QString::fromUtf8(sqlite3_errmsg(m_db)));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::optional<int64_t> RewardStore::insertImpression(const ImpressionRecord& impression,
                                                     ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return insertImpressionUnlocked(impression, errorOut);
}

std::optional<QVector<int64_t>> RewardStore::insertImpressions(
    const QVector<ImpressionRecord>& impressions, ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!execSql("BEGIN IMMEDIATE")) {
        fail(errorOut, ErrorKind::Storage, QStringLiteral("begin_transaction_failed"));
        return std::nullopt;
    }

    QVector<int64_t> ids;
    ids.reserve(impressions.size());
    for (const ImpressionRecord& impression : impressions) {
        const std::optional<int64_t> id = insertImpressionUnlocked(impression, errorOut);
        if (!id.has_value()) {
            execSql("ROLLBACK");
            return std::nullopt;
        }
        ids.append(*id);
    }

    if (!execSql("COMMIT")) {
        execSql("ROLLBACK");
        fail(errorOut, ErrorKind::Storage, QStringLiteral("commit_failed"));
        return std::nullopt;
    }
    return ids;
}

std::optional<ImpressionRecord> RewardStore::getImpression(int64_t impressionId)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const QByteArray sql = QByteArray("SELECT ") + kImpressionColumns
        + " FROM impressions WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, impressionId);

    std::optional<ImpressionRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readImpressionRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

QVector<ImpressionRecord> RewardStore::impressionsFor(const Identity& identity,
                                                      qint64 fromMs, qint64 toMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const QByteArray sql = QByteArray("SELECT ") + kImpressionColumns + R"(
        FROM impressions
        WHERE ((?1 IS NOT NULL AND user_id = ?1) OR (?2 IS NOT NULL AND session_id = ?2))
          AND created_at BETWEEN ?3 AND ?4
        ORDER BY created_at ASC, id ASC
    )";

    QVector<ImpressionRecord> rows;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(folioStore, "impressionsFor prepare failed: %s", sqlite3_errmsg(m_db));
        return rows;
    }
    bindNullableText(stmt, 1, identity.userId);
    bindNullableText(stmt, 2, identity.sessionId);
    sqlite3_bind_int64(stmt, 3, fromMs);
    sqlite3_bind_int64(stmt, 4, toMs);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.append(readImpressionRow(stmt));
    }
    sqlite3_finalize(stmt);
    return rows;
}

std::optional<ImpressionRecord> RewardStore::findAttributionCandidate(const Identity& identity,
                                                                      const QString& bookId,
                                                                      qint64 actionAtMs,
                                                                      qint64 windowMs,
                                                                      ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (errorOut) {
        errorOut->clear();
    }

    const QByteArray sql = QByteArray("SELECT ") + kImpressionColumns + R"(
        FROM impressions
        WHERE book_id = ?1
          AND ((?2 IS NOT NULL AND user_id = ?2) OR (?3 IS NOT NULL AND session_id = ?3))
          AND created_at <= ?4
          AND created_at >= ?5
        ORDER BY created_at DESC, id DESC
        LIMIT 1
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(folioStore, "attribution candidate prepare failed: %s", sqlite3_errmsg(m_db));
        fail(errorOut, ErrorKind::Storage, QStringLiteral("prepare_candidate_query_failed"),
             QString::fromUtf8(sqlite3_errmsg(m_db)));
        return std::nullopt;
    }
    bindText(stmt, 1, bookId);
    bindNullableText(stmt, 2, identity.userId);
    bindNullableText(stmt, 3, identity.sessionId);
    sqlite3_bind_int64(stmt, 4, actionAtMs);
    sqlite3_bind_int64(stmt, 5, actionAtMs - windowMs);

    std::optional<ImpressionRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readImpressionRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

// ── Actions ─────────────────────────────────────────────────

ActionRecord RewardStore::readActionRow(sqlite3_stmt* stmt)
{
    ActionRecord action;
    action.id = sqlite3_column_int64(stmt, 0);
    action.identity.userId = columnText(stmt, 1);
    action.identity.sessionId = columnText(stmt, 2);
    action.bookId = columnText(stmt, 3);
    action.actionType = actionTypeFromString(columnText(stmt, 4)).value_or(ActionType::Click);
    if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
        action.actionValue = sqlite3_column_double(stmt, 5);
    }
    action.createdAtMs = sqlite3_column_int64(stmt, 6);
    if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
        action.attributedImpressionId = sqlite3_column_int64(stmt, 7);
    }
    if (sqlite3_column_type(stmt, 8) != SQLITE_NULL) {
        action.attributedReward = sqlite3_column_double(stmt, 8);
    }
    return action;
}

std::optional<int64_t> RewardStore::insertAction(const ActionRecord& action, ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kSql = R"(
        INSERT INTO actions (user_id, session_id, book_id, action_type, action_value, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(folioStore, "prepare action insert failed: %s", sqlite3_errmsg(m_db));
        fail(errorOut, ErrorKind::Storage, QStringLiteral("prepare_action_insert_failed"),
             QString::fromUtf8(sqlite3_errmsg(m_db)));
        return std::nullopt;
    }

    bindNullableText(stmt, 1, action.identity.userId);
    bindNullableText(stmt, 2, action.identity.sessionId);
    bindText(stmt, 3, action.bookId);
    bindText(stmt, 4, actionTypeToString(action.actionType));
    if (action.actionValue.has_value()) {
        sqlite3_bind_double(stmt, 5, *action.actionValue);
    } else {
        sqlite3_bind_null(stmt, 5);
    }
    sqlite3_bind_int64(stmt, 6, action.createdAtMs);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(folioStore, "action insert failed: %s", sqlite3_errmsg(m_db));
        fail(errorOut, ErrorKind::Storage, QStringLiteral("action_insert_failed"),
             QString::fromUtf8(sqlite3_errmsg(m_db)));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::optional<ActionRecord> RewardStore::getAction(int64_t actionId)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const QByteArray sql = QByteArray("SELECT ") + kActionColumns + " FROM actions WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, actionId);

    std::optional<ActionRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readActionRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

QVector<ActionRecord> RewardStore::actionsFor(const Identity& identity, qint64 fromMs, qint64 toMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const QByteArray sql = QByteArray("SELECT ") + kActionColumns + R"(
        FROM actions
        WHERE ((?1 IS NOT NULL AND user_id = ?1) OR (?2 IS NOT NULL AND session_id = ?2))
          AND created_at BETWEEN ?3 AND ?4
        ORDER BY created_at ASC, id ASC
    )";

    QVector<ActionRecord> rows;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(folioStore, "actionsFor prepare failed: %s", sqlite3_errmsg(m_db));
        return rows;
    }
    bindNullableText(stmt, 1, identity.userId);
    bindNullableText(stmt, 2, identity.sessionId);
    sqlite3_bind_int64(stmt, 3, fromMs);
    sqlite3_bind_int64(stmt, 4, toMs);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.append(readActionRow(stmt));
    }
    sqlite3_finalize(stmt);
    return rows;
}

QVector<ActionRecord> RewardStore::unattributedActionsSince(qint64 sinceMs, qint64 afterMs,
                                                            int64_t afterId, int limit,
                                                            ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (errorOut) {
        errorOut->clear();
    }

    const QByteArray sql = QByteArray("SELECT ") + kActionColumns + R"(
        FROM actions
        WHERE attributed_impression_id IS NULL
          AND created_at >= ?1
          AND (created_at > ?2 OR (created_at = ?2 AND id > ?3))
        ORDER BY created_at ASC, id ASC
        LIMIT ?4
    )";

    QVector<ActionRecord> rows;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(folioStore, "pending actions prepare failed: %s", sqlite3_errmsg(m_db));
        fail(errorOut, ErrorKind::Storage, QStringLiteral("prepare_pending_actions_failed"),
             QString::fromUtf8(sqlite3_errmsg(m_db)));
        return rows;
    }
    sqlite3_bind_int64(stmt, 1, sinceMs);
    sqlite3_bind_int64(stmt, 2, afterMs);
    sqlite3_bind_int64(stmt, 3, afterId);
    sqlite3_bind_int(stmt, 4, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.append(readActionRow(stmt));
    }
    sqlite3_finalize(stmt);
    return rows;
}

// ── Attribution ─────────────────────────────────────────────

std::optional<int64_t> RewardStore::commitAttribution(const AttributionWrite& write,
                                                      ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kClaimActionSql = R"(
        UPDATE actions
        SET attributed_impression_id = ?1,
            attributed_reward = ?2,
            attributed_at = ?3
        WHERE id = ?4
          AND attributed_impression_id IS NULL
    )";

    static constexpr const char* kUpdateImpressionSql = R"(
        UPDATE impressions
        SET reward = COALESCE(reward, 0) + ?1,
            save_credit = MAX(0, save_credit + ?2),
            attributed_at = ?3
        WHERE id = ?4
    )";

    static constexpr const char* kInsertEventSql = R"(
        INSERT INTO reward_events (impression_id, action_id, scope, arm_id, reward, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    )";

    if (!execSql("BEGIN IMMEDIATE")) {
        fail(errorOut, ErrorKind::Storage, QStringLiteral("begin_transaction_failed"));
        return std::nullopt;
    }

    auto rollbackWith = [&](ErrorKind kind, const char* code) -> std::optional<int64_t> {
        const QString message = QString::fromUtf8(sqlite3_errmsg(m_db));
        execSql("ROLLBACK");
        fail(errorOut, kind, QString::fromLatin1(code), message);
        return std::nullopt;
    };

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kClaimActionSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return rollbackWith(ErrorKind::Storage, "prepare_claim_action_failed");
    }
    sqlite3_bind_int64(stmt, 1, write.impressionId);
    sqlite3_bind_double(stmt, 2, write.contribution);
    sqlite3_bind_int64(stmt, 3, write.attributedAtMs);
    sqlite3_bind_int64(stmt, 4, write.actionId);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return rollbackWith(ErrorKind::Storage, "claim_action_failed");
    }
    if (sqlite3_changes(m_db) != 1) {
        return rollbackWith(ErrorKind::AttributionConflict, "action_already_attributed");
    }

    if (sqlite3_prepare_v2(m_db, kUpdateImpressionSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return rollbackWith(ErrorKind::Storage, "prepare_impression_reward_failed");
    }
    sqlite3_bind_double(stmt, 1, write.contribution);
    sqlite3_bind_double(stmt, 2, write.saveCreditDelta);
    sqlite3_bind_int64(stmt, 3, write.attributedAtMs);
    sqlite3_bind_int64(stmt, 4, write.impressionId);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return rollbackWith(ErrorKind::Storage, "impression_reward_failed");
    }
    if (sqlite3_changes(m_db) != 1) {
        return rollbackWith(ErrorKind::NotFound, "impression_not_found");
    }

    int64_t eventId = 0;
    if (write.queueRewardEvent) {
        if (sqlite3_prepare_v2(m_db, kInsertEventSql, -1, &stmt, nullptr) != SQLITE_OK) {
            return rollbackWith(ErrorKind::Storage, "prepare_reward_event_failed");
        }
        sqlite3_bind_int64(stmt, 1, write.impressionId);
        sqlite3_bind_int64(stmt, 2, write.actionId);
        bindText(stmt, 3, write.scope);
        bindText(stmt, 4, write.armId);
        sqlite3_bind_double(stmt, 5, write.contribution);
        sqlite3_bind_int64(stmt, 6, write.attributedAtMs);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return rollbackWith(ErrorKind::Storage, "reward_event_insert_failed");
        }
        eventId = sqlite3_last_insert_rowid(m_db);
    }

    if (!execSql("COMMIT")) {
        return rollbackWith(ErrorKind::Storage, "commit_failed");
    }
    if (errorOut) {
        errorOut->clear();
    }
    return eventId;
}

QVector<RewardEvent> RewardStore::pendingRewardEvents(int limit, ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (errorOut) {
        errorOut->clear();
    }

    static constexpr const char* kSql = R"(
        SELECT e.id, e.impression_id, e.action_id, e.scope, e.arm_id, e.reward, i.context_vector
        FROM reward_events e
        JOIN impressions i ON i.id = e.impression_id
        WHERE e.applied_at IS NULL
        ORDER BY e.id ASC
        LIMIT ?1
    )";

    QVector<RewardEvent> events;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(folioStore, "pending reward events prepare failed: %s", sqlite3_errmsg(m_db));
        fail(errorOut, ErrorKind::Storage, QStringLiteral("prepare_pending_events_failed"),
             QString::fromUtf8(sqlite3_errmsg(m_db)));
        return events;
    }
    sqlite3_bind_int(stmt, 1, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        RewardEvent event;
        event.id = sqlite3_column_int64(stmt, 0);
        event.impressionId = sqlite3_column_int64(stmt, 1);
        event.actionId = sqlite3_column_int64(stmt, 2);
        event.scope = columnText(stmt, 3);
        event.armId = columnText(stmt, 4);
        event.reward = sqlite3_column_double(stmt, 5);
        event.contextVector = columnDoubles(stmt, 6);
        events.append(event);
    }
    sqlite3_finalize(stmt);
    return events;
}

int RewardStore::pendingRewardEventCount()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return countRows("SELECT COUNT(*) FROM reward_events WHERE applied_at IS NULL");
}

// ── Arm models ──────────────────────────────────────────────

std::optional<RewardStore::ArmRow> RewardStore::loadArm(const QString& scope, const QString& armId)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kSql = R"(
        SELECT scope, arm_id, dimension, a_matrix, b_vector, interaction_count,
               cumulative_reward, cumulative_squared_reward, degraded, updated_at
        FROM arm_models
        WHERE scope = ?1 AND arm_id = ?2
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(folioStore, "loadArm prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    bindText(stmt, 1, scope);
    bindText(stmt, 2, armId);

    std::optional<ArmRow> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readArmRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

QVector<RewardStore::ArmRow> RewardStore::loadArms(const QString& scope)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kSql = R"(
        SELECT scope, arm_id, dimension, a_matrix, b_vector, interaction_count,
               cumulative_reward, cumulative_squared_reward, degraded, updated_at
        FROM arm_models
        WHERE scope = ?1
        ORDER BY arm_id ASC
    )";

    QVector<ArmRow> rows;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(folioStore, "loadArms prepare failed: %s", sqlite3_errmsg(m_db));
        return rows;
    }
    bindText(stmt, 1, scope);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.append(readArmRow(stmt));
    }
    sqlite3_finalize(stmt);
    return rows;
}

QStringList RewardStore::armScopes()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    QStringList scopes;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT DISTINCT scope FROM arm_models ORDER BY scope", -1,
                           &stmt, nullptr) != SQLITE_OK) {
        return scopes;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        scopes.append(columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return scopes;
}

bool RewardStore::upsertArmUnlocked(const ArmRow& arm, ErrorInfo* errorOut)
{
    static constexpr const char* kSql = R"(
        INSERT INTO arm_models (scope, arm_id, dimension, a_matrix, b_vector, interaction_count,
                                cumulative_reward, cumulative_squared_reward, degraded, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
        ON CONFLICT(scope, arm_id) DO UPDATE SET
            dimension = excluded.dimension,
            a_matrix = excluded.a_matrix,
            b_vector = excluded.b_vector,
            interaction_count = excluded.interaction_count,
            cumulative_reward = excluded.cumulative_reward,
            cumulative_squared_reward = excluded.cumulative_squared_reward,
            degraded = excluded.degraded,
            updated_at = excluded.updated_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(folioStore, "prepare arm upsert failed: %s", sqlite3_errmsg(m_db));
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("prepare_arm_upsert_failed"),
                    QString::fromUtf8(sqlite3_errmsg(m_db)));
    }
    bindText(stmt, 1, arm.scope);
    bindText(stmt, 2, arm.armId);
    sqlite3_bind_int(stmt, 3, arm.dimension);
    bindBlob(stmt, 4, doublesToBlob(arm.aMatrix));
    bindBlob(stmt, 5, doublesToBlob(arm.bVector));
    sqlite3_bind_int64(stmt, 6, arm.interactionCount);
    sqlite3_bind_double(stmt, 7, arm.cumulativeReward);
    sqlite3_bind_double(stmt, 8, arm.cumulativeSquaredReward);
    sqlite3_bind_int(stmt, 9, arm.degraded ? 1 : 0);
    sqlite3_bind_int64(stmt, 10, arm.updatedAtMs);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(folioStore, "arm upsert failed: %s", sqlite3_errmsg(m_db));
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("arm_upsert_failed"),
                    QString::fromUtf8(sqlite3_errmsg(m_db)));
    }
    return true;
}

bool RewardStore::saveArm(const ArmRow& arm, ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return upsertArmUnlocked(arm, errorOut);
}

bool RewardStore::saveArmAndMarkApplied(const ArmRow& arm, int64_t rewardEventId,
                                        qint64 appliedAtMs, ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kMarkAppliedSql = R"(
        UPDATE reward_events SET applied_at = ?1 WHERE id = ?2 AND applied_at IS NULL
    )";

    if (!execSql("BEGIN IMMEDIATE")) {
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("begin_transaction_failed"));
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kMarkAppliedSql, -1, &stmt, nullptr) != SQLITE_OK) {
        const QString message = QString::fromUtf8(sqlite3_errmsg(m_db));
        execSql("ROLLBACK");
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("prepare_mark_applied_failed"),
                    message);
    }
    sqlite3_bind_int64(stmt, 1, appliedAtMs);
    sqlite3_bind_int64(stmt, 2, rewardEventId);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        const QString message = QString::fromUtf8(sqlite3_errmsg(m_db));
        execSql("ROLLBACK");
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("mark_applied_failed"), message);
    }
    if (sqlite3_changes(m_db) != 1) {
        execSql("ROLLBACK");
        return fail(errorOut, ErrorKind::AttributionConflict,
                    QStringLiteral("reward_event_already_applied"));
    }

    if (!upsertArmUnlocked(arm, errorOut)) {
        execSql("ROLLBACK");
        return false;
    }

    if (!execSql("COMMIT")) {
        execSql("ROLLBACK");
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("commit_failed"));
    }
    if (errorOut) {
        errorOut->clear();
    }
    return true;
}

bool RewardStore::deleteArms(const QString& scope, ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const char* sql = scope.isEmpty() ? "DELETE FROM arm_models"
                                      : "DELETE FROM arm_models WHERE scope = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("prepare_arm_delete_failed"),
                    QString::fromUtf8(sqlite3_errmsg(m_db)));
    }
    if (!scope.isEmpty()) {
        bindText(stmt, 1, scope);
    }
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("arm_delete_failed"),
                    QString::fromUtf8(sqlite3_errmsg(m_db)));
    }
    return true;
}

// ── Identity merge ──────────────────────────────────────────

std::optional<RewardStore::MergeCounts> RewardStore::mergeIdentities(const QString& sessionId,
                                                                     const QString& userId,
                                                                     ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    // Pending events first: their impressions are still identified by the
    // session alone at this point.
    static constexpr const char* kEventsSql = R"(
        UPDATE reward_events
        SET scope = ?1
        WHERE applied_at IS NULL
          AND impression_id IN (
              SELECT id FROM impressions WHERE session_id = ?2 AND user_id IS NULL)
    )";
    static constexpr const char* kImpressionsSql = R"(
        UPDATE impressions SET user_id = ?1 WHERE session_id = ?2 AND user_id IS NULL
    )";
    static constexpr const char* kActionsSql = R"(
        UPDATE actions SET user_id = ?1 WHERE session_id = ?2 AND user_id IS NULL
    )";

    if (!execSql("BEGIN IMMEDIATE")) {
        fail(errorOut, ErrorKind::Storage, QStringLiteral("begin_transaction_failed"));
        return std::nullopt;
    }

    auto run = [&](const char* sql, int* changedOut) -> bool {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        bindText(stmt, 1, userId);
        bindText(stmt, 2, sessionId);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return false;
        }
        *changedOut = sqlite3_changes(m_db);
        return true;
    };

    MergeCounts counts;
    if (!run(kEventsSql, &counts.rewardEvents)
        || !run(kImpressionsSql, &counts.impressions)
        || !run(kActionsSql, &counts.actions)) {
        const QString message = QString::fromUtf8(sqlite3_errmsg(m_db));
        execSql("ROLLBACK");
        LOG_ERROR(folioStore, "Identity merge failed: %s", qUtf8Printable(message));
        fail(errorOut, ErrorKind::Storage, QStringLiteral("identity_merge_failed"), message);
        return std::nullopt;
    }

    if (!execSql("COMMIT")) {
        execSql("ROLLBACK");
        fail(errorOut, ErrorKind::Storage, QStringLiteral("commit_failed"));
        return std::nullopt;
    }
    return counts;
}

// ── Collaborative signals ───────────────────────────────────

QHash<QString, int> RewardStore::saveCounts()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kSql = R"(
        SELECT book_id, COUNT(DISTINCT COALESCE(user_id, session_id))
        FROM actions
        WHERE action_type = 'save'
        GROUP BY book_id
    )";

    QHash<QString, int> counts;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(folioStore, "saveCounts prepare failed: %s", sqlite3_errmsg(m_db));
        return counts;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        counts.insert(columnText(stmt, 0), sqlite3_column_int(stmt, 1));
    }
    sqlite3_finalize(stmt);
    return counts;
}

QHash<QString, int> RewardStore::coSaveCounts(const Identity& identity)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kSql = R"(
        WITH mine AS (
            SELECT DISTINCT book_id FROM actions
            WHERE action_type = 'save'
              AND ((?1 IS NOT NULL AND user_id = ?1) OR (?2 IS NOT NULL AND session_id = ?2))
        ),
        peers AS (
            SELECT DISTINCT COALESCE(user_id, session_id) AS owner FROM actions
            WHERE action_type = 'save'
              AND book_id IN (SELECT book_id FROM mine)
              AND NOT ((?1 IS NOT NULL AND user_id IS ?1) OR (?2 IS NOT NULL AND session_id IS ?2))
        )
        SELECT book_id, COUNT(DISTINCT COALESCE(user_id, session_id))
        FROM actions
        WHERE action_type = 'save'
          AND COALESCE(user_id, session_id) IN (SELECT owner FROM peers)
          AND book_id NOT IN (SELECT book_id FROM mine)
        GROUP BY book_id
    )";

    QHash<QString, int> counts;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(folioStore, "coSaveCounts prepare failed: %s", sqlite3_errmsg(m_db));
        return counts;
    }
    bindNullableText(stmt, 1, identity.userId);
    bindNullableText(stmt, 2, identity.sessionId);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        counts.insert(columnText(stmt, 0), sqlite3_column_int(stmt, 1));
    }
    sqlite3_finalize(stmt);
    return counts;
}

// ── Books ───────────────────────────────────────────────────

bool RewardStore::upsertBook(const CatalogBook& book, ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kSql = R"(
        INSERT INTO books (book_id, title, author, text, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5)
        ON CONFLICT(book_id) DO UPDATE SET
            title = excluded.title,
            author = excluded.author,
            text = excluded.text,
            updated_at = excluded.updated_at
    )";

    if (book.bookId.isEmpty()) {
        return fail(errorOut, ErrorKind::Validation, QStringLiteral("book_id_required"));
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("prepare_book_upsert_failed"),
                    QString::fromUtf8(sqlite3_errmsg(m_db)));
    }
    bindText(stmt, 1, book.bookId);
    bindText(stmt, 2, book.title);
    bindText(stmt, 3, book.author);
    bindText(stmt, 4, book.text);
    sqlite3_bind_int64(stmt, 5, book.updatedAtMs > 0 ? book.updatedAtMs
                                                     : QDateTime::currentMSecsSinceEpoch());
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail(errorOut, ErrorKind::Storage, QStringLiteral("book_upsert_failed"),
                    QString::fromUtf8(sqlite3_errmsg(m_db)));
    }
    return true;
}

QVector<CatalogBook> RewardStore::books()
{
    return booksChangedSince(0);
}

QVector<CatalogBook> RewardStore::booksChangedSince(qint64 sinceMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kSql = R"(
        SELECT book_id, title, author, text, updated_at
        FROM books
        WHERE updated_at >= ?1
        ORDER BY book_id ASC
    )";

    QVector<CatalogBook> rows;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(folioStore, "books prepare failed: %s", sqlite3_errmsg(m_db));
        return rows;
    }
    sqlite3_bind_int64(stmt, 1, sinceMs);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.append(readBookRow(stmt));
    }
    sqlite3_finalize(stmt);
    return rows;
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> RewardStore::getSetting(const QString& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT value FROM settings WHERE key = ?1", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    bindText(stmt, 1, key);

    std::optional<QString> value;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

bool RewardStore::setSetting(const QString& key, const QString& value)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "INSERT OR REPLACE INTO settings (key, value) VALUES (?1, ?2)",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(folioStore, "setSetting prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    bindText(stmt, 1, key);
    bindText(stmt, 2, value);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── Counters ────────────────────────────────────────────────

int RewardStore::impressionCount()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return countRows("SELECT COUNT(*) FROM impressions");
}

int RewardStore::actionCount()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return countRows("SELECT COUNT(*) FROM actions");
}

} // namespace folio
