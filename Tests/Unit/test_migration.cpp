#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <sqlite3.h>
#include "core/store/migration.h"
#include "core/store/reward_store.h"
#include "core/store/schema.h"

namespace {

// Layout written by the first release: no reward event queue, no save credit.
constexpr const char* kVersion1Schema = R"(
CREATE TABLE impressions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT,
    session_id TEXT,
    book_id TEXT NOT NULL,
    context_vector BLOB NOT NULL,
    arm_id TEXT NOT NULL,
    rank INTEGER NOT NULL,
    score REAL NOT NULL,
    metadata TEXT NOT NULL DEFAULT '{}',
    created_at INTEGER NOT NULL,
    reward REAL,
    attributed_at INTEGER
);
CREATE TABLE actions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT,
    session_id TEXT,
    book_id TEXT NOT NULL,
    action_type TEXT NOT NULL,
    action_value REAL,
    created_at INTEGER NOT NULL,
    attributed_impression_id INTEGER,
    attributed_reward REAL
);
CREATE TABLE arm_models (
    scope TEXT NOT NULL,
    arm_id TEXT NOT NULL,
    dimension INTEGER NOT NULL,
    a_matrix BLOB NOT NULL,
    b_vector BLOB NOT NULL,
    interaction_count INTEGER NOT NULL DEFAULT 0,
    cumulative_reward REAL NOT NULL DEFAULT 0,
    cumulative_squared_reward REAL NOT NULL DEFAULT 0,
    degraded INTEGER NOT NULL DEFAULT 0,
    updated_at INTEGER NOT NULL,
    PRIMARY KEY (scope, arm_id)
);
CREATE TABLE books (
    book_id TEXT PRIMARY KEY,
    title TEXT NOT NULL DEFAULT '',
    author TEXT NOT NULL DEFAULT '',
    text TEXT NOT NULL DEFAULT '',
    updated_at INTEGER NOT NULL
);
CREATE TABLE settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);
INSERT INTO settings (key, value) VALUES ('schema_version', '1');
INSERT INTO actions (user_id, book_id, action_type, created_at) VALUES ('u1', 'b1', 'click', 1000);
)";

bool execAll(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    sqlite3_free(errMsg);
    return rc == SQLITE_OK;
}

bool tableExists(sqlite3* db, const char* table)
{
    sqlite3_stmt* stmt = nullptr;
    bool exists = false;
    if (sqlite3_prepare_v2(db, "SELECT count(*) FROM sqlite_master WHERE type='table' AND name=?1",
                           -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, table, -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            exists = sqlite3_column_int(stmt, 0) > 0;
        }
    }
    sqlite3_finalize(stmt);
    return exists;
}

} // namespace

class TestMigration : public QObject {
    Q_OBJECT

private slots:
    void testFreshDatabaseReportsVersionZero();
    void testUpgradeFromVersionOne();
    void testUpgradedDatabaseOpensAndAttributes();
    void testRejectsNewerSchema();
};

void TestMigration::testFreshDatabaseReportsVersionZero()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QCOMPARE(folio::currentSchemaVersion(db), 0);
    sqlite3_close(db);
}

void TestMigration::testUpgradeFromVersionOne()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QVERIFY(execAll(db, kVersion1Schema));
    QCOMPARE(folio::currentSchemaVersion(db), 1);
    QVERIFY(!tableExists(db, "reward_events"));

    QVERIFY(folio::applyMigrations(db, folio::kCurrentSchemaVersion));
    QCOMPARE(folio::currentSchemaVersion(db), 2);
    QVERIFY(tableExists(db, "reward_events"));
    QVERIFY(execAll(db, "SELECT save_credit FROM impressions"));
    QVERIFY(execAll(db, "SELECT attributed_at FROM actions"));

    // Already current: a second run is a no-op.
    QVERIFY(folio::applyMigrations(db, folio::kCurrentSchemaVersion));
    QCOMPARE(folio::currentSchemaVersion(db), 2);
    sqlite3_close(db);
}

void TestMigration::testUpgradedDatabaseOpensAndAttributes()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString dbPath = dir.path() + "/folio.db";
    {
        sqlite3* db = nullptr;
        QCOMPARE(sqlite3_open(dbPath.toUtf8().constData(), &db), SQLITE_OK);
        QVERIFY(execAll(db, kVersion1Schema));
        sqlite3_close(db);
    }

    auto store = folio::RewardStore::open(dbPath);
    QVERIFY(store.has_value());
    QCOMPARE(store->getSetting(QStringLiteral("schema_version")).value_or(QString()),
             QStringLiteral("2"));
    QCOMPARE(store->actionCount(), 1);

    folio::ImpressionRecord impression;
    impression.identity.userId = QStringLiteral("u1");
    impression.bookId = QStringLiteral("b1");
    impression.contextVector = folio::ContextVector(folio::kContextDim, 0.0);
    impression.armId = QStringLiteral("contextual_mood");
    impression.rank = 1;
    impression.createdAtMs = 500;
    const std::optional<int64_t> impressionId = store->insertImpression(impression);
    QVERIFY(impressionId.has_value());

    folio::RewardStore::AttributionWrite write;
    write.actionId = 1;
    write.impressionId = *impressionId;
    write.contribution = 1.0;
    write.scope = QStringLiteral("u1");
    write.armId = QStringLiteral("contextual_mood");
    write.attributedAtMs = 2000;
    QVERIFY(store->commitAttribution(write).value_or(0) > 0);
    QCOMPARE(store->pendingRewardEventCount(), 1);
}

void TestMigration::testRejectsNewerSchema()
{
    QTemporaryDir dir;
    const QString dbPath = dir.path() + "/folio.db";
    {
        sqlite3* db = nullptr;
        QCOMPARE(sqlite3_open(dbPath.toUtf8().constData(), &db), SQLITE_OK);
        QVERIFY(execAll(db, kVersion1Schema));
        QVERIFY(execAll(db, "UPDATE settings SET value = '3' WHERE key = 'schema_version'"));
        QVERIFY(!folio::applyMigrations(db, folio::kCurrentSchemaVersion));
        sqlite3_close(db);
    }

    folio::ErrorInfo error;
    QVERIFY(!folio::RewardStore::open(dbPath, &error).has_value());
    QCOMPARE(error.kind, folio::ErrorKind::Storage);
    QCOMPARE(error.code, QStringLiteral("migration_failed"));
}

QTEST_MAIN(TestMigration)
#include "test_migration.moc"
