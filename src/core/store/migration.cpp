#include "core/store/migration.h"
#include "core/shared/logging.h"
#include <sqlite3.h>
#include <cstdlib>

namespace folio {

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT value FROM settings WHERE key = 'schema_version'";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (val) {
                version = std::atoi(val);
            }
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    int current = currentSchemaVersion(db);

    if (current > targetVersion) {
        LOG_ERROR(folioStore, "Schema version %d is newer than supported version %d",
                  current, targetVersion);
        return false;
    }

    if (current == targetVersion) {
        return true;
    }

    auto exec = [db](const char* sql) -> bool {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(folioStore, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    };

    // Version 1 databases recorded attribution only on the action row. Version 2
    // adds the reward event queue consumed by the model updater and tracks how
    // much save credit each impression holds so unsave can reverse it.
    if (current < 2 && targetVersion >= 2) {
        LOG_INFO(folioStore, "Applying schema migration 1 -> 2");

        if (!exec("BEGIN TRANSACTION")) {
            return false;
        }

        const bool ok = exec(R"(
            CREATE TABLE IF NOT EXISTS reward_events (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                impression_id INTEGER NOT NULL REFERENCES impressions(id) ON DELETE CASCADE,
                action_id INTEGER NOT NULL UNIQUE REFERENCES actions(id) ON DELETE CASCADE,
                scope TEXT NOT NULL,
                arm_id TEXT NOT NULL,
                reward REAL NOT NULL,
                created_at INTEGER NOT NULL,
                applied_at INTEGER
            );
        )")
            && exec("CREATE INDEX IF NOT EXISTS idx_reward_events_pending ON reward_events(applied_at, id);")
            && exec("ALTER TABLE impressions ADD COLUMN save_credit REAL NOT NULL DEFAULT 0;")
            && exec("ALTER TABLE actions ADD COLUMN attributed_at INTEGER;")
            && exec("INSERT OR REPLACE INTO settings (key, value) VALUES ('attribution_checkpoint_ms', '0');")
            && exec("INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', '2');");

        if (!ok) {
            exec("ROLLBACK");
            return false;
        }
        if (!exec("COMMIT")) {
            exec("ROLLBACK");
            return false;
        }

        current = 2;
    }

    LOG_INFO(folioStore, "Schema at version %d", current);
    return current == targetVersion;
}

} // namespace folio
