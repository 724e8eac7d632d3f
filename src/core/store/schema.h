#pragma once

namespace folio {

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA wal_autocheckpoint = 10000;
PRAGMA cache_size = -16384;
)";

// Database-level pragmas, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x464F4C;
PRAGMA user_version = 1;
)";

// Current schema. Timestamps are INTEGER milliseconds since the epoch so the
// attribution window boundary can be compared exactly.
constexpr const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS impressions (
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
    save_credit REAL NOT NULL DEFAULT 0,
    attributed_at INTEGER
);

CREATE INDEX IF NOT EXISTS idx_impressions_book_created ON impressions(book_id, created_at DESC);
CREATE INDEX IF NOT EXISTS idx_impressions_user ON impressions(user_id);
CREATE INDEX IF NOT EXISTS idx_impressions_session ON impressions(session_id);

CREATE TABLE IF NOT EXISTS actions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT,
    session_id TEXT,
    book_id TEXT NOT NULL,
    action_type TEXT NOT NULL CHECK (action_type IN ('click', 'save', 'unsave', 'rate')),
    action_value REAL,
    created_at INTEGER NOT NULL,
    attributed_impression_id INTEGER REFERENCES impressions(id) ON DELETE SET NULL,
    attributed_reward REAL,
    attributed_at INTEGER
);

CREATE INDEX IF NOT EXISTS idx_actions_pending ON actions(attributed_impression_id, created_at);
CREATE INDEX IF NOT EXISTS idx_actions_user ON actions(user_id);
CREATE INDEX IF NOT EXISTS idx_actions_session ON actions(session_id);
CREATE INDEX IF NOT EXISTS idx_actions_book_type ON actions(book_id, action_type);

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

CREATE INDEX IF NOT EXISTS idx_reward_events_pending ON reward_events(applied_at, id);

CREATE TABLE IF NOT EXISTS arm_models (
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

CREATE TABLE IF NOT EXISTS books (
    book_id TEXT PRIMARY KEY,
    title TEXT NOT NULL DEFAULT '',
    author TEXT NOT NULL DEFAULT '',
    text TEXT NOT NULL DEFAULT '',
    updated_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_books_updated_at ON books(updated_at);

CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)";

constexpr const char* kDefaultSettings = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '2');
INSERT OR IGNORE INTO settings (key, value) VALUES ('attribution_checkpoint_ms', '0');
INSERT OR IGNORE INTO settings (key, value) VALUES ('attribution_checkpoint_id', '0');
INSERT OR IGNORE INTO settings (key, value) VALUES ('attribution_resume_pending', '0');
INSERT OR IGNORE INTO settings (key, value) VALUES ('last_attribution_run_ms', '0');
)";

constexpr int kCurrentSchemaVersion = 2;

} // namespace folio
