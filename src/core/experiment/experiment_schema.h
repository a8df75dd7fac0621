#pragma once

namespace sr {

// Per-connection pragmas, safe on every open.
constexpr const char* kExperimentConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
)";

// Database-level pragmas, run once when creating the DB.
constexpr const char* kExperimentDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA user_version = 1;
)";

// Timestamps are UTC milliseconds since the epoch.
constexpr const char* kExperimentSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS experiment_events (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    session_id TEXT NOT NULL,
    variant TEXT NOT NULL,
    candidate_id TEXT NOT NULL,
    kind TEXT NOT NULL,
    position INTEGER NOT NULL DEFAULT 0,
    timestamp_ms INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_experiment_events_time
    ON experiment_events(timestamp_ms);
CREATE INDEX IF NOT EXISTS idx_experiment_events_variant
    ON experiment_events(variant, timestamp_ms);

CREATE TABLE IF NOT EXISTS experiment_assignments (
    session_id TEXT PRIMARY KEY,
    variant TEXT NOT NULL,
    assigned_at_ms INTEGER NOT NULL
);
)";

} // namespace sr
