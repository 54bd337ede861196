#pragma once

namespace selfspy::store {

inline constexpr int SCHEMA_VERSION = 1;

/// Tables and indexes of an activity database. Times are Unix milliseconds.
inline constexpr const char *SCHEMA_DDL = R"(
CREATE TABLE IF NOT EXISTS meta (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS sessions (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  start_time INTEGER NOT NULL,
  end_time INTEGER
);
CREATE TABLE IF NOT EXISTS processes (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  name TEXT NOT NULL,
  bundle_id TEXT NOT NULL DEFAULT '',
  first_seen INTEGER NOT NULL,
  last_seen INTEGER NOT NULL,
  UNIQUE(name, bundle_id)
);
CREATE TABLE IF NOT EXISTS windows (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  title TEXT NOT NULL,
  process_id INTEGER NOT NULL REFERENCES processes(id),
  pid INTEGER NOT NULL,
  x INTEGER NOT NULL DEFAULT 0,
  y INTEGER NOT NULL DEFAULT 0,
  width INTEGER NOT NULL DEFAULT 0,
  height INTEGER NOT NULL DEFAULT 0,
  first_seen INTEGER NOT NULL,
  last_seen INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS keystroke_batches (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  window_id INTEGER REFERENCES windows(id),
  payload TEXT NOT NULL,
  encrypted INTEGER NOT NULL DEFAULT 0,
  modifiers TEXT NOT NULL DEFAULT '',
  count INTEGER NOT NULL DEFAULT 1,
  recorded_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS pointer_events (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  window_id INTEGER REFERENCES windows(id),
  x INTEGER NOT NULL,
  y INTEGER NOT NULL,
  button INTEGER NOT NULL DEFAULT 0,
  event_type TEXT NOT NULL,
  recorded_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_sessions_start ON sessions(start_time);
CREATE INDEX IF NOT EXISTS idx_windows_first_seen ON windows(first_seen);
CREATE INDEX IF NOT EXISTS idx_windows_lookup ON windows(title, pid, last_seen);
CREATE INDEX IF NOT EXISTS idx_keystrokes_recorded ON keystroke_batches(recorded_at);
CREATE INDEX IF NOT EXISTS idx_keystrokes_window ON keystroke_batches(window_id);
CREATE INDEX IF NOT EXISTS idx_pointer_recorded ON pointer_events(recorded_at);
CREATE INDEX IF NOT EXISTS idx_pointer_window ON pointer_events(window_id);
)";

} // namespace selfspy::store
