#include "storage/sqlite_key_value_store.h"
#include "core/errors.h"
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>

namespace {

/**
 * @brief Finalizes a prepared statement when it goes out of scope
 */
struct StatementGuard {
  sqlite3_stmt *stmt;
  ~StatementGuard() { sqlite3_finalize(stmt); }
};

void bindText(sqlite3_stmt *stmt, int index, const std::string &text) {
  sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()),
                    SQLITE_TRANSIENT);
}

} // namespace

SqliteKeyValueStore::SqliteKeyValueStore(const std::string &dbPath,
                                         int busyTimeoutMs)
    : db_path_(dbPath) {
  if (dbPath != ":memory:") {
    std::filesystem::path path(dbPath);
    std::error_code ec;
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path(), ec);
    }
  }

  int flags =
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(dbPath.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string message =
        db_ ? sqlite3_errmsg(db_) : "out of memory opening database";
    sqlite3_close(db_);
    db_ = nullptr;
    throw BackingStoreError("Failed to open SQLite database " + dbPath +
                            ": " + message);
  }

  sqlite3_busy_timeout(db_, busyTimeoutMs);

  try {
    createTables();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  std::cerr << "[SqliteKeyValueStore] Opened " << dbPath << std::endl;
}

SqliteKeyValueStore::~SqliteKeyValueStore() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SqliteKeyValueStore::fail(const std::string &what) const {
  throw BackingStoreError("SQLite " + what + " failed on " + db_path_ + ": " +
                          sqlite3_errmsg(db_));
}

void SqliteKeyValueStore::createTables() {
  const char *sql = "PRAGMA journal_mode=WAL;"
                    "CREATE TABLE IF NOT EXISTS kv ("
                    "  key   TEXT PRIMARY KEY NOT NULL,"
                    "  value TEXT NOT NULL"
                    ");";
  char *err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string message = err ? err : "unknown error";
    sqlite3_free(err);
    throw BackingStoreError("Failed to initialize SQLite schema: " + message);
  }
}

sqlite3_stmt *SqliteKeyValueStore::prepare(const char *sql) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    fail("prepare");
  }
  return stmt;
}

int SqliteKeyValueStore::execute(sqlite3_stmt *stmt) {
  StatementGuard guard{stmt};
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    fail("write");
  }
  return sqlite3_changes(db_);
}

std::string SqliteKeyValueStore::serialize(const Json::Value &value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

Json::Value SqliteKeyValueStore::deserialize(const std::string &key,
                                             const char *text) const {
  Json::CharReaderBuilder builder;
  Json::Value value;
  std::string errors;
  std::istringstream stream(text ? text : "");
  if (!Json::parseFromStream(builder, stream, &value, &errors)) {
    throw BackingStoreError("Corrupt value for key '" + key +
                            "' in " + db_path_ + ": " + errors);
  }
  return value;
}

std::optional<Json::Value> SqliteKeyValueStore::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = prepare("SELECT value FROM kv WHERE key = ?1;");
  StatementGuard guard{stmt};
  bindText(stmt, 1, key);

  int rc = sqlite3_step(stmt);
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    fail("read");
  }
  return deserialize(
      key, reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0)));
}

void SqliteKeyValueStore::put(const std::string &key,
                              const Json::Value &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = prepare(
      "INSERT INTO kv (key, value) VALUES (?1, ?2) "
      "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
  bindText(stmt, 1, key);
  bindText(stmt, 2, serialize(value));
  execute(stmt);
}

bool SqliteKeyValueStore::putIfAbsent(const std::string &key,
                                      const Json::Value &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt =
      prepare("INSERT OR IGNORE INTO kv (key, value) VALUES (?1, ?2);");
  bindText(stmt, 1, key);
  bindText(stmt, 2, serialize(value));
  return execute(stmt) == 1;
}

bool SqliteKeyValueStore::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = prepare("DELETE FROM kv WHERE key = ?1;");
  bindText(stmt, 1, key);
  return execute(stmt) > 0;
}

std::vector<KeyValueEntry>
SqliteKeyValueStore::scan(const std::string &prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt =
      prepare("SELECT key, value FROM kv "
              "WHERE substr(key, 1, length(?1)) = ?1 ORDER BY key;");
  StatementGuard guard{stmt};
  bindText(stmt, 1, prefix);

  std::vector<KeyValueEntry> result;
  int rc;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    std::string key(reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0)));
    Json::Value value = deserialize(
        key, reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1)));
    result.push_back({key, value});
  }
  if (rc != SQLITE_DONE) {
    fail("scan");
  }
  return result;
}
