#pragma once

#include "storage/key_value_store.h"
#include <mutex>
#include <sqlite3.h>

/**
 * @brief Relational row store on SQLite
 *
 * TABLE kv
 * ├── key   (TEXT PRIMARY KEY)
 * └── value (TEXT, compact JSON)
 *
 * putIfAbsent() is a single INSERT OR IGNORE whose effect is read back with
 * sqlite3_changes(), so the conditional write stays atomic across threads,
 * connections and processes sharing the database file. Statements on this
 * connection are serialized so sqlite3_changes() and sqlite3_errmsg() always
 * describe the caller's own statement. Every statement waits
 * at most busyTimeoutMs for a lock before failing with BackingStoreError.
 */
class SqliteKeyValueStore : public IKeyValueStore {
public:
  /**
   * @param dbPath Database file (":memory:" for a private in-memory database)
   * @param busyTimeoutMs Upper bound on lock waits
   * @throws BackingStoreError if the database cannot be opened or initialized
   */
  explicit SqliteKeyValueStore(const std::string &dbPath,
                               int busyTimeoutMs = 5000);
  ~SqliteKeyValueStore() override;

  SqliteKeyValueStore(const SqliteKeyValueStore &) = delete;
  SqliteKeyValueStore &operator=(const SqliteKeyValueStore &) = delete;

  std::optional<Json::Value> get(const std::string &key) override;
  void put(const std::string &key, const Json::Value &value) override;
  bool putIfAbsent(const std::string &key, const Json::Value &value) override;
  bool remove(const std::string &key) override;
  std::vector<KeyValueEntry> scan(const std::string &prefix) override;
  std::string backendName() const override { return "sqlite"; }

private:
  sqlite3 *db_ = nullptr;
  std::string db_path_;
  std::mutex mutex_;

  void createTables();

  /**
   * @brief Prepare a statement, throwing BackingStoreError on failure
   */
  sqlite3_stmt *prepare(const char *sql);

  /**
   * @brief Step a write statement to completion and finalize it
   * @return Number of rows changed
   */
  int execute(sqlite3_stmt *stmt);

  [[noreturn]] void fail(const std::string &what) const;

  static std::string serialize(const Json::Value &value);
  Json::Value deserialize(const std::string &key, const char *text) const;
};
