#pragma once

#include "storage/key_value_store.h"
#include <map>
#include <mutex>

/**
 * @brief Flat file store: one JSON document holding every entry
 *
 * File layout:
 * {
 *   "format": "face_attendance.kv",
 *   "version": 1,
 *   "entries": { "<key>": <value>, ... }
 * }
 *
 * The document is loaded once at construction and rewritten on every
 * mutation through a temporary file followed by rename(), so a crash never
 * leaves a half written file behind. Conditional inserts are decided under
 * the store mutex; the file is owned by a single process.
 */
class JsonFileKeyValueStore : public IKeyValueStore {
public:
  /**
   * @brief Open (or create on first write) the store file
   * @param filePath Path of the JSON document
   * @throws BackingStoreError if an existing file cannot be read or parsed
   */
  explicit JsonFileKeyValueStore(const std::string &filePath);

  std::optional<Json::Value> get(const std::string &key) override;
  void put(const std::string &key, const Json::Value &value) override;
  bool putIfAbsent(const std::string &key, const Json::Value &value) override;
  bool remove(const std::string &key) override;
  std::vector<KeyValueEntry> scan(const std::string &prefix) override;
  std::string backendName() const override { return "json"; }

  const std::string &filePath() const { return file_path_; }

private:
  std::string file_path_;
  std::mutex mutex_;
  std::map<std::string, Json::Value> entries_;

  void loadFromDisk();

  /**
   * @brief Write entries_ to disk. Caller holds mutex_.
   * @throws BackingStoreError on any I/O failure
   */
  void persist() const;
};
