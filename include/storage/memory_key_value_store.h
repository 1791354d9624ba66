#pragma once

#include "storage/key_value_store.h"
#include <map>
#include <mutex>

/**
 * @brief In-process store backed by an ordered map
 *
 * Used by tests and by ephemeral deployments (storage.backend = "memory").
 * Nothing survives the process.
 */
class MemoryKeyValueStore : public IKeyValueStore {
public:
  std::optional<Json::Value> get(const std::string &key) override;
  void put(const std::string &key, const Json::Value &value) override;
  bool putIfAbsent(const std::string &key, const Json::Value &value) override;
  bool remove(const std::string &key) override;
  std::vector<KeyValueEntry> scan(const std::string &prefix) override;
  std::string backendName() const override { return "memory"; }

  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, Json::Value> entries_;
};
