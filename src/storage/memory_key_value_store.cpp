#include "storage/memory_key_value_store.h"

std::optional<Json::Value> MemoryKeyValueStore::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryKeyValueStore::put(const std::string &key,
                              const Json::Value &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[key] = value;
}

bool MemoryKeyValueStore::putIfAbsent(const std::string &key,
                                      const Json::Value &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.emplace(key, value).second;
}

bool MemoryKeyValueStore::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(key) > 0;
}

std::vector<KeyValueEntry>
MemoryKeyValueStore::scan(const std::string &prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<KeyValueEntry> result;
  for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    result.push_back({it->first, it->second});
  }
  return result;
}

size_t MemoryKeyValueStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}
