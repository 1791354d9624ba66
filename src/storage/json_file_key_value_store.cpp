#include "storage/json_file_key_value_store.h"
#include "core/errors.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

namespace {
const char *kFormatName = "face_attendance.kv";
const int kFormatVersion = 1;
} // namespace

JsonFileKeyValueStore::JsonFileKeyValueStore(const std::string &filePath)
    : file_path_(filePath) {
  loadFromDisk();
}

void JsonFileKeyValueStore::loadFromDisk() {
  std::error_code ec;
  if (!fs::exists(file_path_, ec)) {
    std::cerr << "[JsonFileKeyValueStore] No store file at " << file_path_
              << ", starting empty" << std::endl;
    return;
  }

  std::ifstream file(file_path_);
  if (!file.is_open()) {
    throw BackingStoreError("Failed to open store file: " + file_path_);
  }

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  if (!Json::parseFromStream(builder, file, &root, &errors)) {
    throw BackingStoreError("Failed to parse store file " + file_path_ +
                            ": " + errors);
  }

  if (!root.isObject() || !root["entries"].isObject()) {
    throw BackingStoreError("Store file has no 'entries' object: " +
                            file_path_);
  }

  const Json::Value &entries = root["entries"];
  for (const auto &key : entries.getMemberNames()) {
    entries_[key] = entries[key];
  }

  std::cerr << "[JsonFileKeyValueStore] Loaded " << entries_.size()
            << " entries from " << file_path_ << std::endl;
}

void JsonFileKeyValueStore::persist() const {
  Json::Value root(Json::objectValue);
  root["format"] = kFormatName;
  root["version"] = kFormatVersion;
  Json::Value entries(Json::objectValue);
  for (const auto &[key, value] : entries_) {
    entries[key] = value;
  }
  root["entries"] = entries;

  fs::path target(file_path_);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw BackingStoreError("Failed to create directory " +
                              target.parent_path().string() + ": " +
                              ec.message());
    }
  }

  std::string tmp_path = file_path_ + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file.is_open()) {
      throw BackingStoreError("Failed to open file for writing: " + tmp_path);
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(root, &file);
    file.flush();
    if (!file) {
      throw BackingStoreError("Failed to write store file: " + tmp_path);
    }
  }

  fs::rename(tmp_path, target, ec);
  if (ec) {
    fs::remove(tmp_path, ec);
    throw BackingStoreError("Failed to replace store file " + file_path_);
  }
}

std::optional<Json::Value>
JsonFileKeyValueStore::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void JsonFileKeyValueStore::put(const std::string &key,
                                const Json::Value &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto previous = entries_.find(key);
  std::optional<Json::Value> old;
  if (previous != entries_.end()) {
    old = previous->second;
  }

  entries_[key] = value;
  try {
    persist();
  } catch (...) {
    if (old) {
      entries_[key] = *old;
    } else {
      entries_.erase(key);
    }
    throw;
  }
}

bool JsonFileKeyValueStore::putIfAbsent(const std::string &key,
                                        const Json::Value &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!entries_.emplace(key, value).second) {
    return false;
  }

  try {
    persist();
  } catch (...) {
    entries_.erase(key);
    throw;
  }
  return true;
}

bool JsonFileKeyValueStore::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return false;
  }

  Json::Value old = it->second;
  entries_.erase(it);
  try {
    persist();
  } catch (...) {
    entries_[key] = old;
    throw;
  }
  return true;
}

std::vector<KeyValueEntry>
JsonFileKeyValueStore::scan(const std::string &prefix) {
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
