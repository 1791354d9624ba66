#include "storage/store_factory.h"
#include "core/errors.h"
#include "storage/json_file_key_value_store.h"
#include "storage/memory_key_value_store.h"
#include "storage/sqlite_key_value_store.h"
#include <algorithm>
#include <plog/Log.h>

std::unique_ptr<IKeyValueStore> StoreFactory::create(StorageBackend backend,
                                                     const std::string &path) {
  PLOG_INFO << "[StoreFactory] Creating " << getBackendName(backend)
            << " store" << (path.empty() ? "" : " at " + path);

  switch (backend) {
  case StorageBackend::MEMORY:
    return std::make_unique<MemoryKeyValueStore>();
  case StorageBackend::JSON_FILE:
    return std::make_unique<JsonFileKeyValueStore>(path);
  case StorageBackend::SQLITE:
    return std::make_unique<SqliteKeyValueStore>(path);
  }
  throw InputError("Unsupported storage backend");
}

StorageBackend StoreFactory::parseBackend(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

  if (lower == "memory") {
    return StorageBackend::MEMORY;
  }
  if (lower == "json" || lower == "file") {
    return StorageBackend::JSON_FILE;
  }
  if (lower == "sqlite" || lower == "sqlite3") {
    return StorageBackend::SQLITE;
  }
  throw InputError("Unknown storage backend '" + name +
                   "'. Expected memory, json or sqlite");
}

std::string StoreFactory::getBackendName(StorageBackend backend) {
  switch (backend) {
  case StorageBackend::MEMORY:
    return "memory";
  case StorageBackend::JSON_FILE:
    return "json";
  case StorageBackend::SQLITE:
    return "sqlite";
  }
  return "unknown";
}
