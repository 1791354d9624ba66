#pragma once

#include "storage/key_value_store.h"
#include <memory>
#include <string>

/**
 * @brief Storage backends selectable through storage.backend
 */
enum class StorageBackend {
  MEMORY,    // "memory": process local, nothing persisted
  JSON_FILE, // "json": single JSON document on disk
  SQLITE     // "sqlite": SQLite row store
};

/**
 * @brief Factory for key/value stores
 *
 * Registry and ledger share one store instance; key prefixes keep their
 * data apart ("registry/", "attendance/").
 */
class StoreFactory {
public:
  /**
   * @brief Create a store
   * @param backend Backend kind
   * @param path File path (ignored for MEMORY)
   * @throws BackingStoreError if the backend cannot be opened
   */
  static std::unique_ptr<IKeyValueStore> create(StorageBackend backend,
                                                const std::string &path);

  /**
   * @brief Parse a backend name ("memory", "json", "sqlite")
   * @throws InputError for unknown names
   */
  static StorageBackend parseBackend(const std::string &name);

  static std::string getBackendName(StorageBackend backend);
};
