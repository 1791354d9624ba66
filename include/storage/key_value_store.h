#pragma once

#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Single entry returned by IKeyValueStore::scan()
 */
struct KeyValueEntry {
  std::string key;
  Json::Value value;
};

/**
 * @brief Narrow storage capability used by the embedding registry and the
 * attendance ledger
 *
 * Keys are '/' separated paths (e.g. "attendance/alice/seq-000000000001").
 * Values are JSON documents. Every failure of the underlying medium is
 * reported as BackingStoreError; implementations never retry.
 *
 * putIfAbsent() must be atomic with respect to every other writer of the
 * same store: of N concurrent calls for one key exactly one returns true.
 */
class IKeyValueStore {
public:
  virtual ~IKeyValueStore() = default;

  /**
   * @brief Read a value
   * @return Value, or nullopt if the key does not exist
   */
  virtual std::optional<Json::Value> get(const std::string &key) = 0;

  /**
   * @brief Insert or overwrite a value
   */
  virtual void put(const std::string &key, const Json::Value &value) = 0;

  /**
   * @brief Insert a value only if the key does not exist yet
   * @return true if inserted, false if the key was already present
   */
  virtual bool putIfAbsent(const std::string &key,
                           const Json::Value &value) = 0;

  /**
   * @brief Delete a key
   * @return true if the key existed
   */
  virtual bool remove(const std::string &key) = 0;

  /**
   * @brief All entries whose key starts with prefix, ordered by key
   */
  virtual std::vector<KeyValueEntry> scan(const std::string &prefix) = 0;

  /**
   * @brief Backend name for logs and health output
   */
  virtual std::string backendName() const = 0;
};

/**
 * @brief Escape a free-form identity so it can be used as one key segment
 *
 * '%' and '/' are percent-encoded; everything else is kept verbatim so keys
 * stay readable and keep their sort order for ordinary identities.
 */
std::string encodeKeySegment(const std::string &segment);

/**
 * @brief Inverse of encodeKeySegment()
 */
std::string decodeKeySegment(const std::string &segment);
