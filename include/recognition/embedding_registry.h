#pragma once

#include "models/face_match.h"
#include "storage/key_value_store.h"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Immutable copy of the registry used to build a matcher
 *
 * Rows are in identity order (lexicographic), which fixes the tie-breaking
 * order of the matcher.
 */
struct EmbeddingSnapshot {
  std::vector<std::string> identities;
  std::vector<std::vector<float>> vectors;
  size_t dimension = 0;
  uint64_t version = 0;

  size_t size() const { return identities.size(); }
  bool empty() const { return identities.empty(); }
};

/**
 * @brief Embedding Registry
 *
 * Owns the identity -> embedding mapping and persists it through an
 * IKeyValueStore:
 *   registry/meta                    {dimension, version, count, updatedAt}
 *   registry/embeddings/<identity>   {identity, embedding[], updatedAt}
 *
 * The presence of registry/meta marks an initialized registry, which may be
 * empty. Every mutating call writes through before returning and mutations
 * are serialized by the registry mutex.
 */
class EmbeddingRegistry {
public:
  using Embeddings = std::map<std::string, std::vector<float>>;

  /**
   * @brief Turns one source image into an embedding (nullopt = no usable face)
   */
  using SampleEncoder =
      std::function<std::optional<std::vector<float>>(const FaceImageSample &)>;

  explicit EmbeddingRegistry(IKeyValueStore &store);

  /**
   * @brief Current mapping
   * @throws RegistryNotFoundError if the registry was never built or saved
   * @throws BackingStoreError on storage failure or corrupt entries
   */
  Embeddings load() const;

  /**
   * @brief load() packaged as a snapshot with the current version
   */
  EmbeddingSnapshot snapshot() const;

  /**
   * @brief Re-derive the whole registry from source images
   *
   * Samples are visited in the given order; the first sample of an identity
   * that encodes successfully wins and later samples of that identity are
   * skipped. Samples whose encoder throws an InputError or a
   * FaceDetectionError, or returns nullopt, are logged and skipped. Other
   * encoder failures (models that cannot load) propagate. Identities missing
   * from the result are removed.
   *
   * @return Number of identities in the rebuilt registry
   * @throws EmptyResultError if no identity could be derived. The previous
   * content is left untouched in that case.
   */
  size_t rebuildAll(const std::vector<FaceImageSample> &samples,
                    const SampleEncoder &encode);

  /**
   * @brief Replace the whole registry with embeddings
   * @throws DimensionMismatchError if the vectors do not share one dimension
   */
  void save(const Embeddings &embeddings);

  /**
   * @brief Insert or replace the embedding of one identity
   * @throws InvalidIdentityError if identity is empty
   * @throws DimensionMismatchError if the vector is empty or its length
   * differs from the registry dimension
   */
  void upsert(const std::string &identity, const std::vector<float> &embedding);

  /**
   * @brief Remove one identity
   * @return true if it was enrolled
   */
  bool remove(const std::string &identity);

  bool isInitialized() const;

  /**
   * @brief Version counter, bumped by every mutation (0 = never built)
   */
  uint64_t version() const;

  /**
   * @brief Number of enrolled identities (0 if never built)
   */
  size_t size() const;

  /**
   * @brief Shared dimension, 0 while the registry is empty
   */
  size_t dimension() const;

  static std::string embeddingKey(const std::string &identity);

private:
  IKeyValueStore &store_;
  mutable std::mutex mutex_;

  struct Meta {
    size_t dimension = 0;
    uint64_t version = 0;
    size_t count = 0;
  };

  std::optional<Meta> readMeta() const;

  /**
   * @brief load() body. Caller holds mutex_.
   */
  Embeddings loadLocked(Meta *metaOut) const;
  void writeMeta(const Meta &meta);

  /**
   * @brief Replace content with embeddings. Caller holds mutex_.
   */
  void replaceAll(const Embeddings &embeddings);

  static Json::Value toEntryJson(const std::string &identity,
                                 const std::vector<float> &embedding);
  static std::vector<float> fromEntryJson(const std::string &key,
                                          const Json::Value &json);
};
