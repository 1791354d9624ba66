#include "recognition/embedding_registry.h"
#include "core/errors.h"
#include "core/time_utils.h"
#include <plog/Log.h>

namespace {
const char *kMetaKey = "registry/meta";
const char *kEmbeddingPrefix = "registry/embeddings/";
} // namespace

EmbeddingRegistry::EmbeddingRegistry(IKeyValueStore &store) : store_(store) {}

std::string EmbeddingRegistry::embeddingKey(const std::string &identity) {
  return kEmbeddingPrefix + encodeKeySegment(identity);
}

std::optional<EmbeddingRegistry::Meta> EmbeddingRegistry::readMeta() const {
  auto json = store_.get(kMetaKey);
  if (!json) {
    return std::nullopt;
  }
  if (!json->isObject()) {
    throw BackingStoreError("Corrupt registry metadata");
  }

  Meta meta;
  meta.dimension = json->get("dimension", 0).asUInt64();
  meta.version = json->get("version", 0).asUInt64();
  meta.count = json->get("count", 0).asUInt64();
  return meta;
}

void EmbeddingRegistry::writeMeta(const Meta &meta) {
  Json::Value json(Json::objectValue);
  json["dimension"] = static_cast<Json::UInt64>(meta.dimension);
  json["version"] = static_cast<Json::UInt64>(meta.version);
  json["count"] = static_cast<Json::UInt64>(meta.count);
  json["updatedAt"] = TimeUtils::getCurrentTimestamp();
  store_.put(kMetaKey, json);
}

Json::Value EmbeddingRegistry::toEntryJson(const std::string &identity,
                                           const std::vector<float> &embedding) {
  Json::Value json(Json::objectValue);
  json["identity"] = identity;
  Json::Value values(Json::arrayValue);
  for (float v : embedding) {
    values.append(static_cast<double>(v));
  }
  json["embedding"] = values;
  json["updatedAt"] = TimeUtils::getCurrentTimestamp();
  return json;
}

std::vector<float> EmbeddingRegistry::fromEntryJson(const std::string &key,
                                                    const Json::Value &json) {
  if (!json.isObject() || !json["embedding"].isArray()) {
    throw BackingStoreError("Corrupt registry entry: " + key);
  }

  const Json::Value &values = json["embedding"];
  std::vector<float> embedding;
  embedding.reserve(values.size());
  for (const auto &v : values) {
    if (!v.isNumeric()) {
      throw BackingStoreError("Non numeric value in registry entry: " + key);
    }
    embedding.push_back(v.asFloat());
  }
  return embedding;
}

EmbeddingRegistry::Embeddings EmbeddingRegistry::load() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loadLocked(nullptr);
}

EmbeddingRegistry::Embeddings EmbeddingRegistry::loadLocked(Meta *metaOut) const {
  auto meta = readMeta();
  if (!meta) {
    throw RegistryNotFoundError();
  }

  Embeddings embeddings;
  for (const auto &entry : store_.scan(kEmbeddingPrefix)) {
    std::string identity =
        decodeKeySegment(entry.key.substr(std::string(kEmbeddingPrefix).size()));
    auto embedding = fromEntryJson(entry.key, entry.value);
    if (meta->dimension != 0 && embedding.size() != meta->dimension) {
      throw BackingStoreError("Registry entry " + entry.key + " has " +
                              std::to_string(embedding.size()) +
                              " values, registry dimension is " +
                              std::to_string(meta->dimension));
    }
    embeddings.emplace(identity, std::move(embedding));
  }

  if (metaOut) {
    *metaOut = *meta;
  }
  return embeddings;
}

EmbeddingSnapshot EmbeddingRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Meta meta;
  Embeddings embeddings = loadLocked(&meta);

  EmbeddingSnapshot snap;
  snap.version = meta.version;
  for (auto &[identity, embedding] : embeddings) {
    snap.dimension = embedding.size();
    snap.identities.push_back(identity);
    snap.vectors.push_back(std::move(embedding));
  }
  return snap;
}

size_t EmbeddingRegistry::rebuildAll(const std::vector<FaceImageSample> &samples,
                                     const SampleEncoder &encode) {
  PLOG_INFO << "[EmbeddingRegistry] Rebuilding from " << samples.size()
            << " sample(s)";

  Embeddings derived;
  size_t skipped = 0;
  for (const auto &sample : samples) {
    if (derived.count(sample.identity)) {
      continue;
    }

    std::optional<std::vector<float>> embedding;
    try {
      embedding = encode(sample);
    } catch (const InputError &e) {
      PLOG_WARNING << "[EmbeddingRegistry] Skipping " << sample.path << ": "
                   << e.what();
    } catch (const FaceDetectionError &e) {
      PLOG_WARNING << "[EmbeddingRegistry] Skipping " << sample.path << ": "
                   << e.what();
    }

    if (!embedding || embedding->empty()) {
      PLOG_WARNING << "[EmbeddingRegistry] No usable face in " << sample.path;
      ++skipped;
      continue;
    }

    if (!derived.empty() &&
        derived.begin()->second.size() != embedding->size()) {
      throw DimensionMismatchError(derived.begin()->second.size(),
                                   embedding->size());
    }
    derived.emplace(sample.identity, std::move(*embedding));
  }

  if (derived.empty()) {
    throw EmptyResultError("No faces could be encoded from " +
                           std::to_string(samples.size()) +
                           " source image(s)");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  replaceAll(derived);

  PLOG_INFO << "[EmbeddingRegistry] Rebuilt registry with " << derived.size()
            << " identities (" << skipped << " sample(s) skipped)";
  return derived.size();
}

void EmbeddingRegistry::save(const Embeddings &embeddings) {
  size_t dimension = embeddings.empty() ? 0 : embeddings.begin()->second.size();
  for (const auto &[identity, embedding] : embeddings) {
    if (identity.empty()) {
      throw InvalidIdentityError("Identity must not be empty");
    }
    if (embedding.empty() || embedding.size() != dimension) {
      throw DimensionMismatchError(dimension, embedding.size());
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  replaceAll(embeddings);
}

void EmbeddingRegistry::replaceAll(const Embeddings &embeddings) {
  auto meta = readMeta().value_or(Meta{});

  for (const auto &[identity, embedding] : embeddings) {
    store_.put(embeddingKey(identity), toEntryJson(identity, embedding));
  }

  size_t removed = 0;
  for (const auto &entry : store_.scan(kEmbeddingPrefix)) {
    std::string identity =
        decodeKeySegment(entry.key.substr(std::string(kEmbeddingPrefix).size()));
    if (!embeddings.count(identity)) {
      store_.remove(entry.key);
      ++removed;
    }
  }

  meta.dimension = embeddings.empty() ? 0 : embeddings.begin()->second.size();
  meta.count = embeddings.size();
  meta.version += 1;
  writeMeta(meta);

  if (removed > 0) {
    PLOG_DEBUG << "[EmbeddingRegistry] Removed " << removed
               << " stale identities";
  }
}

void EmbeddingRegistry::upsert(const std::string &identity,
                               const std::vector<float> &embedding) {
  if (identity.empty()) {
    throw InvalidIdentityError("Identity must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto meta = readMeta().value_or(Meta{});

  bool exists = store_.get(embeddingKey(identity)).has_value();
  size_t expected = meta.dimension;
  if (embedding.empty() || (expected != 0 && embedding.size() != expected)) {
    throw DimensionMismatchError(expected, embedding.size());
  }

  store_.put(embeddingKey(identity), toEntryJson(identity, embedding));

  meta.dimension = embedding.size();
  meta.count += exists ? 0 : 1;
  meta.version += 1;
  writeMeta(meta);

  PLOG_INFO << "[EmbeddingRegistry] " << (exists ? "Replaced" : "Enrolled")
            << " identity '" << identity << "' (version " << meta.version
            << ")";
}

bool EmbeddingRegistry::remove(const std::string &identity) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto meta = readMeta();
  if (!meta || !store_.remove(embeddingKey(identity))) {
    return false;
  }

  meta->count = meta->count > 0 ? meta->count - 1 : 0;
  if (meta->count == 0) {
    meta->dimension = 0;
  }
  meta->version += 1;
  writeMeta(*meta);
  return true;
}

bool EmbeddingRegistry::isInitialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return readMeta().has_value();
}

uint64_t EmbeddingRegistry::version() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto meta = readMeta();
  return meta ? meta->version : 0;
}

size_t EmbeddingRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto meta = readMeta();
  return meta ? meta->count : 0;
}

size_t EmbeddingRegistry::dimension() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto meta = readMeta();
  return meta ? meta->dimension : 0;
}
