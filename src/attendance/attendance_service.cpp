#include "attendance/attendance_service.h"
#include "core/errors.h"
#include <algorithm>
#include <map>
#include <plog/Log.h>

namespace {
std::string trim(const std::string &value) {
  const char *whitespace = " \t\r\n\f\v";
  size_t begin = value.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = value.find_last_not_of(whitespace);
  return value.substr(begin, end - begin + 1);
}
} // namespace

Json::Value AttendanceService::Status::toJson() const {
  Json::Value json(Json::objectValue);
  json["embeddings_loaded"] = embeddingsLoaded;
  json["known_users"] = static_cast<Json::UInt64>(knownIdentities);
  json["registry_version"] = static_cast<Json::UInt64>(registryVersion);
  json["threshold"] = threshold;
  json["metric"] = metric;
  json["attendance_policy"] = policy;
  json["encoder"] = encoder;
  return json;
}

AttendanceService::AttendanceService(EmbeddingRegistry &registry,
                                     AttendanceLedger &ledger,
                                     FaceImageLibrary &library,
                                     std::shared_ptr<IFaceEncoder> encoder,
                                     const MatchConfig &matchConfig)
    : registry_(registry), ledger_(ledger), library_(library),
      encoder_(std::move(encoder)),
      match_config_(MatchConfig::fromConfig(
          MatchConfig::getMetricName(matchConfig.metric),
          matchConfig.threshold)) {}

std::string AttendanceService::normalizeIdentity(const std::string &identity) {
  std::string trimmed = trim(identity);
  if (trimmed.empty()) {
    throw InvalidIdentityError("user_id must not be empty");
  }
  if (trimmed == kUnknownIdentity) {
    throw InvalidIdentityError("'" + trimmed +
                               "' is reserved and cannot be used as user_id");
  }
  return trimmed;
}

IFaceEncoder &AttendanceService::requireEncoder() const {
  if (!encoder_) {
    throw EncodingFailedError("No face encoder is configured");
  }
  return *encoder_;
}

std::shared_ptr<const FaceMatcher> AttendanceService::currentMatcher() {
  std::lock_guard<std::mutex> lock(matcher_mutex_);
  if (!matcher_) {
    try {
      matcher_ =
          std::make_shared<const FaceMatcher>(registry_.snapshot(), match_config_);
    } catch (const RegistryNotFoundError &) {
      throw EmbeddingsUnavailableError();
    }
    PLOG_INFO << "[AttendanceService] Loaded matcher with " << matcher_->size()
              << " identities (version " << matcher_->version() << ")";
  }
  return matcher_;
}

bool AttendanceService::refreshMatcher() {
  std::shared_ptr<const FaceMatcher> fresh;
  try {
    fresh =
        std::make_shared<const FaceMatcher>(registry_.snapshot(), match_config_);
  } catch (const RegistryNotFoundError &) {
    return false;
  }

  std::lock_guard<std::mutex> lock(matcher_mutex_);
  // Overlapping refreshes may finish out of order; never go back a version.
  if (matcher_ && fresh->version() < matcher_->version()) {
    return true;
  }
  matcher_ = fresh;
  PLOG_DEBUG << "[AttendanceService] Matcher refreshed to version "
             << fresh->version();
  return true;
}

MatchResult AttendanceService::recognize(const std::vector<float> &embedding) {
  return currentMatcher()->match(embedding);
}

std::vector<MatchResult> AttendanceService::recognizeBatch(
    const std::vector<std::vector<float>> &embeddings,
    const std::vector<BoundingBox> &boxes) {
  return currentMatcher()->matchBatch(embeddings, boxes);
}

std::vector<MatchResult> AttendanceService::recognizeBatch(
    const std::vector<std::vector<float>> &embeddings) {
  auto matcher = currentMatcher();
  std::vector<MatchResult> results;
  results.reserve(embeddings.size());
  for (const auto &embedding : embeddings) {
    results.push_back(matcher->match(embedding));
  }
  return results;
}

std::vector<MatchResult>
AttendanceService::recognizeImage(const std::vector<unsigned char> &image) {
  auto matcher = currentMatcher();
  auto faces = requireEncoder().encodeAll(image);

  std::vector<std::vector<float>> embeddings;
  std::vector<BoundingBox> boxes;
  for (auto &face : faces) {
    if (!face.embedding) {
      throw EncodingFailedError("Could not encode the face at [" +
                                std::to_string(face.box.top) + ", " +
                                std::to_string(face.box.right) + ", " +
                                std::to_string(face.box.bottom) + ", " +
                                std::to_string(face.box.left) + "]");
    }
    embeddings.push_back(std::move(*face.embedding));
    boxes.push_back(face.box);
  }
  return matcher->matchBatch(embeddings, boxes);
}

void AttendanceService::enroll(const std::string &identity,
                               const std::vector<float> &embedding) {
  std::string id = normalizeIdentity(identity);
  registry_.upsert(id, embedding);
  refreshMatcher();
}

std::string
AttendanceService::enrollImage(const std::string &identity,
                               const std::vector<unsigned char> &image,
                               const std::string &extension) {
  std::string id = normalizeIdentity(identity);
  if (FaceImageLibrary::normalizeExtension(extension).empty()) {
    throw InvalidImageError("Unsupported image type '" + extension +
                            "'. Allowed: jpg, jpeg, png");
  }

  auto embedding = requireEncoder().encodeFirstFace(image);
  if (!embedding) {
    throw EncodingFailedError("No face could be encoded in the image");
  }

  std::string path = library_.storeImage(id, image, extension);
  try {
    registry_.upsert(id, *embedding);
  } catch (const std::exception &e) {
    PLOG_WARNING << "[AttendanceService] Enrollment of '" << id
                 << "' failed, removing " << path << ": " << e.what();
    library_.removeImage(path);
    throw;
  }

  refreshMatcher();
  return path;
}

LogAttemptResult AttendanceService::logAttendance(const std::string &identity,
                                                  const std::string &source) {
  std::string id = normalizeIdentity(identity);
  return ledger_.logAttempt(id, source.empty() ? "api" : source);
}

AttendanceRecordRange
AttendanceService::queryAttendance(const AttendanceFilter &filter) const {
  return ledger_.query(filter);
}

std::optional<AttendanceRecord>
AttendanceService::lastEvent(const std::string &identity) const {
  return ledger_.lastEvent(normalizeIdentity(identity));
}

size_t AttendanceService::exportCsv(const AttendanceFilter &filter,
                                    std::ostream &out) const {
  return ledger_.exportCsv(filter, out);
}

std::vector<IdentitySummary> AttendanceService::listIdentities() const {
  std::map<std::string, IdentitySummary> byIdentity;
  for (const auto &[identity, count] : library_.photoCounts()) {
    IdentitySummary &summary = byIdentity[identity];
    summary.identity = identity;
    summary.photoCount = static_cast<int>(count);
  }

  try {
    for (const auto &entry : registry_.load()) {
      IdentitySummary &summary = byIdentity[entry.first];
      summary.identity = entry.first;
      summary.hasEmbedding = true;
    }
  } catch (const RegistryNotFoundError &) {
    // Nothing enrolled yet; the library listing is all there is.
  }

  std::vector<IdentitySummary> identities;
  identities.reserve(byIdentity.size());
  for (auto &item : byIdentity) {
    identities.push_back(std::move(item.second));
  }
  return identities;
}

size_t AttendanceService::rebuildDatabase() {
  IFaceEncoder &encoder = requireEncoder();
  auto samples = library_.listSamples();

  size_t count = registry_.rebuildAll(
      samples,
      [&encoder](const FaceImageSample &sample)
          -> std::optional<std::vector<float>> {
        std::vector<unsigned char> image;
        try {
          image = FaceImageLibrary::readImage(sample.path);
        } catch (const BackingStoreError &e) {
          PLOG_WARNING << "[AttendanceService] " << e.what();
          return std::nullopt;
        }
        return encoder.encodeFirstFace(image);
      });

  refreshMatcher();
  return count;
}

AttendanceService::Status AttendanceService::status() const {
  Status status;
  status.threshold = match_config_.threshold;
  status.metric = MatchConfig::getMetricName(match_config_.metric);
  status.policy = ledger_.policy().name();
  status.encoder = encoder_ ? encoder_->name() : "none";

  {
    std::lock_guard<std::mutex> lock(matcher_mutex_);
    if (matcher_) {
      status.embeddingsLoaded = true;
      status.knownIdentities = matcher_->size();
      status.registryVersion = matcher_->version();
      return status;
    }
  }

  status.embeddingsLoaded = registry_.isInitialized();
  status.knownIdentities = registry_.size();
  status.registryVersion = registry_.version();
  return status;
}
