#pragma once

#include "attendance/attendance_ledger.h"
#include "models/face_match.h"
#include "recognition/embedding_registry.h"
#include "recognition/face_encoder.h"
#include "recognition/face_matcher.h"
#include "storage/face_image_library.h"
#include <json/json.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Attendance Service
 *
 * Orchestrates recognition, enrollment and attendance logging on top of the
 * embedding registry, the matcher and the attendance ledger.
 *
 * The current matcher is an immutable snapshot held in a shared_ptr. It is
 * built lazily on first use and replaced (never mutated) after every
 * enrollment or rebuild; requests already holding the previous snapshot
 * finish against it.
 */
class AttendanceService {
public:
  struct Status {
    bool embeddingsLoaded = false;
    size_t knownIdentities = 0;
    uint64_t registryVersion = 0;
    double threshold = 0.0;
    std::string metric;
    std::string policy;
    std::string encoder;

    Json::Value toJson() const;
  };

  /**
   * @param encoder May be null; image based operations then fail with
   * EncodingFailedError
   */
  AttendanceService(EmbeddingRegistry &registry, AttendanceLedger &ledger,
                    FaceImageLibrary &library,
                    std::shared_ptr<IFaceEncoder> encoder,
                    const MatchConfig &matchConfig);

  /**
   * @brief Match one embedding
   * @throws EmbeddingsUnavailableError if the registry was never built
   * @throws DimensionMismatchError if the vector length is wrong
   */
  MatchResult recognize(const std::vector<float> &embedding);

  /**
   * @brief Match several embeddings, index aligned with boxes
   */
  std::vector<MatchResult>
  recognizeBatch(const std::vector<std::vector<float>> &embeddings,
                 const std::vector<BoundingBox> &boxes);

  /**
   * @brief Match several embeddings without boxes against one snapshot
   */
  std::vector<MatchResult>
  recognizeBatch(const std::vector<std::vector<float>> &embeddings);

  /**
   * @brief Detect, encode and match every face of an image
   *
   * An image without faces yields an empty list.
   *
   * @throws InvalidImageError if the image cannot be decoded
   * @throws EncodingFailedError if a detected face cannot be encoded
   */
  std::vector<MatchResult>
  recognizeImage(const std::vector<unsigned char> &image);

  /**
   * @brief Enroll (or re-enroll) an identity from an embedding
   * @throws InvalidIdentityError for an empty or reserved identity
   */
  void enroll(const std::string &identity, const std::vector<float> &embedding);

  /**
   * @brief Enroll from an image
   *
   * The image is stored in the face image library first and removed again
   * if the registry update fails.
   *
   * @return Path of the stored image
   * @throws EncodingFailedError if no face can be encoded
   */
  std::string enrollImage(const std::string &identity,
                          const std::vector<unsigned char> &image,
                          const std::string &extension);

  /**
   * @brief Log an attendance attempt for a recognized identity
   * @throws InvalidIdentityError for an empty or reserved identity
   */
  LogAttemptResult logAttendance(const std::string &identity,
                                 const std::string &source);

  AttendanceRecordRange queryAttendance(const AttendanceFilter &filter) const;

  std::optional<AttendanceRecord> lastEvent(const std::string &identity) const;

  size_t exportCsv(const AttendanceFilter &filter, std::ostream &out) const;

  /**
   * @brief Identities known to the library or the registry
   */
  std::vector<IdentitySummary> listIdentities() const;

  /**
   * @brief Rebuild the registry from the face image library
   * @return Number of enrolled identities
   * @throws EmptyResultError if no image produced an embedding
   */
  size_t rebuildDatabase();

  /**
   * @brief Replace the matcher with a fresh registry snapshot
   * @return false if the registry was never built
   */
  bool refreshMatcher();

  Status status() const;

  /**
   * @brief Trimmed identity, validated for enrollment and logging
   * @throws InvalidIdentityError if empty or equal to kUnknownIdentity
   */
  static std::string normalizeIdentity(const std::string &identity);

private:
  EmbeddingRegistry &registry_;
  AttendanceLedger &ledger_;
  FaceImageLibrary &library_;
  std::shared_ptr<IFaceEncoder> encoder_;
  MatchConfig match_config_;

  mutable std::mutex matcher_mutex_;
  std::shared_ptr<const FaceMatcher> matcher_;

  /**
   * @brief Current matcher, built on first use
   * @throws EmbeddingsUnavailableError if the registry was never built
   */
  std::shared_ptr<const FaceMatcher> currentMatcher();

  IFaceEncoder &requireEncoder() const;
};
