#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Error taxonomy shared by the registry, matcher, ledger and service
 *
 * Handlers translate each family into an HTTP status:
 *   InputError          -> 400
 *   NotFoundError       -> 404
 *   EmptyResultError    -> 422
 *   EncodingFailedError -> 422
 *   BackingStoreError   -> 503
 *
 * "Unknown" is a recognition outcome, never an error.
 */
class AttendanceError : public std::runtime_error {
public:
  explicit AttendanceError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Caller supplied something unusable. Raised before any mutation.
 */
class InputError : public AttendanceError {
public:
  explicit InputError(const std::string &message) : AttendanceError(message) {}
};

class InvalidIdentityError : public InputError {
public:
  explicit InvalidIdentityError(const std::string &message)
      : InputError(message) {}
};

/**
 * @brief A vector whose length differs from the registry dimension
 */
class DimensionMismatchError : public InputError {
public:
  DimensionMismatchError(size_t expected, size_t actual)
      : InputError("Embedding dimension mismatch: expected " +
                   std::to_string(expected) + ", got " +
                   std::to_string(actual)),
        expected_(expected), actual_(actual) {}

  size_t expected() const { return expected_; }
  size_t actual() const { return actual_; }

private:
  size_t expected_;
  size_t actual_;
};

class InvalidImageError : public InputError {
public:
  explicit InvalidImageError(const std::string &message)
      : InputError(message) {}
};

class NotFoundError : public AttendanceError {
public:
  explicit NotFoundError(const std::string &message)
      : AttendanceError(message) {}
};

/**
 * @brief The embedding registry has never been built or saved
 */
class RegistryNotFoundError : public NotFoundError {
public:
  RegistryNotFoundError()
      : NotFoundError("Embedding registry has not been built yet") {}
};

/**
 * @brief Recognition requested while no registry snapshot can be produced
 */
class EmbeddingsUnavailableError : public NotFoundError {
public:
  EmbeddingsUnavailableError()
      : NotFoundError("Embeddings not available. Enroll a user or rebuild the "
                      "embedding database first") {}
};

/**
 * @brief A bulk rebuild derived zero identities
 */
class EmptyResultError : public AttendanceError {
public:
  explicit EmptyResultError(const std::string &message)
      : AttendanceError(message) {}
};

/**
 * @brief The feature extractor could not produce a vector
 */
class EncodingFailedError : public AttendanceError {
public:
  explicit EncodingFailedError(const std::string &message)
      : AttendanceError(message) {}
};

/**
 * @brief Extraction failed for one image; the models are still usable
 */
class FaceDetectionError : public EncodingFailedError {
public:
  explicit FaceDetectionError(const std::string &message)
      : EncodingFailedError(message) {}
};

/**
 * @brief Failure of the storage medium (I/O, corrupt document, SQLite error)
 */
class BackingStoreError : public AttendanceError {
public:
  explicit BackingStoreError(const std::string &message)
      : AttendanceError(message) {}
};
