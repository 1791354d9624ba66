#pragma once

#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Identity returned when no enrolled face is close enough
 */
inline const char *const kUnknownIdentity = "Unknown";

/**
 * @brief Distance reported when there is nothing to compare against
 */
constexpr double kEmptyRegistryDistance = 1.0;

/**
 * @brief Face rectangle in image pixels, (top, right, bottom, left) order
 */
struct BoundingBox {
  int top = 0;
  int right = 0;
  int bottom = 0;
  int left = 0;

  int width() const { return right - left; }
  int height() const { return bottom - top; }

  bool operator==(const BoundingBox &other) const {
    return top == other.top && right == other.right &&
           bottom == other.bottom && left == other.left;
  }

  /**
   * @brief [top, right, bottom, left]
   */
  Json::Value toJson() const;
};

/**
 * @brief Outcome of matching one query vector
 */
struct MatchResult {
  std::string identity;            // Matched identity or kUnknownIdentity
  double distance = 0.0;           // Euclidean distance to nearest candidate
  std::optional<BoundingBox> box;  // Source face, when the query came from one

  bool isKnown() const { return identity != kUnknownIdentity; }

  Json::Value toJson() const;
};

/**
 * @brief One enrollment image found in the face image library
 */
struct FaceImageSample {
  std::string identity;
  std::string path;
};

/**
 * @brief Enrolled identity as reported by listIdentities()
 */
struct IdentitySummary {
  std::string identity;
  int photoCount = 0;     // Images stored for the identity
  bool hasEmbedding = false;

  Json::Value toJson() const;
};
