#pragma once

#include "models/face_match.h"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Feature extractor interface
 *
 * Locates faces in an encoded image (JPEG, PNG, ...) and turns each face
 * into a fixed length embedding. Matching, enrollment and the attendance
 * ledger only see the boxes and vectors produced here.
 */
class IFaceEncoder {
public:
  /**
   * @brief A detected face and its embedding (nullopt if encoding failed)
   */
  struct EncodedFace {
    BoundingBox box;
    std::optional<std::vector<float>> embedding;
  };

  virtual ~IFaceEncoder() = default;

  /**
   * @brief Detect faces
   * @param image Encoded image bytes
   * @return Boxes in detection order (empty if no face was found)
   * @throws InvalidImageError if the bytes cannot be decoded
   */
  virtual std::vector<BoundingBox>
  detectFaces(const std::vector<unsigned char> &image) = 0;

  /**
   * @brief Produce the embedding of the face inside box
   * @return Embedding, or nullopt if the extractor could not encode the face
   * @throws InvalidImageError if the bytes cannot be decoded
   */
  virtual std::optional<std::vector<float>>
  encodeFace(const std::vector<unsigned char> &image,
             const BoundingBox &box) = 0;

  /**
   * @brief Detect and encode every face of an image
   *
   * The default runs detectFaces() followed by encodeFace() per box;
   * implementations may override it to decode the image only once.
   */
  virtual std::vector<EncodedFace>
  encodeAll(const std::vector<unsigned char> &image) {
    std::vector<EncodedFace> faces;
    for (const auto &box : detectFaces(image)) {
      faces.push_back({box, encodeFace(image, box)});
    }
    return faces;
  }

  /**
   * @brief Embedding of the first detected face, nullopt if there is none
   * or it cannot be encoded
   */
  std::optional<std::vector<float>>
  encodeFirstFace(const std::vector<unsigned char> &image) {
    auto boxes = detectFaces(image);
    if (boxes.empty()) {
      return std::nullopt;
    }
    return encodeFace(image, boxes.front());
  }

  /**
   * @brief Extractor name for logs and health output
   */
  virtual std::string name() const = 0;
};
