#pragma once

#include "models/face_match.h"
#include <map>
#include <string>
#include <vector>

/**
 * @brief Face Image Library
 *
 * Enrollment photos on disk, one directory per identity:
 *   <root>/<identity>/<timestamp>.<jpg|jpeg|png>
 *
 * It is the asset store behind enrollment and the source of bulk registry
 * rebuilds. Files with other extensions are ignored.
 */
class FaceImageLibrary {
public:
  explicit FaceImageLibrary(const std::string &root_dir);

  const std::string &rootDir() const { return root_dir_; }

  /**
   * @brief All samples ordered by identity, then file name
   *
   * A missing root directory yields an empty list.
   */
  std::vector<FaceImageSample> listSamples() const;

  /**
   * @brief Number of images per identity directory
   */
  std::map<std::string, size_t> photoCounts() const;

  /**
   * @brief Store an enrollment image
   * @param extension "jpg", "jpeg" or "png" (leading dot optional)
   * @return Path of the written file
   * @throws InvalidIdentityError if identity cannot be used as a directory
   * name
   * @throws InvalidImageError for an unsupported extension or empty data
   * @throws BackingStoreError if the file cannot be written
   */
  std::string storeImage(const std::string &identity,
                         const std::vector<unsigned char> &data,
                         const std::string &extension);

  /**
   * @brief Delete an image written by storeImage()
   *
   * The identity directory is removed too once it is empty.
   *
   * @return true if the file existed
   */
  bool removeImage(const std::string &path);

  /**
   * @brief Read a whole image file
   * @throws BackingStoreError if the file cannot be read
   */
  static std::vector<unsigned char> readImage(const std::string &path);

  /**
   * @brief Lower-case extension without the dot if it is supported, else ""
   */
  static std::string normalizeExtension(const std::string &extension);

private:
  std::string root_dir_;

  static void validateIdentity(const std::string &identity);
};
