#include "storage/face_image_library.h"
#include "core/env_config.h"
#include "core/errors.h"
#include "core/time_utils.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

namespace fs = std::filesystem;

FaceImageLibrary::FaceImageLibrary(const std::string &root_dir)
    : root_dir_(root_dir) {
  EnvConfig::tryCreateDirectory(root_dir_);
}

std::string FaceImageLibrary::normalizeExtension(const std::string &extension) {
  std::string ext = extension;
  if (!ext.empty() && ext[0] == '.') {
    ext.erase(0, 1);
  }
  std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
  if (ext == "jpg" || ext == "jpeg" || ext == "png") {
    return ext;
  }
  return "";
}

void FaceImageLibrary::validateIdentity(const std::string &identity) {
  if (identity.empty() || identity == "." || identity == ".." ||
      identity.find_first_of("/\\") != std::string::npos) {
    throw InvalidIdentityError("Identity '" + identity +
                               "' cannot be used as a directory name");
  }
}

std::vector<FaceImageSample> FaceImageLibrary::listSamples() const {
  std::vector<FaceImageSample> samples;
  std::error_code ec;
  if (!fs::is_directory(root_dir_, ec)) {
    return samples;
  }

  for (const auto &userDir : fs::directory_iterator(root_dir_, ec)) {
    if (!userDir.is_directory()) {
      continue;
    }
    std::string identity = userDir.path().filename().string();
    for (const auto &file : fs::directory_iterator(userDir.path(), ec)) {
      if (!file.is_regular_file() ||
          normalizeExtension(file.path().extension().string()).empty()) {
        continue;
      }
      samples.push_back({identity, file.path().string()});
    }
  }
  if (ec) {
    std::cerr << "[FaceImageLibrary] ⚠ Error while listing " << root_dir_
              << ": " << ec.message() << std::endl;
  }

  std::sort(samples.begin(), samples.end(),
            [](const FaceImageSample &a, const FaceImageSample &b) {
              if (a.identity != b.identity) {
                return a.identity < b.identity;
              }
              return a.path < b.path;
            });
  return samples;
}

std::map<std::string, size_t> FaceImageLibrary::photoCounts() const {
  std::map<std::string, size_t> counts;
  for (const auto &sample : listSamples()) {
    counts[sample.identity]++;
  }
  return counts;
}

std::string FaceImageLibrary::storeImage(const std::string &identity,
                                         const std::vector<unsigned char> &data,
                                         const std::string &extension) {
  validateIdentity(identity);
  std::string ext = normalizeExtension(extension);
  if (ext.empty()) {
    throw InvalidImageError("Unsupported image type '" + extension +
                            "'. Allowed: jpg, jpeg, png");
  }
  if (data.empty()) {
    throw InvalidImageError("Image data is empty");
  }

  fs::path userDir = fs::path(root_dir_) / identity;
  std::error_code ec;
  fs::create_directories(userDir, ec);
  if (ec) {
    throw BackingStoreError("Cannot create " + userDir.string() + ": " +
                            ec.message());
  }

  // 2026-10-19T08:15:00.123Z -> 20261019T081500123Z
  std::string stamp = TimeUtils::getCurrentTimestamp();
  stamp.erase(std::remove_if(stamp.begin(), stamp.end(),
                             [](char c) { return c == '-' || c == ':' || c == '.'; }),
              stamp.end());
  fs::path target = userDir / (stamp + "." + ext);
  for (int n = 1; fs::exists(target, ec); ++n) {
    target = userDir / (stamp + "_" + std::to_string(n) + "." + ext);
  }

  std::ofstream file(target, std::ios::binary);
  if (!file.is_open()) {
    throw BackingStoreError("Failed to open file for writing: " +
                            target.string());
  }
  file.write(reinterpret_cast<const char *>(data.data()),
             static_cast<std::streamsize>(data.size()));
  file.close();
  if (!file) {
    fs::remove(target, ec);
    throw BackingStoreError("Failed to write image: " + target.string());
  }

  std::cerr << "[FaceImageLibrary] Saved image for " << identity << ": "
            << target.string() << std::endl;
  return target.string();
}

bool FaceImageLibrary::removeImage(const std::string &path) {
  std::error_code ec;
  bool removed = fs::remove(path, ec);
  if (ec) {
    std::cerr << "[FaceImageLibrary] ⚠ Failed to remove " << path << ": "
              << ec.message() << std::endl;
    return false;
  }

  fs::path userDir = fs::path(path).parent_path();
  if (userDir.parent_path().lexically_normal() ==
          fs::path(root_dir_).lexically_normal() &&
      fs::is_empty(userDir, ec) && !ec) {
    fs::remove(userDir, ec);
  }
  return removed;
}

std::vector<unsigned char> FaceImageLibrary::readImage(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw BackingStoreError("Failed to open image: " + path);
  }
  std::vector<unsigned char> data((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw BackingStoreError("Failed to read image: " + path);
  }
  return data;
}
