#pragma once

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

/**
 * @brief Environment variable helpers
 *
 * Every getter falls back to its default (with a warning on stderr) when the
 * variable is unset, malformed or out of range. Directory resolution follows
 * a three tier strategy:
 *   1. /opt/face_attendance/{subdir}
 *   2. ~/.local/share/face_attendance/{subdir}
 *   3. ./{subdir}
 */
namespace EnvConfig {

inline const char *kProductionRoot = "/opt/face_attendance";
inline const char *kUserDataSuffix = "/.local/share/face_attendance";

inline std::string getString(const char *name,
                             const std::string &default_value = "") {
  const char *value = std::getenv(name);
  return value ? std::string(value) : default_value;
}

inline int getInt(const char *name, int default_value,
                  int min_value = INT32_MIN, int max_value = INT32_MAX) {
  const char *value = std::getenv(name);
  if (!value) {
    return default_value;
  }

  try {
    int int_value = std::stoi(value);
    if (int_value < min_value || int_value > max_value) {
      std::cerr << "Warning: " << name << "=" << value << " is out of range ["
                << min_value << ", " << max_value
                << "]. Using default: " << default_value << std::endl;
      return default_value;
    }
    return int_value;
  } catch (const std::exception &e) {
    std::cerr << "Warning: Invalid " << name << "='" << value
              << "': " << e.what() << ". Using default: " << default_value
              << std::endl;
    return default_value;
  }
}

inline double getDouble(const char *name, double default_value,
                        double min_value = -1e10, double max_value = 1e10) {
  const char *value = std::getenv(name);
  if (!value) {
    return default_value;
  }

  try {
    double double_value = std::stod(value);
    if (double_value < min_value || double_value > max_value) {
      std::cerr << "Warning: " << name << "=" << value << " is out of range ["
                << min_value << ", " << max_value
                << "]. Using default: " << default_value << std::endl;
      return default_value;
    }
    return double_value;
  } catch (const std::exception &e) {
    std::cerr << "Warning: Invalid " << name << "='" << value
              << "': " << e.what() << ". Using default: " << default_value
              << std::endl;
    return default_value;
  }
}

inline bool getBool(const char *name, bool default_value) {
  const char *value = std::getenv(name);
  if (!value) {
    return default_value;
  }

  std::string str_value = value;
  std::transform(str_value.begin(), str_value.end(), str_value.begin(),
                 ::tolower);

  if (str_value == "1" || str_value == "true" || str_value == "yes" ||
      str_value == "on") {
    return true;
  }
  if (str_value == "0" || str_value == "false" || str_value == "no" ||
      str_value == "off") {
    return false;
  }

  std::cerr << "Warning: Invalid " << name << "='" << value
            << "'. Expected boolean (true/false, 1/0, yes/no, on/off). Using "
               "default: "
            << (default_value ? "true" : "false") << std::endl;
  return default_value;
}

/**
 * @brief Try to create a directory, returning false instead of throwing
 */
inline bool tryCreateDirectory(const std::string &path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return true;
  }
  std::filesystem::create_directories(path, ec);
  if (ec) {
    std::cerr << "[EnvConfig] ⚠ Cannot create " << path << ": "
              << ec.message() << std::endl;
    return false;
  }
  std::cerr << "[EnvConfig] ✓ Created directory: " << path << std::endl;
  return true;
}

/**
 * @brief All candidate directories for a subdir, in priority order
 */
inline std::vector<std::string>
getAllPossibleDirectories(const std::string &subdir) {
  std::vector<std::string> paths;
  paths.push_back(std::string(kProductionRoot) + "/" + subdir);

  const char *home = std::getenv("HOME");
  if (home) {
    paths.push_back(std::string(home) + kUserDataSuffix + "/" + subdir);
  }

  paths.push_back("./" + subdir);
  return paths;
}

/**
 * @brief Resolve a data directory
 *
 * The environment variable wins when set and creatable. Otherwise the first
 * tier from getAllPossibleDirectories() that can be created is used. The
 * last tier is returned even if it could not be created; storage classes
 * report the failure when they touch it.
 *
 * @param env_var_name Environment variable name (e.g., "USERS_DIR")
 * @param subdir Subdirectory name (e.g., "users")
 */
inline std::string resolveDataDir(const char *env_var_name,
                                  const std::string &subdir) {
  const char *env_value = std::getenv(env_var_name);
  if (env_value && std::strlen(env_value) > 0) {
    if (tryCreateDirectory(env_value)) {
      std::cerr << "[EnvConfig] ✓ Using directory from " << env_var_name
                << ": " << env_value << std::endl;
      return env_value;
    }
    std::cerr << "[EnvConfig] ⚠ " << env_var_name
              << " is not usable, trying fallback..." << std::endl;
  }

  auto candidates = getAllPossibleDirectories(subdir);
  for (const auto &candidate : candidates) {
    if (tryCreateDirectory(candidate)) {
      return candidate;
    }
  }
  return candidates.back();
}

/**
 * @brief Resolve config.json location
 *
 * Priority:
 *   1. CONFIG_FILE environment variable
 *   2. ./config.json if it exists
 *   3. /opt/face_attendance/config/config.json if it exists or can be created
 *   4. ~/.config/face_attendance/config.json
 *   5. ./config.json
 */
inline std::string resolveConfigPath() {
  const char *env_config_file = std::getenv("CONFIG_FILE");
  if (env_config_file && std::strlen(env_config_file) > 0) {
    std::filesystem::path filePath(env_config_file);
    if (!filePath.has_parent_path() ||
        tryCreateDirectory(filePath.parent_path().string())) {
      std::cerr << "[EnvConfig] Using config file from CONFIG_FILE: "
                << env_config_file << std::endl;
      return env_config_file;
    }
  }

  std::string current_dir_path = "./config.json";
  if (std::filesystem::exists(current_dir_path)) {
    return current_dir_path;
  }

  std::string production_path =
      std::string(kProductionRoot) + "/config/config.json";
  if (std::filesystem::exists(production_path) ||
      tryCreateDirectory(std::string(kProductionRoot) + "/config")) {
    return production_path;
  }

  const char *home = std::getenv("HOME");
  if (home) {
    std::string user_dir = std::string(home) + "/.config/face_attendance";
    if (tryCreateDirectory(user_dir)) {
      return user_dir + "/config.json";
    }
  }

  std::cerr << "[EnvConfig] ✓ Using last resort: ./config.json" << std::endl;
  return current_dir_path;
}

} // namespace EnvConfig
