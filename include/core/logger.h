#pragma once

#include "core/env_config.h"
#include <algorithm>
#include <filesystem>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <string>

/**
 * @brief Plog initialization for the attendance server and CLI
 *
 * Logs go to {log_dir}/face_attendance.log with size based rolling
 * (face_attendance.log, face_attendance.log.1, ...) and optionally to the
 * console.
 *
 * Usage:
 *   Logger::init();
 *   PLOG_INFO << "[Component] message";
 */
namespace Logger {

/**
 * @brief Map a level name (NONE, FATAL, ERROR, WARN, INFO, DEBUG, VERBOSE)
 * to a plog severity, keeping fallback for unknown names
 */
inline plog::Severity parseSeverity(const std::string &name,
                                    plog::Severity fallback) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

  if (upper == "NONE") return plog::none;
  if (upper == "FATAL") return plog::fatal;
  if (upper == "ERROR") return plog::error;
  if (upper == "WARNING" || upper == "WARN") return plog::warning;
  if (upper == "INFO") return plog::info;
  if (upper == "DEBUG") return plog::debug;
  if (upper == "VERBOSE" || upper == "TRACE") return plog::verbose;
  return fallback;
}

/**
 * @brief Initialize plog
 *
 * LOG_DIR, LOG_LEVEL and LOG_MAX_FILES override the arguments.
 *
 * @param log_dir Directory for log files (default: ./logs)
 * @param log_level Minimum severity
 * @param max_files Rolled files to keep
 * @param enable_console Also log to stdout
 */
inline void init(const std::string &log_dir = "",
                 plog::Severity log_level = plog::info, int max_files = 5,
                 bool enable_console = true) {
  std::string log_directory =
      EnvConfig::getString("LOG_DIR", log_dir.empty() ? "./logs" : log_dir);
  max_files = EnvConfig::getInt("LOG_MAX_FILES", max_files, 1, 365);
  log_level = parseSeverity(EnvConfig::getString("LOG_LEVEL", ""), log_level);

  if (!EnvConfig::tryCreateDirectory(log_directory)) {
    std::cerr << "Warning: Logs will be written to current directory."
              << std::endl;
    log_directory = ".";
  }

  std::string log_file_path =
      (std::filesystem::path(log_directory) / "face_attendance.log").string();
  const size_t max_file_size = 10 * 1024 * 1024;

  static plog::RollingFileAppender<plog::TxtFormatter> rollingFileAppender(
      log_file_path.c_str(), max_file_size, max_files);

  if (enable_console) {
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender;
    plog::init(log_level, &consoleAppender).addAppender(&rollingFileAppender);
  } else {
    plog::init(log_level, &rollingFileAppender);
  }

  PLOG_INFO << "========================================";
  PLOG_INFO << "Logger initialized";
  PLOG_INFO << "Log file: " << log_file_path;
  PLOG_INFO << "Log level: " << plog::severityToString(log_level);
  PLOG_INFO << "Max files to keep: " << max_files;
  PLOG_INFO << "========================================";
}

} // namespace Logger
