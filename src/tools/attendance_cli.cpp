/**
 * @file attendance_cli.cpp
 * @brief Face Attendance command line tool
 *
 * Offline maintenance on the same store and face image library the server
 * uses (config.json is resolved the same way).
 *
 * Usage:
 *   face_attendance_cli build-embeddings
 *   face_attendance_cli enroll <user_id> <image>
 *   face_attendance_cli recognize <image> [--log] [--source <name>]
 *   face_attendance_cli export-csv <file|-> [--user-id <id>] [--start <date>] [--end <date>]
 *   face_attendance_cli last <user_id>
 */

#include "attendance/attendance_runtime.h"
#include "config/system_config.h"
#include "core/env_config.h"
#include "core/errors.h"
#include "core/logger.h"
#include "core/logging_flags.h"
#include "storage/face_image_library.h"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

std::atomic<bool> g_log_api{false};

namespace {

struct CliArgs {
  std::string command;
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;
  bool log = false;
  bool valid = false;
  std::string error;

  static CliArgs parse(int argc, char *argv[]) {
    CliArgs args;
    if (argc < 2) {
      args.error = "Missing command";
      return args;
    }
    args.command = argv[1];

    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--log") {
        args.log = true;
      } else if (arg.rfind("--", 0) == 0) {
        if (i + 1 >= argc) {
          args.error = "Option " + arg + " requires a value";
          return args;
        }
        args.options[arg.substr(2)] = argv[++i];
      } else {
        args.positional.push_back(arg);
      }
    }
    args.valid = true;
    return args;
  }

  std::string option(const std::string &name) const {
    auto it = options.find(name);
    return it == options.end() ? "" : it->second;
  }
};

void printUsage() {
  std::cerr << "Usage:" << std::endl;
  std::cerr << "  face_attendance_cli build-embeddings" << std::endl;
  std::cerr << "  face_attendance_cli enroll <user_id> <image>" << std::endl;
  std::cerr << "  face_attendance_cli recognize <image> [--log] [--source <name>]"
            << std::endl;
  std::cerr << "  face_attendance_cli export-csv <file|-> [--user-id <id>] "
               "[--start <date>] [--end <date>]"
            << std::endl;
  std::cerr << "  face_attendance_cli last <user_id>" << std::endl;
}

std::string extensionOf(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  return ext.empty() ? ext : ext.substr(1);
}

int buildEmbeddings(AttendanceService &service) {
  size_t count = service.rebuildDatabase();
  std::cout << "Embeddings rebuilt for " << count << " users" << std::endl;
  return 0;
}

int enroll(AttendanceService &service, const CliArgs &args) {
  if (args.positional.size() != 2) {
    printUsage();
    return 2;
  }
  const std::string &imagePath = args.positional[1];
  std::string stored = service.enrollImage(
      args.positional[0], FaceImageLibrary::readImage(imagePath),
      extensionOf(imagePath));
  std::cout << "Face registered for user '" << args.positional[0]
            << "' (" << stored << ")" << std::endl;
  return 0;
}

int recognize(AttendanceService &service, const CliArgs &args) {
  if (args.positional.size() != 1) {
    printUsage();
    return 2;
  }

  auto results =
      service.recognizeImage(FaceImageLibrary::readImage(args.positional[0]));

  Json::Value response(Json::objectValue);
  Json::Value list(Json::arrayValue);
  for (const auto &result : results) {
    list.append(result.toJson());
  }
  response["results"] = list;

  if (args.log) {
    std::string source = args.option("source");
    Json::Value attendance(Json::arrayValue);
    for (const auto &result : results) {
      if (result.isKnown()) {
        attendance.append(
            service.logAttendance(result.identity, source.empty() ? "cli" : source)
                .toJson());
      }
    }
    response["attendance"] = attendance;
  }

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  std::cout << Json::writeString(builder, response) << std::endl;
  return 0;
}

int exportCsv(AttendanceService &service, const CliArgs &args) {
  if (args.positional.size() != 1) {
    printUsage();
    return 2;
  }

  AttendanceFilter filter = AttendanceFilter::fromStrings(
      args.option("user-id"), args.option("start"), args.option("end"));

  const std::string &target = args.positional[0];
  size_t rows = 0;
  if (target == "-") {
    rows = service.exportCsv(filter, std::cout);
  } else {
    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw BackingStoreError("Cannot open " + target + " for writing");
    }
    rows = service.exportCsv(filter, file);
    if (!file) {
      throw BackingStoreError("Failed writing " + target);
    }
  }
  std::cerr << "Exported " << rows << " records" << std::endl;
  return 0;
}

int lastEvent(AttendanceService &service, const CliArgs &args) {
  if (args.positional.size() != 1) {
    printUsage();
    return 2;
  }
  auto record = service.lastEvent(args.positional[0]);
  if (!record) {
    std::cerr << "No attendance recorded for user '" << args.positional[0]
              << "'" << std::endl;
    return 1;
  }
  std::cout << Json::writeString(Json::StreamWriterBuilder(), record->toJson())
            << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CliArgs args = CliArgs::parse(argc, argv);
  if (!args.valid || args.command == "--help" || args.command == "-h") {
    if (!args.valid) {
      std::cerr << "[CLI] Error: " << args.error << std::endl;
    }
    printUsage();
    return args.valid ? 0 : 2;
  }

  try {
    auto &systemConfig = SystemConfig::getInstance();
    systemConfig.loadConfig(EnvConfig::resolveConfigPath());

    auto loggingConfig = systemConfig.getLoggingConfig();
    Logger::init(loggingConfig.logDir,
                 Logger::parseSeverity(loggingConfig.logLevel, plog::warning),
                 loggingConfig.maxLogFiles, false);

    AttendanceRuntime runtime(systemConfig.getRecognitionConfig(),
                              systemConfig.getAttendanceConfig(),
                              systemConfig.getStorageConfig());
    AttendanceService &service = runtime.service();

    if (args.command == "build-embeddings") {
      return buildEmbeddings(service);
    }
    if (args.command == "enroll") {
      return enroll(service, args);
    }
    if (args.command == "recognize") {
      return recognize(service, args);
    }
    if (args.command == "export-csv") {
      return exportCsv(service, args);
    }
    if (args.command == "last") {
      return lastEvent(service, args);
    }

    std::cerr << "[CLI] Unknown command: " << args.command << std::endl;
    printUsage();
    return 2;
  } catch (const AttendanceError &e) {
    PLOG_ERROR << "[CLI] " << args.command << ": " << e.what();
    std::cerr << "[CLI] Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    PLOG_FATAL << "[CLI] " << args.command << ": " << e.what();
    std::cerr << "[CLI] Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
