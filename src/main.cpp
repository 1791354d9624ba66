#include "api/attendance_handler.h"
#include "api/health_handler.h"
#include "api/recognition_handler.h"
#include "attendance/attendance_runtime.h"
#include "config/system_config.h"
#include "core/cors_helper.h"
#include "core/env_config.h"
#include "core/logger.h"
#include "core/logging_flags.h"
#include <atomic>
#include <csignal>
#include <drogon/drogon.h>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

/**
 * @brief Face Attendance Server
 *
 * REST API server using Drogon framework
 * Provides face recognition, enrollment and attendance logging endpoints
 */

// Global flag for graceful shutdown
static std::atomic<bool> g_shutdown{false};

// Global logging flags (exported via logging_flags.h)
std::atomic<bool> g_log_api{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    bool expected = false;
    if (!g_shutdown.compare_exchange_strong(expected, true)) {
      std::cerr << "[SHUTDOWN] Second signal received, exiting immediately"
                << std::endl;
      std::_Exit(1);
    }

    PLOG_INFO << "Received signal " << signal
              << ", shutting down gracefully...";
    std::cerr << "[SHUTDOWN] Press Ctrl+C again to force immediate exit"
              << std::endl;
    drogon::app().quit();
  }
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument vector
 * @return true if parsing successful, false if help requested
 */
bool parseArguments(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--log-api" || arg == "--debug-api") {
      g_log_api = true;
      std::cerr << "[Main] API logging enabled" << std::endl;
    } else if (arg == "--help" || arg == "-h") {
      std::cerr << "Usage: " << argv[0] << " [OPTIONS]" << std::endl;
      std::cerr << "Options:" << std::endl;
      std::cerr << "  --log-api, --debug-api    Enable API "
                   "request/response logging"
                << std::endl;
      std::cerr << "  --help, -h                Show this help message"
                << std::endl;
      std::cerr << "Environment:" << std::endl;
      std::cerr << "  CONFIG_FILE, API_HOST, API_PORT, CORS_ENABLED, FACE_MATCH_THRESHOLD, "
                   "ATTENDANCE_POLICY,"
                << std::endl;
      std::cerr << "  ATTENDANCE_COOLDOWN_SECONDS, STORAGE_BACKEND, "
                   "STORAGE_PATH, USERS_DIR, DATA_DIR, LOG_LEVEL"
                << std::endl;
      return false;
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      std::cerr << "Use --help for usage information" << std::endl;
      return false;
    }
  }
  return true;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    if (!parseArguments(argc, argv)) {
      return 0; // Help was requested, exit normally
    }

    // Load system configuration first (needed for logging config)
    std::string configPath = EnvConfig::resolveConfigPath();
    auto &systemConfig = SystemConfig::getInstance();
    bool configLoaded = systemConfig.loadConfig(configPath);

    auto loggingConfig = systemConfig.getLoggingConfig();
    Logger::init(loggingConfig.logDir,
                 Logger::parseSeverity(loggingConfig.logLevel, plog::info),
                 loggingConfig.maxLogFiles);

    PLOG_INFO << "========================================";
    PLOG_INFO << "Face Attendance Server";
    PLOG_INFO << "========================================";
    if (!configLoaded) {
      PLOG_WARNING << "[Config] Could not load " << configPath
                   << ", running with defaults";
    } else {
      PLOG_INFO << "[Config] Loaded " << configPath;
    }
    if (g_log_api.load()) {
      PLOG_INFO << "API logging: ENABLED";
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    AttendanceRuntime runtime(systemConfig.getRecognitionConfig(),
                              systemConfig.getAttendanceConfig(),
                              systemConfig.getStorageConfig());

    // Load existing embeddings eagerly so the first request does not pay for it
    if (!runtime.service().refreshMatcher()) {
      PLOG_WARNING << "[Main] No embeddings yet. Enroll faces or POST "
                      "/v1/attendance/embeddings/rebuild";
    }

    RecognitionHandler::setAttendanceService(&runtime.service());
    AttendanceHandler::setAttendanceService(&runtime.service());
    HealthHandler::setAttendanceService(&runtime.service());

    auto webServerConfig = systemConfig.getWebServerConfig();
    CorsHelper::setEnabled(webServerConfig.corsEnabled);
    if (!webServerConfig.enabled) {
      PLOG_WARNING << "[Main] Web server disabled in configuration, exiting";
      return 0;
    }

    std::string host = webServerConfig.ipAddress;
    uint16_t port = webServerConfig.port;

    PLOG_INFO << "Server will listen on: " << host << ":" << port;
    PLOG_INFO << "Available endpoints:";
    PLOG_INFO << "  GET  /v1/attendance/health - Health check";
    PLOG_INFO << "  POST /v1/attendance/recognize - Recognize faces";
    PLOG_INFO << "  POST /v1/attendance/faces - Enroll a face";
    PLOG_INFO << "  GET  /v1/attendance/faces - List enrolled users";
    PLOG_INFO << "  POST /v1/attendance/embeddings/rebuild - Rebuild embeddings";
    PLOG_INFO << "  POST /v1/attendance/logs - Log attendance";
    PLOG_INFO << "  GET  /v1/attendance/logs - Query attendance";
    PLOG_INFO << "  GET  /v1/attendance/logs/export - Export attendance CSV";
    PLOG_INFO << "  GET  /v1/attendance/logs/{userId}/last - Last attendance";

    size_t max_body_size = webServerConfig.maxBodySizeMb * 1024 * 1024;
    unsigned int thread_num = static_cast<unsigned int>(
        EnvConfig::getInt("THREAD_NUM", 0, 0, 256));
    unsigned int actual_thread_num =
        (thread_num == 0) ? std::thread::hardware_concurrency() : thread_num;
    if (actual_thread_num == 0) {
      actual_thread_num = 4;
    }

    PLOG_INFO << "[Performance] Thread pool size: " << actual_thread_num;
    PLOG_INFO << "[Performance] Max body size: "
              << (max_body_size / 1024 / 1024) << "MB";

    auto &app = drogon::app();
    app.setClientMaxBodySize(max_body_size)
        .setClientMaxMemoryBodySize(max_body_size)
        .setLogLevel(trantor::Logger::kWarn)
        .setThreadNum(actual_thread_num);

    app.addListener(host, port, false, "", "");

    PLOG_INFO << "[Server] Starting HTTP server on " << host << ":" << port;

    app.run();

    PLOG_INFO << "Server stopped.";
    return 0;
  } catch (const std::exception &e) {
    PLOG_FATAL << "Fatal error: " << e.what();
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  } catch (...) {
    PLOG_FATAL << "Fatal error: Unknown exception";
    return 1;
  }
}
