#pragma once

#include <string>
#include <mutex>
#include <filesystem>
#include <json/json.h>

/**
 * @brief System Configuration Manager
 *
 * Manages configuration loaded from config.json
 * Thread-safe singleton pattern
 *
 * Layout:
 *   system.web_server   listener address, port, CORS
 *   system.logging      log directory, level, rolled files
 *   recognition         metric, threshold, model paths
 *   attendance          dedup policy and its parameters
 *   storage             key/value backend and face image directory
 *
 * Section getters apply environment overrides (FACE_MATCH_THRESHOLD,
 * ATTENDANCE_POLICY, ATTENDANCE_COOLDOWN_SECONDS, STORAGE_BACKEND,
 * STORAGE_PATH, USERS_DIR, ...) on top of the file values.
 */
class SystemConfig {
public:
    /**
     * @brief Get singleton instance
     */
    static SystemConfig& getInstance();

    /**
     * @brief Load configuration from file
     * Writes the default configuration when the file does not exist.
     * @param configPath Path to config.json file
     * @return true if loaded successfully
     */
    bool loadConfig(const std::string& configPath);

    /**
     * @brief Save configuration to file
     * @param configPath Path to config.json file (optional, uses current path if empty)
     * @return true if saved successfully
     */
    bool saveConfig(const std::string& configPath = "");

    struct WebServerConfig {
        bool enabled = true;
        std::string ipAddress = "0.0.0.0";
        uint16_t port = 3546;
        std::string name = "face_attendance";
        bool corsEnabled = true;
        size_t maxBodySizeMb = 10;
    };
    WebServerConfig getWebServerConfig() const;

    struct LoggingConfig {
        std::string logDir = "./logs";
        std::string logLevel = "info";
        int maxLogFiles = 5;
    };
    LoggingConfig getLoggingConfig() const;

    struct RecognitionConfig {
        std::string metric = "euclidean";
        double threshold = 1.128; // L2, normalised SFace embeddings
        std::string detectorModel = "./models/face_detection_yunet_2023mar.onnx";
        std::string recognizerModel = "./models/face_recognition_sface_2021dec.onnx";
        double detectionScoreThreshold = 0.7;
    };
    RecognitionConfig getRecognitionConfig() const;

    struct AttendanceConfig {
        std::string policy = "cooldown";
        int cooldownSeconds = 300;
        int bucketUtcOffsetMinutes = 0;
    };
    AttendanceConfig getAttendanceConfig() const;

    struct StorageConfig {
        std::string backend = "sqlite";
        std::string path;     // empty = <data dir>/face_attendance.{db,json}
        std::string usersDir; // empty = resolved "users" data directory
    };
    StorageConfig getStorageConfig() const;

    /**
     * @brief Get full configuration as JSON
     */
    Json::Value getConfigJson() const;

    /**
     * @brief Get configuration section as JSON
     * @param path JSON path (e.g., "system.web_server", "attendance")
     * @return JSON value if found, null otherwise
     */
    Json::Value getConfigSection(const std::string& path) const;

    /**
     * @brief Update configuration section
     * @param path JSON path (e.g., "recognition.threshold")
     * @param value New value for the section
     * @return true if updated successfully
     */
    bool updateConfigSection(const std::string& path, const Json::Value& value);

    /**
     * @brief Get config file path
     */
    std::string getConfigPath() const;

    /**
     * @brief Reset configuration to default values (in memory)
     */
    void resetToDefaults();

    /**
     * @brief Check if configuration is loaded
     */
    bool isLoaded() const;

private:
    SystemConfig() = default;
    ~SystemConfig() = default;
    SystemConfig(const SystemConfig&) = delete;
    SystemConfig& operator=(const SystemConfig&) = delete;

    std::string config_path_;
    mutable std::mutex mutex_;
    Json::Value config_json_;
    bool loaded_ = false;

    /**
     * @brief Initialize default configuration
     */
    void initializeDefaults();

    /**
     * @brief Validate configuration structure
     */
    bool validateConfig(const Json::Value& json) const;

    /**
     * @brief Section by dotted path, null value if absent. Caller holds mutex_.
     */
    const Json::Value& section(const std::string& path) const;

    /**
     * @brief Parse JSON path and get parent and key
     */
    std::pair<Json::Value*, std::string> parsePath(const std::string& path) const;
};
