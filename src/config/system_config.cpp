#include "config/system_config.h"
#include "core/env_config.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

SystemConfig& SystemConfig::getInstance() {
    static SystemConfig instance;
    return instance;
}

bool SystemConfig::loadConfig(const std::string& configPath) {
    config_path_ = configPath;

    try {
        if (!std::filesystem::exists(configPath)) {
            std::cerr << "[SystemConfig] Config file not found: " << configPath << std::endl;
            std::cerr << "[SystemConfig] Initializing with default configuration" << std::endl;

            {
                std::lock_guard<std::mutex> lock(mutex_);
                initializeDefaults();
                loaded_ = true;
            }

            // Save default config to file (outside lock to avoid deadlock)
            saveConfig(configPath);
            return true;
        }

        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream file(configPath);
        if (!file.is_open()) {
            std::cerr << "[SystemConfig] Error: Failed to open config file: " << configPath << std::endl;
            initializeDefaults();
            loaded_ = false;
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errors;
        Json::Value parsed;
        if (!Json::parseFromStream(builder, file, &parsed, &errors)) {
            std::cerr << "[SystemConfig] Failed to parse config file: " << errors << std::endl;
            initializeDefaults();
            loaded_ = false;
            return false;
        }

        if (!validateConfig(parsed)) {
            std::cerr << "[SystemConfig] Invalid config structure, using defaults" << std::endl;
            initializeDefaults();
            loaded_ = false;
            return false;
        }

        config_json_ = parsed;
        loaded_ = true;
        std::cerr << "[SystemConfig] Successfully loaded config from: " << configPath << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[SystemConfig] Exception loading config: " << e.what() << std::endl;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            initializeDefaults();
            loaded_ = false;
        }
        return false;
    }
}

bool SystemConfig::saveConfig(const std::string& configPath) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string path = configPath.empty() ? config_path_ : configPath;
    if (path.empty()) {
        std::cerr << "[SystemConfig] Error: No config path specified" << std::endl;
        return false;
    }

    try {
        std::filesystem::path filePath(path);
        if (filePath.has_parent_path()) {
            std::filesystem::create_directories(filePath.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            std::cerr << "[SystemConfig] Error: Failed to open file for writing: " << path << std::endl;
            return false;
        }

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(config_json_, &file);
        file.close();

        if (configPath.empty()) {
            config_path_ = path;
        }

        std::cerr << "[SystemConfig] Successfully saved config to: " << path << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[SystemConfig] Exception saving config: " << e.what() << std::endl;
        return false;
    }
}

void SystemConfig::initializeDefaults() {
    config_json_ = Json::Value(Json::objectValue);

    // system
    Json::Value system(Json::objectValue);

    Json::Value webServer(Json::objectValue);
    webServer["enabled"] = true;
    webServer["ip_address"] = "0.0.0.0";
    webServer["port"] = 3546;
    webServer["name"] = "face_attendance";
    webServer["max_body_size_mb"] = 10;
    Json::Value cors(Json::objectValue);
    cors["enabled"] = true;
    webServer["cors"] = cors;
    system["web_server"] = webServer;

    Json::Value logging(Json::objectValue);
    logging["log_dir"] = "./logs";
    logging["log_level"] = "info";
    logging["max_log_files"] = 5;
    system["logging"] = logging;

    config_json_["system"] = system;

    // recognition: metric and threshold are one unit. 1.128 is the L2
    // cutoff for normalised SFace embeddings (cosine 0.363).
    Json::Value recognition(Json::objectValue);
    recognition["metric"] = "euclidean";
    recognition["threshold"] = 1.128;
    recognition["detector_model"] = "./models/face_detection_yunet_2023mar.onnx";
    recognition["recognizer_model"] = "./models/face_recognition_sface_2021dec.onnx";
    recognition["detection_score_threshold"] = 0.7;
    config_json_["recognition"] = recognition;

    // attendance
    Json::Value attendance(Json::objectValue);
    attendance["policy"] = "cooldown";
    attendance["cooldown_seconds"] = 300;
    attendance["bucket_utc_offset_minutes"] = 0;
    config_json_["attendance"] = attendance;

    // storage
    Json::Value storage(Json::objectValue);
    storage["backend"] = "sqlite";
    storage["path"] = "";
    storage["users_dir"] = "";
    config_json_["storage"] = storage;
}

bool SystemConfig::validateConfig(const Json::Value& json) const {
    if (!json.isObject()) {
        return false;
    }

    // Partial configs are allowed; present sections must be objects
    for (const char* name : {"system", "recognition", "attendance", "storage"}) {
        if (json.isMember(name) && !json[name].isObject()) {
            std::cerr << "[SystemConfig] Section '" << name << "' must be an object" << std::endl;
            return false;
        }
    }

    if (json.isMember("recognition") && json["recognition"].isMember("threshold")) {
        const Json::Value& threshold = json["recognition"]["threshold"];
        if (!threshold.isNumeric() || threshold.asDouble() < 0.0) {
            std::cerr << "[SystemConfig] recognition.threshold must be a non-negative number" << std::endl;
            return false;
        }
    }

    return true;
}

const Json::Value& SystemConfig::section(const std::string& path) const {
    static const Json::Value kNull(Json::nullValue);
    auto [parent, key] = parsePath(path);
    if (!parent || !parent->isMember(key)) {
        return kNull;
    }
    return (*parent)[key];
}

SystemConfig::WebServerConfig SystemConfig::getWebServerConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    WebServerConfig config;

    const auto& ws = section("system.web_server");
    if (ws.isObject()) {
        if (ws.isMember("enabled") && ws["enabled"].isBool()) {
            config.enabled = ws["enabled"].asBool();
        }
        if (ws.isMember("ip_address") && ws["ip_address"].isString()) {
            config.ipAddress = ws["ip_address"].asString();
        }
        if (ws.isMember("port") && ws["port"].isInt()) {
            config.port = static_cast<uint16_t>(ws["port"].asInt());
        }
        if (ws.isMember("name") && ws["name"].isString()) {
            config.name = ws["name"].asString();
        }
        if (ws.isMember("max_body_size_mb") && ws["max_body_size_mb"].isInt()) {
            config.maxBodySizeMb = static_cast<size_t>(ws["max_body_size_mb"].asInt());
        }
        if (ws.isMember("cors") && ws["cors"].isMember("enabled") &&
            ws["cors"]["enabled"].isBool()) {
            config.corsEnabled = ws["cors"]["enabled"].asBool();
        }
    }

    config.ipAddress = EnvConfig::getString("API_HOST", config.ipAddress);
    config.port = static_cast<uint16_t>(EnvConfig::getInt("API_PORT", config.port, 1, 65535));
    config.corsEnabled = EnvConfig::getBool("CORS_ENABLED", config.corsEnabled);
    return config;
}

SystemConfig::LoggingConfig SystemConfig::getLoggingConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LoggingConfig config;

    const auto& log = section("system.logging");
    if (log.isObject()) {
        if (log.isMember("log_dir") && log["log_dir"].isString()) {
            config.logDir = log["log_dir"].asString();
        }
        if (log.isMember("log_level") && log["log_level"].isString()) {
            config.logLevel = log["log_level"].asString();
        }
        if (log.isMember("max_log_files") && log["max_log_files"].isInt()) {
            config.maxLogFiles = log["max_log_files"].asInt();
        }
    }

    return config;
}

SystemConfig::RecognitionConfig SystemConfig::getRecognitionConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RecognitionConfig config;

    const auto& rec = section("recognition");
    if (rec.isObject()) {
        if (rec.isMember("metric") && rec["metric"].isString()) {
            config.metric = rec["metric"].asString();
        }
        if (rec.isMember("threshold") && rec["threshold"].isNumeric()) {
            config.threshold = rec["threshold"].asDouble();
        }
        if (rec.isMember("detector_model") && rec["detector_model"].isString()) {
            config.detectorModel = rec["detector_model"].asString();
        }
        if (rec.isMember("recognizer_model") && rec["recognizer_model"].isString()) {
            config.recognizerModel = rec["recognizer_model"].asString();
        }
        if (rec.isMember("detection_score_threshold") &&
            rec["detection_score_threshold"].isNumeric()) {
            config.detectionScoreThreshold = rec["detection_score_threshold"].asDouble();
        }
    }

    config.threshold = EnvConfig::getDouble("FACE_MATCH_THRESHOLD", config.threshold, 0.0, 1e6);
    config.detectorModel = EnvConfig::getString("FACE_DETECTOR_MODEL", config.detectorModel);
    config.recognizerModel = EnvConfig::getString("FACE_RECOGNIZER_MODEL", config.recognizerModel);
    return config;
}

SystemConfig::AttendanceConfig SystemConfig::getAttendanceConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    AttendanceConfig config;

    const auto& att = section("attendance");
    if (att.isObject()) {
        if (att.isMember("policy") && att["policy"].isString()) {
            config.policy = att["policy"].asString();
        }
        if (att.isMember("cooldown_seconds") && att["cooldown_seconds"].isInt()) {
            config.cooldownSeconds = att["cooldown_seconds"].asInt();
        }
        if (att.isMember("bucket_utc_offset_minutes") &&
            att["bucket_utc_offset_minutes"].isInt()) {
            config.bucketUtcOffsetMinutes = att["bucket_utc_offset_minutes"].asInt();
        }
    }

    config.policy = EnvConfig::getString("ATTENDANCE_POLICY", config.policy);
    config.cooldownSeconds =
        EnvConfig::getInt("ATTENDANCE_COOLDOWN_SECONDS", config.cooldownSeconds, 0);
    return config;
}

SystemConfig::StorageConfig SystemConfig::getStorageConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StorageConfig config;

    const auto& storage = section("storage");
    if (storage.isObject()) {
        if (storage.isMember("backend") && storage["backend"].isString()) {
            config.backend = storage["backend"].asString();
        }
        if (storage.isMember("path") && storage["path"].isString()) {
            config.path = storage["path"].asString();
        }
        if (storage.isMember("users_dir") && storage["users_dir"].isString()) {
            config.usersDir = storage["users_dir"].asString();
        }
    }

    config.backend = EnvConfig::getString("STORAGE_BACKEND", config.backend);
    config.path = EnvConfig::getString("STORAGE_PATH", config.path);
    config.usersDir = EnvConfig::getString("USERS_DIR", config.usersDir);
    return config;
}

Json::Value SystemConfig::getConfigJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_json_;
}

Json::Value SystemConfig::getConfigSection(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return section(path);
}

bool SystemConfig::updateConfigSection(const std::string& path, const Json::Value& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto [parent, key] = parsePath(path);
    if (!parent) {
        return false;
    }

    (*parent)[key] = value;
    return true;
}

std::string SystemConfig::getConfigPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_path_;
}

void SystemConfig::resetToDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    initializeDefaults();
    loaded_ = true;
}

bool SystemConfig::isLoaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
}

std::pair<Json::Value*, std::string> SystemConfig::parsePath(const std::string& path) const {
    if (path.empty()) {
        return {nullptr, ""};
    }

    // Split path by dots or forward slashes (support both formats)
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;

    bool useSlash = (path.find('/') != std::string::npos);
    char delimiter = useSlash ? '/' : '.';

    while (std::getline(ss, item, delimiter)) {
        if (!item.empty()) {
            parts.push_back(item);
        }
    }

    if (parts.empty()) {
        return {nullptr, ""};
    }

    // Navigate to parent
    Json::Value* current = const_cast<Json::Value*>(&config_json_);
    for (size_t i = 0; i < parts.size() - 1; ++i) {
        if (!current->isMember(parts[i]) || !(*current)[parts[i]].isObject()) {
            return {nullptr, ""};
        }
        current = &((*current)[parts[i]]);
    }

    return {current, parts.back()};
}
