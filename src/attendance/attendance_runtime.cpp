#include "attendance/attendance_runtime.h"
#include "attendance/session_policy.h"
#include "core/env_config.h"
#include "recognition/opencv_face_encoder.h"
#include "storage/store_factory.h"
#include <filesystem>
#include <plog/Log.h>

std::string AttendanceRuntime::resolveStorePath(
    const SystemConfig::StorageConfig &storage) {
  if (!storage.path.empty()) {
    return storage.path;
  }

  StorageBackend backend = StoreFactory::parseBackend(storage.backend);
  if (backend == StorageBackend::MEMORY) {
    return "";
  }

  std::string dataDir = EnvConfig::resolveDataDir("DATA_DIR", "data");
  std::string fileName = backend == StorageBackend::SQLITE
                             ? "face_attendance.db"
                             : "face_attendance.json";
  return (std::filesystem::path(dataDir) / fileName).string();
}

std::string AttendanceRuntime::resolveUsersDir(
    const SystemConfig::StorageConfig &storage) {
  if (!storage.usersDir.empty()) {
    return storage.usersDir;
  }
  return EnvConfig::resolveDataDir("USERS_DIR", "users");
}

AttendanceRuntime::AttendanceRuntime(
    const SystemConfig::RecognitionConfig &recognition,
    const SystemConfig::AttendanceConfig &attendance,
    const SystemConfig::StorageConfig &storage)
    : store_path_(resolveStorePath(storage)),
      users_dir_(resolveUsersDir(storage)) {
  MatchConfig matchConfig =
      MatchConfig::fromConfig(recognition.metric, recognition.threshold);
  auto policy = SessionPolicyFactory::create(attendance.policy,
                                             attendance.cooldownSeconds,
                                             attendance.bucketUtcOffsetMinutes);

  StorageBackend backend = StoreFactory::parseBackend(storage.backend);
  store_ = StoreFactory::create(backend, store_path_);
  PLOG_INFO << "[AttendanceRuntime] Store: " << store_->backendName()
            << (store_path_.empty() ? "" : " at " + store_path_);

  registry_ = std::make_unique<EmbeddingRegistry>(*store_);
  ledger_ = std::make_unique<AttendanceLedger>(*store_, std::move(policy));
  library_ = std::make_unique<FaceImageLibrary>(users_dir_);
  PLOG_INFO << "[AttendanceRuntime] Face images: " << users_dir_;

  OpenCVFaceEncoder::Config encoderConfig;
  encoderConfig.detectorModelPath = recognition.detectorModel;
  encoderConfig.recognizerModelPath = recognition.recognizerModel;
  encoderConfig.scoreThreshold =
      static_cast<float>(recognition.detectionScoreThreshold);
  auto encoder = std::make_shared<OpenCVFaceEncoder>(encoderConfig);

  service_ = std::make_unique<AttendanceService>(
      *registry_, *ledger_, *library_, encoder, matchConfig);

  PLOG_INFO << "[AttendanceRuntime] Matching: "
            << MatchConfig::getMetricName(matchConfig.metric)
            << " threshold " << matchConfig.threshold << ", policy "
            << ledger_->policy().name();
}
