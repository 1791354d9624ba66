#pragma once

#include "attendance/attendance_ledger.h"
#include "attendance/attendance_service.h"
#include "config/system_config.h"
#include "recognition/embedding_registry.h"
#include "storage/face_image_library.h"
#include "storage/key_value_store.h"
#include <memory>
#include <string>

/**
 * @brief Owns the attendance object graph built from SystemConfig
 *
 * Shared by the HTTP server and the command line tool:
 *   store -> registry, ledger(policy) -> service(library, encoder)
 * Members are declared in dependency order so destruction runs in reverse.
 */
class AttendanceRuntime {
public:
  /**
   * @throws InputError for invalid recognition or attendance settings
   * @throws BackingStoreError if the store cannot be opened
   */
  AttendanceRuntime(const SystemConfig::RecognitionConfig &recognition,
                    const SystemConfig::AttendanceConfig &attendance,
                    const SystemConfig::StorageConfig &storage);

  AttendanceService &service() { return *service_; }
  IKeyValueStore &store() { return *store_; }

  const std::string &storePath() const { return store_path_; }
  const std::string &usersDir() const { return users_dir_; }

  /**
   * @brief Store path with the default location filled in
   */
  static std::string resolveStorePath(const SystemConfig::StorageConfig &storage);

  /**
   * @brief Face image directory with the default location filled in
   */
  static std::string resolveUsersDir(const SystemConfig::StorageConfig &storage);

private:
  std::string store_path_;
  std::string users_dir_;
  std::unique_ptr<IKeyValueStore> store_;
  std::unique_ptr<EmbeddingRegistry> registry_;
  std::unique_ptr<AttendanceLedger> ledger_;
  std::unique_ptr<FaceImageLibrary> library_;
  std::unique_ptr<AttendanceService> service_;
};
