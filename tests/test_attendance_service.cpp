#include "attendance/attendance_service.h"
#include "core/errors.h"
#include "fake_face_encoder.h"
#include "storage/memory_key_value_store.h"
#include <filesystem>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

/**
 * Key/value store whose writes can be switched off, to exercise rollback.
 */
class FailingKeyValueStore : public MemoryKeyValueStore {
public:
  bool failWrites = false;

  void put(const std::string &key, const Json::Value &value) override {
    if (failWrites) {
      throw BackingStoreError("disk full");
    }
    MemoryKeyValueStore::put(key, value);
  }
};

class AttendanceServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    users_dir_ = fs::temp_directory_path() / "test_attendance_service_users";
    fs::remove_all(users_dir_);

    encoder_ = std::make_shared<FakeFaceEncoder>();
    registry_ = std::make_unique<EmbeddingRegistry>(store_);
    ledger_ = std::make_unique<AttendanceLedger>(
        store_, std::make_unique<CooldownSessionPolicy>());
    library_ = std::make_unique<FaceImageLibrary>(users_dir_.string());
    service_ = std::make_unique<AttendanceService>(
        *registry_, *ledger_, *library_, encoder_,
        MatchConfig::fromConfig("euclidean", 0.5));
  }

  void TearDown() override {
    service_.reset();
    fs::remove_all(users_dir_);
  }

  fs::path users_dir_;
  FailingKeyValueStore store_;
  std::shared_ptr<FakeFaceEncoder> encoder_;
  std::unique_ptr<EmbeddingRegistry> registry_;
  std::unique_ptr<AttendanceLedger> ledger_;
  std::unique_ptr<FaceImageLibrary> library_;
  std::unique_ptr<AttendanceService> service_;
};

TEST_F(AttendanceServiceTest, RecognizeBeforeAnyEnrollmentIsUnavailable) {
  EXPECT_THROW(service_->recognize({0.0f, 0.0f}), EmbeddingsUnavailableError);
  EXPECT_FALSE(service_->refreshMatcher());
  EXPECT_FALSE(service_->status().embeddingsLoaded);
}

TEST_F(AttendanceServiceTest, EnrollMakesIdentityRecognizable) {
  service_->enroll("alice", {0.0f, 0.0f});
  service_->enroll("bob", {1.0f, 1.0f});

  EXPECT_EQ(service_->recognize({0.1f, 0.0f}).identity, "alice");
  EXPECT_EQ(service_->recognize({5.0f, 5.0f}).identity, kUnknownIdentity);

  // Enrollment after the matcher was built is visible immediately
  service_->enroll("carol", {5.0f, 5.0f});
  EXPECT_EQ(service_->recognize({5.0f, 5.0f}).identity, "carol");

  auto status = service_->status();
  EXPECT_TRUE(status.embeddingsLoaded);
  EXPECT_EQ(status.knownIdentities, 3u);
  EXPECT_EQ(status.policy, "cooldown");
  EXPECT_EQ(status.encoder, "fake");
}

TEST_F(AttendanceServiceTest, ConcurrentEnrollmentsLeaveNewestMatcher) {
  const int threads = 8;
  const int perThread = 25;

  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([this, t]() {
      for (int i = 0; i < perThread; ++i) {
        service_->enroll("user-" + std::to_string(t) + "-" + std::to_string(i),
                         {static_cast<float>(t * 10), static_cast<float>(i * 10)});
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }

  auto status = service_->status();
  EXPECT_EQ(status.knownIdentities, static_cast<size_t>(threads * perThread));
  EXPECT_EQ(status.registryVersion, registry_->version());

  for (int t = 0; t < threads; ++t) {
    for (int i = 0; i < perThread; ++i) {
      EXPECT_EQ(service_->recognize({static_cast<float>(t * 10),
                                     static_cast<float>(i * 10)})
                    .identity,
                "user-" + std::to_string(t) + "-" + std::to_string(i));
    }
  }
}

TEST_F(AttendanceServiceTest, RecognizeBatchWithoutBoxes) {
  service_->enroll("alice", {0.0f, 0.0f});

  auto results = service_->recognizeBatch({{0.0f, 0.1f}, {7.0f, 7.0f}});
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].identity, "alice");
  EXPECT_FALSE(results[0].box.has_value());
  EXPECT_EQ(results[1].identity, kUnknownIdentity);

  EXPECT_THROW(service_->recognizeBatch({{0.0f}}), DimensionMismatchError);
}

TEST_F(AttendanceServiceTest, EnrollRejectsReservedAndEmptyIdentities) {
  EXPECT_THROW(service_->enroll("Unknown", {1.0f}), InvalidIdentityError);
  EXPECT_THROW(service_->enroll("   ", {1.0f}), InvalidIdentityError);
  EXPECT_EQ(AttendanceService::normalizeIdentity("  alice "), "alice");
}

TEST_F(AttendanceServiceTest, RecognizeImageMatchesEveryFace) {
  service_->enroll("alice", {0.0f, 0.0f});
  encoder_->addFace("group", BoundingBox{0, 10, 10, 0}, std::vector<float>{0.0f, 0.1f});
  encoder_->addFace("group", BoundingBox{0, 30, 10, 20}, std::vector<float>{4.0f, 4.0f});

  auto results = service_->recognizeImage(FakeFaceEncoder::image("group"));
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].identity, "alice");
  EXPECT_EQ(*results[0].box, (BoundingBox{0, 10, 10, 0}));
  EXPECT_EQ(results[1].identity, kUnknownIdentity);
}

TEST_F(AttendanceServiceTest, RecognizeImageWithoutFacesIsEmpty) {
  service_->enroll("alice", {0.0f, 0.0f});
  encoder_->addEmptyImage("wall");
  EXPECT_TRUE(service_->recognizeImage(FakeFaceEncoder::image("wall")).empty());
}

TEST_F(AttendanceServiceTest, RecognizeImageFailsWhenFaceCannotBeEncoded) {
  service_->enroll("alice", {0.0f, 0.0f});
  encoder_->addFace("blurry", BoundingBox{0, 10, 10, 0}, std::nullopt);
  EXPECT_THROW(service_->recognizeImage(FakeFaceEncoder::image("blurry")),
               EncodingFailedError);
  EXPECT_THROW(service_->recognizeImage({0x00, 0x01}), InvalidImageError);
}

TEST_F(AttendanceServiceTest, EnrollImageStoresPhotoAndEmbedding) {
  encoder_->addFace("alice-1", BoundingBox{0, 10, 10, 0}, std::vector<float>{0.5f, 0.5f});

  std::string path =
      service_->enrollImage("alice", FakeFaceEncoder::image("alice-1"), "jpg");
  EXPECT_TRUE(fs::exists(path));
  EXPECT_EQ(service_->recognize({0.5f, 0.5f}).identity, "alice");

  auto identities = service_->listIdentities();
  ASSERT_EQ(identities.size(), 1u);
  EXPECT_EQ(identities[0].identity, "alice");
  EXPECT_EQ(identities[0].photoCount, 1);
  EXPECT_TRUE(identities[0].hasEmbedding);
}

TEST_F(AttendanceServiceTest, EnrollImageWithoutFaceWritesNothing) {
  encoder_->addEmptyImage("empty");
  EXPECT_THROW(
      service_->enrollImage("alice", FakeFaceEncoder::image("empty"), "jpg"),
      EncodingFailedError);
  EXPECT_THROW(
      service_->enrollImage("alice", FakeFaceEncoder::image("empty"), "gif"),
      InvalidImageError);
  EXPECT_TRUE(library_->listSamples().empty());
  EXPECT_FALSE(registry_->isInitialized());
}

TEST_F(AttendanceServiceTest, EnrollImageRollsBackPhotoWhenRegistryWriteFails) {
  encoder_->addFace("alice-1", BoundingBox{0, 10, 10, 0}, std::vector<float>{0.5f, 0.5f});
  store_.failWrites = true;

  EXPECT_THROW(
      service_->enrollImage("alice", FakeFaceEncoder::image("alice-1"), "jpg"),
      BackingStoreError);
  EXPECT_TRUE(library_->listSamples().empty());
  EXPECT_FALSE(fs::exists(users_dir_ / "alice"));
}

TEST_F(AttendanceServiceTest, RebuildDatabaseDerivesFromLibrary) {
  encoder_->addFace("a", BoundingBox{0, 10, 10, 0}, std::vector<float>{0.0f, 0.0f});
  encoder_->addFace("b", BoundingBox{0, 10, 10, 0}, std::vector<float>{3.0f, 3.0f});
  library_->storeImage("alice", FakeFaceEncoder::image("a"), "jpg");
  library_->storeImage("bob", FakeFaceEncoder::image("b"), "png");
  library_->storeImage("carol", FakeFaceEncoder::image("unreadable"), "png");

  EXPECT_EQ(service_->rebuildDatabase(), 2u);
  EXPECT_EQ(service_->recognize({3.0f, 3.1f}).identity, "bob");

  auto identities = service_->listIdentities();
  ASSERT_EQ(identities.size(), 3u);
  EXPECT_EQ(identities[2].identity, "carol");
  EXPECT_FALSE(identities[2].hasEmbedding);
}

TEST_F(AttendanceServiceTest, RebuildWithEmptyLibraryIsEmptyResult) {
  EXPECT_THROW(service_->rebuildDatabase(), EmptyResultError);
}

TEST_F(AttendanceServiceTest, LogAttendanceDeduplicatesAndExports) {
  auto first = service_->logAttendance(" alice ", "");
  EXPECT_TRUE(first.logged);
  EXPECT_EQ(first.record.identity, "alice");
  EXPECT_EQ(first.record.source, "api");
  EXPECT_FALSE(service_->logAttendance("alice", "gate").logged);
  EXPECT_THROW(service_->logAttendance("Unknown", "gate"), InvalidIdentityError);

  EXPECT_EQ(service_->queryAttendance(AttendanceFilter{}).toVector().size(), 1u);
  ASSERT_TRUE(service_->lastEvent("alice").has_value());
  EXPECT_FALSE(service_->lastEvent("bob").has_value());

  std::ostringstream csv;
  EXPECT_EQ(service_->exportCsv(AttendanceFilter{}, csv), 1u);
  EXPECT_NE(csv.str().find(",alice,api,seq-000000000001"), std::string::npos);
}

TEST_F(AttendanceServiceTest, MissingEncoderFailsImageOperations) {
  AttendanceService service(*registry_, *ledger_, *library_, nullptr,
                            MatchConfig{});
  service.enroll("alice", {1.0f});
  EXPECT_THROW(service.recognizeImage(FakeFaceEncoder::image("x")),
               EncodingFailedError);
  EXPECT_EQ(service.status().encoder, "none");
}
