#include "api/health_handler.h"
#include "attendance/attendance_service.h"
#include "storage/memory_key_value_store.h"
#include <chrono>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <filesystem>
#include <gtest/gtest.h>
#include <json/json.h>
#include <thread>

using namespace drogon;

class HealthHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    users_dir_ =
        std::filesystem::temp_directory_path() / "test_health_handler_users";
    registry_ = std::make_unique<EmbeddingRegistry>(store_);
    ledger_ = std::make_unique<AttendanceLedger>(
        store_, std::make_unique<CalendarBucketSessionPolicy>());
    library_ = std::make_unique<FaceImageLibrary>(users_dir_.string());
    service_ = std::make_unique<AttendanceService>(
        *registry_, *ledger_, *library_, nullptr,
        MatchConfig::fromConfig("euclidean", 0.6));

    handler_ = std::make_unique<HealthHandler>();
    HealthHandler::setAttendanceService(service_.get());
  }

  void TearDown() override {
    HealthHandler::setAttendanceService(nullptr);
    handler_.reset();
    service_.reset();
    std::filesystem::remove_all(users_dir_);
  }

  HttpResponsePtr getHealth() {
    bool callbackCalled = false;
    HttpResponsePtr response;

    auto req = HttpRequest::newHttpRequest();
    req->setPath("/v1/attendance/health");
    req->setMethod(Get);

    handler_->getHealth(req, [&](const HttpResponsePtr &resp) {
      callbackCalled = true;
      response = resp;
    });

    EXPECT_TRUE(callbackCalled);
    return response;
  }

  std::filesystem::path users_dir_;
  MemoryKeyValueStore store_;
  std::unique_ptr<EmbeddingRegistry> registry_;
  std::unique_ptr<AttendanceLedger> ledger_;
  std::unique_ptr<FaceImageLibrary> library_;
  std::unique_ptr<AttendanceService> service_;
  std::unique_ptr<HealthHandler> handler_;
};

// Test health endpoint returns valid JSON
TEST_F(HealthHandlerTest, HealthEndpointReturnsValidJson) {
  auto response = getHealth();
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);

  // Check content type
  EXPECT_EQ(response->contentType(), CT_APPLICATION_JSON);

  // Parse JSON response
  auto json = response->getJsonObject();
  ASSERT_NE(json, nullptr);

  // Check required fields
  EXPECT_EQ((*json)["status"].asString(), "ok");
  EXPECT_TRUE(json->isMember("timestamp"));
  EXPECT_TRUE(json->isMember("uptime_seconds"));
  EXPECT_EQ((*json)["service"].asString(), "face_attendance");
  EXPECT_TRUE(json->isMember("version"));
  EXPECT_GE((*json)["uptime_seconds"].asInt64(), 0);

  // Recognizer status
  EXPECT_FALSE((*json)["embeddings_loaded"].asBool());
  EXPECT_EQ((*json)["known_users"].asUInt64(), 0u);
  EXPECT_DOUBLE_EQ((*json)["threshold"].asDouble(), 0.6);
  EXPECT_EQ((*json)["attendance_policy"].asString(), "calendar");
  EXPECT_EQ((*json)["encoder"].asString(), "none");
}

// Test health reflects enrolled identities
TEST_F(HealthHandlerTest, HealthReportsKnownUsers) {
  service_->enroll("alice", {1.0f, 0.0f});

  auto response = getHealth();
  ASSERT_NE(response, nullptr);
  auto json = response->getJsonObject();
  ASSERT_NE(json, nullptr);
  EXPECT_TRUE((*json)["embeddings_loaded"].asBool());
  EXPECT_EQ((*json)["known_users"].asUInt64(), 1u);
}

// Test health without a service
TEST_F(HealthHandlerTest, MissingServiceIsUnhealthy) {
  HealthHandler::setAttendanceService(nullptr);

  auto response = getHealth();
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k503ServiceUnavailable);
  EXPECT_EQ((*response->getJsonObject())["status"].asString(), "unhealthy");
}

// Test health timestamp format
TEST_F(HealthHandlerTest, TimestampIsIso8601) {
  auto response = getHealth();
  ASSERT_NE(response, nullptr);
  std::string timestamp = (*response->getJsonObject())["timestamp"].asString();

  // Format: YYYY-MM-DDTHH:MM:SS.mmmZ
  EXPECT_EQ(timestamp.length(), 24u);
  EXPECT_EQ(timestamp[10], 'T');
  EXPECT_EQ(timestamp.back(), 'Z');
}
