#include <gtest/gtest.h>
#include "api/attendance_handler.h"
#include "attendance/attendance_service.h"
#include "storage/memory_key_value_store.h"
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <filesystem>

using namespace drogon;

class AttendanceHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    users_dir_ = std::filesystem::temp_directory_path() / "test_attendance_handler_users";
    registry_ = std::make_unique<EmbeddingRegistry>(store_);
    ledger_ = std::make_unique<AttendanceLedger>(
        store_, std::make_unique<CooldownSessionPolicy>());
    library_ = std::make_unique<FaceImageLibrary>(users_dir_.string());
    service_ = std::make_unique<AttendanceService>(
        *registry_, *ledger_, *library_, nullptr, MatchConfig{});

    handler_ = std::make_unique<AttendanceHandler>();
    AttendanceHandler::setAttendanceService(service_.get());
  }

  void TearDown() override {
    AttendanceHandler::setAttendanceService(nullptr);
    handler_.reset();
    service_.reset();
    std::filesystem::remove_all(users_dir_);
  }

  HttpResponsePtr logAttendance(const Json::Value& body) {
    auto req = HttpRequest::newHttpRequest();
    req->setPath("/v1/attendance/logs");
    req->setMethod(Post);
    req->setContentTypeCode(CT_APPLICATION_JSON);
    req->setBody(body.toStyledString());

    HttpResponsePtr response;
    handler_->logAttendance(req, [&](const HttpResponsePtr &resp) {
      response = resp;
    });
    return response;
  }

  HttpResponsePtr get(void (AttendanceHandler::*method)(
                          const HttpRequestPtr &,
                          std::function<void(const HttpResponsePtr &)> &&),
                      const HttpRequestPtr& req) {
    HttpResponsePtr response;
    bool callbackCalled = false;
    ((*handler_).*method)(req, [&](const HttpResponsePtr &resp) {
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
  std::unique_ptr<AttendanceHandler> handler_;
};

// Test POST /v1/attendance/logs logs once and then suppresses
TEST_F(AttendanceHandlerTest, LogAttendanceDeduplicates) {
  Json::Value body;
  body["user_id"] = "alice";
  body["source"] = "gate-1";

  auto first = logAttendance(body);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->statusCode(), k200OK);
  auto json = first->getJsonObject();
  ASSERT_NE(json, nullptr);
  EXPECT_TRUE((*json)["logged"].asBool());
  EXPECT_EQ((*json)["source"].asString(), "gate-1");
  EXPECT_EQ((*json)["session_id"].asString(), "seq-000000000001");

  auto second = logAttendance(body);
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(second->statusCode(), k200OK);
  EXPECT_FALSE((*second->getJsonObject())["logged"].asBool());
}

// Test POST /v1/attendance/logs input validation
TEST_F(AttendanceHandlerTest, LogAttendanceRejectsInvalidUser) {
  Json::Value missing;
  missing["source"] = "gate-1";
  auto response = logAttendance(missing);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k400BadRequest);

  Json::Value unknown;
  unknown["user_id"] = "Unknown";
  response = logAttendance(unknown);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k400BadRequest);
}

// Test GET /v1/attendance/logs with filters
TEST_F(AttendanceHandlerTest, QueryLogsFiltersByUser) {
  service_->logAttendance("alice", "gate");
  service_->logAttendance("bob", "gate");

  auto req = HttpRequest::newHttpRequest();
  req->setPath("/v1/attendance/logs");
  req->setMethod(Get);
  req->setParameter("user_id", "bob");

  auto response = get(&AttendanceHandler::queryLogs, req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);
  auto json = response->getJsonObject();
  ASSERT_NE(json, nullptr);
  EXPECT_EQ((*json)["count"].asInt(), 1);
  ASSERT_EQ((*json)["records"].size(), 1u);
  EXPECT_EQ((*json)["records"][0]["user_id"].asString(), "bob");
}

// Test GET /v1/attendance/logs with a malformed date
TEST_F(AttendanceHandlerTest, QueryLogsRejectsMalformedDate) {
  auto req = HttpRequest::newHttpRequest();
  req->setPath("/v1/attendance/logs");
  req->setMethod(Get);
  req->setParameter("start_date", "last tuesday");

  auto response = get(&AttendanceHandler::queryLogs, req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k400BadRequest);
}

// Test GET /v1/attendance/logs/export returns CSV
TEST_F(AttendanceHandlerTest, ExportReturnsCsv) {
  service_->logAttendance("alice", "gate");

  auto req = HttpRequest::newHttpRequest();
  req->setPath("/v1/attendance/logs/export");
  req->setMethod(Get);

  auto response = get(&AttendanceHandler::exportLogs, req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);
  EXPECT_NE(response->getHeader("Content-Disposition").find("attendance.csv"),
            std::string::npos);

  std::string body(response->body());
  EXPECT_EQ(body.rfind("timestamp,user_id,source,session_id\n", 0), 0u);
  EXPECT_NE(body.find(",alice,gate,seq-000000000001"), std::string::npos);
}

// Test GET /v1/attendance/logs/{userId}/last
TEST_F(AttendanceHandlerTest, LastEventFoundAndNotFound) {
  service_->logAttendance("alice", "gate");

  auto req = HttpRequest::newHttpRequest();
  req->setPath("/v1/attendance/logs/alice/last");
  req->setMethod(Get);
  auto response = get(&AttendanceHandler::getLastEvent, req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);
  EXPECT_EQ((*response->getJsonObject())["user_id"].asString(), "alice");

  auto missingReq = HttpRequest::newHttpRequest();
  missingReq->setPath("/v1/attendance/logs/bob/last");
  missingReq->setParameter("userId", "bob");
  missingReq->setMethod(Get);
  response = get(&AttendanceHandler::getLastEvent, missingReq);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k404NotFound);
}

// Test OPTIONS request
TEST_F(AttendanceHandlerTest, HandleOptions) {
  auto req = HttpRequest::newHttpRequest();
  req->setPath("/v1/attendance/logs");
  req->setMethod(Options);

  auto response = get(&AttendanceHandler::handleOptions, req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);
}
