#include <gtest/gtest.h>
#include "api/recognition_handler.h"
#include "attendance/attendance_service.h"
#include "fake_face_encoder.h"
#include "storage/memory_key_value_store.h"
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <drogon/utils/Utilities.h>
#include <json/json.h>
#include <thread>
#include <chrono>
#include <filesystem>

using namespace drogon;

class RecognitionHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    users_dir_ = std::filesystem::temp_directory_path() / "test_recognition_handler_users";
    std::filesystem::remove_all(users_dir_);

    encoder_ = std::make_shared<FakeFaceEncoder>();
    registry_ = std::make_unique<EmbeddingRegistry>(store_);
    ledger_ = std::make_unique<AttendanceLedger>(
        store_, std::make_unique<CooldownSessionPolicy>());
    library_ = std::make_unique<FaceImageLibrary>(users_dir_.string());
    service_ = std::make_unique<AttendanceService>(
        *registry_, *ledger_, *library_, encoder_, MatchConfig{});

    handler_ = std::make_unique<RecognitionHandler>();
    RecognitionHandler::setAttendanceService(service_.get());
  }

  void TearDown() override {
    RecognitionHandler::setAttendanceService(nullptr);
    handler_.reset();
    service_.reset();
    std::filesystem::remove_all(users_dir_);
  }

  static HttpRequestPtr jsonRequest(const std::string& path, const Json::Value& body) {
    auto req = HttpRequest::newHttpRequest();
    req->setPath(path);
    req->setMethod(Post);
    req->setContentTypeCode(CT_APPLICATION_JSON);
    req->setBody(body.toStyledString());
    return req;
  }

  static std::string base64(const std::vector<unsigned char>& data) {
    return drogon::utils::base64Encode(data.data(), data.size());
  }

  template <typename Method>
  HttpResponsePtr call(Method method, const HttpRequestPtr& req) {
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
  std::shared_ptr<FakeFaceEncoder> encoder_;
  std::unique_ptr<EmbeddingRegistry> registry_;
  std::unique_ptr<AttendanceLedger> ledger_;
  std::unique_ptr<FaceImageLibrary> library_;
  std::unique_ptr<AttendanceService> service_;
  std::unique_ptr<RecognitionHandler> handler_;
};

// Test recognize with an embedding before anything is enrolled
TEST_F(RecognitionHandlerTest, RecognizeWithoutEmbeddingsReturnsNotFound) {
  Json::Value body;
  body["embedding"].append(0.0);
  body["embedding"].append(0.0);

  auto response = call(&RecognitionHandler::recognize,
                       jsonRequest("/v1/attendance/recognize", body));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k404NotFound);

  auto json = response->getJsonObject();
  ASSERT_NE(json, nullptr);
  EXPECT_TRUE(json->isMember("error"));
  EXPECT_TRUE(json->isMember("message"));
}

// Test recognize with embeddings and boxes
TEST_F(RecognitionHandlerTest, RecognizeEmbeddingsReturnsResults) {
  service_->enroll("alice", {0.0f, 0.0f});

  Json::Value body;
  Json::Value known(Json::arrayValue);
  known.append(0.0);
  known.append(0.1);
  Json::Value stranger(Json::arrayValue);
  stranger.append(9.0);
  stranger.append(9.0);
  body["embeddings"].append(known);
  body["embeddings"].append(stranger);
  Json::Value box(Json::arrayValue);
  box.append(1);
  box.append(2);
  box.append(3);
  box.append(4);
  body["boxes"].append(box);
  body["boxes"].append(box);

  auto response = call(&RecognitionHandler::recognize,
                       jsonRequest("/v1/attendance/recognize", body));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);
  EXPECT_EQ(response->contentType(), CT_APPLICATION_JSON);

  auto json = response->getJsonObject();
  ASSERT_NE(json, nullptr);
  ASSERT_TRUE((*json)["results"].isArray());
  ASSERT_EQ((*json)["results"].size(), 2u);
  EXPECT_EQ((*json)["results"][0]["user_id"].asString(), "alice");
  EXPECT_EQ((*json)["results"][0]["bbox"][3].asInt(), 4);
  EXPECT_EQ((*json)["results"][1]["user_id"].asString(), "Unknown");
  EXPECT_FALSE(json->isMember("attendance"));
}

// Test recognize with several embeddings and no boxes
TEST_F(RecognitionHandlerTest, RecognizeEmbeddingsWithoutBoxes) {
  service_->enroll("alice", {0.0f, 0.0f});

  Json::Value body;
  Json::Value known(Json::arrayValue);
  known.append(0.1);
  known.append(0.0);
  Json::Value stranger(Json::arrayValue);
  stranger.append(6.0);
  stranger.append(6.0);
  body["embeddings"].append(known);
  body["embeddings"].append(stranger);

  auto response = call(&RecognitionHandler::recognize,
                       jsonRequest("/v1/attendance/recognize", body));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);

  auto json = response->getJsonObject();
  ASSERT_NE(json, nullptr);
  ASSERT_EQ((*json)["results"].size(), 2u);
  EXPECT_EQ((*json)["results"][0]["user_id"].asString(), "alice");
  EXPECT_EQ((*json)["results"][1]["user_id"].asString(), "Unknown");
}

// Test recognize with a non boolean log_attendance
TEST_F(RecognitionHandlerTest, RecognizeRejectsNonBooleanLogFlag) {
  service_->enroll("alice", {0.0f, 0.0f});

  Json::Value body;
  body["embedding"].append(0.0);
  body["embedding"].append(0.0);
  body["log_attendance"] = "yes";

  auto response = call(&RecognitionHandler::recognize,
                       jsonRequest("/v1/attendance/recognize", body));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k400BadRequest);
  EXPECT_FALSE(service_->lastEvent("alice").has_value());
}

// Test recognize with a wrong embedding length
TEST_F(RecognitionHandlerTest, RecognizeDimensionMismatchIsBadRequest) {
  service_->enroll("alice", {0.0f, 0.0f});

  Json::Value body;
  body["embedding"].append(0.0);

  auto response = call(&RecognitionHandler::recognize,
                       jsonRequest("/v1/attendance/recognize", body));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k400BadRequest);
}

// Test recognize from a base64 image with attendance logging
TEST_F(RecognitionHandlerTest, RecognizeImageLogsAttendance) {
  service_->enroll("alice", {0.0f, 0.0f});
  encoder_->addFace("gate", BoundingBox{0, 10, 10, 0}, std::vector<float>{0.0f, 0.0f});

  Json::Value body;
  body["file"] = "data:image/jpeg;base64," + base64(FakeFaceEncoder::image("gate"));
  body["log_attendance"] = true;
  body["source"] = "gate-1";

  auto response = call(&RecognitionHandler::recognize,
                       jsonRequest("/v1/attendance/recognize", body));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);

  auto json = response->getJsonObject();
  ASSERT_NE(json, nullptr);
  ASSERT_EQ((*json)["results"].size(), 1u);
  ASSERT_EQ((*json)["attendance"].size(), 1u);
  EXPECT_TRUE((*json)["attendance"][0]["logged"].asBool());
  EXPECT_EQ((*json)["attendance"][0]["source"].asString(), "gate-1");

  ASSERT_TRUE(service_->lastEvent("alice").has_value());
}

// Test recognize rejects non image payloads
TEST_F(RecognitionHandlerTest, RecognizeRejectsUnsupportedImage) {
  service_->enroll("alice", {0.0f, 0.0f});

  Json::Value body;
  body["file"] = base64({'G', 'I', 'F', '8', '9', 'a'});

  auto response = call(&RecognitionHandler::recognize,
                       jsonRequest("/v1/attendance/recognize", body));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k400BadRequest);
}

// Test recognize with invalid body
TEST_F(RecognitionHandlerTest, RecognizeWithoutBodyIsBadRequest) {
  auto req = HttpRequest::newHttpRequest();
  req->setPath("/v1/attendance/recognize");
  req->setMethod(Post);

  auto response = call(&RecognitionHandler::recognize, req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k400BadRequest);
}

// Test enrollment from an embedding and listing
TEST_F(RecognitionHandlerTest, EnrollEmbeddingThenList) {
  Json::Value body;
  body["user_id"] = "alice";
  body["embedding"].append(0.25);
  body["embedding"].append(0.75);

  auto response = call(&RecognitionHandler::enrollFace,
                       jsonRequest("/v1/attendance/faces", body));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);
  auto json = response->getJsonObject();
  ASSERT_NE(json, nullptr);
  EXPECT_TRUE((*json)["success"].asBool());
  EXPECT_EQ((*json)["user_id"].asString(), "alice");

  auto listReq = HttpRequest::newHttpRequest();
  listReq->setPath("/v1/attendance/faces");
  listReq->setMethod(Get);
  auto listResponse = call(&RecognitionHandler::listFaces, listReq);
  ASSERT_NE(listResponse, nullptr);
  EXPECT_EQ(listResponse->statusCode(), k200OK);
  auto list = listResponse->getJsonObject();
  ASSERT_NE(list, nullptr);
  ASSERT_EQ((*list)["users"].size(), 1u);
  EXPECT_EQ((*list)["users"][0]["user_id"].asString(), "alice");
  EXPECT_TRUE((*list)["users"][0]["has_embedding"].asBool());
}

// Test enrollment from a base64 image
TEST_F(RecognitionHandlerTest, EnrollImageStoresPhoto) {
  encoder_->addFace("alice", BoundingBox{0, 10, 10, 0}, std::vector<float>{1.0f, 1.0f});

  Json::Value body;
  body["user_id"] = "alice";
  body["file"] = base64(FakeFaceEncoder::image("alice"));

  auto response = call(&RecognitionHandler::enrollFace,
                       jsonRequest("/v1/attendance/faces", body));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);
  EXPECT_EQ(library_->photoCounts()["alice"], 1u);
}

// Test enrollment error mapping
TEST_F(RecognitionHandlerTest, EnrollErrorsMapToStatusCodes) {
  Json::Value missingUser;
  missingUser["embedding"].append(1.0);
  auto response = call(&RecognitionHandler::enrollFace,
                       jsonRequest("/v1/attendance/faces", missingUser));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k400BadRequest);

  Json::Value reserved;
  reserved["user_id"] = "Unknown";
  reserved["embedding"].append(1.0);
  response = call(&RecognitionHandler::enrollFace,
                  jsonRequest("/v1/attendance/faces", reserved));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k400BadRequest);

  encoder_->addEmptyImage("wall");
  Json::Value noFace;
  noFace["user_id"] = "alice";
  noFace["file"] = base64(FakeFaceEncoder::image("wall"));
  response = call(&RecognitionHandler::enrollFace,
                  jsonRequest("/v1/attendance/faces", noFace));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k422UnprocessableEntity);
}

// Test rebuild with an empty library
TEST_F(RecognitionHandlerTest, RebuildWithoutImagesIsUnprocessable) {
  auto req = HttpRequest::newHttpRequest();
  req->setPath("/v1/attendance/embeddings/rebuild");
  req->setMethod(Post);

  auto response = call(&RecognitionHandler::rebuildEmbeddings, req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k422UnprocessableEntity);
}

// Test rebuild from stored images
TEST_F(RecognitionHandlerTest, RebuildReturnsKnownUsers) {
  encoder_->addFace("a", BoundingBox{0, 10, 10, 0}, std::vector<float>{0.0f, 1.0f});
  library_->storeImage("alice", FakeFaceEncoder::image("a"), "jpg");

  auto req = HttpRequest::newHttpRequest();
  req->setPath("/v1/attendance/embeddings/rebuild");
  req->setMethod(Post);

  auto response = call(&RecognitionHandler::rebuildEmbeddings, req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);
  auto json = response->getJsonObject();
  ASSERT_NE(json, nullptr);
  EXPECT_EQ((*json)["known_users"].asUInt64(), 1u);
}

// Test handler without service
TEST_F(RecognitionHandlerTest, MissingServiceIsServiceUnavailable) {
  RecognitionHandler::setAttendanceService(nullptr);

  auto req = HttpRequest::newHttpRequest();
  req->setPath("/v1/attendance/faces");
  req->setMethod(Get);

  auto response = call(&RecognitionHandler::listFaces, req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k503ServiceUnavailable);
}

// Test OPTIONS request
TEST_F(RecognitionHandlerTest, HandleOptions) {
  auto req = HttpRequest::newHttpRequest();
  req->setPath("/v1/attendance/recognize");
  req->setMethod(Options);

  auto response = call(&RecognitionHandler::handleOptions, req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);
  EXPECT_EQ(response->getHeader("Access-Control-Allow-Origin"), "*");
}
