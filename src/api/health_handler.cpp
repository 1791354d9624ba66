#include "api/health_handler.h"
#include "attendance/attendance_service.h"
#include "core/cors_helper.h"
#include "core/time_utils.h"
#include <chrono>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <plog/Log.h>

// Static start time for uptime calculation
static std::chrono::steady_clock::time_point g_start_time =
    std::chrono::steady_clock::now();

AttendanceService *HealthHandler::service_ = nullptr;

void HealthHandler::setAttendanceService(AttendanceService *service) {
  service_ = service;
}

void HealthHandler::getHealth(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  try {
    Json::Value response;

    std::string status = "ok";
    Json::Value checks;

    int64_t uptime = getUptime();
    checks["uptime"] = uptime >= 0;
    checks["service"] = service_ != nullptr;

    if (service_) {
      try {
        Json::Value recognizer = service_->status().toJson();
        for (const auto &name : recognizer.getMemberNames()) {
          response[name] = recognizer[name];
        }
        checks["storage"] = true;
      } catch (const std::exception &e) {
        PLOG_WARNING << "[HealthHandler] Storage check failed: " << e.what();
        checks["storage"] = false;
        status = "unhealthy";
      }
    } else {
      status = "unhealthy";
    }

    response["status"] = status;
    response["timestamp"] = TimeUtils::getCurrentTimestamp();
    response["uptime_seconds"] = static_cast<Json::Int64>(uptime);
    response["service"] = "face_attendance";
    response["version"] = "1.0.0";
    response["checks"] = checks;

    auto resp = HttpResponse::newHttpJsonResponse(response);
    resp->setStatusCode(status == "ok" ? k200OK : k503ServiceUnavailable);
    CorsHelper::addAllowAllHeaders(resp);

    callback(resp);
  } catch (const std::exception &e) {
    Json::Value errorResponse;
    errorResponse["error"] = "Internal server error";
    errorResponse["message"] = e.what();

    auto resp = HttpResponse::newHttpJsonResponse(errorResponse);
    resp->setStatusCode(k500InternalServerError);
    CorsHelper::addAllowAllHeaders(resp);
    callback(resp);
  }
}

void HealthHandler::handleOptions(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  callback(CorsHelper::createOptionsResponse());
}

int64_t HealthHandler::getUptime() const {
  auto now = std::chrono::steady_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::seconds>(now - g_start_time);
  return duration.count();
}
