#include "api/attendance_handler.h"
#include "api/api_error.h"
#include "attendance/attendance_service.h"
#include "core/cors_helper.h"
#include "core/errors.h"
#include "core/logging_flags.h"
#include <chrono>
#include <drogon/HttpResponse.h>
#include <plog/Log.h>
#include <sstream>

AttendanceService *AttendanceHandler::service_ = nullptr;

void AttendanceHandler::setAttendanceService(AttendanceService *service) {
  service_ = service;
}

std::string AttendanceHandler::extractUserId(const HttpRequestPtr &req) const {
  std::string userId = req->getParameter("userId");

  if (userId.empty()) {
    std::string path = req->getPath();
    size_t logsPos = path.find("/logs/");
    if (logsPos != std::string::npos) {
      size_t start = logsPos + 6; // length of "/logs/"
      size_t end = path.find("/", start);
      if (end == std::string::npos) {
        end = path.length();
      }
      userId = path.substr(start, end - start);
    }
  }

  return userId;
}

AttendanceFilter
AttendanceHandler::filterFromQuery(const HttpRequestPtr &req) const {
  return AttendanceFilter::fromStrings(req->getParameter("user_id"),
                                       req->getParameter("start_date"),
                                       req->getParameter("end_date"));
}

HttpResponsePtr
AttendanceHandler::createErrorResponse(int statusCode, const std::string &error,
                                       const std::string &message) const {
  Json::Value errorResponse;
  errorResponse["error"] = error;
  if (!message.empty()) {
    errorResponse["message"] = message;
  }

  auto resp = HttpResponse::newHttpJsonResponse(errorResponse);
  resp->setStatusCode(static_cast<HttpStatusCode>(statusCode));
  CorsHelper::addAllowAllHeaders(resp);
  return resp;
}

HttpResponsePtr
AttendanceHandler::createSuccessResponse(const Json::Value &data,
                                         int statusCode) const {
  auto resp = HttpResponse::newHttpJsonResponse(data);
  resp->setStatusCode(static_cast<HttpStatusCode>(statusCode));
  CorsHelper::addAllowAllHeaders(resp);
  return resp;
}

void AttendanceHandler::logAttendance(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  auto start_time = std::chrono::steady_clock::now();

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] POST /v1/attendance/logs - Log attendance";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(503, "Service unavailable",
                                   "Attendance service is not initialized"));
      return;
    }

    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
      callback(createErrorResponse(400, "Invalid request",
                                   "Request body must be valid JSON"));
      return;
    }
    if (!json->isMember("user_id") || !(*json)["user_id"].isString()) {
      callback(createErrorResponse(400, "Invalid request",
                                   "Missing required field: user_id"));
      return;
    }

    std::string source = "api";
    if (json->isMember("source") && (*json)["source"].isString() &&
        !(*json)["source"].asString().empty()) {
      source = (*json)["source"].asString();
    }

    LogAttemptResult result =
        service_->logAttendance((*json)["user_id"].asString(), source);

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time);
    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] POST /v1/attendance/logs - "
                << (result.logged ? "Logged " : "Already present ")
                << result.record.identity << " (" << result.sessionKey
                << ") - " << duration.count() << "ms";
    }

    callback(createSuccessResponse(result.toJson()));
  } catch (const AttendanceError &e) {
    ApiError apiError = ApiError::from(e);
    if (isApiLoggingEnabled()) {
      PLOG_WARNING << "[API] POST /v1/attendance/logs - " << e.what();
    }
    callback(createErrorResponse(apiError.statusCode, apiError.error, e.what()));
  } catch (const std::exception &e) {
    PLOG_ERROR << "[API] POST /v1/attendance/logs - Exception: " << e.what();
    callback(createErrorResponse(500, "Internal server error", e.what()));
  } catch (...) {
    PLOG_ERROR << "[API] POST /v1/attendance/logs - Unknown exception";
    callback(createErrorResponse(500, "Internal server error",
                                 "Unknown error occurred"));
  }
}

void AttendanceHandler::queryLogs(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  auto start_time = std::chrono::steady_clock::now();

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/attendance/logs - Query attendance";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(503, "Service unavailable",
                                   "Attendance service is not initialized"));
      return;
    }

    AttendanceFilter filter = filterFromQuery(req);

    Json::Value records(Json::arrayValue);
    for (const auto &record : service_->queryAttendance(filter)) {
      records.append(record.toJson());
    }

    Json::Value response;
    response["records"] = records;
    response["count"] = static_cast<int>(records.size());

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time);
    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] GET /v1/attendance/logs - Success: "
                << records.size() << " records - " << duration.count() << "ms";
    }

    callback(createSuccessResponse(response));
  } catch (const AttendanceError &e) {
    ApiError apiError = ApiError::from(e);
    if (isApiLoggingEnabled()) {
      PLOG_WARNING << "[API] GET /v1/attendance/logs - " << e.what();
    }
    callback(createErrorResponse(apiError.statusCode, apiError.error, e.what()));
  } catch (const std::exception &e) {
    PLOG_ERROR << "[API] GET /v1/attendance/logs - Exception: " << e.what();
    callback(createErrorResponse(500, "Internal server error", e.what()));
  } catch (...) {
    PLOG_ERROR << "[API] GET /v1/attendance/logs - Unknown exception";
    callback(createErrorResponse(500, "Internal server error",
                                 "Unknown error occurred"));
  }
}

void AttendanceHandler::exportLogs(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/attendance/logs/export - Export CSV";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(503, "Service unavailable",
                                   "Attendance service is not initialized"));
      return;
    }

    AttendanceFilter filter = filterFromQuery(req);

    std::ostringstream csv;
    size_t rows = service_->exportCsv(filter, csv);

    auto resp = HttpResponse::newHttpResponse();
    resp->setStatusCode(k200OK);
    resp->setContentTypeString("text/csv; charset=utf-8");
    resp->addHeader("Content-Disposition",
                    "attachment; filename=\"attendance.csv\"");
    resp->setBody(csv.str());
    CorsHelper::addAllowAllHeaders(resp);

    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] GET /v1/attendance/logs/export - " << rows
                << " rows";
    }
    callback(resp);
  } catch (const AttendanceError &e) {
    ApiError apiError = ApiError::from(e);
    callback(createErrorResponse(apiError.statusCode, apiError.error, e.what()));
  } catch (const std::exception &e) {
    PLOG_ERROR << "[API] GET /v1/attendance/logs/export - Exception: "
               << e.what();
    callback(createErrorResponse(500, "Internal server error", e.what()));
  } catch (...) {
    PLOG_ERROR << "[API] GET /v1/attendance/logs/export - Unknown exception";
    callback(createErrorResponse(500, "Internal server error",
                                 "Unknown error occurred"));
  }
}

void AttendanceHandler::getLastEvent(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  std::string userId = extractUserId(req);

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/attendance/logs/" << userId
              << "/last - Last attendance event";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(503, "Service unavailable",
                                   "Attendance service is not initialized"));
      return;
    }

    auto record = service_->lastEvent(userId);
    if (!record) {
      callback(createErrorResponse(404, "Not found",
                                   "No attendance recorded for user '" +
                                       userId + "'"));
      return;
    }

    callback(createSuccessResponse(record->toJson()));
  } catch (const AttendanceError &e) {
    ApiError apiError = ApiError::from(e);
    callback(createErrorResponse(apiError.statusCode, apiError.error, e.what()));
  } catch (const std::exception &e) {
    PLOG_ERROR << "[API] GET /v1/attendance/logs/" << userId
               << "/last - Exception: " << e.what();
    callback(createErrorResponse(500, "Internal server error", e.what()));
  } catch (...) {
    PLOG_ERROR << "[API] GET /v1/attendance/logs/" << userId
               << "/last - Unknown exception";
    callback(createErrorResponse(500, "Internal server error",
                                 "Unknown error occurred"));
  }
}

void AttendanceHandler::handleOptions(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  callback(CorsHelper::createOptionsResponse());
}
