#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <chrono>

using namespace drogon;

class AttendanceService;

/**
 * @brief Health check endpoint handler
 * 
 * Endpoint: GET /v1/attendance/health
 * Returns: JSON with status, timestamp, uptime and the recognizer status
 * (embeddings_loaded, known_users, threshold, ...)
 */
class HealthHandler : public drogon::HttpController<HealthHandler>
{
public:
    METHOD_LIST_BEGIN
        ADD_METHOD_TO(HealthHandler::getHealth, "/v1/attendance/health", Get);
        ADD_METHOD_TO(HealthHandler::handleOptions, "/v1/attendance/health", Options);
    METHOD_LIST_END

    /**
     * @brief Handle GET /v1/attendance/health
     * 
     * @param req HTTP request
     * @param callback Response callback
     */
    void getHealth(const HttpRequestPtr &req,
                   std::function<void(const HttpResponsePtr &)> &&callback);

    void handleOptions(const HttpRequestPtr &req,
                       std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Set attendance service (dependency injection)
     */
    static void setAttendanceService(AttendanceService* service);

private:
    static AttendanceService* service_;

    /**
     * @brief Get process uptime in seconds
     */
    int64_t getUptime() const;
};
