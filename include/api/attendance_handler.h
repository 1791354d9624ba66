#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <string>

using namespace drogon;

class AttendanceService;
struct AttendanceFilter;

/**
 * @brief Attendance Log Handler
 *
 * Endpoints:
 * - POST /v1/attendance/logs - Log an attendance attempt
 * - GET /v1/attendance/logs - Query records (user_id, start_date, end_date)
 * - GET /v1/attendance/logs/export - Same query as CSV
 * - GET /v1/attendance/logs/{userId}/last - Most recent record of a user
 */
class AttendanceHandler : public drogon::HttpController<AttendanceHandler> {
public:
    METHOD_LIST_BEGIN
        ADD_METHOD_TO(AttendanceHandler::logAttendance, "/v1/attendance/logs", Post);
        ADD_METHOD_TO(AttendanceHandler::queryLogs, "/v1/attendance/logs", Get);
        ADD_METHOD_TO(AttendanceHandler::exportLogs, "/v1/attendance/logs/export", Get);
        ADD_METHOD_TO(AttendanceHandler::getLastEvent, "/v1/attendance/logs/{userId}/last", Get);
        ADD_METHOD_TO(AttendanceHandler::handleOptions, "/v1/attendance/logs", Options);
        ADD_METHOD_TO(AttendanceHandler::handleOptions, "/v1/attendance/logs/export", Options);
        ADD_METHOD_TO(AttendanceHandler::handleOptions, "/v1/attendance/logs/{userId}/last", Options);
    METHOD_LIST_END

    /**
     * @brief Handle POST /v1/attendance/logs
     *
     * Body: {"user_id": "alice", "source": "gate-1"}
     * Response: {"logged", "user_id", "session_id", "timestamp", "source"}
     */
    void logAttendance(const HttpRequestPtr &req,
                       std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle GET /v1/attendance/logs
     *
     * Query: user_id, start_date, end_date (ISO 8601, date-only end is
     * inclusive of the whole day)
     */
    void queryLogs(const HttpRequestPtr &req,
                   std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle GET /v1/attendance/logs/export
     */
    void exportLogs(const HttpRequestPtr &req,
                    std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle GET /v1/attendance/logs/{userId}/last
     */
    void getLastEvent(const HttpRequestPtr &req,
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
     * @brief Extract user ID from path parameter
     */
    std::string extractUserId(const HttpRequestPtr &req) const;

    /**
     * @brief Filter from the user_id, start_date and end_date query parameters
     * @throws InputError on malformed dates
     */
    AttendanceFilter filterFromQuery(const HttpRequestPtr &req) const;

    HttpResponsePtr createErrorResponse(int statusCode,
                                        const std::string& error,
                                        const std::string& message = "") const;

    HttpResponsePtr createSuccessResponse(const Json::Value& data, int statusCode = 200) const;
};
