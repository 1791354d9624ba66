#pragma once

#include <chrono>
#include <json/json.h>
#include <optional>
#include <string>

/**
 * @brief One persisted attendance event
 *
 * At most one record exists per (identity, sessionKey).
 */
struct AttendanceRecord {
  std::string identity;   // Recognized user
  std::string timestamp;  // ISO 8601 UTC with milliseconds
  std::string source;     // Where the event came from ("api", "webcam", ...)
  std::string sessionKey; // Dedup bucket ("seq-000000000003", "day-20261019")

  Json::Value toJson() const;

  /**
   * @brief Parse a stored record
   * @param error Reason when nullopt is returned
   */
  static std::optional<AttendanceRecord> fromJson(const Json::Value &json,
                                                  std::string *error = nullptr);
};

/**
 * @brief Filters for AttendanceLedger::query(). Unset fields match all.
 *
 * Bounds are inclusive. A date-only end bound ("2026-10-19") covers the
 * whole day.
 */
struct AttendanceFilter {
  std::optional<std::string> identity;
  std::optional<std::chrono::system_clock::time_point> start;
  std::optional<std::chrono::system_clock::time_point> end;

  /**
   * @brief Build a filter from request or command line values
   *
   * Empty strings leave the field unset. A date-only end bound is extended
   * to the last millisecond of that day.
   *
   * @throws InputError if a bound is not a valid ISO 8601 date/timestamp or
   * start is after end
   */
  static AttendanceFilter fromStrings(const std::string &identity,
                                      const std::string &start,
                                      const std::string &end);

  bool matches(const AttendanceRecord &record,
               std::chrono::system_clock::time_point timestamp) const;
};

/**
 * @brief Outcome of AttendanceLedger::logAttempt()
 */
struct LogAttemptResult {
  bool logged = false;     // false = suppressed as duplicate
  std::string sessionKey;  // Key the attempt was decided on
  AttendanceRecord record; // Record written (logged) or attempted

  Json::Value toJson() const;
};
