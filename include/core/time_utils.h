#pragma once

#include <chrono>
#include <optional>
#include <string>

/**
 * @brief Timestamp helpers for attendance records
 *
 * All timestamps are UTC and rendered as ISO 8601 with milliseconds:
 *   2026-10-19T08:15:00.123Z
 * This format sorts lexicographically in chronological order.
 */
namespace TimeUtils {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Format a time point as YYYY-MM-DDTHH:MM:SS.mmmZ (UTC)
 */
std::string formatIso8601(TimePoint tp);

/**
 * @brief Current time formatted with formatIso8601()
 */
std::string getCurrentTimestamp();

/**
 * @brief Parse an ISO 8601 UTC timestamp
 *
 * Accepted forms:
 *   YYYY-MM-DD
 *   YYYY-MM-DDTHH:MM:SS
 *   YYYY-MM-DDTHH:MM:SS.fff
 * each optionally followed by 'Z'. A space may replace 'T'.
 *
 * @return Time point, or nullopt when the text is not a valid timestamp
 */
std::optional<TimePoint> parseIso8601(const std::string &text);

/**
 * @brief True if the text is a date without a time-of-day component
 */
bool isDateOnly(const std::string &text);

/**
 * @brief Calendar day of a time point as YYYYMMDD, after shifting by an
 * offset in minutes
 */
std::string formatCompactDate(TimePoint tp, int utcOffsetMinutes = 0);

} // namespace TimeUtils
