#include "core/time_utils.h"
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace TimeUtils {

namespace {

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

const std::regex &timestampPattern() {
  static const std::regex pattern(
      R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?)?Z?$)");
  return pattern;
}

} // namespace

std::string formatIso8601(TimePoint tp) {
  auto secs = std::chrono::floor<std::chrono::seconds>(tp);
  auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
  std::time_t time = Clock::to_time_t(secs);

  std::tm tm{};
  gmtime_r(&time, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms;
  ss << "Z";
  return ss.str();
}

std::string getCurrentTimestamp() { return formatIso8601(Clock::now()); }

std::optional<TimePoint> parseIso8601(const std::string &text) {
  std::smatch match;
  if (!std::regex_match(text, match, timestampPattern())) {
    return std::nullopt;
  }

  int year = std::stoi(match[1].str());
  int month = std::stoi(match[2].str());
  int day = std::stoi(match[3].str());
  if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
    return std::nullopt;
  }

  int hour = 0, minute = 0, second = 0, millis = 0;
  if (match[4].matched) {
    hour = std::stoi(match[4].str());
    minute = std::stoi(match[5].str());
    second = std::stoi(match[6].str());
    if (hour > 23 || minute > 59 || second > 59) {
      return std::nullopt;
    }
  }
  if (match[7].matched) {
    std::string fraction = match[7].str();
    fraction.resize(3, '0');
    millis = std::stoi(fraction);
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;

  std::time_t epoch = timegm(&tm);
  return Clock::from_time_t(epoch) + std::chrono::milliseconds(millis);
}

bool isDateOnly(const std::string &text) {
  std::smatch match;
  return std::regex_match(text, match, timestampPattern()) &&
         !match[4].matched;
}

std::string formatCompactDate(TimePoint tp, int utcOffsetMinutes) {
  auto shifted = tp + std::chrono::minutes(utcOffsetMinutes);
  std::time_t time =
      Clock::to_time_t(std::chrono::floor<std::chrono::seconds>(shifted));

  std::tm tm{};
  gmtime_r(&time, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%Y%m%d");
  return ss.str();
}

} // namespace TimeUtils
