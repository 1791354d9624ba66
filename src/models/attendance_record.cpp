#include "models/attendance_record.h"
#include "core/errors.h"
#include "core/time_utils.h"

Json::Value AttendanceRecord::toJson() const {
  Json::Value json(Json::objectValue);
  json["user_id"] = identity;
  json["timestamp"] = timestamp;
  json["source"] = source;
  json["session_id"] = sessionKey;
  return json;
}

std::optional<AttendanceRecord>
AttendanceRecord::fromJson(const Json::Value &json, std::string *error) {
  if (!json.isObject()) {
    if (error) {
      *error = "Attendance record must be a JSON object";
    }
    return std::nullopt;
  }

  for (const char *field : {"user_id", "timestamp", "session_id"}) {
    if (!json.isMember(field) || !json[field].isString()) {
      if (error) {
        *error = std::string("Attendance record is missing field: ") + field;
      }
      return std::nullopt;
    }
  }

  AttendanceRecord record;
  record.identity = json["user_id"].asString();
  record.timestamp = json["timestamp"].asString();
  record.sessionKey = json["session_id"].asString();
  record.source = json.get("source", "").asString();
  return record;
}

Json::Value LogAttemptResult::toJson() const {
  Json::Value json(Json::objectValue);
  json["logged"] = logged;
  json["user_id"] = record.identity;
  json["session_id"] = sessionKey;
  json["timestamp"] = record.timestamp;
  json["source"] = record.source;
  return json;
}

AttendanceFilter AttendanceFilter::fromStrings(const std::string &identity,
                                               const std::string &start,
                                               const std::string &end) {
  AttendanceFilter filter;
  if (!identity.empty()) {
    filter.identity = identity;
  }

  if (!start.empty()) {
    filter.start = TimeUtils::parseIso8601(start);
    if (!filter.start) {
      throw InputError("Invalid start_date '" + start +
                       "'. Expected YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS");
    }
  }

  if (!end.empty()) {
    filter.end = TimeUtils::parseIso8601(end);
    if (!filter.end) {
      throw InputError("Invalid end_date '" + end +
                       "'. Expected YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS");
    }
    if (TimeUtils::isDateOnly(end)) {
      *filter.end += std::chrono::hours(24) - std::chrono::milliseconds(1);
    }
  }

  if (filter.start && filter.end && *filter.start > *filter.end) {
    throw InputError("start_date must not be after end_date");
  }
  return filter;
}

bool AttendanceFilter::matches(
    const AttendanceRecord &record,
    std::chrono::system_clock::time_point timestamp) const {
  if (identity && record.identity != *identity) {
    return false;
  }
  if (start && timestamp < *start) {
    return false;
  }
  if (end && timestamp > *end) {
    return false;
  }
  return true;
}
