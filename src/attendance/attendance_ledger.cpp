#include "attendance/attendance_ledger.h"
#include "core/errors.h"
#include <algorithm>
#include <ostream>
#include <plog/Log.h>

namespace {
const char *kAttendancePrefix = "attendance/";

struct TimedRecord {
  TimeUtils::TimePoint time;
  AttendanceRecord record;
};
} // namespace

AttendanceRecordRange::Iterator AttendanceRecordRange::begin() const {
  auto records =
      std::make_shared<const std::vector<AttendanceRecord>>(loader_());
  return Iterator(records, 0);
}

AttendanceLedger::AttendanceLedger(IKeyValueStore &store,
                                   std::unique_ptr<ISessionPolicy> policy,
                                   ClockFn clock)
    : store_(store), policy_(std::move(policy)), clock_(std::move(clock)) {
  if (!policy_) {
    throw InputError("Attendance ledger requires a session policy");
  }
  if (!clock_) {
    clock_ = TimeUtils::Clock::now;
  }
}

std::string AttendanceLedger::recordPrefix(const std::string &identity) {
  return kAttendancePrefix + encodeKeySegment(identity) + "/";
}

std::string AttendanceLedger::recordKey(const std::string &identity,
                                        const std::string &sessionKey) {
  return recordPrefix(identity) + sessionKey;
}

std::optional<AttendanceRecord>
AttendanceLedger::latestRecord(const std::string &identity) const {
  // Slots are zero padded, so the last key in scan order is the latest.
  auto entries = store_.scan(recordPrefix(identity) + policy_->keyPrefix());
  for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
    std::string error;
    auto record = AttendanceRecord::fromJson(it->value, &error);
    if (record) {
      return record;
    }
    PLOG_WARNING << "[AttendanceLedger] Skipping corrupt record " << it->key
                 << ": " << error;
  }
  return std::nullopt;
}

LogAttemptResult AttendanceLedger::logAttempt(const std::string &identity,
                                              const std::string &source) {
  if (identity.empty()) {
    throw InvalidIdentityError("Identity must not be empty");
  }

  TimeUtils::TimePoint now = clock_();
  std::optional<AttendanceRecord> latest;
  if (policy_->needsLatestRecord()) {
    latest = latestRecord(identity);
  }

  LogAttemptResult result;
  result.sessionKey = policy_->sessionKey(now, latest);
  result.record.identity = identity;
  result.record.timestamp = TimeUtils::formatIso8601(now);
  result.record.source = source;
  result.record.sessionKey = result.sessionKey;

  result.logged = store_.putIfAbsent(recordKey(identity, result.sessionKey),
                                     result.record.toJson());

  if (result.logged) {
    PLOG_INFO << "[AttendanceLedger] Logged " << identity << " (" << source
              << ") session " << result.sessionKey;
  } else {
    PLOG_DEBUG << "[AttendanceLedger] Suppressed duplicate for " << identity
               << " in session " << result.sessionKey;
  }
  return result;
}

std::vector<AttendanceRecord>
AttendanceLedger::load(const AttendanceFilter &filter) const {
  std::string prefix =
      filter.identity ? recordPrefix(*filter.identity) : kAttendancePrefix;

  std::vector<TimedRecord> matched;
  for (const auto &entry : store_.scan(prefix)) {
    std::string error;
    auto record = AttendanceRecord::fromJson(entry.value, &error);
    if (!record) {
      PLOG_WARNING << "[AttendanceLedger] Skipping corrupt record " << entry.key
                   << ": " << error;
      continue;
    }
    auto time = TimeUtils::parseIso8601(record->timestamp);
    if (!time) {
      PLOG_WARNING << "[AttendanceLedger] Skipping record " << entry.key
                   << " with invalid timestamp " << record->timestamp;
      continue;
    }
    if (filter.matches(*record, *time)) {
      matched.push_back({*time, std::move(*record)});
    }
  }

  std::stable_sort(matched.begin(), matched.end(),
                   [](const TimedRecord &a, const TimedRecord &b) {
                     return a.time < b.time;
                   });

  std::vector<AttendanceRecord> records;
  records.reserve(matched.size());
  for (auto &item : matched) {
    records.push_back(std::move(item.record));
  }
  return records;
}

AttendanceRecordRange
AttendanceLedger::query(const AttendanceFilter &filter) const {
  return AttendanceRecordRange([this, filter]() { return load(filter); });
}

std::optional<AttendanceRecord>
AttendanceLedger::lastEvent(const std::string &identity) const {
  if (identity.empty()) {
    throw InvalidIdentityError("Identity must not be empty");
  }

  AttendanceFilter filter;
  filter.identity = identity;
  auto records = load(filter);
  if (records.empty()) {
    return std::nullopt;
  }
  return records.back();
}

std::string AttendanceLedger::escapeCsv(const std::string &field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }
  std::string escaped = "\"";
  for (char c : field) {
    if (c == '"') {
      escaped += '"';
    }
    escaped += c;
  }
  escaped += '"';
  return escaped;
}

size_t AttendanceLedger::exportCsv(const AttendanceFilter &filter,
                                   std::ostream &out) const {
  out << "timestamp,user_id,source,session_id\n";
  size_t rows = 0;
  for (const auto &record : query(filter)) {
    out << escapeCsv(record.timestamp) << ',' << escapeCsv(record.identity)
        << ',' << escapeCsv(record.source) << ','
        << escapeCsv(record.sessionKey) << '\n';
    ++rows;
  }
  return rows;
}
