#include "attendance/session_policy.h"
#include "core/errors.h"
#include <algorithm>
#include <cstdio>
#include <plog/Log.h>

CooldownSessionPolicy::CooldownSessionPolicy(std::chrono::seconds cooldown)
    : cooldown_(cooldown) {
  if (cooldown_.count() < 0) {
    throw InputError("Cooldown must not be negative");
  }
}

std::string CooldownSessionPolicy::formatSlot(uint64_t slot) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "seq-%012llu",
                static_cast<unsigned long long>(slot));
  return buffer;
}

std::optional<uint64_t>
CooldownSessionPolicy::parseSlot(const std::string &key) {
  const std::string prefix = "seq-";
  if (key.size() <= prefix.size() || key.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  std::string digits = key.substr(prefix.size());
  if (!std::all_of(digits.begin(), digits.end(), ::isdigit)) {
    return std::nullopt;
  }
  try {
    return std::stoull(digits);
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::string CooldownSessionPolicy::sessionKey(
    TimeUtils::TimePoint now,
    const std::optional<AttendanceRecord> &latest) const {
  if (!latest) {
    return formatSlot(1);
  }

  auto slot = parseSlot(latest->sessionKey);
  if (!slot) {
    PLOG_WARNING << "[SessionPolicy] Ignoring record with unexpected session "
                    "key: "
                 << latest->sessionKey;
    return formatSlot(1);
  }

  auto lastTime = TimeUtils::parseIso8601(latest->timestamp);
  if (lastTime && now - *lastTime < cooldown_) {
    return latest->sessionKey;
  }
  return formatSlot(*slot + 1);
}

CalendarBucketSessionPolicy::CalendarBucketSessionPolicy(int utcOffsetMinutes)
    : utc_offset_minutes_(utcOffsetMinutes) {
  if (utcOffsetMinutes < -14 * 60 || utcOffsetMinutes > 14 * 60) {
    throw InputError("UTC offset must be within +/-14 hours");
  }
}

std::string CalendarBucketSessionPolicy::sessionKey(
    TimeUtils::TimePoint now, const std::optional<AttendanceRecord> &) const {
  return "day-" + TimeUtils::formatCompactDate(now, utc_offset_minutes_);
}

std::unique_ptr<ISessionPolicy>
SessionPolicyFactory::create(const std::string &policy, int cooldownSeconds,
                             int utcOffsetMinutes) {
  std::string lower = policy;
  std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

  if (lower.empty() || lower == "cooldown") {
    return std::make_unique<CooldownSessionPolicy>(
        std::chrono::seconds(cooldownSeconds));
  }
  if (lower == "calendar" || lower == "daily") {
    return std::make_unique<CalendarBucketSessionPolicy>(utcOffsetMinutes);
  }
  throw InputError("Unknown attendance policy '" + policy +
                   "'. Use 'cooldown' or 'calendar'");
}
