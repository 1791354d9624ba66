#pragma once

#include "core/time_utils.h"
#include "models/attendance_record.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

/**
 * @brief Decides which dedup bucket an attendance attempt belongs to
 *
 * The ledger stores at most one record per (identity, session key), so the
 * policy alone defines what "duplicate" means.
 */
class ISessionPolicy {
public:
  virtual ~ISessionPolicy() = default;

  /**
   * @brief Session key for an attempt made at now
   * @param latest Most recent record of the identity written under this
   * policy (only supplied when needsLatestRecord() is true)
   */
  virtual std::string
  sessionKey(TimeUtils::TimePoint now,
             const std::optional<AttendanceRecord> &latest) const = 0;

  /**
   * @brief Prefix shared by every key this policy produces
   */
  virtual std::string keyPrefix() const = 0;

  /**
   * @brief Whether sessionKey() depends on the identity's latest record
   */
  virtual bool needsLatestRecord() const = 0;

  virtual std::string name() const = 0;
};

/**
 * @brief One record per identity per cooldown window
 *
 * Keys are per identity sequence slots "seq-000000000001", ... An attempt
 * younger than cooldown relative to the latest slot maps onto that slot and
 * is suppressed by the conditional insert. Otherwise it claims the next
 * slot; concurrent callers that saw the same latest slot race for the same
 * next slot and exactly one wins.
 */
class CooldownSessionPolicy : public ISessionPolicy {
public:
  static constexpr int kDefaultCooldownSeconds = 300;

  /**
   * @throws InputError if cooldown is negative
   */
  explicit CooldownSessionPolicy(
      std::chrono::seconds cooldown =
          std::chrono::seconds(kDefaultCooldownSeconds));

  std::string
  sessionKey(TimeUtils::TimePoint now,
             const std::optional<AttendanceRecord> &latest) const override;
  std::string keyPrefix() const override { return "seq-"; }
  bool needsLatestRecord() const override { return true; }
  std::string name() const override { return "cooldown"; }

  std::chrono::seconds cooldown() const { return cooldown_; }

  static std::string formatSlot(uint64_t slot);

  /**
   * @return Slot number of a "seq-<n>" key, nullopt for any other key
   */
  static std::optional<uint64_t> parseSlot(const std::string &key);

private:
  std::chrono::seconds cooldown_;
};

/**
 * @brief One record per identity per calendar day ("day-YYYYMMDD")
 *
 * The day is taken in UTC shifted by a fixed offset in minutes.
 */
class CalendarBucketSessionPolicy : public ISessionPolicy {
public:
  explicit CalendarBucketSessionPolicy(int utcOffsetMinutes = 0);

  std::string
  sessionKey(TimeUtils::TimePoint now,
             const std::optional<AttendanceRecord> &latest) const override;
  std::string keyPrefix() const override { return "day-"; }
  bool needsLatestRecord() const override { return false; }
  std::string name() const override { return "calendar"; }

  int utcOffsetMinutes() const { return utc_offset_minutes_; }

private:
  int utc_offset_minutes_;
};

/**
 * @brief Creates session policies from configuration values
 */
class SessionPolicyFactory {
public:
  /**
   * @param policy "cooldown" or "calendar" (alias "daily")
   * @throws InputError for an unknown policy name or invalid parameters
   */
  static std::unique_ptr<ISessionPolicy> create(const std::string &policy,
                                                int cooldownSeconds,
                                                int utcOffsetMinutes);
};
