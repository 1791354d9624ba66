#pragma once

#include "attendance/session_policy.h"
#include "models/attendance_record.h"
#include "storage/key_value_store.h"
#include <functional>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Lazy, restartable sequence of attendance records
 *
 * Nothing is read until begin() is called and every begin() re-reads the
 * store, so iterating twice reflects records logged in between. Records are
 * ordered by timestamp ascending.
 */
class AttendanceRecordRange {
public:
  using Loader = std::function<std::vector<AttendanceRecord>()>;

  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = AttendanceRecord;
    using difference_type = std::ptrdiff_t;
    using pointer = const AttendanceRecord *;
    using reference = const AttendanceRecord &;

    Iterator() = default;
    Iterator(std::shared_ptr<const std::vector<AttendanceRecord>> records,
             size_t index)
        : records_(std::move(records)), index_(index) {}

    reference operator*() const { return (*records_)[index_]; }
    pointer operator->() const { return &(*records_)[index_]; }

    Iterator &operator++() {
      ++index_;
      return *this;
    }

    Iterator operator++(int) {
      Iterator previous = *this;
      ++index_;
      return previous;
    }

    bool operator==(const Iterator &other) const {
      if (atEnd() || other.atEnd()) {
        return atEnd() == other.atEnd();
      }
      return records_ == other.records_ && index_ == other.index_;
    }
    bool operator!=(const Iterator &other) const { return !(*this == other); }

  private:
    bool atEnd() const { return !records_ || index_ >= records_->size(); }

    std::shared_ptr<const std::vector<AttendanceRecord>> records_;
    size_t index_ = 0;
  };

  explicit AttendanceRecordRange(Loader loader) : loader_(std::move(loader)) {}

  Iterator begin() const;
  Iterator end() const { return Iterator(); }

  /**
   * @brief Materialize one pass
   */
  std::vector<AttendanceRecord> toVector() const { return loader_(); }

private:
  Loader loader_;
};

/**
 * @brief Attendance Ledger
 *
 * Persists attendance records under
 *   attendance/<identity>/<session key>
 * and decides duplicates with one IKeyValueStore::putIfAbsent() per attempt.
 * The session key comes from the configured ISessionPolicy; the clock is
 * injected so tests can drive time explicitly.
 */
class AttendanceLedger {
public:
  using ClockFn = std::function<TimeUtils::TimePoint()>;

  AttendanceLedger(IKeyValueStore &store,
                   std::unique_ptr<ISessionPolicy> policy,
                   ClockFn clock = TimeUtils::Clock::now);

  /**
   * @brief Record an attendance attempt
   * @return logged = true if a new record was written, false if the attempt
   * fell into an already recorded session
   * @throws InvalidIdentityError if identity is empty
   * @throws BackingStoreError on storage failure
   */
  LogAttemptResult logAttempt(const std::string &identity,
                              const std::string &source);

  /**
   * @brief Records matching filter, ordered by timestamp ascending
   */
  AttendanceRecordRange query(const AttendanceFilter &filter) const;

  /**
   * @brief Most recent record of an identity across all session keys
   */
  std::optional<AttendanceRecord> lastEvent(const std::string &identity) const;

  /**
   * @brief Write matching records as CSV
   *
   * Header: timestamp,user_id,source,session_id
   *
   * @return Number of data rows written
   */
  size_t exportCsv(const AttendanceFilter &filter, std::ostream &out) const;

  const ISessionPolicy &policy() const { return *policy_; }

  static std::string recordPrefix(const std::string &identity);
  static std::string recordKey(const std::string &identity,
                               const std::string &sessionKey);

private:
  IKeyValueStore &store_;
  std::unique_ptr<ISessionPolicy> policy_;
  ClockFn clock_;

  std::optional<AttendanceRecord>
  latestRecord(const std::string &identity) const;
  std::vector<AttendanceRecord> load(const AttendanceFilter &filter) const;

  static std::string escapeCsv(const std::string &field);
};
