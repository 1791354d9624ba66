#include "attendance/attendance_ledger.h"
#include "core/errors.h"
#include "storage/memory_key_value_store.h"
#include <atomic>
#include <gtest/gtest.h>
#include <sstream>
#include <thread>

using namespace std::chrono;

/**
 * Ledger tests drive time through an injected clock.
 */
class AttendanceLedgerTest : public ::testing::Test {
protected:
  void SetUp() override { now_ = at("2026-10-19T08:00:00Z"); }

  static TimeUtils::TimePoint at(const std::string &text) {
    return *TimeUtils::parseIso8601(text);
  }

  std::unique_ptr<AttendanceLedger> makeLedger(std::unique_ptr<ISessionPolicy> policy) {
    return std::make_unique<AttendanceLedger>(store_, std::move(policy),
                                              [this]() { return now_; });
  }

  std::unique_ptr<AttendanceLedger> cooldownLedger(int seconds = 300) {
    return makeLedger(std::make_unique<CooldownSessionPolicy>(
        std::chrono::seconds(seconds)));
  }

  MemoryKeyValueStore store_;
  TimeUtils::TimePoint now_;
};

TEST_F(AttendanceLedgerTest, CooldownSuppressesAttemptsInsideWindow) {
  auto ledger = cooldownLedger();
  TimeUtils::TimePoint start = now_;

  auto first = ledger->logAttempt("alice", "gate");
  EXPECT_TRUE(first.logged);
  EXPECT_EQ(first.sessionKey, "seq-000000000001");
  EXPECT_EQ(first.record.timestamp, "2026-10-19T08:00:00.000Z");

  now_ = start + seconds(200);
  auto second = ledger->logAttempt("alice", "gate");
  EXPECT_FALSE(second.logged);
  EXPECT_EQ(second.sessionKey, "seq-000000000001");

  now_ = start + seconds(301);
  auto third = ledger->logAttempt("alice", "gate");
  EXPECT_TRUE(third.logged);
  EXPECT_EQ(third.sessionKey, "seq-000000000002");

  EXPECT_EQ(ledger->query(AttendanceFilter{}).toVector().size(), 2u);
}

TEST_F(AttendanceLedgerTest, SuppressedAttemptDoesNotExtendWindow) {
  auto ledger = cooldownLedger();
  TimeUtils::TimePoint start = now_;

  EXPECT_TRUE(ledger->logAttempt("alice", "gate").logged);
  now_ = start + seconds(299);
  EXPECT_FALSE(ledger->logAttempt("alice", "gate").logged);
  now_ = start + seconds(300);
  EXPECT_TRUE(ledger->logAttempt("alice", "gate").logged);
}

TEST_F(AttendanceLedgerTest, IdentitiesAreIndependent) {
  auto ledger = cooldownLedger();
  EXPECT_TRUE(ledger->logAttempt("alice", "gate").logged);
  EXPECT_TRUE(ledger->logAttempt("bob", "gate").logged);
  EXPECT_FALSE(ledger->logAttempt("alice", "door").logged);
}

TEST_F(AttendanceLedgerTest, CalendarPolicyLogsAgainAfterMidnight) {
  auto ledger = makeLedger(std::make_unique<CalendarBucketSessionPolicy>());
  now_ = at("2026-10-19T23:59:00Z");
  EXPECT_TRUE(ledger->logAttempt("alice", "gate").logged);

  now_ = at("2026-10-20T00:01:00Z");
  auto next = ledger->logAttempt("alice", "gate");
  EXPECT_TRUE(next.logged);
  EXPECT_EQ(next.sessionKey, "day-20261020");

  now_ = at("2026-10-20T17:00:00Z");
  EXPECT_FALSE(ledger->logAttempt("alice", "gate").logged);
}

TEST_F(AttendanceLedgerTest, CooldownPolicySuppressesAcrossMidnight) {
  auto ledger = cooldownLedger();
  now_ = at("2026-10-19T23:59:00Z");
  EXPECT_TRUE(ledger->logAttempt("alice", "gate").logged);

  now_ = at("2026-10-20T00:01:00Z");
  EXPECT_FALSE(ledger->logAttempt("alice", "gate").logged);
}

TEST_F(AttendanceLedgerTest, ConcurrentAttemptsLogExactlyOnce) {
  auto ledger = cooldownLedger();
  constexpr int kThreads = 16;
  std::atomic<int> logged{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&ledger, &logged]() {
      if (ledger->logAttempt("alice", "gate").logged) {
        logged.fetch_add(1);
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(logged.load(), 1);
  EXPECT_EQ(ledger->query(AttendanceFilter{}).toVector().size(), 1u);
}

TEST_F(AttendanceLedgerTest, EmptyIdentityIsRejected) {
  auto ledger = cooldownLedger();
  EXPECT_THROW(ledger->logAttempt("", "gate"), InvalidIdentityError);
  EXPECT_THROW(ledger->lastEvent(""), InvalidIdentityError);
}

TEST_F(AttendanceLedgerTest, QueryFiltersByIdentityAndInclusiveBounds) {
  auto ledger = cooldownLedger(0);
  now_ = at("2026-10-18T09:00:00Z");
  ledger->logAttempt("alice", "gate");
  now_ = at("2026-10-19T09:00:00Z");
  ledger->logAttempt("bob", "gate");
  now_ = at("2026-10-19T10:00:00Z");
  ledger->logAttempt("alice", "gate");
  now_ = at("2026-10-20T00:00:00Z");
  ledger->logAttempt("alice", "gate");

  auto onlyAlice =
      ledger->query(AttendanceFilter::fromStrings("alice", "", "")).toVector();
  ASSERT_EQ(onlyAlice.size(), 3u);
  EXPECT_EQ(onlyAlice.front().timestamp, "2026-10-18T09:00:00.000Z");
  EXPECT_EQ(onlyAlice.back().timestamp, "2026-10-20T00:00:00.000Z");

  auto oneDay = ledger
                    ->query(AttendanceFilter::fromStrings("", "2026-10-19",
                                                          "2026-10-19"))
                    .toVector();
  ASSERT_EQ(oneDay.size(), 2u);
  EXPECT_EQ(oneDay[0].identity, "bob");
  EXPECT_EQ(oneDay[1].identity, "alice");

  auto exactBounds =
      ledger
          ->query(AttendanceFilter::fromStrings(
              "", "2026-10-19T09:00:00Z", "2026-10-19T10:00:00Z"))
          .toVector();
  EXPECT_EQ(exactBounds.size(), 2u);
}

TEST_F(AttendanceLedgerTest, QueryRangeReflectsLaterWrites) {
  auto ledger = cooldownLedger(0);
  AttendanceRecordRange range = ledger->query(AttendanceFilter{});

  size_t count = 0;
  for (const auto &record : range) {
    (void)record;
    ++count;
  }
  EXPECT_EQ(count, 0u);

  ledger->logAttempt("alice", "gate");
  count = 0;
  for (auto it = range.begin(); it != range.end(); ++it) {
    EXPECT_EQ(it->identity, "alice");
    ++count;
  }
  EXPECT_EQ(count, 1u);
}

TEST_F(AttendanceLedgerTest, CorruptRecordsAreSkipped) {
  auto ledger = cooldownLedger();
  ledger->logAttempt("alice", "gate");
  store_.put("attendance/alice/garbage", Json::Value("not a record"));

  EXPECT_EQ(ledger->query(AttendanceFilter{}).toVector().size(), 1u);
}

TEST_F(AttendanceLedgerTest, LastEventReturnsMostRecentRecord) {
  auto ledger = cooldownLedger(0);
  EXPECT_FALSE(ledger->lastEvent("alice").has_value());

  ledger->logAttempt("alice", "gate");
  now_ += hours(1);
  ledger->logAttempt("alice", "door");

  auto last = ledger->lastEvent("alice");
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->source, "door");
  EXPECT_EQ(last->sessionKey, "seq-000000000002");
}

TEST_F(AttendanceLedgerTest, ExportWritesHeaderAndEscapedRows) {
  auto ledger = cooldownLedger();
  ledger->logAttempt("alice", "gate, north");

  std::ostringstream out;
  EXPECT_EQ(ledger->exportCsv(AttendanceFilter{}, out), 1u);
  EXPECT_EQ(out.str(),
            "timestamp,user_id,source,session_id\n"
            "2026-10-19T08:00:00.000Z,alice,\"gate, north\",seq-000000000001\n");
}

TEST(AttendanceFilterTest, RejectsMalformedOrInvertedBounds) {
  EXPECT_THROW(AttendanceFilter::fromStrings("", "not-a-date", ""), InputError);
  EXPECT_THROW(AttendanceFilter::fromStrings("", "", "2026-99-01"), InputError);
  EXPECT_THROW(AttendanceFilter::fromStrings("", "2026-10-20", "2026-10-19"),
               InputError);

  AttendanceFilter filter = AttendanceFilter::fromStrings("", "", "");
  EXPECT_FALSE(filter.identity.has_value());
  EXPECT_FALSE(filter.start.has_value());
  EXPECT_FALSE(filter.end.has_value());
}
