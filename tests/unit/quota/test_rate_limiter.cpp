#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "upgate/quota/rate_limiter.hpp"
#include "test_helpers.hpp"

using namespace upgate::quota;
using namespace upgate::test;
using upgate::core::RateWindow;
using upgate::core::UploadErrorKind;

class RateLimiterTest : public ::testing::Test {
 protected:
  ManualClock clock_;
  RateLimiter limiter_{RateLimits{}, clock_.source()};
};

TEST_F(RateLimiterTest, TenUploadsPerMinute) {
  for (int i = 0; i < 10; ++i) {
    auto decision = limiter_.check("alice", 1024);
    ASSERT_TRUE(decision.allowed) << "upload " << i << ": " << decision.reason;
    limiter_.record("alice", 1024);
    clock_.advance(std::chrono::seconds(1));
  }

  auto decision = limiter_.check("alice", 1024);
  EXPECT_FALSE(decision.allowed);
  ASSERT_TRUE(decision.window.has_value());
  EXPECT_EQ(*decision.window, RateWindow::kMinute);
  EXPECT_NE(decision.reason.find("per minute"), std::string::npos);
}

TEST_F(RateLimiterTest, MinuteWindowSlides) {
  for (int i = 0; i < 10; ++i) {
    limiter_.record("alice", 10);
  }
  EXPECT_FALSE(limiter_.check("alice", 10).allowed);

  clock_.advance(std::chrono::seconds(61));
  EXPECT_TRUE(limiter_.check("alice", 10).allowed);
}

TEST_F(RateLimiterTest, IdentitiesAreIndependent) {
  for (int i = 0; i < 10; ++i) {
    limiter_.record("alice", 10);
  }
  EXPECT_FALSE(limiter_.check("alice", 10).allowed);
  EXPECT_TRUE(limiter_.check("bob", 10).allowed);
}

TEST_F(RateLimiterTest, HourlyCountLimit) {
  for (int i = 0; i < 50; ++i) {
    limiter_.record("alice", 10);
    clock_.advance(std::chrono::seconds(30));
  }

  auto decision = limiter_.check("alice", 10);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.window, RateWindow::kHour);
}

TEST_F(RateLimiterTest, DailyCountLimit) {
  for (int i = 0; i < 200; ++i) {
    limiter_.record("alice", 10);
    clock_.advance(std::chrono::minutes(7));
  }

  auto decision = limiter_.check("alice", 10);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.window, RateWindow::kDay);
}

TEST_F(RateLimiterTest, HourlyVolumeNeverExceeded) {
  const auto limit = limiter_.limits().total_size_per_hour;
  const std::uintmax_t size = 9 * kMiB;
  std::uintmax_t admitted = 0;

  for (int i = 0; i < 20; ++i) {
    auto reservation = limiter_.reserve("alice", size);
    if (reservation.has_value()) {
      EXPECT_OK(reservation->commit(size));
      admitted += size;
    } else {
      EXPECT_EQ(reservation.error().kind(), UploadErrorKind::kRateLimit);
    }
    clock_.advance(std::chrono::minutes(2));
  }

  EXPECT_LE(admitted, limit);
  EXPECT_LE(limiter_.usage("alice").bytes_last_hour, limit);
}

TEST_F(RateLimiterTest, VolumeRejectsCandidateThatWouldOverflow) {
  limiter_.record("alice", 95 * kMiB);
  clock_.advance(std::chrono::minutes(1));

  auto decision = limiter_.check("alice", 6 * kMiB);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.window, RateWindow::kBytesPerHour);

  EXPECT_TRUE(limiter_.check("alice", 5 * kMiB).allowed);
}

TEST_F(RateLimiterTest, DailyVolume) {
  for (int i = 0; i < 5; ++i) {
    limiter_.record("alice", 100 * kMiB);
    clock_.advance(std::chrono::hours(2));
  }

  auto decision = limiter_.check("alice", 1);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.window, RateWindow::kBytesPerDay);
}

TEST_F(RateLimiterTest, UsageSnapshot) {
  limiter_.record("alice", 100);
  clock_.advance(std::chrono::minutes(30));
  limiter_.record("alice", 200);

  auto usage = limiter_.usage("alice");
  EXPECT_EQ(usage.uploads_last_minute, 1u);
  EXPECT_EQ(usage.uploads_last_hour, 2u);
  EXPECT_EQ(usage.uploads_last_day, 2u);
  EXPECT_EQ(usage.bytes_last_hour, 300u);

  auto unknown = limiter_.usage("nobody");
  EXPECT_EQ(unknown.uploads_last_day, 0u);
}

TEST_F(RateLimiterTest, OldEntriesArePruned) {
  limiter_.record("alice", 100);
  clock_.advance(std::chrono::hours(25));

  EXPECT_TRUE(limiter_.check("alice", 100).allowed);
  EXPECT_EQ(limiter_.usage("alice").uploads_last_day, 0u);
}

TEST_F(RateLimiterTest, ReservationCommitReplacesSize) {
  {
    auto reservation = limiter_.reserve("alice", 10 * kMiB);
    ASSERT_OK(reservation);
    EXPECT_EQ(limiter_.usage("alice").bytes_last_hour, 10 * kMiB);
    EXPECT_OK(reservation->commit(1024));
  }

  auto usage = limiter_.usage("alice");
  EXPECT_EQ(usage.uploads_last_minute, 1u);
  EXPECT_EQ(usage.bytes_last_hour, 1024u);
}

TEST_F(RateLimiterTest, UncommittedReservationRollsBack) {
  {
    auto reservation = limiter_.reserve("alice", 10 * kMiB);
    ASSERT_OK(reservation);
    EXPECT_EQ(limiter_.usage("alice").uploads_last_minute, 1u);
  }

  auto usage = limiter_.usage("alice");
  EXPECT_EQ(usage.uploads_last_minute, 0u);
  EXPECT_EQ(usage.bytes_last_hour, 0u);
}

TEST_F(RateLimiterTest, ReservationRejectionNamesWindow) {
  for (int i = 0; i < 10; ++i) {
    limiter_.record("alice", 1);
  }

  auto reservation = limiter_.reserve("alice", 1);
  ASSERT_FALSE(reservation.has_value());
  EXPECT_EQ(reservation.error().kind(), UploadErrorKind::kRateLimit);
  EXPECT_EQ(reservation.error().window(), RateWindow::kMinute);
}

TEST_F(RateLimiterTest, MovedReservationCommitsOnce) {
  auto first = limiter_.reserve("alice", 500);
  ASSERT_OK(first);

  auto moved = std::move(*first);
  EXPECT_FALSE(first->active());
  EXPECT_TRUE(moved.active());

  EXPECT_OK(moved.commit(250));
  EXPECT_FALSE(moved.active());
  EXPECT_EQ(limiter_.usage("alice").bytes_last_hour, 250u);
}

TEST_F(RateLimiterTest, CommitAboveReservedSizeIsCheckedAgain) {
  RateLimiter limiter(RateLimits{10, 50, 200, 1000, 5000}, clock_.source());
  limiter.record("alice", 600);

  auto reservation = limiter.reserve("alice", 10);
  ASSERT_OK(reservation);

  auto committed = reservation->commit(500);
  ASSERT_FALSE(committed.has_value());
  EXPECT_EQ(committed.error().kind(), UploadErrorKind::kRateLimit);
  EXPECT_EQ(committed.error().window(), RateWindow::kBytesPerHour);
  EXPECT_NE(committed.error().message().find("1000 bytes per hour"), std::string::npos);

  // Rejected commit keeps the reservation; releasing it restores the old usage
  EXPECT_TRUE(reservation->active());
  reservation->release();
  EXPECT_EQ(limiter.usage("alice").bytes_last_hour, 600u);
  EXPECT_EQ(limiter.usage("alice").uploads_last_hour, 1u);
}

TEST_F(RateLimiterTest, CommitWithinVolumeSucceeds) {
  RateLimiter limiter(RateLimits{10, 50, 200, 1000, 5000}, clock_.source());
  limiter.record("alice", 600);

  auto reservation = limiter.reserve("alice", 10);
  ASSERT_OK(reservation);
  EXPECT_OK(reservation->commit(400));
  EXPECT_FALSE(reservation->active());
  EXPECT_EQ(limiter.usage("alice").bytes_last_hour, 1000u);
}

TEST_F(RateLimiterTest, CommitRechecksDailyVolume) {
  RateLimiter limiter(RateLimits{10, 50, 200, 1000, 1500}, clock_.source());
  limiter.record("alice", 900);
  clock_.advance(std::chrono::hours(2));

  auto reservation = limiter.reserve("alice", 10);
  ASSERT_OK(reservation);

  auto committed = reservation->commit(700);
  ASSERT_FALSE(committed.has_value());
  EXPECT_EQ(committed.error().window(), RateWindow::kBytesPerDay);
}

TEST(RateLimiterConcurrencyTest, ConcurrentReservationsRespectMinuteLimit) {
  ManualClock clock;
  RateLimiter limiter(RateLimits{}, clock.source());

  std::atomic<int> admitted{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&limiter, &admitted] {
      for (int i = 0; i < 10; ++i) {
        auto reservation = limiter.reserve("shared", 1);
        if (reservation.has_value()) {
          if (reservation->commit(1).has_value()) {
            ++admitted;
          }
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(admitted.load(), 10);
}
