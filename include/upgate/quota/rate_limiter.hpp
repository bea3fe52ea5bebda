#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "upgate/core/upload_error.hpp"

namespace upgate::quota {

constexpr std::uintmax_t kMiB = 1024 * 1024;

// Upload ceilings per identity
struct RateLimits {
  size_t uploads_per_minute = 10;
  size_t uploads_per_hour = 50;
  size_t uploads_per_day = 200;
  std::uintmax_t total_size_per_hour = 100 * kMiB;
  std::uintmax_t total_size_per_day = 500 * kMiB;
};

struct RateDecision {
  bool allowed = true;
  std::string reason;
  std::optional<core::RateWindow> window;  // Set when rejected
};

struct UsageSnapshot {
  size_t uploads_last_minute = 0;
  size_t uploads_last_hour = 0;
  size_t uploads_last_day = 0;
  std::uintmax_t bytes_last_hour = 0;
  std::uintmax_t bytes_last_day = 0;
};

using Clock = std::function<std::chrono::system_clock::time_point()>;

/**
 * @brief Sliding-window upload admission per identity
 *
 * State lives in memory for the lifetime of the limiter. Each identity has its
 * own mutex; the map lock only guards identity lookup and insertion, so two
 * identities never contend on each other's windows.
 *
 * Entries older than 24 hours are pruned lazily, at most once every 5 minutes
 * per identity.
 */
class RateLimiter {
 private:
  struct IdentityState;

 public:
  /**
   * @brief Provisional admission
   *
   * Holds an entry recorded at reserve() time. commit() replaces the reserved
   * size with the measured one; a reservation destroyed without commit removes
   * its entry again. Must not outlive the limiter that issued it.
   */
  class Reservation {
   public:
    ~Reservation();

    Reservation(const Reservation&) = delete;
    Reservation& operator=(const Reservation&) = delete;
    Reservation(Reservation&& other) noexcept;
    Reservation& operator=(Reservation&& other) noexcept;

    // A measured size above the reserved one is checked against the byte
    // windows again; on rejection the reservation stays active.
    core::UploadResult<void> commit(std::uintmax_t actual_size);

    // Drop the entry now instead of at destruction
    void release();

    bool active() const { return state_ != nullptr; }

   private:
    friend class RateLimiter;
    Reservation(const RateLimiter* limiter, std::shared_ptr<IdentityState> state,
                std::uint64_t entry_id)
        : limiter_(limiter), state_(std::move(state)), entry_id_(entry_id) {}

    const RateLimiter* limiter_ = nullptr;
    std::shared_ptr<IdentityState> state_;
    std::uint64_t entry_id_ = 0;
  };

  explicit RateLimiter(RateLimits limits = {}, Clock clock = {});

  // Would an upload of candidate_size bytes be admitted now
  RateDecision check(const std::string& identity, std::uintmax_t candidate_size);

  // Count a completed upload
  void record(const std::string& identity, std::uintmax_t size);

  // Check and record under one lock
  core::UploadResult<Reservation> reserve(const std::string& identity,
                                          std::uintmax_t candidate_size);

  UsageSnapshot usage(const std::string& identity) const;

  const RateLimits& limits() const { return limits_; }

  static constexpr std::chrono::hours kRetention{24};
  static constexpr std::chrono::minutes kPruneInterval{5};

 private:
  struct Entry {
    std::chrono::system_clock::time_point at;
    std::uintmax_t size = 0;
    std::uint64_t id = 0;
  };

  struct IdentityState {
    std::mutex mutex;
    std::deque<Entry> entries;  // Ordered by time
    std::chrono::system_clock::time_point last_prune{};
    std::uint64_t next_id = 1;
  };

  std::shared_ptr<IdentityState> stateFor(const std::string& identity);
  std::shared_ptr<IdentityState> findState(const std::string& identity) const;

  // Caller holds state.mutex
  void pruneLocked(IdentityState& state, std::chrono::system_clock::time_point now) const;
  RateDecision evaluateLocked(const IdentityState& state, std::chrono::system_clock::time_point now,
                              std::uintmax_t candidate_size) const;
  // Byte windows only, with the entry excluded_id left out of the sums
  RateDecision evaluateVolumeLocked(const IdentityState& state,
                                    std::chrono::system_clock::time_point now,
                                    std::uint64_t excluded_id, std::uintmax_t candidate_size) const;
  RateDecision volumeDecision(std::uintmax_t bytes_last_hour, std::uintmax_t bytes_last_day,
                              std::uintmax_t candidate_size) const;
  UsageSnapshot usageLocked(const IdentityState& state,
                            std::chrono::system_clock::time_point now) const;
  std::uint64_t appendLocked(IdentityState& state, std::chrono::system_clock::time_point now,
                             std::uintmax_t size);

  RateLimits limits_;
  Clock clock_;

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<std::string, std::shared_ptr<IdentityState>> states_;
};

}  // namespace upgate::quota
