#include "upgate/quota/rate_limiter.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "upgate/util/format.hpp"

namespace upgate::quota {

namespace {

using TimePoint = std::chrono::system_clock::time_point;

}  // namespace

// Reservation

RateLimiter::Reservation::~Reservation() {
  release();
}

RateLimiter::Reservation::Reservation(Reservation&& other) noexcept
    : limiter_(other.limiter_), state_(std::move(other.state_)), entry_id_(other.entry_id_) {
  other.state_.reset();
}

RateLimiter::Reservation& RateLimiter::Reservation::operator=(Reservation&& other) noexcept {
  if (this != &other) {
    release();
    limiter_ = other.limiter_;
    state_ = std::move(other.state_);
    entry_id_ = other.entry_id_;
    other.state_.reset();
  }
  return *this;
}

core::UploadResult<void> RateLimiter::Reservation::commit(std::uintmax_t actual_size) {
  if (!state_) {
    return {};
  }
  {
    std::lock_guard lock(state_->mutex);
    auto it = std::find_if(state_->entries.begin(), state_->entries.end(),
                           [this](const Entry& e) { return e.id == entry_id_; });
    if (it != state_->entries.end()) {
      if (actual_size > it->size) {
        auto decision = limiter_->evaluateVolumeLocked(*state_, limiter_->clock_(), entry_id_,
                                                       actual_size);
        if (!decision.allowed) {
          return std::unexpected(core::UploadError::rateLimit(*decision.window, decision.reason));
        }
      }
      it->size = actual_size;
    }
  }
  state_.reset();
  return {};
}

void RateLimiter::Reservation::release() {
  if (!state_) {
    return;
  }
  {
    std::lock_guard lock(state_->mutex);
    auto it = std::find_if(state_->entries.begin(), state_->entries.end(),
                           [this](const Entry& e) { return e.id == entry_id_; });
    if (it != state_->entries.end()) {
      state_->entries.erase(it);
    }
  }
  state_.reset();
}

// RateLimiter

RateLimiter::RateLimiter(RateLimits limits, Clock clock)
    : limits_(limits), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

RateDecision RateLimiter::check(const std::string& identity, std::uintmax_t candidate_size) {
  auto state = stateFor(identity);
  auto now = clock_();

  std::lock_guard lock(state->mutex);
  pruneLocked(*state, now);
  return evaluateLocked(*state, now, candidate_size);
}

void RateLimiter::record(const std::string& identity, std::uintmax_t size) {
  auto state = stateFor(identity);
  auto now = clock_();

  std::lock_guard lock(state->mutex);
  appendLocked(*state, now, size);
}

core::UploadResult<RateLimiter::Reservation> RateLimiter::reserve(
    const std::string& identity, std::uintmax_t candidate_size) {
  auto state = stateFor(identity);
  auto now = clock_();

  std::uint64_t entry_id = 0;
  {
    std::lock_guard lock(state->mutex);
    pruneLocked(*state, now);
    auto decision = evaluateLocked(*state, now, candidate_size);
    if (!decision.allowed) {
      return std::unexpected(core::UploadError::rateLimit(*decision.window, decision.reason));
    }
    entry_id = appendLocked(*state, now, candidate_size);
  }

  return Reservation(this, std::move(state), entry_id);
}

UsageSnapshot RateLimiter::usage(const std::string& identity) const {
  auto state = findState(identity);
  if (!state) {
    return {};
  }
  auto now = clock_();

  std::lock_guard lock(state->mutex);
  return usageLocked(*state, now);
}

std::shared_ptr<RateLimiter::IdentityState> RateLimiter::stateFor(const std::string& identity) {
  if (auto existing = findState(identity)) {
    return existing;
  }

  std::unique_lock lock(map_mutex_);
  auto& slot = states_[identity];
  if (!slot) {
    slot = std::make_shared<IdentityState>();
  }
  return slot;
}

std::shared_ptr<RateLimiter::IdentityState> RateLimiter::findState(
    const std::string& identity) const {
  std::shared_lock lock(map_mutex_);
  auto it = states_.find(identity);
  if (it == states_.end()) {
    return nullptr;
  }
  return it->second;
}

void RateLimiter::pruneLocked(IdentityState& state, TimePoint now) const {
  if (now - state.last_prune < kPruneInterval) {
    return;
  }
  state.last_prune = now;

  auto cutoff = now - kRetention;
  size_t pruned = 0;
  while (!state.entries.empty() && state.entries.front().at <= cutoff) {
    state.entries.pop_front();
    ++pruned;
  }
  if (pruned > 0) {
    spdlog::debug("Pruned {} rate-limit entries", pruned);
  }
}

RateDecision RateLimiter::evaluateLocked(const IdentityState& state, TimePoint now,
                                         std::uintmax_t candidate_size) const {
  auto usage = usageLocked(state, now);
  RateDecision decision;

  auto reject = [&decision](core::RateWindow window, std::string reason) {
    decision.allowed = false;
    decision.window = window;
    decision.reason = std::move(reason);
    return decision;
  };

  if (usage.uploads_last_minute >= limits_.uploads_per_minute) {
    return reject(core::RateWindow::kMinute,
                  fmt::format("Rate limit exceeded: {} uploads per minute",
                              limits_.uploads_per_minute));
  }
  if (usage.uploads_last_hour >= limits_.uploads_per_hour) {
    return reject(core::RateWindow::kHour,
                  fmt::format("Rate limit exceeded: {} uploads per hour",
                              limits_.uploads_per_hour));
  }
  if (usage.uploads_last_day >= limits_.uploads_per_day) {
    return reject(core::RateWindow::kDay,
                  fmt::format("Rate limit exceeded: {} uploads per day",
                              limits_.uploads_per_day));
  }
  return volumeDecision(usage.bytes_last_hour, usage.bytes_last_day, candidate_size);
}

RateDecision RateLimiter::evaluateVolumeLocked(const IdentityState& state, TimePoint now,
                                               std::uint64_t excluded_id,
                                               std::uintmax_t candidate_size) const {
  auto hour_ago = now - std::chrono::hours(1);
  auto day_ago = now - std::chrono::hours(24);

  std::uintmax_t bytes_last_hour = 0;
  std::uintmax_t bytes_last_day = 0;
  for (const auto& entry : state.entries) {
    if (entry.id == excluded_id || entry.at <= day_ago) {
      continue;
    }
    bytes_last_day += entry.size;
    if (entry.at > hour_ago) {
      bytes_last_hour += entry.size;
    }
  }
  return volumeDecision(bytes_last_hour, bytes_last_day, candidate_size);
}

RateDecision RateLimiter::volumeDecision(std::uintmax_t bytes_last_hour,
                                         std::uintmax_t bytes_last_day,
                                         std::uintmax_t candidate_size) const {
  RateDecision decision;
  if (bytes_last_hour + candidate_size > limits_.total_size_per_hour) {
    decision.allowed = false;
    decision.window = core::RateWindow::kBytesPerHour;
    decision.reason = "Upload volume limit exceeded: " +
                      util::formatMegabytes(limits_.total_size_per_hour) + " per hour";
  } else if (bytes_last_day + candidate_size > limits_.total_size_per_day) {
    decision.allowed = false;
    decision.window = core::RateWindow::kBytesPerDay;
    decision.reason = "Upload volume limit exceeded: " +
                      util::formatMegabytes(limits_.total_size_per_day) + " per day";
  }
  return decision;
}

UsageSnapshot RateLimiter::usageLocked(const IdentityState& state, TimePoint now) const {
  UsageSnapshot usage;
  auto minute_ago = now - std::chrono::minutes(1);
  auto hour_ago = now - std::chrono::hours(1);
  auto day_ago = now - std::chrono::hours(24);

  for (const auto& entry : state.entries) {
    if (entry.at <= day_ago) {
      continue;
    }
    ++usage.uploads_last_day;
    usage.bytes_last_day += entry.size;
    if (entry.at > hour_ago) {
      ++usage.uploads_last_hour;
      usage.bytes_last_hour += entry.size;
    }
    if (entry.at > minute_ago) {
      ++usage.uploads_last_minute;
    }
  }
  return usage;
}

std::uint64_t RateLimiter::appendLocked(IdentityState& state, TimePoint now,
                                        std::uintmax_t size) {
  std::uint64_t id = state.next_id++;
  // Keep the sequence ordered even if the clock steps back
  if (!state.entries.empty() && now < state.entries.back().at) {
    now = state.entries.back().at;
  }
  state.entries.push_back(Entry{now, size, id});
  return id;
}

}  // namespace upgate::quota
