#include "rangekv/hlc.h"

#include <algorithm>
#include <chrono>

#include "fmt/format.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::hlc {

////////////////////////////////////////////////////////////////////////

std::string ToString(const Timestamp& timestamp) {
  return fmt::format("{}.{:09d},{}",
      timestamp.wall_time() / 1000000000,
      timestamp.wall_time() % 1000000000,
      timestamp.logical());
}

////////////////////////////////////////////////////////////////////////

int64_t UnixNanos() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

////////////////////////////////////////////////////////////////////////

Timestamp Clock::Now() {
  std::unique_lock lock(mutex_);

  int64_t physical = physical_clock_();

  if (state_.wall_time() >= physical) {
    state_.set_logical(state_.logical() + 1);
  } else {
    state_.set_wall_time(physical);
    state_.set_logical(0);
  }

  return state_;
}

////////////////////////////////////////////////////////////////////////

Timestamp Clock::Update(const Timestamp& remote) {
  std::unique_lock lock(mutex_);

  int64_t physical = physical_clock_();

  if (physical > state_.wall_time() && physical > remote.wall_time()) {
    // Physical time is ahead of everything we've seen, just use it.
    state_.set_wall_time(physical);
    state_.set_logical(0);
  } else if (remote.wall_time() > state_.wall_time()) {
    state_.set_wall_time(remote.wall_time());
    state_.set_logical(remote.logical() + 1);
  } else if (state_.wall_time() > remote.wall_time()) {
    state_.set_logical(state_.logical() + 1);
  } else {
    // Same wall time, take the larger logical component.
    state_.set_logical(std::max(state_.logical(), remote.logical()) + 1);
  }

  return state_;
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::hlc

////////////////////////////////////////////////////////////////////////
