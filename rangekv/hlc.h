#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

#include "rkv/v1alpha1/data.pb.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::hlc {

////////////////////////////////////////////////////////////////////////

using rkv::v1alpha1::Timestamp;

////////////////////////////////////////////////////////////////////////

inline Timestamp MakeTimestamp(int64_t wall_time, int32_t logical = 0) {
  Timestamp timestamp;
  timestamp.set_wall_time(wall_time);
  timestamp.set_logical(logical);
  return timestamp;
}

inline bool Less(const Timestamp& lhs, const Timestamp& rhs) {
  return lhs.wall_time() < rhs.wall_time()
      || (lhs.wall_time() == rhs.wall_time()
          && lhs.logical() < rhs.logical());
}

inline bool Equal(const Timestamp& lhs, const Timestamp& rhs) {
  return lhs.wall_time() == rhs.wall_time()
      && lhs.logical() == rhs.logical();
}

inline const Timestamp& Max(const Timestamp& lhs, const Timestamp& rhs) {
  return Less(lhs, rhs) ? rhs : lhs;
}

// Returns the smallest timestamp that is greater than 'timestamp'.
inline Timestamp Next(const Timestamp& timestamp) {
  return MakeTimestamp(timestamp.wall_time(), timestamp.logical() + 1);
}

inline bool IsZero(const Timestamp& timestamp) {
  return timestamp.wall_time() == 0 && timestamp.logical() == 0;
}

std::string ToString(const Timestamp& timestamp);

////////////////////////////////////////////////////////////////////////

// Returns nanoseconds since the Unix epoch.
int64_t UnixNanos();

////////////////////////////////////////////////////////////////////////

// Hybrid logical clock. Every timestamp returned from 'Now()' is
// strictly greater than any timestamp previously returned or passed
// to 'Update()', even if the physical clock goes backwards.
class Clock final {
 public:
  using PhysicalClock = std::function<int64_t()>;

  explicit Clock(PhysicalClock physical_clock = UnixNanos)
    : physical_clock_(std::move(physical_clock)) {}

  Clock(const Clock&) = delete;
  Clock& operator=(const Clock&) = delete;

  Timestamp Now();

  // Folds a timestamp observed from some other node into this clock
  // and returns a timestamp greater than both.
  Timestamp Update(const Timestamp& remote);

  // Returns the physical clock reading without affecting the state of
  // the clock.
  int64_t PhysicalNow() const {
    return physical_clock_();
  }

 private:
  std::mutex mutex_;
  PhysicalClock physical_clock_;
  Timestamp state_;
};

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::hlc

////////////////////////////////////////////////////////////////////////
