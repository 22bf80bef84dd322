#pragma once

#include <chrono>

namespace docrep {

using TimePoint = std::chrono::system_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

// Time source used for TTLs, retry gates and record timestamps
class Clock {
public:
  virtual ~Clock() = default;
  virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
  TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// Milliseconds since the epoch, used in generated file names
inline long long to_epoch_ms(TimePoint tp) {
  return std::chrono::duration_cast<Milliseconds>(tp.time_since_epoch()).count();
}

} // namespace docrep
