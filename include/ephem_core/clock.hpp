#pragma once

#include <chrono>

namespace ephem_core {

// Time source for every timestamp in the core. Tests swap in a manual clock
// so TTL and quota windows can be advanced without sleeping.
class Clock {
 public:
  using time_point = std::chrono::system_clock::time_point;

  virtual ~Clock() = default;
  virtual time_point now() const = 0;
};

class SystemClock : public Clock {
 public:
  time_point now() const override {
    return std::chrono::system_clock::now();
  }
};

// Epoch milliseconds, the representation used on the wire
inline long long to_epoch_ms(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace ephem_core
