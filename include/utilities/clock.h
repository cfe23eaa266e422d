#pragma once
#include <chrono>
#include <cstdint>

/**
 * @file clock.h
 * @brief Wall-clock source for lastAccessed timestamps.
 */

namespace mailcas {

using SystemClockType = std::chrono::system_clock;

/**
 * @brief Millisecond wall clock. Injected so tests can control time.
 */
class Clock {
public:
  virtual ~Clock() = default;
  /** Milliseconds since the Unix epoch. */
  virtual int64_t nowMillis() const = 0;
};

class SystemClock : public Clock {
public:
  int64_t nowMillis() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               SystemClockType::now().time_since_epoch())
        .count();
  }
};

} // namespace mailcas
