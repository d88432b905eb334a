#pragma once

#include <mutex>

#include "parkinglot/types.hpp"

namespace parkinglot {

/**
 * @brief Source of entry/exit timestamps.
 */
class Clock {
public:
  virtual ~Clock() = default;
  virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
  Timestamp now() const override { return std::chrono::system_clock::now(); }
};

/**
 * @brief Clock that only moves when told to.
 */
class ManualClock : public Clock {
public:
  explicit ManualClock(Timestamp start = Timestamp{}) : now_(start) {}

  Timestamp now() const override {
    std::lock_guard<std::mutex> lock(mtx_);
    return now_;
  }

  void set(Timestamp t) {
    std::lock_guard<std::mutex> lock(mtx_);
    now_ = t;
  }

  template<typename Rep, typename Period>
  void advance(std::chrono::duration<Rep, Period> d) {
    std::lock_guard<std::mutex> lock(mtx_);
    now_ += std::chrono::duration_cast<Timestamp::duration>(d);
  }

private:
  mutable std::mutex mtx_;
  Timestamp now_;
};

} // namespace parkinglot
