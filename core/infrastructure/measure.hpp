#ifndef CORE_INFRASTRUCTURE_MEASURE_HPP
#define CORE_INFRASTRUCTURE_MEASURE_HPP

#include "concepts.hpp"
#include <chrono>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <string>

namespace core::measure {

// Per-owner stopwatch. Instances are not shared between threads, so
// concurrent deployment runs each keep their own.
class Stopwatch {
public:
  Stopwatch() : start_(Clock::now()), lap_(start_) {}

  template <IsChronable T> T elapsed() const {
    return std::chrono::duration_cast<T>(Clock::now() - start_);
  }

  // Returns the time since the previous lap (or construction) and starts a
  // new lap.
  template <IsChronable T> T lap() {
    auto now = Clock::now();
    auto dur = std::chrono::duration_cast<T>(now - lap_);
    lap_ = now;
    return dur;
  }

  template <IsChronable T>
  T lap_and_log(const std::string &message = "lap: {}") {
    auto dur = lap<T>();
    spdlog::debug(fmt::runtime(message), dur.count());
    return dur;
  }

private:
  using Clock = std::chrono::steady_clock;
  using TimePoint = std::chrono::time_point<Clock>;

  TimePoint start_;
  TimePoint lap_;
};

} // namespace core::measure

#endif // CORE_INFRASTRUCTURE_MEASURE_HPP
