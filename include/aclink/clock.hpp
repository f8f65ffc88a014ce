#pragma once
/**
 * @file clock.hpp
 * @brief Time source for header timestamps and transit telemetry.
 *
 * Seconds as float64, matching the header's sent_at field. Tests inject a
 * fixed clock; production uses wall time so both ends of the link agree.
 */

#include <chrono>

namespace aclink {

class IClock {
public:
  virtual ~IClock() = default;
  virtual double now() const = 0;
};

/// Wall clock, seconds since the Unix epoch.
class SystemClock : public IClock {
public:
  double now() const override {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
  }
};

/// Returns whatever was last set. Used by the CLI (--now) and tests.
class FixedClock : public IClock {
public:
  explicit FixedClock(double t = 0.0) : t_(t) {}
  double now() const override { return t_; }
  void set(double t) { t_ = t; }
  void advance(double dt) { t_ += dt; }
private:
  double t_;
};

} // namespace aclink
