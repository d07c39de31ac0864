#pragma once

#include <chrono>

namespace xpcs::util {

class WallTimer {
public:
  using clock = std::chrono::steady_clock;

  WallTimer() : t0_(clock::now()) {}

  double seconds() const {
    return std::chrono::duration<double>(clock::now() - t0_).count();
  }

private:
  clock::time_point t0_;
};

// Adds the lifetime of the scope to *sink (no-op for nullptr).
class ScopedTimer {
public:
  explicit ScopedTimer(double* sink) : sink_(sink) {}
  ~ScopedTimer() {
    if (sink_) *sink_ += timer_.seconds();
  }

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
  double* sink_ = nullptr;
  WallTimer timer_;
};

} // namespace xpcs::util
