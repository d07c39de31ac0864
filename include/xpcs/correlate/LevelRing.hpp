#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

#if XPCS_HAS_OPENMP
#include <omp.h>
#endif

namespace xpcs {

// Fixed-capacity history of one multi-tau level: `capacity` slots of
// `width` pixel values, overwritten cyclically.
//
// cursor() is the slot written last; peek(i) is the value written i arrivals
// ago. `awaiting_pair` is owned by the level above's pairing logic: it is set
// when this level has received the first half of a pair from the level below.
class LevelRing {
public:
  LevelRing() = default;

  LevelRing(std::size_t capacity, std::size_t width)
  : capacity_(capacity), width_(width), slots_(capacity, std::vector<double>(width, 0.0)), cursor_(capacity - 1) {
    if (capacity_ == 0) throw std::runtime_error("LevelRing: capacity must be > 0");
  }

  std::size_t capacity() const { return capacity_; }
  std::size_t width() const { return width_; }
  std::size_t cursor() const { return cursor_; }
  std::uint64_t arrivals() const { return arrivals_; }

  bool awaiting_pair() const { return awaiting_pair_; }
  void set_awaiting_pair(bool v) { awaiting_pair_ = v; }

  std::span<const double> slot(std::size_t s) const { return {slots_[s].data(), width_}; }

  // Slot index written `offset` arrivals before the latest one.
  std::size_t slot_at(std::size_t offset) const {
    return (cursor_ + capacity_ - (offset % capacity_)) % capacity_;
  }

  std::span<const double> peek(std::size_t offset) const { return slot(slot_at(offset)); }

  // Advance the cursor and return the slot to overwrite. The caller must fill
  // it completely before the next accumulate.
  std::span<double> advance() {
    cursor_ = (cursor_ + 1) % capacity_;
    arrivals_ += 1;
    return {slots_[cursor_].data(), width_};
  }

  void push(std::span<const double> values) {
    if (values.size() != width_) throw std::runtime_error("LevelRing: pushed vector width does not match");
    std::span<double> dst = advance();
    for (std::size_t p = 0; p < width_; ++p) dst[p] = values[p];
  }

  // Push the elementwise mean of the two latest values of `below`.
  void push_pair_mean(const LevelRing& below) {
    if (below.width_ != width_) throw std::runtime_error("LevelRing: level widths differ");
    if (below.arrivals_ < 2) throw std::runtime_error("LevelRing: pair mean needs two values below");
    const std::span<const double> a = below.peek(1);
    const std::span<const double> b = below.peek(0);
    std::span<double> dst = advance();
    const std::size_t n = width_;
#if XPCS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::size_t p = 0; p < n; ++p) {
      dst[p] = 0.5 * (a[p] + b[p]);
    }
  }

  // Raw state access for checkpointing.
  std::vector<std::vector<double>>& raw_slots() { return slots_; }
  const std::vector<std::vector<double>>& raw_slots() const { return slots_; }
  void restore_counters(std::size_t cursor, std::uint64_t arrivals, bool awaiting_pair) {
    if (cursor >= capacity_) throw std::runtime_error("LevelRing: cursor out of range");
    cursor_ = cursor;
    arrivals_ = arrivals;
    awaiting_pair_ = awaiting_pair;
  }

private:
  std::size_t capacity_ = 0;
  std::size_t width_ = 0;
  std::vector<std::vector<double>> slots_;
  std::size_t cursor_ = 0;
  std::uint64_t arrivals_ = 0;
  bool awaiting_pair_ = false;
};

} // namespace xpcs
