#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "xpcs/correlate/LevelRing.hpp"
#include "xpcs/roi/RoiIndex.hpp"

namespace xpcs {

// Running multi-tau averages, one row per tau slot (level*num_bufs/2 + offset)
// and one column per ROI:
//   G   = <I(t) I(t+tau)>
//   IAP = <I(t)>        (past)
//   IAF = <I(t+tau)>    (future)
// Each update folds in one new time origin with acc += (x - acc) / n, so the
// accumulators always hold plain means over the origins seen so far.
class LevelAccumulator {
public:
  LevelAccumulator() = default;
  LevelAccumulator(std::size_t num_levels, std::size_t num_bufs, std::size_t num_rois);

  std::size_t num_levels() const { return num_levels_; }
  std::size_t num_bufs() const { return num_bufs_; }
  std::size_t num_rois() const { return num_rois_; }
  std::size_t num_slots() const { return counts_.size(); }

  // Fold in the value just written at `ring.cursor()` of level `level`,
  // correlated with every partner still held by the ring.
  void accumulate(std::size_t level, const LevelRing& ring, const RoiIndex& roi);

  double g(std::size_t slot, std::size_t r) const { return g_[slot * num_rois_ + r]; }
  double past(std::size_t slot, std::size_t r) const { return iap_[slot * num_rois_ + r]; }
  double future(std::size_t slot, std::size_t r) const { return iaf_[slot * num_rois_ + r]; }
  // Number of time origins folded into `slot`.
  std::uint64_t count(std::size_t slot) const { return counts_[slot]; }

  // Number of leading slots with at least one update.
  std::size_t populated_slots() const;

  bool pristine() const;

  std::vector<double>& raw_g() { return g_; }
  std::vector<double>& raw_past() { return iap_; }
  std::vector<double>& raw_future() { return iaf_; }
  std::vector<std::uint64_t>& raw_counts() { return counts_; }
  const std::vector<double>& raw_g() const { return g_; }
  const std::vector<double>& raw_past() const { return iap_; }
  const std::vector<double>& raw_future() const { return iaf_; }
  const std::vector<std::uint64_t>& raw_counts() const { return counts_; }

private:
  std::size_t num_levels_ = 0;
  std::size_t num_bufs_ = 0;
  std::size_t num_rois_ = 0;

  std::vector<double> g_;
  std::vector<double> iap_;
  std::vector<double> iaf_;
  std::vector<std::uint64_t> counts_;
};

} // namespace xpcs
