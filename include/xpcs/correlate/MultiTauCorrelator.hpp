#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

#include "xpcs/correlate/ICorrelator.hpp"
#include "xpcs/correlate/LevelAccumulator.hpp"
#include "xpcs/correlate/LevelRing.hpp"
#include "xpcs/roi/RoiIndex.hpp"

namespace xpcs {

// Multi-tau one-time correlator.
//
// Level 0 stores the last num_bufs frames (ROI pixels only). Every second
// value arriving at level k-1 produces one value at level k, the mean of that
// pair, so level k samples the stream at 2^k frames. After each write the
// level's new value is correlated with all partners it still holds; levels
// above 0 only contribute offsets num_bufs/2 .. num_bufs-1.
class MultiTauCorrelator final : public ICorrelator {
public:
  struct Options {
    std::size_t num_levels = 7;
    std::size_t num_bufs = 8;   // even, >= 2
    double frame_period = 0.0;  // seconds per frame; 0 = lags in frames only
  };

  // Throws InvalidConfig for bad options (before any state is allocated).
  MultiTauCorrelator(RoiIndex roi, Options opt);

  void push(const Frame& frame) override;
  CorrelationResult finalize() override;
  std::uint64_t frames_processed() const override { return frames_; }

  void save_state(std::ostream& os) const override;
  void load_state(std::istream& is) override;

  const Options& options() const { return opt_; }
  const RoiIndex& roi() const { return roi_; }
  const LevelRing& level(std::size_t k) const { return levels_.at(k); }
  const LevelAccumulator& accumulators() const { return acc_; }
  bool aborted() const { return aborted_; }

private:
  RoiIndex roi_;
  Options opt_;
  std::vector<LevelRing> levels_;
  LevelAccumulator acc_;
  std::uint64_t frames_ = 0;
  double push_seconds_ = 0.0;
  bool aborted_ = false;

  void propagate_();
  void require_live_() const;
};

} // namespace xpcs
