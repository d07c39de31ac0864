#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "xpcs/correlate/ICorrelator.hpp"
#include "xpcs/roi/RoiIndex.hpp"

namespace xpcs {

// Direct pairwise correlator on the multi-tau lag schedule.
//
// Keeps every frame (ROI pixels only). finalize() rebuilds the level series
// (level k = means of consecutive disjoint pairs of level k-1) and averages
// over all time origins for each tau slot. Memory grows with the number of
// frames; intended as a reference for the multi-tau engine.
class ExactCorrelator final : public ICorrelator {
public:
  struct Options {
    std::size_t num_levels = 7;
    std::size_t num_bufs = 8;
    double frame_period = 0.0;
  };

  ExactCorrelator(RoiIndex roi, Options opt);

  void push(const Frame& frame) override;
  CorrelationResult finalize() override;
  std::uint64_t frames_processed() const override { return static_cast<std::uint64_t>(history_.size()); }

  bool aborted() const { return aborted_; }

private:
  RoiIndex roi_;
  Options opt_;
  std::vector<std::vector<double>> history_;
  double push_seconds_ = 0.0;
  bool aborted_ = false;

  void require_live_() const;
};

} // namespace xpcs
