#include "xpcs/correlate/AutoCorr.hpp"

#include <string>
#include <utility>

#include "xpcs/core/Errors.hpp"
#include "xpcs/correlate/LagSchedule.hpp"
#include "xpcs/correlate/MultiTauCorrelator.hpp"

namespace xpcs {

CorrelationResult auto_corr(std::size_t num_levels,
                            std::size_t num_bufs,
                            const LabelImage& labels,
                            std::span<const Frame> frames,
                            const MaskImage* mask,
                            RoiNumbering numbering,
                            ProgressObserver observer) {
  validate_multi_tau(num_levels, num_bufs);

  RoiIndex roi = RoiIndex::build(labels, mask, numbering);
  for (std::size_t n = 0; n < frames.size(); ++n) {
    try {
      roi.check_frame(frames[n]);
    } catch (const ShapeMismatch& e) {
      throw ShapeMismatch("auto_corr: frame " + std::to_string(n) + ": " + e.what());
    }
  }

  MultiTauCorrelator::Options opt;
  opt.num_levels = num_levels;
  opt.num_bufs = num_bufs;
  MultiTauCorrelator corr(std::move(roi), opt);
  corr.set_observer(std::move(observer));
  for (const Frame& f : frames) corr.push(f);
  return corr.finalize();
}

} // namespace xpcs
