#pragma once

#include <cstddef>
#include <span>

#include "xpcs/core/Image.hpp"
#include "xpcs/correlate/CorrelationResult.hpp"
#include "xpcs/correlate/ICorrelator.hpp"
#include "xpcs/roi/RoiIndex.hpp"

namespace xpcs {

// One-shot multi-tau one-time correlation of a complete frame stack.
//
// Validates num_levels/num_bufs (InvalidConfig), the ROI labels and mask
// (ShapeMismatch, EmptyRoi) and the shape of every frame (ShapeMismatch)
// before the first frame is correlated, so a failed call never computes
// anything.
CorrelationResult auto_corr(std::size_t num_levels,
                            std::size_t num_bufs,
                            const LabelImage& labels,
                            std::span<const Frame> frames,
                            const MaskImage* mask = nullptr,
                            RoiNumbering numbering = RoiNumbering::Dense,
                            ProgressObserver observer = {});

} // namespace xpcs
