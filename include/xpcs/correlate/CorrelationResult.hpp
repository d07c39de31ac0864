#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace xpcs {

// Normalized one-time correlation, one row per populated tau slot.
struct CorrelationResult {
  std::size_t num_rows = 0;
  std::size_t num_rois = 0;

  // g2[row * num_rois + roi] = G / (IAP * IAF)
  std::vector<double> g2;

  // Delay of each row in frames.
  std::vector<std::uint64_t> lag_steps;

  // Delay in seconds (lag_steps * frame_period); empty when no frame period is known.
  std::vector<double> time;

  // Number of time origins averaged into each row.
  std::vector<std::uint64_t> count;

  // Per ROI column: original label and pixel count.
  std::vector<std::int64_t> roi_labels;
  std::vector<std::size_t> roi_pixels;

  std::uint64_t num_frames = 0;

  double at(std::size_t row, std::size_t roi) const { return g2[row * num_rois + roi]; }
};

} // namespace xpcs
