#include "xpcs/correlate/LevelAccumulator.hpp"

#include <algorithm>
#include <span>
#include <stdexcept>
#include <string>

#if XPCS_HAS_OPENMP
#include <omp.h>
#endif

namespace xpcs {

LevelAccumulator::LevelAccumulator(std::size_t num_levels, std::size_t num_bufs, std::size_t num_rois)
: num_levels_(num_levels), num_bufs_(num_bufs), num_rois_(num_rois) {
  if (num_levels_ < 1) throw std::runtime_error("LevelAccumulator: num_levels must be >= 1");
  if (num_bufs_ < 2 || (num_bufs_ % 2) != 0) throw std::runtime_error("LevelAccumulator: num_bufs must be even and >= 2");
  if (num_rois_ == 0) throw std::runtime_error("LevelAccumulator: num_rois must be > 0");

  const std::size_t slots = (num_levels_ + 1) * (num_bufs_ / 2);
  g_.assign(slots * num_rois_, 0.0);
  iap_.assign(slots * num_rois_, 0.0);
  iaf_.assign(slots * num_rois_, 0.0);
  counts_.assign(slots, 0);
}

void LevelAccumulator::accumulate(std::size_t level, const LevelRing& ring, const RoiIndex& roi) {
  if (level >= num_levels_) {
    throw std::runtime_error("LevelAccumulator: level " + std::to_string(level) + " out of range");
  }
  if (ring.capacity() != num_bufs_ || ring.width() != roi.num_pixels() || roi.num_rois() != num_rois_) {
    throw std::runtime_error("LevelAccumulator: ring / ROI layout does not match accumulator");
  }

  const std::uint64_t n = ring.arrivals();
  const std::size_t half = num_bufs_ / 2;
  // Lags below num_bufs/2 at level k are already covered, at finer
  // resolution, by level k-1.
  const std::size_t i_min = (level == 0) ? 0 : half;
  const std::size_t i_max = static_cast<std::size_t>(std::min<std::uint64_t>(n, num_bufs_));

  const std::span<const double> fut = ring.peek(0);
  const std::int64_t nroi = static_cast<std::int64_t>(num_rois_);

  for (std::size_t i = i_min; i < i_max; ++i) {
    const std::span<const double> pst = ring.peek(i);
    const std::size_t slot = level * half + i;
    // Number of origins this slot has seen, including the current one.
    const double denom = static_cast<double>(n - i);

    double* g = g_.data() + slot * num_rois_;
    double* iap = iap_.data() + slot * num_rois_;
    double* iaf = iaf_.data() + slot * num_rois_;

#if XPCS_HAS_OPENMP
#pragma omp parallel for schedule(static)
#endif
    for (std::int64_t rr = 0; rr < nroi; ++rr) {
      const std::size_t r = static_cast<std::size_t>(rr);
      double s_pf = 0.0;
      double s_p = 0.0;
      double s_f = 0.0;
      for (std::size_t p : roi.members(r)) {
        s_pf += pst[p] * fut[p];
        s_p += pst[p];
        s_f += fut[p];
      }
      const double inv_npix = 1.0 / static_cast<double>(roi.pixel_counts()[r]);
      g[r] += (s_pf * inv_npix - g[r]) / denom;
      iap[r] += (s_p * inv_npix - iap[r]) / denom;
      iaf[r] += (s_f * inv_npix - iaf[r]) / denom;
    }
    counts_[slot] += 1;
  }
}

std::size_t LevelAccumulator::populated_slots() const {
  std::size_t k = 0;
  while (k < counts_.size() && counts_[k] > 0) ++k;
  return k;
}

bool LevelAccumulator::pristine() const {
  auto zero = [](double v) { return v == 0.0; };
  return std::all_of(g_.begin(), g_.end(), zero) &&
         std::all_of(iap_.begin(), iap_.end(), zero) &&
         std::all_of(iaf_.begin(), iaf_.end(), zero) &&
         std::all_of(counts_.begin(), counts_.end(), [](std::uint64_t c) { return c == 0; });
}

} // namespace xpcs
