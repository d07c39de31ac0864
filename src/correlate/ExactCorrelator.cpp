#include "xpcs/correlate/ExactCorrelator.hpp"

#include <algorithm>
#include <cmath>
#include <span>
#include <utility>

#if XPCS_HAS_OPENMP
#include <omp.h>
#endif

#include "xpcs/core/Errors.hpp"
#include "xpcs/correlate/LagSchedule.hpp"
#include "xpcs/util/Timer.hpp"

namespace xpcs {

namespace {

using Series = std::vector<std::vector<double>>;

Series halve(const Series& in) {
  Series out(in.size() / 2);
  for (std::size_t j = 0; j < out.size(); ++j) {
    const auto& a = in[2 * j];
    const auto& b = in[2 * j + 1];
    out[j].resize(a.size());
    for (std::size_t p = 0; p < a.size(); ++p) out[j][p] = 0.5 * (a[p] + b[p]);
  }
  return out;
}

} // namespace

ExactCorrelator::ExactCorrelator(RoiIndex roi, Options opt)
: roi_(std::move(roi)), opt_(opt) {
  validate_multi_tau(opt_.num_levels, opt_.num_bufs);
  if (!(opt_.frame_period >= 0.0) || !std::isfinite(opt_.frame_period)) {
    throw InvalidConfig("frame_period must be a finite value >= 0");
  }
  if (roi_.num_rois() == 0) throw EmptyRoi("ExactCorrelator: ROI index has no ROIs");
}

void ExactCorrelator::require_live_() const {
  if (aborted_) {
    throw ShapeMismatch("ExactCorrelator: run was aborted by an earlier frame shape mismatch");
  }
}

void ExactCorrelator::push(const Frame& frame) {
  require_live_();
  try {
    roi_.check_frame(frame);
  } catch (const ShapeMismatch&) {
    if (!history_.empty()) aborted_ = true;
    throw;
  }
  util::ScopedTimer timer(&push_seconds_);
  std::vector<double> v(roi_.num_pixels());
  roi_.gather(frame, v);
  history_.push_back(std::move(v));
}

CorrelationResult ExactCorrelator::finalize() {
  require_live_();
  const std::size_t R = roi_.num_rois();
  const std::size_t B = opt_.num_bufs;
  const std::size_t half = B / 2;
  const MultiTauLags lags = multi_tau_lags(opt_.num_levels, B);

  std::vector<double> g(lags.total_channels * R, 0.0);
  std::vector<double> ip(lags.total_channels * R, 0.0);
  std::vector<double> iff(lags.total_channels * R, 0.0);
  std::vector<std::uint64_t> count(lags.total_channels, 0);

  Series series = history_;
  for (std::size_t lev = 0; lev < opt_.num_levels; ++lev) {
    if (lev > 0) series = halve(series);
    const std::size_t n = series.size();
    const std::size_t i_min = (lev == 0) ? 0 : half;
    const std::size_t i_max = std::min(n, B);

    for (std::size_t i = i_min; i < i_max; ++i) {
      const std::size_t slot = lev * half + i;
      const std::int64_t nroi = static_cast<std::int64_t>(R);
#if XPCS_HAS_OPENMP
#pragma omp parallel for schedule(static)
#endif
      for (std::int64_t rr = 0; rr < nroi; ++rr) {
        const std::size_t r = static_cast<std::size_t>(rr);
        const double inv_npix = 1.0 / static_cast<double>(roi_.pixel_counts()[r]);
        double sum_g = 0.0, sum_p = 0.0, sum_f = 0.0;
        for (std::size_t t = i; t < n; ++t) {
          const std::vector<double>& past = series[t - i];
          const std::vector<double>& fut = series[t];
          double s_pf = 0.0, s_p = 0.0, s_f = 0.0;
          for (std::size_t p : roi_.members(r)) {
            s_pf += past[p] * fut[p];
            s_p += past[p];
            s_f += fut[p];
          }
          sum_g += s_pf * inv_npix;
          sum_p += s_p * inv_npix;
          sum_f += s_f * inv_npix;
        }
        const double norigins = static_cast<double>(n - i);
        g[slot * R + r] = sum_g / norigins;
        ip[slot * R + r] = sum_p / norigins;
        iff[slot * R + r] = sum_f / norigins;
      }
      count[slot] = n - i;
    }
  }

  std::size_t rows = 0;
  while (rows < count.size() && count[rows] > 0) ++rows;

  CorrelationResult out;
  out.num_rows = rows;
  out.num_rois = R;
  out.num_frames = history_.size();
  out.roi_labels = roi_.labels();
  out.roi_pixels = roi_.pixel_counts();
  out.g2.resize(rows * R);
  out.count.assign(count.begin(), count.begin() + static_cast<std::ptrdiff_t>(rows));
  out.lag_steps.assign(lags.lag_steps.begin(), lags.lag_steps.begin() + static_cast<std::ptrdiff_t>(rows));
  for (std::size_t k = 0; k < rows * R; ++k) out.g2[k] = g[k] / (ip[k] * iff[k]);
  if (opt_.frame_period > 0.0) {
    for (std::uint64_t s : out.lag_steps) out.time.push_back(static_cast<double>(s) * opt_.frame_period);
  }

  if (observer_) observer_(out.num_frames, push_seconds_);
  return out;
}

} // namespace xpcs
