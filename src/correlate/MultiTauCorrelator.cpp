#include "xpcs/correlate/MultiTauCorrelator.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "xpcs/core/Errors.hpp"
#include "xpcs/correlate/LagSchedule.hpp"
#include "xpcs/util/BinaryIO.hpp"
#include "xpcs/util/Timer.hpp"

namespace xpcs {

namespace {

constexpr std::uint64_t kStateVersion = 1;

void check_options(const MultiTauCorrelator::Options& opt) {
  validate_multi_tau(opt.num_levels, opt.num_bufs);
  if (!(opt.frame_period >= 0.0) || !std::isfinite(opt.frame_period)) {
    throw InvalidConfig("frame_period must be a finite value >= 0");
  }
}

} // namespace

MultiTauCorrelator::MultiTauCorrelator(RoiIndex roi, Options opt)
: roi_(std::move(roi)), opt_(opt) {
  check_options(opt_);
  if (roi_.num_rois() == 0) throw EmptyRoi("MultiTauCorrelator: ROI index has no ROIs");

  levels_.reserve(opt_.num_levels);
  for (std::size_t k = 0; k < opt_.num_levels; ++k) {
    levels_.emplace_back(opt_.num_bufs, roi_.num_pixels());
  }
  acc_ = LevelAccumulator(opt_.num_levels, opt_.num_bufs, roi_.num_rois());
}

void MultiTauCorrelator::require_live_() const {
  if (aborted_) {
    throw ShapeMismatch("MultiTauCorrelator: run was aborted by an earlier frame shape mismatch");
  }
}

void MultiTauCorrelator::push(const Frame& frame) {
  require_live_();
  try {
    roi_.check_frame(frame);
  } catch (const ShapeMismatch&) {
    // Accumulators may already mix earlier frames; no partial result may
    // escape from this run.
    if (frames_ > 0) aborted_ = true;
    throw;
  }

  util::ScopedTimer timer(&push_seconds_);

  LevelRing& l0 = levels_[0];
  roi_.gather(frame, l0.advance());
  acc_.accumulate(0, l0, roi_);
  propagate_();
  frames_ += 1;
}

void MultiTauCorrelator::propagate_() {
  for (std::size_t k = 1; k < levels_.size(); ++k) {
    LevelRing& cur = levels_[k];
    if (!cur.awaiting_pair()) {
      cur.set_awaiting_pair(true);
      return;
    }
    cur.set_awaiting_pair(false);
    cur.push_pair_mean(levels_[k - 1]);
    acc_.accumulate(k, cur, roi_);
  }
}

CorrelationResult MultiTauCorrelator::finalize() {
  require_live_();

  const std::size_t R = roi_.num_rois();
  const std::size_t rows = acc_.populated_slots();
  const MultiTauLags lags = multi_tau_lags(opt_.num_levels, opt_.num_bufs);

  CorrelationResult out;
  out.num_rows = rows;
  out.num_rois = R;
  out.num_frames = frames_;
  out.roi_labels = roi_.labels();
  out.roi_pixels = roi_.pixel_counts();
  out.g2.resize(rows * R);
  out.count.resize(rows);
  out.lag_steps.assign(lags.lag_steps.begin(), lags.lag_steps.begin() + static_cast<std::ptrdiff_t>(rows));

  for (std::size_t k = 0; k < rows; ++k) {
    for (std::size_t r = 0; r < R; ++r) {
      out.g2[k * R + r] = acc_.g(k, r) / (acc_.past(k, r) * acc_.future(k, r));
    }
    out.count[k] = acc_.count(k);
  }
  if (opt_.frame_period > 0.0) {
    out.time.reserve(rows);
    for (std::uint64_t s : out.lag_steps) out.time.push_back(static_cast<double>(s) * opt_.frame_period);
  }

  if (observer_) observer_(frames_, push_seconds_);
  return out;
}

void MultiTauCorrelator::save_state(std::ostream& os) const {
  require_live_();
  util::write_magic(os, "XPCSMULTITAU");
  util::BinaryWriter w(os);
  w.u64(kStateVersion);

  w.u64(opt_.num_levels);
  w.u64(opt_.num_bufs);
  w.f64(opt_.frame_period);

  // Layout fingerprint: the ROI index is rebuilt by the caller, not stored.
  w.u64(roi_.rows());
  w.u64(roi_.cols());
  w.array(roi_.pixel_list());
  w.array(roi_.roi_ids());

  w.u64(frames_);
  w.f64(push_seconds_);

  for (const LevelRing& L : levels_) {
    w.u64(L.cursor());
    w.u64(L.arrivals());
    w.u8(L.awaiting_pair() ? 1 : 0);
    for (const auto& s : L.raw_slots()) w.array(s);
  }

  w.array(acc_.raw_g());
  w.array(acc_.raw_past());
  w.array(acc_.raw_future());
  w.array(acc_.raw_counts());

  util::write_magic(os, "XPCSEND");
}

void MultiTauCorrelator::load_state(std::istream& is) {
  util::expect_magic(is, "XPCSMULTITAU");
  util::BinaryReader r(is);
  const std::uint64_t ver = r.u64();
  if (ver != kStateVersion) {
    throw InvalidConfig("MultiTauCorrelator: unsupported checkpoint version " + std::to_string(ver));
  }

  const std::uint64_t lv = r.u64();
  const std::uint64_t nb = r.u64();
  const double fp = r.f64();
  if (lv != opt_.num_levels) throw InvalidConfig("MultiTauCorrelator: num_levels mismatch in checkpoint");
  if (nb != opt_.num_bufs) throw InvalidConfig("MultiTauCorrelator: num_bufs mismatch in checkpoint");
  if (fp != opt_.frame_period) throw InvalidConfig("MultiTauCorrelator: frame_period mismatch in checkpoint");

  const std::uint64_t rows = r.u64();
  const std::uint64_t cols = r.u64();
  std::vector<std::size_t> plist;
  std::vector<std::uint32_t> rids;
  r.array(plist);
  r.array(rids);
  if (rows != roi_.rows() || cols != roi_.cols() || plist != roi_.pixel_list() || rids != roi_.roi_ids()) {
    throw InvalidConfig("MultiTauCorrelator: ROI layout in checkpoint differs from the current ROI index");
  }

  // Read everything into temporaries so a truncated file leaves *this untouched.
  std::vector<LevelRing> levels = levels_;
  LevelAccumulator acc = acc_;
  const std::uint64_t frames = r.u64();
  const double secs = r.f64();

  for (LevelRing& L : levels) {
    const std::uint64_t cursor = r.u64();
    const std::uint64_t arrivals = r.u64();
    const bool awaiting = r.u8() != 0;
    for (auto& s : L.raw_slots()) r.array(s, L.width());
    L.restore_counters(static_cast<std::size_t>(cursor), arrivals, awaiting);
  }

  r.array(acc.raw_g(), acc.raw_g().size());
  r.array(acc.raw_past(), acc.raw_past().size());
  r.array(acc.raw_future(), acc.raw_future().size());
  r.array(acc.raw_counts(), acc.raw_counts().size());

  util::expect_magic(is, "XPCSEND");

  levels_ = std::move(levels);
  acc_ = std::move(acc);
  frames_ = frames;
  push_seconds_ = secs;
  aborted_ = false;
}

} // namespace xpcs
