#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <vector>

#include "TestUtil.hpp"
#include "xpcs/core/Errors.hpp"
#include "xpcs/correlate/ExactCorrelator.hpp"
#include "xpcs/correlate/MultiTauCorrelator.hpp"

using namespace xpcs;

namespace {

// (num_levels, num_bufs, frames)
using Geometry = std::tuple<std::size_t, std::size_t, std::size_t>;

LabelImage scattered_labels() {
  return xpcs::test::labels_from(4, 5, {1, 1, 0, 4, 4,
                                        1, 2, 2, 0, 4,
                                        0, 2, 7, 7, 0,
                                        7, 7, 0, 4, 1});
}

MaskImage partial_mask() {
  MaskImage m(4, 5, 1);
  m.at(0, 0) = 0;
  m.at(2, 2) = 0;
  m.at(3, 4) = 0;
  return m;
}

} // namespace

class ExactEquivalence : public ::testing::TestWithParam<Geometry> {};

TEST_P(ExactEquivalence, MultiTauMatchesDirectAverages) {
  const auto [levels, bufs, nframes] = GetParam();
  const LabelImage labels = scattered_labels();
  const MaskImage mask = partial_mask();
  const auto frames = xpcs::test::drifting_frames(nframes, 4, 5, static_cast<std::uint32_t>(levels * 100 + bufs));

  MultiTauCorrelator::Options mo;
  mo.num_levels = levels;
  mo.num_bufs = bufs;
  ExactCorrelator::Options eo;
  eo.num_levels = levels;
  eo.num_bufs = bufs;

  MultiTauCorrelator multi(RoiIndex::build(labels, &mask), mo);
  ExactCorrelator exact(RoiIndex::build(labels, &mask), eo);
  for (const auto& f : frames) {
    multi.push(f);
    exact.push(f);
  }

  const CorrelationResult a = multi.finalize();
  const CorrelationResult b = exact.finalize();

  ASSERT_EQ(a.num_rows, b.num_rows);
  ASSERT_EQ(a.num_rois, b.num_rois);
  EXPECT_EQ(a.lag_steps, b.lag_steps);
  EXPECT_EQ(a.count, b.count);
  EXPECT_EQ(a.roi_labels, b.roi_labels);
  for (std::size_t k = 0; k < a.num_rows; ++k) {
    for (std::size_t r = 0; r < a.num_rois; ++r) {
      EXPECT_TRUE(xpcs::test::near_rel(a.at(k, r), b.at(k, r), 1e-9))
          << "row " << k << " roi " << r << ": " << a.at(k, r) << " vs " << b.at(k, r);
    }
  }
}

INSTANTIATE_TEST_SUITE_P(Geometries, ExactEquivalence,
                         ::testing::Values(Geometry{1, 2, 5},
                                           Geometry{1, 4, 4},
                                           Geometry{2, 4, 13},
                                           Geometry{3, 4, 50},
                                           Geometry{4, 8, 130},
                                           Geometry{5, 6, 97},
                                           Geometry{6, 2, 64},
                                           Geometry{7, 8, 3}));

TEST(ExactCorrelator, SingleRoiFullGrid) {
  const LabelImage labels(3, 3, 1);
  const auto frames = xpcs::test::noise_frames(33, 3, 3, 9u);

  MultiTauCorrelator multi(RoiIndex::build(labels), MultiTauCorrelator::Options{3, 4, 0.0});
  ExactCorrelator exact(RoiIndex::build(labels), ExactCorrelator::Options{3, 4, 0.0});
  for (const auto& f : frames) {
    multi.push(f);
    exact.push(f);
  }
  const CorrelationResult a = multi.finalize();
  const CorrelationResult b = exact.finalize();
  ASSERT_EQ(a.num_rows, b.num_rows);
  for (std::size_t k = 0; k < a.num_rows; ++k) {
    EXPECT_TRUE(xpcs::test::near_rel(a.at(k, 0), b.at(k, 0), 1e-9)) << "row " << k;
  }
  EXPECT_EQ(exact.frames_processed(), 33u);
}

TEST(ExactCorrelator, MismatchMidStreamAbortsTheRun) {
  ExactCorrelator exact(RoiIndex::build(LabelImage(2, 2, 1)), ExactCorrelator::Options{2, 4, 0.0});
  exact.push(xpcs::test::constant_frame(2, 2, 1.0));

  EXPECT_THROW(exact.push(xpcs::test::constant_frame(3, 2, 1.0)), ShapeMismatch);
  EXPECT_TRUE(exact.aborted());
  EXPECT_THROW(exact.push(xpcs::test::constant_frame(2, 2, 1.0)), ShapeMismatch);
  EXPECT_THROW(exact.finalize(), ShapeMismatch);
  EXPECT_EQ(exact.frames_processed(), 1u);
}

TEST(ExactCorrelator, MismatchedFirstFrameIsRecoverable) {
  ExactCorrelator exact(RoiIndex::build(LabelImage(2, 2, 1)), ExactCorrelator::Options{1, 2, 0.0});
  EXPECT_THROW(exact.push(xpcs::test::constant_frame(2, 3, 1.0)), ShapeMismatch);
  EXPECT_FALSE(exact.aborted());
  exact.push(xpcs::test::constant_frame(2, 2, 1.0));
  EXPECT_EQ(exact.finalize().num_rows, 1u);
}

TEST(ExactCorrelator, DoesNotCheckpoint) {
  ExactCorrelator exact(RoiIndex::build(LabelImage(2, 2, 1)), ExactCorrelator::Options{});
  std::stringstream ss;
  EXPECT_THROW(exact.save_state(ss), std::runtime_error);
  EXPECT_THROW(exact.load_state(ss), std::runtime_error);
}
