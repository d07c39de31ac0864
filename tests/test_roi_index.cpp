#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "TestUtil.hpp"
#include "xpcs/core/Errors.hpp"
#include "xpcs/roi/RoiIndex.hpp"

using namespace xpcs;
using xpcs::test::labels_from;

TEST(RoiIndex, FlattensLabelsInRowMajorOrder) {
  const LabelImage labels = labels_from(3, 3, {0, 1, 1,
                                               2, 0, 1,
                                               2, 2, 0});
  const RoiIndex idx = RoiIndex::build(labels);

  EXPECT_EQ(idx.rows(), 3u);
  EXPECT_EQ(idx.cols(), 3u);
  EXPECT_EQ(idx.num_rois(), 2u);
  EXPECT_EQ(idx.num_pixels(), 6u);
  EXPECT_EQ(idx.pixel_list(), (std::vector<std::size_t>{1, 2, 3, 5, 6, 7}));
  EXPECT_EQ(idx.roi_ids(), (std::vector<std::uint32_t>{0, 0, 1, 0, 1, 1}));
  EXPECT_EQ(idx.pixel_counts(), (std::vector<std::size_t>{3, 3}));
  EXPECT_EQ(idx.labels(), (std::vector<std::int64_t>{1, 2}));
}

TEST(RoiIndex, MemberListsGroupPixelsPerRoi) {
  const LabelImage labels = labels_from(2, 3, {2, 1, 2,
                                               1, 2, 0});
  const RoiIndex idx = RoiIndex::build(labels);

  const auto m0 = idx.members(0);
  const auto m1 = idx.members(1);
  EXPECT_EQ(std::vector<std::size_t>(m0.begin(), m0.end()), (std::vector<std::size_t>{1, 3}));
  EXPECT_EQ(std::vector<std::size_t>(m1.begin(), m1.end()), (std::vector<std::size_t>{0, 2, 4}));
}

TEST(RoiIndex, BuildIsDeterministic) {
  const LabelImage labels = labels_from(2, 4, {3, 0, 1, 1,
                                               0, 3, 3, 1});
  const RoiIndex a = RoiIndex::build(labels);
  const RoiIndex b = RoiIndex::build(labels);
  EXPECT_EQ(a.pixel_list(), b.pixel_list());
  EXPECT_EQ(a.roi_ids(), b.roi_ids());
  EXPECT_EQ(a.pixel_counts(), b.pixel_counts());
  EXPECT_EQ(a.labels(), b.labels());
}

TEST(RoiIndex, MaskedPixelsAreExcludedEvenWhenLabelled) {
  const LabelImage labels = labels_from(2, 2, {1, 1,
                                               2, 2});
  MaskImage mask(2, 2, 1);
  mask.at(0, 1) = 0;
  mask.at(1, 0) = 0;

  const RoiIndex idx = RoiIndex::build(labels, &mask);
  EXPECT_EQ(idx.pixel_list(), (std::vector<std::size_t>{0, 3}));
  EXPECT_EQ(idx.pixel_counts(), (std::vector<std::size_t>{1, 1}));
}

TEST(RoiIndex, RoiEmptiedByMaskIsRejected) {
  const LabelImage labels = labels_from(1, 3, {1, 2, 2});
  MaskImage mask(1, 3, 1);
  mask.at(0, 0) = 0;
  EXPECT_THROW(RoiIndex::build(labels, &mask), EmptyRoi);
}

TEST(RoiIndex, AllZeroLabelsAreRejected) {
  const LabelImage labels(3, 3, 0);
  EXPECT_THROW(RoiIndex::build(labels), EmptyRoi);
}

TEST(RoiIndex, DenseNumberingSkipsLabelGaps) {
  const LabelImage labels = labels_from(1, 4, {3, 0, 7, 3});
  const RoiIndex idx = RoiIndex::build(labels, nullptr, RoiNumbering::Dense);
  EXPECT_EQ(idx.num_rois(), 2u);
  EXPECT_EQ(idx.labels(), (std::vector<std::int64_t>{3, 7}));
  EXPECT_EQ(idx.roi_ids(), (std::vector<std::uint32_t>{0, 1, 0}));
}

TEST(RoiIndex, SparseNumberingRejectsLabelGaps) {
  const LabelImage gap = labels_from(1, 3, {1, 3, 3});
  EXPECT_THROW(RoiIndex::build(gap, nullptr, RoiNumbering::Sparse), EmptyRoi);

  // A huge label must be rejected without sizing columns up to it.
  const LabelImage huge = labels_from(1, 2, {1, 1000000000000});
  try {
    RoiIndex::build(huge, nullptr, RoiNumbering::Sparse);
    FAIL() << "expected EmptyRoi";
  } catch (const EmptyRoi& e) {
    EXPECT_NE(std::string(e.what()).find("label 2"), std::string::npos) << e.what();
  }

  const LabelImage full = labels_from(1, 3, {2, 1, 2});
  const RoiIndex idx = RoiIndex::build(full, nullptr, RoiNumbering::Sparse);
  EXPECT_EQ(idx.labels(), (std::vector<std::int64_t>{1, 2}));
  EXPECT_EQ(idx.roi_ids(), (std::vector<std::uint32_t>{1, 0, 1}));
}

TEST(RoiIndex, NegativeLabelIsInvalid) {
  const LabelImage labels = labels_from(1, 3, {1, -1, 1});
  EXPECT_THROW(RoiIndex::build(labels), InvalidConfig);
}

TEST(RoiIndex, MaskShapeMustMatchLabels) {
  const LabelImage labels(2, 2, 1);
  const MaskImage mask(2, 3, 1);
  EXPECT_THROW(RoiIndex::build(labels, &mask), ShapeMismatch);
}

TEST(RoiIndex, GatherReadsPixelListPositions) {
  const LabelImage labels = labels_from(2, 2, {0, 1,
                                               1, 2});
  const RoiIndex idx = RoiIndex::build(labels);

  Frame f(2, 2);
  f.data = {10.0, 20.0, 30.0, 40.0};
  std::vector<double> out(idx.num_pixels());
  idx.gather(f, out);
  EXPECT_EQ(out, (std::vector<double>{20.0, 30.0, 40.0}));

  const Frame wrong(2, 3, 1.0);
  EXPECT_THROW(idx.check_frame(wrong), ShapeMismatch);
  EXPECT_THROW(idx.gather(wrong, out), ShapeMismatch);
}

TEST(RoiIndex, NumberingNamesParse) {
  EXPECT_EQ(parse_roi_numbering("Dense"), RoiNumbering::Dense);
  EXPECT_EQ(parse_roi_numbering("sparse"), RoiNumbering::Sparse);
  EXPECT_EQ(roi_numbering_name(RoiNumbering::Sparse), "sparse");
  EXPECT_THROW(parse_roi_numbering("contiguous"), InvalidConfig);
}
