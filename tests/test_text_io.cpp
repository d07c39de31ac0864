#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "TestUtil.hpp"
#include "xpcs/io/TextImageIO.hpp"
#include "xpcs/output/G2Table.hpp"

using namespace xpcs;
using xpcs::test::TempDir;

TEST(TextImageIO, ReadsLabelGrid) {
  TempDir dir;
  const auto p = dir.write("labels.txt",
                           "# ring labels\n"
                           "0 1 1\n"
                           "\n"
                           "2 2 0\n");
  const LabelImage img = read_label_image(p);
  EXPECT_EQ(img.rows, 2u);
  EXPECT_EQ(img.cols, 3u);
  EXPECT_EQ(img.data, (std::vector<std::int64_t>{0, 1, 1, 2, 2, 0}));
}

TEST(TextImageIO, MaskNonzeroMeansUsable) {
  TempDir dir;
  const auto p = dir.write("mask.txt", "1 0 5\n0 1 -1\n");
  const MaskImage m = read_mask_image(p);
  EXPECT_EQ(m.data, (std::vector<std::uint8_t>{1, 0, 1, 0, 1, 1}));
}

TEST(TextImageIO, GridErrorsNameTheLine) {
  TempDir dir;
  const auto ragged = dir.write("ragged.txt", "1 2 3\n4 5\n");
  try {
    (void)read_label_image(ragged);
    FAIL() << "expected a row length error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find(":2:"), std::string::npos) << e.what();
  }
  EXPECT_THROW(read_label_image(dir.write("bad.txt", "1 x\n")), std::runtime_error);
  EXPECT_THROW(read_label_image(dir.write("empty.txt", "# nothing\n")), std::runtime_error);
  EXPECT_THROW(read_label_image(dir.path() / "missing.txt"), std::runtime_error);
}

TEST(FrameStackReader, ReadsFramesInOrder) {
  TempDir dir;
  const auto p = dir.write("frames.txt",
                           "# two frames\n"
                           "FRAME 10 2 2\n"
                           "1 2\n"
                           "3 4.5\n"
                           "FRAME 11 2 2\n"
                           "5 6\n"
                           "7 8\n");
  FrameStackReader reader(p);
  Frame f;
  ASSERT_TRUE(reader.next(f));
  EXPECT_EQ(f.rows, 2u);
  EXPECT_EQ(f.cols, 2u);
  EXPECT_EQ(f.data, (std::vector<double>{1.0, 2.0, 3.0, 4.5}));
  ASSERT_TRUE(reader.next(f));
  EXPECT_EQ(f.data, (std::vector<double>{5.0, 6.0, 7.0, 8.0}));
  EXPECT_FALSE(reader.next(f));
  EXPECT_EQ(reader.frames_read(), 2u);
  EXPECT_EQ(reader.last_index(), 11);
}

TEST(FrameStackReader, RoundTripsGeneratedStack) {
  TempDir dir;
  const auto frames = xpcs::test::noise_frames(5, 3, 2, 3u);
  const auto p = dir.write("frames.txt", xpcs::test::frame_stack_text(frames));
  FrameStackReader reader(p);
  Frame f;
  for (const auto& expected : frames) {
    ASSERT_TRUE(reader.next(f));
    EXPECT_EQ(f.data, expected.data);
  }
  EXPECT_FALSE(reader.next(f));
}

TEST(FrameStackReader, RejectsIndexGaps) {
  TempDir dir;
  const auto p = dir.write("frames.txt", "FRAME 0 1 1\n1\nFRAME 2 1 1\n1\n");
  FrameStackReader reader(p);
  Frame f;
  ASSERT_TRUE(reader.next(f));
  EXPECT_THROW(reader.next(f), std::runtime_error);
}

TEST(FrameStackReader, RejectsFrameAfterLargestIndex) {
  TempDir dir;
  const auto p = dir.write("frames.txt",
                           "FRAME 9223372036854775807 1 1\n1\n"
                           "FRAME -9223372036854775808 1 1\n1\n");
  FrameStackReader reader(p);
  Frame f;
  ASSERT_TRUE(reader.next(f));
  EXPECT_EQ(reader.last_index(), std::numeric_limits<std::int64_t>::max());
  EXPECT_THROW(reader.next(f), std::runtime_error);
  EXPECT_EQ(reader.frames_read(), 1u);
}

TEST(FrameStackReader, RejectsMalformedFrames) {
  TempDir dir;
  Frame f;
  {
    FrameStackReader r(dir.write("a.txt", "FRAME 0 2 2\n1 2\n"));
    EXPECT_THROW(r.next(f), std::runtime_error);
  }
  {
    FrameStackReader r(dir.write("b.txt", "FRAME 0 1 2\n1 2 3\n"));
    EXPECT_THROW(r.next(f), std::runtime_error);
  }
  {
    FrameStackReader r(dir.write("c.txt", "IMAGE 0 1 1\n1\n"));
    EXPECT_THROW(r.next(f), std::runtime_error);
  }
  {
    FrameStackReader r(dir.write("d.txt", "FRAME 0 0 1\n"));
    EXPECT_THROW(r.next(f), std::runtime_error);
  }
}

TEST(G2Table, WritesHeaderAndRows) {
  CorrelationResult res;
  res.num_rows = 2;
  res.num_rois = 2;
  res.g2 = {1.5, 1.25, 1.0, 0.75};
  res.lag_steps = {0, 1};
  res.count = {10, 9};
  res.roi_labels = {3, 7};
  res.roi_pixels = {12, 4};
  res.num_frames = 10;

  G2TableInfo info;
  info.correlator = "multitau";
  info.num_levels = 2;
  info.num_bufs = 4;
  info.roi_numbering = "dense";

  std::ostringstream os;
  write_g2_table(os, res, info);
  const std::string text = os.str();

  EXPECT_EQ(text.rfind("# xpcscorr: one-time correlation g2\n", 0), 0u);
  EXPECT_NE(text.find("# roi_labels: 3 7\n"), std::string::npos);
  EXPECT_NE(text.find("# columns: lag_step  count  g2_roi3  g2_roi7\n"), std::string::npos);
  EXPECT_NE(text.find("\n0 10 1.5 1.25\n"), std::string::npos);
  EXPECT_NE(text.find("\n1 9 1 0.75\n"), std::string::npos);
  EXPECT_EQ(text.find("  time"), std::string::npos);
  EXPECT_EQ(text.find("# frame_period"), std::string::npos);
}

TEST(G2Table, TimeColumnAppearsWithFramePeriod) {
  CorrelationResult res;
  res.num_rows = 1;
  res.num_rois = 1;
  res.g2 = {2.0};
  res.lag_steps = {4};
  res.time = {0.5};
  res.count = {3};
  res.roi_labels = {1};
  res.roi_pixels = {1};

  G2TableInfo info;
  info.frame_period = 0.125;

  TempDir dir;
  const auto p = dir.path() / "g2.dat";
  write_g2_table(p, res, info);
  const std::string text = xpcs::test::read_file(p);
  EXPECT_NE(text.find("# columns: lag_step  time  count  g2_roi1\n"), std::string::npos);
  EXPECT_NE(text.find("\n4 0.5 3 2\n"), std::string::npos);
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "g2.dat.tmp"));
}
