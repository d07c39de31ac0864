#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "xpcs/core/Image.hpp"

namespace xpcs {

// Grid files: one image row per line, whitespace separated integers; empty
// lines and '#' comments are skipped. All rows must have the same length.
LabelImage read_label_image(const std::filesystem::path& path);
MaskImage read_mask_image(const std::filesystem::path& path);

// Streaming reader for text frame stacks:
//
//   FRAME <index> <rows> <cols>
//   <rows lines of cols numbers>
//   FRAME ...
//
// Frames are returned in file order; indices must increase by one starting
// at the first frame's index.
class FrameStackReader {
public:
  explicit FrameStackReader(const std::filesystem::path& path);

  // Read the next frame into `frame`. Returns false at end of file.
  bool next(Frame& frame);

  std::size_t frames_read() const { return frames_read_; }
  std::int64_t last_index() const { return last_index_; }

private:
  std::filesystem::path path_;
  std::ifstream ifs_;
  std::size_t lineno_ = 0;
  std::size_t frames_read_ = 0;
  std::int64_t last_index_ = -1;

  bool next_content_line_(std::string& line);
  std::runtime_error error_(const std::string& msg) const;
};

} // namespace xpcs
