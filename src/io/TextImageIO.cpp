#include "xpcs/io/TextImageIO.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "xpcs/util/Parse.hpp"

namespace xpcs {

namespace {

template <typename Out, typename Parsed>
Image<Out> read_grid(const std::filesystem::path& path, const char* what) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error(std::string(what) + ": cannot open '" + path.string() + "'");

  Image<Out> img;
  std::string line;
  std::size_t lineno = 0;
  std::size_t cols = 0;
  std::size_t rows = 0;
  while (std::getline(ifs, line)) {
    ++lineno;
    if (util::is_skippable_line(line)) continue;

    const char* p = line.data();
    const char* end = p + line.size();
    std::string_view tok;
    std::size_t n = 0;
    while (util::next_token(p, end, tok)) {
      Parsed v{};
      if (!util::parse_number(tok, v)) {
        throw std::runtime_error(std::string(what) + ": " + path.string() + ":" + std::to_string(lineno) +
                                 ": cannot parse integer '" + std::string(tok) + "'");
      }
      img.data.push_back(static_cast<Out>(v));
      ++n;
    }
    if (rows == 0) {
      cols = n;
    } else if (n != cols) {
      throw std::runtime_error(std::string(what) + ": " + path.string() + ":" + std::to_string(lineno) +
                               ": row has " + std::to_string(n) + " values, expected " + std::to_string(cols));
    }
    ++rows;
  }
  if (rows == 0) throw std::runtime_error(std::string(what) + ": '" + path.string() + "' contains no rows");
  img.rows = rows;
  img.cols = cols;
  return img;
}

} // namespace

LabelImage read_label_image(const std::filesystem::path& path) {
  return read_grid<std::int64_t, std::int64_t>(path, "read_label_image");
}

MaskImage read_mask_image(const std::filesystem::path& path) {
  // Any nonzero entry marks a usable pixel.
  Image<std::int64_t> raw = read_grid<std::int64_t, std::int64_t>(path, "read_mask_image");
  MaskImage m(raw.rows, raw.cols, 0);
  for (std::size_t i = 0; i < raw.data.size(); ++i) m.data[i] = raw.data[i] != 0 ? 1 : 0;
  return m;
}

FrameStackReader::FrameStackReader(const std::filesystem::path& path)
: path_(path), ifs_(path) {
  if (!ifs_) throw std::runtime_error("FrameStackReader: cannot open '" + path.string() + "'");
  ifs_.exceptions(std::ios::badbit);
}

std::runtime_error FrameStackReader::error_(const std::string& msg) const {
  return std::runtime_error("FrameStackReader: " + path_.string() + ":" + std::to_string(lineno_) + ": " + msg);
}

bool FrameStackReader::next_content_line_(std::string& line) {
  while (std::getline(ifs_, line)) {
    ++lineno_;
    if (!util::is_skippable_line(line)) return true;
  }
  return false;
}

bool FrameStackReader::next(Frame& frame) {
  std::string line;
  if (!next_content_line_(line)) return false;

  const char* p = line.data();
  const char* end = p + line.size();
  std::string_view tok;
  if (!util::next_token(p, end, tok) || tok != "FRAME") {
    throw error_("expected 'FRAME <index> <rows> <cols>' but got: " + line);
  }

  std::int64_t index = 0;
  std::size_t rows = 0;
  std::size_t cols = 0;
  if (!util::next_token(p, end, tok) || !util::parse_number(tok, index)) throw error_("bad frame index");
  if (!util::next_token(p, end, tok) || !util::parse_number(tok, rows) || rows == 0) throw error_("bad row count");
  if (!util::next_token(p, end, tok) || !util::parse_number(tok, cols) || cols == 0) throw error_("bad column count");
  if (util::next_token(p, end, tok)) throw error_("trailing tokens after FRAME header");

  if (frames_read_ > 0 && (last_index_ == std::numeric_limits<std::int64_t>::max() || index != last_index_ + 1)) {
    throw error_("frame index " + std::to_string(index) + " does not follow " + std::to_string(last_index_));
  }

  frame.resize(rows, cols);
  for (std::size_t r = 0; r < rows; ++r) {
    if (!next_content_line_(line)) throw error_("unexpected end of file inside frame " + std::to_string(index));
    p = line.data();
    end = p + line.size();
    std::size_t c = 0;
    while (util::next_token(p, end, tok)) {
      if (c >= cols) throw error_("too many values in row " + std::to_string(r));
      double v = 0.0;
      if (!util::parse_number(tok, v)) throw error_("cannot parse intensity '" + std::string(tok) + "'");
      frame.data[r * cols + c] = v;
      ++c;
    }
    if (c != cols) throw error_("row " + std::to_string(r) + " has " + std::to_string(c) + " values, expected " + std::to_string(cols));
  }

  last_index_ = index;
  ++frames_read_;
  return true;
}

} // namespace xpcs
