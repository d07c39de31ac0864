#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace xpcs {

// Row-major 2D detector grid.
template <typename T>
struct Image {
  std::size_t rows = 0;
  std::size_t cols = 0;
  std::vector<T> data;

  Image() = default;
  Image(std::size_t r, std::size_t c, T fill = T{}) : rows(r), cols(c), data(r * c, fill) {}

  void resize(std::size_t r, std::size_t c) {
    rows = r;
    cols = c;
    data.resize(r * c);
  }

  std::size_t size() const { return data.size(); }
  bool empty() const { return data.empty(); }

  T& at(std::size_t r, std::size_t c) {
    if (r >= rows || c >= cols) throw std::out_of_range("Image: index out of range");
    return data[r * cols + c];
  }
  const T& at(std::size_t r, std::size_t c) const {
    if (r >= rows || c >= cols) throw std::out_of_range("Image: index out of range");
    return data[r * cols + c];
  }

  bool same_shape(std::size_t r, std::size_t c) const { return rows == r && cols == c; }

  template <typename U>
  bool same_shape(const Image<U>& o) const { return rows == o.rows && cols == o.cols; }

  std::string shape_str() const {
    return "(" + std::to_string(rows) + ", " + std::to_string(cols) + ")";
  }
};

// Intensity frame.
using Frame = Image<double>;
// ROI labels: 0 = no ROI, >0 = ROI label.
using LabelImage = Image<std::int64_t>;
// Pixel mask: nonzero = usable, 0 = excluded.
using MaskImage = Image<std::uint8_t>;

} // namespace xpcs
