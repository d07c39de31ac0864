#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "xpcs/core/Image.hpp"

namespace xpcs {

enum class RoiNumbering {
  Dense,  // distinct labels, ascending, mapped to columns 0..R-1
  Sparse, // column r is label r+1; every label up to the maximum must own pixels
};

RoiNumbering parse_roi_numbering(std::string s);
std::string roi_numbering_name(RoiNumbering n);

// Flattened view of an ROI label image.
//
// pixel_list[p] is the row-major index of the p-th pixel taking part in the
// correlation and roi_ids[p] the zero-based ROI column it belongs to. Both are
// in row-major scan order. Masked pixels (mask == 0) are removed before
// labels are looked at.
//
// Member lists (CSR: member_offsets/members) group pixel-list positions per
// ROI, in ascending order, so that per-ROI reductions can run independently.
class RoiIndex {
public:
  RoiIndex() = default;

  // Throws ShapeMismatch (mask shape), EmptyRoi (ROI without pixels),
  // InvalidConfig (negative label).
  static RoiIndex build(const LabelImage& labels,
                        const MaskImage* mask = nullptr,
                        RoiNumbering numbering = RoiNumbering::Dense);

  std::size_t rows() const { return rows_; }
  std::size_t cols() const { return cols_; }
  std::size_t num_rois() const { return pixel_counts_.size(); }
  std::size_t num_pixels() const { return pixel_list_.size(); }
  RoiNumbering numbering() const { return numbering_; }

  const std::vector<std::size_t>& pixel_list() const { return pixel_list_; }
  const std::vector<std::uint32_t>& roi_ids() const { return roi_ids_; }
  const std::vector<std::size_t>& pixel_counts() const { return pixel_counts_; }
  // Original label value of each ROI column.
  const std::vector<std::int64_t>& labels() const { return labels_; }

  std::span<const std::size_t> members(std::size_t roi) const {
    return {members_.data() + member_offsets_[roi], member_offsets_[roi + 1] - member_offsets_[roi]};
  }

  // Throws ShapeMismatch unless `frame` has the label grid's shape.
  void check_frame(const Frame& frame) const;

  // out[p] = frame value at pixel_list[p]. `out` must hold num_pixels() values.
  void gather(const Frame& frame, std::span<double> out) const;

private:
  std::size_t rows_ = 0;
  std::size_t cols_ = 0;
  RoiNumbering numbering_ = RoiNumbering::Dense;

  std::vector<std::size_t> pixel_list_;
  std::vector<std::uint32_t> roi_ids_;
  std::vector<std::size_t> pixel_counts_;
  std::vector<std::int64_t> labels_;

  std::vector<std::size_t> member_offsets_;
  std::vector<std::size_t> members_;
};

} // namespace xpcs
