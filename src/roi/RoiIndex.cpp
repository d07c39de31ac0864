#include "xpcs/roi/RoiIndex.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>

#if XPCS_HAS_OPENMP
#include <omp.h>
#endif

#include "xpcs/core/Errors.hpp"

namespace xpcs {

RoiNumbering parse_roi_numbering(std::string s) {
  for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  if (s == "dense") return RoiNumbering::Dense;
  if (s == "sparse") return RoiNumbering::Sparse;
  throw InvalidConfig("invalid roi_numbering: '" + s + "' (use dense|sparse)");
}

std::string roi_numbering_name(RoiNumbering n) {
  switch (n) {
    case RoiNumbering::Dense: return "dense";
    case RoiNumbering::Sparse: return "sparse";
  }
  return "dense";
}

RoiIndex RoiIndex::build(const LabelImage& labels, const MaskImage* mask, RoiNumbering numbering) {
  if (labels.data.size() != labels.rows * labels.cols) {
    throw ShapeMismatch("RoiIndex: label image storage does not match its shape " + labels.shape_str());
  }
  if (mask && !mask->same_shape(labels)) {
    throw ShapeMismatch("RoiIndex: mask shape " + mask->shape_str() +
                        " does not match label shape " + labels.shape_str());
  }

  RoiIndex idx;
  idx.rows_ = labels.rows;
  idx.cols_ = labels.cols;
  idx.numbering_ = numbering;

  // Every positive label present in the grid names an ROI, whether or not the
  // mask leaves it any pixels.
  std::int64_t max_label = 0;
  std::vector<std::int64_t> present;
  for (std::size_t i = 0; i < labels.data.size(); ++i) {
    const std::int64_t v = labels.data[i];
    if (v < 0) {
      throw InvalidConfig("RoiIndex: negative label " + std::to_string(v) + " at flat index " + std::to_string(i));
    }
    if (v > 0) {
      present.push_back(v);
      max_label = std::max(max_label, v);
    }
  }
  if (present.empty()) {
    throw EmptyRoi("RoiIndex: label image contains no ROI (all labels are 0)");
  }

  std::sort(present.begin(), present.end());
  present.erase(std::unique(present.begin(), present.end()), present.end());

  std::unordered_map<std::int64_t, std::uint32_t> column_of;
  if (numbering == RoiNumbering::Dense) {
    idx.labels_ = present;
  } else {
    // Column r is label r+1, so the labels must be exactly 1..max_label.
    if (present.size() != static_cast<std::uint64_t>(max_label)) {
      std::int64_t missing = 1;
      for (std::int64_t v : present) {
        if (v != missing) break;
        ++missing;
      }
      throw EmptyRoi("RoiIndex: sparse numbering has no pixels for label " + std::to_string(missing) +
                     " (labels must run 1.." + std::to_string(max_label) + ")");
    }
    idx.labels_.resize(static_cast<std::size_t>(max_label));
    for (std::size_t r = 0; r < idx.labels_.size(); ++r) idx.labels_[r] = static_cast<std::int64_t>(r + 1);
  }
  column_of.reserve(idx.labels_.size() * 2);
  for (std::size_t r = 0; r < idx.labels_.size(); ++r) {
    column_of[idx.labels_[r]] = static_cast<std::uint32_t>(r);
  }

  // Exclude first, then keep positive labels.
  idx.pixel_counts_.assign(idx.labels_.size(), 0);
  for (std::size_t i = 0; i < labels.data.size(); ++i) {
    if (mask && mask->data[i] == 0) continue;
    const std::int64_t v = labels.data[i];
    if (v <= 0) continue;
    const std::uint32_t r = column_of.at(v);
    idx.pixel_list_.push_back(i);
    idx.roi_ids_.push_back(r);
    idx.pixel_counts_[r] += 1;
  }

  for (std::size_t r = 0; r < idx.pixel_counts_.size(); ++r) {
    if (idx.pixel_counts_[r] == 0) {
      throw EmptyRoi("RoiIndex: ROI with label " + std::to_string(idx.labels_[r]) +
                     " has no pixels" + (mask ? " after masking" : ""));
    }
  }

  idx.member_offsets_.assign(idx.labels_.size() + 1, 0);
  for (std::size_t r = 0; r < idx.pixel_counts_.size(); ++r) {
    idx.member_offsets_[r + 1] = idx.member_offsets_[r] + idx.pixel_counts_[r];
  }
  idx.members_.resize(idx.pixel_list_.size());
  std::vector<std::size_t> fill(idx.member_offsets_.begin(), idx.member_offsets_.end() - 1);
  for (std::size_t p = 0; p < idx.roi_ids_.size(); ++p) {
    idx.members_[fill[idx.roi_ids_[p]]++] = p;
  }

  return idx;
}

void RoiIndex::check_frame(const Frame& frame) const {
  if (!frame.same_shape(rows_, cols_) || frame.data.size() != rows_ * cols_) {
    throw ShapeMismatch("frame shape " + frame.shape_str() + " does not match ROI label shape (" +
                        std::to_string(rows_) + ", " + std::to_string(cols_) + ")");
  }
}

void RoiIndex::gather(const Frame& frame, std::span<double> out) const {
  check_frame(frame);
  if (out.size() != pixel_list_.size()) {
    throw std::runtime_error("RoiIndex::gather: output size does not match the pixel list");
  }
  const std::size_t n = pixel_list_.size();
  const double* src = frame.data.data();
#if XPCS_HAS_OPENMP
#pragma omp parallel for
#endif
  for (std::size_t p = 0; p < n; ++p) {
    out[p] = src[pixel_list_[p]];
  }
}

} // namespace xpcs
