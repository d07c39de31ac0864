#pragma once

#include <cstddef>
#include <filesystem>
#include <iomanip>
#include <ostream>
#include <string>

#include "xpcs/correlate/CorrelationResult.hpp"
#include "xpcs/util/AtomicFile.hpp"

namespace xpcs {

// Provenance printed in the table header.
struct G2TableInfo {
  std::string correlator;
  std::size_t num_levels = 0;
  std::size_t num_bufs = 0;
  double frame_period = 0.0;
  std::string roi_numbering;
};

inline void write_g2_table(std::ostream& os, const CorrelationResult& res, const G2TableInfo& info) {
  const bool with_time = !res.time.empty();

  os << "# xpcscorr: one-time correlation g2\n";
  os << "# correlator: " << info.correlator << "\n";
  os << "# num_levels: " << info.num_levels << ", num_bufs: " << info.num_bufs << "\n";
  if (with_time) os << "# frame_period: " << std::setprecision(17) << info.frame_period << " (seconds)\n";
  os << "# frames: " << res.num_frames << "\n";
  os << "# roi_numbering: " << info.roi_numbering << "\n";
  os << "# roi_labels:";
  for (auto l : res.roi_labels) os << " " << l;
  os << "\n# roi_pixels:";
  for (auto n : res.roi_pixels) os << " " << n;
  os << "\n# columns: lag_step" << (with_time ? "  time" : "") << "  count";
  for (auto l : res.roi_labels) os << "  g2_roi" << l;
  os << "\n";

  for (std::size_t k = 0; k < res.num_rows; ++k) {
    os << res.lag_steps[k];
    if (with_time) os << " " << std::setprecision(17) << res.time[k];
    os << " " << res.count[k];
    for (std::size_t r = 0; r < res.num_rois; ++r) {
      os << " " << std::setprecision(17) << res.at(k, r);
    }
    os << "\n";
  }
}

inline void write_g2_table(const std::filesystem::path& path, const CorrelationResult& res, const G2TableInfo& info) {
  util::atomic_write(path, [&](std::ostream& os) { write_g2_table(os, res, info); });
}

} // namespace xpcs
