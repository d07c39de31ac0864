#pragma once

#include <cctype>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "xpcs/config/IniConfig.hpp"
#include "xpcs/core/Errors.hpp"
#include "xpcs/correlate/ExactCorrelator.hpp"
#include "xpcs/correlate/ICorrelator.hpp"
#include "xpcs/correlate/LagSchedule.hpp"
#include "xpcs/correlate/MultiTauCorrelator.hpp"
#include "xpcs/roi/RoiIndex.hpp"

namespace xpcs {

// Correlator configuration as read from the [correlation] section.
struct CorrelatorSpec {
  std::string type = "multitau"; // multitau | exact
  std::size_t num_levels = 7;
  std::size_t num_bufs = 8;
  double frame_period = 0.0;     // seconds per frame, 0 = unknown
  RoiNumbering numbering = RoiNumbering::Dense;
};

inline CorrelatorSpec parse_correlator_spec(const IniConfig& cfg, const std::string& section = "correlation") {
  CorrelatorSpec s;
  std::string t = cfg.get_string(section, "correlator", std::optional<std::string>("multitau"));
  for (auto& c : t) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (t != "multitau" && t != "exact") {
    throw InvalidConfig("unsupported correlator type: '" + t + "' (use multitau|exact)");
  }
  s.type = t;
  s.num_levels = cfg.get_size(section, "num_levels", std::optional<std::size_t>(7));
  s.num_bufs = cfg.get_size(section, "num_bufs", std::optional<std::size_t>(8));
  s.frame_period = cfg.get_double(section, "frame_period", std::optional<double>(0.0));
  s.numbering = parse_roi_numbering(cfg.get_string(section, "roi_numbering", std::optional<std::string>("dense")));

  // Reject bad buffer geometry here, before any frame is read.
  validate_multi_tau(s.num_levels, s.num_bufs);
  return s;
}

inline std::unique_ptr<ICorrelator> make_correlator(RoiIndex roi, const CorrelatorSpec& spec) {
  if (spec.type == "multitau") {
    MultiTauCorrelator::Options opt;
    opt.num_levels = spec.num_levels;
    opt.num_bufs = spec.num_bufs;
    opt.frame_period = spec.frame_period;
    return std::make_unique<MultiTauCorrelator>(std::move(roi), opt);
  }
  if (spec.type == "exact") {
    ExactCorrelator::Options opt;
    opt.num_levels = spec.num_levels;
    opt.num_bufs = spec.num_bufs;
    opt.frame_period = spec.frame_period;
    return std::make_unique<ExactCorrelator>(std::move(roi), opt);
  }
  throw InvalidConfig("unsupported correlator type: " + spec.type);
}

} // namespace xpcs
