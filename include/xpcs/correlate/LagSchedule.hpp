#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "xpcs/core/Errors.hpp"

namespace xpcs {

struct MultiTauLags {
  std::size_t total_channels = 0;
  // Delay, in frames, of every tau slot (level*num_bufs/2 + offset).
  std::vector<std::uint64_t> lag_steps;
};

inline void validate_multi_tau(std::size_t num_levels, std::size_t num_bufs) {
  if (num_levels < 1) {
    throw InvalidConfig("num_levels must be >= 1 (got " + std::to_string(num_levels) + ")");
  }
  if (num_bufs < 2 || (num_bufs % 2) != 0) {
    throw InvalidConfig("num_bufs (buffers per multi-tau level) must be an even integer >= 2 (got " +
                        std::to_string(num_bufs) + ")");
  }
}

// Level 0 contributes lags 0..num_bufs-1; level k >= 1 contributes
// (num_bufs/2 .. num_bufs-1) * 2^k.
inline MultiTauLags multi_tau_lags(std::size_t num_levels, std::size_t num_bufs) {
  validate_multi_tau(num_levels, num_bufs);
  const std::size_t half = num_bufs / 2;

  MultiTauLags out;
  out.total_channels = (num_levels + 1) * half;
  out.lag_steps.reserve(out.total_channels);
  for (std::size_t i = 0; i < num_bufs; ++i) out.lag_steps.push_back(i);
  for (std::size_t lev = 1; lev < num_levels; ++lev) {
    const std::uint64_t scale = std::uint64_t(1) << lev;
    for (std::size_t i = half; i < num_bufs; ++i) out.lag_steps.push_back(static_cast<std::uint64_t>(i) * scale);
  }
  return out;
}

} // namespace xpcs
