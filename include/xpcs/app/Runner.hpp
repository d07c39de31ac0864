#pragma once

#include <filesystem>

#include "xpcs/config/IniConfig.hpp"

namespace xpcs {

// Runner: main() handles CLI + config and calls Runner(cfg).run().
// Runner owns the pipeline: labels/mask -> ROI index -> correlator ->
// frame loop -> g2 table (+ optional checkpoint).
class Runner {
public:
  explicit Runner(const IniConfig& cfg);

  // Execute the run. Returns 0 on success; errors are thrown.
  int run();

  // Check configuration, ROI files and the first frame's shape without
  // correlating anything or writing output (CLI: --validate-config).
  int validate_config();

private:
  const IniConfig& cfg_;

  int run_impl_(bool validate_only);
};

} // namespace xpcs
