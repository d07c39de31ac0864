#pragma once

#include <stdexcept>
#include <string>

namespace xpcs {

// Base class for all correlation-core errors. Callers can catch a specific
// kind, or xpcs::Error for any of them, or std::runtime_error for everything.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Bad run parameters (odd num_bufs, num_levels < 1, unknown names, ...).
class InvalidConfig : public Error {
public:
  explicit InvalidConfig(const std::string& msg) : Error(msg) {}
};

// ROI label grid, mask and frames disagree on the detector shape.
class ShapeMismatch : public Error {
public:
  explicit ShapeMismatch(const std::string& msg) : Error(msg) {}
};

// An ROI owns no pixels after masking.
class EmptyRoi : public Error {
public:
  explicit EmptyRoi(const std::string& msg) : Error(msg) {}
};

} // namespace xpcs
