#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <utility>

#include "xpcs/core/Image.hpp"
#include "xpcs/correlate/CorrelationResult.hpp"

namespace xpcs {

// Optional observability hook: frames processed so far and wall seconds
// spent inside push() calls. Called once per finalize().
using ProgressObserver = std::function<void(std::uint64_t frames, double seconds)>;

// Streaming one-time correlator over detector frames (multi-tau or exact).
class ICorrelator {
public:
  virtual ~ICorrelator() = default;

  // Feed one frame, in acquisition order.
  virtual void push(const Frame& frame) = 0;

  // Normalized result for the frames seen so far. Non-destructive.
  virtual CorrelationResult finalize() = 0;

  virtual std::uint64_t frames_processed() const = 0;

  virtual void set_observer(ProgressObserver obs) { observer_ = std::move(obs); }

  // Checkpoint hooks; correlators that cannot checkpoint keep the defaults.
  virtual void save_state(std::ostream&) const {
    throw std::runtime_error("ICorrelator: checkpointing is not supported by this correlator");
  }
  virtual void load_state(std::istream&) {
    throw std::runtime_error("ICorrelator: checkpointing is not supported by this correlator");
  }

protected:
  ProgressObserver observer_;
};

} // namespace xpcs
