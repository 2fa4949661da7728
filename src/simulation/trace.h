#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "common/types.h"
#include "simulation/chip.h"
#include "simulation/pin.h"

namespace breadsim {

/// Fold one driver into an accumulated bus value (wired-OR):
/// High dominates, Low wins over nothing, Undefined drives nothing.
State ResolveWired(State acc, State driver);

// --- Trace: a wire tying pins of (usually) different chips together ---
//
// Communicate() resolves the Output pins into one state and writes it into
// every non-Output pin. Several High drivers on one trace are legal and
// resolve to High; contention is not modeled.

class Trace {
 public:
  void Connect(const std::shared_ptr<Pin>& pin);

  /// Connects pin `index` of `chip`. Returns false when the index is out of
  /// range for the chip.
  bool Connect(const Chip& chip, uint32_t index);

  void Communicate();

  /// Value computed by the last Communicate().
  State Resolved() const { return resolved_; }

  /// Pins still alive, in connection order. Pins of chips that were
  /// unplugged and destroyed are skipped.
  std::vector<std::shared_ptr<Pin>> Pins() const;
  size_t LinkCount() const { return link_.size(); }

 private:
  std::vector<std::weak_ptr<Pin>> link_;
  State resolved_ = State::kUndefined;
};

}  // namespace breadsim
