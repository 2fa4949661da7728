#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.h"
#include "simulation/pin.h"

namespace breadsim {

/// Human-readable description of a mounted chip.
struct ChipInfo {
  std::string name;
  std::string description;
  std::string data;  // Free-form state dump, empty for stateless chips.
};

// --- Chip: polymorphic unit of behavior ---
//
// A chip owns its pins (indexed 1..PinCount()) and optional internal state.
// Run() must be total: every combination of pin types and states, including
// all Undefined, yields defined outputs.

class Chip {
 public:
  virtual ~Chip() = default;

  Chip(const Chip&) = delete;
  Chip& operator=(const Chip&) = delete;

  ChipId Id() const { return id_; }
  uint32_t PinCount() const { return static_cast<uint32_t>(pins_.size()); }

  /// Handle to pin `index`, or an empty handle if `index` is outside
  /// [1, PinCount()].
  std::shared_ptr<Pin> GetPin(uint32_t index) const;

  /// Stable tag used by saved boards to rebuild the chip through a factory.
  virtual std::string_view TypeTag() const = 0;
  virtual ChipInfo Info() const = 0;

  virtual void Run(Duration elapsed) = 0;

  /// Opaque persisted state. Stateless chips save nothing and accept
  /// anything.
  virtual std::vector<std::string> SaveData() const { return {}; }
  virtual bool LoadData(const std::vector<std::string>& /*data*/) {
    return true;
  }

 protected:
  explicit Chip(std::initializer_list<PinType> pin_types);
  explicit Chip(const std::vector<PinType>& pin_types);

  // Unchecked accessors for chip implementations; `index` is 1-based.
  State PinState(uint32_t index) const { return pins_[index - 1]->state; }
  void SetPinState(uint32_t index, State state) {
    pins_[index - 1]->state = state;
  }
  void SetPinType(uint32_t index, PinType type) {
    pins_[index - 1]->type = type;
  }

  /// GND reads Low and VCC reads High.
  bool IsPowered(uint32_t gnd, uint32_t vcc) const {
    return PinState(gnd) == State::kLow && PinState(vcc) == State::kHigh;
  }

  /// Drives every pin, inputs included, to `state`.
  void ForceAllPins(State state);

 private:
  ChipId id_;
  std::vector<std::shared_ptr<Pin>> pins_;
};

/// Builds a chip for a saved type tag; returns nullptr for unknown tags.
/// Supplied by the caller of the board loader.
using ChipFactory =
    std::function<std::unique_ptr<Chip>(std::string_view type_tag)>;

}  // namespace breadsim
