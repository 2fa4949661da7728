#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.h"
#include "simulation/chip.h"

namespace breadsim {

/// Boolean function of one gate unit over its input states.
using GateFn = State (*)(std::span<const State> inputs);

// Powered gate functions. Anything that is not High counts as not-High, so
// Undefined inputs still yield High or Low.
State EvalAnd(std::span<const State> inputs);
State EvalNand(std::span<const State> inputs);
State EvalOr(std::span<const State> inputs);
State EvalNor(std::span<const State> inputs);
State EvalNot(std::span<const State> inputs);
// High only when every input reads Low.
State EvalAllLow(std::span<const State> inputs);

/// One gate inside a package: input pins feeding one output pin.
struct GateUnit {
  std::vector<uint32_t> inputs;
  uint32_t output = 0;
  GateFn fn = nullptr;
};

/// Data-driven description of a combinational gate package.
struct GateSpec {
  std::string type_tag;
  std::string name;
  std::string description;
  uint32_t pin_count = 14;
  uint32_t gnd = 7;
  uint32_t vcc = 14;
  std::vector<GateUnit> units;
  /// Value forced onto every pin while GND/VCC are not Low/High. OR-style
  /// packages fall to Low, AND-style packages to Undefined.
  State unpowered = State::kUndefined;
};

/// True when the power pins and every unit's pins lie in [1, pin_count] and
/// every unit has a function.
bool IsValidGateSpec(const GateSpec& spec);

// --- Gate: a package of independent combinational units ---
//
// The gate keeps its own copy of the spec. A gate built from an invalid spec
// holds every pin Undefined.

class Gate : public Chip {
 public:
  explicit Gate(GateSpec spec);

  std::string_view TypeTag() const override { return spec_.type_tag; }
  ChipInfo Info() const override;
  void Run(Duration elapsed) override;

  const GateSpec& Spec() const { return spec_; }

 private:
  GateSpec spec_;
  bool valid_;
  std::vector<State> inputs_;
};

// --- Catalog ---
//
// Pin numbers below follow the DIP-14 packages:
//
//        ---__---
//    1 --|      |-- 14 VCC
//    .   |      |   .
//  GND --|7    8|-- .
//        --------

namespace gate_or {
inline constexpr uint32_t kA = 1;
inline constexpr uint32_t kB = 2;
inline constexpr uint32_t kAOrB = 3;
inline constexpr uint32_t kC = 4;
inline constexpr uint32_t kD = 5;
inline constexpr uint32_t kCOrD = 6;
inline constexpr uint32_t kGnd = 7;
inline constexpr uint32_t kGOrH = 8;
inline constexpr uint32_t kH = 9;
inline constexpr uint32_t kG = 10;
inline constexpr uint32_t kEOrF = 11;
inline constexpr uint32_t kF = 12;
inline constexpr uint32_t kE = 13;
inline constexpr uint32_t kVcc = 14;
}  // namespace gate_or

namespace gate_and {
inline constexpr uint32_t kA = 1;
inline constexpr uint32_t kB = 2;
inline constexpr uint32_t kAAndB = 3;
inline constexpr uint32_t kC = 4;
inline constexpr uint32_t kD = 5;
inline constexpr uint32_t kCAndD = 6;
inline constexpr uint32_t kGnd = 7;
inline constexpr uint32_t kGAndH = 8;
inline constexpr uint32_t kH = 9;
inline constexpr uint32_t kG = 10;
inline constexpr uint32_t kEAndF = 11;
inline constexpr uint32_t kF = 12;
inline constexpr uint32_t kE = 13;
inline constexpr uint32_t kVcc = 14;
}  // namespace gate_and

// NAND shares the AND pinout.
namespace gate_nand {
inline constexpr uint32_t kA = 1;
inline constexpr uint32_t kB = 2;
inline constexpr uint32_t kNotAAndB = 3;
inline constexpr uint32_t kC = 4;
inline constexpr uint32_t kD = 5;
inline constexpr uint32_t kNotCAndD = 6;
inline constexpr uint32_t kGnd = 7;
inline constexpr uint32_t kNotGAndH = 8;
inline constexpr uint32_t kH = 9;
inline constexpr uint32_t kG = 10;
inline constexpr uint32_t kNotEAndF = 11;
inline constexpr uint32_t kF = 12;
inline constexpr uint32_t kE = 13;
inline constexpr uint32_t kVcc = 14;
}  // namespace gate_nand

namespace gate_nor {
inline constexpr uint32_t kNotAOrB = 1;
inline constexpr uint32_t kA = 2;
inline constexpr uint32_t kB = 3;
inline constexpr uint32_t kNotCOrD = 4;
inline constexpr uint32_t kC = 5;
inline constexpr uint32_t kD = 6;
inline constexpr uint32_t kGnd = 7;
inline constexpr uint32_t kH = 8;
inline constexpr uint32_t kG = 9;
inline constexpr uint32_t kNotGOrH = 10;
inline constexpr uint32_t kF = 11;
inline constexpr uint32_t kE = 12;
inline constexpr uint32_t kNotEOrF = 13;
inline constexpr uint32_t kVcc = 14;
}  // namespace gate_nor

namespace gate_not {
inline constexpr uint32_t kA = 1;
inline constexpr uint32_t kNotA = 2;
inline constexpr uint32_t kB = 3;
inline constexpr uint32_t kNotB = 4;
inline constexpr uint32_t kC = 5;
inline constexpr uint32_t kNotC = 6;
inline constexpr uint32_t kGnd = 7;
inline constexpr uint32_t kNotF = 8;
inline constexpr uint32_t kF = 9;
inline constexpr uint32_t kNotE = 10;
inline constexpr uint32_t kE = 11;
inline constexpr uint32_t kNotD = 12;
inline constexpr uint32_t kD = 13;
inline constexpr uint32_t kVcc = 14;
}  // namespace gate_not

// Shared by the 3-input AND, NAND and NOR packages.
namespace gate3 {
inline constexpr uint32_t kA = 1;
inline constexpr uint32_t kB = 2;
inline constexpr uint32_t kD = 3;
inline constexpr uint32_t kE = 4;
inline constexpr uint32_t kF = 5;
inline constexpr uint32_t kDEF = 6;
inline constexpr uint32_t kGnd = 7;
inline constexpr uint32_t kGHI = 8;
inline constexpr uint32_t kI = 9;
inline constexpr uint32_t kH = 10;
inline constexpr uint32_t kG = 11;
inline constexpr uint32_t kABC = 12;
inline constexpr uint32_t kC = 13;
inline constexpr uint32_t kVcc = 14;
}  // namespace gate3

const GateSpec& GateOrSpec();
const GateSpec& GateAndSpec();
const GateSpec& Gate3InputAndSpec();
const GateSpec& GateNotSpec();
const GateSpec& GateNorSpec();
const GateSpec& Gate3InputNorSpec();
const GateSpec& GateNandSpec();
const GateSpec& Gate3InputNandSpec();

/// Every gate package, in catalog order.
std::span<const GateSpec* const> GateCatalog();

/// Builds a gate for `spec`, or nullptr when the spec is invalid.
std::unique_ptr<Gate> MakeGate(const GateSpec& spec);

}  // namespace breadsim
