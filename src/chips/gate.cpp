#include "chips/gate.h"

#include <algorithm>
#include <array>
#include <utility>

namespace breadsim {

// --- Gate functions ---

State EvalAnd(std::span<const State> inputs) {
  bool all_high = std::all_of(inputs.begin(), inputs.end(),
                              [](State s) { return s == State::kHigh; });
  return all_high ? State::kHigh : State::kLow;
}

State EvalNand(std::span<const State> inputs) {
  return EvalAnd(inputs) == State::kHigh ? State::kLow : State::kHigh;
}

State EvalOr(std::span<const State> inputs) {
  bool any_high = std::any_of(inputs.begin(), inputs.end(),
                              [](State s) { return s == State::kHigh; });
  return any_high ? State::kHigh : State::kLow;
}

State EvalNor(std::span<const State> inputs) {
  return EvalOr(inputs) == State::kHigh ? State::kLow : State::kHigh;
}

State EvalNot(std::span<const State> inputs) {
  return EvalOr(inputs) == State::kHigh ? State::kLow : State::kHigh;
}

State EvalAllLow(std::span<const State> inputs) {
  bool all_low = std::all_of(inputs.begin(), inputs.end(),
                             [](State s) { return s == State::kLow; });
  return all_low ? State::kHigh : State::kLow;
}

// --- Gate ---

namespace {

bool PinInRange(const GateSpec& spec, uint32_t pin) {
  return pin >= 1 && pin <= spec.pin_count;
}

std::vector<PinType> GatePinTypes(const GateSpec& spec) {
  std::vector<PinType> types(spec.pin_count, PinType::kInput);
  for (const auto& unit : spec.units) {
    if (PinInRange(spec, unit.output)) {
      types[unit.output - 1] = PinType::kOutput;
    }
  }
  return types;
}

}  // namespace

bool IsValidGateSpec(const GateSpec& spec) {
  if (!PinInRange(spec, spec.gnd) || !PinInRange(spec, spec.vcc)) {
    return false;
  }
  for (const auto& unit : spec.units) {
    if (unit.fn == nullptr || !PinInRange(spec, unit.output)) {
      return false;
    }
    for (uint32_t pin : unit.inputs) {
      if (!PinInRange(spec, pin)) {
        return false;
      }
    }
  }
  return true;
}

Gate::Gate(GateSpec spec)
    : Chip(GatePinTypes(spec)),
      spec_(std::move(spec)),
      valid_(IsValidGateSpec(spec_)) {}

ChipInfo Gate::Info() const { return {spec_.name, spec_.description, {}}; }

void Gate::Run(Duration /*elapsed*/) {
  if (!valid_) {
    ForceAllPins(State::kUndefined);
    return;
  }
  if (!IsPowered(spec_.gnd, spec_.vcc)) {
    ForceAllPins(spec_.unpowered);
    return;
  }
  for (const auto& unit : spec_.units) {
    inputs_.clear();
    for (uint32_t pin : unit.inputs) {
      inputs_.push_back(PinState(pin));
    }
    SetPinState(unit.output, unit.fn(inputs_));
  }
}

// --- Catalog ---

const GateSpec& GateOrSpec() {
  static const GateSpec spec{
      "breadsim::GateOr",
      "Gate OR",
      "A 4-in-one OR gate chip",
      14,
      gate_or::kGnd,
      gate_or::kVcc,
      {{{gate_or::kA, gate_or::kB}, gate_or::kAOrB, EvalOr},
       {{gate_or::kC, gate_or::kD}, gate_or::kCOrD, EvalOr},
       {{gate_or::kE, gate_or::kF}, gate_or::kEOrF, EvalOr},
       {{gate_or::kG, gate_or::kH}, gate_or::kGOrH, EvalOr}},
      State::kLow,
  };
  return spec;
}

const GateSpec& GateAndSpec() {
  static const GateSpec spec{
      "breadsim::GateAnd",
      "Gate AND",
      "A 4-in-one AND gate chip",
      14,
      gate_and::kGnd,
      gate_and::kVcc,
      {{{gate_and::kA, gate_and::kB}, gate_and::kAAndB, EvalAnd},
       {{gate_and::kC, gate_and::kD}, gate_and::kCAndD, EvalAnd},
       {{gate_and::kE, gate_and::kF}, gate_and::kEAndF, EvalAnd},
       {{gate_and::kG, gate_and::kH}, gate_and::kGAndH, EvalAnd}},
      State::kUndefined,
  };
  return spec;
}

const GateSpec& Gate3InputAndSpec() {
  static const GateSpec spec{
      "breadsim::Gate3InputAnd",
      "Gate 3-Input AND",
      "A 3-in-one 3-input AND gate chip",
      14,
      gate3::kGnd,
      gate3::kVcc,
      {{{gate3::kA, gate3::kB, gate3::kC}, gate3::kABC, EvalAnd},
       {{gate3::kD, gate3::kE, gate3::kF}, gate3::kDEF, EvalAnd},
       {{gate3::kG, gate3::kH, gate3::kI}, gate3::kGHI, EvalAnd}},
      State::kUndefined,
  };
  return spec;
}

const GateSpec& GateNotSpec() {
  static const GateSpec spec{
      "breadsim::GateNot",
      "Gate NOT",
      "A 6-in-one NOT gate chip",
      14,
      gate_not::kGnd,
      gate_not::kVcc,
      {{{gate_not::kA}, gate_not::kNotA, EvalNot},
       {{gate_not::kB}, gate_not::kNotB, EvalNot},
       {{gate_not::kC}, gate_not::kNotC, EvalNot},
       {{gate_not::kD}, gate_not::kNotD, EvalNot},
       {{gate_not::kE}, gate_not::kNotE, EvalNot},
       {{gate_not::kF}, gate_not::kNotF, EvalNot}},
      State::kUndefined,
  };
  return spec;
}

const GateSpec& GateNorSpec() {
  static const GateSpec spec{
      "breadsim::GateNor",
      "Gate NOR",
      "A 4-in-one NOR gate chip",
      14,
      gate_nor::kGnd,
      gate_nor::kVcc,
      {{{gate_nor::kA, gate_nor::kB}, gate_nor::kNotAOrB, EvalNor},
       {{gate_nor::kC, gate_nor::kD}, gate_nor::kNotCOrD, EvalNor},
       {{gate_nor::kE, gate_nor::kF}, gate_nor::kNotEOrF, EvalNor},
       {{gate_nor::kG, gate_nor::kH}, gate_nor::kNotGOrH, EvalNor}},
      State::kLow,
  };
  return spec;
}

const GateSpec& Gate3InputNorSpec() {
  static const GateSpec spec{
      "breadsim::Gate3InputNor",
      "Gate 3-Input NOR",
      "A 3-in-one 3-input NOR gate chip",
      14,
      gate3::kGnd,
      gate3::kVcc,
      {{{gate3::kA, gate3::kB, gate3::kC}, gate3::kABC, EvalAllLow},
       {{gate3::kD, gate3::kE, gate3::kF}, gate3::kDEF, EvalAllLow},
       {{gate3::kG, gate3::kH, gate3::kI}, gate3::kGHI, EvalAllLow}},
      State::kLow,
  };
  return spec;
}

const GateSpec& GateNandSpec() {
  static const GateSpec spec{
      "breadsim::GateNand",
      "Gate NAND",
      "A 4-in-one NAND gate chip",
      14,
      gate_nand::kGnd,
      gate_nand::kVcc,
      {{{gate_nand::kA, gate_nand::kB}, gate_nand::kNotAAndB, EvalNand},
       {{gate_nand::kC, gate_nand::kD}, gate_nand::kNotCAndD, EvalNand},
       {{gate_nand::kE, gate_nand::kF}, gate_nand::kNotEAndF, EvalNand},
       {{gate_nand::kG, gate_nand::kH}, gate_nand::kNotGAndH, EvalNand}},
      State::kUndefined,
  };
  return spec;
}

const GateSpec& Gate3InputNandSpec() {
  static const GateSpec spec{
      "breadsim::Gate3InputNand",
      "Gate 3-Input NAND",
      "A 3-in-one 3-input NAND gate chip",
      14,
      gate3::kGnd,
      gate3::kVcc,
      {{{gate3::kA, gate3::kB, gate3::kC}, gate3::kABC, EvalNand},
       {{gate3::kD, gate3::kE, gate3::kF}, gate3::kDEF, EvalNand},
       {{gate3::kG, gate3::kH, gate3::kI}, gate3::kGHI, EvalNand}},
      State::kUndefined,
  };
  return spec;
}

std::span<const GateSpec* const> GateCatalog() {
  static const std::array<const GateSpec*, 8> catalog{
      &GateOrSpec(),  &GateAndSpec(),      &Gate3InputAndSpec(),
      &GateNotSpec(), &GateNorSpec(),      &Gate3InputNorSpec(),
      &GateNandSpec(), &Gate3InputNandSpec(),
  };
  return catalog;
}

std::unique_ptr<Gate> MakeGate(const GateSpec& spec) {
  if (!IsValidGateSpec(spec)) {
    return nullptr;
  }
  return std::make_unique<Gate>(spec);
}

}  // namespace breadsim
