#pragma once

#include <initializer_list>
#include <string_view>
#include <vector>

#include "simulation/chip.h"

namespace breadsim {

/// Chip with caller-chosen pin types that records what it saw when run.
class ProbeChip : public Chip {
 public:
  explicit ProbeChip(std::initializer_list<PinType> types,
                     std::vector<ChipId>* run_log = nullptr)
      : Chip(types), run_log_(run_log) {}

  std::string_view TypeTag() const override { return "test::Probe"; }
  ChipInfo Info() const override { return {"Probe", "test chip", {}}; }

  void Run(Duration elapsed) override {
    ++runs;
    last_elapsed = elapsed;
    seen.clear();
    for (uint32_t i = 1; i <= PinCount(); ++i) {
      seen.push_back(PinState(i));
    }
    if (run_log_ != nullptr) {
      run_log_->push_back(Id());
    }
  }

  void Set(uint32_t index, State state) { SetPinState(index, state); }

  int runs = 0;
  Duration last_elapsed{0};
  std::vector<State> seen;

 private:
  std::vector<ChipId>* run_log_;
};

}  // namespace breadsim
