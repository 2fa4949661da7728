#pragma once

#include <cstdint>
#include <string_view>

#include "simulation/chip.h"

namespace breadsim {

// Power rail: pin 1 is always High, pin 2 always Low.
//
//        --------
//  VCC --|1    2|-- GND
//        --------
class Generator : public Chip {
 public:
  static constexpr std::string_view kTypeTag = "breadsim::Generator";
  static constexpr uint32_t kVcc = 1;
  static constexpr uint32_t kGnd = 2;

  Generator();

  std::string_view TypeTag() const override { return kTypeTag; }
  ChipInfo Info() const override;
  void Run(Duration elapsed) override;
};

}  // namespace breadsim
