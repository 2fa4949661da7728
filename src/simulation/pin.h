#pragma once

#include <cstdint>

#include "common/types.h"

namespace breadsim {

/// One chip terminal. Created by its chip and owned by it for the chip's
/// whole lifetime; traces only hold weak handles.
///
/// Write discipline: the owning chip writes the state of its Output pins,
/// traces write the state of every other pin. Chips may also switch a pin's
/// direction (bidirectional data buses) and force all pins when unpowered.
struct Pin {
  Pin(ChipId chip, uint32_t idx, PinType initial_type)
      : chip_id(chip), index(idx), type(initial_type) {}

  const ChipId chip_id;
  const uint32_t index;  // 1-based, as printed on the package.
  PinType type;
  State state = State::kUndefined;
};

}  // namespace breadsim
