#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "simulation/chip.h"

namespace breadsim {

/// Builds any chip of this library by type tag, or nullptr for an unknown
/// tag. RAM chips are seeded from std::random_device.
std::unique_ptr<Chip> BuildBuiltinChip(std::string_view type_tag);

/// Same catalog, but RAM chips draw their seeds from a generator seeded
/// with `seed` so repeated runs randomize identically.
ChipFactory MakeBuiltinChipFactory(uint32_t seed);

}  // namespace breadsim
