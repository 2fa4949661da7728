#include "chips/factory.h"

#include <random>

#include "chips/gate.h"
#include "chips/generator.h"
#include "chips/memory.h"

namespace breadsim {

static std::unique_ptr<Chip> BuildUnseededChip(std::string_view type_tag) {
  if (type_tag == Generator::kTypeTag) {
    return std::make_unique<Generator>();
  }
  if (type_tag == Rom256B::kTypeTag) {
    return std::make_unique<Rom256B>();
  }
  for (const GateSpec* spec : GateCatalog()) {
    if (spec->type_tag == type_tag) {
      return MakeGate(*spec);
    }
  }
  return nullptr;
}

std::unique_ptr<Chip> BuildBuiltinChip(std::string_view type_tag) {
  if (type_tag == Ram256B::kTypeTag) {
    return std::make_unique<Ram256B>();
  }
  return BuildUnseededChip(type_tag);
}

ChipFactory MakeBuiltinChipFactory(uint32_t seed) {
  auto seeds = std::make_shared<std::mt19937>(seed);
  return [seeds](std::string_view type_tag) -> std::unique_ptr<Chip> {
    if (type_tag == Ram256B::kTypeTag) {
      return std::make_unique<Ram256B>(static_cast<uint32_t>((*seeds)()));
    }
    return BuildUnseededChip(type_tag);
  };
}

}  // namespace breadsim
