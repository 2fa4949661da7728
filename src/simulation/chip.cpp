#include "simulation/chip.h"

namespace breadsim {

Chip::Chip(std::initializer_list<PinType> pin_types)
    : Chip(std::vector<PinType>(pin_types)) {}

Chip::Chip(const std::vector<PinType>& pin_types) : id_(NextChipId()) {
  pins_.reserve(pin_types.size());
  uint32_t index = 1;
  for (PinType type : pin_types) {
    pins_.push_back(std::make_shared<Pin>(id_, index++, type));
  }
}

std::shared_ptr<Pin> Chip::GetPin(uint32_t index) const {
  if (index == 0 || index > pins_.size()) {
    return nullptr;
  }
  return pins_[index - 1];
}

void Chip::ForceAllPins(State state) {
  for (auto& pin : pins_) {
    pin->state = state;
  }
}

}  // namespace breadsim
