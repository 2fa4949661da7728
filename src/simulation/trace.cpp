#include "simulation/trace.h"

namespace breadsim {

State ResolveWired(State acc, State driver) {
  if (acc == State::kHigh || driver == State::kHigh) {
    return State::kHigh;
  }
  if (acc == State::kLow || driver == State::kLow) {
    return State::kLow;
  }
  return State::kUndefined;
}

void Trace::Connect(const std::shared_ptr<Pin>& pin) {
  if (pin) {
    link_.push_back(pin);
  }
}

bool Trace::Connect(const Chip& chip, uint32_t index) {
  auto pin = chip.GetPin(index);
  if (!pin) {
    return false;
  }
  link_.push_back(pin);
  return true;
}

void Trace::Communicate() {
  State bus = State::kUndefined;
  for (const auto& weak : link_) {
    auto pin = weak.lock();
    if (pin && pin->type == PinType::kOutput) {
      bus = ResolveWired(bus, pin->state);
    }
  }
  resolved_ = bus;

  for (const auto& weak : link_) {
    auto pin = weak.lock();
    if (pin && pin->type != PinType::kOutput) {
      pin->state = bus;
    }
  }
}

std::vector<std::shared_ptr<Pin>> Trace::Pins() const {
  std::vector<std::shared_ptr<Pin>> live;
  live.reserve(link_.size());
  for (const auto& weak : link_) {
    if (auto pin = weak.lock()) {
      live.push_back(std::move(pin));
    }
  }
  return live;
}

}  // namespace breadsim
