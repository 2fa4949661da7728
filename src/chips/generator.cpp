#include "chips/generator.h"

namespace breadsim {

Generator::Generator() : Chip({PinType::kOutput, PinType::kOutput}) {
  SetPinState(kVcc, State::kHigh);
  SetPinState(kGnd, State::kLow);
}

ChipInfo Generator::Info() const {
  return {"Generator", "Provides a constant VCC (High) and GND (Low)", {}};
}

void Generator::Run(Duration /*elapsed*/) {
  SetPinState(kVcc, State::kHigh);
  SetPinState(kGnd, State::kLow);
}

}  // namespace breadsim
