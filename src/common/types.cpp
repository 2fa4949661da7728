#include "common/types.h"

namespace breadsim {

State StateFromBit(uint8_t byte, uint32_t bit) {
  return ((byte >> bit) & 1u) != 0 ? State::kHigh : State::kLow;
}

char StateChar(State state) {
  switch (state) {
    case State::kHigh:
      return '1';
    case State::kLow:
      return '0';
    case State::kUndefined:
      return 'x';
  }
  return 'x';
}

std::string_view StateName(State state) {
  switch (state) {
    case State::kHigh:
      return "High";
    case State::kLow:
      return "Low";
    case State::kUndefined:
      return "Undefined";
  }
  return "Undefined";
}

std::string_view PinTypeName(PinType type) {
  switch (type) {
    case PinType::kInput:
      return "Input";
    case PinType::kOutput:
      return "Output";
    case PinType::kUndefined:
      return "Undefined";
  }
  return "Undefined";
}

// Identities are only unique within one process; saved boards reference chips
// by the id they had when written and are remapped on load.

ChipId NextChipId() {
  static ChipId next = 0;
  return ++next;
}

SocketId NextSocketId() {
  static SocketId next = 0;
  return ++next;
}

}  // namespace breadsim
