#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace breadsim {

// --- Three-value pin logic ---

enum class State : uint8_t {
  kHigh,
  kLow,
  kUndefined,
};

/// Direction of a pin. Bidirectional bus lines switch at runtime.
enum class PinType : uint8_t {
  kInput,
  kOutput,
  kUndefined,
};

/// High when bit `bit` of `byte` is set, Low otherwise.
State StateFromBit(uint8_t byte, uint32_t bit);

/// Single-character rendering used by dumps and VCD: '1', '0' or 'x'.
char StateChar(State state);

std::string_view StateName(State state);
std::string_view PinTypeName(PinType type);

// --- Identities ---

using ChipId = uint64_t;
using SocketId = uint64_t;

ChipId NextChipId();
SocketId NextSocketId();

// --- Simulated time ---

/// Elapsed time handed to every tick. Wall-clock pacing produces arbitrary
/// values, so chips must not assume a fixed step.
using Duration = std::chrono::nanoseconds;

}  // namespace breadsim
