#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.h"
#include "simulation/chip.h"

namespace breadsim {

inline constexpr size_t kMemorySize = 256;

using MemoryImage = std::array<uint8_t, kMemorySize>;

// 256-byte RAM, DIP-22. CS, WE and OE are active low.
//
//        ---__---
//  !CS --|1   22|-- VCC
//  !WE --|2   21|-- UNUSED
//  !OE --|3   20|-- IO7
//   A0 --|4   19|-- IO6
//   A1 --|5   18|-- IO5
//   A2 --|6   17|-- IO4
//   A3 --|7   16|-- IO3
//   A4 --|8   15|-- IO2
//   A5 --|9   14|-- IO1
//   A6 --|10  13|-- IO0
//  GND --|11  12|-- A7
//        --------
namespace ram256b {
inline constexpr uint32_t kCs = 1;
inline constexpr uint32_t kWe = 2;
inline constexpr uint32_t kOe = 3;
inline constexpr uint32_t kA0 = 4;
inline constexpr uint32_t kA1 = 5;
inline constexpr uint32_t kA2 = 6;
inline constexpr uint32_t kA3 = 7;
inline constexpr uint32_t kA4 = 8;
inline constexpr uint32_t kA5 = 9;
inline constexpr uint32_t kA6 = 10;
inline constexpr uint32_t kGnd = 11;
inline constexpr uint32_t kA7 = 12;
inline constexpr uint32_t kIo0 = 13;
inline constexpr uint32_t kIo1 = 14;
inline constexpr uint32_t kIo2 = 15;
inline constexpr uint32_t kIo3 = 16;
inline constexpr uint32_t kIo4 = 17;
inline constexpr uint32_t kIo5 = 18;
inline constexpr uint32_t kIo6 = 19;
inline constexpr uint32_t kIo7 = 20;
inline constexpr uint32_t kVcc = 22;
}  // namespace ram256b

// 256-byte ROM: the RAM pinout with pin 2 unused.
namespace rom256b {
inline constexpr uint32_t kCs = 1;
inline constexpr uint32_t kOe = 3;
inline constexpr uint32_t kA0 = 4;
inline constexpr uint32_t kA6 = 10;
inline constexpr uint32_t kGnd = 11;
inline constexpr uint32_t kA7 = 12;
inline constexpr uint32_t kIo0 = 13;
inline constexpr uint32_t kIo7 = 20;
inline constexpr uint32_t kVcc = 22;
}  // namespace rom256b

/// Pin number carrying address bit `bit` (0..7). A7 sits on pin 12 because
/// GND takes pin 11.
uint32_t AddressPin(uint32_t bit);

/// Pin number carrying data bit `bit` (0..7).
uint32_t DataPin(uint32_t bit);

// --- Shared 256-byte memory package ---

class Memory256B : public Chip {
 public:
  const MemoryImage& Contents() const { return bytes_; }

 protected:
  Memory256B();

  uint8_t ReadAddress() const;
  uint8_t ReadDataBus() const;
  void SetDataBusType(PinType type);
  /// Switches IO0..IO7 to Output and drives `value` onto them.
  void DriveDataBus(uint8_t value);
  std::string HexDump() const;

  MemoryImage bytes_{};
};

// --- Ram256B ---
//
// The first powered tick fills the array with random bytes (uninitialized
// memory) and sets the powered flag. Losing power clears the flag and drives
// every pin Undefined, so the next power-up randomizes again.

class Ram256B : public Memory256B {
 public:
  static constexpr std::string_view kTypeTag = "breadsim::Ram256B";

  Ram256B();
  explicit Ram256B(uint32_t seed);

  std::string_view TypeTag() const override { return kTypeTag; }
  ChipInfo Info() const override;
  void Run(Duration elapsed) override;

  std::vector<std::string> SaveData() const override;
  bool LoadData(const std::vector<std::string>& data) override;

  bool Powered() const { return powered_; }

 private:
  std::mt19937 rng_;
  bool powered_ = false;
};

// --- Rom256B ---

class Rom256B : public Memory256B {
 public:
  static constexpr std::string_view kTypeTag = "breadsim::Rom256B";

  Rom256B() = default;
  explicit Rom256B(const MemoryImage& image) { LoadImage(image); }

  void LoadImage(const MemoryImage& image) { bytes_ = image; }

  std::string_view TypeTag() const override { return kTypeTag; }
  ChipInfo Info() const override;
  void Run(Duration elapsed) override;

  std::vector<std::string> SaveData() const override;
  bool LoadData(const std::vector<std::string>& data) override;
};

}  // namespace breadsim
