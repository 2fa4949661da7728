#include <gtest/gtest.h>

#include <memory>

#include "chips/memory.h"

using namespace breadsim;
using std::chrono::nanoseconds;

namespace {

void SetPin(Chip& chip, uint32_t index, State state) {
  chip.GetPin(index)->state = state;
}

void SetAddress(Chip& chip, uint8_t addr) {
  for (uint32_t bit = 0; bit < 8; ++bit) {
    SetPin(chip, AddressPin(bit), StateFromBit(addr, bit));
  }
}

void SetData(Chip& chip, uint8_t value) {
  for (uint32_t bit = 0; bit < 8; ++bit) {
    SetPin(chip, DataPin(bit), StateFromBit(value, bit));
  }
}

uint8_t ReadData(const Chip& chip) {
  uint8_t value = 0;
  for (uint32_t bit = 0; bit < 8; ++bit) {
    if (chip.GetPin(DataPin(bit))->state == State::kHigh) {
      value |= static_cast<uint8_t>(1u << bit);
    }
  }
  return value;
}

void PowerRam(Chip& ram) {
  SetPin(ram, ram256b::kGnd, State::kLow);
  SetPin(ram, ram256b::kVcc, State::kHigh);
}

void WriteCycle(Ram256B& ram, uint8_t addr, uint8_t value) {
  SetPin(ram, ram256b::kCs, State::kLow);
  SetPin(ram, ram256b::kWe, State::kLow);
  SetPin(ram, ram256b::kOe, State::kHigh);
  SetAddress(ram, addr);
  SetData(ram, value);
  ram.Run(nanoseconds(1));
}

uint8_t ReadCycle(Memory256B& mem, uint8_t addr) {
  SetPin(mem, ram256b::kCs, State::kLow);
  SetPin(mem, ram256b::kWe, State::kHigh);
  SetPin(mem, ram256b::kOe, State::kLow);
  SetAddress(mem, addr);
  mem.Run(nanoseconds(1));
  return ReadData(mem);
}

MemoryImage CountingImage() {
  MemoryImage image{};
  for (size_t i = 0; i < image.size(); ++i) {
    image[i] = static_cast<uint8_t>(255 - i);
  }
  return image;
}

}  // namespace

// --- Pinout ---

TEST(Memory, AddressPinSkipsGround) {
  EXPECT_EQ(AddressPin(0), ram256b::kA0);
  EXPECT_EQ(AddressPin(6), ram256b::kA6);
  EXPECT_EQ(AddressPin(7), ram256b::kA7);
  EXPECT_EQ(AddressPin(7), 12u);
  EXPECT_EQ(DataPin(0), ram256b::kIo0);
  EXPECT_EQ(DataPin(7), ram256b::kIo7);
}

TEST(Memory, InitialPinTypes) {
  Ram256B ram(1);
  EXPECT_EQ(ram.PinCount(), 22u);
  EXPECT_EQ(ram.GetPin(ram256b::kCs)->type, PinType::kInput);
  EXPECT_EQ(ram.GetPin(ram256b::kIo0)->type, PinType::kOutput);
  EXPECT_EQ(ram.GetPin(ram256b::kIo7)->type, PinType::kOutput);
  EXPECT_EQ(ram.GetPin(ram256b::kVcc)->type, PinType::kInput);
  EXPECT_EQ(ram.GetPin(23), nullptr);
}

// --- Ram256B ---

TEST(Ram, WriteThenReadEveryAddressAndValue) {
  Ram256B ram(7);
  PowerRam(ram);
  for (int addr = 0; addr < 256; ++addr) {
    for (int value = 0; value < 256; ++value) {
      WriteCycle(ram, static_cast<uint8_t>(addr), static_cast<uint8_t>(value));
      ASSERT_EQ(ReadCycle(ram, static_cast<uint8_t>(addr)), value)
          << "address " << addr;
    }
  }
}

TEST(Ram, WriteSwitchesBusToInput) {
  Ram256B ram(1);
  PowerRam(ram);
  WriteCycle(ram, 0x10, 0x5A);
  for (uint32_t bit = 0; bit < 8; ++bit) {
    EXPECT_EQ(ram.GetPin(DataPin(bit))->type, PinType::kInput);
  }
  EXPECT_EQ(ram.Contents()[0x10], 0x5A);
}

TEST(Ram, ReadSwitchesBusToOutput) {
  Ram256B ram(1);
  PowerRam(ram);
  WriteCycle(ram, 0x80, 0xC3);
  EXPECT_EQ(ReadCycle(ram, 0x80), 0xC3);
  for (uint32_t bit = 0; bit < 8; ++bit) {
    EXPECT_EQ(ram.GetPin(DataPin(bit))->type, PinType::kOutput);
  }
}

TEST(Ram, DeselectedFloatsBus) {
  Ram256B ram(1);
  PowerRam(ram);
  SetPin(ram, ram256b::kCs, State::kHigh);
  SetPin(ram, ram256b::kWe, State::kLow);
  SetData(ram, 0xFF);
  ram.Run(nanoseconds(1));
  for (uint32_t bit = 0; bit < 8; ++bit) {
    EXPECT_EQ(ram.GetPin(DataPin(bit))->type, PinType::kUndefined);
  }
}

TEST(Ram, DeselectedIgnoresWrites) {
  Ram256B ram(1);
  PowerRam(ram);
  WriteCycle(ram, 3, 0x11);
  SetPin(ram, ram256b::kCs, State::kHigh);
  SetData(ram, 0x22);
  ram.Run(nanoseconds(1));
  EXPECT_EQ(ram.Contents()[3], 0x11);
}

TEST(Ram, FirstPowerUpRandomizesOnce) {
  Ram256B a(42);
  Ram256B b(42);
  EXPECT_FALSE(a.Powered());
  PowerRam(a);
  PowerRam(b);
  SetPin(a, ram256b::kCs, State::kHigh);
  SetPin(b, ram256b::kCs, State::kHigh);
  a.Run(nanoseconds(1));
  b.Run(nanoseconds(1));
  EXPECT_TRUE(a.Powered());
  EXPECT_EQ(a.Contents(), b.Contents());

  auto snapshot = a.Contents();
  a.Run(nanoseconds(1));
  a.Run(nanoseconds(1));
  EXPECT_EQ(a.Contents(), snapshot);
}

TEST(Ram, PowerLossClearsFlagAndFloatsPins) {
  Ram256B ram(3);
  PowerRam(ram);
  for (int addr = 0; addr < 256; ++addr) {
    WriteCycle(ram, static_cast<uint8_t>(addr), 0xAA);
  }

  SetPin(ram, ram256b::kVcc, State::kLow);
  ram.Run(nanoseconds(1));
  EXPECT_FALSE(ram.Powered());
  for (uint32_t i = 1; i <= ram.PinCount(); ++i) {
    EXPECT_EQ(ram.GetPin(i)->state, State::kUndefined) << "pin " << i;
  }

  PowerRam(ram);
  SetPin(ram, ram256b::kCs, State::kHigh);
  ram.Run(nanoseconds(1));
  EXPECT_TRUE(ram.Powered());
  int unchanged = 0;
  for (uint8_t b : ram.Contents()) {
    unchanged += (b == 0xAA) ? 1 : 0;
  }
  EXPECT_LT(unchanged, 256);
}

TEST(Ram, SaveAndLoadData) {
  Ram256B ram(5);
  PowerRam(ram);
  WriteCycle(ram, 0x42, 0x99);
  auto data = ram.SaveData();
  ASSERT_EQ(data.size(), 2u);
  EXPECT_EQ(data[0].size(), 512u);
  EXPECT_EQ(data[1], "ON");

  Ram256B copy(6);
  ASSERT_TRUE(copy.LoadData(data));
  EXPECT_EQ(copy.Contents(), ram.Contents());
  EXPECT_TRUE(copy.Powered());
}

TEST(Ram, LoadDataRejectsMalformed) {
  Ram256B ram(5);
  auto before = ram.Contents();
  EXPECT_FALSE(ram.LoadData({}));
  EXPECT_FALSE(ram.LoadData({std::string(512, '0')}));
  EXPECT_FALSE(ram.LoadData({std::string(510, '0'), "OFF"}));
  EXPECT_FALSE(ram.LoadData({std::string(512, 'Z'), "OFF"}));
  EXPECT_FALSE(ram.LoadData({std::string(512, '0'), "MAYBE"}));
  EXPECT_EQ(ram.Contents(), before);
  EXPECT_FALSE(ram.Powered());
}

TEST(Ram, InfoDumpsContents) {
  Ram256B ram(1);
  auto info = ram.Info();
  EXPECT_EQ(info.name, "Ram 256 Bytes");
  EXPECT_NE(info.data.find("ADR| 00 01"), std::string::npos);
  EXPECT_NE(info.data.find(" F0|"), std::string::npos);
}

// --- Rom256B ---

TEST(Rom, ReadsPreloadedImage) {
  Rom256B rom(CountingImage());
  PowerRam(rom);
  for (int addr = 0; addr < 256; ++addr) {
    EXPECT_EQ(ReadCycle(rom, static_cast<uint8_t>(addr)), 255 - addr);
  }
}

TEST(Rom, PinsCannotAlterContents) {
  Rom256B rom(CountingImage());
  PowerRam(rom);
  for (int addr = 0; addr < 256; addr += 17) {
    // Pin 2 is write-enable on the RAM; here it is unused.
    SetPin(rom, ram256b::kWe, State::kLow);
    SetPin(rom, rom256b::kCs, State::kLow);
    SetPin(rom, rom256b::kOe, State::kHigh);
    SetAddress(rom, static_cast<uint8_t>(addr));
    SetData(rom, 0x00);
    rom.Run(nanoseconds(1));
  }
  SetPin(rom, rom256b::kGnd, State::kHigh);
  rom.Run(nanoseconds(1));
  EXPECT_EQ(rom.Contents(), CountingImage());
}

TEST(Rom, UnpoweredFloatsEveryPin) {
  Rom256B rom(CountingImage());
  rom.Run(nanoseconds(1));
  for (uint32_t i = 1; i <= rom.PinCount(); ++i) {
    EXPECT_EQ(rom.GetPin(i)->state, State::kUndefined);
  }
}

TEST(Rom, SaveAndLoadData) {
  Rom256B rom(CountingImage());
  Rom256B copy;
  ASSERT_TRUE(copy.LoadData(rom.SaveData()));
  EXPECT_EQ(copy.Contents(), CountingImage());
  EXPECT_FALSE(copy.LoadData({"00"}));
}
