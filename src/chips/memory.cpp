#include "chips/memory.h"

#include <format>
#include <optional>

namespace breadsim {

namespace {

constexpr uint32_t kMemoryPinCount = 22;
constexpr uint32_t kDataBits = 8;

std::vector<PinType> MemoryPinTypes() {
  std::vector<PinType> types(kMemoryPinCount, PinType::kInput);
  for (uint32_t bit = 0; bit < kDataBits; ++bit) {
    types[DataPin(bit) - 1] = PinType::kOutput;
  }
  return types;
}

std::string EncodeHex(const MemoryImage& bytes) {
  static constexpr char kDigits[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0xF]);
  }
  return out;
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::optional<MemoryImage> DecodeHex(std::string_view text) {
  if (text.size() != kMemorySize * 2) {
    return std::nullopt;
  }
  MemoryImage bytes{};
  for (size_t i = 0; i < kMemorySize; ++i) {
    int hi = HexDigit(text[2 * i]);
    int lo = HexDigit(text[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return bytes;
}

}  // namespace

uint32_t AddressPin(uint32_t bit) {
  return bit == 7 ? ram256b::kA7 : ram256b::kA0 + bit;
}

uint32_t DataPin(uint32_t bit) { return ram256b::kIo0 + bit; }

// --- Memory256B ---

Memory256B::Memory256B() : Chip(MemoryPinTypes()) {}

uint8_t Memory256B::ReadAddress() const {
  uint8_t addr = 0;
  for (uint32_t bit = 0; bit < kDataBits; ++bit) {
    if (PinState(AddressPin(bit)) == State::kHigh) {
      addr |= static_cast<uint8_t>(1u << bit);
    }
  }
  return addr;
}

uint8_t Memory256B::ReadDataBus() const {
  uint8_t data = 0;
  for (uint32_t bit = 0; bit < kDataBits; ++bit) {
    if (PinState(DataPin(bit)) == State::kHigh) {
      data |= static_cast<uint8_t>(1u << bit);
    }
  }
  return data;
}

void Memory256B::SetDataBusType(PinType type) {
  for (uint32_t bit = 0; bit < kDataBits; ++bit) {
    SetPinType(DataPin(bit), type);
  }
}

void Memory256B::DriveDataBus(uint8_t value) {
  for (uint32_t bit = 0; bit < kDataBits; ++bit) {
    SetPinType(DataPin(bit), PinType::kOutput);
    SetPinState(DataPin(bit), StateFromBit(value, bit));
  }
}

std::string Memory256B::HexDump() const {
  std::string out =
      "ADR| 00 01 02 03 04 05 06 07 08 09 0A 0B 0C 0D 0E 0F\n"
      "---+------------------------------------------------";
  for (size_t addr = 0; addr < bytes_.size(); ++addr) {
    if (addr % 16 == 0) {
      out += std::format("\n {:02X}|", addr);
    }
    out += std::format(" {:02X}", bytes_[addr]);
  }
  return out;
}

// --- Ram256B ---

Ram256B::Ram256B() : rng_(std::random_device{}()) {}

Ram256B::Ram256B(uint32_t seed) : rng_(seed) {}

ChipInfo Ram256B::Info() const {
  return {"Ram 256 Bytes",
          "A Random Access Memory chip holding 256 bytes of data.\n"
          "The data is lost when the chip is no longer powered.",
          HexDump()};
}

void Ram256B::Run(Duration /*elapsed*/) {
  if (!IsPowered(ram256b::kGnd, ram256b::kVcc)) {
    if (powered_) {
      ForceAllPins(State::kUndefined);
      powered_ = false;
    }
    return;
  }

  if (!powered_) {
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto& b : bytes_) {
      b = static_cast<uint8_t>(dist(rng_));
    }
    powered_ = true;
  }

  if (PinState(ram256b::kCs) != State::kLow) {
    SetDataBusType(PinType::kUndefined);
    return;
  }
  if (PinState(ram256b::kWe) == State::kLow) {
    SetDataBusType(PinType::kInput);
    bytes_[ReadAddress()] = ReadDataBus();
  }
  if (PinState(ram256b::kOe) == State::kLow) {
    DriveDataBus(bytes_[ReadAddress()]);
  }
}

std::vector<std::string> Ram256B::SaveData() const {
  return {EncodeHex(bytes_), powered_ ? "ON" : "OFF"};
}

bool Ram256B::LoadData(const std::vector<std::string>& data) {
  if (data.size() != 2 || (data[1] != "ON" && data[1] != "OFF")) {
    return false;
  }
  auto bytes = DecodeHex(data[0]);
  if (!bytes) {
    return false;
  }
  bytes_ = *bytes;
  powered_ = data[1] == "ON";
  return true;
}

// --- Rom256B ---

ChipInfo Rom256B::Info() const {
  return {"Rom 256 Bytes",
          "A Read Only Memory chip holding 256 bytes of data.\n"
          "The data is kept when the chip is no longer powered.",
          HexDump()};
}

void Rom256B::Run(Duration /*elapsed*/) {
  if (!IsPowered(rom256b::kGnd, rom256b::kVcc)) {
    ForceAllPins(State::kUndefined);
    return;
  }
  if (PinState(rom256b::kCs) != State::kLow) {
    SetDataBusType(PinType::kUndefined);
    return;
  }
  if (PinState(rom256b::kOe) == State::kLow) {
    DriveDataBus(bytes_[ReadAddress()]);
  }
}

std::vector<std::string> Rom256B::SaveData() const {
  return {EncodeHex(bytes_)};
}

bool Rom256B::LoadData(const std::vector<std::string>& data) {
  if (data.size() != 1) {
    return false;
  }
  auto bytes = DecodeHex(data[0]);
  if (!bytes) {
    return false;
  }
  bytes_ = *bytes;
  return true;
}

}  // namespace breadsim
