#pragma once

#include <memory>

#include "common/types.h"
#include "simulation/chip.h"

namespace breadsim {

/// Mount point for at most one chip. The socket id is stable across
/// re-plugging and is only meaningful within a running board.
class Socket {
 public:
  Socket() : id_(NextSocketId()) {}

  SocketId Id() const { return id_; }

  /// Mounts `chip`, dropping the previous occupant if any.
  void Plug(std::unique_ptr<Chip> chip) { chip_ = std::move(chip); }
  std::unique_ptr<Chip> Unplug() { return std::move(chip_); }

  bool HasChip() const { return chip_ != nullptr; }
  Chip* GetChip() const { return chip_.get(); }

  void Run(Duration elapsed) {
    if (chip_) {
      chip_->Run(elapsed);
    }
  }

 private:
  SocketId id_;
  std::unique_ptr<Chip> chip_;
};

}  // namespace breadsim
