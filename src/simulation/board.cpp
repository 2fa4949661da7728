#include "simulation/board.h"

#include <chrono>

namespace breadsim {

std::shared_ptr<Trace> Board::NewTrace() {
  traces_.push_back(std::make_shared<Trace>());
  return traces_.back();
}

std::shared_ptr<Socket> Board::NewSocket() {
  sockets_.push_back(std::make_shared<Socket>());
  return sockets_.back();
}

std::shared_ptr<Socket> Board::NewSocketWith(std::unique_ptr<Chip> chip) {
  auto socket = NewSocket();
  socket->Plug(std::move(chip));
  return socket;
}

std::shared_ptr<Socket> Board::FindSocket(SocketId id) const {
  for (const auto& socket : sockets_) {
    if (socket->Id() == id) {
      return socket;
    }
  }
  return nullptr;
}

Chip* Board::FindChip(ChipId id) const {
  for (const auto& socket : sockets_) {
    Chip* chip = socket->GetChip();
    if (chip != nullptr && chip->Id() == id) {
      return chip;
    }
  }
  return nullptr;
}

void Board::Run(Duration elapsed) {
  for (auto& trace : traces_) {
    trace->Communicate();
  }
  for (auto& socket : sockets_) {
    socket->Run(elapsed);
  }
  elapsed_ += elapsed;
  ++tick_count_;
  if (tick_callback_) {
    tick_callback_();
  }
}

void Board::RunDuring(Duration duration, Duration step) {
  if (step <= Duration::zero()) {
    return;
  }
  Duration elapsed{0};
  while (elapsed < duration) {
    Run(step);
    elapsed += step;
  }
}

void Board::RunRealtime(Duration duration) {
  using Clock = std::chrono::steady_clock;
  const auto start = Clock::now();
  auto previous = start;
  auto current = start;
  while (Clock::now() - start <= duration) {
    Run(std::chrono::duration_cast<Duration>(current - previous));
    previous = current;
    current = Clock::now();
  }
}

}  // namespace breadsim
