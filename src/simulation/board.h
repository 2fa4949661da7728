#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "common/types.h"
#include "simulation/chip.h"
#include "simulation/socket.h"
#include "simulation/trace.h"

namespace breadsim {

// --- Board: owns sockets and traces and steps them in time ---
//
// One tick is strictly two-phase: every trace resolves (in creation order)
// using the pin states left by the previous tick, then every socket runs its
// chip (in creation order). A chain of N combinational chips therefore needs
// N ticks to settle.
//
// Traces and sockets are shared: callers keep the handles returned by the
// New*() calls to wire the board while the board iterates them.

class Board {
 public:
  std::shared_ptr<Trace> NewTrace();
  std::shared_ptr<Socket> NewSocket();
  std::shared_ptr<Socket> NewSocketWith(std::unique_ptr<Chip> chip);

  const std::vector<std::shared_ptr<Socket>>& Sockets() const {
    return sockets_;
  }
  const std::vector<std::shared_ptr<Trace>>& Traces() const { return traces_; }

  /// Live lookup by socket identity; nullptr when absent.
  std::shared_ptr<Socket> FindSocket(SocketId id) const;

  /// The chip with identity `id` mounted on any socket, or nullptr.
  Chip* FindChip(ChipId id) const;

  /// One tick.
  void Run(Duration elapsed);

  /// Ticks by `step` while the accumulated time is below `duration`. The
  /// check precedes each tick, so the last tick may end past `duration`
  /// (duration 10, step 3 runs four ticks and ends at 12). A non-positive
  /// step runs nothing.
  void RunDuring(Duration duration, Duration step);

  /// Ticks paced by wall-clock time until `duration` has passed. Each tick
  /// receives the measured gap since the previous poll as its elapsed time.
  void RunRealtime(Duration duration);

  /// Simulated time accumulated over every tick so far.
  Duration Elapsed() const { return elapsed_; }
  uint64_t TickCount() const { return tick_count_; }

  /// Invoked after every tick, once all chips have run.
  void SetTickCallback(std::function<void()> callback) {
    tick_callback_ = std::move(callback);
  }

 private:
  std::vector<std::shared_ptr<Trace>> traces_;
  std::vector<std::shared_ptr<Socket>> sockets_;
  std::function<void()> tick_callback_;
  Duration elapsed_{0};
  uint64_t tick_count_ = 0;
};

}  // namespace breadsim
