#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/diagnostic.h"
#include "common/source_loc.h"
#include "common/types.h"
#include "simulation/board.h"
#include "simulation/chip.h"

namespace breadsim {

enum class IoStatus : uint8_t {
  kOk,
  kIoError,       // The file could not be opened, read or written.
  kInvalidInput,  // The content is malformed or inconsistent.
};

// --- Saved-board records ---
//
// Topology is stored by position: sockets in board order, traces as lists of
// (chip id, pin) references. Chip ids are those of the saving process and
// are remapped when the board is rebuilt.

struct SavedPinRef {
  ChipId chip = 0;
  uint32_t pin = 0;
};

struct SavedChip {
  ChipId id = 0;
  std::string type_tag;
  std::vector<std::string> data;
};

struct SavedSocket {
  std::optional<SavedChip> chip;
  SourceLoc loc;
};

struct SavedTrace {
  std::vector<SavedPinRef> pins;
  SourceLoc loc;
};

struct SavedBoard {
  std::vector<SavedSocket> sockets;
  std::vector<SavedTrace> traces;
};

/// Snapshot of a board's topology and chip data. Trace pins belonging to
/// chips not mounted on the board are left out.
SavedBoard CaptureBoard(const Board& board);

/// Rebuilds `saved` and replaces `out` with the result. Chips whose type tag
/// the factory does not know leave their socket empty and their trace
/// references are dropped; that is reported as a note, not an error. On
/// failure `out` is left untouched.
IoStatus BuildBoard(const SavedBoard& saved, const ChipFactory& factory,
                    Board& out, DiagEngine& diag);

}  // namespace breadsim
