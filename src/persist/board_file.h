#pragma once

#include <string>

#include "common/diagnostic.h"
#include "common/source_mgr.h"
#include "persist/saved_board.h"
#include "simulation/board.h"
#include "simulation/chip.h"

namespace breadsim {

/// Writes `board` to `path`. kIoError when the file cannot be written.
IoStatus SaveBoard(const Board& board, const std::string& path,
                   DiagEngine& diag);

/// Reads and rebuilds a board, replacing `out` on success. kIoError when the
/// file cannot be read, kInvalidInput when its content is malformed; `out` is
/// untouched on either failure.
IoStatus LoadBoard(const std::string& path, const ChipFactory& factory,
                   SourceManager& src_mgr, DiagEngine& diag, Board& out);

/// LoadBoard() on in-memory text; `name` is used in diagnostics.
IoStatus LoadBoardFromString(std::string name, std::string text,
                             const ChipFactory& factory,
                             SourceManager& src_mgr, DiagEngine& diag,
                             Board& out);

}  // namespace breadsim
