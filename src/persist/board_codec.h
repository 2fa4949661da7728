#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "common/diagnostic.h"
#include "persist/saved_board.h"

namespace breadsim {

// Line-oriented text form of a SavedBoard:
//
//   breadsim-board 1
//   socket                      empty socket
//   socket <chip-id> <tag>      socket holding a chip
//   data <string>               chip data, in order, after its socket
//   trace <id>:<pin> ...        one trace
//
// '#' starts a comment line. Data strings escape '\', newline and carriage
// return.

inline constexpr std::string_view kBoardMagic = "breadsim-board";
inline constexpr uint32_t kBoardVersion = 1;

std::string WriteBoardText(const SavedBoard& board);

/// Parses `text` (registered as `file_id` in the diagnostics' source
/// manager). Returns false after reporting the first malformed line.
bool ParseBoardText(uint32_t file_id, std::string_view text, SavedBoard& out,
                    DiagEngine& diag);

std::string EscapeData(std::string_view raw);
/// Returns false on a dangling or unknown escape.
bool UnescapeData(std::string_view escaped, std::string& out);

}  // namespace breadsim
