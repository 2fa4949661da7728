#include "persist/board_file.h"

#include <format>
#include <fstream>
#include <sstream>

#include "persist/board_codec.h"

namespace breadsim {

IoStatus SaveBoard(const Board& board, const std::string& path,
                   DiagEngine& diag) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    diag.Error({}, std::format("cannot open '{}' for writing", path));
    return IoStatus::kIoError;
  }
  ofs << WriteBoardText(CaptureBoard(board));
  ofs.flush();
  if (!ofs) {
    diag.Error({}, std::format("failed writing '{}'", path));
    return IoStatus::kIoError;
  }
  return IoStatus::kOk;
}

IoStatus LoadBoard(const std::string& path, const ChipFactory& factory,
                   SourceManager& src_mgr, DiagEngine& diag, Board& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    diag.Error({}, std::format("cannot open file '{}'", path));
    return IoStatus::kIoError;
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  if (ifs.bad()) {
    diag.Error({}, std::format("failed reading '{}'", path));
    return IoStatus::kIoError;
  }
  return LoadBoardFromString(path, ss.str(), factory, src_mgr, diag, out);
}

IoStatus LoadBoardFromString(std::string name, std::string text,
                             const ChipFactory& factory,
                             SourceManager& src_mgr, DiagEngine& diag,
                             Board& out) {
  auto file_id = src_mgr.AddFile(std::move(name), std::move(text));
  SavedBoard saved;
  if (!ParseBoardText(file_id, src_mgr.FileContent(file_id), saved, diag)) {
    return IoStatus::kInvalidInput;
  }
  return BuildBoard(saved, factory, out, diag);
}

}  // namespace breadsim
