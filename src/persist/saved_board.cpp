#include "persist/saved_board.h"

#include <format>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace breadsim {

SavedBoard CaptureBoard(const Board& board) {
  SavedBoard saved;
  std::unordered_set<ChipId> mounted;
  for (const auto& socket : board.Sockets()) {
    SavedSocket record;
    if (const Chip* chip = socket->GetChip()) {
      record.chip = SavedChip{chip->Id(), std::string(chip->TypeTag()),
                              chip->SaveData()};
      mounted.insert(chip->Id());
    }
    saved.sockets.push_back(std::move(record));
  }
  for (const auto& trace : board.Traces()) {
    SavedTrace record;
    for (const auto& pin : trace->Pins()) {
      if (mounted.count(pin->chip_id) != 0) {
        record.pins.push_back({pin->chip_id, pin->index});
      }
    }
    saved.traces.push_back(std::move(record));
  }
  return saved;
}

IoStatus BuildBoard(const SavedBoard& saved, const ChipFactory& factory,
                    Board& out, DiagEngine& diag) {
  Board board;
  std::unordered_map<ChipId, Chip*> chips;
  std::unordered_set<ChipId> unknown;

  for (const auto& record : saved.sockets) {
    auto socket = board.NewSocket();
    if (!record.chip) {
      continue;
    }
    const SavedChip& saved_chip = *record.chip;
    if (chips.count(saved_chip.id) != 0 || unknown.count(saved_chip.id) != 0) {
      diag.Error(record.loc,
                 std::format("chip id {} is declared twice", saved_chip.id));
      return IoStatus::kInvalidInput;
    }
    std::unique_ptr<Chip> chip;
    if (factory) {
      chip = factory(saved_chip.type_tag);
    }
    if (!chip) {
      diag.Note(record.loc, std::format("unknown chip type '{}', socket left "
                                        "empty",
                                        saved_chip.type_tag));
      unknown.insert(saved_chip.id);
      continue;
    }
    if (!chip->LoadData(saved_chip.data)) {
      diag.Error(record.loc, std::format("invalid data for chip type '{}'",
                                         saved_chip.type_tag));
      return IoStatus::kInvalidInput;
    }
    chips[saved_chip.id] = chip.get();
    socket->Plug(std::move(chip));
  }

  for (const auto& record : saved.traces) {
    auto trace = board.NewTrace();
    for (const auto& ref : record.pins) {
      if (unknown.count(ref.chip) != 0) {
        continue;
      }
      auto it = chips.find(ref.chip);
      if (it == chips.end()) {
        diag.Error(record.loc,
                   std::format("trace references undeclared chip {}", ref.chip));
        return IoStatus::kInvalidInput;
      }
      if (!trace->Connect(*it->second, ref.pin)) {
        diag.Error(record.loc,
                   std::format("pin {} is out of range for chip {} ({} pins)",
                               ref.pin, ref.chip, it->second->PinCount()));
        return IoStatus::kInvalidInput;
      }
    }
  }
  out = std::move(board);
  return IoStatus::kOk;
}

}  // namespace breadsim
