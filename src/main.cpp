#include <chrono>
#include <cstdint>
#include <format>
#include <iostream>
#include <memory>
#include <string>

#include "chips/factory.h"
#include "cli/cli_options.h"
#include "common/diagnostic.h"
#include "common/source_mgr.h"
#include "persist/board_file.h"
#include "simulation/board.h"
#include "simulation/vcd_writer.h"

namespace {

void PrintVersion() {
  std::cout << "breadsim 0.1.0\n";
  std::cout << "Discrete-time breadboard logic simulator\n";
}

void PrintHelp() {
  PrintVersion();
  std::cout << "\nUsage: breadsim [options] <board-file>\n\n"
            << "Options:\n"
            << "  --duration <us>      Simulated time (default 1000)\n"
            << "  --step <us>          Tick size (default 1)\n"
            << "  --realtime           Pace ticks to wall-clock time\n"
            << "  --vcd <file>         Dump trace waveforms\n"
            << "  --save <file>        Save the board after the run\n"
            << "  --seed <n>           Seed for RAM randomization\n"
            << "  --info               Print chip info after the run\n"
            << "  -Werror              Treat warnings as errors\n"
            << "  --version / --help   Info\n";
}

void PrintChipInfo(const breadsim::Board& board) {
  size_t index = 0;
  for (const auto& socket : board.Sockets()) {
    const breadsim::Chip* chip = socket->GetChip();
    if (chip == nullptr) {
      std::cout << std::format("socket {}: empty\n", index++);
      continue;
    }
    auto info = chip->Info();
    std::cout << std::format("socket {}: {} ({})\n  {}\n", index++, info.name,
                             chip->TypeTag(), info.description);
    if (!info.data.empty()) {
      std::cout << info.data << "\n";
    }
  }
}

bool AttachVcd(const std::string& path, breadsim::Board& board,
               breadsim::VcdWriter& vcd, breadsim::DiagEngine& diag) {
  if (!vcd.IsOpen()) {
    diag.Error({}, std::format("cannot open VCD file '{}'", path));
    return false;
  }
  vcd.WriteHeader("1ns");
  vcd.BeginScope("board");
  size_t index = 0;
  for (const auto& trace : board.Traces()) {
    vcd.RegisterTrace(std::format("trace{}", index++), trace);
  }
  vcd.EndScope();
  vcd.EndDefinitions();
  vcd.WriteTimestamp(0);
  vcd.DumpAllValues();
  board.SetTickCallback([&board, &vcd]() {
    vcd.DumpChangedValues(static_cast<uint64_t>(board.Elapsed().count()));
  });
  return true;
}

int RunBoard(const breadsim::CliOptions& opts, breadsim::Board& board,
             breadsim::DiagEngine& diag) {
  std::unique_ptr<breadsim::VcdWriter> vcd;
  if (!opts.vcd_file.empty()) {
    vcd = std::make_unique<breadsim::VcdWriter>(opts.vcd_file);
    if (!AttachVcd(opts.vcd_file, board, *vcd, diag)) {
      return 1;
    }
  }

  auto duration = std::chrono::microseconds(opts.duration_us);
  if (opts.realtime) {
    board.RunRealtime(duration);
  } else {
    if (opts.step_us == 0) {
      diag.Warning({}, "--step 0 runs no ticks");
    }
    board.RunDuring(duration, std::chrono::microseconds(opts.step_us));
  }
  board.SetTickCallback(nullptr);

  if (opts.show_info) {
    PrintChipInfo(board);
  }
  if (!opts.save_file.empty() &&
      breadsim::SaveBoard(board, opts.save_file, diag) !=
          breadsim::IoStatus::kOk) {
    return 1;
  }
  return diag.HasErrors() ? 1 : 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
  breadsim::CliOptions opts;
  if (!breadsim::ParseArgs(argc, argv, opts)) {
    return 1;
  }
  if (opts.show_version) {
    PrintVersion();
    return 0;
  }
  if (opts.show_help || opts.board_file.empty()) {
    PrintHelp();
    return opts.show_help ? 0 : 1;
  }

  breadsim::SourceManager src_mgr;
  breadsim::DiagEngine diag(src_mgr);
  if (opts.werror) {
    diag.SetWarningsAsErrors(true);
  }

  breadsim::ChipFactory factory = opts.has_seed
                                      ? breadsim::MakeBuiltinChipFactory(
                                            opts.seed)
                                      : breadsim::ChipFactory(
                                            breadsim::BuildBuiltinChip);
  breadsim::Board board;
  if (breadsim::LoadBoard(opts.board_file, factory, src_mgr, diag, board) !=
      breadsim::IoStatus::kOk) {
    return 1;
  }
  return RunBoard(opts, board, diag);
}
