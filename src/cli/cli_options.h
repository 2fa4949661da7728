#pragma once

#include <cstdint>
#include <string>

namespace breadsim {

struct CliOptions {
  std::string board_file;
  std::string vcd_file;
  std::string save_file;
  uint64_t duration_us = 1000;
  uint64_t step_us = 1;
  uint32_t seed = 0;
  bool has_seed = false;
  bool realtime = false;
  bool show_info = false;
  bool werror = false;
  bool show_version = false;
  bool show_help = false;
};

/// Largest --duration or --step, in microseconds, that still fits the
/// nanosecond tick duration.
uint64_t MaxMicroseconds();

/// Parses the command line into `opts`. Reports the first problem on stderr
/// and returns false.
bool ParseArgs(int argc, const char* const argv[], CliOptions& opts);

}  // namespace breadsim
