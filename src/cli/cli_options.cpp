#include "cli/cli_options.h"

#include <charconv>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "common/types.h"

namespace breadsim {

uint64_t MaxMicroseconds() {
  return static_cast<uint64_t>(Duration::max().count()) / 1000;
}

namespace {

template <typename T>
bool ParseNumberArg(std::string_view name, std::string_view text, T& out,
                    T max_value) {
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, out);
  if (ec != std::errc() || ptr != end) {
    std::cerr << "invalid value for " << name << ": " << text << "\n";
    return false;
  }
  if (out > max_value) {
    std::cerr << "value for " << name << " is too large: " << text
              << " (max " << max_value << ")\n";
    return false;
  }
  return true;
}

bool IsValuedOption(std::string_view arg) {
  return arg == "--vcd" || arg == "--save" || arg == "--duration" ||
         arg == "--step" || arg == "--seed";
}

// Returns 1 when consumed, 0 when not a valued option, -1 on a missing or
// bad value.
int TryParseValuedArg(std::string_view arg, int& i, int argc,
                      const char* const argv[], CliOptions& opts) {
  if (!IsValuedOption(arg)) {
    return 0;
  }
  if (i + 1 >= argc) {
    std::cerr << "missing value for " << arg << "\n";
    return -1;
  }
  std::string_view value = argv[++i];
  if (arg == "--vcd") {
    opts.vcd_file = std::string(value);
    return 1;
  }
  if (arg == "--save") {
    opts.save_file = std::string(value);
    return 1;
  }
  if (arg == "--duration") {
    return ParseNumberArg(arg, value, opts.duration_us, MaxMicroseconds())
               ? 1
               : -1;
  }
  if (arg == "--step") {
    return ParseNumberArg(arg, value, opts.step_us, MaxMicroseconds()) ? 1
                                                                       : -1;
  }
  opts.has_seed = true;
  return ParseNumberArg(arg, value, opts.seed,
                        std::numeric_limits<uint32_t>::max()) ? 1 : -1;
}

bool TryParseFlag(std::string_view arg, CliOptions& opts) {
  if (arg == "--version") {
    opts.show_version = true;
    return true;
  }
  if (arg == "--help") {
    opts.show_help = true;
    return true;
  }
  if (arg == "--realtime") {
    opts.realtime = true;
    return true;
  }
  if (arg == "--info") {
    opts.show_info = true;
    return true;
  }
  if (arg == "-Werror") {
    opts.werror = true;
    return true;
  }
  return false;
}

}  // namespace

bool ParseArgs(int argc, const char* const argv[], CliOptions& opts) {
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (TryParseFlag(arg, opts)) {
      continue;
    }
    int valued = TryParseValuedArg(arg, i, argc, argv, opts);
    if (valued < 0) {
      return false;
    }
    if (valued > 0) {
      continue;
    }
    if (arg.starts_with("-")) {
      std::cerr << "unknown option: " << arg << "\n";
      return false;
    }
    if (!opts.board_file.empty()) {
      std::cerr << "only one board file may be given\n";
      return false;
    }
    opts.board_file = std::string(arg);
  }
  return true;
}

}  // namespace breadsim
