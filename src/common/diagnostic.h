#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/source_loc.h"
#include "common/source_mgr.h"

namespace breadsim {

enum class DiagSeverity : uint8_t {
  kNote,
  kWarning,
  kError,
  kFatal,
};

struct Diagnostic {
  DiagSeverity severity = DiagSeverity::kError;
  SourceLoc loc;
  std::string message;
};

/// Collects and prints diagnostics for board files and the command-line
/// driver. The tick loop itself never reports anything.
class DiagEngine {
 public:
  explicit DiagEngine(const SourceManager& src_mgr) : src_mgr_(src_mgr) {}

  void Note(SourceLoc loc, std::string msg);
  void Warning(SourceLoc loc, std::string msg);
  void Error(SourceLoc loc, std::string msg);
  void Fatal(SourceLoc loc, std::string msg);

  uint32_t ErrorCount() const { return error_count_; }
  uint32_t WarningCount() const { return warning_count_; }
  bool HasErrors() const { return error_count_ > 0; }

  const std::vector<Diagnostic>& Diagnostics() const { return diags_; }

  void SetWarningsAsErrors(bool val) { warnings_as_errors_ = val; }
  void SetQuiet(bool val) { quiet_ = val; }

 private:
  void Emit(DiagSeverity sev, SourceLoc loc, std::string msg);

  const SourceManager& src_mgr_;
  std::vector<Diagnostic> diags_;
  uint32_t error_count_ = 0;
  uint32_t warning_count_ = 0;
  bool warnings_as_errors_ = false;
  bool quiet_ = false;
};

}  // namespace breadsim
