#include "common/diagnostic.h"

#include <format>
#include <iostream>

namespace breadsim {

static const char* SeverityLabel(DiagSeverity sev) {
  switch (sev) {
    case DiagSeverity::kNote:
      return "note";
    case DiagSeverity::kWarning:
      return "warning";
    case DiagSeverity::kError:
      return "error";
    case DiagSeverity::kFatal:
      return "fatal error";
  }
  return "unknown";
}

void DiagEngine::Note(SourceLoc loc, std::string msg) {
  Emit(DiagSeverity::kNote, loc, std::move(msg));
}

void DiagEngine::Warning(SourceLoc loc, std::string msg) {
  if (warnings_as_errors_) {
    Emit(DiagSeverity::kError, loc, std::move(msg));
    return;
  }
  Emit(DiagSeverity::kWarning, loc, std::move(msg));
}

void DiagEngine::Error(SourceLoc loc, std::string msg) {
  Emit(DiagSeverity::kError, loc, std::move(msg));
}

void DiagEngine::Fatal(SourceLoc loc, std::string msg) {
  Emit(DiagSeverity::kFatal, loc, std::move(msg));
}

void DiagEngine::Emit(DiagSeverity sev, SourceLoc loc, std::string msg) {
  if (sev == DiagSeverity::kError || sev == DiagSeverity::kFatal) {
    ++error_count_;
  } else if (sev == DiagSeverity::kWarning) {
    ++warning_count_;
  }

  if (!quiet_) {
    if (!loc.IsValid()) {
      std::cerr << std::format("breadsim: {}: {}\n", SeverityLabel(sev), msg);
    } else {
      std::cerr << std::format("{}: {}: {}\n", src_mgr_.FormatLoc(loc),
                               SeverityLabel(sev), msg);
    }

    auto line_text = src_mgr_.GetLineText(loc);
    if (!line_text.empty()) {
      std::cerr << "  " << line_text << "\n";
      if (loc.column > 0) {
        std::cerr << "  " << std::string(loc.column - 1, ' ') << "^\n";
      }
    }
  }

  diags_.push_back({sev, loc, std::move(msg)});
}

}  // namespace breadsim
