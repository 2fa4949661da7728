#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.h"

namespace breadsim {

class Trace;

/// VCD signal entry: maps a trace to a VCD identifier.
struct VcdSignal {
  std::string name;
  std::shared_ptr<const Trace> trace;
  std::string ident;
  char last = '\0';  // Last value written, '\0' before the first dump.
};

/// Writes the resolved state of board traces as 1-bit VCD wires.
class VcdWriter {
 public:
  explicit VcdWriter(const std::string& filename);
  ~VcdWriter();

  VcdWriter(const VcdWriter&) = delete;
  VcdWriter& operator=(const VcdWriter&) = delete;

  bool IsOpen() const { return ofs_.is_open(); }

  void WriteHeader(std::string_view timescale);
  void BeginScope(std::string_view name);
  void EndScope();
  void RegisterTrace(std::string_view name, std::shared_ptr<const Trace> trace);
  void EndDefinitions();

  void WriteTimestamp(uint64_t time);
  void DumpAllValues();

  /// Writes a timestamp followed by every trace whose value changed since
  /// the last dump. Writes nothing when no trace changed.
  void DumpChangedValues(uint64_t time);

  size_t SignalCount() const { return signals_.size(); }

 private:
  static std::string MakeIdent(size_t ordinal);
  void WriteSignalChange(VcdSignal& sig, char value);

  std::ofstream ofs_;
  std::vector<VcdSignal> signals_;
  uint64_t last_time_ = 0;
  bool header_written_ = false;
  bool time_written_ = false;
};

}  // namespace breadsim
