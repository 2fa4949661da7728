#include "simulation/vcd_writer.h"

#include <ctime>
#include <iomanip>

#include "simulation/trace.h"

namespace breadsim {

VcdWriter::VcdWriter(const std::string& filename) : ofs_(filename) {}

VcdWriter::~VcdWriter() {
  if (ofs_.is_open()) {
    ofs_.flush();
  }
}

void VcdWriter::WriteHeader(std::string_view timescale) {
  if (header_written_) {
    return;
  }
  std::time_t now = std::time(nullptr);
  ofs_ << "$date\n  " << std::put_time(std::localtime(&now), "%Y-%m-%d %H:%M:%S")
       << "\n$end\n";
  ofs_ << "$version\n  breadsim\n$end\n";
  ofs_ << "$timescale " << timescale << " $end\n";
  header_written_ = true;
}

void VcdWriter::BeginScope(std::string_view name) {
  ofs_ << "$scope module " << name << " $end\n";
}

void VcdWriter::EndScope() { ofs_ << "$upscope $end\n"; }

// Identifiers are printable ASCII '!'..'~' in little-endian base 94.
std::string VcdWriter::MakeIdent(size_t ordinal) {
  constexpr size_t kBase = '~' - '!' + 1;
  std::string ident;
  do {
    ident.push_back(static_cast<char>('!' + ordinal % kBase));
    ordinal /= kBase;
  } while (ordinal != 0);
  return ident;
}

void VcdWriter::RegisterTrace(std::string_view name,
                              std::shared_ptr<const Trace> trace) {
  VcdSignal sig;
  sig.name = std::string(name);
  sig.trace = std::move(trace);
  sig.ident = MakeIdent(signals_.size());
  ofs_ << "$var wire 1 " << sig.ident << " " << sig.name << " $end\n";
  signals_.push_back(std::move(sig));
}

void VcdWriter::EndDefinitions() { ofs_ << "$enddefinitions $end\n"; }

void VcdWriter::WriteTimestamp(uint64_t time) {
  if (time_written_ && time == last_time_) {
    return;
  }
  ofs_ << "#" << time << "\n";
  last_time_ = time;
  time_written_ = true;
}

void VcdWriter::WriteSignalChange(VcdSignal& sig, char value) {
  ofs_ << value << sig.ident << "\n";
  sig.last = value;
}

void VcdWriter::DumpAllValues() {
  ofs_ << "$dumpvars\n";
  for (auto& sig : signals_) {
    WriteSignalChange(sig, StateChar(sig.trace->Resolved()));
  }
  ofs_ << "$end\n";
}

void VcdWriter::DumpChangedValues(uint64_t time) {
  bool stamped = false;
  for (auto& sig : signals_) {
    char value = StateChar(sig.trace->Resolved());
    if (value == sig.last) {
      continue;
    }
    if (!stamped) {
      WriteTimestamp(time);
      stamped = true;
    }
    WriteSignalChange(sig, value);
  }
}

}  // namespace breadsim
