#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "common/source_loc.h"

namespace breadsim {

/// Owns the text of every board file read in a session so diagnostics can
/// point back at the offending line.
class SourceManager {
 public:
  uint32_t AddFile(std::string path, std::string content);

  std::string_view FilePath(uint32_t file_id) const;
  std::string_view FileContent(uint32_t file_id) const;

  std::string FormatLoc(SourceLoc loc) const;
  std::string_view GetLineText(SourceLoc loc) const;

  size_t FileCount() const { return files_.size(); }

 private:
  struct FileEntry {
    std::string path;
    std::string content;
    std::vector<uint32_t> line_offsets;
  };

  void ComputeLineOffsets(FileEntry& entry);

  std::vector<FileEntry> files_;
};

}  // namespace breadsim
