#include "persist/board_codec.h"

#include <charconv>
#include <format>
#include <vector>

namespace breadsim {

// --- Escaping ---

std::string EscapeData(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    if (c == '\\') {
      out += "\\\\";
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

bool UnescapeData(std::string_view escaped, std::string& out) {
  out.clear();
  for (size_t i = 0; i < escaped.size(); ++i) {
    char c = escaped[i];
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    if (++i == escaped.size()) {
      return false;
    }
    if (escaped[i] == '\\') {
      out.push_back('\\');
    } else if (escaped[i] == 'n') {
      out.push_back('\n');
    } else if (escaped[i] == 'r') {
      out.push_back('\r');
    } else {
      return false;
    }
  }
  return true;
}

// --- Writer ---

std::string WriteBoardText(const SavedBoard& board) {
  std::string out = std::format("{} {}\n", kBoardMagic, kBoardVersion);
  for (const auto& socket : board.sockets) {
    if (!socket.chip) {
      out += "socket\n";
      continue;
    }
    out += std::format("socket {} {}\n", socket.chip->id, socket.chip->type_tag);
    for (const auto& data : socket.chip->data) {
      out += "data ";
      out += EscapeData(data);
      out += '\n';
    }
  }
  for (const auto& trace : board.traces) {
    out += "trace";
    for (const auto& ref : trace.pins) {
      out += std::format(" {}:{}", ref.chip, ref.pin);
    }
    out += '\n';
  }
  return out;
}

// --- Parser ---

namespace {

struct Word {
  std::string_view text;
  uint32_t column = 0;  // 1-based
};

std::vector<Word> SplitWords(std::string_view line) {
  std::vector<Word> words;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) {
      ++i;
    }
    size_t start = i;
    while (i < line.size() && line[i] != ' ' && line[i] != '\t') {
      ++i;
    }
    if (i > start) {
      words.push_back({line.substr(start, i - start),
                       static_cast<uint32_t>(start + 1)});
    }
  }
  return words;
}

template <typename T>
bool ParseNumber(std::string_view text, T& out) {
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, out);
  return ec == std::errc() && ptr == end;
}

bool ParsePinRef(std::string_view text, SavedPinRef& out) {
  auto colon = text.find(':');
  if (colon == std::string_view::npos) {
    return false;
  }
  return ParseNumber(text.substr(0, colon), out.chip) &&
         ParseNumber(text.substr(colon + 1), out.pin);
}

class BoardParser {
 public:
  BoardParser(uint32_t file_id, SavedBoard& out, DiagEngine& diag)
      : file_id_(file_id), out_(out), diag_(diag) {}

  bool ParseLine(uint32_t line_no, std::string_view line);
  bool Finish(uint32_t last_line);

 private:
  bool ParseHeader(const std::vector<Word>& words);
  bool ParseSocket(const std::vector<Word>& words);
  bool ParseData(std::string_view line, const Word& keyword);
  bool ParseTrace(const std::vector<Word>& words);
  bool Fail(uint32_t column, std::string msg);

  uint32_t file_id_;
  SavedBoard& out_;
  DiagEngine& diag_;
  uint32_t line_no_ = 0;
  bool seen_header_ = false;
};

bool BoardParser::Fail(uint32_t column, std::string msg) {
  diag_.Error({file_id_, line_no_, column}, std::move(msg));
  return false;
}

bool BoardParser::ParseLine(uint32_t line_no, std::string_view line) {
  line_no_ = line_no;
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  auto words = SplitWords(line);
  if (words.empty() || words[0].text.starts_with("#")) {
    return true;
  }
  if (!seen_header_) {
    return ParseHeader(words);
  }
  const Word& keyword = words[0];
  if (keyword.text == "socket") {
    return ParseSocket(words);
  }
  if (keyword.text == "data") {
    return ParseData(line, keyword);
  }
  if (keyword.text == "trace") {
    return ParseTrace(words);
  }
  return Fail(keyword.column,
              std::format("unknown record '{}'", keyword.text));
}

bool BoardParser::ParseHeader(const std::vector<Word>& words) {
  if (words[0].text != kBoardMagic) {
    return Fail(words[0].column, std::format("expected '{}' header",
                                             kBoardMagic));
  }
  uint32_t version = 0;
  if (words.size() != 2 || !ParseNumber(words[1].text, version)) {
    return Fail(words[0].column, "malformed board header");
  }
  if (version != kBoardVersion) {
    return Fail(words[1].column,
                std::format("unsupported board version {}", version));
  }
  seen_header_ = true;
  return true;
}

bool BoardParser::ParseSocket(const std::vector<Word>& words) {
  SavedSocket socket;
  socket.loc = {file_id_, line_no_, 0};
  if (words.size() == 1) {
    out_.sockets.push_back(std::move(socket));
    return true;
  }
  if (words.size() != 3) {
    return Fail(words[0].column, "expected 'socket' or 'socket <id> <type>'");
  }
  SavedChip chip;
  if (!ParseNumber(words[1].text, chip.id)) {
    return Fail(words[1].column,
                std::format("invalid chip id '{}'", words[1].text));
  }
  chip.type_tag = std::string(words[2].text);
  socket.chip = std::move(chip);
  out_.sockets.push_back(std::move(socket));
  return true;
}

bool BoardParser::ParseData(std::string_view line, const Word& keyword) {
  if (out_.sockets.empty() || !out_.sockets.back().chip) {
    return Fail(keyword.column, "'data' must follow a socket holding a chip");
  }
  // Payload is everything after "data" and one separating space.
  size_t payload_start = keyword.column - 1 + keyword.text.size();
  if (payload_start < line.size()) {
    ++payload_start;
  }
  std::string payload;
  if (!UnescapeData(line.substr(payload_start), payload)) {
    return Fail(static_cast<uint32_t>(payload_start + 1),
                "invalid escape in chip data");
  }
  out_.sockets.back().chip->data.push_back(std::move(payload));
  return true;
}

bool BoardParser::ParseTrace(const std::vector<Word>& words) {
  SavedTrace trace;
  trace.loc = {file_id_, line_no_, 0};
  for (size_t i = 1; i < words.size(); ++i) {
    SavedPinRef ref;
    if (!ParsePinRef(words[i].text, ref)) {
      return Fail(words[i].column,
                  std::format("invalid pin reference '{}'", words[i].text));
    }
    trace.pins.push_back(ref);
  }
  out_.traces.push_back(std::move(trace));
  return true;
}

bool BoardParser::Finish(uint32_t last_line) {
  if (!seen_header_) {
    line_no_ = last_line;
    return Fail(0, std::format("missing '{}' header", kBoardMagic));
  }
  return true;
}

}  // namespace

bool ParseBoardText(uint32_t file_id, std::string_view text, SavedBoard& out,
                    DiagEngine& diag) {
  BoardParser parser(file_id, out, diag);
  uint32_t line_no = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t eol = text.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = text.size();
    }
    if (!parser.ParseLine(++line_no, text.substr(pos, eol - pos))) {
      return false;
    }
    pos = eol + 1;
  }
  return parser.Finish(line_no);
}

}  // namespace breadsim
