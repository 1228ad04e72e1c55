#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge {

/// Trim ASCII whitespace from both ends.
inline std::string_view trim(std::string_view s) {
  constexpr std::string_view ws = " \t\r\n\f\v";
  auto start = s.find_first_not_of(ws);
  if (start == std::string_view::npos)
    return {};
  auto end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

/// Copy `in`, replacing every malformed UTF-8 sequence with U+FFFD so the
/// result is valid as a WebSocket text payload. Overlong forms, surrogates
/// and code points above U+10FFFF count as malformed.
inline std::string to_utf8_text(std::string_view in) {
  constexpr std::string_view kReplacement = "\xEF\xBF\xBD";
  constexpr uint32_t kMinCodePoint[5] = {0, 0, 0x80, 0x800, 0x10000};

  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    auto lead = static_cast<unsigned char>(in[i]);
    if (lead < 0x80) {
      out.push_back(in[i++]);
      continue;
    }

    size_t len = 0;
    uint32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
      len = 2;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4;
      cp = lead & 0x07;
    }

    // A truncated or interrupted sequence is replaced once, as a unit.
    size_t seen = 1;
    while (len > 0 && seen < len && i + seen < in.size()) {
      auto c = static_cast<unsigned char>(in[i + seen]);
      if ((c & 0xC0) != 0x80)
        break;
      cp = (cp << 6) | (c & 0x3F);
      ++seen;
    }

    if (len == 0 || seen < len) {
      out.append(kReplacement);
      i += seen;
      continue;
    }
    if (cp < kMinCodePoint[len] || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
      out.append(kReplacement);
      ++i;
      continue;
    }
    out.append(in.substr(i, len));
    i += len;
  }
  return out;
}

/// Incremental newline framer for a process output stream.
///
/// Feed arbitrary chunks; each call returns the lines whose '\n' has
/// arrived, in order, trimmed, with blank lines dropped and malformed UTF-8
/// replaced. The unterminated tail stays buffered until a later chunk
/// completes it. One framer belongs to exactly one reader thread.
class line_framer {
public:
  std::vector<std::string> feed(std::string_view chunk) {
    buffer_.append(chunk.data(), chunk.size());

    std::vector<std::string> lines;
    size_t start = 0;
    for (;;) {
      auto pos = buffer_.find('\n', start);
      if (pos == std::string::npos)
        break;
      auto line = trim(std::string_view(buffer_).substr(start, pos - start));
      if (!line.empty())
        lines.push_back(to_utf8_text(line));
      start = pos + 1;
    }
    buffer_.erase(0, start);
    return lines;
  }

  /// Bytes received after the last '\n'.
  const std::string &pending() const { return buffer_; }

  void reset() {
    buffer_.clear();
    buffer_.shrink_to_fit();
  }

private:
  std::string buffer_;
};

} // namespace mcpbridge
