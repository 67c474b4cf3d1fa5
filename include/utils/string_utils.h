#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {

inline std::string toLower(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string trim(std::string_view str) {
  const auto start = std::find_if_not(
      str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });

  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  return (start < end) ? std::string(start, end) : std::string{};
}

inline bool startsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

// Splits on '\n', dropping a trailing '\r' from each line. A trailing newline
// does not produce an extra empty line.
inline std::vector<std::string> splitLines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string line(text.substr(start, end - start));
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    start = end + 1;
  }
  return lines;
}

inline std::string truncate(const std::string &text, size_t maxLength,
                            const std::string &marker = "...") {
  if (text.size() <= maxLength) {
    return text;
  }
  if (maxLength <= marker.size()) {
    return text.substr(0, maxLength);
  }
  return text.substr(0, maxLength - marker.size()) + marker;
}

// Drops invalid UTF-8 byte sequences and control characters other than
// newline, carriage return and tab.
inline std::string sanitizeUTF8(const std::string &input) {
  std::string result;
  result.reserve(input.size());

  auto isContinuation = [&input](size_t index) {
    return index < input.size() &&
           (static_cast<unsigned char>(input[index]) & 0xC0) == 0x80;
  };

  for (size_t i = 0; i < input.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(input[i]);

    if ((c >= 0x20 && c <= 0x7E) || c == '\n' || c == '\r' || c == '\t') {
      result += static_cast<char>(c);
      continue;
    }

    size_t sequenceLength = 0;
    if ((c & 0xE0) == 0xC0) {
      sequenceLength = 2;
    } else if ((c & 0xF0) == 0xE0) {
      sequenceLength = 3;
    } else if ((c & 0xF8) == 0xF0) {
      sequenceLength = 4;
    }

    if (sequenceLength == 0) {
      continue;
    }

    bool valid = true;
    for (size_t k = 1; k < sequenceLength; ++k) {
      if (!isContinuation(i + k)) {
        valid = false;
        break;
      }
    }
    if (valid) {
      result.append(input, i, sequenceLength);
      i += sequenceLength - 1;
    }
  }

  return result;
}

} // namespace StringUtils

#endif
