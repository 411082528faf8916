#include "pdftrans/TextUtils.hpp"

#include <utf8proc.h>

namespace pdftrans {
namespace text {

namespace {

// Byte length of the UTF-8 sequence at pos. Malformed or truncated sequences
// are consumed one byte at a time and report the lead byte as code point.
std::size_t decodeAt(const std::string &s, std::size_t pos,
                     utf8proc_int32_t &codePoint) {
  const utf8proc_uint8_t *str =
      reinterpret_cast<const utf8proc_uint8_t *>(s.data());
  const auto remaining = static_cast<utf8proc_ssize_t>(s.size() - pos);
  utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, remaining, &codePoint);
  if (bytes <= 0) {
    codePoint = str[pos];
    return 1;
  }
  return static_cast<std::size_t>(bytes);
}

bool isSpace(utf8proc_int32_t cp) {
  // Control characters that count as blanks: \t \n \v \f \r, the
  // information separators and NEL
  if ((cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F) || cp == 0x85) {
    return true;
  }
  switch (utf8proc_category(cp)) {
  case UTF8PROC_CATEGORY_ZS:
  case UTF8PROC_CATEGORY_ZL:
  case UTF8PROC_CATEGORY_ZP:
    return true;
  default:
    return false;
  }
}

} // anonymous namespace

std::string trim(const std::string &s) {
  std::size_t begin = std::string::npos;
  std::size_t end = 0;

  std::size_t pos = 0;
  while (pos < s.size()) {
    utf8proc_int32_t cp = 0;
    std::size_t length = decodeAt(s, pos, cp);
    if (!isSpace(cp)) {
      if (begin == std::string::npos) {
        begin = pos;
      }
      end = pos + length;
    }
    pos += length;
  }

  if (begin == std::string::npos) {
    return "";
  }
  return s.substr(begin, end - begin);
}

std::size_t codePointLength(const std::string &s) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < s.size()) {
    utf8proc_int32_t cp = 0;
    pos += decodeAt(s, pos, cp);
    ++count;
  }
  return count;
}

std::size_t countNonWhitespace(const std::string &s) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < s.size()) {
    utf8proc_int32_t cp = 0;
    pos += decodeAt(s, pos, cp);
    if (!isSpace(cp)) {
      ++count;
    }
  }
  return count;
}

std::vector<std::string> splitByCodePoints(const std::string &s,
                                           std::size_t maxLen) {
  std::vector<std::string> slices;
  if (s.empty() || maxLen == 0) {
    return slices;
  }

  std::size_t sliceStart = 0;
  std::size_t sliceCodePoints = 0;
  std::size_t pos = 0;
  while (pos < s.size()) {
    if (sliceCodePoints == maxLen) {
      slices.push_back(s.substr(sliceStart, pos - sliceStart));
      sliceStart = pos;
      sliceCodePoints = 0;
    }
    utf8proc_int32_t cp = 0;
    pos += decodeAt(s, pos, cp);
    ++sliceCodePoints;
  }
  slices.push_back(s.substr(sliceStart));

  return slices;
}

std::vector<std::string> split(const std::string &s,
                               const std::string &delimiter) {
  std::vector<std::string> pieces;
  if (delimiter.empty()) {
    pieces.push_back(s);
    return pieces;
  }

  std::size_t start = 0;
  std::size_t found = s.find(delimiter);
  while (found != std::string::npos) {
    pieces.push_back(s.substr(start, found - start));
    start = found + delimiter.size();
    found = s.find(delimiter, start);
  }
  pieces.push_back(s.substr(start));

  return pieces;
}

std::string join(const std::vector<std::string> &pieces,
                 const std::string &separator) {
  std::string joined;
  for (std::size_t i = 0; i < pieces.size(); ++i) {
    if (i > 0) {
      joined += separator;
    }
    joined += pieces[i];
  }
  return joined;
}

} // namespace text
} // namespace pdftrans
