#ifndef PDFTRANS_TEXT_UTILS_HPP
#define PDFTRANS_TEXT_UTILS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace pdftrans {
namespace text {

/**
 * @brief Remove leading and trailing whitespace
 *
 * Whitespace is the ASCII blanks and control separators (including U+001C
 * to U+001F and U+0085) plus every Unicode space, line or paragraph
 * separator, decoded from UTF-8.
 */
std::string trim(const std::string &s);

/// Number of code points in a UTF-8 string. Invalid lead bytes count as one.
std::size_t codePointLength(const std::string &s);

/// Number of code points that are not whitespace (see trim()).
std::size_t countNonWhitespace(const std::string &s);

/**
 * @brief Split a UTF-8 string into consecutive slices of at most @p maxLen
 * code points
 *
 * Slices never end inside a multi-byte sequence. Concatenating the slices
 * gives back the input. Returns an empty vector for empty input.
 */
std::vector<std::string> splitByCodePoints(const std::string &s,
                                           std::size_t maxLen);

/// Split on every occurrence of @p delimiter (empty pieces are kept).
std::vector<std::string> split(const std::string &s,
                               const std::string &delimiter);

/// Join pieces with @p separator between them.
std::string join(const std::vector<std::string> &pieces,
                 const std::string &separator);

} // namespace text
} // namespace pdftrans

#endif // PDFTRANS_TEXT_UTILS_HPP
