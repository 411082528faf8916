#ifndef PDFTRANS_CHUNKER_HPP
#define PDFTRANS_CHUNKER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace pdftrans {

/// Separator placed between paragraphs inside a chunk and between
/// translated chunks.
extern const char *const kParagraphSeparator;

/**
 * @brief Split text into trimmed, non-empty paragraphs
 *
 * Paragraph boundaries are blank lines ("\n\n").
 */
std::vector<std::string> splitParagraphs(const std::string &text);

/**
 * @brief Split text into chunks no longer than @p maxLen code points
 *
 * Paragraphs are packed greedily into a chunk, joined by a blank line, while
 * the chunk still fits. A paragraph that alone exceeds @p maxLen is emitted
 * as consecutive hard-split slices of exactly @p maxLen code points (the last
 * one shorter), never merged with its neighbours.
 *
 * @param text Input text (UTF-8)
 * @param maxLen Maximum chunk length in code points, must be positive
 * @return Ordered chunks; empty for empty or whitespace-only input
 * @throws std::invalid_argument if @p maxLen is zero
 */
std::vector<std::string> chunkText(const std::string &text,
                                   std::size_t maxLen);

} // namespace pdftrans

#endif // PDFTRANS_CHUNKER_HPP
