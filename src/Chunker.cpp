#include "pdftrans/Chunker.hpp"

#include "pdftrans/TextUtils.hpp"

#include <stdexcept>

namespace pdftrans {

const char *const kParagraphSeparator = "\n\n";

std::vector<std::string> splitParagraphs(const std::string &text) {
  std::vector<std::string> paragraphs;
  for (const auto &piece : text::split(text, kParagraphSeparator)) {
    std::string paragraph = text::trim(piece);
    if (!paragraph.empty()) {
      paragraphs.push_back(std::move(paragraph));
    }
  }
  return paragraphs;
}

std::vector<std::string> chunkText(const std::string &text,
                                   std::size_t maxLen) {
  if (maxLen == 0) {
    throw std::invalid_argument("chunk length must be positive");
  }

  std::vector<std::string> chunks;
  if (text.empty()) {
    return chunks;
  }

  const std::size_t separatorLength = 2;

  std::vector<std::string> buffer;
  std::size_t bufferLength = 0;

  auto flush = [&]() {
    if (!buffer.empty()) {
      chunks.push_back(text::join(buffer, kParagraphSeparator));
      buffer.clear();
      bufferLength = 0;
    }
  };

  for (auto &paragraph : splitParagraphs(text)) {
    const std::size_t length = text::codePointLength(paragraph);

    if (length > maxLen) {
      flush();
      for (auto &slice : text::splitByCodePoints(paragraph, maxLen)) {
        chunks.push_back(std::move(slice));
      }
      continue;
    }

    const std::size_t overhead = buffer.empty() ? 0 : separatorLength;
    if (bufferLength + length + overhead <= maxLen) {
      buffer.push_back(std::move(paragraph));
      bufferLength += length + overhead;
    } else {
      flush();
      buffer.push_back(std::move(paragraph));
      bufferLength = length;
    }
  }

  flush();
  return chunks;
}

} // namespace pdftrans
