#ifndef PDFTRANS_PAGE_EXTRACTOR_HPP
#define PDFTRANS_PAGE_EXTRACTOR_HPP

#include "pdftrans/Config.hpp"

#include <cstddef>
#include <string>

namespace pdftrans {

class IPage;
class ITextRecognizer;

/**
 * @brief Outcome of extracting one page
 *
 * A failed page keeps an empty text; the caller decides whether that is
 * fatal.
 */
struct PageResult {
  int pageNumber = 0;           ///< 1-indexed page number
  std::string text;             ///< Trimmed page text (native or OCR)
  std::size_t nativeLength = 0; ///< Non-whitespace characters found natively
  bool usedOcr = false;         ///< Whether OCR replaced the native text
  bool success = false;         ///< Whether extraction succeeded
  std::string errorMessage;     ///< Error message if failed
  double processingTimeMs = 0;  ///< Processing time in milliseconds
};

/**
 * @brief Extracts the text of a single page, falling back to OCR
 *
 * The native text layer is used when it holds at least `threshold`
 * non-whitespace characters. Below that the page is considered scanned: it
 * is rendered at the requested DPI and the recognizer's output replaces the
 * native text, even when OCR finds nothing.
 */
class PageExtractor {
public:
  /**
   * @param recognizer OCR capability, must outlive the extractor
   * @param threshold Minimum non-whitespace characters to trust native text
   */
  explicit PageExtractor(
      ITextRecognizer &recognizer,
      std::size_t threshold = kDefaultMeaningfulTextThreshold);

  /**
   * @brief Extract the text of one page
   *
   * Never throws for page content problems: render, recognition and backend
   * errors come back as a failed PageResult.
   *
   * @param page Page to read
   * @param dpi Rasterization resolution for the OCR fallback
   * @param ocrLanguageHint Language code handed to the recognizer
   */
  PageResult extract(IPage &page, int dpi, const std::string &ocrLanguageHint);

  /// Whether native text of this length is too short to be trusted
  bool needsOcr(std::size_t meaningfulLength) const;

  std::size_t threshold() const { return m_threshold; }

private:
  ITextRecognizer &m_recognizer;
  std::size_t m_threshold;
};

} // namespace pdftrans

#endif // PDFTRANS_PAGE_EXTRACTOR_HPP
