#ifndef PDFTRANS_DOCUMENT_EXTRACTOR_HPP
#define PDFTRANS_DOCUMENT_EXTRACTOR_HPP

#include "pdftrans/Errors.hpp"
#include "pdftrans/PageExtractor.hpp"

#include <string>
#include <vector>

namespace pdftrans {

class CancellationToken;
class IDocument;

/**
 * @brief Text of a whole document plus per-page bookkeeping
 */
struct ExtractionResult {
  std::string fullText;          ///< Page sections joined in page order
  std::vector<PageResult> pages; ///< One entry per page, in page order
  int pageCount = 0;             ///< Pages in the document
  int ocrPageCount = 0;          ///< Pages that went through OCR
  int failedPageCount = 0;       ///< Pages whose extraction failed
  int textPageCount = 0;         ///< Pages that produced non-empty text
  double processingTimeMs = 0;   ///< Processing time in milliseconds
  bool success = false;          ///< Whether extraction succeeded
  ErrorKind errorKind = ErrorKind::None; ///< Failure kind
  std::string errorMessage;              ///< Error message if failed
};

/**
 * @brief Format one page section: "\n\n===== Page N =====\n" + trimmed text
 */
std::string formatPageSection(int pageNumber, const std::string &pageText);

/**
 * @brief Extracts every page of a document in order
 *
 * The output is the concatenation of formatPageSection() for every page,
 * trimmed as a whole. Pages are never dropped: an empty or failed page
 * still contributes its marker.
 *
 * Failure kinds:
 * - ExtractionEmptyError when no page produced any text and none failed
 *   (fullText still holds the markers),
 * - PageExtractionError when a page failed and page isolation is off, or
 *   when every page without text got there by failing,
 * - CancelledError when the token fires between pages.
 */
class DocumentExtractor {
public:
  explicit DocumentExtractor(PageExtractor &pageExtractor);

  /**
   * @brief Choose the page failure policy
   * @param isolate true: a failed page becomes an empty section and a
   * warning; false: the first failed page aborts the whole document
   */
  void setIsolatePageFailures(bool isolate) { m_isolatePageFailures = isolate; }

  void setVerbose(bool verbose) { m_verbose = verbose; }

  ExtractionResult extractDocument(IDocument &document, int dpi,
                                   const std::string &ocrLanguageHint,
                                   const CancellationToken *cancel = nullptr);

private:
  PageExtractor &m_pageExtractor;
  bool m_isolatePageFailures = true;
  bool m_verbose = false;
};

} // namespace pdftrans

#endif // PDFTRANS_DOCUMENT_EXTRACTOR_HPP
