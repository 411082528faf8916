#include "pdftrans/DocumentExtractor.hpp"

#include "pdftrans/CancellationToken.hpp"
#include "pdftrans/PdfDocument.hpp"
#include "pdftrans/TextUtils.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace pdftrans {

std::string formatPageSection(int pageNumber, const std::string &pageText) {
  return "\n\n===== Page " + std::to_string(pageNumber) + " =====\n" +
         text::trim(pageText);
}

DocumentExtractor::DocumentExtractor(PageExtractor &pageExtractor)
    : m_pageExtractor(pageExtractor) {}

ExtractionResult
DocumentExtractor::extractDocument(IDocument &document, int dpi,
                                   const std::string &ocrLanguageHint,
                                   const CancellationToken *cancel) {
  ExtractionResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();
  auto finish = [&]() {
    auto endTime = std::chrono::high_resolution_clock::now();
    result.processingTimeMs =
        std::chrono::duration<double, std::milli>(endTime - startTime).count();
  };

  result.pageCount = document.pageCount();
  if (m_verbose) {
    std::cerr << "DEBUG: PDF has " << result.pageCount << " pages"
              << std::endl;
  }

  std::string combined;
  std::string firstFailure;

  for (int pageIndex = 0; pageIndex < result.pageCount; pageIndex++) {
    if (cancel && cancel->isCancelled()) {
      result.errorKind = ErrorKind::CancelledError;
      result.errorMessage =
          cancel->deadlineExpired()
              ? "Deadline exceeded before page " + std::to_string(pageIndex + 1)
              : "Cancelled before page " + std::to_string(pageIndex + 1);
      result.fullText.clear();
      finish();
      return result;
    }

    PageResult page;
    try {
      std::unique_ptr<IPage> handle = document.page(pageIndex);
      page = m_pageExtractor.extract(*handle, dpi, ocrLanguageHint);
    } catch (const std::exception &e) {
      page = PageResult();
      page.pageNumber = pageIndex + 1;
      page.errorMessage = "Failed to open page " +
                          std::to_string(pageIndex + 1) + ": " + e.what();
    }

    if (m_verbose) {
      std::cerr << "DEBUG: Page " << page.pageNumber << ": "
                << (page.usedOcr ? "OCR" : "native text") << ", "
                << page.nativeLength << " native characters, "
                << page.processingTimeMs << " ms" << std::endl;
    }

    if (page.usedOcr) {
      result.ocrPageCount++;
    }

    if (!page.success) {
      result.failedPageCount++;
      if (firstFailure.empty()) {
        firstFailure = page.errorMessage;
      }

      if (!m_isolatePageFailures) {
        result.errorKind = ErrorKind::PageExtractionError;
        result.errorMessage = page.errorMessage;
        result.pages.push_back(std::move(page));
        result.fullText.clear();
        finish();
        return result;
      }

      std::cerr << "WARNING: " << page.errorMessage
                << " (continuing with an empty page)" << std::endl;
      page.text.clear();
    }

    if (!page.text.empty()) {
      result.textPageCount++;
    }

    combined += formatPageSection(pageIndex + 1, page.text);
    result.pages.push_back(std::move(page));
  }

  result.fullText = text::trim(combined);

  if (result.textPageCount == 0 && result.failedPageCount > 0) {
    // Nothing to show for the document because pages broke, not because
    // they were blank
    result.errorKind = ErrorKind::PageExtractionError;
    result.errorMessage = "No page produced text; " +
                          std::to_string(result.failedPageCount) + " of " +
                          std::to_string(result.pageCount) +
                          " pages failed, first: " + firstFailure;
  } else if (result.textPageCount == 0) {
    result.errorKind = ErrorKind::ExtractionEmptyError;
    result.errorMessage =
        "Could not extract any text from the PDF (even with OCR)";
  } else {
    result.success = true;
  }

  finish();
  return result;
}

} // namespace pdftrans
