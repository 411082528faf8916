#include "pdftrans/PageExtractor.hpp"

#include "pdftrans/OCREngine.hpp"
#include "pdftrans/PdfDocument.hpp"
#include "pdftrans/TextUtils.hpp"

#include <chrono>
#include <exception>

namespace pdftrans {

PageExtractor::PageExtractor(ITextRecognizer &recognizer,
                             std::size_t threshold)
    : m_recognizer(recognizer), m_threshold(threshold) {}

bool PageExtractor::needsOcr(std::size_t meaningfulLength) const {
  return meaningfulLength < m_threshold;
}

PageResult PageExtractor::extract(IPage &page, int dpi,
                                  const std::string &ocrLanguageHint) {
  PageResult result;
  result.pageNumber = page.pageNumber();
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    std::string text = page.nativeText();
    result.nativeLength = text::countNonWhitespace(text);

    if (needsOcr(result.nativeLength)) {
      result.usedOcr = true;

      OCRResult ocr;
      {
        // The bitmap is the largest allocation of a run, keep it scoped
        cv::Mat bitmap = page.rasterize(static_cast<double>(dpi));
        ocr = m_recognizer.recognize(bitmap, ocrLanguageHint);
      }

      if (ocr.success) {
        text = std::move(ocr.fullText);
      } else {
        text.clear();
        result.errorMessage = "OCR failed on page " +
                              std::to_string(result.pageNumber) + ": " +
                              ocr.errorMessage;
      }
    }

    result.text = text::trim(text);
    result.success = result.errorMessage.empty();
  } catch (const std::exception &e) {
    result.text.clear();
    result.errorMessage = "Extraction failed on page " +
                          std::to_string(result.pageNumber) + ": " + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace pdftrans
