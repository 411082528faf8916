#ifndef PDFTRANS_TESTS_FAKES_HPP
#define PDFTRANS_TESTS_FAKES_HPP

#include "pdftrans/ITranslator.hpp"
#include "pdftrans/OCREngine.hpp"
#include "pdftrans/PdfDocument.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace pdftrans {
namespace fakes {

/// Page content served by FakeDocument
struct FakePageContent {
  std::string nativeText;
  std::string ocrText;        ///< What FakeRecognizer reads off the bitmap
  bool failNativeText = false;
  bool failRasterize = false;
  bool failOpen = false;      ///< FakeDocument::page() throws
};

class FakePage : public IPage {
public:
  FakePage(int pageNumber, FakePageContent layout,
           int *rasterizeCalls = nullptr)
      : m_pageNumber(pageNumber), m_layout(std::move(layout)),
        m_rasterizeCalls(rasterizeCalls) {}

  int pageNumber() const override { return m_pageNumber; }

  std::string nativeText() override {
    if (m_layout.failNativeText) {
      throw std::runtime_error("broken content stream");
    }
    return m_layout.nativeText;
  }

  // The OCR text travels inside the bitmap: one row per byte
  cv::Mat rasterize(double dpi) override {
    if (m_rasterizeCalls) {
      ++*m_rasterizeCalls;
    }
    if (m_layout.failRasterize) {
      throw std::runtime_error("render failed at " + std::to_string(dpi));
    }
    lastDpi = dpi;
    cv::Mat bitmap(static_cast<int>(m_layout.ocrText.size()) + 1, 1, CV_8UC3,
                   cv::Scalar(0, 0, 0));
    for (std::size_t i = 0; i < m_layout.ocrText.size(); ++i) {
      bitmap.at<cv::Vec3b>(static_cast<int>(i), 0)[0] =
          static_cast<unsigned char>(m_layout.ocrText[i]);
    }
    return bitmap;
  }

  double lastDpi = 0;

private:
  int m_pageNumber;
  FakePageContent m_layout;
  int *m_rasterizeCalls;
};

/// Decodes the text FakePage encoded into its bitmap
class FakeRecognizer : public ITextRecognizer {
public:
  OCRResult recognize(const cv::Mat &bitmap,
                      const std::string &languageHint) override {
    ++calls;
    lastLanguage = languageHint;

    OCRResult result;
    if (fail) {
      result.errorMessage = "engine not initialized";
      return result;
    }
    for (int row = 0; row + 1 < bitmap.rows; ++row) {
      result.fullText += static_cast<char>(bitmap.at<cv::Vec3b>(row, 0)[0]);
    }
    result.success = true;
    return result;
  }

  int calls = 0;
  bool fail = false;
  std::string lastLanguage;
};

class FakeDocument : public IDocument {
public:
  explicit FakeDocument(std::vector<FakePageContent> pages)
      : m_pages(std::move(pages)) {}

  int pageCount() const override { return static_cast<int>(m_pages.size()); }

  std::unique_ptr<IPage> page(int index) override {
    if (index < 0 || index >= pageCount()) {
      throw std::out_of_range("page index " + std::to_string(index));
    }
    ++opened;
    if (m_pages[index].failOpen) {
      throw std::runtime_error("cannot create page");
    }
    return std::make_unique<FakePage>(index + 1, m_pages[index],
                                      &rasterizeCalls);
  }

  int opened = 0;
  int rasterizeCalls = 0;

private:
  std::vector<FakePageContent> m_pages;
};

/**
 * @brief Translator driven by a callback, safe for concurrent use
 *
 * The default behavior upper-cases ASCII letters and succeeds.
 */
class FakeTranslator : public ITranslator {
public:
  using Handler = std::function<TranslationResponse(const std::string &)>;

  FakeTranslator() : m_handler(&FakeTranslator::upperCase) {}
  explicit FakeTranslator(Handler handler) : m_handler(std::move(handler)) {}

  TranslationResponse translate(const std::string &text,
                                const std::string &sourceLanguage,
                                const std::string &targetLanguage,
                                const CancellationToken *) override {
    calls.fetch_add(1);
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      received.push_back(text);
      lastSource = sourceLanguage;
      lastTarget = targetLanguage;
    }
    return m_handler(text);
  }

  const char *name() const override { return "fake"; }

  static TranslationResponse upperCase(const std::string &text) {
    TranslationResponse response;
    response.text = text;
    for (auto &c : response.text) {
      if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
      }
    }
    response.success = true;
    return response;
  }

  static TranslationResponse failure(const std::string &message,
                                     bool retryable) {
    TranslationResponse response;
    response.errorMessage = message;
    response.retryable = retryable;
    return response;
  }

  std::atomic<int> calls{0};
  std::vector<std::string> received;
  std::string lastSource;
  std::string lastTarget;

private:
  std::mutex m_mutex;
  Handler m_handler;
};

/// A paragraph of @p length copies of @p letter
inline std::string paragraphOf(std::size_t length, char letter = 'a') {
  return std::string(length, letter);
}

} // namespace fakes
} // namespace pdftrans

#endif // PDFTRANS_TESTS_FAKES_HPP
