#include "pdftrans/PdfDocument.hpp"

#include <opencv2/imgproc.hpp>

#include <poppler-document.h>
#include <poppler-global.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

#include <iostream>
#include <stdexcept>

namespace pdftrans {

namespace {

void printBackendMessage(const std::string &message, void *) {
  std::cerr << "poppler: " << message << std::endl;
}

void dropBackendMessage(const std::string &, void *) {}

class PopplerPage : public IPage {
public:
  PopplerPage(std::unique_ptr<poppler::page> page, int pageNumber)
      : m_page(std::move(page)), m_pageNumber(pageNumber) {}

  int pageNumber() const override { return m_pageNumber; }

  std::string nativeText() override {
    poppler::byte_array textBytes = m_page->text().to_utf8();
    return std::string(textBytes.begin(), textBytes.end());
  }

  cv::Mat rasterize(double dpi) override {
    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    // Resolution is relative to the 72 DPI page space
    poppler::image popplerImage =
        renderer.render_page(m_page.get(), dpi, dpi);

    if (!popplerImage.is_valid()) {
      throw std::runtime_error("Failed to render page " +
                               std::to_string(m_pageNumber));
    }

    int width = popplerImage.width();
    int height = popplerImage.height();

    // Wrap the Poppler buffer, then convert into an owned 3-channel image
    cv::Mat mat;

    switch (popplerImage.format()) {
    case poppler::image::format_argb32: {
      // ARGB32 is stored as B, G, R, A bytes on little-endian hosts
      cv::Mat view(height, width, CV_8UC4,
                   const_cast<char *>(popplerImage.const_data()),
                   popplerImage.bytes_per_row());
      cv::cvtColor(view, mat, cv::COLOR_BGRA2BGR);
      break;
    }
    case poppler::image::format_rgb24: {
      cv::Mat view(height, width, CV_8UC3,
                   const_cast<char *>(popplerImage.const_data()),
                   popplerImage.bytes_per_row());
      cv::cvtColor(view, mat, cv::COLOR_RGB2BGR);
      break;
    }
    case poppler::image::format_bgr24: {
      mat = cv::Mat(height, width, CV_8UC3,
                    const_cast<char *>(popplerImage.const_data()),
                    popplerImage.bytes_per_row())
                .clone();
      break;
    }
    case poppler::image::format_gray8: {
      cv::Mat view(height, width, CV_8UC1,
                   const_cast<char *>(popplerImage.const_data()),
                   popplerImage.bytes_per_row());
      cv::cvtColor(view, mat, cv::COLOR_GRAY2BGR);
      break;
    }
    default:
      throw std::runtime_error("Unsupported image format while rendering page " +
                               std::to_string(m_pageNumber));
    }

    return mat;
  }

private:
  std::unique_ptr<poppler::page> m_page;
  int m_pageNumber;
};

} // anonymous namespace

PdfDocument::PdfDocument(std::unique_ptr<poppler::document> document)
    : m_document(std::move(document)) {}

PdfDocument::~PdfDocument() = default;

PdfLoadResult PdfDocument::loadFromFile(const std::string &pdfPath) {
  return finishLoad(poppler::document::load_from_file(pdfPath), pdfPath);
}

PdfLoadResult PdfDocument::loadFromData(const std::vector<char> &data) {
  if (data.empty()) {
    PdfLoadResult result;
    result.errorMessage = "PDF data is empty";
    return result;
  }

  // load_from_data takes over the byte array's storage
  poppler::byte_array bytes(data.begin(), data.end());
  return finishLoad(poppler::document::load_from_data(&bytes),
                    "<memory>");
}

PdfLoadResult PdfDocument::finishLoad(poppler::document *raw,
                                      const std::string &source) {
  PdfLoadResult result;
  result.success = false;

  std::unique_ptr<poppler::document> doc(raw);

  if (!doc) {
    result.errorMessage = "Failed to load PDF file: " + source;
    return result;
  }

  if (doc->is_locked()) {
    result.errorMessage = "PDF file is password protected: " + source;
    return result;
  }

  if (doc->pages() < 1) {
    result.errorMessage = "PDF has no pages: " + source;
    return result;
  }

  result.document.reset(new PdfDocument(std::move(doc)));
  result.success = true;
  return result;
}

void PdfDocument::setBackendDiagnostics(bool enabled) {
  poppler::set_debug_error_function(
      enabled ? &printBackendMessage : &dropBackendMessage, nullptr);
}

int PdfDocument::pageCount() const { return m_document->pages(); }

std::unique_ptr<IPage> PdfDocument::page(int index) {
  if (index < 0 || index >= pageCount()) {
    throw std::out_of_range("Page index out of range: " +
                            std::to_string(index));
  }

  std::unique_ptr<poppler::page> page(m_document->create_page(index));
  if (!page) {
    throw std::runtime_error("Failed to create page " +
                             std::to_string(index + 1));
  }

  return std::make_unique<PopplerPage>(std::move(page), index + 1);
}

} // namespace pdftrans
