#ifndef PDFTRANS_PDF_DOCUMENT_HPP
#define PDFTRANS_PDF_DOCUMENT_HPP

#include <opencv2/core.hpp>

#include <memory>
#include <string>
#include <vector>

namespace poppler {
class document;
class page;
} // namespace poppler

namespace pdftrans {

/**
 * @brief One page of a document
 *
 * Both accessors may throw std::runtime_error when the page content cannot
 * be read; callers isolate such failures per page.
 */
class IPage {
public:
  virtual ~IPage() = default;

  /// 1-indexed page number
  virtual int pageNumber() const = 0;

  /// Text embedded in the page (UTF-8), empty for image-only pages
  virtual std::string nativeText() = 0;

  /**
   * @brief Render the page to an 8-bit, 3-channel bitmap without alpha
   * @param dpi Resolution; the 72 DPI page space is scaled by dpi / 72
   * @return Bitmap in OpenCV (BGR) channel order
   */
  virtual cv::Mat rasterize(double dpi) = 0;
};

/**
 * @brief Ordered, read-only sequence of pages
 */
class IDocument {
public:
  virtual ~IDocument() = default;

  virtual int pageCount() const = 0;

  /**
   * @brief Open a page
   * @param index 0-indexed page position
   * @throws std::out_of_range for an invalid index, std::runtime_error when
   * the page cannot be created
   */
  virtual std::unique_ptr<IPage> page(int index) = 0;
};

class PdfDocument;

/**
 * @brief Result of loading a PDF
 */
struct PdfLoadResult {
  bool success = false;                  ///< Whether loading succeeded
  std::string errorMessage;              ///< Error message if failed
  std::unique_ptr<PdfDocument> document; ///< Loaded document on success
};

/**
 * @brief PDF document backed by the Poppler C++ API
 */
class PdfDocument : public IDocument {
public:
  ~PdfDocument() override;

  PdfDocument(const PdfDocument &) = delete;
  PdfDocument &operator=(const PdfDocument &) = delete;

  /**
   * @brief Load a PDF file
   *
   * Fails for unreadable or malformed files, password protected documents
   * and documents without pages.
   */
  static PdfLoadResult loadFromFile(const std::string &pdfPath);

  /**
   * @brief Load a PDF held in memory (the bytes are copied)
   */
  static PdfLoadResult loadFromData(const std::vector<char> &data);

  /**
   * @brief Enable or silence Poppler's own error output on stderr
   *
   * Process-wide setting.
   */
  static void setBackendDiagnostics(bool enabled);

  int pageCount() const override;

  std::unique_ptr<IPage> page(int index) override;

private:
  explicit PdfDocument(std::unique_ptr<poppler::document> document);

  static PdfLoadResult finishLoad(poppler::document *raw,
                                  const std::string &source);

  std::unique_ptr<poppler::document> m_document;
};

} // namespace pdftrans

#endif // PDFTRANS_PDF_DOCUMENT_HPP
