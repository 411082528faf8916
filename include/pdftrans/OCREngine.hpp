#ifndef PDFTRANS_OCR_ENGINE_HPP
#define PDFTRANS_OCR_ENGINE_HPP

#include <opencv2/core.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace pdftrans {

/**
 * @brief Result of recognizing text in one bitmap
 */
struct OCRResult {
  std::string fullText;        ///< Recognized text (may be empty)
  int meanConfidence = 0;      ///< Tesseract mean word confidence (0-100)
  double processingTimeMs = 0; ///< Processing time in milliseconds
  bool success = false;        ///< Whether recognition ran
  std::string errorMessage;    ///< Error message if failed
};

/**
 * @brief Configuration options for the OCR engine
 */
struct OCRConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "deu+eng")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_AUTO;      ///< Page segmentation mode
  bool preprocessImage = false; ///< Apply grayscale + adaptive threshold
  std::string tessDataPath;     ///< tessdata directory (empty = auto)
};

/**
 * @brief Text recognition capability used for image-only pages
 *
 * The bitmap is an 8-bit OpenCV image in OpenCV channel order (BGR, BGRA or
 * gray). Implementations may return an empty text for unreadable input
 * without reporting a failure.
 */
class ITextRecognizer {
public:
  virtual ~ITextRecognizer() = default;

  /**
   * @brief Recognize the text of a bitmap
   * @param bitmap Page image
   * @param languageHint Language code for the recognizer (e.g., "eng")
   * @return OCRResult; success is false only when recognition could not run
   */
  virtual OCRResult recognize(const cv::Mat &bitmap,
                              const std::string &languageHint) = 0;
};

/**
 * @brief Tesseract backed text recognizer
 *
 * Example usage:
 * @code
 * pdftrans::OCREngine engine;
 * auto result = engine.recognize(bitmap, "eng");
 * if (result.success) {
 *     std::cout << result.fullText << std::endl;
 * }
 * @endcode
 *
 * The engine initializes lazily on the first recognize() call and
 * re-initializes when a different language hint arrives. One instance must
 * not be used from several threads at once.
 */
class OCREngine : public ITextRecognizer {
public:
  OCREngine();

  explicit OCREngine(const OCRConfig &config);

  ~OCREngine() override;

  // Tesseract API is not copyable
  OCREngine(const OCREngine &) = delete;
  OCREngine &operator=(const OCREngine &) = delete;

  OCREngine(OCREngine &&other) noexcept;
  OCREngine &operator=(OCREngine &&other) noexcept;

  /**
   * @brief Initialize Tesseract with the configured language
   *
   * The tessdata directory is, in order: OCRConfig::tessDataPath, the
   * TESSDATA_PREFIX environment variable, Tesseract's compiled-in default.
   *
   * @return true if initialization was successful
   */
  bool initialize();

  bool isInitialized() const;

  OCRResult recognize(const cv::Mat &bitmap,
                      const std::string &languageHint) override;

  /**
   * @brief Set the OCR language, re-initializing a running engine
   * @param language Language code (e.g., "eng", "deu+eng" for multiple)
   * @return true if the language was set successfully
   */
  bool setLanguage(const std::string &language);

  const OCRConfig &getConfig() const;

  /// Replace the configuration (the engine re-initializes on next use)
  void setConfig(const OCRConfig &config);

  static std::string getTesseractVersion();

  /// Languages available in the tessdata directory (requires initialize())
  std::vector<std::string> getAvailableLanguages() const;

private:
  /**
   * @brief Grayscale, denoise and adaptive-threshold an image
   */
  cv::Mat preprocessImage(const cv::Mat &image);

  /**
   * @brief Hand an OpenCV image to Tesseract as packed RGB
   */
  void setImage(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI>
      m_tesseract;    ///< Tesseract API instance
  OCRConfig m_config; ///< Current configuration
  bool m_initialized; ///< Initialization state
};

} // namespace pdftrans

#endif // PDFTRANS_OCR_ENGINE_HPP
