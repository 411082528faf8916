#include "pdftrans/OCREngine.hpp"

#include <opencv2/imgproc.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>

namespace pdftrans {

OCREngine::OCREngine()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_initialized(false) {}

OCREngine::OCREngine(const OCRConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

OCREngine::~OCREngine() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

OCREngine::OCREngine(OCREngine &&other) noexcept
    : m_tesseract(std::move(other.m_tesseract)),
      m_config(std::move(other.m_config)), m_initialized(other.m_initialized) {
  other.m_initialized = false;
}

OCREngine &OCREngine::operator=(OCREngine &&other) noexcept {
  if (this != &other) {
    if (m_tesseract) {
      m_tesseract->End();
    }
    m_tesseract = std::move(other.m_tesseract);
    m_config = std::move(other.m_config);
    m_initialized = other.m_initialized;
    other.m_initialized = false;
  }
  return *this;
}

bool OCREngine::initialize() {
  if (m_initialized) {
    return true;
  }
  if (!m_tesseract) {
    m_tesseract = std::make_unique<tesseract::TessBaseAPI>();
  }

  // nullptr lets Tesseract fall back to its compiled-in tessdata location
  const char *tessDataPath = nullptr;

  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  } else {
    const char *envPath = std::getenv("TESSDATA_PREFIX");
    if (envPath != nullptr && *envPath != '\0') {
      tessDataPath = envPath;
    }
  }

  int result = m_tesseract->Init(tessDataPath, m_config.language.c_str());

  if (result != 0) {
    std::cerr << "Failed to initialize Tesseract with language: "
              << m_config.language << " (tessdata: "
              << (tessDataPath ? tessDataPath : "default") << ")"
              << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_initialized = true;
  return true;
}

bool OCREngine::isInitialized() const { return m_initialized; }

OCRResult OCREngine::recognize(const cv::Mat &bitmap,
                               const std::string &languageHint) {
  OCRResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  if (!languageHint.empty() && languageHint != m_config.language) {
    if (!setLanguage(languageHint)) {
      result.errorMessage =
          "OCR engine could not load language: " + languageHint;
      return result;
    }
  }

  if (!initialize()) {
    result.errorMessage = "OCR engine not initialized for language: " +
                          m_config.language +
                          ". Make sure the tessdata files are installed.";
    return result;
  }

  if (bitmap.empty()) {
    // Nothing to read is not an error: the page is blank
    result.success = true;
    return result;
  }

  try {
    cv::Mat processedImage =
        m_config.preprocessImage ? preprocessImage(bitmap) : bitmap;

    setImage(processedImage);

    if (m_tesseract->Recognize(nullptr) != 0) {
      m_tesseract->Clear();
      result.errorMessage = "Tesseract recognition failed";
      return result;
    }

    char *outText = m_tesseract->GetUTF8Text();
    if (outText) {
      result.fullText = outText;
      delete[] outText;
    }
    result.meanConfidence = m_tesseract->MeanTextConf();

    // Release the page image held by Tesseract
    m_tesseract->Clear();

    result.success = true;
  } catch (const std::exception &e) {
    m_tesseract->Clear();
    result.errorMessage = std::string("OCR analysis failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

bool OCREngine::setLanguage(const std::string &language) {
  m_config.language = language;

  if (m_initialized) {
    m_tesseract->End();
    m_initialized = false;
    return initialize();
  }

  return true;
}

const OCRConfig &OCREngine::getConfig() const { return m_config; }

void OCREngine::setConfig(const OCRConfig &config) {
  m_config = config;
  if (m_initialized) {
    m_tesseract->End();
    m_initialized = false;
  }
}

std::string OCREngine::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

std::vector<std::string> OCREngine::getAvailableLanguages() const {
  std::vector<std::string> languages;

  if (m_initialized) {
    m_tesseract->GetAvailableLanguagesAsVector(&languages);
  }

  return languages;
}

cv::Mat OCREngine::preprocessImage(const cv::Mat &image) {
  cv::Mat processed;

  if (image.channels() == 3) {
    cv::cvtColor(image, processed, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, processed, cv::COLOR_BGRA2GRAY);
  } else {
    processed = image.clone();
  }

  cv::GaussianBlur(processed, processed, cv::Size(3, 3), 0);

  cv::adaptiveThreshold(processed, processed, 255,
                        cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 11,
                        2);

  return processed;
}

void OCREngine::setImage(const cv::Mat &image) {
  cv::Mat rgbImage;

  // Tesseract expects packed RGB
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  // SetImage copies the pixels, rgbImage may go out of scope afterwards
  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

} // namespace pdftrans
