#ifndef PDFTRANS_CONFIG_HPP
#define PDFTRANS_CONFIG_HPP

#include <cstddef>
#include <string>

namespace pdftrans {

/// Non-whitespace characters below which a page is treated as scanned.
constexpr std::size_t kDefaultMeaningfulTextThreshold = 40;

/// Chunk size that stays under the translation service's request limit.
constexpr int kDefaultMaxChunkLength = 4500;

constexpr int kDefaultDpi = 300;

/**
 * @brief Every externally configurable knob of the PDF translation pipeline
 */
struct PipelineConfig {
  // Extraction
  int dpi = kDefaultDpi;          ///< Rasterization resolution for OCR pages
  std::string ocrLanguage = "eng"; ///< Tesseract language code ("eng+deu")
  std::size_t meaningfulTextThreshold =
      kDefaultMeaningfulTextThreshold; ///< OCR fallback trigger
  std::string tessDataPath;     ///< tessdata directory (empty = auto)
  int pageSegMode = 3;          ///< Tesseract PSM (3 = fully automatic)
  bool preprocessImage = false; ///< Grayscale + threshold before OCR
  bool isolatePageFailures = true; ///< Failed page -> empty section

  // Translation
  std::string sourceLanguage = "auto"; ///< Source language or "auto"
  std::string targetLanguage = "zh-CN"; ///< Target language code
  std::string apiKey; ///< Cloud Translation key (empty = public endpoint)
  int maxChunkLength = kDefaultMaxChunkLength; ///< Code points per request
  int maxConcurrentRequests = 1; ///< Chunks translated in parallel
  int maxRetries = 0;            ///< Extra attempts per failed chunk
  int retryBackoffMs = 200;      ///< Backoff step between attempts
  int connectTimeoutMs = 5000;
  int requestTimeoutMs = 45000;

  // Run
  double deadlineSeconds = 0.0; ///< Whole-run deadline, 0 = none
  bool verbose = false;         ///< Print DEBUG diagnostics to stderr
};

/**
 * @brief Check a configuration before any work starts
 * @param config Configuration to check
 * @return Empty string when valid, otherwise a description of the first
 * invalid field
 */
std::string validateConfig(const PipelineConfig &config);

/**
 * @brief Parse a whole-string decimal integer option
 *
 * Rejects empty input, trailing garbage ("300dpi"), fractions and values
 * outside the int range.
 *
 * @param value Text to parse
 * @param out Receives the parsed value on success
 * @return true if @p value is a valid integer
 */
bool parseIntegerOption(const std::string &value, int &out);

/// Same as parseIntegerOption() for non-negative decimal numbers ("2.5").
bool parseSecondsOption(const std::string &value, double &out);

} // namespace pdftrans

#endif // PDFTRANS_CONFIG_HPP
