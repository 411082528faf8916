#ifndef PDFTRANS_ITRANSLATOR_HPP
#define PDFTRANS_ITRANSLATOR_HPP

#include <string>

namespace pdftrans {

class CancellationToken;

/**
 * @brief Outcome of one translation request
 */
struct TranslationResponse {
  bool success = false;     ///< Whether the text was translated
  std::string text;         ///< Translated text
  std::string errorMessage; ///< Error message if failed
  bool retryable = true;    ///< false when repeating the request cannot help
};

/**
 * @brief Translation capability for one chunk of text
 *
 * Implementations hold no per-request state: translate() may be called
 * concurrently from several threads.
 */
class ITranslator {
public:
  virtual ~ITranslator() = default;

  /**
   * @brief Translate one chunk
   * @param text Text to translate (UTF-8)
   * @param sourceLanguage Source language code or "auto"
   * @param targetLanguage Target language code (e.g., "zh-CN")
   * @param cancel Optional request cancellation, may abort the transfer
   */
  virtual TranslationResponse translate(const std::string &text,
                                        const std::string &sourceLanguage,
                                        const std::string &targetLanguage,
                                        const CancellationToken *cancel) = 0;

  /// Human-readable backend name for diagnostics
  virtual const char *name() const = 0;
};

} // namespace pdftrans

#endif // PDFTRANS_ITRANSLATOR_HPP
