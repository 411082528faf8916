#ifndef PDFTRANS_GOOGLE_TRANSLATOR_HPP
#define PDFTRANS_GOOGLE_TRANSLATOR_HPP

#include "pdftrans/ITranslator.hpp"

#include <string>

namespace pdftrans {

/**
 * @brief Connection settings for the Google Translate backend
 */
struct GoogleTranslatorConfig {
  std::string apiKey;         ///< Cloud Translation key (empty = free endpoint)
  int connectTimeoutMs = 5000;
  int timeoutMs = 45000;
  std::string freeEndpoint =
      "https://translate.googleapis.com/translate_a/single";
  std::string paidEndpoint =
      "https://translation.googleapis.com/language/translate/v2";
};

/**
 * @brief Google Translate client
 *
 * Uses the Cloud Translation v2 API when an API key is configured and the
 * public web endpoint otherwise. Each call opens its own connection, so one
 * instance can serve several worker threads.
 */
class GoogleTranslator : public ITranslator {
public:
  GoogleTranslator();
  explicit GoogleTranslator(GoogleTranslatorConfig config);

  TranslationResponse translate(const std::string &text,
                                const std::string &sourceLanguage,
                                const std::string &targetLanguage,
                                const CancellationToken *cancel) override;

  const char *name() const override;

  /**
   * @brief Map user language codes to the codes the service expects
   *
   * Lower-cases the code; Chinese keeps its script region ("zh-CN",
   * "zh-TW"), other regional variants collapse to the language ("en-US" ->
   * "en"). "auto" is left alone.
   */
  static std::string normalizeLanguageCode(const std::string &code);

  /**
   * @brief Join the translated segments of a web endpoint response
   *
   * The body looks like [[["seg1","src1",...],["seg2","src2",...]],...].
   *
   * @param body Response body
   * @param out Receives the translation
   * @return false when the body is not in the expected shape
   */
  static bool parseFreeResponse(const std::string &body, std::string &out);

  /**
   * @brief Extract data.translations[0].translatedText from a v2 response
   */
  static bool parsePaidResponse(const std::string &body, std::string &out);

  /**
   * @brief Short description of a failed HTTP exchange
   * @param statusCode HTTP status (0 when the transfer itself failed)
   * @param transportError libcurl error text, empty if the transfer worked
   * @param retryable Set to whether repeating the request may succeed
   */
  static std::string describeFailure(int statusCode,
                                     const std::string &transportError,
                                     bool &retryable);

private:
  TranslationResponse translateFree(const std::string &text,
                                    const std::string &source,
                                    const std::string &target,
                                    const CancellationToken *cancel) const;
  TranslationResponse translatePaid(const std::string &text,
                                    const std::string &source,
                                    const std::string &target,
                                    const CancellationToken *cancel) const;

  GoogleTranslatorConfig m_config;
};

} // namespace pdftrans

#endif // PDFTRANS_GOOGLE_TRANSLATOR_HPP
