#include "pdftrans/GoogleTranslator.hpp"

#include "pdftrans/HttpClient.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace pdftrans {

namespace {

using json = nlohmann::json;

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

http::SessionConfig makeSession(const GoogleTranslatorConfig &config,
                                const CancellationToken *cancel) {
  http::SessionConfig session;
  session.connectTimeoutMs = config.connectTimeoutMs;
  session.timeoutMs = config.timeoutMs;
  session.cancel = cancel;
  return session;
}

// Turns a finished exchange into a response, using parse for 2xx bodies
template <typename Parser>
TranslationResponse toResponse(const http::HttpResponse &reply,
                               Parser parse) {
  TranslationResponse response;

  if (!reply.ok()) {
    response.errorMessage = GoogleTranslator::describeFailure(
        reply.statusCode, reply.error, response.retryable);
    return response;
  }

  std::string translated;
  if (!parse(reply.body, translated)) {
    response.errorMessage = "Malformed response from the translation service";
    return response;
  }

  response.text = std::move(translated);
  response.success = true;
  return response;
}

} // anonymous namespace

GoogleTranslator::GoogleTranslator() = default;

GoogleTranslator::GoogleTranslator(GoogleTranslatorConfig config)
    : m_config(std::move(config)) {}

const char *GoogleTranslator::name() const {
  return m_config.apiKey.empty() ? "Google Translate (web)"
                                 : "Google Cloud Translation";
}

TranslationResponse GoogleTranslator::translate(
    const std::string &text, const std::string &sourceLanguage,
    const std::string &targetLanguage, const CancellationToken *cancel) {
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    // Nothing to send; whitespace translates to nothing
    TranslationResponse response;
    response.success = true;
    return response;
  }

  const std::string source = normalizeLanguageCode(sourceLanguage);
  const std::string target = normalizeLanguageCode(targetLanguage);

  if (!m_config.apiKey.empty()) {
    return translatePaid(text, source, target, cancel);
  }
  return translateFree(text, source, target, cancel);
}

TranslationResponse
GoogleTranslator::translateFree(const std::string &text,
                                const std::string &source,
                                const std::string &target,
                                const CancellationToken *cancel) const {
  // Long texts go in the POST body, only the parameters in the URL
  const std::string url = m_config.freeEndpoint +
                          "?client=gtx&sl=" + http::urlEncode(source) +
                          "&tl=" + http::urlEncode(target) + "&dt=t";

  http::HttpResponse reply = http::postForm(
      url, {{"q", text}}, makeSession(m_config, cancel));

  return toResponse(reply, &GoogleTranslator::parseFreeResponse);
}

TranslationResponse
GoogleTranslator::translatePaid(const std::string &text,
                                const std::string &source,
                                const std::string &target,
                                const CancellationToken *cancel) const {
  http::FormFields fields{{"q", text}, {"target", target}, {"format", "text"}};
  if (source != "auto") {
    fields.emplace_back("source", source);
  }

  http::HttpResponse reply =
      http::postForm(m_config.paidEndpoint, fields,
                     makeSession(m_config, cancel),
                     {{"X-Goog-Api-Key", m_config.apiKey}});

  return toResponse(reply, &GoogleTranslator::parsePaidResponse);
}

std::string GoogleTranslator::normalizeLanguageCode(const std::string &code) {
  std::string lower = toLower(code);
  std::replace(lower.begin(), lower.end(), '_', '-');

  if (lower == "auto") {
    return lower;
  }
  if (lower == "zh" || lower == "zh-cn" || lower == "zh-sg" ||
      lower == "zh-hans") {
    return "zh-CN";
  }
  if (lower == "zh-tw" || lower == "zh-hk" || lower == "zh-mo" ||
      lower == "zh-hant") {
    return "zh-TW";
  }

  std::size_t dash = lower.find('-');
  if (dash != std::string::npos) {
    return lower.substr(0, dash);
  }
  return lower;
}

bool GoogleTranslator::parseFreeResponse(const std::string &body,
                                         std::string &out) {
  json root = json::parse(body, nullptr, false);
  if (root.is_discarded() || !root.is_array() || root.empty() ||
      !root[0].is_array()) {
    return false;
  }

  // The service splits the input into sentences, one segment each
  std::string joined;
  for (const auto &segment : root[0]) {
    if (segment.is_array() && !segment.empty() && segment[0].is_string()) {
      joined += segment[0].get<std::string>();
    }
  }

  out = std::move(joined);
  return true;
}

bool GoogleTranslator::parsePaidResponse(const std::string &body,
                                         std::string &out) {
  json root = json::parse(body, nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    return false;
  }

  auto data = root.find("data");
  if (data == root.end() || !data->is_object()) {
    return false;
  }
  auto translations = data->find("translations");
  if (translations == data->end() || !translations->is_array() ||
      translations->empty()) {
    return false;
  }
  const json &first = (*translations)[0];
  auto translated = first.find("translatedText");
  if (translated == first.end() || !translated->is_string()) {
    return false;
  }

  out = translated->get<std::string>();
  return true;
}

std::string GoogleTranslator::describeFailure(int statusCode,
                                              const std::string &transportError,
                                              bool &retryable) {
  if (!transportError.empty()) {
    retryable = true;
    return "Network error: " + transportError;
  }

  const std::string status = " (HTTP " + std::to_string(statusCode) + ")";

  if (statusCode == 429) {
    retryable = true;
    return "Rate limited by the translation service" + status;
  }
  if (statusCode == 408 || statusCode >= 500) {
    retryable = true;
    return "Translation service unavailable" + status;
  }
  retryable = false;
  if (statusCode == 401 || statusCode == 403) {
    return "Access denied by the translation service, check the API key "
           "and quota" +
           status;
  }
  if (statusCode == 400) {
    return "Request rejected by the translation service, check the language "
           "codes" +
           status;
  }
  if (statusCode == 404) {
    return "Translation endpoint not found" + status;
  }
  return "Unexpected response from the translation service" + status;
}

} // namespace pdftrans
