#include "pdftrans/Config.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace pdftrans {

namespace {

bool isBlankLanguage(const std::string &code) {
  return code.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // anonymous namespace

std::string validateConfig(const PipelineConfig &config) {
  // Beyond this a letter-sized page renders to gigabytes
  constexpr int maxDpi = 1200;

  if (config.dpi <= 0 || config.dpi > maxDpi) {
    return "Invalid dpi " + std::to_string(config.dpi) +
           " (must be between 1 and " + std::to_string(maxDpi) + ")";
  }
  if (config.maxChunkLength <= 0) {
    return "Invalid chunk length " + std::to_string(config.maxChunkLength) +
           " (must be positive)";
  }
  if (config.maxConcurrentRequests <= 0) {
    return "Invalid concurrency " +
           std::to_string(config.maxConcurrentRequests) +
           " (must be positive)";
  }
  if (config.maxRetries < 0) {
    return "Invalid retry count " + std::to_string(config.maxRetries);
  }
  if (config.retryBackoffMs < 0 || config.connectTimeoutMs < 0 ||
      config.requestTimeoutMs < 0) {
    return "Timeouts and backoff must not be negative";
  }
  if (config.pageSegMode < 0 || config.pageSegMode > 13) {
    return "Invalid page segmentation mode " +
           std::to_string(config.pageSegMode) + " (must be 0-13)";
  }
  if (config.deadlineSeconds < 0.0 || !std::isfinite(config.deadlineSeconds)) {
    return "Invalid deadline (must be a non-negative number of seconds)";
  }
  if (isBlankLanguage(config.ocrLanguage)) {
    return "OCR language must not be empty";
  }
  if (isBlankLanguage(config.targetLanguage)) {
    return "Target language must not be empty";
  }
  if (isBlankLanguage(config.sourceLanguage)) {
    return "Source language must not be empty";
  }
  return "";
}

bool parseIntegerOption(const std::string &value, int &out) {
  if (value.empty()) {
    return false;
  }

  const char *begin = value.c_str();
  char *end = nullptr;
  errno = 0;
  long parsed = std::strtol(begin, &end, 10);

  if (end == begin || *end != '\0' || errno == ERANGE) {
    return false;
  }
  if (parsed < std::numeric_limits<int>::min() ||
      parsed > std::numeric_limits<int>::max()) {
    return false;
  }
  // strtol accepts leading blanks, the option syntax does not
  if (value[0] == ' ' || value[0] == '\t') {
    return false;
  }

  out = static_cast<int>(parsed);
  return true;
}

bool parseSecondsOption(const std::string &value, double &out) {
  if (value.empty() || value[0] == ' ' || value[0] == '\t') {
    return false;
  }

  const char *begin = value.c_str();
  char *end = nullptr;
  errno = 0;
  double parsed = std::strtod(begin, &end);

  if (end == begin || *end != '\0' || errno == ERANGE ||
      !std::isfinite(parsed) || parsed < 0.0) {
    return false;
  }

  out = parsed;
  return true;
}

} // namespace pdftrans
