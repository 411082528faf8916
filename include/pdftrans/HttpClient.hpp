#ifndef PDFTRANS_HTTP_CLIENT_HPP
#define PDFTRANS_HTTP_CLIENT_HPP

#include <string>
#include <utility>
#include <vector>

namespace pdftrans {

class CancellationToken;

namespace http {

struct Header {
  std::string name;
  std::string value;
};

struct SessionConfig {
  int connectTimeoutMs = 5000;
  int timeoutMs = 45000;
  const CancellationToken *cancel = nullptr; ///< Aborts the transfer
  std::string userAgent = "pdftrans/1.0";
};

struct HttpResponse {
  int statusCode = 0;
  std::string body;
  std::string error; ///< Non-empty on network/transport errors

  bool ok() const {
    return error.empty() && statusCode >= 200 && statusCode < 300;
  }
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

/// Percent-encode everything except RFC 3986 unreserved characters
std::string urlEncode(const std::string &s);

/// Build an application/x-www-form-urlencoded body
std::string encodeForm(const FormFields &fields);

/**
 * @brief POST an x-www-form-urlencoded body
 *
 * Transport failures are reported in HttpResponse::error, never thrown.
 * Safe to call from several threads at once.
 */
HttpResponse postForm(const std::string &url, const FormFields &fields,
                      const SessionConfig &config,
                      const std::vector<Header> &headers = {});

} // namespace http
} // namespace pdftrans

#endif // PDFTRANS_HTTP_CLIENT_HPP
