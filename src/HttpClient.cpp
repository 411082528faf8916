#include "pdftrans/HttpClient.hpp"

#include "pdftrans/CancellationToken.hpp"

#include <curl/curl.h>

#include <cctype>
#include <memory>
#include <mutex>

namespace pdftrans {
namespace http {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlListDeleter>;

std::once_flag curlInitFlag;
CURLcode curlInitCode = CURLE_OK;

// curl_global_init is not thread-safe, run it exactly once
bool ensureCurlInitialized() {
  std::call_once(curlInitFlag, []() {
    curlInitCode = curl_global_init(CURL_GLOBAL_DEFAULT);
  });
  return curlInitCode == CURLE_OK;
}

size_t writeBody(char *data, size_t size, size_t count, void *userdata) {
  auto *body = static_cast<std::string *>(userdata);
  body->append(data, size * count);
  return size * count;
}

int transferProgress(void *userdata, curl_off_t, curl_off_t, curl_off_t,
                     curl_off_t) {
  const auto *cancel = static_cast<const CancellationToken *>(userdata);
  // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
  return cancel && cancel->isCancelled() ? 1 : 0;
}

// curl_slist_append returns the list head, which only changes for the first
// entry
bool appendHeader(CurlHeaderList &list, const std::string &line) {
  curl_slist *head = curl_slist_append(list.get(), line.c_str());
  if (!head) {
    return false;
  }
  if (!list) {
    list.reset(head);
  }
  return true;
}

bool equalsIgnoreCase(const std::string &a, const std::string &b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

} // anonymous namespace

std::string urlEncode(const std::string &s) {
  static const char hex[] = "0123456789ABCDEF";

  std::string escaped;
  escaped.reserve(s.size() * 3);

  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped += static_cast<char>(c);
    } else {
      escaped += '%';
      escaped += hex[c >> 4];
      escaped += hex[c & 0x0F];
    }
  }
  return escaped;
}

std::string encodeForm(const FormFields &fields) {
  std::string body;
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      body += '&';
    }
    body += urlEncode(fields[i].first);
    body += '=';
    body += urlEncode(fields[i].second);
  }
  return body;
}

HttpResponse postForm(const std::string &url, const FormFields &fields,
                      const SessionConfig &config,
                      const std::vector<Header> &headers) {
  HttpResponse response;

  if (!ensureCurlInitialized()) {
    response.error = "Failed to initialize libcurl";
    return response;
  }

  CurlHandle curl(curl_easy_init());
  if (!curl) {
    response.error = "Failed to create curl handle";
    return response;
  }

  bool hasContentType = false;
  CurlHeaderList headerList;
  for (const auto &header : headers) {
    if (equalsIgnoreCase(header.name, "Content-Type")) {
      hasContentType = true;
    }
    if (!appendHeader(headerList, header.name + ": " + header.value)) {
      response.error = "Failed to build request headers";
      return response;
    }
  }
  if (!hasContentType &&
      !appendHeader(headerList,
                    "Content-Type: application/x-www-form-urlencoded")) {
    response.error = "Failed to build request headers";
    return response;
  }

  const std::string body = encodeForm(fields);
  char errorBuffer[CURL_ERROR_SIZE] = {0};

  CURL *handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle, CURLOPT_POST, 1L);
  curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(body.size()));
  curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headerList.get());
  curl_easy_setopt(handle, CURLOPT_USERAGENT, config.userAgent.c_str());
  curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(config.connectTimeoutMs));
  curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(config.timeoutMs));
  // Worker threads must not receive SIGALRM from the resolver
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, errorBuffer);
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &writeBody);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);

  if (config.cancel) {
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, &transferProgress);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA,
                     const_cast<CancellationToken *>(config.cancel));
  }

  CURLcode code = curl_easy_perform(handle);
  if (code != CURLE_OK) {
    response.error = errorBuffer[0] != '\0' ? std::string(errorBuffer)
                                            : curl_easy_strerror(code);
    response.body.clear();
    return response;
  }

  long statusCode = 0;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &statusCode);
  response.statusCode = static_cast<int>(statusCode);

  return response;
}

} // namespace http
} // namespace pdftrans
