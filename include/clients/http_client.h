#ifndef HTTP_CLIENT_H
#define HTTP_CLIENT_H

#include "core/logger.h"
#include <chrono>
#include <curl/curl.h>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

struct HttpResponse {
  int status_code = 0;
  std::string body;
  std::string error_message;

  bool ok() const { return status_code >= 200 && status_code < 300; }
  bool transportFailed() const { return status_code == 0; }

  // First 200 bytes of the body, for error messages.
  std::string bodyExcerpt() const;
};

// Thin libcurl wrapper. Every request runs on its own easy handle, so one
// client can be shared between worker threads. No retries happen here.
class HttpClient {
  std::string baseUrl_;
  std::map<std::string, std::string> defaultHeaders_;
  std::string bearerToken_;
  int timeoutSeconds_;
  LogCategory category_;

  static size_t WriteCallback(void *contents, size_t size, size_t nmemb,
                              void *userp);
  static void ensureGlobalInit();

public:
  explicit HttpClient(const std::string &baseUrl,
                      LogCategory category = LogCategory::SYSTEM);

  void setBearerToken(const std::string &token) { bearerToken_ = token; }
  void setDefaultHeader(const std::string &name, const std::string &value) {
    defaultHeaders_[name] = value;
  }
  void setTimeout(int seconds) { timeoutSeconds_ = seconds; }
  int timeoutSeconds() const { return timeoutSeconds_; }
  const std::string &baseUrl() const { return baseUrl_; }

  std::string buildURL(const std::string &endpoint) const;

  // `timeout` caps this request below the client timeout when positive.
  HttpResponse request(const std::string &endpoint, const std::string &method,
                       const std::string &body = "",
                       std::chrono::milliseconds timeout =
                           std::chrono::milliseconds::zero()) const;

  HttpResponse get(const std::string &endpoint,
                   std::chrono::milliseconds timeout =
                       std::chrono::milliseconds::zero()) const {
    return request(endpoint, "GET", "", timeout);
  }

  HttpResponse postJson(const std::string &endpoint, const json &payload,
                        std::chrono::milliseconds timeout =
                            std::chrono::milliseconds::zero()) const {
    return request(endpoint, "POST", payload.dump(), timeout);
  }
};

#endif
