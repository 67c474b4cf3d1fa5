#include "clients/http_client.h"
#include <memory>
#include <mutex>

std::string HttpResponse::bodyExcerpt() const {
  return body.length() > 200 ? body.substr(0, 200) : body;
}

HttpClient::HttpClient(const std::string &baseUrl, LogCategory category)
    : baseUrl_(baseUrl), timeoutSeconds_(30), category_(category) {
  ensureGlobalInit();
}

void HttpClient::ensureGlobalInit() {
  static std::once_flag once;
  std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t HttpClient::WriteCallback(void *contents, size_t size, size_t nmemb,
                                 void *userp) {
  static_cast<std::string *>(userp)->append(static_cast<char *>(contents),
                                            size * nmemb);
  return size * nmemb;
}

std::string HttpClient::buildURL(const std::string &endpoint) const {
  std::string url = baseUrl_;
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  if (!endpoint.empty() && endpoint.front() != '/') {
    url += "/";
  }
  url += endpoint;
  return url;
}

HttpResponse HttpClient::request(const std::string &endpoint,
                                 const std::string &method,
                                 const std::string &body,
                                 std::chrono::milliseconds timeout) const {
  HttpResponse response;

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                          curl_easy_cleanup);
  if (!curl) {
    response.error_message = "CURL not initialized";
    Logger::error(category_, "HttpClient", "Failed to initialize CURL");
    return response;
  }

  long timeoutMs = static_cast<long>(timeoutSeconds_) * 1000L;
  if (timeout.count() > 0 && timeout.count() < timeoutMs) {
    timeoutMs = static_cast<long>(timeout.count());
  }

  const std::string url = buildURL(endpoint);
  std::string responseBody;
  struct curl_slist *headerList = nullptr;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &responseBody);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeoutMs);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

  if (method == "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  } else {
    if (method != "POST") {
      curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.length()));
    headerList =
        curl_slist_append(headerList, "Content-Type: application/json");
  }

  for (const auto &[name, value] : defaultHeaders_) {
    std::string header = name + ": " + value;
    headerList = curl_slist_append(headerList, header.c_str());
  }
  if (!bearerToken_.empty()) {
    std::string header = "Authorization: Bearer " + bearerToken_;
    headerList = curl_slist_append(headerList, header.c_str());
  }
  if (headerList) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList);
  }

  CURLcode res = curl_easy_perform(curl.get());

  if (headerList) {
    curl_slist_free_all(headerList);
  }

  if (res != CURLE_OK) {
    response.error_message = curl_easy_strerror(res);
    Logger::warning(category_, "HttpClient",
                    method + " " + url + " failed: " + response.error_message);
    return response;
  }

  long httpCode = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
  response.status_code = static_cast<int>(httpCode);
  response.body = std::move(responseBody);

  if (!response.ok()) {
    response.error_message = "HTTP " + std::to_string(response.status_code) +
                             ": " + response.bodyExcerpt();
  }
  Logger::debug(category_, "HttpClient",
                method + " " + url + " -> " +
                    std::to_string(response.status_code));
  return response;
}
