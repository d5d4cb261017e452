#include "curl_transport.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/util/errors.hpp"

namespace pulsetx::ledger {

namespace {

std::once_flag g_curl_global_once;

struct EasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

} // namespace

CurlTransport::CurlTransport() {
  std::call_once(g_curl_global_once, [] {
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
      throw util::TransportError("curl_global_init failed");
    }
  });
}

size_t CurlTransport::WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

HttpResponse CurlTransport::Post(const HttpRequest& request) {
  std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
  if (!curl) {
    throw util::TransportError("curl_easy_init failed");
  }

  curl_slist* raw_headers = nullptr;
  for (const auto& header : request.headers) {
    raw_headers = curl_slist_append(raw_headers, header.c_str());
  }
  std::unique_ptr<curl_slist, HeaderListDeleter> headers(raw_headers);

  HttpResponse response;

  curl_easy_setopt(curl.get(), CURLOPT_URL,            request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER,     headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POST,           1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS,     request.body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,  static_cast<long>(request.body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,  &CurlTransport::WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA,      &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL,       1L);

  if (request.timeout.count() > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
  }
  if (request.connect_timeout.count() > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
  }

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw util::TransportError(std::string("POST failed: ") + curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

} // namespace pulsetx::ledger
