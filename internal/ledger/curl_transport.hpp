#pragma once

#include <cstddef>

#include "rpc_transport.hpp"

namespace pulsetx::ledger {

/*
  libcurl backed transport.

  One easy handle per request, so a single instance can be
  shared by every session pipeline.
*/
class CurlTransport final : public RpcTransport {
 public:
  CurlTransport();

  CurlTransport(const CurlTransport&)            = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  HttpResponse Post(const HttpRequest& request) override;

 private:
  static size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
};

} // namespace pulsetx::ledger
