#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace pulsetx::ledger {

struct HttpRequest {
  std::string              url;
  std::string              body;
  std::vector<std::string> headers;

  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds connect_timeout{0};
};

struct HttpResponse {
  long        status = 0;
  std::string body;
};

/*
  Abstract HTTP POST used by the signature client.

  Implementations throw util::TransportError when no response
  was received (connect failure, TLS failure, timeout). A response
  with a non-2xx status is returned, not thrown, so the caller can
  still read a JSON-RPC error envelope from it.
*/
class RpcTransport {
 public:
  virtual ~RpcTransport() = default;

  virtual HttpResponse Post(const HttpRequest& request) = 0;
};

} // namespace pulsetx::ledger
