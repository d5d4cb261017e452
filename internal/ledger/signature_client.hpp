#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "fetch_error.hpp"
#include "rpc_transport.hpp"

namespace pulsetx::ledger {

struct SignatureClientOptions {
  std::string rpc_url;
  std::string api_key;

  std::chrono::milliseconds request_timeout{10'000};
  std::chrono::milliseconds connect_timeout{5'000};
};

/*
  getSignaturesForAddress over JSON-RPC 2.0.

  Stateless apart from its options; every call is a single POST
  and nothing is retried.
*/
class SignatureClient {
 public:
  static constexpr const char* kMethod = "getSignaturesForAddress";

  SignatureClient(std::shared_ptr<RpcTransport> transport, SignatureClientOptions options);

  // Newest first, as the node returns them. An empty page means
  // there is nothing older than `before`.
  FetchResult FetchPage(const std::string& address, uint32_t limit, const std::optional<std::string>& before) const;

  // exposed for tests
  static std::string BuildRequestBody(const std::string& address, uint32_t limit, const std::optional<std::string>& before);
  static FetchResult DecodeResponse(const HttpResponse& response);

 private:
  std::string Endpoint() const;

  std::shared_ptr<RpcTransport> transport_;
  SignatureClientOptions        options_;
};

} // namespace pulsetx::ledger
