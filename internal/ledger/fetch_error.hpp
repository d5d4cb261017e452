#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "pulsetx/ledger/v1/rpc.pb.h"

namespace pulsetx::ledger {

/*
  Why a page fetch produced no signatures.

  All three kinds abort the page in the same way; the split
  exists so callers can tell a flaky link from a node that
  refused the request.
*/
struct FetchError {
  enum class Kind {
    kTransport,
    kDecode,
    kRemoteRejected,
  };

  Kind        kind = Kind::kTransport;
  int         code = 0; // JSON-RPC error code, or HTTP status for kTransport
  std::string message;

  static FetchError Transport(std::string msg, int http_status = 0) {
    return {Kind::kTransport, http_status, std::move(msg)};
  }

  static FetchError Decode(std::string msg) {
    return {Kind::kDecode, 0, std::move(msg)};
  }

  static FetchError RemoteRejected(int rpc_code, std::string msg) {
    return {Kind::kRemoteRejected, rpc_code, std::move(msg)};
  }

  std::string ToString() const;
};

const char* KindName(FetchError::Kind kind);

using SignaturePage = std::vector<pulsetx::ledger::v1::SignatureInfo>;

class FetchResult {
 public:
  static FetchResult Ok(SignaturePage page) {
    return FetchResult(std::move(page));
  }

  static FetchResult Err(FetchError error) {
    return FetchResult(std::move(error));
  }

  bool ok() const {
    return std::holds_alternative<SignaturePage>(value_);
  }

  explicit operator bool() const {
    return ok();
  }

  const SignaturePage& page() const {
    return std::get<SignaturePage>(value_);
  }

  SignaturePage& page() {
    return std::get<SignaturePage>(value_);
  }

  const FetchError& error() const {
    return std::get<FetchError>(value_);
  }

 private:
  explicit FetchResult(SignaturePage page) : value_(std::move(page)) {
  }
  explicit FetchResult(FetchError error) : value_(std::move(error)) {
  }

  std::variant<SignaturePage, FetchError> value_;
};

} // namespace pulsetx::ledger
