#pragma once

#include <stdexcept>
#include <string>

namespace pulsetx::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Page fetch and heart rate failures are not thrown across
  the pipeline; see ledger::FetchError and biometric::Resolution.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by RpcTransport implementations when no HTTP response
// arrived at all (connect, TLS, timeout).
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg, long http_status = 0) : std::runtime_error(msg), http_status_(http_status) {
  }

  long http_status() const {
    return http_status_;
  }

 private:
  long http_status_;
};

} // namespace pulsetx::util
