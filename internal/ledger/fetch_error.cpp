#include "fetch_error.hpp"

#include <sstream>

namespace pulsetx::ledger {

const char* KindName(FetchError::Kind kind) {
  switch (kind) {
    case FetchError::Kind::kTransport:
      return "transport";
    case FetchError::Kind::kDecode:
      return "decode";
    case FetchError::Kind::kRemoteRejected:
      return "remote_rejected";
  }
  return "unknown";
}

std::string FetchError::ToString() const {
  std::ostringstream out;
  out << KindName(kind);
  if (code != 0) {
    out << " code=" << code;
  }
  if (!message.empty()) {
    out << ": " << message;
  }
  return out.str();
}

} // namespace pulsetx::ledger
