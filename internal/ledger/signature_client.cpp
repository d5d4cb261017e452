#include "signature_client.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pulsetx::ledger {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;
using pulsetx::observability::IntField;
using pulsetx::observability::StringField;

bool IsSuccessStatus(long status) {
  return status >= 200 && status < 300;
}

std::string PercentEncode(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (unsigned char c : in) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
      continue;
    }
    char buf[4];
    std::snprintf(buf, sizeof(buf), "%%%02X", c);
    out += buf;
  }
  return out;
}

const Value* FindField(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() == Value::kNullValue) {
    return nullptr;
  }
  return &it->second;
}

// JSON-RPC error codes are integers; anything else is not a usable code.
bool ToErrorCode(double number, int& code) {
  if (!std::isfinite(number) || std::trunc(number) != number) {
    return false;
  }
  if (number < static_cast<double>(std::numeric_limits<int>::min()) || number > static_cast<double>(std::numeric_limits<int>::max())) {
    return false;
  }
  code = static_cast<int>(number);
  return true;
}

FetchError RejectionFrom(const Value& error) {
  if (error.kind_case() != Value::kStructValue) {
    return FetchError::RemoteRejected(0, error.kind_case() == Value::kStringValue ? error.string_value() : "malformed error object");
  }

  int         code = 0;
  std::string message;
  if (const auto* c = FindField(error.struct_value(), "code"); c && c->kind_case() == Value::kNumberValue) {
    if (!ToErrorCode(c->number_value(), code)) {
      return FetchError::Decode("malformed error code");
    }
  }
  if (const auto* m = FindField(error.struct_value(), "message"); m && m->kind_case() == Value::kStringValue) {
    message = m->string_value();
  }
  return FetchError::RemoteRejected(code, std::move(message));
}

} // namespace

SignatureClient::SignatureClient(std::shared_ptr<RpcTransport> transport, SignatureClientOptions options)
    : transport_(std::move(transport)), options_(std::move(options)) {
  if (!transport_) {
    throw util::InvalidArgument("SignatureClient requires a transport");
  }
  if (options_.rpc_url.empty()) {
    throw util::InvalidArgument("SignatureClient requires an rpc url");
  }
}

std::string SignatureClient::Endpoint() const {
  if (options_.api_key.empty()) {
    return options_.rpc_url;
  }
  const char sep = options_.rpc_url.find('?') == std::string::npos ? '?' : '&';
  return options_.rpc_url + sep + "api-key=" + PercentEncode(options_.api_key);
}

std::string SignatureClient::BuildRequestBody(const std::string& address, uint32_t limit, const std::optional<std::string>& before) {
  Struct request;
  auto&  fields = *request.mutable_fields();

  fields["jsonrpc"].set_string_value("2.0");
  fields["id"].set_number_value(1);
  fields["method"].set_string_value(kMethod);

  auto* params = fields["params"].mutable_list_value();
  params->add_values()->set_string_value(address);

  auto& options = *params->add_values()->mutable_struct_value()->mutable_fields();
  options["limit"].set_number_value(limit);
  if (before.has_value()) {
    options["before"].set_string_value(*before);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(request, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize RPC request: " + std::string(status.message()));
  }
  return json;
}

// ------------------------------------------------------------
// Response decoding
// ------------------------------------------------------------

FetchResult SignatureClient::DecodeResponse(const HttpResponse& response) {
  Struct root;
  if (!google::protobuf::util::JsonStringToMessage(response.body, &root).ok()) {
    if (!IsSuccessStatus(response.status)) {
      return FetchResult::Err(FetchError::Transport("HTTP " + std::to_string(response.status), static_cast<int>(response.status)));
    }
    return FetchResult::Err(FetchError::Decode("response is not a JSON object"));
  }

  // protocol errors win over everything else, including HTTP status
  if (const auto* error = FindField(root, "error")) {
    return FetchResult::Err(RejectionFrom(*error));
  }

  if (!IsSuccessStatus(response.status)) {
    return FetchResult::Err(FetchError::Transport("HTTP " + std::to_string(response.status), static_cast<int>(response.status)));
  }

  const auto* result = FindField(root, "result");
  if (result == nullptr) {
    return FetchResult::Err(FetchError::Decode("response has neither result nor error"));
  }
  if (result->kind_case() != Value::kListValue) {
    return FetchResult::Err(FetchError::Decode("result is not an array"));
  }

  pulsetx::ledger::v1::SignaturesEnvelope envelope;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(response.body, &envelope, options);
  if (!status.ok()) {
    return FetchResult::Err(FetchError::Decode("malformed signature entry: " + std::string(status.message())));
  }

  SignaturePage page;
  page.reserve(envelope.result_size());
  for (auto& info : *envelope.mutable_result()) {
    if (info.signature().empty()) {
      return FetchResult::Err(FetchError::Decode("signature entry without signature"));
    }
    page.push_back(std::move(info));
  }
  return FetchResult::Ok(std::move(page));
}

// ------------------------------------------------------------
// FetchPage
// ------------------------------------------------------------

FetchResult SignatureClient::FetchPage(const std::string& address, uint32_t limit, const std::optional<std::string>& before) const {
  if (address.empty()) {
    throw util::InvalidArgument("FetchPage: address must not be empty");
  }
  if (limit == 0) {
    throw util::InvalidArgument("FetchPage: limit must be positive");
  }

  HttpRequest request;
  request.url             = Endpoint();
  request.body            = BuildRequestBody(address, limit, before);
  request.headers         = {"Content-Type: application/json", "Accept: application/json"};
  request.timeout         = options_.request_timeout;
  request.connect_timeout = options_.connect_timeout;

  PULSETX_LOG_DEBUG("Fetching signature page",
                    {StringField("address", address), IntField("limit", limit), StringField("before", before.value_or(""))});

  HttpResponse response;
  try {
    response = transport_->Post(request);
  } catch (const util::TransportError& e) {
    PULSETX_LOG_WARN("Signature page transport failure", {StringField("address", address), StringField("error", e.what())});
    return FetchResult::Err(FetchError::Transport(e.what(), static_cast<int>(e.http_status())));
  }

  auto result = DecodeResponse(response);
  if (!result) {
    PULSETX_LOG_WARN("Signature page rejected",
                     {StringField("address", address), StringField("error", result.error().ToString()), IntField("http_status", response.status)});
    return result;
  }

  PULSETX_LOG_DEBUG("Fetched signature page", {StringField("address", address), IntField("count", static_cast<int64_t>(result.page().size()))});
  return result;
}

} // namespace pulsetx::ledger
