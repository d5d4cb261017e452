#include "internal/ledger/signature_client.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using pulsetx::ledger::FetchError;
using pulsetx::ledger::HttpResponse;
using pulsetx::ledger::SignatureClient;
using pulsetx::ledger::SignatureClientOptions;
using pulsetx::testing::FakeTransport;
using pulsetx::testing::Ok;
using pulsetx::testing::PageBody;
using pulsetx::testing::RequestAddress;
using pulsetx::testing::RequestOptions;
using pulsetx::testing::RpcErrorResponse;

const std::string kAddress = "9WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM";

SignatureClientOptions Options(std::string api_key = "") {
  SignatureClientOptions options;
  options.rpc_url         = "https://rpc.example.org/";
  options.api_key         = std::move(api_key);
  options.request_timeout = std::chrono::milliseconds(1500);
  options.connect_timeout = std::chrono::milliseconds(700);
  return options;
}

void TestRequestBodyOmitsBeforeWithoutCursor() {
  const auto body    = SignatureClient::BuildRequestBody(kAddress, 30, std::nullopt);
  const auto options = RequestOptions(body);

  assert(RequestAddress(body) == kAddress);
  assert(options.fields().at("limit").number_value() == 30);
  assert(options.fields().count("before") == 0);
  assert(body.find("\"method\":\"getSignaturesForAddress\"") != std::string::npos);
  assert(body.find("\"jsonrpc\":\"2.0\"") != std::string::npos);
}

void TestRequestBodyCarriesCursor() {
  const auto options = RequestOptions(SignatureClient::BuildRequestBody(kAddress, 5, std::string("SigCursor")));

  assert(options.fields().at("limit").number_value() == 5);
  assert(options.fields().at("before").string_value() == "SigCursor");
}

void TestDecodesCamelCaseEntries() {
  const auto result = SignatureClient::DecodeResponse(Ok(PageBody({{"A", 1'700'000'000}, {"B", std::nullopt, true}})));

  assert(result.ok());
  const auto& page = result.page();
  assert(page.size() == 2);
  assert(page[0].signature() == "A");
  assert(page[0].slot() == 100);
  assert(page[0].has_block_time());
  assert(page[0].block_time() == 1'700'000'000);
  assert(page[0].err().kind_case() == google::protobuf::Value::kNullValue);
  assert(page[0].confirmation_status() == "finalized");

  assert(!page[1].has_block_time());
  assert(page[1].err().kind_case() == google::protobuf::Value::kStructValue);
}

void TestDecodesSnakeCaseAndUnknownFields() {
  const auto result = SignatureClient::DecodeResponse(
      Ok(R"({"jsonrpc":"2.0","id":1,"result":[{"signature":"S","slot":7,"block_time":42,"err":null,"extra":{"x":1}}]})"));

  assert(result.ok());
  assert(result.page().size() == 1);
  assert(result.page()[0].block_time() == 42);
}

void TestEmptyResultIsAnEmptyPage() {
  const auto result = SignatureClient::DecodeResponse(Ok(PageBody({})));

  assert(result.ok());
  assert(result.page().empty());
}

void TestMissingResultIsDecodeError() {
  const auto result = SignatureClient::DecodeResponse(Ok(R"({"jsonrpc":"2.0","id":1})"));

  assert(!result.ok());
  assert(result.error().kind == FetchError::Kind::kDecode);
}

void TestNonArrayResultIsDecodeError() {
  const auto result = SignatureClient::DecodeResponse(Ok(R"({"jsonrpc":"2.0","id":1,"result":{"value":[]}})"));

  assert(!result.ok());
  assert(result.error().kind == FetchError::Kind::kDecode);
}

void TestEntryWithoutSignatureIsDecodeError() {
  const auto result = SignatureClient::DecodeResponse(Ok(R"({"jsonrpc":"2.0","id":1,"result":[{"slot":3}]})"));

  assert(!result.ok());
  assert(result.error().kind == FetchError::Kind::kDecode);
}

void TestGarbageBodyIsDecodeError() {
  const auto result = SignatureClient::DecodeResponse(Ok("<html>gateway</html>"));

  assert(!result.ok());
  assert(result.error().kind == FetchError::Kind::kDecode);
}

void TestErrorEnvelopeIsRemoteRejected() {
  const auto result = SignatureClient::DecodeResponse(RpcErrorResponse(-32602, "Invalid param: WrongSize"));

  assert(!result.ok());
  assert(result.error().kind == FetchError::Kind::kRemoteRejected);
  assert(result.error().code == -32602);
  assert(result.error().message == "Invalid param: WrongSize");
}

void TestErrorEnvelopeWinsOverHttpStatus() {
  const auto result = SignatureClient::DecodeResponse(RpcErrorResponse(429, "Too many requests", 429));

  assert(!result.ok());
  assert(result.error().kind == FetchError::Kind::kRemoteRejected);
  assert(result.error().code == 429);
}

void TestOutOfRangeErrorCodeIsDecodeError() {
  for (const char* code : {"1e20", "-1e20", "-32602.5"}) {
    const auto result = SignatureClient::DecodeResponse(
        Ok(std::string(R"({"jsonrpc":"2.0","id":1,"error":{"code":)") + code + R"(,"message":"x"}})"));

    assert(!result.ok());
    assert(result.error().kind == FetchError::Kind::kDecode);
    assert(result.error().message == "malformed error code");
  }

  const auto edge = SignatureClient::DecodeResponse(RpcErrorResponse(-2147483647 - 1, "min"));
  assert(edge.error().kind == FetchError::Kind::kRemoteRejected);
  assert(edge.error().code == -2147483647 - 1);
}

void TestHttpFailureWithoutEnvelopeIsTransport() {
  const auto result = SignatureClient::DecodeResponse(HttpResponse{503, "Service Unavailable"});

  assert(!result.ok());
  assert(result.error().kind == FetchError::Kind::kTransport);
  assert(result.error().code == 503);
}

void TestFetchPageSendsConfiguredRequest() {
  auto transport = std::make_shared<FakeTransport>();
  transport->Push(Ok(PageBody({{"A", 10}})));

  SignatureClient client(transport, Options("a b"));
  const auto      result = client.FetchPage(kAddress, 30, std::string("Prev"));
  assert(result.ok());
  assert(result.page().size() == 1);

  const auto requests = transport->Requests();
  assert(requests.size() == 1);
  assert(requests[0].url == "https://rpc.example.org/?api-key=a%20b");
  assert(requests[0].timeout == std::chrono::milliseconds(1500));
  assert(requests[0].connect_timeout == std::chrono::milliseconds(700));
  assert(RequestOptions(requests[0].body).fields().at("before").string_value() == "Prev");
}

void TestFetchPageWithoutApiKeyUsesBareUrl() {
  auto transport = std::make_shared<FakeTransport>();
  transport->Push(Ok(PageBody({})));

  SignatureClient client(transport, Options());
  assert(client.FetchPage(kAddress, 1, std::nullopt).ok());
  assert(transport->Requests()[0].url == "https://rpc.example.org/");
}

void TestTransportExceptionBecomesTransportError() {
  auto transport = std::make_shared<FakeTransport>();
  transport->PushThrow("Timeout was reached");

  SignatureClient client(transport, Options());
  const auto      result = client.FetchPage(kAddress, 30, std::nullopt);

  assert(!result.ok());
  assert(result.error().kind == FetchError::Kind::kTransport);
  assert(result.error().message == "Timeout was reached");
}

void TestInvalidArgumentsThrow() {
  auto            transport = std::make_shared<FakeTransport>();
  SignatureClient client(transport, Options());

  bool threw = false;
  try {
    client.FetchPage("", 30, std::nullopt);
  } catch (const pulsetx::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    client.FetchPage(kAddress, 0, std::nullopt);
  } catch (const pulsetx::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(transport->CallCount() == 0);
}

} // namespace

int main() {
  TestRequestBodyOmitsBeforeWithoutCursor();
  TestRequestBodyCarriesCursor();
  TestDecodesCamelCaseEntries();
  TestDecodesSnakeCaseAndUnknownFields();
  TestEmptyResultIsAnEmptyPage();
  TestMissingResultIsDecodeError();
  TestNonArrayResultIsDecodeError();
  TestEntryWithoutSignatureIsDecodeError();
  TestGarbageBodyIsDecodeError();
  TestErrorEnvelopeIsRemoteRejected();
  TestErrorEnvelopeWinsOverHttpStatus();
  TestOutOfRangeErrorCodeIsDecodeError();
  TestHttpFailureWithoutEnvelopeIsTransport();
  TestFetchPageSendsConfiguredRequest();
  TestFetchPageWithoutApiKeyUsesBareUrl();
  TestTransportExceptionBecomesTransportError();
  TestInvalidArgumentsThrow();

  std::cout << "pulsetx_unit_signature_client: pass\n";
  return 0;
}
