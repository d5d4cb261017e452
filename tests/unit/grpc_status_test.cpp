#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/grpc/correlation_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/session_service.hpp"
#include "internal/util/errors.hpp"
#include "pulsetx/v1.hpp"
#include "test_support.hpp"

namespace {

using pulsetx::grpc::ToStatus;

std::shared_ptr<pulsetx::service::SessionService> BuildSessions() {
  pulsetx::runtime::config::RuntimeConfig config;
  config.mutable_ledger()->set_rpc_url("http://ledger.test");
  config.mutable_ledger()->set_page_limit(10);

  auto ctx = pulsetx::factory::BuildContext(config, std::make_shared<pulsetx::testing::FakeTransport>());
  return std::make_shared<pulsetx::service::SessionService>(std::move(ctx));
}

void TestExceptionMapping() {
  assert(ToStatus(pulsetx::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(pulsetx::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(pulsetx::util::Unavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(pulsetx::util::ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(pulsetx::util::TransportError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

void TestUnknownSessionReturnsNotFound() {
  pulsetx::grpc::CorrelationServer server(BuildSessions());

  pulsetx::v1::GetRecordsRequest req;
  req.mutable_session()->set_value("123e4567-e89b-12d3-a456-426614174000");
  pulsetx::v1::GetRecordsResponse resp;
  ::grpc::ServerContext           grpc_ctx;

  const auto status = server.GetRecords(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestMissingAddressIsRejectedDecision() {
  pulsetx::grpc::CorrelationServer server(BuildSessions());

  ::grpc::ServerContext            open_ctx;
  pulsetx::v1::OpenSessionRequest  open_req;
  pulsetx::v1::OpenSessionResponse open_resp;
  assert(server.OpenSession(&open_ctx, &open_req, &open_resp).ok());

  pulsetx::v1::InitialFetchRequest req;
  *req.mutable_session() = open_resp.session();
  pulsetx::v1::InitialFetchResponse resp;
  ::grpc::ServerContext             grpc_ctx;

  const auto status = server.InitialFetch(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.decision() == pulsetx::v1::REQUEST_DECISION_REJECTED_INVALID);
}

void TestMalformedSessionReturnsInvalidArgument() {
  pulsetx::grpc::CorrelationServer server(BuildSessions());

  pulsetx::v1::LoadMoreRequest req;
  req.mutable_session()->set_value("not-a-session");
  pulsetx::v1::LoadMoreResponse resp;
  ::grpc::ServerContext         grpc_ctx;

  const auto status = server.LoadMore(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestLoadMoreWithoutHistoryIsDecisionNotError() {
  pulsetx::grpc::CorrelationServer server(BuildSessions());

  ::grpc::ServerContext            open_ctx;
  pulsetx::v1::OpenSessionRequest  open_req;
  pulsetx::v1::OpenSessionResponse open_resp;
  assert(server.OpenSession(&open_ctx, &open_req, &open_resp).ok());

  pulsetx::v1::LoadMoreRequest req;
  *req.mutable_session() = open_resp.session();
  pulsetx::v1::LoadMoreResponse resp;
  ::grpc::ServerContext         grpc_ctx;

  assert(server.LoadMore(&grpc_ctx, &req, &resp).ok());
  assert(resp.decision() == pulsetx::v1::REQUEST_DECISION_REJECTED_NO_CURSOR);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestUnknownSessionReturnsNotFound();
  TestMissingAddressIsRejectedDecision();
  TestMalformedSessionReturnsInvalidArgument();
  TestLoadMoreWithoutHistoryIsDecisionNotError();

  std::cout << "pulsetx_unit_grpc_status: pass\n";
  return 0;
}
