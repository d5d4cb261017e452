#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/session_service.hpp"
#include "pulsetx/v1_grpc.hpp"

namespace pulsetx::grpc {

class CorrelationServer final : public pulsetx::v1::CorrelationService::Service {
public:
  explicit CorrelationServer(std::shared_ptr<pulsetx::service::SessionService> svc);

  ::grpc::Status OpenSession(::grpc::ServerContext*,
                             const pulsetx::v1::OpenSessionRequest*,
                             pulsetx::v1::OpenSessionResponse*) override;

  ::grpc::Status CloseSession(::grpc::ServerContext*,
                              const pulsetx::v1::CloseSessionRequest*,
                              pulsetx::v1::CloseSessionResponse*) override;

  ::grpc::Status InitialFetch(::grpc::ServerContext*,
                              const pulsetx::v1::InitialFetchRequest*,
                              pulsetx::v1::InitialFetchResponse*) override;

  ::grpc::Status LoadMore(::grpc::ServerContext*,
                          const pulsetx::v1::LoadMoreRequest*,
                          pulsetx::v1::LoadMoreResponse*) override;

  ::grpc::Status GetRecords(::grpc::ServerContext*,
                            const pulsetx::v1::GetRecordsRequest*,
                            pulsetx::v1::GetRecordsResponse*) override;

  ::grpc::Status RecordHeartRate(::grpc::ServerContext*,
                                 const pulsetx::v1::RecordHeartRateRequest*,
                                 pulsetx::v1::RecordHeartRateResponse*) override;

  ::grpc::Status SetHeartRateAuthorization(::grpc::ServerContext*,
                                           const pulsetx::v1::SetHeartRateAuthorizationRequest*,
                                           pulsetx::v1::SetHeartRateAuthorizationResponse*) override;

private:
  std::shared_ptr<pulsetx::service::SessionService> service_;
};

} // namespace pulsetx::grpc
