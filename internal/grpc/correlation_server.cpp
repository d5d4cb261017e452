#include "correlation_server.hpp"

#include "grpc_error.hpp"
#include "pulsetx/v1.hpp"

namespace pulsetx::grpc {

CorrelationServer::CorrelationServer(std::shared_ptr<pulsetx::service::SessionService> svc)
    : service_(std::move(svc)) {}

::grpc::Status CorrelationServer::OpenSession(::grpc::ServerContext*,
                                              const pulsetx::v1::OpenSessionRequest* req,
                                              pulsetx::v1::OpenSessionResponse* resp) {
  try {
    *resp = service_->OpenSession(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CorrelationServer::CloseSession(::grpc::ServerContext*,
                                               const pulsetx::v1::CloseSessionRequest* req,
                                               pulsetx::v1::CloseSessionResponse*) {
  try {
    service_->CloseSession(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CorrelationServer::InitialFetch(::grpc::ServerContext*,
                                               const pulsetx::v1::InitialFetchRequest* req,
                                               pulsetx::v1::InitialFetchResponse* resp) {
  try {
    *resp = service_->InitialFetch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CorrelationServer::LoadMore(::grpc::ServerContext*,
                                           const pulsetx::v1::LoadMoreRequest* req,
                                           pulsetx::v1::LoadMoreResponse* resp) {
  try {
    *resp = service_->LoadMore(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CorrelationServer::GetRecords(::grpc::ServerContext*,
                                             const pulsetx::v1::GetRecordsRequest* req,
                                             pulsetx::v1::GetRecordsResponse* resp) {
  try {
    *resp = service_->GetRecords(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CorrelationServer::RecordHeartRate(::grpc::ServerContext*,
                                                  const pulsetx::v1::RecordHeartRateRequest* req,
                                                  pulsetx::v1::RecordHeartRateResponse* resp) {
  try {
    *resp = service_->RecordHeartRate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CorrelationServer::SetHeartRateAuthorization(::grpc::ServerContext*,
                                                            const pulsetx::v1::SetHeartRateAuthorizationRequest* req,
                                                            pulsetx::v1::SetHeartRateAuthorizationResponse*) {
  try {
    service_->SetHeartRateAuthorization(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace pulsetx::grpc
