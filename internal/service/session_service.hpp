#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/pipeline/correlation_pipeline.hpp"
#include "pulsetx/v1.hpp"
#include "service_context.hpp"

namespace pulsetx::service {

/*
  Owns one CorrelationPipeline per session.

  Sessions live until closed or until the service is destroyed;
  nothing survives the process.
*/
class SessionService {
 public:
  static constexpr std::size_t kMaxSessions = 256;

  explicit SessionService(ServiceContext ctx);
  ~SessionService();

  SessionService(const SessionService&)            = delete;
  SessionService& operator=(const SessionService&) = delete;

  pulsetx::v1::OpenSessionResponse OpenSession(const pulsetx::v1::OpenSessionRequest& req);
  void                             CloseSession(const pulsetx::v1::CloseSessionRequest& req);

  pulsetx::v1::InitialFetchResponse InitialFetch(const pulsetx::v1::InitialFetchRequest& req);
  pulsetx::v1::LoadMoreResponse     LoadMore(const pulsetx::v1::LoadMoreRequest& req);
  pulsetx::v1::GetRecordsResponse   GetRecords(const pulsetx::v1::GetRecordsRequest& req) const;

  pulsetx::v1::RecordHeartRateResponse RecordHeartRate(const pulsetx::v1::RecordHeartRateRequest& req);
  void                                 SetHeartRateAuthorization(const pulsetx::v1::SetHeartRateAuthorizationRequest& req);

  std::size_t SessionCount() const;

 private:
  std::shared_ptr<pulsetx::pipeline::CorrelationPipeline> GetSessionOrThrow(const pulsetx::v1::SessionID& id, const std::string& op) const;

  ServiceContext ctx_;

  mutable std::shared_mutex                                                              mutex_;
  std::unordered_map<std::string, std::shared_ptr<pulsetx::pipeline::CorrelationPipeline>> sessions_;
};

} // namespace pulsetx::service
