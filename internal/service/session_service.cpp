#include "session_service.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/biometric/memory_heart_rate_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace pulsetx::service {

using namespace pulsetx::v1;
using pulsetx::observability::BoolField;
using pulsetx::observability::IntField;
using pulsetx::observability::StringField;

namespace {

LoadingState ToProto(pipeline::LoadingState state) {
  switch (state) {
    case pipeline::LoadingState::kIdle:
      return LOADING_STATE_IDLE;
    case pipeline::LoadingState::kLoadingInitial:
      return LOADING_STATE_LOADING_INITIAL;
    case pipeline::LoadingState::kLoadingMore:
      return LOADING_STATE_LOADING_MORE;
  }
  return LOADING_STATE_UNSPECIFIED;
}

RequestDecision ToProto(pipeline::RequestDecision decision) {
  switch (decision) {
    case pipeline::RequestDecision::kAccepted:
      return REQUEST_DECISION_ACCEPTED;
    case pipeline::RequestDecision::kRejectedBusy:
      return REQUEST_DECISION_REJECTED_BUSY;
    case pipeline::RequestDecision::kRejectedNoCursor:
      return REQUEST_DECISION_REJECTED_NO_CURSOR;
    case pipeline::RequestDecision::kRejectedInvalid:
      return REQUEST_DECISION_REJECTED_INVALID;
    case pipeline::RequestDecision::kRejectedExhausted:
      return REQUEST_DECISION_REJECTED_EXHAUSTED;
  }
  return REQUEST_DECISION_UNSPECIFIED;
}

FetchErrorKind ToProto(ledger::FetchError::Kind kind) {
  switch (kind) {
    case ledger::FetchError::Kind::kTransport:
      return FETCH_ERROR_KIND_TRANSPORT;
    case ledger::FetchError::Kind::kDecode:
      return FETCH_ERROR_KIND_DECODE;
    case ledger::FetchError::Kind::kRemoteRejected:
      return FETCH_ERROR_KIND_REMOTE_REJECTED;
  }
  return FETCH_ERROR_KIND_UNSPECIFIED;
}

PageOutcome ToProto(const pipeline::PageOutcome& outcome) {
  PageOutcome out;
  switch (outcome.kind) {
    case pipeline::PageOutcome::Kind::kAppended:
      out.set_kind(PAGE_OUTCOME_KIND_APPENDED);
      break;
    case pipeline::PageOutcome::Kind::kExhausted:
      out.set_kind(PAGE_OUTCOME_KIND_EXHAUSTED);
      break;
    case pipeline::PageOutcome::Kind::kFailed:
      out.set_kind(PAGE_OUTCOME_KIND_FAILED);
      break;
  }
  out.set_initial(outcome.initial);
  out.set_appended(outcome.appended);
  out.set_degraded(outcome.degraded);
  if (outcome.error) {
    auto* error = out.mutable_error();
    error->set_kind(ToProto(outcome.error->kind));
    error->set_code(outcome.error->code);
    error->set_message(outcome.error->message);
  }
  *out.mutable_finished_at() = util::ToProto(outcome.finished_at);
  return out;
}

EnrichedRecord ToProto(const pipeline::EnrichedRecord& record) {
  EnrichedRecord out;
  out.set_id(record.id);
  out.set_signature(record.signature);
  out.set_slot(record.slot);
  *out.mutable_timestamp() = util::ToProto(record.timestamp);
  out.set_timestamp_defaulted(record.timestamp_defaulted);
  out.set_failed(record.failed);
  if (record.heart_rate_bpm.has_value()) {
    out.set_heart_rate_bpm(*record.heart_rate_bpm);
  }
  return out;
}

std::string SessionKey(const SessionID& id, const std::string& op) {
  if (id.value().empty()) {
    throw util::InvalidArgument(op + ": session id is required");
  }
  try {
    return util::ToString(util::FromString(id.value()));
  } catch (const std::exception&) {
    throw util::InvalidArgument(op + ": malformed session id '" + id.value() + "'");
  }
}

} // namespace

SessionService::SessionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.client || !ctx_.heart_rate || !ctx_.resolver) {
    throw util::InvalidArgument("SessionService requires client, heart rate store and resolver");
  }
}

SessionService::~SessionService() {
  std::unique_lock lock(mutex_);
  for (auto& [key, session] : sessions_) {
    session->Stop();
  }
  sessions_.clear();
}

// ------------------------------------------------------------
// Session lifecycle
// ------------------------------------------------------------

OpenSessionResponse SessionService::OpenSession(const OpenSessionRequest&) {
  auto session = std::make_shared<pipeline::CorrelationPipeline>(ctx_.client, ctx_.resolver, ctx_.pipeline_options);

  std::string key;
  {
    std::unique_lock lock(mutex_);
    if (sessions_.size() >= kMaxSessions) {
      throw util::ResourceExhausted("OpenSession: session limit reached");
    }

    do {
      key = util::GenerateUUIDString();
    } while (sessions_.count(key) != 0);

    session->Start();
    sessions_.emplace(key, session);
  }

  PULSETX_LOG_INFO("Session opened", {StringField("session", key)});

  OpenSessionResponse resp;
  resp.mutable_session()->set_value(key);
  return resp;
}

void SessionService::CloseSession(const CloseSessionRequest& req) {
  const auto key = SessionKey(req.session(), "CloseSession");

  std::shared_ptr<pipeline::CorrelationPipeline> session;
  {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(key);
    if (it == sessions_.end()) {
      throw util::NotFound("CloseSession: unknown session " + key);
    }
    session = std::move(it->second);
    sessions_.erase(it);
  }

  // outside the lock: waits for an in-flight page
  session->Stop();
  PULSETX_LOG_INFO("Session closed", {StringField("session", key)});
}

std::shared_ptr<pipeline::CorrelationPipeline> SessionService::GetSessionOrThrow(const SessionID& id, const std::string& op) const {
  const auto key = SessionKey(id, op);

  std::shared_lock lock(mutex_);
  auto it = sessions_.find(key);
  if (it == sessions_.end()) {
    throw util::NotFound(op + ": unknown session " + key);
  }
  return it->second;
}

std::size_t SessionService::SessionCount() const {
  std::shared_lock lock(mutex_);
  return sessions_.size();
}

// ------------------------------------------------------------
// Pipeline operations
// ------------------------------------------------------------

InitialFetchResponse SessionService::InitialFetch(const InitialFetchRequest& req) {
  auto session  = GetSessionOrThrow(req.session(), "InitialFetch");
  auto decision = session->InitialFetch(req.address());

  InitialFetchResponse resp;
  resp.set_decision(ToProto(decision));
  return resp;
}

LoadMoreResponse SessionService::LoadMore(const LoadMoreRequest& req) {
  auto session  = GetSessionOrThrow(req.session(), "LoadMore");
  auto decision = session->LoadMore();

  LoadMoreResponse resp;
  resp.set_decision(ToProto(decision));
  return resp;
}

GetRecordsResponse SessionService::GetRecords(const GetRecordsRequest& req) const {
  auto session  = GetSessionOrThrow(req.session(), "GetRecords");
  auto snapshot = session->Snapshot();

  GetRecordsResponse resp;
  resp.set_address(snapshot.address);
  resp.mutable_records()->Reserve(static_cast<int>(snapshot.records.size()));
  for (const auto& record : snapshot.records) {
    *resp.add_records() = ToProto(record);
  }
  if (snapshot.cursor.has_value()) {
    resp.set_cursor(*snapshot.cursor);
  }
  resp.set_exhausted(snapshot.exhausted);
  resp.set_state(ToProto(snapshot.loading));
  resp.set_is_loading_initial(snapshot.loading == pipeline::LoadingState::kLoadingInitial);
  resp.set_is_loading_more(snapshot.loading == pipeline::LoadingState::kLoadingMore);
  if (snapshot.last_outcome.has_value()) {
    *resp.mutable_last_outcome() = ToProto(*snapshot.last_outcome);
  }
  return resp;
}

// ------------------------------------------------------------
// Heart rate ingest
// ------------------------------------------------------------

RecordHeartRateResponse SessionService::RecordHeartRate(const RecordHeartRateRequest& req) {
  std::vector<biometric::HeartRateSample> samples;
  samples.reserve(req.samples_size());
  for (const auto& sample : req.samples()) {
    if (!sample.has_at()) {
      throw util::InvalidArgument("RecordHeartRate: sample timestamp is required");
    }
    samples.push_back({util::FromProto(sample.at()), sample.bpm()});
  }

  ctx_.heart_rate->Append(samples);
  PULSETX_LOG_DEBUG("Heart rate samples recorded", {IntField("count", static_cast<int64_t>(samples.size()))});

  RecordHeartRateResponse resp;
  resp.set_accepted(samples.size());
  return resp;
}

void SessionService::SetHeartRateAuthorization(const SetHeartRateAuthorizationRequest& req) {
  ctx_.heart_rate->SetReadAuthorized(req.granted());
  PULSETX_LOG_INFO("Heart rate read authorization changed", {BoolField("granted", req.granted())});
}

} // namespace pulsetx::service
