#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include "pulsetx/v1_grpc.hpp"

using namespace pulsetx::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  pulsetxctl <addr> open\n"
            << "  pulsetxctl <addr> close <session>\n"
            << "  pulsetxctl <addr> initial <session> <address>\n"
            << "  pulsetxctl <addr> more <session>\n"
            << "  pulsetxctl <addr> records <session>\n"
            << "  pulsetxctl <addr> hr-auth <on|off>\n"
            << "  pulsetxctl <addr> import-hr <csv: unix_seconds,bpm>\n"
            << "  pulsetxctl <addr> fetch <address> [pages=1] [timeout_s=60]\n";
}

static SessionID MakeSession(const std::string& value) {
  SessionID id;
  id.set_value(value);
  return id;
}

static const char* DecisionName(RequestDecision decision) {
  switch (decision) {
    case REQUEST_DECISION_ACCEPTED:
      return "accepted";
    case REQUEST_DECISION_REJECTED_BUSY:
      return "rejected: busy";
    case REQUEST_DECISION_REJECTED_NO_CURSOR:
      return "rejected: no cursor";
    case REQUEST_DECISION_REJECTED_INVALID:
      return "rejected: invalid";
    case REQUEST_DECISION_REJECTED_EXHAUSTED:
      return "rejected: history exhausted";
    default:
      return "unspecified";
  }
}

static const char* ErrorKindName(FetchErrorKind kind) {
  switch (kind) {
    case FETCH_ERROR_KIND_TRANSPORT:
      return "transport";
    case FETCH_ERROR_KIND_DECODE:
      return "decode";
    case FETCH_ERROR_KIND_REMOTE_REJECTED:
      return "remote_rejected";
    default:
      return "unspecified";
  }
}

static std::string FormatTime(const google::protobuf::Timestamp& ts) {
  std::time_t secs = static_cast<std::time_t>(ts.seconds());
  std::tm     tm{};
  gmtime_r(&secs, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%SZ");
  return out.str();
}

static void PrintRecords(const GetRecordsResponse& resp) {
  for (const auto& record : resp.records()) {
    std::cout << FormatTime(record.timestamp()) << (record.timestamp_defaulted() ? "*" : " ") << "  " << record.signature() << "  ";
    if (record.has_heart_rate_bpm()) {
      std::cout << record.heart_rate_bpm() << " bpm";
    } else {
      std::cout << "no data";
    }
    if (record.failed()) {
      std::cout << "  (failed)";
    }
    std::cout << "\n";
  }

  std::cout << "records=" << resp.records_size() << " cursor=" << (resp.has_cursor() ? resp.cursor() : "<none>")
            << " loading_initial=" << resp.is_loading_initial() << " loading_more=" << resp.is_loading_more() << "\n";

  if (resp.has_last_outcome() && resp.last_outcome().kind() == PAGE_OUTCOME_KIND_FAILED) {
    const auto& error = resp.last_outcome().error();
    std::cout << "last page failed: " << ErrorKindName(error.kind()) << " code=" << error.code() << " " << error.message() << "\n";
  } else if (resp.has_last_outcome() && resp.last_outcome().kind() == PAGE_OUTCOME_KIND_EXHAUSTED) {
    std::cout << "history exhausted\n";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

// Polls until the session is idle or the deadline passes.
static std::optional<GetRecordsResponse> WaitIdle(CorrelationService::Stub& stub, const SessionID& session, std::chrono::seconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    grpc::ClientContext ctx;
    GetRecordsRequest   req;
    *req.mutable_session() = session;
    GetRecordsResponse resp;

    auto status = stub.GetRecords(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return std::nullopt;
    }
    if (resp.state() == LOADING_STATE_IDLE) {
      return resp;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  std::cerr << "timed out waiting for session to become idle\n";
  return std::nullopt;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = CorrelationService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "open") {
    OpenSessionResponse resp;
    auto                status = stub->OpenSession(&ctx, OpenSessionRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.session().value() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "close") {
    if (argc < 4) return 1;

    CloseSessionRequest req;
    *req.mutable_session() = MakeSession(argv[3]);
    CloseSessionResponse resp;

    auto status = stub->CloseSession(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "closed\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "initial") {
    if (argc < 5) return 1;

    InitialFetchRequest req;
    *req.mutable_session() = MakeSession(argv[3]);
    req.set_address(argv[4]);
    InitialFetchResponse resp;

    auto status = stub->InitialFetch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << DecisionName(resp.decision()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "more") {
    if (argc < 4) return 1;

    LoadMoreRequest req;
    *req.mutable_session() = MakeSession(argv[3]);
    LoadMoreResponse resp;

    auto status = stub->LoadMore(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << DecisionName(resp.decision()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "records") {
    if (argc < 4) return 1;

    GetRecordsRequest req;
    *req.mutable_session() = MakeSession(argv[3]);
    GetRecordsResponse resp;

    auto status = stub->GetRecords(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintRecords(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "hr-auth") {
    if (argc < 4) return 1;

    const std::string value = argv[3];
    if (value != "on" && value != "off") {
      std::cerr << "expected on or off, got " << value << "\n";
      return 1;
    }

    SetHeartRateAuthorizationRequest req;
    req.set_granted(value == "on");
    SetHeartRateAuthorizationResponse resp;

    auto status = stub->SetHeartRateAuthorization(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "heart rate read " << (req.granted() ? "granted" : "revoked") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "import-hr") {
    if (argc < 4) return 1;

    std::ifstream in(argv[3]);
    if (!in) {
      std::cerr << "cannot open " << argv[3] << "\n";
      return 1;
    }

    RecordHeartRateRequest req;
    std::string            line;
    size_t                 line_no = 0;
    while (std::getline(in, line)) {
      ++line_no;
      if (line.empty() || line[0] == '#') continue;

      std::istringstream row(line);
      std::string        secs_field;
      std::string        bpm_field;
      if (!std::getline(row, secs_field, ',') || !std::getline(row, bpm_field)) {
        std::cerr << "line " << line_no << ": expected unix_seconds,bpm\n";
        return 1;
      }

      try {
        auto* sample = req.add_samples();
        sample->mutable_at()->set_seconds(std::stoll(secs_field));
        sample->set_bpm(std::stod(bpm_field));
      } catch (const std::exception&) {
        std::cerr << "line " << line_no << ": not a number\n";
        return 1;
      }
    }

    RecordHeartRateResponse resp;
    auto                    status = stub->RecordHeartRate(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "accepted=" << resp.accepted() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "fetch") {
    if (argc < 4) return 1;

    const std::string address = argv[3];
    const int         pages   = argc >= 5 ? std::atoi(argv[4]) : 1;
    const auto        timeout = std::chrono::seconds(argc >= 6 ? std::atoi(argv[5]) : 60);
    if (pages < 1) {
      std::cerr << "pages must be at least 1\n";
      return 1;
    }

    OpenSessionResponse opened;
    auto                status = stub->OpenSession(&ctx, OpenSessionRequest{}, &opened);
    if (!status.ok()) return Fail(status);
    const auto session = opened.session();

    {
      grpc::ClientContext initial_ctx;
      InitialFetchRequest req;
      *req.mutable_session() = session;
      req.set_address(address);
      InitialFetchResponse resp;
      status = stub->InitialFetch(&initial_ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      if (resp.decision() != REQUEST_DECISION_ACCEPTED) {
        std::cerr << "initial fetch " << DecisionName(resp.decision()) << "\n";
        return 2;
      }
    }

    auto records = WaitIdle(*stub, session, timeout);
    for (int page = 1; records && page < pages; ++page) {
      if (!records->has_cursor() || records->exhausted()) break;
      if (records->last_outcome().kind() == PAGE_OUTCOME_KIND_FAILED) break;

      grpc::ClientContext more_ctx;
      LoadMoreRequest     req;
      *req.mutable_session() = session;
      LoadMoreResponse resp;
      status = stub->LoadMore(&more_ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      if (resp.decision() != REQUEST_DECISION_ACCEPTED) break;

      records = WaitIdle(*stub, session, timeout);
    }

    if (records) {
      PrintRecords(*records);
    }

    grpc::ClientContext close_ctx;
    CloseSessionRequest close_req;
    *close_req.mutable_session() = session;
    CloseSessionResponse close_resp;
    status = stub->CloseSession(&close_ctx, close_req, &close_resp);
    if (!status.ok()) return Fail(status);

    return records ? 0 : 2;
  }

  Usage();
  return 1;
}
