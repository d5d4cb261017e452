#pragma once

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/biometric/heart_rate_store.hpp"
#include "internal/ledger/rpc_transport.hpp"
#include "internal/util/errors.hpp"

namespace pulsetx::testing {

struct SignatureFixture {
  std::string            signature;
  std::optional<int64_t> block_time;
  bool                   failed = false;
};

inline std::string PageBody(const std::vector<SignatureFixture>& sigs) {
  std::ostringstream out;
  out << R"({"jsonrpc":"2.0","id":1,"result":[)";
  for (size_t i = 0; i < sigs.size(); ++i) {
    if (i) out << ',';
    out << R"({"signature":")" << sigs[i].signature << R"(","slot":)" << (100 + i) << R"(,"blockTime":)";
    if (sigs[i].block_time) {
      out << *sigs[i].block_time;
    } else {
      out << "null";
    }
    out << R"(,"err":)" << (sigs[i].failed ? R"({"InstructionError":[0,{"Custom":1}]})" : "null");
    out << R"(,"memo":null,"confirmationStatus":"finalized"})";
  }
  out << "]}";
  return out.str();
}

inline ledger::HttpResponse Ok(std::string body) {
  return {200, std::move(body)};
}

inline ledger::HttpResponse RpcErrorResponse(int code, const std::string& message, long http_status = 200) {
  return {http_status, R"({"jsonrpc":"2.0","id":1,"error":{"code":)" + std::to_string(code) + R"(,"message":")" + message + R"("}})"};
}

// The {"limit", "before"} object of a getSignaturesForAddress body.
inline google::protobuf::Struct RequestOptions(const std::string& body) {
  google::protobuf::Struct root;
  const bool parsed = google::protobuf::util::JsonStringToMessage(body, &root).ok();
  assert(parsed);
  (void)parsed;
  const auto& params = root.fields().at("params").list_value();
  assert(params.values_size() == 2);
  return params.values(1).struct_value();
}

inline std::string RequestAddress(const std::string& body) {
  google::protobuf::Struct root;
  const bool parsed = google::protobuf::util::JsonStringToMessage(body, &root).ok();
  assert(parsed);
  (void)parsed;
  return root.fields().at("params").list_value().values(0).string_value();
}

/*
  Scripted transport. Responses are consumed in order; Hold() makes
  the next Post block until Release().
*/
class FakeTransport : public ledger::RpcTransport {
 public:
  void Push(ledger::HttpResponse response) {
    std::lock_guard lock(mu_);
    script_.push_back(Step{std::move(response), std::nullopt});
  }

  void PushThrow(std::string message) {
    std::lock_guard lock(mu_);
    script_.push_back(Step{{}, std::move(message)});
  }

  void Hold() {
    std::lock_guard lock(mu_);
    held_ = true;
  }

  void Release() {
    {
      std::lock_guard lock(mu_);
      held_ = false;
    }
    cv_.notify_all();
  }

  ledger::HttpResponse Post(const ledger::HttpRequest& request) override {
    std::unique_lock lock(mu_);
    requests_.push_back(request);
    cv_.notify_all();

    cv_.wait(lock, [&] { return !held_; });

    if (script_.empty()) {
      throw std::logic_error("FakeTransport: no scripted response");
    }
    Step step = std::move(script_.front());
    script_.pop_front();
    if (step.throw_message) {
      throw util::TransportError(*step.throw_message);
    }
    return step.response;
  }

  bool WaitForCalls(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    std::unique_lock lock(mu_);
    return cv_.wait_for(lock, timeout, [&] { return requests_.size() >= count; });
  }

  std::vector<ledger::HttpRequest> Requests() const {
    std::lock_guard lock(mu_);
    return requests_;
  }

  size_t CallCount() const {
    std::lock_guard lock(mu_);
    return requests_.size();
  }

 private:
  struct Step {
    ledger::HttpResponse       response;
    std::optional<std::string> throw_message;
  };

  mutable std::mutex               mu_;
  std::condition_variable          cv_;
  std::deque<Step>                 script_;
  std::vector<ledger::HttpRequest> requests_;
  bool                             held_ = false;
};

/*
  Authorized store whose every query fails.
*/
class ThrowingHeartRateStore : public biometric::HeartRateStore {
 public:
  bool ReadAuthorized() const override {
    return true;
  }

  std::optional<double> AverageBetween(util::TimePoint, util::TimePoint) const override {
    ++queries_;
    throw std::runtime_error("heart rate backend offline");
  }

  void Append(const std::vector<biometric::HeartRateSample>&) override {
  }

  int queries() const {
    return queries_;
  }

 private:
  mutable int queries_ = 0;
};

} // namespace pulsetx::testing
