#pragma once

#include <memory>

#include "internal/pipeline/correlation_pipeline.hpp"

namespace pulsetx::ledger { class SignatureClient; }
namespace pulsetx::biometric { class MemoryHeartRateStore; class WindowResolver; }

namespace pulsetx::service {

/*
  Dependency container shared by all sessions.
*/
struct ServiceContext {
  std::shared_ptr<const pulsetx::ledger::SignatureClient>   client;
  std::shared_ptr<pulsetx::biometric::MemoryHeartRateStore> heart_rate;
  std::shared_ptr<const pulsetx::biometric::WindowResolver> resolver;

  pulsetx::pipeline::PipelineOptions pipeline_options;
};

} // namespace pulsetx::service
