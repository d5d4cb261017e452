#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/biometric/memory_heart_rate_store.hpp"
#include "internal/biometric/window_resolver.hpp"
#include "internal/grpc/correlation_server.hpp"
#include "internal/ledger/curl_transport.hpp"
#include "internal/ledger/signature_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace pulsetx::factory {

service::ServiceContext BuildContext(const pulsetx::runtime::config::RuntimeConfig& config, std::shared_ptr<ledger::RpcTransport> transport) {
  const auto& ledger_cfg = config.ledger();

  ledger::SignatureClientOptions options;
  options.rpc_url         = ledger_cfg.rpc_url();
  options.api_key         = ledger_cfg.api_key();
  options.request_timeout = util::ToMillis(ledger_cfg.request_timeout());
  options.connect_timeout = util::ToMillis(ledger_cfg.connect_timeout());

  service::ServiceContext ctx;
  ctx.client     = std::make_shared<ledger::SignatureClient>(std::move(transport), std::move(options));
  ctx.heart_rate = std::make_shared<biometric::MemoryHeartRateStore>(config.biometric().read_authorized());
  ctx.resolver   = std::make_shared<biometric::WindowResolver>(ctx.heart_rate);
  ctx.pipeline_options.page_limit = ledger_cfg.page_limit();
  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const pulsetx::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto ctx = BuildContext(config, std::make_shared<ledger::CurlTransport>());

  PULSETX_LOG_INFO("Ledger client configured", {observability::StringField("rpc_url", config.ledger().rpc_url()),
                                                 observability::IntField("page_limit", config.ledger().page_limit()),
                                                 observability::BoolField("api_key", !config.ledger().api_key().empty())});

  app.sessions = std::make_shared<service::SessionService>(std::move(ctx));

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::CorrelationServer>(app.sessions));

  return app;
}

} // namespace pulsetx::factory
