#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/ledger/rpc_transport.hpp"
#include "internal/service/session_service.hpp"

namespace pulsetx::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<service::SessionService>     sessions;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.
  This is the composition root of the application and the only
  place that knows the concrete transport and store types.
*/
Application Build(const pulsetx::runtime::config::RuntimeConfig& config);

// Core object graph around an already constructed transport.
service::ServiceContext BuildContext(const pulsetx::runtime::config::RuntimeConfig& config, std::shared_ptr<ledger::RpcTransport> transport);

} // namespace pulsetx::factory
