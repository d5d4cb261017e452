#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace pulsetx::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace pulsetx::grpc
