#pragma once

#include "pulsetx/core/v1/types.pb.h"
#include "pulsetx/ledger/v1/rpc.pb.h"
#include "pulsetx/services/v1/correlation_service.pb.h"

namespace pulsetx::v1 {
using namespace ::pulsetx::core::v1;
using namespace ::pulsetx::ledger::v1;
using namespace ::pulsetx::services::v1;
}
