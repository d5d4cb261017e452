#pragma once

#include "pulsetx/services/v1/correlation_service.grpc.pb.h"
#include "pulsetx/v1.hpp"
