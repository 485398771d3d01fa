#pragma once

#include "streamledger/core/v1/id.pb.h"
#include "streamledger/core/v1/types.pb.h"
#include "streamledger/core/v1/events.pb.h"

#include "streamledger/services/v1/stream_lifecycle_service.pb.h"
#include "streamledger/services/v1/viewer_service.pb.h"
#include "streamledger/services/v1/revenue_service.pb.h"
#include "streamledger/services/v1/registry_service.pb.h"

#include "streamledger/services/v1/stream_lifecycle_service.grpc.pb.h"
#include "streamledger/services/v1/viewer_service.grpc.pb.h"
#include "streamledger/services/v1/revenue_service.grpc.pb.h"
#include "streamledger/services/v1/registry_service.grpc.pb.h"

namespace streamledger::v1 {
using namespace ::streamledger::core::v1;
using namespace ::streamledger::services::v1;
}
