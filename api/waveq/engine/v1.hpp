#pragma once

#include "waveq/engine/v1/types.pb.h"

#include "waveq/engine/v1/request_service.pb.h"
#include "waveq/engine/v1/request_service.grpc.pb.h"

namespace waveq::v1 {
using namespace ::waveq::engine::v1;
}
