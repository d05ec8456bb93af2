#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace waveq::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Every non-OK status carries a serialized waveq.engine.v1.RequestError in
  error_details, so clients can recover the error kind and the offending
  operation index without parsing the message text.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace waveq::grpc
