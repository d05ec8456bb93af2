#pragma once

#include <string>

#include "waveq/engine/v1/types.pb.h"

namespace waveq::model {

using RequestStatus = waveq::engine::v1::RequestStatus;

constexpr bool IsTerminal(RequestStatus status) {
  return status == waveq::engine::v1::REQUEST_STATUS_COMPLETED || status == waveq::engine::v1::REQUEST_STATUS_ERROR ||
         status == waveq::engine::v1::REQUEST_STATUS_CANCELLED;
}

constexpr bool IsActive(RequestStatus status) {
  return status == waveq::engine::v1::REQUEST_STATUS_QUEUED || status == waveq::engine::v1::REQUEST_STATUS_PROCESSING;
}

/*
  Legal edges:

    queued     -> processing | cancelled
    processing -> completed | error | cancelled

  Nothing leaves a terminal state. Self-transitions are not transitions.
*/
constexpr bool CanTransition(RequestStatus from, RequestStatus to) {
  using namespace waveq::engine::v1;

  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case REQUEST_STATUS_QUEUED:
      return to == REQUEST_STATUS_PROCESSING || to == REQUEST_STATUS_CANCELLED;
    case REQUEST_STATUS_PROCESSING:
      return to == REQUEST_STATUS_COMPLETED || to == REQUEST_STATUS_ERROR || to == REQUEST_STATUS_CANCELLED;
    default:
      return false;
  }
}

const char* StatusName(RequestStatus status);

// Accepts "queued", "processing", ...; returns REQUEST_STATUS_UNSPECIFIED otherwise.
RequestStatus ParseStatus(const std::string& name);

} // namespace waveq::model
