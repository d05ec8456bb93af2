#include "state_machine.hpp"

namespace waveq::model {

using namespace waveq::engine::v1;

const char* StatusName(RequestStatus status) {
  switch (status) {
    case REQUEST_STATUS_QUEUED:
      return "queued";
    case REQUEST_STATUS_PROCESSING:
      return "processing";
    case REQUEST_STATUS_COMPLETED:
      return "completed";
    case REQUEST_STATUS_ERROR:
      return "error";
    case REQUEST_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

RequestStatus ParseStatus(const std::string& name) {
  if (name == "queued") return REQUEST_STATUS_QUEUED;
  if (name == "processing") return REQUEST_STATUS_PROCESSING;
  if (name == "completed") return REQUEST_STATUS_COMPLETED;
  if (name == "error") return REQUEST_STATUS_ERROR;
  if (name == "cancelled") return REQUEST_STATUS_CANCELLED;
  return REQUEST_STATUS_UNSPECIFIED;
}

} // namespace waveq::model
