#include "grpc_error.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "waveq/engine/v1/types.pb.h"

namespace waveq::grpc {

namespace {

using waveq::engine::v1::ErrorKind;

::grpc::Status Make(::grpc::StatusCode code, ErrorKind kind, const std::string& message, int operation_index = -1) {
  waveq::engine::v1::RequestError detail;
  detail.set_kind(kind);
  detail.set_message(message);
  detail.set_operation_index(operation_index);
  return {code, message, detail.SerializeAsString()};
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace waveq::util;
  using namespace waveq::engine::v1;

  if (const auto* validation = dynamic_cast<const ValidationError*>(&e)) {
    std::string message = e.what();
    if (validation->operation_index() >= 0) {
      message += " (operation " + std::to_string(validation->operation_index()) + ")";
    }
    return Make(::grpc::StatusCode::INVALID_ARGUMENT, ERROR_KIND_VALIDATION, message, validation->operation_index());
  }
  if (dynamic_cast<const AdmissionError*>(&e)) {
    return Make(::grpc::StatusCode::RESOURCE_EXHAUSTED, ERROR_KIND_ADMISSION, e.what());
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return Make(::grpc::StatusCode::NOT_FOUND, ERROR_KIND_NOT_FOUND, e.what());
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return Make(::grpc::StatusCode::ALREADY_EXISTS, ERROR_KIND_VALIDATION, e.what());
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return Make(::grpc::StatusCode::FAILED_PRECONDITION, ERROR_KIND_VALIDATION, e.what());
  }
  if (dynamic_cast<const IllegalTransition*>(&e)) {
    WAVEQ_LOG_ERROR("Illegal state transition reached the API", {observability::StringField("error", e.what())});
  }

  return Make(::grpc::StatusCode::INTERNAL, ERROR_KIND_INTERNAL, e.what());
}

} // namespace waveq::grpc
