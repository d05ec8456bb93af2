#pragma once

#include <stdexcept>
#include <string>

#include "waveq/engine/v1/types.pb.h"

namespace waveq::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Malformed, missing or out-of-range request content.

  operation_index is -1 for request-level problems (sources, priority).
*/
class ValidationError : public std::runtime_error {
 public:
  ValidationError(const std::string& msg, int operation_index = -1, std::string field = {})
      : std::runtime_error(msg), operation_index_(operation_index), field_(std::move(field)) {
  }

  int operation_index() const {
    return operation_index_;
  }
  const std::string& field() const {
    return field_;
  }

 private:
  int         operation_index_;
  std::string field_;
};

// Per-client backpressure; the caller should retry later.
class AdmissionError : public std::runtime_error {
 public:
  explicit AdmissionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// State machine invariant violation. Never expected in normal operation.
class IllegalTransition : public std::runtime_error {
 public:
  explicit IllegalTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Executor fault worth retrying (resource shortage, timeout).
class TransientError : public std::runtime_error {
 public:
  explicit TransientError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operation failure that ended a pipeline run.
class ExecutionError : public std::runtime_error {
 public:
  ExecutionError(const std::string& msg, int operation_index, waveq::engine::v1::OperationKind kind)
      : std::runtime_error(msg), operation_index_(operation_index), kind_(kind) {
  }

  int operation_index() const {
    return operation_index_;
  }
  waveq::engine::v1::OperationKind kind() const {
    return kind_;
  }

 private:
  int                              operation_index_;
  waveq::engine::v1::OperationKind kind_;
};

} // namespace waveq::util
