#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "waveq/engine/v1/types.pb.h"

namespace waveq::db::model {

/*
  Persistent edit request row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - result_ref and error are mutually exclusive; both unset until terminal.
  - sequence is the insertion order, used for newest-first listing.
*/

struct RequestRecord {
  std::string id;
  std::string client_id;

  std::vector<std::string>                      sources;
  std::vector<waveq::engine::v1::OperationSpec> operations;

  int32_t priority = 3;

  waveq::engine::v1::RequestStatus status = waveq::engine::v1::REQUEST_STATUS_QUEUED;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  std::string                                     result_ref;
  std::optional<waveq::engine::v1::RequestError> error;

  std::string instruction;
  std::string description;

  uint64_t processing_ms = 0;
  uint64_t sequence      = 0;
};

}
