#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "waveq/engine/v1/types.pb.h"

namespace waveq::db {

struct RequestFilter {
  std::optional<std::string>                      client_id;
  std::optional<waveq::engine::v1::RequestStatus> status;
  std::size_t                                     limit = 100;
};

} // namespace waveq::db
