#pragma once

#include <google/protobuf/struct.pb.h>

#include <memory>
#include <string>
#include <vector>

#include "internal/audio/audio_buffer.hpp"
#include "internal/storage/audio_store.hpp"
#include "waveq/engine/v1/types.pb.h"

namespace waveq::pipeline {

/*
  What an executor may see besides its input buffer.

  Held by value: an executor that outlives its timeout keeps its own copy.
*/
struct ExecutionContext {
  std::string                          request_id;
  std::vector<std::string>             sources;
  std::shared_ptr<storage::AudioStore> store;
  int                                  operation_index = 0;

  // Fetches and decodes sources[index]. Throws util::NotFound.
  audio::AudioBuffer LoadSource(std::size_t index) const;
};

/*
  One primitive operation.

  Contract:
    - input is never modified
    - parameters have already passed catalog validation
    - util::TransientError marks a retryable fault; anything else is final
*/
class OperationExecutor {
 public:
  virtual ~OperationExecutor() = default;

  virtual waveq::engine::v1::OperationKind Kind() const = 0;

  virtual audio::AudioBuffer Execute(const audio::AudioBuffer& input, const google::protobuf::Struct& parameters, const ExecutionContext& ctx) = 0;
};

using OperationExecutorPtr = std::shared_ptr<OperationExecutor>;

// Parameter accessors; missing keys fall back to def.
double      NumberParam(const google::protobuf::Struct& parameters, const std::string& key, double def = 0.0);
std::string StringParam(const google::protobuf::Struct& parameters, const std::string& key, const std::string& def = {});

} // namespace waveq::pipeline
