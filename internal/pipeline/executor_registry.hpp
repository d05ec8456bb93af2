#pragma once

#include <unordered_map>

#include "operation_executor.hpp"

namespace waveq::pipeline {

/*
  Kind -> executor binding. Populated at startup, read-only afterwards.
*/
class ExecutorRegistry {
 public:
  // Replaces any earlier binding for the same kind.
  void Register(OperationExecutorPtr executor);

  // nullptr when unbound.
  OperationExecutorPtr Find(waveq::engine::v1::OperationKind kind) const;

  std::size_t Size() const {
    return executors_.size();
  }

 private:
  std::unordered_map<int, OperationExecutorPtr> executors_;
};

// Registry with the PCM executor for every catalog kind.
std::shared_ptr<ExecutorRegistry> BuildDefaultRegistry();

} // namespace waveq::pipeline
