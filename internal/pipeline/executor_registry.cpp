#include "executor_registry.hpp"

#include <stdexcept>

#include "dsp_executors.hpp"

namespace waveq::pipeline {

void ExecutorRegistry::Register(OperationExecutorPtr executor) {
  if (!executor) {
    throw std::invalid_argument("executor must not be null");
  }
  executors_[static_cast<int>(executor->Kind())] = std::move(executor);
}

OperationExecutorPtr ExecutorRegistry::Find(waveq::engine::v1::OperationKind kind) const {
  auto it = executors_.find(static_cast<int>(kind));
  return it == executors_.end() ? nullptr : it->second;
}

std::shared_ptr<ExecutorRegistry> BuildDefaultRegistry() {
  auto registry = std::make_shared<ExecutorRegistry>();
  RegisterDspExecutors(*registry);
  return registry;
}

} // namespace waveq::pipeline
