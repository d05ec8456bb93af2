#pragma once

#include <functional>

#include "executor_registry.hpp"

namespace waveq::pipeline {

// Adapts a plain function to the executor interface.
class FunctionExecutor final : public OperationExecutor {
 public:
  using Fn = std::function<audio::AudioBuffer(const audio::AudioBuffer&, const google::protobuf::Struct&, const ExecutionContext&)>;

  FunctionExecutor(waveq::engine::v1::OperationKind kind, Fn fn) : kind_(kind), fn_(std::move(fn)) {
  }

  waveq::engine::v1::OperationKind Kind() const override {
    return kind_;
  }

  audio::AudioBuffer Execute(const audio::AudioBuffer& input, const google::protobuf::Struct& parameters, const ExecutionContext& ctx) override {
    return fn_(input, parameters, ctx);
  }

 private:
  waveq::engine::v1::OperationKind kind_;
  Fn                               fn_;
};

// Binds audio::dsp kernels for all thirteen kinds.
void RegisterDspExecutors(ExecutorRegistry& registry);

} // namespace waveq::pipeline
