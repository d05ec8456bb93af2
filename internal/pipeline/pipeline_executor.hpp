#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "executor_registry.hpp"
#include "internal/store/request_store.hpp"

namespace waveq::pipeline {

struct PipelineOptions {
  uint32_t max_attempts         = 3;
  uint64_t retry_backoff_ms     = 100;
  uint64_t operation_timeout_ms = 0; // 0 = no timeout

  // Timed-out attempts keep running detached until they return. Past this
  // many, further attempts fail as transient instead of starting a thread.
  uint32_t max_abandoned_attempts = 8;
};

/*
  Runs one request's operation chain, strictly in order.

  Input:  a record already transitioned to processing.
  Output: the record after its final transition (completed, error), or the
          cancelled record when a cancel won the race.

  Cancellation is checked at every operation boundary. Transient faults and
  timeouts are retried with exponential backoff; everything else aborts the
  chain and discards partial output.
*/
class PipelineExecutor {
 public:
  PipelineExecutor(std::shared_ptr<store::RequestStore> store, std::shared_ptr<ExecutorRegistry> registry,
                   std::shared_ptr<storage::AudioStore> audio_store, PipelineOptions options);

  db::model::RequestRecord Run(const db::model::RequestRecord& record);

  // Moves a processing request to error after a failure outside the chain.
  // No-op once the request has left processing.
  void Abort(const std::string& id, const std::string& message);

  // Timed-out attempts whose threads have not returned yet.
  uint32_t AbandonedAttempts() const;

 private:
  audio::AudioBuffer RunStep(const OperationExecutorPtr& executor, const audio::AudioBuffer& input, const waveq::engine::v1::OperationSpec& op,
                             const ExecutionContext& ctx);

  audio::AudioBuffer Attempt(const OperationExecutorPtr& executor, const audio::AudioBuffer& input, const google::protobuf::Struct& parameters,
                             const ExecutionContext& ctx);

  bool IsCancelled(const std::string& id);

  db::model::RequestRecord Fail(const db::model::RequestRecord& record, int index, waveq::engine::v1::OperationKind kind,
                                const std::string& message, uint64_t processing_ms);

  std::shared_ptr<store::RequestStore> store_;
  std::shared_ptr<ExecutorRegistry>    registry_;
  std::shared_ptr<storage::AudioStore> audio_store_;
  PipelineOptions                      options_;

  std::shared_ptr<std::atomic<uint32_t>> abandoned_ = std::make_shared<std::atomic<uint32_t>>(0);
};

} // namespace waveq::pipeline
