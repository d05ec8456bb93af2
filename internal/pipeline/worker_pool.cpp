#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"

namespace waveq::pipeline {

using observability::IntField;
using observability::RequestField;
using observability::StringField;

WorkerPool::WorkerPool(std::shared_ptr<scheduler::RequestScheduler> scheduler, std::shared_ptr<PipelineExecutor> executor, uint32_t threads)
    : scheduler_(std::move(scheduler)), executor_(std::move(executor)), threads_(threads == 0 ? 1 : threads) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) {
    return;
  }
  for (uint32_t i = 0; i < threads_; ++i) {
    workers_.emplace_back(&WorkerPool::Run, this, i);
  }
  WAVEQ_LOG_INFO("worker pool started", {IntField("threads", threads_)});
}

void WorkerPool::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
}

void WorkerPool::Run(uint32_t worker) {
  while (running_) {
    std::optional<db::model::RequestRecord> record;
    try {
      record = scheduler_->Next();
    } catch (const std::exception& e) {
      WAVEQ_LOG_ERROR("worker failed to take a request", {IntField("worker", worker), StringField("error", e.what())});
      continue;
    }
    if (!record) break;

    try {
      executor_->Run(*record);
    } catch (const std::exception& e) {
      // store or transport failure outside the operation chain
      WAVEQ_LOG_ERROR("worker failed to run request",
                      {IntField("worker", worker), RequestField(record->id), StringField("error", e.what())});
      try {
        executor_->Abort(record->id, e.what());
      } catch (const std::exception& abort_error) {
        WAVEQ_LOG_ERROR("failed to abort request", {RequestField(record->id), StringField("error", abort_error.what())});
      }
    }
  }
}

} // namespace waveq::pipeline
