#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "internal/scheduler/request_scheduler.hpp"
#include "pipeline_executor.hpp"

namespace waveq::pipeline {

/*
  Fixed set of workers looping Next() -> Run().

  Stop() shuts the scheduler down and joins every worker; requests already
  running finish first.
*/
class WorkerPool {
 public:
  WorkerPool(std::shared_ptr<scheduler::RequestScheduler> scheduler, std::shared_ptr<PipelineExecutor> executor, uint32_t threads);
  ~WorkerPool();

  void Start();
  void Stop();

  uint32_t Size() const {
    return threads_;
  }

 private:
  void Run(uint32_t worker);

  std::shared_ptr<scheduler::RequestScheduler> scheduler_;
  std::shared_ptr<PipelineExecutor>            executor_;
  uint32_t                                     threads_;

  std::vector<std::thread> workers_;
  std::atomic<bool>        running_{false};
};

} // namespace waveq::pipeline
