#pragma once

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/store/request_store.hpp"

namespace waveq::scheduler {

/*
  Five FIFO tiers (priority 1 = highest) in front of the worker pool.

  Next() always drains the lowest-numbered non-empty tier first. Dispatch is
  the queued -> processing transition in the store; entries cancelled while
  waiting are dropped there, so a request is handed to at most one worker.
  A request whose dispatch fails for any other reason is moved to error, or
  put back in its tier when the store cannot record that either.
*/
class RequestScheduler {
 public:
  static constexpr int kMinPriority = 1;
  static constexpr int kMaxPriority = 5;

  RequestScheduler(std::shared_ptr<store::RequestStore> store, uint32_t max_active_per_client);

  // Admission check, persist as queued and enqueue, atomically with
  // respect to other admissions. Throws util::AdmissionError.
  db::model::RequestRecord Admit(db::model::RequestRecord record);

  // Blocks until a request is dispatched or Shutdown() is called.
  std::optional<db::model::RequestRecord> Next();

  void Shutdown();

  uint64_t Depth() const;
  uint64_t Depth(int priority) const;

 private:
  static constexpr std::chrono::milliseconds kRequeueDelay{100};

  void Enqueue(const std::string& id, int priority);
  void Quarantine(const std::string& id, int priority, const std::string& reason);

  std::shared_ptr<store::RequestStore> store_;
  const uint32_t                       max_active_per_client_;

  std::mutex admission_mutex_;

  mutable std::mutex                            mutex_;
  std::condition_variable                       cv_;
  std::array<std::deque<std::string>, kMaxPriority> tiers_;
  bool                                          shutdown_ = false;
};

} // namespace waveq::scheduler
