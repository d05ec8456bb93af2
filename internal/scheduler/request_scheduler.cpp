#include "request_scheduler.hpp"

#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace waveq::scheduler {

using db::model::RequestRecord;
using namespace waveq::engine::v1;

RequestScheduler::RequestScheduler(std::shared_ptr<store::RequestStore> store, uint32_t max_active_per_client)
    : store_(std::move(store)), max_active_per_client_(max_active_per_client) {
}

RequestRecord RequestScheduler::Admit(RequestRecord record) {
  if (record.priority < kMinPriority || record.priority > kMaxPriority) {
    throw util::ValidationError("priority must be within 1..5, got " + std::to_string(record.priority), -1, "priority");
  }

  std::lock_guard admission(admission_mutex_);

  if (max_active_per_client_ > 0) {
    const auto active = store_->CountActive(record.client_id);
    if (active >= max_active_per_client_) {
      throw util::AdmissionError("client " + record.client_id + " already has " + std::to_string(active) +
                                 " active requests (limit " + std::to_string(max_active_per_client_) + ")");
    }
  }

  auto created = store_->Create(std::move(record));
  Enqueue(created.id, created.priority);
  return created;
}

void RequestScheduler::Enqueue(const std::string& id, int priority) {
  uint64_t depth = 0;
  {
    std::lock_guard lock(mutex_);
    auto&           tier = tiers_[priority - 1];
    tier.push_back(id);
    depth = tier.size();
  }
  cv_.notify_one();
  observability::Metrics::Instance().SetQueueDepth(priority, depth);
}

std::optional<RequestRecord> RequestScheduler::Next() {
  while (true) {
    std::string id;
    int         priority = 0;
    uint64_t    depth    = 0;
    {
      std::unique_lock lock(mutex_);

      cv_.wait(lock, [&] {
        if (shutdown_) return true;
        for (const auto& tier : tiers_) {
          if (!tier.empty()) return true;
        }
        return false;
      });

      if (shutdown_) return std::nullopt;

      for (std::size_t i = 0; i < tiers_.size(); ++i) {
        if (!tiers_[i].empty()) {
          id = std::move(tiers_[i].front());
          tiers_[i].pop_front();
          priority = static_cast<int>(i) + 1;
          depth    = tiers_[i].size();
          break;
        }
      }
    }
    observability::Metrics::Instance().SetQueueDepth(priority, depth);

    try {
      // cancelled or deleted while waiting in its tier
      auto dispatched = store_->TryTransition(id, REQUEST_STATUS_QUEUED, REQUEST_STATUS_PROCESSING, [](RequestRecord&) {});
      if (!dispatched) {
        continue;
      }
      return dispatched;
    } catch (const std::exception& e) {
      WAVEQ_LOG_ERROR("dispatch failed", {observability::RequestField(id), observability::StringField("error", e.what())});
      Quarantine(id, priority, e.what());
    }
  }
}

void RequestScheduler::Quarantine(const std::string& id, int priority, const std::string& reason) {
  try {
    auto failed = store_->TryTransition(id, REQUEST_STATUS_QUEUED, REQUEST_STATUS_ERROR, [&](RequestRecord& r) {
      RequestError error;
      error.set_kind(ERROR_KIND_INTERNAL);
      error.set_message("dispatch failed: " + reason);
      error.set_operation_index(-1);
      r.error = error;
    });
    if (failed) {
      observability::Metrics::Instance().RecordRequestOutcome("error");
    }
  } catch (const std::exception& e) {
    // the store is unusable; keep the request queued and retry later
    WAVEQ_LOG_ERROR("request left queued after dispatch failure",
                    {observability::RequestField(id), observability::StringField("error", e.what())});
    std::this_thread::sleep_for(kRequeueDelay);
    Enqueue(id, priority);
  }
}

void RequestScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

uint64_t RequestScheduler::Depth() const {
  std::lock_guard lock(mutex_);
  uint64_t        total = 0;
  for (const auto& tier : tiers_) {
    total += tier.size();
  }
  return total;
}

uint64_t RequestScheduler::Depth(int priority) const {
  if (priority < kMinPriority || priority > kMaxPriority) {
    return 0;
  }
  std::lock_guard lock(mutex_);
  return tiers_[priority - 1].size();
}

} // namespace waveq::scheduler
