#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace waveq::store {

struct StepMarker {
  int                              index = 0;
  waveq::engine::v1::OperationKind kind  = waveq::engine::v1::OPERATION_KIND_UNSPECIFIED;
};

// Committed change handed to the transition listener.
struct RequestEvent {
  const db::model::RequestRecord& record;
  std::optional<StepMarker>       step;
  bool                            progress = false;
};

/*
  Single source of truth for request records.

  Every repository call runs under one store lock, so status changes are
  serialized and at most one caller transitions a request at a time.

  Committed changes are queued under that lock and handed to the listener
  after it is released, one event at a time and in commit order. The
  listener may call back into the store; events it causes are delivered
  after it returns. A caller can return before its own event is delivered
  when another thread is already draining the queue.
*/
class RequestStore {
 public:
  using Mutation           = std::function<void(db::model::RequestRecord&)>;
  using TransitionListener = std::function<void(const RequestEvent&)>;

  explicit RequestStore(std::shared_ptr<db::Repository> repository);

  void SetTransitionListener(TransitionListener listener);

  // Assigns REQ-000123 style id when empty; status forced to queued.
  db::model::RequestRecord Create(db::model::RequestRecord record);

  db::model::RequestRecord                Get(const std::string& id);
  std::optional<db::model::RequestRecord> Find(const std::string& id);

  // Atomic read-modify-write. A status change must be a legal edge and the
  // record must keep result_ref and error consistent with its status, or
  // util::IllegalTransition is thrown and nothing is written.
  db::model::RequestRecord Update(const std::string& id, const Mutation& mutation);

  // Applies mutation and moves the request to `to` only while it is still in
  // `from`. Returns nullopt, writing nothing, when the request has left
  // `from` or no longer exists.
  std::optional<db::model::RequestRecord> TryTransition(const std::string& id, waveq::engine::v1::RequestStatus from,
                                                        waveq::engine::v1::RequestStatus to, const Mutation& mutation);

  std::vector<db::model::RequestRecord> List(const db::RequestFilter& filter);

  // Only terminal requests can be deleted; returns the removed record.
  db::model::RequestRecord Delete(const std::string& id);

  uint64_t CountActive(const std::string& client_id);

  // queued|processing -> cancelled. Terminal requests are returned untouched.
  db::model::RequestRecord Cancel(const std::string& id);

  // Records the step now running; publishes a progress event.
  void MarkStep(const std::string& id, int index, waveq::engine::v1::OperationKind kind);

  std::optional<StepMarker> CurrentStep(const std::string& id) const;

 private:
  struct PendingEvent {
    db::model::RequestRecord  record;
    std::optional<StepMarker> step;
    bool                      progress = false;
  };

  void                     CreateLocked(db::model::RequestRecord& record);
  db::model::RequestRecord UpdateLocked(const std::string& id, const Mutation& mutation);
  db::model::RequestRecord CommitLocked(db::Transaction& tx, const db::model::RequestRecord& current, db::model::RequestRecord next);
  void                     QueueLocked(const db::model::RequestRecord& record, bool progress);
  void                     Dispatch();

  std::shared_ptr<db::Repository> repository_;
  TransitionListener              listener_;

  mutable std::mutex                          mutex_;
  std::unordered_map<std::string, StepMarker> steps_;
  std::deque<PendingEvent>                    pending_;
  bool                                        dispatching_ = false;
};

} // namespace waveq::store
