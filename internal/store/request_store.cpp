#include "request_store.hpp"

#include <cstdio>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace waveq::store {

using db::model::RequestRecord;
using namespace waveq::engine::v1;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

std::string FormatRequestId(uint64_t sequence) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "REQ-%06llu", static_cast<unsigned long long>(sequence));
  return buffer;
}

} // namespace

RequestStore::RequestStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void RequestStore::SetTransitionListener(TransitionListener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

void RequestStore::QueueLocked(const RequestRecord& record, bool progress) {
  if (!listener_) {
    return;
  }

  std::optional<StepMarker> step;
  if (auto it = steps_.find(record.id); it != steps_.end()) {
    step = it->second;
  }
  pending_.push_back(PendingEvent{record, step, progress});
}

void RequestStore::Dispatch() {
  {
    std::lock_guard lock(mutex_);
    if (dispatching_) {
      return;
    }
    dispatching_ = true;
  }

  while (true) {
    PendingEvent       event;
    TransitionListener listener;
    {
      std::lock_guard lock(mutex_);
      if (pending_.empty()) {
        dispatching_ = false;
        return;
      }
      event = std::move(pending_.front());
      pending_.pop_front();
      listener = listener_;
    }

    if (!listener) {
      continue;
    }
    try {
      listener(RequestEvent{event.record, event.step, event.progress});
    } catch (const std::exception& e) {
      WAVEQ_LOG_ERROR("transition listener failed", {observability::RequestField(event.record.id), observability::StringField("error", e.what())});
    }
  }
}

RequestRecord RequestStore::Create(RequestRecord record) {
  {
    std::lock_guard lock(mutex_);
    CreateLocked(record);
  }
  Dispatch();
  return record;
}

void RequestStore::CreateLocked(RequestRecord& record) {
  auto tx         = repository_->Begin();
  record.sequence = repository_->NextSequence(*tx);
  if (record.id.empty()) {
    record.id = FormatRequestId(record.sequence);
  }

  const auto now       = util::NowMillis();
  record.status        = REQUEST_STATUS_QUEUED;
  record.created_at_ms = now;
  record.updated_at_ms = now;
  record.result_ref.clear();
  record.error.reset();
  record.processing_ms = 0;

  ThrowIfDbError(repository_->InsertRequest(*tx, record), "create request " + record.id);
  tx->Commit();

  QueueLocked(record, false);
}

std::optional<RequestRecord> RequestStore::Find(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  auto            record = repository_->GetRequest(*tx, id);
  tx->Commit();
  return record;
}

RequestRecord RequestStore::Get(const std::string& id) {
  auto record = Find(id);
  if (!record) {
    throw util::NotFound("request " + id + " not found");
  }
  return *record;
}

RequestRecord RequestStore::CommitLocked(db::Transaction& tx, const RequestRecord& current, RequestRecord next) {
  const auto& id     = current.id;
  next.id            = current.id;
  next.sequence      = current.sequence;
  next.created_at_ms = current.created_at_ms;

  if (next.status != current.status && !model::CanTransition(current.status, next.status)) {
    throw util::IllegalTransition("request " + id + ": illegal transition " + model::StatusName(current.status) + " -> " +
                                  model::StatusName(next.status));
  }
  if (next.status == current.status && model::IsTerminal(current.status)) {
    throw util::IllegalTransition("request " + id + ": terminal record is immutable");
  }
  if (!next.result_ref.empty() && next.error) {
    throw util::IllegalTransition("request " + id + ": result_ref and error are mutually exclusive");
  }
  if (!model::IsTerminal(next.status) && (!next.result_ref.empty() || next.error)) {
    throw util::IllegalTransition("request " + id + ": " + model::StatusName(next.status) + " record cannot carry a result or error");
  }

  next.updated_at_ms = util::NowMillisAfter(current.updated_at_ms);

  ThrowIfDbError(repository_->UpdateRequest(tx, next), "update request " + id);
  tx.Commit();

  if (model::IsTerminal(next.status)) {
    steps_.erase(id);
  }
  QueueLocked(next, false);
  return next;
}

RequestRecord RequestStore::UpdateLocked(const std::string& id, const Mutation& mutation) {
  auto tx      = repository_->Begin();
  auto current = repository_->GetRequest(*tx, id);
  if (!current) {
    throw util::NotFound("request " + id + " not found");
  }

  RequestRecord next = *current;
  mutation(next);
  return CommitLocked(*tx, *current, std::move(next));
}

RequestRecord RequestStore::Update(const std::string& id, const Mutation& mutation) {
  RequestRecord updated;
  {
    std::lock_guard lock(mutex_);
    updated = UpdateLocked(id, mutation);
  }
  Dispatch();
  return updated;
}

std::optional<RequestRecord> RequestStore::TryTransition(const std::string& id, RequestStatus from, RequestStatus to,
                                                         const Mutation& mutation) {
  std::optional<RequestRecord> updated;
  {
    std::lock_guard lock(mutex_);

    auto tx      = repository_->Begin();
    auto current = repository_->GetRequest(*tx, id);
    if (!current || current->status != from) {
      tx->Commit();
      return std::nullopt;
    }

    RequestRecord next = *current;
    mutation(next);
    next.status = to;
    updated     = CommitLocked(*tx, *current, std::move(next));
  }
  Dispatch();
  return updated;
}

std::vector<RequestRecord> RequestStore::List(const db::RequestFilter& filter) {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  auto            records = repository_->ListRequests(*tx, filter);
  tx->Commit();
  return records;
}

RequestRecord RequestStore::Delete(const std::string& id) {
  std::lock_guard lock(mutex_);

  auto tx     = repository_->Begin();
  auto record = repository_->GetRequest(*tx, id);
  if (!record) {
    throw util::NotFound("request " + id + " not found");
  }
  if (!model::IsTerminal(record->status)) {
    throw util::InvalidState("request " + id + " is " + model::StatusName(record->status) + "; cancel it before deleting");
  }

  ThrowIfDbError(repository_->DeleteRequest(*tx, id), "delete request " + id);
  tx->Commit();
  steps_.erase(id);
  return *record;
}

uint64_t RequestStore::CountActive(const std::string& client_id) {
  std::lock_guard lock(mutex_);
  auto            tx    = repository_->Begin();
  const auto      count = repository_->CountActiveForClient(*tx, client_id);
  tx->Commit();
  return count;
}

RequestRecord RequestStore::Cancel(const std::string& id) {
  RequestRecord result;
  {
    std::lock_guard lock(mutex_);

    auto tx      = repository_->Begin();
    auto current = repository_->GetRequest(*tx, id);
    if (!current) {
      throw util::NotFound("request " + id + " not found");
    }
    if (model::IsTerminal(current->status)) {
      tx->Commit();
      return *current;
    }

    RequestRecord next = *current;
    next.status        = REQUEST_STATUS_CANCELLED;
    result             = CommitLocked(*tx, *current, std::move(next));
  }
  Dispatch();
  return result;
}

void RequestStore::MarkStep(const std::string& id, int index, OperationKind kind) {
  {
    std::lock_guard lock(mutex_);

    auto tx     = repository_->Begin();
    auto record = repository_->GetRequest(*tx, id);
    tx->Commit();
    if (!record) {
      throw util::NotFound("request " + id + " not found");
    }
    if (record->status != REQUEST_STATUS_PROCESSING) {
      WAVEQ_LOG_DEBUG("step marker ignored", {observability::RequestField(id), observability::IntField("step", index)});
      return;
    }

    steps_[id] = StepMarker{index, kind};
    QueueLocked(*record, true);
  }
  Dispatch();
}

std::optional<StepMarker> RequestStore::CurrentStep(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            it = steps_.find(id);
  if (it == steps_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace waveq::store
