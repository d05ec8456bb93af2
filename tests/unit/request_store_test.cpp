#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/request_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace waveq::engine::v1;
using waveq::db::model::RequestRecord;
using waveq::store::RequestEvent;
using waveq::store::RequestStore;

std::shared_ptr<RequestStore> MakeStore() {
  return std::make_shared<RequestStore>(std::make_shared<waveq::db::memory::MemoryRepository>());
}

RequestRecord Draft(const std::string& client = "client-a") {
  RequestRecord record;
  record.client_id  = client;
  record.sources    = {"src-1"};
  record.status     = REQUEST_STATUS_COMPLETED; // Create resets it
  record.result_ref = "stale";

  OperationSpec op;
  op.set_kind(OPERATION_KIND_NORMALIZE);
  record.operations.push_back(op);
  return record;
}

void SetStatus(RequestStore& store, const std::string& id, RequestStatus status) {
  store.Update(id, [status](RequestRecord& r) { r.status = status; });
}

void TestCreateAssignsIdsAndResetsState() {
  auto store = MakeStore();

  auto first  = store->Create(Draft());
  auto second = store->Create(Draft());

  assert(first.id == "REQ-000001");
  assert(second.id == "REQ-000002");
  assert(first.status == REQUEST_STATUS_QUEUED);
  assert(first.result_ref.empty());
  assert(first.created_at_ms == first.updated_at_ms);
  assert(first.created_at_ms > 0);

  RequestRecord named = Draft();
  named.id            = "custom-id";
  assert(store->Create(named).id == "custom-id");

  bool thrown = false;
  try {
    store->Create(named);
  } catch (const waveq::util::AlreadyExists&) {
    thrown = true;
  }
  assert(thrown);
}

void TestIllegalTransitionLeavesRecordUnchanged() {
  auto store  = MakeStore();
  auto record = store->Create(Draft());

  bool thrown = false;
  try {
    SetStatus(*store, record.id, REQUEST_STATUS_COMPLETED);
  } catch (const waveq::util::IllegalTransition&) {
    thrown = true;
  }
  assert(thrown);

  auto after = store->Get(record.id);
  assert(after.status == REQUEST_STATUS_QUEUED);
  assert(after.updated_at_ms == record.updated_at_ms);
}

void TestUpdatedAtStrictlyIncreases() {
  auto store  = MakeStore();
  auto record = store->Create(Draft());

  SetStatus(*store, record.id, REQUEST_STATUS_PROCESSING);
  auto processing = store->Get(record.id);
  assert(processing.updated_at_ms > record.updated_at_ms);

  auto done = store->Update(record.id, [](RequestRecord& r) {
    r.status     = REQUEST_STATUS_COMPLETED;
    r.result_ref = "result-1.wav";
  });
  assert(done.updated_at_ms > processing.updated_at_ms);
  assert(done.created_at_ms == record.created_at_ms);

  bool thrown = false;
  try {
    store->Update(record.id, [](RequestRecord& r) { r.result_ref = "other"; });
  } catch (const waveq::util::IllegalTransition&) {
    thrown = true;
  }
  assert(thrown);
  assert(store->Get(record.id).result_ref == "result-1.wav");
}

void TestCancelSemantics() {
  auto store = MakeStore();

  auto queued    = store->Create(Draft());
  auto cancelled = store->Cancel(queued.id);
  assert(cancelled.status == REQUEST_STATUS_CANCELLED);

  auto again = store->Cancel(queued.id);
  assert(again.status == REQUEST_STATUS_CANCELLED);
  assert(again.updated_at_ms == cancelled.updated_at_ms);

  auto finished = store->Create(Draft());
  SetStatus(*store, finished.id, REQUEST_STATUS_PROCESSING);
  auto completed = store->Update(finished.id, [](RequestRecord& r) {
    r.status     = REQUEST_STATUS_COMPLETED;
    r.result_ref = "result-1.wav";
  });
  auto untouched = store->Cancel(finished.id);
  assert(untouched.status == REQUEST_STATUS_COMPLETED);
  assert(untouched.updated_at_ms == completed.updated_at_ms);
  assert(untouched.result_ref == "result-1.wav");

  bool thrown = false;
  try {
    store->Cancel("REQ-999999");
  } catch (const waveq::util::NotFound&) {
    thrown = true;
  }
  assert(thrown);
}

void TestResultAndErrorFollowStatus() {
  auto store  = MakeStore();
  auto record = store->Create(Draft());
  SetStatus(*store, record.id, REQUEST_STATUS_PROCESSING);

  bool thrown = false;
  try {
    store->Update(record.id, [](RequestRecord& r) { r.result_ref = "result-early.wav"; });
  } catch (const waveq::util::IllegalTransition&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    store->Update(record.id, [](RequestRecord& r) {
      RequestError error;
      error.set_kind(ERROR_KIND_EXECUTION);
      error.set_message("boom");
      r.status     = REQUEST_STATUS_COMPLETED;
      r.result_ref = "result-1.wav";
      r.error      = error;
    });
  } catch (const waveq::util::IllegalTransition&) {
    thrown = true;
  }
  assert(thrown);

  auto after = store->Get(record.id);
  assert(after.status == REQUEST_STATUS_PROCESSING);
  assert(after.result_ref.empty() && !after.error);
}

void TestTryTransitionOnlyFromExpectedStatus() {
  auto store  = MakeStore();
  auto record = store->Create(Draft());

  auto missed = store->TryTransition(record.id, REQUEST_STATUS_PROCESSING, REQUEST_STATUS_COMPLETED,
                                     [](RequestRecord& r) { r.result_ref = "result-1.wav"; });
  assert(!missed);
  assert(store->Get(record.id).status == REQUEST_STATUS_QUEUED);

  auto dispatched = store->TryTransition(record.id, REQUEST_STATUS_QUEUED, REQUEST_STATUS_PROCESSING, [](RequestRecord&) {});
  assert(dispatched && dispatched->status == REQUEST_STATUS_PROCESSING);

  store->Cancel(record.id);
  auto late = store->TryTransition(record.id, REQUEST_STATUS_PROCESSING, REQUEST_STATUS_COMPLETED,
                                   [](RequestRecord& r) { r.result_ref = "result-1.wav"; });
  assert(!late);
  assert(store->Get(record.id).status == REQUEST_STATUS_CANCELLED);
  assert(store->Get(record.id).result_ref.empty());

  assert(!store->TryTransition("REQ-999999", REQUEST_STATUS_QUEUED, REQUEST_STATUS_PROCESSING, [](RequestRecord&) {}));
}

void TestDeleteRequiresTerminal() {
  auto store  = MakeStore();
  auto record = store->Create(Draft());

  bool thrown = false;
  try {
    store->Delete(record.id);
  } catch (const waveq::util::InvalidState&) {
    thrown = true;
  }
  assert(thrown);

  store->Cancel(record.id);
  auto removed = store->Delete(record.id);
  assert(removed.id == record.id);
  assert(!store->Find(record.id));
}

void TestListFiltersNewestFirst() {
  auto store = MakeStore();
  auto a1    = store->Create(Draft("a"));
  auto b1    = store->Create(Draft("b"));
  auto a2    = store->Create(Draft("a"));
  store->Cancel(a2.id);

  waveq::db::RequestFilter all;
  all.limit = 0;
  auto everything = store->List(all);
  assert(everything.size() == 3);
  assert(everything[0].id == a2.id);
  assert(everything[2].id == a1.id);

  waveq::db::RequestFilter by_client;
  by_client.client_id = "a";
  assert(store->List(by_client).size() == 2);

  waveq::db::RequestFilter by_status;
  by_status.status = REQUEST_STATUS_QUEUED;
  auto queued      = store->List(by_status);
  assert(queued.size() == 2);

  waveq::db::RequestFilter limited;
  limited.limit = 1;
  assert(store->List(limited).size() == 1);

  assert(store->CountActive("a") == 1);
  assert(store->CountActive("b") == 1);
  (void)b1;
}

void TestListenerSeesCommitsAndSteps() {
  auto store = MakeStore();

  std::vector<RequestStatus> statuses;
  std::vector<int>           progress_steps;
  store->SetTransitionListener([&](const RequestEvent& event) {
    if (event.progress) {
      assert(event.step);
      progress_steps.push_back(event.step->index);
      return;
    }
    statuses.push_back(event.record.status);
  });

  auto record = store->Create(Draft());
  store->MarkStep(record.id, 0, OPERATION_KIND_NORMALIZE); // ignored while queued
  SetStatus(*store, record.id, REQUEST_STATUS_PROCESSING);
  store->MarkStep(record.id, 0, OPERATION_KIND_TRIM);
  store->MarkStep(record.id, 1, OPERATION_KIND_NORMALIZE);

  auto step = store->CurrentStep(record.id);
  assert(step && step->index == 1 && step->kind == OPERATION_KIND_NORMALIZE);

  SetStatus(*store, record.id, REQUEST_STATUS_ERROR);
  assert(!store->CurrentStep(record.id));

  assert((statuses == std::vector<RequestStatus>{REQUEST_STATUS_QUEUED, REQUEST_STATUS_PROCESSING, REQUEST_STATUS_ERROR}));
  assert((progress_steps == std::vector<int>{0, 1}));
}

void TestListenerMayCallBackIntoStore() {
  auto store = MakeStore();

  std::vector<RequestStatus> fetched;
  std::vector<std::string>   created_ids;
  bool                       spawned = false;
  store->SetTransitionListener([&](const RequestEvent& event) {
    // a subscriber that reads the record it was told about
    fetched.push_back(store->Get(event.record.id).status);

    if (event.record.status == REQUEST_STATUS_QUEUED && !spawned) {
      spawned = true;
      std::thread other([&] { created_ids.push_back(store->Create(Draft("b")).id); });
      other.join();
      store->Cancel(event.record.id);
    }
  });

  auto record = store->Create(Draft("a"));

  assert(created_ids.size() == 1);
  assert(store->Get(record.id).status == REQUEST_STATUS_CANCELLED);
  assert(store->Get(created_ids[0]).status == REQUEST_STATUS_QUEUED);
  // queued(a) then the other thread's queued(b) then cancelled(a), in commit order
  assert(fetched.size() == 3);
  assert(fetched[1] == REQUEST_STATUS_QUEUED);
  assert(fetched[2] == REQUEST_STATUS_CANCELLED);
}

} // namespace

int main() {
  TestCreateAssignsIdsAndResetsState();
  TestIllegalTransitionLeavesRecordUnchanged();
  TestUpdatedAtStrictlyIncreases();
  TestCancelSemantics();
  TestResultAndErrorFollowStatus();
  TestTryTransitionOnlyFromExpectedStatus();
  TestDeleteRequiresTerminal();
  TestListFiltersNewestFirst();
  TestListenerSeesCommitsAndSteps();
  TestListenerMayCallBackIntoStore();

  std::cout << "waveq_unit_request_store: pass\n";
  return 0;
}
