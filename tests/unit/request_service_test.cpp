#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/catalog/operation_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/interpreter/instruction_interpreter.hpp"
#include "internal/interpreter/keyword_classifier.hpp"
#include "internal/pipeline/executor_registry.hpp"
#include "internal/pipeline/pipeline_executor.hpp"
#include "internal/scheduler/request_scheduler.hpp"
#include "internal/service/intake_listener.hpp"
#include "internal/service/request_service.hpp"
#include "internal/status/in_process_transport.hpp"
#include "internal/status/status_publisher.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/ram/ram_audio_store.hpp"
#include "internal/store/request_store.hpp"
#include "internal/util/errors.hpp"
#include "support/audio_fixture.hpp"

namespace {

using namespace waveq::engine::v1;
using waveq::service::RequestService;
using waveq::service::ServiceContext;

struct Fixture {
  ServiceContext                                     ctx;
  std::shared_ptr<RequestService>                    service;
  std::shared_ptr<waveq::pipeline::PipelineExecutor> executor;

  explicit Fixture(uint32_t max_active_per_client = 0) {
    ctx.catalog     = &waveq::catalog::OperationCatalog::Default();
    ctx.interpreter =
        std::make_shared<waveq::interpreter::InstructionInterpreter>(*ctx.catalog, std::make_shared<waveq::interpreter::KeywordClassifier>());
    ctx.store       = std::make_shared<waveq::store::RequestStore>(std::make_shared<waveq::db::memory::MemoryRepository>());
    ctx.scheduler   = std::make_shared<waveq::scheduler::RequestScheduler>(ctx.store, max_active_per_client);
    ctx.audio_store = std::make_shared<waveq::storage::RamAudioStore>();
    ctx.transport   = std::make_shared<waveq::status::InProcessTransport>();
    ctx.publisher   = std::make_shared<waveq::status::StatusPublisher>(ctx.transport, waveq::status::PublisherOptions{});
    ctx.store->SetTransitionListener([p = ctx.publisher](const waveq::store::RequestEvent& e) { p->OnTransition(e); });

    service  = std::make_shared<RequestService>(ctx);
    executor = std::make_shared<waveq::pipeline::PipelineExecutor>(ctx.store, waveq::pipeline::BuildDefaultRegistry(), ctx.audio_store,
                                                                  waveq::pipeline::PipelineOptions{});

    waveq::testing::PutTone(*ctx.audio_store, "src-1", 1000);
  }

  // Runs the next queued request on the calling thread.
  EditRequest Drain() {
    auto next = ctx.scheduler->Next();
    assert(next);
    return waveq::service::ToProto(executor->Run(*next));
  }
};

RawOperation* AddOp(SubmitRequest* req, const std::string& name) {
  auto* op = req->add_operations();
  op->set_name(name);
  return op;
}

void SetNumber(RawOperation* op, const std::string& key, double value) {
  (*op->mutable_parameters()->mutable_fields())[key].set_number_value(value);
}

SubmitRequest TrimThenNormalize() {
  SubmitRequest req;
  req.add_sources("src-1");
  AddOp(&req, "normalize");
  auto* trim = AddOp(&req, "trim");
  SetNumber(trim, "start_ms", 0);
  SetNumber(trim, "end_ms", 500);
  return req;
}

void TestSubmitNormalizesAndQueues() {
  Fixture f;
  auto    req = TrimThenNormalize();
  req.set_priority_name("urgent");
  req.set_description("demo");

  auto submitted = f.service->Submit(req).request();
  assert(submitted.id() == "REQ-000001");
  assert(submitted.client_id() == "anonymous");
  assert(submitted.status() == REQUEST_STATUS_QUEUED);
  assert(submitted.priority() == 1);
  assert(submitted.operations_size() == 2);
  assert(submitted.operations(0).kind() == OPERATION_KIND_TRIM);
  assert(submitted.operations(1).parameters().fields().at("target_db").number_value() == -20.0);

  GetRequestRequest get;
  get.set_id(submitted.id());
  auto fetched = f.service->GetRequest(get).request();
  assert(fetched.description() == "demo");
  assert(fetched.created_at_ms() == submitted.created_at_ms());

  get.set_id("REQ-424242");
  bool thrown = false;
  try {
    f.service->GetRequest(get);
  } catch (const waveq::util::NotFound&) {
    thrown = true;
  }
  assert(thrown);
}

void TestSubmitRejectsInvalidChainWithoutStoring() {
  Fixture       f;
  SubmitRequest req;
  req.add_sources("src-1");
  AddOp(&req, "normalize");
  SetNumber(AddOp(&req, "speed"), "factor", 9);

  bool thrown = false;
  try {
    f.service->Submit(req);
  } catch (const waveq::util::ValidationError& e) {
    thrown = true;
    assert(e.operation_index() == 1);
    assert(e.field() == "factor");
  }
  assert(thrown);

  ListRequestsRequest list;
  assert(f.service->List(list).requests_size() == 0);
}

void TestAdmissionLimit() {
  Fixture f(1);
  auto    req = TrimThenNormalize();
  req.set_client_id("studio");
  f.service->Submit(req);

  bool thrown = false;
  try {
    f.service->Submit(req);
  } catch (const waveq::util::AdmissionError&) {
    thrown = true;
  }
  assert(thrown);

  req.set_client_id("other-studio");
  f.service->Submit(req);
}

void TestListAndCancel() {
  Fixture f;
  for (int i = 0; i < 3; ++i) {
    auto req = TrimThenNormalize();
    req.set_client_id(i == 1 ? "b" : "a");
    f.service->Submit(req);
  }

  CancelRequestRequest cancel;
  cancel.set_id("REQ-000002");
  assert(f.service->Cancel(cancel).request().status() == REQUEST_STATUS_CANCELLED);
  assert(f.service->Cancel(cancel).request().status() == REQUEST_STATUS_CANCELLED);

  ListRequestsRequest list;
  auto                all = f.service->List(list);
  assert(all.requests_size() == 3);
  assert(all.requests(0).id() == "REQ-000003");

  list.set_client_id("a");
  assert(f.service->List(list).requests_size() == 2);

  list.clear_client_id();
  list.set_status(REQUEST_STATUS_CANCELLED);
  auto cancelled = f.service->List(list);
  assert(cancelled.requests_size() == 1 && cancelled.requests(0).client_id() == "b");

  list.clear_status();
  list.set_limit(1);
  assert(f.service->List(list).requests_size() == 1);

  cancel.clear_id();
  bool thrown = false;
  try {
    f.service->Cancel(cancel);
  } catch (const waveq::util::ValidationError& e) {
    thrown = e.field() == "id";
  }
  assert(thrown);
}

void TestFetchAndDeleteResult() {
  Fixture f;
  auto    id = f.service->Submit(TrimThenNormalize()).request().id();

  FetchResultRequest fetch;
  fetch.set_id(id);
  bool thrown = false;
  try {
    f.service->FetchResult(fetch);
  } catch (const waveq::util::InvalidState&) {
    thrown = true;
  }
  assert(thrown);

  DeleteRequestRequest del;
  del.set_id(id);
  thrown = false;
  try {
    f.service->Delete(del);
  } catch (const waveq::util::InvalidState&) {
    thrown = true;
  }
  assert(thrown);

  auto done = f.Drain();
  assert(done.status() == REQUEST_STATUS_COMPLETED);

  auto result = f.service->FetchResult(fetch);
  assert(result.result_ref() == done.result_ref());
  auto audio = waveq::audio::DecodeWav(*waveq::storage::common::CopyToBuffer(result.data()));
  assert(audio.DurationMs() > 499.0 && audio.DurationMs() < 501.0);

  f.service->Delete(del);
  assert(!f.ctx.audio_store->Contains(done.result_ref()));
  assert(!f.ctx.store->Find(id));
}

void TestStats() {
  Fixture f;

  f.service->Submit(TrimThenNormalize());
  f.Drain();

  SubmitRequest bad = TrimThenNormalize();
  bad.set_sources(0, "missing-source");
  f.service->Submit(bad);
  f.Drain();

  f.service->Submit(TrimThenNormalize());
  auto queued = f.service->Submit(TrimThenNormalize()).request();
  CancelRequestRequest cancel;
  cancel.set_id(queued.id());
  f.service->Cancel(cancel);

  auto stats = f.service->Stats(StatsRequest{});
  assert(stats.total() == 4);
  assert(stats.completed() == 1);
  assert(stats.failed() == 1);
  assert(stats.queued() == 1);
  assert(stats.cancelled() == 1);
  assert(stats.processing() == 0);
  assert(stats.success_rate() == 0.5);
  // the cancelled entry still sits in its tier until a worker skips it
  assert(stats.queue_depth() == 2);
}

void TestDescribeOperations() {
  Fixture f;
  auto    ops = f.service->DescribeOperations(DescribeOperationsRequest{});
  assert(ops.operations_size() == 13);
  assert(ops.operations(0).name() == "trim");
}

void TestUploadAudio() {
  Fixture            f;
  UploadAudioRequest upload;

  auto rejects = [&](const std::string& data) {
    upload.set_data(data);
    try {
      f.service->UploadAudio(upload);
    } catch (const waveq::util::ValidationError& e) {
      return e.field() == "data";
    }
    return false;
  };
  assert(rejects(""));
  assert(rejects("ID3 this is an mp3"));

  upload.set_data(waveq::audio::EncodeWav(waveq::testing::MakeTone(200))->ToString());
  auto ref = f.service->UploadAudio(upload).source_ref();
  assert(ref.rfind("source-", 0) == 0);
  assert(f.ctx.audio_store->Contains(ref));
}

void TestSnapshotReflectsStep() {
  Fixture f;
  auto    id = f.service->Submit(TrimThenNormalize()).request().id();

  auto snapshot = f.service->Snapshot(id);
  assert(snapshot.status() == REQUEST_STATUS_QUEUED);
  assert(snapshot.total_steps() == 2);
  assert(!snapshot.has_step());
}

void TestIntakeListener() {
  Fixture f;
  auto    listener = std::make_shared<waveq::service::IntakeListener>(f.service, f.ctx.transport, "audio/requests");
  listener->Start();

  std::vector<StatusEvent> rejections;
  f.ctx.transport->Subscribe("audio/status/#", [&](const std::string&, const std::string& payload) {
    auto event = waveq::status::StatusPublisher::FromJson(payload);
    if (event.status() == REQUEST_STATUS_ERROR) {
      rejections.push_back(event);
    }
  });

  f.ctx.transport->Publish("audio/requests",
                           R"({"id":"job-1","sources":["src-1"],"operations":[{"name":"fade_out","parameters":{"duration_ms":250}}]})");
  assert(f.ctx.store->Get("job-1").status == REQUEST_STATUS_QUEUED);

  f.ctx.transport->Publish("audio/requests", R"({"id":"job-2","sources":["src-1"],"operations":[{"name":"fade_in"},{"name":"equalize"}]})");
  assert(rejections.size() == 1);
  assert(rejections[0].id() == "job-2");
  assert(rejections[0].error().kind() == ERROR_KIND_VALIDATION);
  assert(rejections[0].error().operation_index() == 1);
  assert(!f.ctx.store->Find("job-2"));

  // unparseable and anonymous rejections are only logged
  f.ctx.transport->Publish("audio/requests", "not json");
  f.ctx.transport->Publish("audio/requests", R"({"sources":[]})");
  assert(rejections.size() == 1);

  listener->Stop();
  f.ctx.transport->Publish("audio/requests", R"({"id":"job-3","sources":["src-1"],"operations":[{"name":"normalize"}]})");
  assert(!f.ctx.store->Find("job-3"));
}

} // namespace

int main() {
  TestSubmitNormalizesAndQueues();
  TestSubmitRejectsInvalidChainWithoutStoring();
  TestAdmissionLimit();
  TestListAndCancel();
  TestFetchAndDeleteResult();
  TestStats();
  TestDescribeOperations();
  TestUploadAudio();
  TestSnapshotReflectsStep();
  TestIntakeListener();

  std::cout << "waveq_unit_request_service: pass\n";
  return 0;
}
