#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/waveq_client.h"
#include "internal/audio/audio_buffer.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"
#include "support/audio_fixture.hpp"

namespace {

using namespace waveq::engine::v1;
using waveq::engine::client::WaveqClient;

constexpr uint64_t kWaitMs = 15'000;

RawOperation* AddOp(SubmitRequest* req, const std::string& name) {
  auto* op = req->add_operations();
  op->set_name(name);
  return op;
}

void SetNumber(RawOperation* op, const std::string& key, double value) {
  (*op->mutable_parameters()->mutable_fields())[key].set_number_value(value);
}

void SetString(RawOperation* op, const std::string& key, const std::string& value) {
  (*op->mutable_parameters()->mutable_fields())[key].set_string_value(value);
}

void TestCatalogIsServed(const WaveqClient& client) {
  auto ops = client.DescribeOperations();
  assert(ops.ok());
  assert(ops->operations_size() == 13);
}

std::string UploadTone(const WaveqClient& client, double duration_ms) {
  auto ref = client.UploadAudio(waveq::audio::EncodeWav(waveq::testing::MakeTone(duration_ms)));
  assert(ref.ok());
  return *ref;
}

std::string TestEditChainCompletes(const WaveqClient& client, const std::string& source) {
  SubmitRequest req;
  req.set_client_id("e2e");
  req.set_priority_name("high");
  req.add_sources(source);
  SetString(AddOp(&req, "convert_format"), "format", "mp3");
  AddOp(&req, "normalize");
  auto* trim = AddOp(&req, "trim");
  SetNumber(trim, "start_ms", 0);
  SetNumber(trim, "end_ms", 5000);

  auto submitted = client.Submit(req);
  assert(submitted.ok());
  assert(submitted->priority() == 2);
  assert(submitted->operations(0).kind() == OPERATION_KIND_TRIM);
  assert(submitted->operations(2).kind() == OPERATION_KIND_CONVERT_FORMAT);

  auto terminal = client.WaitForTerminal(submitted->id(), kWaitMs);
  assert(terminal.ok());
  assert(terminal->status() == REQUEST_STATUS_COMPLETED);
  assert(terminal->total_steps() == 3);

  auto record = client.Get(submitted->id());
  assert(record.ok());
  assert(record->status() == REQUEST_STATUS_COMPLETED);
  assert(!record->result_ref().empty());
  assert(record->result_ref().substr(record->result_ref().size() - 4) == ".wav");
  assert(record->description().find("requested mp3") != std::string::npos);
  assert(!record->has_error());

  auto bytes = client.FetchResult(submitted->id());
  assert(bytes.ok());
  auto audio = waveq::audio::DecodeWav(**bytes);
  assert(std::abs(audio.DurationMs() - 5000.0) < 1.0);

  return submitted->id();
}

void TestInstructionOnlySubmission(const WaveqClient& client, const std::string& source) {
  SubmitRequest req;
  req.set_client_id("e2e");
  req.add_sources(source);
  req.set_instruction("Fade out over 2 seconds");

  auto submitted = client.Submit(req);
  assert(submitted.ok());
  assert(submitted->operations_size() == 1);
  assert(submitted->operations(0).kind() == OPERATION_KIND_FADE_OUT);

  auto terminal = client.WaitForTerminal(submitted->id(), kWaitMs);
  assert(terminal.ok());
  assert(terminal->status() == REQUEST_STATUS_COMPLETED);
}

void TestExecutionFailureIsReported(const WaveqClient& client, const std::string& source) {
  SubmitRequest req;
  req.set_client_id("e2e");
  req.add_sources(source);
  auto* trim = AddOp(&req, "trim");
  SetNumber(trim, "start_ms", 60000);
  SetNumber(trim, "end_ms", 70000);
  AddOp(&req, "normalize");

  auto submitted = client.Submit(req);
  assert(submitted.ok());

  auto terminal = client.WaitForTerminal(submitted->id(), kWaitMs);
  assert(terminal.ok());
  assert(terminal->status() == REQUEST_STATUS_ERROR);
  assert(terminal->error().kind() == ERROR_KIND_EXECUTION);
  assert(terminal->error().operation_index() == 0);
  assert(terminal->error().operation_kind() == OPERATION_KIND_TRIM);

  auto bytes = client.FetchResult(submitted->id());
  assert(!bytes.ok());
}

void TestValidationAndLookupErrors(const WaveqClient& client, const std::string& source) {
  SubmitRequest req;
  req.add_sources(source);
  SetNumber(AddOp(&req, "pitch"), "semitones", 99);

  auto rejected = client.Submit(req);
  assert(!rejected.ok());
  assert(rejected.status().IsInvalid());

  auto missing = client.Get("REQ-999999");
  assert(!missing.ok());
  assert(missing.status().IsKeyError());
}

void TestStatsAndDelete(const WaveqClient& client, const std::string& completed_id) {
  auto stats = client.Stats();
  assert(stats.ok());
  assert(stats->total() == 3);
  assert(stats->completed() == 2);
  assert(stats->failed() == 1);
  assert(stats->queue_depth() == 0);

  ListRequestsRequest list;
  list.set_client_id("e2e");
  auto listed = client.List(list);
  assert(listed.ok());
  assert(listed->requests_size() == 3);

  assert(client.Delete(completed_id).ok());
  assert(client.Get(completed_id).status().IsKeyError());
}

} // namespace

int main() {
  auto config = waveq::config::ConfigLoader::LoadFromString(R"(
server:
  bind_address: 127.0.0.1:0
workers:
  threads: 2
execution:
  max_attempts: 1
)");

  auto                   app = waveq::factory::Build(config);
  waveq::runtime::Server server(config.server(), std::move(app.grpc_services));
  app.Start();
  server.Start();

  {
    WaveqClient client(WaveqClient::Connect("127.0.0.1:" + std::to_string(server.port())));

    TestCatalogIsServed(client);
    const auto source = UploadTone(client, 8000);

    const auto completed_id = TestEditChainCompletes(client, source);
    TestInstructionOnlySubmission(client, source);
    TestExecutionFailureIsReported(client, source);
    TestValidationAndLookupErrors(client, source);
    TestStatsAndDelete(client, completed_id);
  }

  server.Stop();
  app.Stop();

  std::cout << "waveq_integration_engine_end_to_end: pass\n";
  return 0;
}
