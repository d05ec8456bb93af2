#include "pipeline_executor.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include "internal/catalog/operation_catalog.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace waveq::pipeline {

using db::model::RequestRecord;
using observability::IntField;
using observability::RequestField;
using observability::StringField;
using namespace waveq::engine::v1;

namespace {

constexpr int kAttemptRunning   = 0;
constexpr int kAttemptDone      = 1;
constexpr int kAttemptAbandoned = 2;

uint64_t ElapsedMs(std::chrono::steady_clock::time_point start) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

std::string KindName(OperationKind kind) {
  return std::string(catalog::OperationCatalog::Default().Name(kind));
}

// Results are always WAV; a different requested container is noted on the
// record instead of in the key.
std::string DescribeDelivery(const std::string& description, const audio::AudioBuffer& audio) {
  if (audio.format.empty() || audio.format == "wav") {
    return description;
  }
  const std::string note = "delivered as wav; requested " + audio.format + " (" + audio.quality + " quality)";
  return description.empty() ? note : description + " [" + note + "]";
}

} // namespace

PipelineExecutor::PipelineExecutor(std::shared_ptr<store::RequestStore> store, std::shared_ptr<ExecutorRegistry> registry,
                                   std::shared_ptr<storage::AudioStore> audio_store, PipelineOptions options)
    : store_(std::move(store)), registry_(std::move(registry)), audio_store_(std::move(audio_store)), options_(options) {
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
  if (options_.max_abandoned_attempts == 0) {
    options_.max_abandoned_attempts = 1;
  }
}

bool PipelineExecutor::IsCancelled(const std::string& id) {
  auto current = store_->Find(id);
  return !current || current->status == REQUEST_STATUS_CANCELLED;
}

audio::AudioBuffer PipelineExecutor::Attempt(const OperationExecutorPtr& executor, const audio::AudioBuffer& input,
                                             const google::protobuf::Struct& parameters, const ExecutionContext& ctx) {
  if (options_.operation_timeout_ms == 0) {
    return executor->Execute(input, parameters, ctx);
  }

  if (abandoned_->load() >= options_.max_abandoned_attempts) {
    throw util::TransientError("too many timed-out operations still running (" + std::to_string(abandoned_->load()) + ")");
  }

  // The worker thread owns copies of everything it touches, so a timed-out
  // attempt can finish in the background without dangling references.
  auto promise = std::make_shared<std::promise<audio::AudioBuffer>>();
  auto future  = promise->get_future();
  auto state   = std::make_shared<std::atomic<int>>(kAttemptRunning);

  std::thread([executor, input, parameters, ctx, promise, state, abandoned = abandoned_]() {
    try {
      promise->set_value(executor->Execute(input, parameters, ctx));
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
    if (state->exchange(kAttemptDone) == kAttemptAbandoned) {
      --*abandoned;
    }
  }).detach();

  if (future.wait_for(std::chrono::milliseconds(options_.operation_timeout_ms)) == std::future_status::timeout) {
    ++*abandoned_;
    int running = kAttemptRunning;
    if (!state->compare_exchange_strong(running, kAttemptAbandoned)) {
      --*abandoned_; // finished just after the deadline
    }
    throw util::TransientError("operation timed out after " + std::to_string(options_.operation_timeout_ms) + " ms");
  }
  return future.get();
}

uint32_t PipelineExecutor::AbandonedAttempts() const {
  return abandoned_->load();
}

audio::AudioBuffer PipelineExecutor::RunStep(const OperationExecutorPtr& executor, const audio::AudioBuffer& input, const OperationSpec& op,
                                             const ExecutionContext& ctx) {
  const auto kind_name = KindName(op.kind());

  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return Attempt(executor, input, op.parameters(), ctx);
    } catch (const util::TransientError& e) {
      if (attempt >= options_.max_attempts) {
        throw util::ExecutionError(std::string(e.what()) + " (gave up after " + std::to_string(attempt) + " attempts)", ctx.operation_index, op.kind());
      }

      const uint64_t backoff = options_.retry_backoff_ms << (attempt - 1);
      WAVEQ_LOG_WARN("retrying operation", {RequestField(ctx.request_id), IntField("step", ctx.operation_index),
                                             StringField("kind", kind_name), IntField("attempt", attempt), IntField("backoff_ms", static_cast<int64_t>(backoff)),
                                             StringField("error", e.what())});
      observability::Metrics::Instance().RecordOperationRetry(kind_name);
      std::this_thread::sleep_for(std::chrono::milliseconds(backoff));
    }
  }
}

RequestRecord PipelineExecutor::Fail(const RequestRecord& record, int index, OperationKind kind, const std::string& message,
                                     uint64_t processing_ms) {
  WAVEQ_LOG_WARN("request failed", {RequestField(record.id), IntField("step", index), StringField("kind", KindName(kind)),
                                     StringField("error", message)});
  auto failed = store_->TryTransition(record.id, REQUEST_STATUS_PROCESSING, REQUEST_STATUS_ERROR, [&](RequestRecord& r) {
    RequestError error;
    error.set_kind(ERROR_KIND_EXECUTION);
    error.set_message(message);
    error.set_operation_index(index);
    error.set_operation_kind(kind);
    r.error         = error;
    r.processing_ms = processing_ms;
  });
  if (!failed) {
    WAVEQ_LOG_INFO("request left processing before its failure was recorded", {RequestField(record.id)});
    return store_->Get(record.id);
  }
  observability::Metrics::Instance().RecordRequestOutcome("error");
  return *failed;
}

void PipelineExecutor::Abort(const std::string& id, const std::string& message) {
  auto aborted = store_->TryTransition(id, REQUEST_STATUS_PROCESSING, REQUEST_STATUS_ERROR, [&](RequestRecord& r) {
    RequestError error;
    error.set_kind(ERROR_KIND_INTERNAL);
    error.set_message(message);
    error.set_operation_index(-1);
    r.error = error;
  });
  if (aborted) {
    observability::Metrics::Instance().RecordRequestOutcome("error");
  }
}

RequestRecord PipelineExecutor::Run(const RequestRecord& record) {
  observability::SpanScope span("pipeline.run", record.id);
  span.SetAttribute("request.steps", static_cast<int64_t>(record.operations.size()));

  const auto started = std::chrono::steady_clock::now();

  ExecutionContext ctx;
  ctx.request_id = record.id;
  ctx.sources    = record.sources;
  ctx.store      = audio_store_;

  audio::AudioBuffer current;
  try {
    current = ctx.LoadSource(0);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    return Fail(record, -1, OPERATION_KIND_UNSPECIFIED, std::string("load source: ") + e.what(), ElapsedMs(started));
  }

  for (std::size_t i = 0; i < record.operations.size(); ++i) {
    const auto& op    = record.operations[i];
    const int   index = static_cast<int>(i);

    if (IsCancelled(record.id)) {
      WAVEQ_LOG_INFO("request cancelled mid-chain", {RequestField(record.id), IntField("step", index)});
      return store_->Get(record.id);
    }

    auto executor = registry_->Find(op.kind());
    if (!executor) {
      return Fail(record, index, op.kind(), "no executor bound for " + KindName(op.kind()), ElapsedMs(started));
    }

    observability::SpanScope step_span("pipeline.step", record.id);
    step_span.SetAttribute("step.index", static_cast<int64_t>(index));
    step_span.SetAttribute("step.kind", KindName(op.kind()));

    ctx.operation_index   = index;
    const auto step_start = std::chrono::steady_clock::now();
    try {
      current = RunStep(executor, current, op, ctx);
    } catch (const util::ExecutionError& e) {
      step_span.RecordException(e.what());
      return Fail(record, e.operation_index(), e.kind(), e.what(), ElapsedMs(started));
    } catch (const std::exception& e) {
      step_span.RecordException(e.what());
      return Fail(record, index, op.kind(), e.what(), ElapsedMs(started));
    }

    const auto step_ms = ElapsedMs(step_start);
    observability::Metrics::Instance().ObserveOperationDurationMs(KindName(op.kind()), static_cast<double>(step_ms));
    WAVEQ_LOG_DEBUG("step finished", {RequestField(record.id), IntField("step", index), StringField("kind", KindName(op.kind())),
                                      IntField("duration_ms", static_cast<int64_t>(step_ms))});

    store_->MarkStep(record.id, index, op.kind());
  }

  if (IsCancelled(record.id)) {
    return store_->Get(record.id);
  }

  const std::string result_ref = util::GenerateRef("result", "wav");
  try {
    audio_store_->Put(result_ref, audio::EncodeWav(current));
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    return Fail(record, static_cast<int>(record.operations.size()) - 1,
                record.operations.empty() ? OPERATION_KIND_UNSPECIFIED : record.operations.back().kind(), std::string("store result: ") + e.what(),
                ElapsedMs(started));
  }

  const auto processing_ms = ElapsedMs(started);
  auto       completed     = store_->TryTransition(record.id, REQUEST_STATUS_PROCESSING, REQUEST_STATUS_COMPLETED, [&](RequestRecord& r) {
    r.result_ref    = result_ref;
    r.processing_ms = processing_ms;
    r.description   = DescribeDelivery(r.description, current);
  });
  if (!completed) {
    // cancelled while the artifact was written; the result must not outlive it
    audio_store_->Delete(result_ref);
    return store_->Get(record.id);
  }

  observability::Metrics::Instance().RecordRequestOutcome("completed");
  WAVEQ_LOG_INFO("request completed", {RequestField(record.id), StringField("result_ref", result_ref),
                                       IntField("processing_ms", static_cast<int64_t>(processing_ms))});
  return *completed;
}

} // namespace waveq::pipeline
