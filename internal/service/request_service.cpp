#include "request_service.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "internal/audio/audio_buffer.hpp"
#include "internal/catalog/operation_catalog.hpp"
#include "internal/interpreter/instruction_interpreter.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduler/request_scheduler.hpp"
#include "internal/status/status_publisher.hpp"
#include "internal/storage/audio_store.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/store/request_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace waveq::service {

using namespace waveq::engine::v1;

namespace {

constexpr std::size_t kDefaultListLimit = 100;
constexpr const char* kAnonymousClient  = "anonymous";

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string* request_id, Fn&& fn) {
  waveq::observability::SpanScope span(route, request_id ? std::string_view(*request_id) : std::string_view());

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      waveq::observability::Metrics::Instance().RecordRequest(route, true);
      waveq::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return;
    } else {
      auto result = fn();
      waveq::observability::Metrics::Instance().RecordRequest(route, true);
      waveq::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    WAVEQ_LOG_WARN("RPC failed", {waveq::observability::StringField("route", route), waveq::observability::StringField("error", ex.what()),
                                  waveq::observability::RequestField(request_id ? *request_id : std::string())});
    waveq::observability::Metrics::Instance().RecordRequest(route, false);
    waveq::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

void RequireId(const std::string& id) {
  if (id.empty()) {
    throw waveq::util::ValidationError("request id is required", -1, "id");
  }
}

} // namespace

EditRequest ToProto(const waveq::db::model::RequestRecord& record) {
  EditRequest out;
  out.set_id(record.id);
  out.set_client_id(record.client_id);
  for (const auto& source : record.sources) {
    out.add_sources(source);
  }
  for (const auto& op : record.operations) {
    *out.add_operations() = op;
  }
  out.set_priority(record.priority);
  out.set_status(record.status);
  out.set_created_at_ms(record.created_at_ms);
  out.set_updated_at_ms(record.updated_at_ms);
  out.set_result_ref(record.result_ref);
  if (record.error) {
    *out.mutable_error() = *record.error;
  }
  out.set_instruction(record.instruction);
  out.set_description(record.description);
  out.set_processing_ms(record.processing_ms);
  return out;
}

RequestService::RequestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitResponse RequestService::Submit(const SubmitRequest& req) {
  return ObserveRpc("RequestService.Submit", &req.id(), [&] {
    waveq::interpreter::RawSubmission submission;
    submission.operations.assign(req.operations().begin(), req.operations().end());
    submission.instruction = req.instruction();
    submission.sources.assign(req.sources().begin(), req.sources().end());
    submission.priority      = req.priority();
    submission.priority_name = req.priority_name();

    auto interpretation = ctx_.interpreter->Interpret(submission);

    waveq::db::model::RequestRecord record;
    record.id          = req.id();
    record.client_id   = req.client_id().empty() ? kAnonymousClient : req.client_id();
    record.sources     = std::move(submission.sources);
    record.operations  = std::move(interpretation.operations);
    record.priority    = interpretation.priority;
    record.instruction = req.instruction();
    record.description = req.description();

    auto admitted = ctx_.scheduler->Admit(std::move(record));

    WAVEQ_LOG_INFO("Request admitted", {waveq::observability::RequestField(admitted.id),
                                        waveq::observability::StringField("client_id", admitted.client_id),
                                        waveq::observability::IntField("priority", admitted.priority),
                                        waveq::observability::IntField("operations", static_cast<int64_t>(admitted.operations.size()))});

    SubmitResponse resp;
    *resp.mutable_request() = ToProto(admitted);
    return resp;
  });
}

GetRequestResponse RequestService::GetRequest(const GetRequestRequest& req) {
  return ObserveRpc("RequestService.GetRequest", &req.id(), [&] {
    RequireId(req.id());
    GetRequestResponse resp;
    *resp.mutable_request() = ToProto(ctx_.store->Get(req.id()));
    return resp;
  });
}

ListRequestsResponse RequestService::List(const ListRequestsRequest& req) {
  return ObserveRpc("RequestService.ListRequests", nullptr, [&] {
    waveq::db::RequestFilter filter;
    if (!req.client_id().empty()) {
      filter.client_id = req.client_id();
    }
    if (req.status() != REQUEST_STATUS_UNSPECIFIED) {
      filter.status = req.status();
    }
    filter.limit = req.limit() > 0 ? req.limit() : kDefaultListLimit;

    ListRequestsResponse resp;
    for (const auto& record : ctx_.store->List(filter)) {
      *resp.add_requests() = ToProto(record);
    }
    return resp;
  });
}

CancelRequestResponse RequestService::Cancel(const CancelRequestRequest& req) {
  return ObserveRpc("RequestService.CancelRequest", &req.id(), [&] {
    RequireId(req.id());
    CancelRequestResponse resp;
    *resp.mutable_request() = ToProto(ctx_.store->Cancel(req.id()));
    return resp;
  });
}

void RequestService::Delete(const DeleteRequestRequest& req) {
  ObserveRpc("RequestService.DeleteRequest", &req.id(), [&] {
    RequireId(req.id());
    auto removed = ctx_.store->Delete(req.id());
    if (!removed.result_ref.empty()) {
      ctx_.audio_store->Delete(removed.result_ref);
    }
  });
}

StatsResponse RequestService::Stats(const StatsRequest&) {
  return ObserveRpc("RequestService.GetStats", nullptr, [&] {
    waveq::db::RequestFilter filter;
    filter.limit = 0;

    StatsResponse resp;
    uint64_t      processing_total = 0;
    for (const auto& record : ctx_.store->List(filter)) {
      resp.set_total(resp.total() + 1);
      switch (record.status) {
        case REQUEST_STATUS_QUEUED:
          resp.set_queued(resp.queued() + 1);
          break;
        case REQUEST_STATUS_PROCESSING:
          resp.set_processing(resp.processing() + 1);
          break;
        case REQUEST_STATUS_COMPLETED:
          resp.set_completed(resp.completed() + 1);
          processing_total += record.processing_ms;
          break;
        case REQUEST_STATUS_ERROR:
          resp.set_failed(resp.failed() + 1);
          processing_total += record.processing_ms;
          break;
        case REQUEST_STATUS_CANCELLED:
          resp.set_cancelled(resp.cancelled() + 1);
          break;
        default:
          break;
      }
    }

    const uint64_t finished = resp.completed() + resp.failed();
    if (finished > 0) {
      resp.set_avg_processing_ms(static_cast<double>(processing_total) / static_cast<double>(finished));
      resp.set_success_rate(static_cast<double>(resp.completed()) / static_cast<double>(finished));
    }
    resp.set_queue_depth(ctx_.scheduler->Depth());
    return resp;
  });
}

DescribeOperationsResponse RequestService::DescribeOperations(const DescribeOperationsRequest&) {
  return ObserveRpc("RequestService.DescribeOperations", nullptr, [&] {
    DescribeOperationsResponse resp;
    for (const auto& entry : ctx_.catalog->Entries()) {
      *resp.add_operations() = ctx_.catalog->Describe(entry.kind);
    }
    return resp;
  });
}

UploadAudioResponse RequestService::UploadAudio(const UploadAudioRequest& req) {
  return ObserveRpc("RequestService.UploadAudio", nullptr, [&] {
    if (req.data().empty()) {
      throw waveq::util::ValidationError("audio data is empty", -1, "data");
    }

    auto buffer = waveq::storage::common::CopyToBuffer(req.data());
    try {
      (void)waveq::audio::DecodeWav(*buffer);
    } catch (const std::invalid_argument& ex) {
      throw waveq::util::ValidationError(std::string("unsupported audio: ") + ex.what(), -1, "data");
    }

    const std::string ref = waveq::util::GenerateRef("source");
    ctx_.audio_store->Put(ref, buffer);

    WAVEQ_LOG_INFO("Audio uploaded", {waveq::observability::StringField("source_ref", ref),
                                      waveq::observability::IntField("bytes", static_cast<int64_t>(buffer->size()))});

    UploadAudioResponse resp;
    resp.set_source_ref(ref);
    return resp;
  });
}

FetchResultResponse RequestService::FetchResult(const FetchResultRequest& req) {
  return ObserveRpc("RequestService.FetchResult", &req.id(), [&] {
    RequireId(req.id());
    auto record = ctx_.store->Get(req.id());
    if (record.status != REQUEST_STATUS_COMPLETED || record.result_ref.empty()) {
      throw waveq::util::InvalidState("request " + record.id + " is " + waveq::model::StatusName(record.status) + ", no result available");
    }

    auto buffer = ctx_.audio_store->Get(record.result_ref);

    FetchResultResponse resp;
    resp.set_result_ref(record.result_ref);
    resp.set_data(waveq::storage::common::BufferToString(*buffer));
    return resp;
  });
}

StatusEvent RequestService::Snapshot(const std::string& id) {
  RequireId(id);
  auto record = ctx_.store->Get(id);
  return waveq::status::StatusPublisher::BuildEvent(record, ctx_.store->CurrentStep(id));
}

}
