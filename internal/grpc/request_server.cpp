#include "request_server.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "grpc_error.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/status/status_publisher.hpp"
#include "internal/status/transport.hpp"

namespace waveq::grpc {

using namespace waveq::engine::v1;

namespace {

constexpr auto kWatchPollInterval = std::chrono::milliseconds(250);

// Events handed over from the publishing thread to the stream writer.
struct WatchQueue {
  std::mutex              mutex;
  std::condition_variable cv;
  std::deque<StatusEvent> events;
};

} // namespace

RequestServer::RequestServer(std::shared_ptr<waveq::service::RequestService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RequestServer::Submit(::grpc::ServerContext*,
                                     const SubmitRequest* req,
                                     SubmitResponse* resp) {
  try {
    *resp = service_->Submit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequestServer::GetRequest(::grpc::ServerContext*,
                                         const GetRequestRequest* req,
                                         GetRequestResponse* resp) {
  try {
    *resp = service_->GetRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequestServer::ListRequests(::grpc::ServerContext*,
                                           const ListRequestsRequest* req,
                                           ListRequestsResponse* resp) {
  try {
    *resp = service_->List(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequestServer::CancelRequest(::grpc::ServerContext*,
                                            const CancelRequestRequest* req,
                                            CancelRequestResponse* resp) {
  try {
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequestServer::DeleteRequest(::grpc::ServerContext*,
                                            const DeleteRequestRequest* req,
                                            google::protobuf::Empty*) {
  try {
    service_->Delete(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequestServer::GetStats(::grpc::ServerContext*,
                                       const StatsRequest* req,
                                       StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequestServer::DescribeOperations(::grpc::ServerContext*,
                                                 const DescribeOperationsRequest* req,
                                                 DescribeOperationsResponse* resp) {
  try {
    *resp = service_->DescribeOperations(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequestServer::UploadAudio(::grpc::ServerContext*,
                                          const UploadAudioRequest* req,
                                          UploadAudioResponse* resp) {
  try {
    *resp = service_->UploadAudio(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequestServer::FetchResult(::grpc::ServerContext*,
                                          const FetchResultRequest* req,
                                          FetchResultResponse* resp) {
  try {
    *resp = service_->FetchResult(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequestServer::WatchStatus(::grpc::ServerContext* context,
                                          const WatchStatusRequest* req,
                                          ::grpc::ServerWriter<StatusEvent>* writer) {
  const auto& transport = service_->context().transport;
  if (!transport) {
    return {::grpc::StatusCode::UNAVAILABLE, "status channel is not configured"};
  }

  // Subscribe before taking the snapshot so no transition falls in between.
  auto queue        = std::make_shared<WatchQueue>();
  auto subscription = transport->Subscribe(waveq::status::StatusPublisher::Topic(req->id()),
                                           [queue](const std::string&, const std::string& payload) {
                                             auto event = waveq::status::StatusPublisher::FromJson(payload);
                                             {
                                               std::lock_guard lock(queue->mutex);
                                               queue->events.push_back(std::move(event));
                                             }
                                             queue->cv.notify_one();
                                           });

  ::grpc::Status status = ::grpc::Status::OK;
  try {
    auto snapshot = service_->Snapshot(req->id());
    bool done     = waveq::model::IsTerminal(snapshot.status());
    if (!writer->Write(snapshot)) {
      done = true;
    }

    while (!done && !context->IsCancelled()) {
      std::deque<StatusEvent> batch;
      {
        std::unique_lock lock(queue->mutex);
        queue->cv.wait_for(lock, kWatchPollInterval, [&] { return !queue->events.empty(); });
        batch.swap(queue->events);
      }

      for (const auto& event : batch) {
        // the snapshot may already be newer than queued events
        if (event.updated_at_ms() < snapshot.updated_at_ms()) {
          continue;
        }
        if (!writer->Write(event)) {
          done = true;
          break;
        }
        if (waveq::model::IsTerminal(event.status())) {
          done = true;
          break;
        }
      }
    }
  } catch (const std::exception& e) {
    status = ToStatus(e);
  }

  transport->Unsubscribe(subscription);
  return status;
}

} // namespace waveq::grpc
