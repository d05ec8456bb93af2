#pragma once

#include "internal/db/model/request_record.hpp"
#include "service_context.hpp"
#include "waveq/engine/v1.hpp"

namespace waveq::service {

waveq::engine::v1::EditRequest ToProto(const waveq::db::model::RequestRecord& record);

/*
  Request lifecycle API: submission through retrieval of results.

  Everything here is synchronous; execution happens on the worker pool and
  is observed through the store or the status channel.
*/
class RequestService {
public:
  explicit RequestService(ServiceContext ctx);

  waveq::engine::v1::SubmitResponse Submit(const waveq::engine::v1::SubmitRequest& req);

  waveq::engine::v1::GetRequestResponse GetRequest(const waveq::engine::v1::GetRequestRequest& req);

  waveq::engine::v1::ListRequestsResponse List(const waveq::engine::v1::ListRequestsRequest& req);

  waveq::engine::v1::CancelRequestResponse Cancel(const waveq::engine::v1::CancelRequestRequest& req);

  // Terminal requests only; the stored result goes with the record.
  void Delete(const waveq::engine::v1::DeleteRequestRequest& req);

  waveq::engine::v1::StatsResponse Stats(const waveq::engine::v1::StatsRequest& req);

  waveq::engine::v1::DescribeOperationsResponse DescribeOperations(const waveq::engine::v1::DescribeOperationsRequest& req);

  waveq::engine::v1::UploadAudioResponse UploadAudio(const waveq::engine::v1::UploadAudioRequest& req);

  waveq::engine::v1::FetchResultResponse FetchResult(const waveq::engine::v1::FetchResultRequest& req);

  // Snapshot used to seed a status stream.
  waveq::engine::v1::StatusEvent Snapshot(const std::string& id);

  const ServiceContext& context() const {
    return ctx_;
  }

private:
  ServiceContext ctx_;
};

}
