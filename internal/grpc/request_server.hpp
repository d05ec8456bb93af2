#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/request_service.hpp"
#include "waveq/engine/v1.hpp"

namespace waveq::grpc {

class RequestServer final : public waveq::engine::v1::RequestService::Service {
public:
  explicit RequestServer(std::shared_ptr<waveq::service::RequestService> svc);

  ::grpc::Status Submit(::grpc::ServerContext*,
                        const waveq::engine::v1::SubmitRequest*,
                        waveq::engine::v1::SubmitResponse*) override;

  ::grpc::Status GetRequest(::grpc::ServerContext*,
                            const waveq::engine::v1::GetRequestRequest*,
                            waveq::engine::v1::GetRequestResponse*) override;

  ::grpc::Status ListRequests(::grpc::ServerContext*,
                              const waveq::engine::v1::ListRequestsRequest*,
                              waveq::engine::v1::ListRequestsResponse*) override;

  ::grpc::Status CancelRequest(::grpc::ServerContext*,
                               const waveq::engine::v1::CancelRequestRequest*,
                               waveq::engine::v1::CancelRequestResponse*) override;

  ::grpc::Status DeleteRequest(::grpc::ServerContext*,
                               const waveq::engine::v1::DeleteRequestRequest*,
                               google::protobuf::Empty*) override;

  ::grpc::Status GetStats(::grpc::ServerContext*,
                          const waveq::engine::v1::StatsRequest*,
                          waveq::engine::v1::StatsResponse*) override;

  ::grpc::Status DescribeOperations(::grpc::ServerContext*,
                                    const waveq::engine::v1::DescribeOperationsRequest*,
                                    waveq::engine::v1::DescribeOperationsResponse*) override;

  ::grpc::Status UploadAudio(::grpc::ServerContext*,
                             const waveq::engine::v1::UploadAudioRequest*,
                             waveq::engine::v1::UploadAudioResponse*) override;

  ::grpc::Status FetchResult(::grpc::ServerContext*,
                             const waveq::engine::v1::FetchResultRequest*,
                             waveq::engine::v1::FetchResultResponse*) override;

  // Snapshot first, then every event on audio/status/<id> until terminal.
  ::grpc::Status WatchStatus(::grpc::ServerContext*,
                             const waveq::engine::v1::WatchStatusRequest*,
                             ::grpc::ServerWriter<waveq::engine::v1::StatusEvent>*) override;

private:
  std::shared_ptr<waveq::service::RequestService> service_;
};

} // namespace waveq::grpc
