#include "client/cpp/waveq_client.h"

#include <chrono>
#include <string>
#include <string_view>

#include <arrow/status.h>
#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/channel_arguments.h>

namespace waveq::engine::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  if (status.error_code() == grpc::StatusCode::INVALID_ARGUMENT) {
    return arrow::Status::Invalid(std::string(action), " rejected: ", status.error_message());
  }
  if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
    return arrow::Status::KeyError(std::string(action), ": ", status.error_message());
  }
  return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
}

bool IsTerminal(waveq::engine::v1::RequestStatus status) {
  return status == waveq::engine::v1::REQUEST_STATUS_COMPLETED || status == waveq::engine::v1::REQUEST_STATUS_ERROR ||
         status == waveq::engine::v1::REQUEST_STATUS_CANCELLED;
}

} // namespace

std::shared_ptr<grpc::Channel> WaveqClient::Connect(const std::string& target, int max_message_bytes) {
  grpc::ChannelArguments args;
  args.SetMaxReceiveMessageSize(max_message_bytes);
  args.SetMaxSendMessageSize(max_message_bytes);
  return grpc::CreateCustomChannel(target, grpc::InsecureChannelCredentials(), args);
}

WaveqClient::WaveqClient(std::shared_ptr<grpc::Channel> channel)
    : stub_(waveq::engine::v1::RequestService::NewStub(std::move(channel))) {}

arrow::Result<waveq::engine::v1::EditRequest> WaveqClient::Submit(const waveq::engine::v1::SubmitRequest& request) const {
  waveq::engine::v1::SubmitResponse response;
  grpc::ClientContext               ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Submit(&ctx, request, &response), "Submit"));
  return response.request();
}

arrow::Result<waveq::engine::v1::EditRequest> WaveqClient::Get(const std::string& id) const {
  waveq::engine::v1::GetRequestRequest  request;
  waveq::engine::v1::GetRequestResponse response;
  grpc::ClientContext                   ctx;
  request.set_id(id);

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetRequest(&ctx, request, &response), "GetRequest"));
  return response.request();
}

arrow::Result<waveq::engine::v1::ListRequestsResponse> WaveqClient::List(const waveq::engine::v1::ListRequestsRequest& request) const {
  waveq::engine::v1::ListRequestsResponse response;
  grpc::ClientContext                     ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->ListRequests(&ctx, request, &response), "ListRequests"));
  return response;
}

arrow::Result<waveq::engine::v1::EditRequest> WaveqClient::Cancel(const std::string& id) const {
  waveq::engine::v1::CancelRequestRequest  request;
  waveq::engine::v1::CancelRequestResponse response;
  grpc::ClientContext                      ctx;
  request.set_id(id);

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->CancelRequest(&ctx, request, &response), "CancelRequest"));
  return response.request();
}

arrow::Status WaveqClient::Delete(const std::string& id) const {
  waveq::engine::v1::DeleteRequestRequest request;
  google::protobuf::Empty                 response;
  grpc::ClientContext                     ctx;
  request.set_id(id);

  return GrpcToArrow(stub_->DeleteRequest(&ctx, request, &response), "DeleteRequest");
}

arrow::Result<waveq::engine::v1::StatsResponse> WaveqClient::Stats() const {
  waveq::engine::v1::StatsRequest  request;
  waveq::engine::v1::StatsResponse response;
  grpc::ClientContext              ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetStats(&ctx, request, &response), "GetStats"));
  return response;
}

arrow::Result<waveq::engine::v1::DescribeOperationsResponse> WaveqClient::DescribeOperations() const {
  waveq::engine::v1::DescribeOperationsRequest  request;
  waveq::engine::v1::DescribeOperationsResponse response;
  grpc::ClientContext                           ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->DescribeOperations(&ctx, request, &response), "DescribeOperations"));
  return response;
}

arrow::Result<std::string> WaveqClient::UploadAudio(const std::shared_ptr<arrow::Buffer>& audio) const {
  if (!audio) {
    return arrow::Status::Invalid("UploadAudio: buffer is null");
  }

  waveq::engine::v1::UploadAudioRequest  request;
  waveq::engine::v1::UploadAudioResponse response;
  grpc::ClientContext                    ctx;
  request.set_data(audio->ToString());

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->UploadAudio(&ctx, request, &response), "UploadAudio"));
  return response.source_ref();
}

arrow::Result<std::shared_ptr<arrow::Buffer>> WaveqClient::FetchResult(const std::string& id) const {
  waveq::engine::v1::FetchResultRequest  request;
  waveq::engine::v1::FetchResultResponse response;
  grpc::ClientContext                    ctx;
  request.set_id(id);

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->FetchResult(&ctx, request, &response), "FetchResult"));
  return std::shared_ptr<arrow::Buffer>(arrow::Buffer::FromString(std::move(*response.mutable_data())));
}

std::unique_ptr<grpc::ClientReader<waveq::engine::v1::StatusEvent>> WaveqClient::WatchStatus(const std::string& id,
                                                                                              grpc::ClientContext* context) const {
  waveq::engine::v1::WatchStatusRequest request;
  request.set_id(id);
  return stub_->WatchStatus(context, request);
}

arrow::Result<waveq::engine::v1::StatusEvent> WaveqClient::WaitForTerminal(const std::string& id, uint64_t timeout_ms) const {
  grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(timeout_ms));

  auto                           reader = WatchStatus(id, &ctx);
  waveq::engine::v1::StatusEvent event;
  bool                           terminal = false;
  while (reader->Read(&event)) {
    if (IsTerminal(event.status())) {
      terminal = true;
      break;
    }
  }
  if (terminal) {
    ctx.TryCancel();
  }

  auto status = reader->Finish();
  if (terminal) {
    return event;
  }
  ARROW_RETURN_NOT_OK(GrpcToArrow(status, "WatchStatus"));
  return arrow::Status::IOError("WatchStatus ended before request ", id, " reached a terminal state");
}

} // namespace waveq::engine::client
