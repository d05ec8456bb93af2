#pragma once

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <grpcpp/channel.h>
#include <grpcpp/support/sync_stream.h>

#include <cstdint>
#include <memory>
#include <string>

#include "waveq/engine/v1.hpp"

namespace waveq::engine::client {

/*
  Synchronous client for the edit request engine.

  Failures come back as arrow::Status carrying the gRPC message. Audio is
  exchanged as Arrow buffers holding encoded bytes.
*/
class WaveqClient {
 public:
  explicit WaveqClient(std::shared_ptr<grpc::Channel> channel);

  // Insecure channel whose message limit matches the engine's default, so
  // long recordings can be uploaded and fetched in one call.
  static std::shared_ptr<grpc::Channel> Connect(const std::string& target, int max_message_bytes = 64 * 1024 * 1024);

  arrow::Result<waveq::engine::v1::EditRequest> Submit(const waveq::engine::v1::SubmitRequest& request) const;

  arrow::Result<waveq::engine::v1::EditRequest> Get(const std::string& id) const;

  arrow::Result<waveq::engine::v1::ListRequestsResponse> List(const waveq::engine::v1::ListRequestsRequest& request) const;

  arrow::Result<waveq::engine::v1::EditRequest> Cancel(const std::string& id) const;

  arrow::Status Delete(const std::string& id) const;

  arrow::Result<waveq::engine::v1::StatsResponse> Stats() const;

  arrow::Result<waveq::engine::v1::DescribeOperationsResponse> DescribeOperations() const;

  // Returns the source_ref to put in SubmitRequest.sources.
  arrow::Result<std::string> UploadAudio(const std::shared_ptr<arrow::Buffer>& audio) const;

  arrow::Result<std::shared_ptr<arrow::Buffer>> FetchResult(const std::string& id) const;

  std::unique_ptr<grpc::ClientReader<waveq::engine::v1::StatusEvent>> WatchStatus(const std::string& id, grpc::ClientContext* context) const;

  // Follows the status stream until a terminal event; returns that event.
  arrow::Result<waveq::engine::v1::StatusEvent> WaitForTerminal(const std::string& id, uint64_t timeout_ms) const;

 private:
  std::unique_ptr<waveq::engine::v1::RequestService::Stub> stub_;
};

} // namespace waveq::engine::client
