#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace waveq::runtime {

namespace {

constexpr auto kShutdownGrace = std::chrono::seconds(5);

}

Server::Server(const waveq::runtime::config::ServerConfig& config, std::vector<std::unique_ptr<grpc::Service>> services)
    : bind_address_(config.bind_address()),
      max_message_bytes_(config.max_message_bytes() == 0 ? -1 : static_cast<int>(config.max_message_bytes())),
      services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, grpc::InsecureServerCredentials(), &selected_port_);
  builder.SetMaxReceiveMessageSize(max_message_bytes_);
  builder.SetMaxSendMessageSize(max_message_bytes_);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  WAVEQ_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_),
                                           observability::IntField("port", selected_port_),
                                           observability::IntField("max_message_bytes", max_message_bytes_)});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    // open WatchStatus streams are cut off after the grace period
    grpc_server_->Shutdown(std::chrono::system_clock::now() + kShutdownGrace);
    grpc_server_.reset();
  }
}

} // namespace waveq::runtime
