#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace waveq::runtime {

class Server {
public:
  Server(const waveq::runtime::config::ServerConfig& config, std::vector<std::unique_ptr<grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound; differs from the configured one when it was 0.
  int port() const {
    return selected_port_;
  }

private:
  std::string bind_address_;
  int max_message_bytes_;
  std::vector<std::unique_ptr<grpc::Service>> services_;
  std::unique_ptr<grpc::Server> grpc_server_;
  int selected_port_ = 0;
};

} // namespace waveq::runtime
