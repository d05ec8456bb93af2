#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/waveq_client.h"
#include "waveq/engine/v1.hpp"

int main(int argc, char** argv) {
  // Allow optional endpoint override for local/remote diagnostics.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  waveq::engine::client::WaveqClient client(waveq::engine::client::WaveqClient::Connect(target));

  auto result = client.Stats();
  if (!result.ok()) {
    std::cerr << "GetStats RPC failed: " << result.status().ToString() << '\n';
    return 1;
  }

  const auto& stats = result.ValueOrDie();
  std::cout << "WaveQ engine stats for " << target << '\n';
  std::cout << "requests: total=" << stats.total() << ", queued=" << stats.queued() << ", processing=" << stats.processing()
            << ", completed=" << stats.completed() << ", failed=" << stats.failed() << ", cancelled=" << stats.cancelled() << '\n';
  std::cout << "avg processing: " << stats.avg_processing_ms() << " ms, success rate: " << stats.success_rate() * 100.0 << "%\n";
  std::cout << "queue depth: " << stats.queue_depth() << '\n';

  return 0;
}
