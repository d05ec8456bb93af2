#include <google/protobuf/struct.pb.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "client/cpp/waveq_client.h"
#include "waveq/engine/v1.hpp"

namespace {

// One second of a 440 Hz tone as 16-bit mono PCM WAV.
std::shared_ptr<arrow::Buffer> MakeTone() {
  constexpr uint32_t kRate   = 44100;
  constexpr uint32_t kFrames = kRate;

  std::vector<int16_t> pcm(kFrames);
  for (uint32_t i = 0; i < kFrames; ++i) {
    pcm[i] = static_cast<int16_t>(8000.0 * std::sin(2.0 * M_PI * 440.0 * i / kRate));
  }

  auto put32 = [](std::string& out, uint32_t v) { out.append(reinterpret_cast<const char*>(&v), 4); };
  auto put16 = [](std::string& out, uint16_t v) { out.append(reinterpret_cast<const char*>(&v), 2); };

  const uint32_t data_bytes = kFrames * 2;
  std::string    wav        = "RIFF";
  put32(wav, 36 + data_bytes);
  wav += "WAVEfmt ";
  put32(wav, 16);
  put16(wav, 1);
  put16(wav, 1);
  put32(wav, kRate);
  put32(wav, kRate * 2);
  put16(wav, 2);
  put16(wav, 16);
  wav += "data";
  put32(wav, data_bytes);
  wav.append(reinterpret_cast<const char*>(pcm.data()), data_bytes);
  return arrow::Buffer::FromString(std::move(wav));
}

waveq::engine::v1::RawOperation Op(const std::string& name, std::initializer_list<std::pair<const char*, double>> params) {
  waveq::engine::v1::RawOperation op;
  op.set_name(name);
  for (const auto& [key, value] : params) {
    (*op.mutable_parameters()->mutable_fields())[key].set_number_value(value);
  }
  return op;
}

} // namespace

int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";
  const std::string output = argc > 2 ? argv[2] : "edited.wav";

  waveq::engine::client::WaveqClient client(waveq::engine::client::WaveqClient::Connect(target));

  auto source = client.UploadAudio(MakeTone());
  if (!source.ok()) {
    std::cerr << source.status().ToString() << '\n';
    return 1;
  }

  // Submitted out of order; the engine runs trim before normalize.
  waveq::engine::v1::SubmitRequest req;
  req.set_client_id("example");
  req.add_sources(*source);
  *req.add_operations() = Op("normalize", {{"target_db", -1.0}});
  *req.add_operations() = Op("cut", {{"start_ms", 100.0}, {"end_ms", 900.0}});
  *req.add_operations() = Op("fade_out", {{"duration_ms", 200.0}});
  req.set_priority_name("high");

  auto submitted = client.Submit(req);
  if (!submitted.ok()) {
    std::cerr << submitted.status().ToString() << '\n';
    return 1;
  }
  std::cout << "submitted " << submitted->id() << " with " << submitted->operations_size() << " operations\n";

  auto final_event = client.WaitForTerminal(submitted->id(), 30000);
  if (!final_event.ok()) {
    std::cerr << final_event.status().ToString() << '\n';
    return 1;
  }
  if (final_event->status() != waveq::engine::v1::REQUEST_STATUS_COMPLETED) {
    std::cerr << "request ended with error: " << final_event->error().message() << '\n';
    return 1;
  }

  auto audio = client.FetchResult(submitted->id());
  if (!audio.ok()) {
    std::cerr << audio.status().ToString() << '\n';
    return 1;
  }

  std::ofstream out(output, std::ios::binary);
  out.write(reinterpret_cast<const char*>((*audio)->data()), (*audio)->size());
  std::cout << "wrote " << (*audio)->size() << " bytes to " << output << '\n';
  return 0;
}
