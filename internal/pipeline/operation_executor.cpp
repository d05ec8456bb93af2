#include "operation_executor.hpp"

#include "internal/util/errors.hpp"

namespace waveq::pipeline {

audio::AudioBuffer ExecutionContext::LoadSource(std::size_t index) const {
  if (index >= sources.size()) {
    throw util::NotFound("request " + request_id + " has no source #" + std::to_string(index));
  }
  if (!store) {
    throw std::runtime_error("execution context has no audio store");
  }

  auto bytes = store->Get(sources[index]);
  return audio::DecodeWav(*bytes);
}

double NumberParam(const google::protobuf::Struct& parameters, const std::string& key, double def) {
  auto it = parameters.fields().find(key);
  if (it == parameters.fields().end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) {
    return def;
  }
  return it->second.number_value();
}

std::string StringParam(const google::protobuf::Struct& parameters, const std::string& key, const std::string& def) {
  auto it = parameters.fields().find(key);
  if (it == parameters.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return def;
  }
  return it->second.string_value();
}

} // namespace waveq::pipeline
