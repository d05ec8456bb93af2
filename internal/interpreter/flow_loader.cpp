#include "flow_loader.hpp"

#include <google/protobuf/struct.pb.h>

#include <cstdlib>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace waveq::interpreter {

using waveq::engine::v1::SubmitRequest;

FlowLoader::FlowLoader(const catalog::OperationCatalog& catalog) : catalog_(catalog) {
}

SubmitRequest FlowLoader::LoadFile(const std::string& path) const {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ValidationError("failed to load flow " + path + ": " + e.what(), -1, "flow");
  }
  return FromNode(root);
}

SubmitRequest FlowLoader::LoadString(const std::string& yaml) const {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw util::ValidationError(std::string("failed to parse flow: ") + e.what(), -1, "flow");
  }
  return FromNode(root);
}

SubmitRequest FlowLoader::FromNode(const YAML::Node& root) const {
  if (!root.IsMap()) {
    throw util::ValidationError("flow document must be a mapping", -1, "flow");
  }

  SubmitRequest request;

  if (root["workflow_name"]) {
    request.set_description(root["workflow_name"].as<std::string>());
  }
  if (root["description"]) {
    request.set_description(root["description"].as<std::string>());
  }
  if (root["client_id"]) {
    request.set_client_id(root["client_id"].as<std::string>());
  }
  if (root["id"]) {
    request.set_id(root["id"].as<std::string>());
  }
  if (root["instruction"]) {
    request.set_instruction(root["instruction"].as<std::string>());
  }

  if (const auto priority = root["priority"]) {
    const std::string text = priority.as<std::string>();
    char*             end  = nullptr;
    const long        v    = std::strtol(text.c_str(), &end, 10);
    if (!text.empty() && end != nullptr && *end == '\0') {
      request.set_priority(static_cast<int32_t>(v));
    } else {
      request.set_priority_name(text);
    }
  }

  if (const auto sources = root["sources"]) {
    if (!sources.IsSequence()) {
      throw util::ValidationError("sources must be a list", -1, "sources");
    }
    for (const auto& source : sources) {
      request.add_sources(source.as<std::string>());
    }
  }

  const auto steps = root["steps"];
  if (steps && !steps.IsSequence()) {
    throw util::ValidationError("steps must be a list", -1, "steps");
  }

  int index = 0;
  for (const auto& step : steps) {
    const auto type = step["type"];
    if (!type) {
      throw util::ValidationError("step " + std::to_string(index) + " has no type", index, "type");
    }

    const std::string type_name = type.as<std::string>();
    if (!catalog_.Resolve(type_name)) {
      throw util::ValidationError("step " + std::to_string(index) + ": unknown step type '" + type_name + "'", index, "type");
    }

    auto* op = request.add_operations();
    op->set_name(type_name);

    if (const auto parameters = step["parameters"]) {
      if (!parameters.IsMap()) {
        throw util::ValidationError("step " + std::to_string(index) + ": parameters must be a mapping", index, "parameters");
      }
      google::protobuf::Value value;
      config::ConfigLoader::YamlToValue(parameters, &value);
      *op->mutable_parameters() = value.struct_value();
    }

    ++index;
  }

  return request;
}

} // namespace waveq::interpreter
