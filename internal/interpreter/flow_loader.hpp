#pragma once

#include <yaml-cpp/yaml.h>

#include <string>

#include "internal/catalog/operation_catalog.hpp"
#include "waveq/engine/v1/request_service.pb.h"

namespace waveq::interpreter {

/*
  YAML workflow files:

    workflow_name: podcast-cleanup
    client_id: studio-a
    priority: high          # integer 1..5 or a priority name
    sources: [src-1]
    steps:
      - name: tidy
        type: noise_reduction
        parameters: {strength: 0.4}

  Step types must resolve in the catalog; parameters are checked later by
  the interpreter at submission.
*/
class FlowLoader {
 public:
  explicit FlowLoader(const catalog::OperationCatalog& catalog);

  waveq::engine::v1::SubmitRequest LoadFile(const std::string& path) const;
  waveq::engine::v1::SubmitRequest LoadString(const std::string& yaml) const;

 private:
  waveq::engine::v1::SubmitRequest FromNode(const YAML::Node& root) const;

  const catalog::OperationCatalog& catalog_;
};

} // namespace waveq::interpreter
