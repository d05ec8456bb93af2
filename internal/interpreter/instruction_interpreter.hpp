#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "classifier.hpp"
#include "internal/catalog/operation_catalog.hpp"
#include "waveq/engine/v1/types.pb.h"

namespace waveq::interpreter {

struct RawSubmission {
  std::vector<waveq::engine::v1::RawOperation> operations;
  std::string                                  instruction;
  std::vector<std::string>                     sources;

  // 0 means "not given"; priority_name is consulted next.
  int32_t     priority = 0;
  std::string priority_name;
};

struct Interpretation {
  std::vector<waveq::engine::v1::OperationSpec> operations;
  int32_t                                       priority = 3;
};

/*
  Turns a raw submission into a validated, canonically ordered chain.

  Order stages (stable within a stage):
    split/trim < merge < speed/pitch < effects < normalize < convert_format

  Any failure is a util::ValidationError; operation_index refers to the
  caller's original position.
*/
class InstructionInterpreter {
 public:
  InstructionInterpreter(const catalog::OperationCatalog& catalog, std::shared_ptr<Classifier> classifier, int32_t default_priority = 3);

  Interpretation Interpret(const RawSubmission& submission) const;

  std::vector<waveq::engine::v1::OperationSpec> InterpretOperations(const std::vector<waveq::engine::v1::RawOperation>& operations,
                                                                    const std::string& instruction) const;

  int32_t ResolvePriority(int32_t priority, const std::string& priority_name) const;

  static int CanonicalStage(waveq::engine::v1::OperationKind kind);

  static void Canonicalize(std::vector<waveq::engine::v1::OperationSpec>* operations);

 private:
  waveq::engine::v1::OperationSpec Normalize(const waveq::engine::v1::RawOperation& raw, int index) const;

  const catalog::OperationCatalog& catalog_;
  std::shared_ptr<Classifier>      classifier_;
  int32_t                          default_priority_;
};

} // namespace waveq::interpreter
