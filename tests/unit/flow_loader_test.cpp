#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/interpreter/flow_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using waveq::catalog::OperationCatalog;
using waveq::interpreter::FlowLoader;

void TestFullFlowDocument() {
  FlowLoader loader(OperationCatalog::Default());
  auto       request = loader.LoadString(R"(
workflow_name: podcast-cleanup
client_id: studio-a
priority: high
sources: [src-1, src-2]
steps:
  - name: tidy
    type: noise_reduction
    parameters: {strength: 0.4}
  - name: tone
    type: eq
    parameters:
      bands: {"100": -3, "8000": 2}
  - type: convert_format
    parameters: {format: mp3}
)");

  assert(request.description() == "podcast-cleanup");
  assert(request.client_id() == "studio-a");
  assert(request.priority() == 0);
  assert(request.priority_name() == "high");
  assert(request.sources_size() == 2);
  assert(request.operations_size() == 3);

  assert(request.operations(0).name() == "noise_reduction");
  assert(request.operations(0).parameters().fields().at("strength").number_value() == 0.4);

  const auto& bands = request.operations(1).parameters().fields().at("bands").struct_value().fields();
  assert(bands.at("100").number_value() == -3.0);
  assert(bands.at("8000").number_value() == 2.0);

  assert(request.operations(2).parameters().fields().at("format").string_value() == "mp3");
}

void TestNumericPriority() {
  FlowLoader loader(OperationCatalog::Default());
  auto       request = loader.LoadString("priority: 2\nsources: [a]\nsteps:\n  - type: normalize\n");
  assert(request.priority() == 2);
  assert(request.priority_name().empty());
  assert(request.operations(0).parameters().fields().empty());
}

void TestUnknownStepTypeNamesTheStep() {
  FlowLoader loader(OperationCatalog::Default());

  bool thrown = false;
  try {
    loader.LoadString("sources: [a]\nsteps:\n  - type: normalize\n  - type: teleport\n");
  } catch (const waveq::util::ValidationError& e) {
    thrown = true;
    assert(e.operation_index() == 1);
    assert(e.field() == "type");
  }
  assert(thrown);

  thrown = false;
  try {
    loader.LoadString("steps:\n  - name: nameless\n");
  } catch (const waveq::util::ValidationError& e) {
    thrown = e.operation_index() == 0 && e.field() == "type";
  }
  assert(thrown);
}

void TestMalformedDocuments() {
  FlowLoader loader(OperationCatalog::Default());

  auto rejects = [&](const std::string& yaml, const std::string& field) {
    try {
      loader.LoadString(yaml);
    } catch (const waveq::util::ValidationError& e) {
      return e.field() == field;
    }
    return false;
  };

  assert(rejects("- just\n- a list\n", "flow"));
  assert(rejects("steps: {type: trim}\n", "steps"));
  assert(rejects("sources: one\n", "sources"));
  assert(rejects("steps:\n  - type: trim\n    parameters: [1, 2]\n", "parameters"));
  assert(rejects("steps: [unterminated\n", "flow"));
}

void TestLoadFile() {
  const std::string path = "waveq_flow_loader_test.yaml";
  {
    std::ofstream out(path);
    out << "description: from disk\nsources: [s]\nsteps:\n  - type: fade_out\n    parameters: {duration_ms: 250}\n";
  }

  FlowLoader loader(OperationCatalog::Default());
  auto       request = loader.LoadFile(path);
  std::remove(path.c_str());

  assert(request.description() == "from disk");
  assert(request.operations(0).parameters().fields().at("duration_ms").number_value() == 250.0);

  bool thrown = false;
  try {
    loader.LoadFile("does/not/exist.yaml");
  } catch (const waveq::util::ValidationError&) {
    thrown = true;
  }
  assert(thrown);
}

} // namespace

int main() {
  TestFullFlowDocument();
  TestNumericPriority();
  TestUnknownStepTypeNamesTheStep();
  TestMalformedDocuments();
  TestLoadFile();

  std::cout << "waveq_unit_flow_loader: pass\n";
  return 0;
}
