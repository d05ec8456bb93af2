#include "instruction_interpreter.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "internal/util/errors.hpp"

namespace waveq::interpreter {

using namespace waveq::engine::v1;

namespace {

// "12.5" -> 12.5; anything else is left as-is for validation to reject.
void CoerceNumber(google::protobuf::Value* value) {
  if (value->kind_case() != google::protobuf::Value::kStringValue) {
    return;
  }

  const std::string& text = value->string_value();
  if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) {
    return;
  }

  char*        end = nullptr;
  const double v   = std::strtod(text.c_str(), &end);
  if (end != nullptr && *end == '\0') {
    value->set_number_value(v);
  }
}

void CoerceParameters(const catalog::OperationEntry& entry, google::protobuf::Struct* parameters) {
  for (auto& [name, value] : *parameters->mutable_fields()) {
    const auto* spec = entry.FindParam(name);
    if (!spec) {
      continue;
    }

    switch (spec->type) {
      case ParameterDescriptor::TYPE_NUMBER:
      case ParameterDescriptor::TYPE_INTEGER:
        CoerceNumber(&value);
        break;
      case ParameterDescriptor::TYPE_BAND_MAP:
        if (value.kind_case() == google::protobuf::Value::kStructValue) {
          for (auto& [freq, gain] : *value.mutable_struct_value()->mutable_fields()) {
            CoerceNumber(&gain);
          }
        }
        break;
      case ParameterDescriptor::TYPE_STRING:
        if (value.kind_case() == google::protobuf::Value::kStringValue) {
          std::string lowered = value.string_value();
          std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
          value.set_string_value(lowered);
        }
        break;
      default:
        break;
    }
  }
}

} // namespace

InstructionInterpreter::InstructionInterpreter(const catalog::OperationCatalog& catalog, std::shared_ptr<Classifier> classifier, int32_t default_priority)
    : catalog_(catalog), classifier_(std::move(classifier)), default_priority_(default_priority) {
}

int InstructionInterpreter::CanonicalStage(OperationKind kind) {
  switch (kind) {
    case OPERATION_KIND_SPLIT:
    case OPERATION_KIND_TRIM:
      return 1;
    case OPERATION_KIND_MERGE:
      return 2;
    case OPERATION_KIND_SPEED_CHANGE:
    case OPERATION_KIND_PITCH_CHANGE:
      return 3;
    case OPERATION_KIND_NORMALIZE:
      return 5;
    case OPERATION_KIND_CONVERT_FORMAT:
      return 6;
    default:
      return 4;
  }
}

void InstructionInterpreter::Canonicalize(std::vector<OperationSpec>* operations) {
  std::stable_sort(operations->begin(), operations->end(),
                   [](const OperationSpec& a, const OperationSpec& b) { return CanonicalStage(a.kind()) < CanonicalStage(b.kind()); });
}

OperationSpec InstructionInterpreter::Normalize(const RawOperation& raw, int index) const {
  auto kind = catalog_.Resolve(raw.name());
  if (!kind) {
    throw util::ValidationError("operation " + std::to_string(index) + ": unknown operation '" + raw.name() + "'", index, "name");
  }

  const auto* entry = catalog_.Find(*kind);

  OperationSpec spec;
  spec.set_kind(*kind);
  *spec.mutable_parameters() = raw.parameters();

  CoerceParameters(*entry, spec.mutable_parameters());
  catalog_.FillOptionalDefaults(*kind, spec.mutable_parameters());

  try {
    catalog_.Validate(*kind, spec.parameters());
  } catch (const util::ValidationError& e) {
    throw util::ValidationError("operation " + std::to_string(index) + " (" + entry->name + "): " + e.what(), index, e.field());
  }

  return spec;
}

std::vector<OperationSpec> InstructionInterpreter::InterpretOperations(const std::vector<RawOperation>& operations,
                                                                       const std::string& instruction) const {
  std::vector<RawOperation> raw = operations;
  if (raw.empty() && !instruction.empty()) {
    if (!classifier_) {
      throw util::ValidationError("free-text instruction given but no classifier is configured", -1, "instruction");
    }
    raw = classifier_->Guess(instruction);
    if (raw.empty()) {
      throw util::ValidationError("no operation could be derived from the instruction", -1, "instruction");
    }
  }

  if (raw.empty()) {
    throw util::ValidationError("at least one operation is required", -1, "operations");
  }

  std::vector<OperationSpec> out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    out.push_back(Normalize(raw[i], static_cast<int>(i)));
  }

  Canonicalize(&out);
  return out;
}

int32_t InstructionInterpreter::ResolvePriority(int32_t priority, const std::string& priority_name) const {
  if (priority != 0) {
    if (priority < 1 || priority > 5) {
      throw util::ValidationError("priority must be within 1..5, got " + std::to_string(priority), -1, "priority");
    }
    return priority;
  }

  if (priority_name.empty()) {
    return default_priority_;
  }

  std::string name = priority_name;
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (name == "urgent") return 1;
  if (name == "high") return 2;
  if (name == "normal") return 3;
  if (name == "low") return 4;
  if (name == "background") return 5;

  throw util::ValidationError("unknown priority name '" + priority_name + "'", -1, "priority_name");
}

Interpretation InstructionInterpreter::Interpret(const RawSubmission& submission) const {
  Interpretation out;
  out.priority = ResolvePriority(submission.priority, submission.priority_name);

  if (submission.sources.empty()) {
    throw util::ValidationError("at least one source is required", -1, "sources");
  }
  for (const auto& source : submission.sources) {
    if (source.empty()) {
      throw util::ValidationError("source references must not be empty", -1, "sources");
    }
  }

  out.operations = InterpretOperations(submission.operations, submission.instruction);

  const bool has_merge = std::any_of(out.operations.begin(), out.operations.end(),
                                     [](const OperationSpec& op) { return op.kind() == OPERATION_KIND_MERGE; });
  if (has_merge && submission.sources.size() < 2) {
    throw util::ValidationError("merge requires at least two sources", -1, "sources");
  }

  return out;
}

} // namespace waveq::interpreter
