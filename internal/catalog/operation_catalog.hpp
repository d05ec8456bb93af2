#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "waveq/engine/v1/types.pb.h"

namespace waveq::catalog {

using OperationKind = waveq::engine::v1::OperationKind;
using ParamType     = waveq::engine::v1::ParameterDescriptor::Type;

struct ParamSpec {
  std::string name;
  ParamType   type     = waveq::engine::v1::ParameterDescriptor::TYPE_NUMBER;
  bool        required = false;

  std::optional<double> min;
  std::optional<double> max;
  bool                  min_exclusive = false;

  // Optional params: applied when absent, or never when unset. Required
  // params: a sample value.
  google::protobuf::Value default_value;

  std::vector<std::string> allowed;

  bool HasDefault() const {
    return default_value.kind_case() != google::protobuf::Value::KIND_NOT_SET;
  }
};

// Largest split segment_index the catalog accepts.
inline constexpr double kMaxSegmentIndex = 86400000.0;

struct OperationEntry {
  OperationKind            kind;
  std::string              name;
  std::string              description;
  std::vector<std::string> aliases;
  std::vector<ParamSpec>   params;

  const ParamSpec* FindParam(std::string_view name) const;
};

/*
  Static registry of operation kinds.

  Immutable after construction and safe to share across threads. Adding a
  kind means one entry here and one executor binding in the pipeline
  registry.
*/
class OperationCatalog {
 public:
  static const OperationCatalog& Default();

  OperationCatalog();

  const OperationEntry* Find(OperationKind kind) const;
  const std::vector<OperationEntry>& Entries() const {
    return entries_;
  }

  // Canonical names and aliases, case-insensitive; spaces and dashes fold to '_'.
  std::optional<OperationKind> Resolve(std::string_view name) const;

  // throws util::NotFound
  waveq::engine::v1::OperationDescriptor Describe(OperationKind kind) const;

  // Strict check: types exact, ranges inclusive unless marked, unknown
  // parameters rejected. Throws util::ValidationError naming the field.
  void Validate(OperationKind kind, const google::protobuf::Struct& parameters) const;

  // Every parameter at its default (sample values for required ones).
  google::protobuf::Struct BuildDefaults(OperationKind kind) const;

  // Adds defaults for missing optional parameters only.
  void FillOptionalDefaults(OperationKind kind, google::protobuf::Struct* parameters) const;

  std::string_view Name(OperationKind kind) const;

 private:
  const OperationEntry& Require(OperationKind kind) const;

  std::vector<OperationEntry>                    entries_;
  std::unordered_map<std::string, OperationKind> names_;
};

} // namespace waveq::catalog
