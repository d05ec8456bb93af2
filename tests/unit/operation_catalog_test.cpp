#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/catalog/operation_catalog.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace waveq::engine::v1;
using waveq::catalog::OperationCatalog;

google::protobuf::Struct Params(std::initializer_list<std::pair<const char*, double>> values) {
  google::protobuf::Struct out;
  for (const auto& [key, value] : values) {
    (*out.mutable_fields())[key].set_number_value(value);
  }
  return out;
}

std::string ValidationField(OperationKind kind, const google::protobuf::Struct& params) {
  try {
    OperationCatalog::Default().Validate(kind, params);
  } catch (const waveq::util::ValidationError& e) {
    return e.field();
  }
  return {};
}

void TestEveryKindIsRegisteredOnce() {
  const auto&         catalog = OperationCatalog::Default();
  std::set<int>       kinds;
  std::set<std::string> names;
  for (const auto& entry : catalog.Entries()) {
    assert(kinds.insert(entry.kind).second);
    assert(names.insert(entry.name).second);
  }
  assert(kinds.size() == 13);
  for (int k = OPERATION_KIND_TRIM; k <= OPERATION_KIND_SPLIT; ++k) {
    assert(catalog.Find(static_cast<OperationKind>(k)) != nullptr);
  }
}

void TestDefaultsValidateForEveryKind() {
  const auto& catalog = OperationCatalog::Default();
  for (const auto& entry : catalog.Entries()) {
    catalog.Validate(entry.kind, catalog.BuildDefaults(entry.kind));
  }
}

void TestAliasesResolveCaseInsensitively() {
  const auto& catalog = OperationCatalog::Default();
  assert(catalog.Resolve("trim") == OPERATION_KIND_TRIM);
  assert(catalog.Resolve("Cut") == OPERATION_KIND_TRIM);
  assert(catalog.Resolve("fix-levels") == OPERATION_KIND_NORMALIZE);
  assert(catalog.Resolve("TIME STRETCH") == OPERATION_KIND_SPEED_CHANGE);
  assert(catalog.Resolve("denoise") == OPERATION_KIND_NOISE_REDUCTION);
  assert(catalog.Resolve("eq") == OPERATION_KIND_EQUALIZE);
  assert(catalog.Resolve("save_as") == OPERATION_KIND_CONVERT_FORMAT);
  assert(catalog.Resolve("concatenate") == OPERATION_KIND_MERGE);
  assert(!catalog.Resolve("reverse").has_value());
  assert(!catalog.Resolve("").has_value());
}

void TestMissingRequiredParameterNamesField() {
  assert(ValidationField(OPERATION_KIND_EQUALIZE, google::protobuf::Struct()) == "bands");
  assert(ValidationField(OPERATION_KIND_SPEED_CHANGE, google::protobuf::Struct()) == "factor");
  assert(ValidationField(OPERATION_KIND_TRIM, Params({{"start_ms", 0}})) == "end_ms");
}

void TestRangesAndTypesAreStrict() {
  assert(ValidationField(OPERATION_KIND_SPEED_CHANGE, Params({{"factor", 0.1}})) == "factor");
  assert(ValidationField(OPERATION_KIND_SPEED_CHANGE, Params({{"factor", 4.0}})).empty());
  assert(ValidationField(OPERATION_KIND_NORMALIZE, Params({{"target_db", 3.0}})) == "target_db");
  assert(ValidationField(OPERATION_KIND_FADE_IN, Params({{"duration_ms", 0.0}})) == "duration_ms");
  assert(ValidationField(OPERATION_KIND_TRIM, Params({{"start_ms", 500}, {"end_ms", 500}})) == "end_ms");
  assert(ValidationField(OPERATION_KIND_SPLIT, Params({{"segment_ms", 100}, {"segment_index", 1.5}})) == "segment_index");
  assert(ValidationField(OPERATION_KIND_SPLIT, Params({{"segment_ms", 100}, {"segment_index", 1e20}})) == "segment_index");
  assert(ValidationField(OPERATION_KIND_SPLIT, Params({{"segment_ms", 100}, {"segment_index", 4611686018427387904.0}})) == "segment_index");
  assert(ValidationField(OPERATION_KIND_SPLIT, Params({{"segment_ms", 100}, {"segment_index", 86400000}})).empty());

  google::protobuf::Struct text_factor;
  (*text_factor.mutable_fields())["factor"].set_string_value("1.5");
  assert(ValidationField(OPERATION_KIND_SPEED_CHANGE, text_factor) == "factor");

  google::protobuf::Struct wrong_format;
  (*wrong_format.mutable_fields())["format"].set_string_value("midi");
  assert(ValidationField(OPERATION_KIND_CONVERT_FORMAT, wrong_format) == "format");
}

void TestConvertFormatLayoutParameters() {
  google::protobuf::Struct params;
  (*params.mutable_fields())["format"].set_string_value("flac");
  (*params.mutable_fields())["sample_rate"].set_number_value(48000);
  (*params.mutable_fields())["channels"].set_number_value(1);
  assert(ValidationField(OPERATION_KIND_CONVERT_FORMAT, params).empty());

  (*params.mutable_fields())["sample_rate"].set_number_value(4000);
  assert(ValidationField(OPERATION_KIND_CONVERT_FORMAT, params) == "sample_rate");
  (*params.mutable_fields())["sample_rate"].set_number_value(22050.5);
  assert(ValidationField(OPERATION_KIND_CONVERT_FORMAT, params) == "sample_rate");
  (*params.mutable_fields())["sample_rate"].set_number_value(192000);

  (*params.mutable_fields())["channels"].set_number_value(9);
  assert(ValidationField(OPERATION_KIND_CONVERT_FORMAT, params) == "channels");
  (*params.mutable_fields())["channels"].set_number_value(0);
  assert(ValidationField(OPERATION_KIND_CONVERT_FORMAT, params) == "channels");

  auto desc = OperationCatalog::Default().Describe(OPERATION_KIND_CONVERT_FORMAT);
  assert(desc.parameters_size() == 4);
  assert(desc.parameters(2).name() == "sample_rate");
  assert(desc.parameters(2).min() == 8000.0 && desc.parameters(2).max() == 192000.0);
  assert(!desc.parameters(2).has_default_value());
}

void TestUnknownParametersAreRejected() {
  assert(ValidationField(OPERATION_KIND_REVERB, Params({{"roomsize", 0.5}})) == "roomsize");
}

void TestBandMapValidation() {
  google::protobuf::Struct params;
  auto&                    bands = *(*params.mutable_fields())["bands"].mutable_struct_value()->mutable_fields();
  bands["100"].set_number_value(6.0);
  bands["8000"].set_number_value(-3.0);
  assert(ValidationField(OPERATION_KIND_EQUALIZE, params).empty());

  bands["bass"].set_number_value(2.0);
  assert(ValidationField(OPERATION_KIND_EQUALIZE, params) == "bands.bass");
  bands.erase("bass");

  bands["100"].set_number_value(30.0);
  assert(ValidationField(OPERATION_KIND_EQUALIZE, params) == "bands.100");
}

void TestDescribeMirrorsEntries() {
  const auto& catalog = OperationCatalog::Default();
  auto        desc    = catalog.Describe(OPERATION_KIND_COMPRESS);
  assert(desc.name() == "compress");
  assert(desc.aliases_size() == 2);
  assert(desc.parameters_size() == 4);
  assert(desc.parameters(0).name() == "threshold_db");
  assert(!desc.parameters(0).required());
  assert(desc.parameters(0).default_value().number_value() == -20.0);

  bool threw = false;
  try {
    (void)catalog.Describe(OPERATION_KIND_UNSPECIFIED);
  } catch (const waveq::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestFillOptionalDefaultsLeavesRequiredAlone() {
  const auto&              catalog = OperationCatalog::Default();
  google::protobuf::Struct params;
  catalog.FillOptionalDefaults(OPERATION_KIND_CONVERT_FORMAT, &params);
  assert(params.fields().count("quality") == 1);
  assert(params.fields().count("format") == 0);
  // layout stays with the source unless asked for
  assert(params.fields().count("sample_rate") == 0);
  assert(params.fields().count("channels") == 0);
}

} // namespace

int main() {
  TestEveryKindIsRegisteredOnce();
  TestDefaultsValidateForEveryKind();
  TestAliasesResolveCaseInsensitively();
  TestMissingRequiredParameterNamesField();
  TestRangesAndTypesAreStrict();
  TestConvertFormatLayoutParameters();
  TestUnknownParametersAreRejected();
  TestBandMapValidation();
  TestDescribeMirrorsEntries();
  TestFillOptionalDefaultsLeavesRequiredAlone();

  std::cout << "waveq_unit_operation_catalog: pass\n";
  return 0;
}
