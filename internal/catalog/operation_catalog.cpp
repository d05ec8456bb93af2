#include "operation_catalog.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

#include "internal/util/errors.hpp"

namespace waveq::catalog {

using waveq::engine::v1::ParameterDescriptor;
using namespace waveq::engine::v1;

namespace {

google::protobuf::Value Number(double v) {
  google::protobuf::Value value;
  value.set_number_value(v);
  return value;
}

google::protobuf::Value Text(const std::string& v) {
  google::protobuf::Value value;
  value.set_string_value(v);
  return value;
}

google::protobuf::Value BandSample() {
  google::protobuf::Value value;
  (*value.mutable_struct_value()->mutable_fields())["1000"].set_number_value(0.0);
  return value;
}

ParamSpec NumberParam(std::string name, bool required, double min, double max, google::protobuf::Value def, bool min_exclusive = false) {
  ParamSpec spec;
  spec.name          = std::move(name);
  spec.type          = ParameterDescriptor::TYPE_NUMBER;
  spec.required      = required;
  spec.min           = min;
  spec.max           = max;
  spec.min_exclusive = min_exclusive;
  spec.default_value = std::move(def);
  return spec;
}

ParamSpec IntegerParam(std::string name, bool required, double min, std::optional<double> max, double def, bool has_default = true) {
  ParamSpec spec;
  spec.name     = std::move(name);
  spec.type     = ParameterDescriptor::TYPE_INTEGER;
  spec.required = required;
  spec.min      = min;
  spec.max      = max;
  if (has_default) {
    spec.default_value = Number(def);
  }
  return spec;
}

ParamSpec EnumParam(std::string name, bool required, std::vector<std::string> allowed, std::string def) {
  ParamSpec spec;
  spec.name          = std::move(name);
  spec.type          = ParameterDescriptor::TYPE_STRING;
  spec.required      = required;
  spec.allowed       = std::move(allowed);
  spec.default_value = Text(def);
  return spec;
}

ParamSpec BandMapParam(std::string name) {
  ParamSpec spec;
  spec.name          = std::move(name);
  spec.type          = ParameterDescriptor::TYPE_BAND_MAP;
  spec.required      = true;
  spec.min           = -24.0;
  spec.max           = 24.0;
  spec.default_value = BandSample();
  return spec;
}

std::string FoldName(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    if (c == ' ' || c == '-') {
      out.push_back('_');
    } else {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return out;
}

std::string FormatNumber(double v) {
  std::ostringstream out;
  out << v;
  return out.str();
}

[[noreturn]] void Reject(const OperationEntry& entry, const std::string& field, const std::string& reason) {
  throw util::ValidationError(entry.name + "." + field + ": " + reason, -1, field);
}

void CheckRange(const OperationEntry& entry, const ParamSpec& spec, double v, const std::string& field) {
  if (spec.min) {
    if (spec.min_exclusive ? v <= *spec.min : v < *spec.min) {
      Reject(entry, field, "must be " + std::string(spec.min_exclusive ? "> " : ">= ") + FormatNumber(*spec.min) + ", got " + FormatNumber(v));
    }
  }
  if (spec.max && v > *spec.max) {
    Reject(entry, field, "must be <= " + FormatNumber(*spec.max) + ", got " + FormatNumber(v));
  }
}

void CheckBands(const OperationEntry& entry, const ParamSpec& spec, const google::protobuf::Value& value) {
  if (value.kind_case() != google::protobuf::Value::kStructValue) {
    Reject(entry, spec.name, "expected a map of frequency to gain");
  }

  const auto& bands = value.struct_value().fields();
  if (bands.empty()) {
    Reject(entry, spec.name, "at least one band is required");
  }

  for (const auto& [freq_text, gain] : bands) {
    const std::string field = spec.name + "." + freq_text;

    char*        end  = nullptr;
    const double freq = std::strtod(freq_text.c_str(), &end);
    if (freq_text.empty() || end == nullptr || *end != '\0') {
      Reject(entry, field, "band key must be a frequency in Hz");
    }
    if (freq < 20.0 || freq > 20000.0) {
      Reject(entry, field, "frequency must be within 20..20000 Hz");
    }

    if (gain.kind_case() != google::protobuf::Value::kNumberValue) {
      Reject(entry, field, "gain must be a number");
    }
    CheckRange(entry, spec, gain.number_value(), field);
  }
}

void CheckParam(const OperationEntry& entry, const ParamSpec& spec, const google::protobuf::Value& value) {
  switch (spec.type) {
    case ParameterDescriptor::TYPE_NUMBER:
    case ParameterDescriptor::TYPE_INTEGER: {
      if (value.kind_case() != google::protobuf::Value::kNumberValue) {
        Reject(entry, spec.name, "expected a number");
      }
      const double v = value.number_value();
      if (!std::isfinite(v)) {
        Reject(entry, spec.name, "must be finite");
      }
      if (spec.type == ParameterDescriptor::TYPE_INTEGER && std::floor(v) != v) {
        Reject(entry, spec.name, "expected an integer");
      }
      CheckRange(entry, spec, v, spec.name);
      break;
    }

    case ParameterDescriptor::TYPE_STRING: {
      if (value.kind_case() != google::protobuf::Value::kStringValue) {
        Reject(entry, spec.name, "expected a string");
      }
      if (!spec.allowed.empty()) {
        bool found = false;
        for (const auto& allowed : spec.allowed) {
          if (allowed == value.string_value()) {
            found = true;
            break;
          }
        }
        if (!found) {
          Reject(entry, spec.name, "unsupported value '" + value.string_value() + "'");
        }
      }
      break;
    }

    case ParameterDescriptor::TYPE_BAND_MAP:
      CheckBands(entry, spec, value);
      break;

    default:
      Reject(entry, spec.name, "unsupported parameter type");
  }
}

std::vector<OperationEntry> BuildEntries() {
  std::vector<OperationEntry> entries;

  entries.push_back({OPERATION_KIND_TRIM,
                     "trim",
                     "Keep the [start_ms, end_ms) window",
                     {"cut", "slice", "extract"},
                     {NumberParam("start_ms", true, 0.0, 86400000.0, Number(0.0)),
                      NumberParam("end_ms", true, 0.0, 86400000.0, Number(1000.0), true)}});

  entries.push_back({OPERATION_KIND_NORMALIZE,
                     "normalize",
                     "Scale so the peak sits at target_db dBFS",
                     {"level", "fix_levels"},
                     {NumberParam("target_db", false, -60.0, 0.0, Number(-20.0))}});

  entries.push_back({OPERATION_KIND_FADE_IN,
                     "fade_in",
                     "Linear fade from silence",
                     {"fade", "gradual_start"},
                     {NumberParam("duration_ms", false, 0.0, 600000.0, Number(1000.0), true)}});

  entries.push_back({OPERATION_KIND_FADE_OUT,
                     "fade_out",
                     "Linear fade to silence",
                     {"fade_end", "gradual_end"},
                     {NumberParam("duration_ms", false, 0.0, 600000.0, Number(1000.0), true)}});

  entries.push_back({OPERATION_KIND_SPEED_CHANGE,
                     "speed_change",
                     "Change playback speed (duration and pitch)",
                     {"change_speed", "speed", "tempo", "time_stretch"},
                     {NumberParam("factor", true, 0.25, 4.0, Number(1.0))}});

  entries.push_back({OPERATION_KIND_PITCH_CHANGE,
                     "pitch_change",
                     "Shift pitch by semitones, duration preserved",
                     {"change_pitch", "pitch"},
                     {NumberParam("semitones", true, -24.0, 24.0, Number(0.0))}});

  entries.push_back({OPERATION_KIND_REVERB,
                     "reverb",
                     "Add room reverberation",
                     {"add_reverb", "echo"},
                     {NumberParam("room_size", false, 0.0, 1.0, Number(0.5)), NumberParam("damping", false, 0.0, 1.0, Number(0.5)),
                      NumberParam("wet", false, 0.0, 1.0, Number(0.3))}});

  entries.push_back({OPERATION_KIND_NOISE_REDUCTION,
                     "noise_reduction",
                     "Suppress low-level background noise",
                     {"denoise", "remove_noise"},
                     {NumberParam("strength", false, 0.0, 1.0, Number(0.5))}});

  entries.push_back({OPERATION_KIND_EQUALIZE,
                     "equalize",
                     "Peaking equalizer, one band per frequency",
                     {"eq", "equalizer"},
                     {BandMapParam("bands"), NumberParam("q", false, 0.1, 10.0, Number(1.0))}});

  entries.push_back({OPERATION_KIND_COMPRESS,
                     "compress",
                     "Dynamic range compression",
                     {"compression", "squash"},
                     {NumberParam("threshold_db", false, -60.0, 0.0, Number(-20.0)), NumberParam("ratio", false, 1.0, 20.0, Number(4.0)),
                      NumberParam("attack_ms", false, 0.1, 1000.0, Number(10.0)), NumberParam("release_ms", false, 1.0, 5000.0, Number(100.0))}});

  entries.push_back({OPERATION_KIND_CONVERT_FORMAT,
                     "convert_format",
                     "Select the output container",
                     {"convert", "export", "save_as"},
                     {EnumParam("format", true, {"wav", "mp3", "flac", "aac", "ogg"}, "wav"),
                      EnumParam("quality", false, {"low", "medium", "high"}, "high"),
                      IntegerParam("sample_rate", false, 8000.0, 192000.0, 44100.0, false),
                      IntegerParam("channels", false, 1.0, 8.0, 2.0, false)}});

  entries.push_back({OPERATION_KIND_MERGE,
                     "merge",
                     "Append the remaining sources in order",
                     {"combine", "join", "concatenate"},
                     {NumberParam("crossfade_ms", false, 0.0, 10000.0, Number(0.0))}});

  entries.push_back({OPERATION_KIND_SPLIT,
                     "split",
                     "Keep one fixed-length segment",
                     {"divide", "segment"},
                     {NumberParam("segment_ms", true, 0.0, 86400000.0, Number(1000.0), true),
                      IntegerParam("segment_index", false, 0.0, kMaxSegmentIndex, 0.0)}});

  return entries;
}

} // namespace

const ParamSpec* OperationEntry::FindParam(std::string_view param_name) const {
  for (const auto& p : params) {
    if (p.name == param_name) {
      return &p;
    }
  }
  return nullptr;
}

const OperationCatalog& OperationCatalog::Default() {
  static const OperationCatalog catalog;
  return catalog;
}

OperationCatalog::OperationCatalog() : entries_(BuildEntries()) {
  for (const auto& entry : entries_) {
    names_.emplace(entry.name, entry.kind);
    for (const auto& alias : entry.aliases) {
      names_.emplace(alias, entry.kind);
    }
  }
}

const OperationEntry* OperationCatalog::Find(OperationKind kind) const {
  for (const auto& entry : entries_) {
    if (entry.kind == kind) {
      return &entry;
    }
  }
  return nullptr;
}

const OperationEntry& OperationCatalog::Require(OperationKind kind) const {
  const auto* entry = Find(kind);
  if (!entry) {
    throw util::NotFound("unknown operation kind " + std::to_string(static_cast<int>(kind)));
  }
  return *entry;
}

std::optional<OperationKind> OperationCatalog::Resolve(std::string_view name) const {
  auto it = names_.find(FoldName(name));
  if (it == names_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string_view OperationCatalog::Name(OperationKind kind) const {
  const auto* entry = Find(kind);
  return entry ? std::string_view(entry->name) : std::string_view("unspecified");
}

OperationDescriptor OperationCatalog::Describe(OperationKind kind) const {
  const auto& entry = Require(kind);

  OperationDescriptor desc;
  desc.set_kind(entry.kind);
  desc.set_name(entry.name);
  for (const auto& alias : entry.aliases) {
    desc.add_aliases(alias);
  }

  for (const auto& spec : entry.params) {
    auto* p = desc.add_parameters();
    p->set_name(spec.name);
    p->set_type(spec.type);
    p->set_required(spec.required);
    if (spec.min) p->set_min(*spec.min);
    if (spec.max) p->set_max(*spec.max);
    if (spec.HasDefault()) {
      *p->mutable_default_value() = spec.default_value;
    }
    for (const auto& allowed : spec.allowed) {
      p->add_allowed_values(allowed);
    }
  }

  return desc;
}

void OperationCatalog::Validate(OperationKind kind, const google::protobuf::Struct& parameters) const {
  const auto* entry = Find(kind);
  if (!entry) {
    throw util::ValidationError("unknown operation kind " + std::to_string(static_cast<int>(kind)), -1, "kind");
  }

  for (const auto& [name, value] : parameters.fields()) {
    if (!entry->FindParam(name)) {
      Reject(*entry, name, "unknown parameter");
    }
  }

  for (const auto& spec : entry->params) {
    auto it = parameters.fields().find(spec.name);
    if (it == parameters.fields().end()) {
      if (spec.required) {
        Reject(*entry, spec.name, "required parameter missing");
      }
      continue;
    }
    CheckParam(*entry, spec, it->second);
  }

  if (kind == OPERATION_KIND_TRIM) {
    const double start = parameters.fields().at("start_ms").number_value();
    const double end   = parameters.fields().at("end_ms").number_value();
    if (end <= start) {
      Reject(*entry, "end_ms", "must be greater than start_ms");
    }
  }
}

google::protobuf::Struct OperationCatalog::BuildDefaults(OperationKind kind) const {
  const auto& entry = Require(kind);

  google::protobuf::Struct out;
  for (const auto& spec : entry.params) {
    if (spec.HasDefault()) {
      (*out.mutable_fields())[spec.name] = spec.default_value;
    }
  }
  return out;
}

void OperationCatalog::FillOptionalDefaults(OperationKind kind, google::protobuf::Struct* parameters) const {
  const auto& entry = Require(kind);

  auto* fields = parameters->mutable_fields();
  for (const auto& spec : entry.params) {
    if (!spec.required && spec.HasDefault() && fields->find(spec.name) == fields->end()) {
      (*fields)[spec.name] = spec.default_value;
    }
  }
}

} // namespace waveq::catalog
