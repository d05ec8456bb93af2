#include "dsp_executors.hpp"

#include <cstdlib>
#include <map>
#include <stdexcept>

#include "internal/audio/dsp.hpp"
#include "internal/catalog/operation_catalog.hpp"

namespace waveq::pipeline {

using audio::AudioBuffer;
using google::protobuf::Struct;
using namespace waveq::engine::v1;

namespace {

std::map<double, double> BandsParam(const Struct& parameters) {
  std::map<double, double> bands;
  auto                     it = parameters.fields().find("bands");
  if (it == parameters.fields().end()) {
    return bands;
  }
  for (const auto& [freq, gain] : it->second.struct_value().fields()) {
    bands[std::strtod(freq.c_str(), nullptr)] = gain.number_value();
  }
  return bands;
}

void Bind(ExecutorRegistry& registry, OperationKind kind, FunctionExecutor::Fn fn) {
  registry.Register(std::make_shared<FunctionExecutor>(kind, std::move(fn)));
}

} // namespace

void RegisterDspExecutors(ExecutorRegistry& registry) {
  Bind(registry, OPERATION_KIND_TRIM, [](const AudioBuffer& in, const Struct& p, const ExecutionContext&) {
    return audio::dsp::Trim(in, NumberParam(p, "start_ms"), NumberParam(p, "end_ms"));
  });

  Bind(registry, OPERATION_KIND_NORMALIZE, [](const AudioBuffer& in, const Struct& p, const ExecutionContext&) {
    return audio::dsp::Normalize(in, NumberParam(p, "target_db", -20.0));
  });

  Bind(registry, OPERATION_KIND_FADE_IN, [](const AudioBuffer& in, const Struct& p, const ExecutionContext&) {
    return audio::dsp::FadeIn(in, NumberParam(p, "duration_ms", 1000.0));
  });

  Bind(registry, OPERATION_KIND_FADE_OUT, [](const AudioBuffer& in, const Struct& p, const ExecutionContext&) {
    return audio::dsp::FadeOut(in, NumberParam(p, "duration_ms", 1000.0));
  });

  Bind(registry, OPERATION_KIND_SPEED_CHANGE, [](const AudioBuffer& in, const Struct& p, const ExecutionContext&) {
    return audio::dsp::ChangeSpeed(in, NumberParam(p, "factor", 1.0));
  });

  Bind(registry, OPERATION_KIND_PITCH_CHANGE, [](const AudioBuffer& in, const Struct& p, const ExecutionContext&) {
    return audio::dsp::PitchShift(in, NumberParam(p, "semitones"));
  });

  Bind(registry, OPERATION_KIND_REVERB, [](const AudioBuffer& in, const Struct& p, const ExecutionContext&) {
    return audio::dsp::Reverb(in, NumberParam(p, "room_size", 0.5), NumberParam(p, "damping", 0.5), NumberParam(p, "wet", 0.3));
  });

  Bind(registry, OPERATION_KIND_NOISE_REDUCTION, [](const AudioBuffer& in, const Struct& p, const ExecutionContext&) {
    return audio::dsp::ReduceNoise(in, NumberParam(p, "strength", 0.5));
  });

  Bind(registry, OPERATION_KIND_EQUALIZE, [](const AudioBuffer& in, const Struct& p, const ExecutionContext&) {
    return audio::dsp::Equalize(in, BandsParam(p), NumberParam(p, "q", 1.0));
  });

  Bind(registry, OPERATION_KIND_COMPRESS, [](const AudioBuffer& in, const Struct& p, const ExecutionContext&) {
    return audio::dsp::Compress(in, NumberParam(p, "threshold_db", -20.0), NumberParam(p, "ratio", 4.0), NumberParam(p, "attack_ms", 10.0),
                                NumberParam(p, "release_ms", 100.0));
  });

  // Sample rate and channel count default to the input's layout.
  Bind(registry, OPERATION_KIND_CONVERT_FORMAT, [](const AudioBuffer& in, const Struct& p, const ExecutionContext&) {
    const auto sample_rate = static_cast<uint32_t>(NumberParam(p, "sample_rate", in.sample_rate));
    const auto channels    = static_cast<uint16_t>(NumberParam(p, "channels", in.channels));

    AudioBuffer out = audio::dsp::Conform(in, sample_rate, channels);
    out.format      = StringParam(p, "format", "wav");
    out.quality     = StringParam(p, "quality", "high");
    return out;
  });

  Bind(registry, OPERATION_KIND_MERGE, [](const AudioBuffer& in, const Struct& p, const ExecutionContext& ctx) {
    std::vector<AudioBuffer> tail;
    for (std::size_t i = 1; i < ctx.sources.size(); ++i) {
      tail.push_back(ctx.LoadSource(i));
    }
    return audio::dsp::Concatenate(in, tail, NumberParam(p, "crossfade_ms"));
  });

  Bind(registry, OPERATION_KIND_SPLIT, [](const AudioBuffer& in, const Struct& p, const ExecutionContext&) {
    const double index = NumberParam(p, "segment_index");
    if (!(index >= 0.0 && index <= catalog::kMaxSegmentIndex)) {
      throw std::invalid_argument("segment_index out of range");
    }
    return audio::dsp::Segment(in, NumberParam(p, "segment_ms", 1000.0), static_cast<std::size_t>(index));
  });
}

} // namespace waveq::pipeline
