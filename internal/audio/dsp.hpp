#pragma once

#include <map>
#include <vector>

#include "audio_buffer.hpp"

namespace waveq::audio::dsp {

/*
  Plain PCM kernels behind the operation executors.

  All functions take the input by const reference and return a new buffer.
  Results are reasonable approximations, not bit-exact reference DSP.
  Data-dependent failures (window past the end of the audio) throw
  std::invalid_argument.
*/

// Keeps [start_ms, end_ms); end is clamped to the audio length.
AudioBuffer Trim(const AudioBuffer& in, double start_ms, double end_ms);

// Peak normalization to target_db dBFS. Silence is returned unchanged.
AudioBuffer Normalize(const AudioBuffer& in, double target_db);

AudioBuffer FadeIn(const AudioBuffer& in, double duration_ms);
AudioBuffer FadeOut(const AudioBuffer& in, double duration_ms);

// Linear-interpolation resampling; factor 2 halves the duration.
AudioBuffer ChangeSpeed(const AudioBuffer& in, double factor);

// Duration-preserving time stretch by overlap-add; stretch 2 doubles the duration.
AudioBuffer TimeStretch(const AudioBuffer& in, double stretch);

AudioBuffer PitchShift(const AudioBuffer& in, double semitones);

AudioBuffer Reverb(const AudioBuffer& in, double room_size, double damping, double wet);

// Downward expander keyed on the estimated noise floor.
AudioBuffer ReduceNoise(const AudioBuffer& in, double strength);

// Cascade of RBJ peaking filters, one per (frequency Hz -> gain dB).
AudioBuffer Equalize(const AudioBuffer& in, const std::map<double, double>& bands, double q);

AudioBuffer Compress(const AudioBuffer& in, double threshold_db, double ratio, double attack_ms, double release_ms);

// Resamples and remaps channels to match the target layout.
AudioBuffer Conform(const AudioBuffer& in, uint32_t sample_rate, uint16_t channels);

// Appends each part in order with an optional linear crossfade.
AudioBuffer Concatenate(const AudioBuffer& head, const std::vector<AudioBuffer>& tail, double crossfade_ms);

// Segment segment_index of length segment_ms; the last one may be short.
AudioBuffer Segment(const AudioBuffer& in, double segment_ms, std::size_t segment_index);

double PeakDb(const AudioBuffer& in);

} // namespace waveq::audio::dsp
