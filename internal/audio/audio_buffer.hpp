#pragma once

#include <arrow/buffer.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace waveq::audio {

/*
  Decoded audio: interleaved float PCM in [-1, 1].

  format/quality describe the container the buffer will be encoded to and
  are only changed by convert_format.
*/
struct AudioBuffer {
  uint32_t           sample_rate = 44100;
  uint16_t           channels    = 1;
  std::vector<float> samples;

  std::string format  = "wav";
  std::string quality = "high";

  std::size_t Frames() const {
    return channels == 0 ? 0 : samples.size() / channels;
  }

  double DurationMs() const {
    return sample_rate == 0 ? 0.0 : static_cast<double>(Frames()) * 1000.0 / sample_rate;
  }

  // Clamped to [0, Frames()].
  std::size_t FrameAt(double ms) const;

  // Same layout, no samples.
  AudioBuffer EmptyLike() const;
};

// RIFF/WAVE: PCM 8/16/24/32-bit integer and 32-bit float input.
// Throws std::invalid_argument on malformed data.
AudioBuffer DecodeWav(const arrow::Buffer& bytes);

// 16-bit PCM RIFF/WAVE.
std::shared_ptr<arrow::Buffer> EncodeWav(const AudioBuffer& audio);

} // namespace waveq::audio
