#include "dsp.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace waveq::audio::dsp {

namespace {

constexpr double kPi = 3.14159265358979323846;

double DbToGain(double db) {
  return std::pow(10.0, db / 20.0);
}

double GainToDb(double gain) {
  return gain <= 0.0 ? -120.0 : 20.0 * std::log10(gain);
}

float PeakOf(const std::vector<float>& samples) {
  float peak = 0.0f;
  for (float s : samples) {
    peak = std::max(peak, std::fabs(s));
  }
  return peak;
}

// Linear interpolation at fractional frame position.
float SampleAt(const AudioBuffer& in, double frame, uint16_t channel) {
  const std::size_t frames = in.Frames();
  if (frames == 0) return 0.0f;

  const auto   i0   = static_cast<std::size_t>(frame);
  const double frac = frame - static_cast<double>(i0);
  if (i0 + 1 >= frames) {
    return in.samples[(frames - 1) * in.channels + channel];
  }
  const float a = in.samples[i0 * in.channels + channel];
  const float b = in.samples[(i0 + 1) * in.channels + channel];
  return static_cast<float>(a + (b - a) * frac);
}

AudioBuffer Resample(const AudioBuffer& in, double step, std::size_t out_frames) {
  AudioBuffer out = in.EmptyLike();
  out.samples.resize(out_frames * in.channels);
  for (std::size_t i = 0; i < out_frames; ++i) {
    const double pos = static_cast<double>(i) * step;
    for (uint16_t c = 0; c < in.channels; ++c) {
      out.samples[i * in.channels + c] = SampleAt(in, pos, c);
    }
  }
  return out;
}

AudioBuffer Slice(const AudioBuffer& in, std::size_t begin_frame, std::size_t end_frame) {
  AudioBuffer out = in.EmptyLike();
  end_frame       = std::min(end_frame, in.Frames());
  if (begin_frame >= end_frame) {
    return out;
  }
  out.samples.assign(in.samples.begin() + static_cast<std::ptrdiff_t>(begin_frame * in.channels),
                     in.samples.begin() + static_cast<std::ptrdiff_t>(end_frame * in.channels));
  return out;
}

struct Biquad {
  double b0 = 1, b1 = 0, b2 = 0, a1 = 0, a2 = 0;
  double z1 = 0, z2 = 0;

  float Process(float x) {
    const double y = b0 * x + z1;
    z1             = b1 * x - a1 * y + z2;
    z2             = b2 * x - a2 * y;
    return static_cast<float>(y);
  }
};

Biquad PeakingFilter(double sample_rate, double freq, double gain_db, double q) {
  const double a     = std::pow(10.0, gain_db / 40.0);
  const double w0    = 2.0 * kPi * freq / sample_rate;
  const double alpha = std::sin(w0) / (2.0 * q);
  const double cosw  = std::cos(w0);
  const double a0    = 1.0 + alpha / a;

  Biquad f;
  f.b0 = (1.0 + alpha * a) / a0;
  f.b1 = (-2.0 * cosw) / a0;
  f.b2 = (1.0 - alpha * a) / a0;
  f.a1 = (-2.0 * cosw) / a0;
  f.a2 = (1.0 - alpha / a) / a0;
  return f;
}

class Comb {
 public:
  explicit Comb(std::size_t size) : buffer_(std::max<std::size_t>(size, 1), 0.0f) {
  }

  float Process(float x, float feedback, float damp) {
    const float out = buffer_[pos_];
    store_          = out * (1.0f - damp) + store_ * damp;
    buffer_[pos_]   = x + store_ * feedback;
    pos_            = (pos_ + 1) % buffer_.size();
    return out;
  }

 private:
  std::vector<float> buffer_;
  std::size_t        pos_   = 0;
  float              store_ = 0.0f;
};

class Allpass {
 public:
  explicit Allpass(std::size_t size) : buffer_(std::max<std::size_t>(size, 1), 0.0f) {
  }

  float Process(float x) {
    const float delayed = buffer_[pos_];
    const float out     = -x + delayed;
    buffer_[pos_]       = x + delayed * 0.5f;
    pos_                = (pos_ + 1) % buffer_.size();
    return out;
  }

 private:
  std::vector<float> buffer_;
  std::size_t        pos_ = 0;
};

} // namespace

double PeakDb(const AudioBuffer& in) {
  return GainToDb(PeakOf(in.samples));
}

AudioBuffer Trim(const AudioBuffer& in, double start_ms, double end_ms) {
  const auto begin = in.FrameAt(start_ms);
  if (begin >= in.Frames()) {
    throw std::invalid_argument("trim start " + std::to_string(start_ms) + " ms is past the end of the audio (" +
                                std::to_string(in.DurationMs()) + " ms)");
  }
  return Slice(in, begin, in.FrameAt(end_ms));
}

AudioBuffer Normalize(const AudioBuffer& in, double target_db) {
  AudioBuffer out  = in;
  const float peak = PeakOf(in.samples);
  if (peak <= 0.0f) {
    return out;
  }

  const auto gain = static_cast<float>(DbToGain(target_db) / peak);
  for (auto& s : out.samples) {
    s *= gain;
  }
  return out;
}

AudioBuffer FadeIn(const AudioBuffer& in, double duration_ms) {
  AudioBuffer out    = in;
  const auto  frames = std::max<std::size_t>(in.FrameAt(duration_ms), 1);
  for (std::size_t i = 0; i < std::min(frames, in.Frames()); ++i) {
    const auto g = static_cast<float>(i) / static_cast<float>(frames);
    for (uint16_t c = 0; c < in.channels; ++c) {
      out.samples[i * in.channels + c] *= g;
    }
  }
  return out;
}

AudioBuffer FadeOut(const AudioBuffer& in, double duration_ms) {
  AudioBuffer out    = in;
  const auto  total  = in.Frames();
  const auto  frames = std::min(std::max<std::size_t>(in.FrameAt(duration_ms), 1), total);
  for (std::size_t k = 0; k < frames; ++k) {
    const std::size_t i = total - frames + k;
    const auto        g = static_cast<float>(frames - 1 - k) / static_cast<float>(frames);
    for (uint16_t c = 0; c < in.channels; ++c) {
      out.samples[i * in.channels + c] *= g;
    }
  }
  return out;
}

AudioBuffer ChangeSpeed(const AudioBuffer& in, double factor) {
  if (factor <= 0.0) {
    throw std::invalid_argument("speed factor must be positive");
  }
  const auto out_frames = static_cast<std::size_t>(std::floor(static_cast<double>(in.Frames()) / factor));
  return Resample(in, factor, out_frames);
}

AudioBuffer TimeStretch(const AudioBuffer& in, double stretch) {
  if (stretch <= 0.0) {
    throw std::invalid_argument("stretch must be positive");
  }

  const std::size_t window  = 1024;
  const std::size_t hop_out = window / 4;
  const double      hop_in  = static_cast<double>(hop_out) / stretch;

  const auto  in_frames  = in.Frames();
  const auto  out_frames = static_cast<std::size_t>(std::round(static_cast<double>(in_frames) * stretch));
  AudioBuffer out        = in.EmptyLike();
  out.samples.assign(out_frames * in.channels, 0.0f);
  if (in_frames == 0 || out_frames == 0) {
    return out;
  }

  std::vector<float> norm(out_frames, 0.0f);
  std::vector<float> hann(window);
  for (std::size_t i = 0; i < window; ++i) {
    hann[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) / static_cast<double>(window)));
  }

  for (std::size_t grain = 0;; ++grain) {
    const std::size_t out_start = grain * hop_out;
    if (out_start >= out_frames) break;
    const auto in_start = static_cast<std::size_t>(static_cast<double>(grain) * hop_in);

    for (std::size_t i = 0; i < window && out_start + i < out_frames; ++i) {
      const std::size_t src = std::min(in_start + i, in_frames - 1);
      for (uint16_t c = 0; c < in.channels; ++c) {
        out.samples[(out_start + i) * in.channels + c] += in.samples[src * in.channels + c] * hann[i];
      }
      norm[out_start + i] += hann[i];
    }
  }

  for (std::size_t i = 0; i < out_frames; ++i) {
    if (norm[i] > 1e-3f) {
      for (uint16_t c = 0; c < in.channels; ++c) {
        out.samples[i * in.channels + c] /= norm[i];
      }
    }
  }
  return out;
}

AudioBuffer PitchShift(const AudioBuffer& in, double semitones) {
  if (semitones == 0.0) {
    return in;
  }
  const double ratio     = std::pow(2.0, semitones / 12.0);
  AudioBuffer  stretched = TimeStretch(in, ratio);
  return Resample(stretched, ratio, in.Frames());
}

AudioBuffer Reverb(const AudioBuffer& in, double room_size, double damping, double wet) {
  static constexpr std::array<double, 4> kCombMs    = {29.7, 37.1, 41.1, 43.7};
  static constexpr std::array<double, 2> kAllpassMs = {5.0, 1.7};

  AudioBuffer out      = in;
  const auto  feedback = static_cast<float>(0.7 + 0.28 * room_size);
  const auto  damp     = static_cast<float>(damping * 0.4);
  const auto  wet_gain = static_cast<float>(wet);
  const auto  dry_gain = static_cast<float>(1.0 - wet);

  for (uint16_t c = 0; c < in.channels; ++c) {
    std::vector<Comb>    combs;
    std::vector<Allpass> allpasses;
    for (double ms : kCombMs) {
      combs.emplace_back(static_cast<std::size_t>(ms * in.sample_rate / 1000.0) + c * 23);
    }
    for (double ms : kAllpassMs) {
      allpasses.emplace_back(static_cast<std::size_t>(ms * in.sample_rate / 1000.0));
    }

    for (std::size_t i = 0; i < in.Frames(); ++i) {
      const float x   = in.samples[i * in.channels + c];
      float       acc = 0.0f;
      for (auto& comb : combs) {
        acc += comb.Process(x, feedback, damp);
      }
      acc *= 0.25f;
      for (auto& ap : allpasses) {
        acc = ap.Process(acc);
      }
      out.samples[i * in.channels + c] = x * dry_gain + acc * wet_gain;
    }
  }
  return out;
}

AudioBuffer ReduceNoise(const AudioBuffer& in, double strength) {
  AudioBuffer out = in;
  if (strength <= 0.0 || in.Frames() == 0) {
    return out;
  }

  const std::size_t block  = std::max<std::size_t>(in.sample_rate / 50, 1);
  const std::size_t blocks = (in.Frames() + block - 1) / block;

  std::vector<double> rms(blocks, 0.0);
  for (std::size_t b = 0; b < blocks; ++b) {
    const std::size_t begin = b * block;
    const std::size_t end   = std::min(begin + block, in.Frames());
    double            sum   = 0.0;
    for (std::size_t i = begin * in.channels; i < end * in.channels; ++i) {
      sum += static_cast<double>(in.samples[i]) * in.samples[i];
    }
    rms[b] = std::sqrt(sum / static_cast<double>((end - begin) * in.channels));
  }

  std::vector<double> sorted = rms;
  std::nth_element(sorted.begin(), sorted.begin() + static_cast<std::ptrdiff_t>(sorted.size() / 10), sorted.end());
  const double floor     = sorted[sorted.size() / 10];
  const double threshold = floor * (1.0 + 4.0 * strength) + 1e-6;
  const double reduction = 1.0 - strength;

  double gain = 1.0;
  for (std::size_t b = 0; b < blocks; ++b) {
    const double target = rms[b] <= threshold ? reduction : 1.0;
    const std::size_t begin = b * block;
    const std::size_t end   = std::min(begin + block, in.Frames());
    for (std::size_t i = begin; i < end; ++i) {
      // one-block linear ramp towards the target gain
      gain += (target - gain) / static_cast<double>(block);
      for (uint16_t c = 0; c < in.channels; ++c) {
        out.samples[i * in.channels + c] = static_cast<float>(out.samples[i * in.channels + c] * gain);
      }
    }
  }
  return out;
}

AudioBuffer Equalize(const AudioBuffer& in, const std::map<double, double>& bands, double q) {
  AudioBuffer out = in;
  for (uint16_t c = 0; c < in.channels; ++c) {
    std::vector<Biquad> filters;
    for (const auto& [freq, gain_db] : bands) {
      // bands above Nyquist have no effect
      if (freq >= in.sample_rate / 2.0) continue;
      filters.push_back(PeakingFilter(in.sample_rate, freq, gain_db, q));
    }

    for (std::size_t i = 0; i < in.Frames(); ++i) {
      float x = out.samples[i * in.channels + c];
      for (auto& f : filters) {
        x = f.Process(x);
      }
      out.samples[i * in.channels + c] = x;
    }
  }
  return out;
}

AudioBuffer Compress(const AudioBuffer& in, double threshold_db, double ratio, double attack_ms, double release_ms) {
  AudioBuffer out = in;

  const double attack  = std::exp(-1.0 / (attack_ms * in.sample_rate / 1000.0));
  const double release = std::exp(-1.0 / (release_ms * in.sample_rate / 1000.0));

  double envelope = 0.0;
  for (std::size_t i = 0; i < in.Frames(); ++i) {
    double level = 0.0;
    for (uint16_t c = 0; c < in.channels; ++c) {
      level = std::max(level, static_cast<double>(std::fabs(in.samples[i * in.channels + c])));
    }

    const double coeff = level > envelope ? attack : release;
    envelope           = coeff * envelope + (1.0 - coeff) * level;

    const double env_db = GainToDb(envelope);
    double       gain   = 1.0;
    if (env_db > threshold_db) {
      const double out_db = threshold_db + (env_db - threshold_db) / ratio;
      gain                = DbToGain(out_db - env_db);
    }

    for (uint16_t c = 0; c < in.channels; ++c) {
      out.samples[i * in.channels + c] = static_cast<float>(in.samples[i * in.channels + c] * gain);
    }
  }
  return out;
}

AudioBuffer Conform(const AudioBuffer& in, uint32_t sample_rate, uint16_t channels) {
  AudioBuffer source = in;
  if (in.sample_rate != sample_rate && in.Frames() > 0) {
    const double step       = static_cast<double>(in.sample_rate) / sample_rate;
    const auto   out_frames = static_cast<std::size_t>(std::floor(static_cast<double>(in.Frames()) / step));
    source                  = Resample(in, step, out_frames);
  }
  source.sample_rate = sample_rate;

  if (source.channels == channels) {
    return source;
  }

  AudioBuffer out = source.EmptyLike();
  out.channels    = channels;
  out.samples.resize(source.Frames() * channels);
  for (std::size_t i = 0; i < source.Frames(); ++i) {
    if (channels == 1) {
      float sum = 0.0f;
      for (uint16_t c = 0; c < source.channels; ++c) sum += source.samples[i * source.channels + c];
      out.samples[i] = sum / static_cast<float>(source.channels);
    } else {
      for (uint16_t c = 0; c < channels; ++c) {
        out.samples[i * channels + c] = source.samples[i * source.channels + std::min<uint16_t>(c, source.channels - 1)];
      }
    }
  }
  return out;
}

AudioBuffer Concatenate(const AudioBuffer& head, const std::vector<AudioBuffer>& tail, double crossfade_ms) {
  AudioBuffer out = head;

  for (const auto& raw : tail) {
    const AudioBuffer part    = Conform(raw, head.sample_rate, head.channels);
    const std::size_t overlap = std::min({head.FrameAt(crossfade_ms), out.Frames(), part.Frames()});
    const std::size_t start   = out.Frames() - overlap;

    for (std::size_t i = 0; i < overlap; ++i) {
      const auto g = static_cast<float>(i + 1) / static_cast<float>(overlap + 1);
      for (uint16_t c = 0; c < head.channels; ++c) {
        auto& s = out.samples[(start + i) * head.channels + c];
        s       = s * (1.0f - g) + part.samples[i * head.channels + c] * g;
      }
    }
    out.samples.insert(out.samples.end(), part.samples.begin() + static_cast<std::ptrdiff_t>(overlap * head.channels), part.samples.end());
  }
  return out;
}

AudioBuffer Segment(const AudioBuffer& in, double segment_ms, std::size_t segment_index) {
  const auto length = std::max<std::size_t>(in.FrameAt(segment_ms), 1);
  const auto count  = in.Frames() / length + (in.Frames() % length == 0 ? 0 : 1);
  if (segment_index >= count) {
    throw std::invalid_argument("segment " + std::to_string(segment_index) + " starts past the end of the audio (" + std::to_string(count) +
                                " segments)");
  }
  const auto begin = length * segment_index;
  return Slice(in, begin, std::min(begin + length, in.Frames()));
}

} // namespace waveq::audio::dsp
