#include "audio_buffer.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace waveq::audio {

namespace {

constexpr uint16_t kFormatPcm   = 1;
constexpr uint16_t kFormatFloat = 3;

uint16_t ReadU16(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t ReadU32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

void WriteU16(std::string* out, uint16_t v) {
  out->push_back(static_cast<char>(v & 0xFF));
  out->push_back(static_cast<char>((v >> 8) & 0xFF));
}

void WriteU32(std::string* out, uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    out->push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
  }
}

float DecodeSample(const uint8_t* p, uint16_t format, uint16_t bits) {
  if (format == kFormatFloat) {
    float v;
    const uint32_t raw = ReadU32(p);
    std::memcpy(&v, &raw, sizeof(v));
    return v;
  }

  switch (bits) {
    case 8:
      return (static_cast<int>(p[0]) - 128) / 128.0f;
    case 16:
      return static_cast<int16_t>(ReadU16(p)) / 32768.0f;
    case 24: {
      int32_t v = p[0] | (p[1] << 8) | (p[2] << 16);
      if (v & 0x800000) v |= ~0xFFFFFF;
      return v / 8388608.0f;
    }
    case 32:
      return static_cast<int32_t>(ReadU32(p)) / 2147483648.0f;
    default:
      throw std::invalid_argument("unsupported WAV bit depth " + std::to_string(bits));
  }
}

} // namespace

std::size_t AudioBuffer::FrameAt(double ms) const {
  if (ms <= 0.0) {
    return 0;
  }
  const double frame = std::round(ms * sample_rate / 1000.0);
  return std::min(static_cast<std::size_t>(frame), Frames());
}

AudioBuffer AudioBuffer::EmptyLike() const {
  AudioBuffer out;
  out.sample_rate = sample_rate;
  out.channels    = channels;
  out.format      = format;
  out.quality     = quality;
  return out;
}

AudioBuffer DecodeWav(const arrow::Buffer& bytes) {
  const uint8_t* data = bytes.data();
  const auto     size = static_cast<std::size_t>(bytes.size());

  if (size < 12 || std::memcmp(data, "RIFF", 4) != 0 || std::memcmp(data + 8, "WAVE", 4) != 0) {
    throw std::invalid_argument("not a RIFF/WAVE stream");
  }

  bool     have_fmt = false;
  uint16_t format   = 0;
  uint16_t channels = 0;
  uint32_t rate     = 0;
  uint16_t bits     = 0;

  std::size_t pos = 12;
  while (pos + 8 <= size) {
    const uint8_t* chunk      = data + pos;
    const uint32_t chunk_size = ReadU32(chunk + 4);
    const auto     body       = pos + 8;
    if (body + chunk_size > size) {
      throw std::invalid_argument("truncated WAV chunk");
    }

    if (std::memcmp(chunk, "fmt ", 4) == 0) {
      if (chunk_size < 16) throw std::invalid_argument("short WAV fmt chunk");
      format   = ReadU16(data + body);
      channels = ReadU16(data + body + 2);
      rate     = ReadU32(data + body + 4);
      bits     = ReadU16(data + body + 14);
      if (format == 0xFFFE && chunk_size >= 26) {
        // WAVE_FORMAT_EXTENSIBLE: sub-format GUID starts with the real tag
        format = ReadU16(data + body + 24);
      }
      have_fmt = true;
    } else if (std::memcmp(chunk, "data", 4) == 0) {
      if (!have_fmt) throw std::invalid_argument("WAV data chunk before fmt chunk");
      if (format != kFormatPcm && format != kFormatFloat) {
        throw std::invalid_argument("unsupported WAV encoding " + std::to_string(format));
      }
      if (format == kFormatFloat && bits != 32) {
        throw std::invalid_argument("unsupported float WAV bit depth " + std::to_string(bits));
      }
      if (channels == 0 || rate == 0 || bits == 0 || bits % 8 != 0) {
        throw std::invalid_argument("invalid WAV format header");
      }

      AudioBuffer out;
      out.sample_rate = rate;
      out.channels    = channels;

      const std::size_t width  = bits / 8;
      const std::size_t count  = chunk_size / width;
      out.samples.reserve(count - count % channels);
      for (std::size_t i = 0; i + channels <= count; i += channels) {
        for (std::size_t c = 0; c < channels; ++c) {
          out.samples.push_back(DecodeSample(data + body + (i + c) * width, format, bits));
        }
      }
      return out;
    }

    pos = body + chunk_size + (chunk_size & 1);
  }

  throw std::invalid_argument("WAV stream has no data chunk");
}

std::shared_ptr<arrow::Buffer> EncodeWav(const AudioBuffer& audio) {
  const uint16_t bits        = 16;
  const uint16_t block_align = static_cast<uint16_t>(audio.channels * bits / 8);
  const uint32_t data_size   = static_cast<uint32_t>(audio.samples.size() * (bits / 8));

  std::string out;
  out.reserve(44 + data_size);

  out.append("RIFF");
  WriteU32(&out, 36 + data_size);
  out.append("WAVE");

  out.append("fmt ");
  WriteU32(&out, 16);
  WriteU16(&out, kFormatPcm);
  WriteU16(&out, audio.channels);
  WriteU32(&out, audio.sample_rate);
  WriteU32(&out, audio.sample_rate * block_align);
  WriteU16(&out, block_align);
  WriteU16(&out, bits);

  out.append("data");
  WriteU32(&out, data_size);
  for (float s : audio.samples) {
    const float clamped = std::clamp(s, -1.0f, 1.0f);
    const auto  v       = static_cast<int16_t>(std::lrint(clamped * 32767.0f));
    WriteU16(&out, static_cast<uint16_t>(v));
  }

  return arrow::Buffer::FromString(std::move(out));
}

} // namespace waveq::audio
