#include <arrow/buffer.h>

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>

#include "internal/audio/audio_buffer.hpp"
#include "internal/audio/dsp.hpp"
#include "support/audio_fixture.hpp"

namespace {

using waveq::audio::AudioBuffer;
using waveq::testing::MakeTone;
namespace dsp = waveq::audio::dsp;

bool Near(double a, double b, double tolerance) {
  return std::fabs(a - b) <= tolerance;
}

void TestWavRoundTripKeepsLayout() {
  AudioBuffer stereo = MakeTone(100, 0.5, 16000);
  stereo.channels    = 2;

  auto encoded = waveq::audio::EncodeWav(stereo);
  auto decoded = waveq::audio::DecodeWav(*encoded);

  assert(decoded.sample_rate == 16000);
  assert(decoded.channels == 2);
  assert(decoded.samples.size() == stereo.samples.size());
  // 16-bit quantization
  for (std::size_t i = 0; i < decoded.samples.size(); i += 97) {
    assert(Near(decoded.samples[i], stereo.samples[i], 1.0 / 16384));
  }
}

void TestDecodeRejectsGarbage() {
  auto garbage = arrow::Buffer::FromString(std::string("definitely not a RIFF header"));
  bool thrown  = false;
  try {
    waveq::audio::DecodeWav(*garbage);
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);
}

void TestTrimWindow() {
  auto tone = MakeTone(1000);

  auto middle = dsp::Trim(tone, 250, 750);
  assert(Near(middle.DurationMs(), 500, 0.5));

  // end past the audio is clamped
  auto tail = dsp::Trim(tone, 900, 5000);
  assert(Near(tail.DurationMs(), 100, 0.5));

  bool thrown = false;
  try {
    dsp::Trim(tone, 2000, 3000);
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);
}

void TestNormalizeHitsPeakTarget() {
  auto quiet = MakeTone(200, 0.05);
  auto loud  = dsp::Normalize(quiet, -6.0);
  assert(Near(dsp::PeakDb(loud), -6.0, 0.05));

  AudioBuffer silence = MakeTone(200, 0.0);
  auto        same    = dsp::Normalize(silence, -1.0);
  assert(dsp::PeakDb(same) <= -119.0);
}

void TestFadesReachSilenceAtTheEdges() {
  auto tone = MakeTone(1000, 0.5);

  auto in = dsp::FadeIn(tone, 500);
  assert(in.samples.front() == 0.0f);
  assert(in.Frames() == tone.Frames());

  auto out = dsp::FadeOut(tone, 500);
  assert(std::fabs(out.samples.back()) < 1e-6f);
  // untouched outside the fade window
  assert(out.samples[10] == tone.samples[10]);
}

void TestSpeedChangesDuration() {
  auto tone = MakeTone(1000);
  assert(Near(dsp::ChangeSpeed(tone, 2.0).DurationMs(), 500, 1));
  assert(Near(dsp::ChangeSpeed(tone, 0.5).DurationMs(), 2000, 1));
}

void TestPitchShiftKeepsDuration() {
  auto tone    = MakeTone(500);
  auto shifted = dsp::PitchShift(tone, 5);
  assert(shifted.Frames() == tone.Frames());
  assert(dsp::PitchShift(tone, 0).samples == tone.samples);
}

void TestEqualizeBoostRaisesLevel() {
  auto tone    = MakeTone(500, 0.1, 8000, 1000);
  auto boosted = dsp::Equalize(tone, std::map<double, double>{{1000.0, 12.0}}, 1.0);
  assert(dsp::PeakDb(boosted) > dsp::PeakDb(tone) + 6.0);

  // band above Nyquist is ignored
  auto ignored = dsp::Equalize(tone, std::map<double, double>{{6000.0, 12.0}}, 1.0);
  assert(ignored.samples == tone.samples);
}

void TestCompressReducesPeaks() {
  auto tone       = MakeTone(500, 0.9);
  auto compressed = dsp::Compress(tone, -20.0, 8.0, 0.1, 50.0);
  assert(dsp::PeakDb(compressed) < dsp::PeakDb(tone) - 3.0);
}

void TestReverbAndNoiseKeepLength() {
  auto tone = MakeTone(300);
  assert(dsp::Reverb(tone, 0.8, 0.5, 0.4).Frames() == tone.Frames());
  assert(dsp::ReduceNoise(tone, 0.5).Frames() == tone.Frames());
  assert(dsp::ReduceNoise(tone, 0.0).samples == tone.samples);
}

void TestConcatenateConformsAndCrossfades() {
  auto head = MakeTone(1000, 0.25, 8000);
  auto tail     = MakeTone(1000, 0.25, 16000);
  tail.channels = 2;
  tail.samples.resize(tail.samples.size() - tail.samples.size() % 2);

  auto joined = dsp::Concatenate(head, {tail}, 0);
  assert(joined.sample_rate == 8000);
  assert(joined.channels == 1);
  assert(Near(joined.DurationMs(), 1500, 2));

  auto faded = dsp::Concatenate(head, {MakeTone(1000)}, 100);
  assert(Near(faded.DurationMs(), 1900, 1));
}

void TestSegmentSelection() {
  auto tone = MakeTone(2500);

  assert(Near(dsp::Segment(tone, 1000, 0).DurationMs(), 1000, 0.5));
  assert(Near(dsp::Segment(tone, 1000, 2).DurationMs(), 500, 0.5));

  bool thrown = false;
  try {
    dsp::Segment(tone, 1000, 3);
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);

  // length * index would wrap to frame 0
  for (std::size_t huge : {std::size_t{1} << 62, std::numeric_limits<std::size_t>::max()}) {
    thrown = false;
    try {
      dsp::Segment(tone, 1000, huge);
    } catch (const std::invalid_argument&) {
      thrown = true;
    }
    assert(thrown);
  }
}

void TestConformChangesLayout() {
  auto tone = MakeTone(500, 0.25, 8000);

  auto stereo = dsp::Conform(tone, 16000, 2);
  assert(stereo.sample_rate == 16000);
  assert(stereo.channels == 2);
  assert(Near(stereo.DurationMs(), 500, 1));
  assert(stereo.samples[200] == stereo.samples[201]);

  auto back = dsp::Conform(stereo, 8000, 1);
  assert(back.channels == 1);
  assert(Near(back.DurationMs(), 500, 1));
}

} // namespace

int main() {
  TestWavRoundTripKeepsLayout();
  TestDecodeRejectsGarbage();
  TestTrimWindow();
  TestNormalizeHitsPeakTarget();
  TestFadesReachSilenceAtTheEdges();
  TestSpeedChangesDuration();
  TestPitchShiftKeepsDuration();
  TestEqualizeBoostRaisesLevel();
  TestCompressReducesPeaks();
  TestReverbAndNoiseKeepLength();
  TestConcatenateConformsAndCrossfades();
  TestSegmentSelection();
  TestConformChangesLayout();

  std::cout << "waveq_unit_audio_dsp: pass\n";
  return 0;
}
