#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/interpreter/keyword_classifier.hpp"

namespace {

using waveq::engine::v1::RawOperation;
using waveq::interpreter::KeywordClassifier;

double Number(const RawOperation& op, const std::string& key) {
  return op.parameters().fields().at(key).number_value();
}

std::string Text(const RawOperation& op, const std::string& key) {
  return op.parameters().fields().at(key).string_value();
}

void TestTrimAndNormalizeWithUnits() {
  KeywordClassifier classifier;
  auto              ops = classifier.Guess("Trim from 2 seconds to 10 seconds and normalize to -3 dB");

  assert(ops.size() == 2);
  assert(ops[0].name() == "trim");
  assert(Number(ops[0], "start_ms") == 2000.0);
  assert(Number(ops[0], "end_ms") == 10000.0);
  assert(ops[1].name() == "normalize");
  assert(Number(ops[1], "target_db") == -3.0);
}

void TestSingleTimeTrimsFromStart() {
  KeywordClassifier classifier;
  auto              ops = classifier.Guess("extract the first 1.5 minutes");

  assert(ops.size() == 1);
  assert(Number(ops[0], "start_ms") == 0.0);
  assert(Number(ops[0], "end_ms") == 90000.0);
}

void TestSpeedRatioDirection() {
  KeywordClassifier classifier;

  auto faster = classifier.Guess("speed it up 2x");
  assert(faster.size() == 1 && faster[0].name() == "speed_change");
  assert(Number(faster[0], "factor") == 2.0);

  auto slower = classifier.Guess("slow down 2x");
  assert(slower.size() == 1);
  assert(Number(slower[0], "factor") == 0.5);

  auto vague = classifier.Guess("make it faster");
  assert(Number(vague[0], "factor") == 1.5);
}

void TestPitchDirectionFollowsWording() {
  KeywordClassifier classifier;

  auto lower = classifier.Guess("lower the pitch by 3 semitones");
  assert(lower.size() == 1 && lower[0].name() == "pitch_change");
  assert(Number(lower[0], "semitones") == -3.0);

  auto raise = classifier.Guess("raise pitch 2 semitones");
  assert(Number(raise[0], "semitones") == 2.0);
}

void TestBassAndTrebleBecomeBands() {
  KeywordClassifier classifier;

  auto boost = classifier.Guess("boost the bass and treble");
  assert(boost.size() == 1 && boost[0].name() == "equalize");
  const auto& bands = boost[0].parameters().fields().at("bands").struct_value().fields();
  assert(bands.at("100").number_value() == 6.0);
  assert(bands.at("8000").number_value() == 6.0);

  // "cut" here is about the bass, not a trim
  auto cut = classifier.Guess("cut the bass");
  assert(cut.size() == 1 && cut[0].name() == "equalize");
  assert(cut[0].parameters().fields().at("bands").struct_value().fields().at("100").number_value() == -6.0);
}

void TestFormatAndQuality() {
  KeywordClassifier classifier;

  auto ops = classifier.Guess("export as FLAC, high quality");
  assert(ops.size() == 1 && ops[0].name() == "convert_format");
  assert(Text(ops[0], "format") == "flac");
  assert(Text(ops[0], "quality") == "high");

  auto fallback = classifier.Guess("convert it");
  assert(Text(fallback[0], "format") == "mp3");
}

void TestFadeDuration() {
  KeywordClassifier classifier;
  auto              ops = classifier.Guess("fade in over 500ms");
  assert(ops.size() == 1 && ops[0].name() == "fade_in");
  assert(Number(ops[0], "duration_ms") == 500.0);
}

void TestNothingRecognized() {
  KeywordClassifier classifier;
  assert(classifier.Guess("make it sound nice").empty());
}

} // namespace

int main() {
  TestTrimAndNormalizeWithUnits();
  TestSingleTimeTrimsFromStart();
  TestSpeedRatioDirection();
  TestPitchDirectionFollowsWording();
  TestBassAndTrebleBecomeBands();
  TestFormatAndQuality();
  TestFadeDuration();
  TestNothingRecognized();

  std::cout << "waveq_unit_keyword_classifier: pass\n";
  return 0;
}
