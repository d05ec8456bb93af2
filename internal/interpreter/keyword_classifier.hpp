#pragma once

#include <regex>

#include "classifier.hpp"

namespace waveq::interpreter {

/*
  Keyword and pattern matcher.

  Recognizes operations by phrase and pulls parameters from time, dB,
  ratio, semitone, format and quality patterns. Operations whose required
  parameters cannot be recovered are still emitted; validation decides.
*/
class KeywordClassifier final : public Classifier {
 public:
  KeywordClassifier();

  std::vector<waveq::engine::v1::RawOperation> Guess(const std::string& instruction) const override;

 private:
  std::regex time_;
  std::regex db_;
  std::regex ratio_;
  std::regex semitone_;
  std::regex format_;
  std::regex quality_;
};

} // namespace waveq::interpreter
