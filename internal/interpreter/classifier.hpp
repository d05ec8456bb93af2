#pragma once

#include <string>
#include <vector>

#include "waveq/engine/v1/types.pb.h"

namespace waveq::interpreter {

/*
  Best-effort guess of an operation chain from free text.

  Output is untrusted: the interpreter validates it exactly like
  caller-supplied operations.
*/
class Classifier {
 public:
  virtual ~Classifier() = default;

  virtual std::vector<waveq::engine::v1::RawOperation> Guess(const std::string& instruction) const = 0;
};

} // namespace waveq::interpreter
