#include "keyword_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace waveq::interpreter {

using waveq::engine::v1::RawOperation;

namespace {

struct KeywordRule {
  const char*                   kind;
  std::vector<std::string_view> phrases;
};

const std::vector<KeywordRule>& Rules() {
  static const std::vector<KeywordRule> rules = {
      {"trim", {"trim", "cut from", "slice", "extract"}},
      {"normalize", {"normalize", "normalise", "fix levels", "fix the levels", "level the"}},
      {"fade_in", {"fade in", "fade-in", "gradual start", "smooth start", "smooth the beginning"}},
      {"fade_out", {"fade out", "fade-out", "gradual end", "smooth end", "smooth the ending"}},
      {"speed_change", {"speed", "tempo", "faster", "slower", "slow down"}},
      {"pitch_change", {"pitch", "semitone"}},
      {"reverb", {"reverb", "echo", "cathedral"}},
      {"noise_reduction", {"noise", "denoise", "hiss", "static"}},
      {"equalize", {"equalize", "equalise", "bass", "treble"}},
      {"compress", {"compress", "dynamic range", "squash"}},
      {"merge", {"merge", "combine", "join", "concatenate"}},
      {"split", {"split", "divide", "segments"}},
      {"convert_format", {"convert", "export", "save as"}},
  };
  return rules;
}

bool Contains(const std::string& text, std::string_view needle) {
  return text.find(needle) != std::string::npos;
}

void SetNumber(RawOperation* op, const std::string& key, double v) {
  (*op->mutable_parameters()->mutable_fields())[key].set_number_value(v);
}

void SetText(RawOperation* op, const std::string& key, const std::string& v) {
  (*op->mutable_parameters()->mutable_fields())[key].set_string_value(v);
}

double UnitToMs(const std::string& unit) {
  if (unit.rfind("ms", 0) == 0 || unit.rfind("milli", 0) == 0) return 1.0;
  if (unit.rfind("min", 0) == 0) return 60000.0;
  if (unit.rfind("h", 0) == 0) return 3600000.0;
  return 1000.0;
}

} // namespace

KeywordClassifier::KeywordClassifier()
    : time_(R"((\d+(?:\.\d+)?)\s*(milliseconds?|ms|seconds?|secs?|s\b|minutes?|mins?|hours?|hrs?))", std::regex::icase),
      db_(R"((-?\d+(?:\.\d+)?)\s*db)", std::regex::icase),
      ratio_(R"((\d+(?:\.\d+)?)\s*x\b)", std::regex::icase),
      semitone_(R"((\d+)\s*semitones?)", std::regex::icase),
      format_(R"(\b(wav|mp3|flac|aac|ogg)\b)", std::regex::icase),
      quality_(R"((low|medium|high)\s*quality)", std::regex::icase) {
}

std::vector<RawOperation> KeywordClassifier::Guess(const std::string& instruction) const {
  std::string text = instruction;
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  std::vector<double> times_ms;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), time_); it != std::sregex_iterator(); ++it) {
    times_ms.push_back(std::stod((*it)[1].str()) * UnitToMs((*it)[2].str()));
  }

  const bool lowering = Contains(text, "lower") || Contains(text, "down") || Contains(text, "reduce") || Contains(text, "cut ");

  std::vector<RawOperation> out;
  for (const auto& rule : Rules()) {
    const bool matched = std::any_of(rule.phrases.begin(), rule.phrases.end(), [&](std::string_view p) { return Contains(text, p); });
    if (!matched) {
      continue;
    }

    RawOperation op;
    op.set_name(rule.kind);
    const std::string_view kind = rule.kind;
    std::smatch            m;

    if (kind == "trim") {
      if (times_ms.size() >= 2) {
        SetNumber(&op, "start_ms", times_ms[0]);
        SetNumber(&op, "end_ms", times_ms[1]);
      } else if (times_ms.size() == 1) {
        SetNumber(&op, "start_ms", 0.0);
        SetNumber(&op, "end_ms", times_ms[0]);
      }
    } else if (kind == "normalize") {
      if (std::regex_search(text, m, db_)) SetNumber(&op, "target_db", std::stod(m[1].str()));
    } else if (kind == "fade_in" || kind == "fade_out") {
      if (!times_ms.empty()) SetNumber(&op, "duration_ms", times_ms.front());
    } else if (kind == "speed_change") {
      if (std::regex_search(text, m, ratio_)) {
        double factor = std::stod(m[1].str());
        if ((Contains(text, "slow") || Contains(text, "down")) && factor > 0.0) factor = 1.0 / factor;
        SetNumber(&op, "factor", factor);
      } else if (Contains(text, "fast") || Contains(text, "speed up")) {
        SetNumber(&op, "factor", 1.5);
      } else if (Contains(text, "slow")) {
        SetNumber(&op, "factor", 0.8);
      }
    } else if (kind == "pitch_change") {
      if (std::regex_search(text, m, semitone_)) {
        const double steps = std::stod(m[1].str());
        SetNumber(&op, "semitones", lowering ? -steps : steps);
      }
    } else if (kind == "equalize") {
      auto* bands = (*op.mutable_parameters()->mutable_fields())["bands"].mutable_struct_value()->mutable_fields();
      const double gain = lowering ? -6.0 : 6.0;
      if (Contains(text, "bass")) (*bands)["100"].set_number_value(gain);
      if (Contains(text, "treble")) (*bands)["8000"].set_number_value(gain);
    } else if (kind == "convert_format") {
      SetText(&op, "format", std::regex_search(text, m, format_) ? m[1].str() : "mp3");
      if (std::regex_search(text, m, quality_)) SetText(&op, "quality", m[1].str());
    } else if (kind == "split") {
      if (!times_ms.empty()) SetNumber(&op, "segment_ms", times_ms.front());
    }

    out.push_back(std::move(op));
  }

  return out;
}

} // namespace waveq::interpreter
