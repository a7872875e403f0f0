#include "babylonify/row_classifier.h"

#include "babylonify/text_cleaner.h"

namespace babylonify {

Result<RowDecision> RowClassifier::classify(std::optional<std::string_view> text) const {
  RowDecision decision;

  if (!text.has_value() || text->empty()) {
    decision.keep = options_.keep_empty;
    return Result<RowDecision>::success(std::move(decision));
  }

  std::string_view input = *text;
  if (options_.clean) {
    decision.cleaned = clean_text(input);
    input = *decision.cleaned;
    // Nothing left to detect: same policy as an empty value
    if (input.empty()) {
      decision.keep = options_.keep_empty;
      return Result<RowDecision>::success(std::move(decision));
    }
  }

  auto detected = detector_.detect(input);
  if (!detected.ok)
    return Result<RowDecision>::failure(detected.error);

  decision.detected = true;
  decision.language = detected.value;
  decision.keep = detected.value != kUndetermined && detected.value == options_.target;
  return Result<RowDecision>::success(std::move(decision));
}

} // namespace babylonify
