/**
 * @file row_classifier.h
 * @brief Keep/drop decision for a single text value.
 */

#pragma once

#include "babylonify/detector.h"
#include "babylonify/error.h"
#include "babylonify/language.h"

#include <optional>
#include <string>
#include <string_view>

namespace babylonify {

struct ClassifierOptions {
  Language target = CLD2::UKRAINIAN;
  bool clean = false;      ///< Run clean_text() before detection and emit the cleaned value
  bool keep_empty = false; ///< Keep null/empty values without detection
};

struct RowDecision {
  bool keep = false;

  /// False when the value bypassed detection (null or empty).
  bool detected = false;
  Language language = kUndetermined;

  /// Cleaned value. Set only when cleaning ran on a non-empty value.
  std::optional<std::string> cleaned;
};

/**
 * @brief Applies the keep-empty policy, the optional cleaning and the
 * detector to one value.
 *
 * Holds no mutable state; one instance is shared by all workers.
 */
class RowClassifier {
public:
  RowClassifier(const LanguageDetector& detector, ClassifierOptions options)
      : detector_(detector), options_(options) {}

  /// @param text The value, or std::nullopt for null
  Result<RowDecision> classify(std::optional<std::string_view> text) const;

  const ClassifierOptions& options() const { return options_; }

private:
  const LanguageDetector& detector_;
  ClassifierOptions options_;
};

} // namespace babylonify
