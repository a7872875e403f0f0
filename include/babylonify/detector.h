/**
 * @file detector.h
 * @brief Language detector interface and the CLD2-backed implementation.
 */

#pragma once

#include "babylonify/error.h"
#include "babylonify/language.h"

#include <string_view>

namespace babylonify {

/**
 * @brief Maps a text value to the detector's best-guess language.
 *
 * Implementations must be deterministic for identical input and safe to
 * call concurrently from every worker of the pool: detect() is const and the
 * pipeline shares one instance across threads without locking.
 */
class LanguageDetector {
public:
  virtual ~LanguageDetector() = default;

  /// Best guess, or kUndetermined when the text carries no usable signal.
  virtual Result<Language> detect(std::string_view text) const = 0;
};

/**
 * @brief CLD2 (Compact Language Detector 2) detector.
 *
 * CLD2 scores text against static tables compiled into the library, so a
 * single instance has no mutable state. Input that is not valid UTF-8 is
 * reported as DETECTION_ERROR rather than guessed.
 */
class Cld2Detector : public LanguageDetector {
public:
  Result<Language> detect(std::string_view text) const override;
};

} // namespace babylonify
