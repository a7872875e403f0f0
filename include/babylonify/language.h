/**
 * @file language.h
 * @brief Mapping user language tokens to detector languages.
 */

#pragma once

#include "babylonify/error.h"

#include <cld2/public/compact_lang_det.h>

#include <string>
#include <string_view>

namespace babylonify {

/// Languages are the detector's own enumeration.
using Language = CLD2::Language;

/// "Undetermined" outcome of detection; never a valid target.
inline constexpr Language kUndetermined = CLD2::UNKNOWN_LANGUAGE;

/**
 * @brief Resolve a user-supplied language token.
 *
 * The token is trimmed and case-folded, then matched against, in order:
 * 1. the curated alias table (ISO 639-1/639-2 codes, English and native
 *    names of Ukrainian, English, Russian, Polish, German, French, Spanish);
 * 2. the detector's English language names ("dutch", "scots gaelic");
 * 3. the detector's language codes ("nl", "it").
 *
 * @return The language, or UNKNOWN_LANGUAGE error "Unknown language: '<token>'"
 */
Result<Language> resolve_language(std::string_view token);

/// Title-cased English name, e.g. "Ukrainian", "Scots Gaelic".
std::string language_display_name(Language lang);

/// Detector language code, e.g. "uk".
std::string language_code(Language lang);

} // namespace babylonify
