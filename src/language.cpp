#include "babylonify/language.h"

#include <unicode/unistr.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace babylonify {

namespace {

struct LanguageAlias {
  std::string_view alias;
  Language language;
};

// Keys are stored case-folded.
constexpr std::array<LanguageAlias, 30> kAliases = {{
    {"uk", CLD2::UKRAINIAN},
    {"ukr", CLD2::UKRAINIAN},
    {"ukrainian", CLD2::UKRAINIAN},
    {"українська", CLD2::UKRAINIAN},
    {"en", CLD2::ENGLISH},
    {"eng", CLD2::ENGLISH},
    {"english", CLD2::ENGLISH},
    {"ru", CLD2::RUSSIAN},
    {"rus", CLD2::RUSSIAN},
    {"russian", CLD2::RUSSIAN},
    {"русский", CLD2::RUSSIAN},
    {"pl", CLD2::POLISH},
    {"pol", CLD2::POLISH},
    {"polish", CLD2::POLISH},
    {"polski", CLD2::POLISH},
    {"de", CLD2::GERMAN},
    {"deu", CLD2::GERMAN},
    {"ger", CLD2::GERMAN},
    {"german", CLD2::GERMAN},
    {"deutsch", CLD2::GERMAN},
    {"fr", CLD2::FRENCH},
    {"fra", CLD2::FRENCH},
    {"fre", CLD2::FRENCH},
    {"french", CLD2::FRENCH},
    {"français", CLD2::FRENCH},
    {"es", CLD2::SPANISH},
    {"spa", CLD2::SPANISH},
    {"spanish", CLD2::SPANISH},
    {"español", CLD2::SPANISH},
    {"espanol", CLD2::SPANISH},
}};

std::string fold_token(std::string_view token) {
  icu::UnicodeString ustr =
      icu::UnicodeString::fromUTF8(icu::StringPiece(token.data(), static_cast<int32_t>(token.size())));
  ustr.trim();
  ustr.foldCase();
  std::string folded;
  ustr.toUTF8String(folded);
  return folded;
}

// CLD2 names are upper case with underscores ("SCOTS_GAELIC")
std::string normalize_name(std::string_view name) {
  std::string out(name);
  for (auto& c : out) {
    if (c == ' ' || c == '-')
      c = '_';
    else
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

bool is_selectable(Language lang) {
  if (lang == kUndetermined)
    return false;
  const char* name = CLD2::LanguageName(lang);
  return name != nullptr && name[0] != '\0';
}

} // anonymous namespace

Result<Language> resolve_language(std::string_view token) {
  std::string key = fold_token(token);
  if (key.empty())
    return Result<Language>::failure(ErrorCode::UNKNOWN_LANGUAGE, "Unknown language: ''");

  for (const auto& entry : kAliases) {
    if (entry.alias == key)
      return Result<Language>::success(entry.language);
  }

  std::string name_key = normalize_name(key);
  for (int i = 0; i < CLD2::NUM_LANGUAGES; ++i) {
    auto lang = static_cast<Language>(i);
    if (is_selectable(lang) && normalize_name(CLD2::LanguageName(lang)) == name_key)
      return Result<Language>::success(lang);
  }

  for (int i = 0; i < CLD2::NUM_LANGUAGES; ++i) {
    auto lang = static_cast<Language>(i);
    const char* code = CLD2::LanguageCode(lang);
    if (is_selectable(lang) && code != nullptr && key == code)
      return Result<Language>::success(lang);
  }

  return Result<Language>::failure(ErrorCode::UNKNOWN_LANGUAGE,
                                   "Unknown language: '" + std::string(token) + "'");
}

std::string language_display_name(Language lang) {
  const char* raw = CLD2::LanguageName(lang);
  std::string name = raw ? raw : "";
  bool word_start = true;
  for (auto& c : name) {
    if (c == '_') {
      c = ' ';
      word_start = true;
    } else if (word_start) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      word_start = false;
    } else {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }
  return name;
}

std::string language_code(Language lang) {
  const char* code = CLD2::LanguageCode(lang);
  return code ? code : "";
}

} // namespace babylonify
