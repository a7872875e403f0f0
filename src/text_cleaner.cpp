#include "babylonify/text_cleaner.h"

#include "babylonify/utf8.h"

namespace babylonify {

namespace {

// Punctuation that shows up as markup or noise in transcripts
bool is_stripped_punctuation(uint32_t cp) {
  switch (cp) {
  case '@':
  case '#':
  case '%':
  case '&':
  case '*':
  case '(':
  case ')':
    return true;
  default:
    return false;
  }
}

} // anonymous namespace

std::string clean_text(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  bool pending_space = false;
  // True while the last kept code point is a letter or a mark attached to one
  bool after_letter = false;

  size_t pos = 0;
  while (pos < text.size()) {
    uint32_t cp;
    size_t len = utf8_decode(text, pos, cp);
    std::string_view bytes = text.substr(pos, len);
    pos += len;

    if (cp == kReplacementChar) {
      after_letter = false;
      continue;
    }

    switch (classify_codepoint(cp)) {
    case CodepointClass::WHITESPACE:
      pending_space = !out.empty();
      after_letter = false;
      break;
    case CodepointClass::LETTER:
      if (pending_space) {
        out += ' ';
        pending_space = false;
      }
      out += bytes;
      after_letter = true;
      break;
    case CodepointClass::MARK:
      if (after_letter)
        out += bytes;
      break;
    case CodepointClass::PUNCTUATION:
      after_letter = false;
      if (is_stripped_punctuation(cp))
        break;
      if (pending_space) {
        out += ' ';
        pending_space = false;
      }
      out += bytes;
      break;
    case CodepointClass::OTHER:
      after_letter = false;
      break;
    }
  }

  return out;
}

} // namespace babylonify
