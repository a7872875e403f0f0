/**
 * @file utf8.cpp
 * @brief Implementation of UTF-8 decoding and code point classification.
 */

#include "babylonify/utf8.h"

#include <unicode/uchar.h>

namespace babylonify {

size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint) {
  if (pos >= str.size()) {
    codepoint = kReplacementChar;
    return 0;
  }

  uint8_t byte = static_cast<uint8_t>(str[pos]);

  // ASCII (0xxxxxxx)
  if ((byte & 0x80) == 0) {
    codepoint = byte;
    return 1;
  }

  size_t len;
  uint32_t cp;

  if ((byte & 0xE0) == 0xC0) {
    len = 2;
    cp = byte & 0x1F;
  } else if ((byte & 0xF0) == 0xE0) {
    len = 3;
    cp = byte & 0x0F;
  } else if ((byte & 0xF8) == 0xF0) {
    len = 4;
    cp = byte & 0x07;
  } else {
    // Stray continuation byte or invalid lead byte
    codepoint = kReplacementChar;
    return 1;
  }

  if (pos + len > str.size()) {
    codepoint = kReplacementChar;
    return 1;
  }

  for (size_t i = 1; i < len; ++i) {
    uint8_t cont = static_cast<uint8_t>(str[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      codepoint = kReplacementChar;
      return 1;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }

  // Overlong encodings, surrogates and values past U+10FFFF
  if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
      (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    codepoint = kReplacementChar;
    return len;
  }

  codepoint = cp;
  return len;
}

CodepointClass classify_codepoint(uint32_t codepoint) {
  auto c = static_cast<UChar32>(codepoint);
  if (u_isUWhiteSpace(c))
    return CodepointClass::WHITESPACE;

  uint32_t mask = U_GET_GC_MASK(c);
  if (mask & U_GC_L_MASK)
    return CodepointClass::LETTER;
  if (mask & U_GC_M_MASK)
    return CodepointClass::MARK;
  if (mask & U_GC_P_MASK)
    return CodepointClass::PUNCTUATION;
  return CodepointClass::OTHER;
}

int codepoint_width(uint32_t codepoint) {
  auto c = static_cast<UChar32>(codepoint);
  uint32_t mask = U_GET_GC_MASK(c);
  if (mask & (U_GC_CC_MASK | U_GC_CF_MASK | U_GC_MN_MASK | U_GC_ME_MASK))
    return 0;

  int eaw = u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH);
  if (eaw == U_EA_WIDE || eaw == U_EA_FULLWIDTH)
    return 2;
  // Emoji presentation characters render wide in terminals
  if (u_hasBinaryProperty(c, UCHAR_EMOJI_PRESENTATION))
    return 2;
  return 1;
}

size_t utf8_display_width(std::string_view str) {
  size_t width = 0;
  size_t pos = 0;
  while (pos < str.size()) {
    uint32_t cp;
    size_t len = utf8_decode(str, pos, cp);
    width += (cp == kReplacementChar && len == 1) ? 1 : codepoint_width(cp);
    pos += len;
  }
  return width;
}

std::string utf8_truncate(std::string_view str, size_t max_width) {
  if (utf8_display_width(str) <= max_width)
    return std::string(str);

  constexpr size_t ellipsis_width = 3;
  size_t budget = max_width > ellipsis_width ? max_width - ellipsis_width : max_width;

  size_t width = 0;
  size_t pos = 0;
  while (pos < str.size()) {
    uint32_t cp;
    size_t len = utf8_decode(str, pos, cp);
    int w = (cp == kReplacementChar && len == 1) ? 1 : codepoint_width(cp);
    if (width + w > budget)
      break;
    width += w;
    pos += len;
  }

  std::string result(str.substr(0, pos));
  if (max_width > ellipsis_width)
    result += "...";
  return result;
}

} // namespace babylonify
