/**
 * @file utf8.h
 * @brief UTF-8 decoding and code point classification.
 *
 * Decoding is done by hand; Unicode properties (general category,
 * White_Space, East Asian width) come from ICU.
 *
 * @see utf8_decode() for walking a string one code point at a time
 * @see classify_codepoint() for the classes the text cleaner keeps or drops
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace babylonify {

/// Replacement character returned for invalid sequences.
inline constexpr uint32_t kReplacementChar = 0xFFFD;

/**
 * @brief Decode a UTF-8 sequence starting at the given position.
 *
 * @param str The UTF-8 string
 * @param pos Starting byte position
 * @param[out] codepoint The decoded code point (0xFFFD for invalid sequences)
 * @return The number of bytes consumed (1-4, 1 for an invalid lead byte,
 *         0 when pos is past the end)
 */
size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint);

/// Coarse Unicode classes relevant to text cleaning.
enum class CodepointClass {
  LETTER,      ///< General category L*
  MARK,        ///< General category M* (combining marks)
  PUNCTUATION, ///< General category P*
  WHITESPACE,  ///< Unicode White_Space property
  OTHER        ///< Digits, symbols, emoji, controls, unassigned
};

CodepointClass classify_codepoint(uint32_t codepoint);

/**
 * @brief Get the display width of a Unicode code point.
 *
 * @return 0 for controls, format characters and combining marks, 2 for wide
 *         and fullwidth characters, 1 otherwise
 */
int codepoint_width(uint32_t codepoint);

/// Sum of codepoint_width() over the string. Invalid bytes count as 1.
size_t utf8_display_width(std::string_view str);

/**
 * @brief Truncate a UTF-8 string to fit within a maximum display width.
 *
 * Never splits a multi-byte sequence. When truncation happens and there is
 * room, "..." is appended and counted against max_width.
 */
std::string utf8_truncate(std::string_view str, size_t max_width);

} // namespace babylonify
