/**
 * @file text_cleaner.h
 * @brief Strip everything but letters and punctuation from transcription text.
 */

#pragma once

#include <string>
#include <string_view>

namespace babylonify {

/**
 * @brief Clean a text value before language detection.
 *
 * Keeps letters, punctuation and combining marks attached to a kept letter.
 * Digits, symbols, emoji and control characters are removed, as are the
 * markup-like punctuation characters @ # % & * ( ). Whitespace runs collapse
 * to one ASCII space and the result is trimmed.
 *
 * Works on whole code points; invalid UTF-8 bytes are dropped. The function
 * is idempotent.
 *
 * @code
 * clean_text("Hello, world! 123 \n\t Привіт, світ! @#$%^&*() 456");
 * // "Hello, world! Привіт, світ!"
 * @endcode
 */
std::string clean_text(std::string_view text);

} // namespace babylonify
