#pragma once
/**
 * @file utf8.hpp
 * @brief UTF-8 decoding and script classification
 */

#include <cstddef>
#include <string>
#include <string_view>

namespace WordCard::Text {

constexpr char32_t kReplacementCharacter = 0xFFFD;

/// Decoded code point and how many bytes it consumed
struct Utf8DecodeResult {
  char32_t code_point;
  size_t length;
};

/// Decode the first code point of @p data (invalid bytes -> U+FFFD)
[[nodiscard]] Utf8DecodeResult utf8_decode(std::string_view data) noexcept;

/// Decode a whole string
[[nodiscard]] std::u32string utf8_to_u32(std::string_view text);

/// Encode code points back to UTF-8
[[nodiscard]] std::string u32_to_utf8(std::u32string_view text);

/// CJK ideographs, kana, hangul, CJK punctuation and fullwidth forms
[[nodiscard]] bool is_cjk(char32_t cp) noexcept;

/// Breakable whitespace for line wrapping
[[nodiscard]] bool is_space(char32_t cp) noexcept;

/// Trim ASCII whitespace on both ends
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

} // namespace WordCard::Text
