/**
 * @file utf8.cpp
 * @brief UTF-8 codec and CJK classification
 */

#include "text/utf8.hpp"

namespace WordCard::Text {

Utf8DecodeResult utf8_decode(std::string_view data) noexcept {
  if (data.empty()) {
    return {kReplacementCharacter, 0};
  }

  auto byte = static_cast<unsigned char>(data[0]);

  // Single byte (ASCII)
  if ((byte & 0x80) == 0) {
    return {static_cast<char32_t>(byte), 1};
  }

  size_t seq_len;
  char32_t cp;

  if ((byte & 0xE0) == 0xC0) {
    seq_len = 2;
    cp = byte & 0x1F;
  } else if ((byte & 0xF0) == 0xE0) {
    seq_len = 3;
    cp = byte & 0x0F;
  } else if ((byte & 0xF8) == 0xF0) {
    seq_len = 4;
    cp = byte & 0x07;
  } else {
    return {kReplacementCharacter, 1};
  }

  if (data.size() < seq_len) {
    return {kReplacementCharacter, data.size()};
  }

  for (size_t i = 1; i < seq_len; ++i) {
    byte = static_cast<unsigned char>(data[i]);
    if ((byte & 0xC0) != 0x80) {
      return {kReplacementCharacter, i};
    }
    cp = (cp << 6) | (byte & 0x3F);
  }

  // Overlong encodings, surrogates and out-of-range values
  static constexpr char32_t kMinForLength[5] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < kMinForLength[seq_len] || cp > 0x10FFFF ||
      (cp >= 0xD800 && cp <= 0xDFFF)) {
    return {kReplacementCharacter, seq_len};
  }

  return {cp, seq_len};
}

std::u32string utf8_to_u32(std::string_view text) {
  std::u32string out;
  out.reserve(text.size());
  while (!text.empty()) {
    Utf8DecodeResult r = utf8_decode(text);
    out.push_back(r.code_point);
    text.remove_prefix(r.length);
  }
  return out;
}

std::string u32_to_utf8(std::u32string_view text) {
  std::string out;
  out.reserve(text.size() * 3);
  for (char32_t cp : text) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}

bool is_cjk(char32_t cp) noexcept {
  return (cp >= 0x2E80 && cp <= 0x2FDF) ||   // radicals
         (cp >= 0x3000 && cp <= 0x30FF) ||   // CJK punctuation, kana
         (cp >= 0x3100 && cp <= 0x31FF) ||   // bopomofo, kana ext
         (cp >= 0x3400 && cp <= 0x4DBF) ||   // extension A
         (cp >= 0x4E00 && cp <= 0x9FFF) ||   // unified ideographs
         (cp >= 0xAC00 && cp <= 0xD7AF) ||   // hangul
         (cp >= 0xF900 && cp <= 0xFAFF) ||   // compatibility ideographs
         (cp >= 0xFE30 && cp <= 0xFE4F) ||   // compatibility forms
         (cp >= 0xFF00 && cp <= 0xFFEF) ||   // fullwidth forms
         (cp >= 0x20000 && cp <= 0x2FA1F);   // supplementary ideographs
}

bool is_space(char32_t cp) noexcept {
  return cp == U' ' || cp == U'\t' || cp == 0x3000;
}

std::string_view trim(std::string_view text) noexcept {
  constexpr std::string_view kWhitespace = " \t\r\n\f\v";
  size_t first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  size_t last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

} // namespace WordCard::Text
