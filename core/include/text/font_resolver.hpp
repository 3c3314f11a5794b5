#pragma once
/**
 * @file font_resolver.hpp
 * @brief Explicit font selection per operating system
 *
 * Font defaults differ per host OS. The OS is passed in rather than
 * detected inside the renderer; current_os() is the only place that looks
 * at the build target. The last candidate is always the bundled font that
 * ships in assets/fonts.
 */

#include "core/result.hpp"
#include "text/glyph_source.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifndef WC_BUNDLED_FONT_DIR
#define WC_BUNDLED_FONT_DIR "assets/fonts"
#endif

namespace WordCard::Text {

enum class OsFamily { Windows, MacOS, Linux };

enum class FontScript { Latin, Cjk };

/// Host OS of this build
[[nodiscard]] OsFamily current_os() noexcept;

[[nodiscard]] std::string_view os_family_name(OsFamily os) noexcept;

/// Bundled fallback font for a script
[[nodiscard]] std::string bundled_font_path(FontScript script);

/**
 * @brief Ordered font file candidates
 * @param os Target OS whose default font locations are used
 * @param script Latin (English, phonetic) or CJK (Chinese)
 * @param explicit_path User-configured font, tried first when set
 */
[[nodiscard]] std::vector<std::string>
resolve_font_candidates(OsFamily os, FontScript script,
                        const std::optional<std::string> &explicit_path);

/**
 * @brief Load the first candidate that exists and parses
 * @return InvalidConfiguration if no candidate loads
 */
[[nodiscard]] CardResult<std::shared_ptr<const GlyphSource>>
load_first_font(const std::vector<std::string> &candidates);

/// Resolve and load both faces of a FontSet
[[nodiscard]] CardResult<FontSet>
load_font_set(OsFamily os, const std::optional<std::string> &latin_path,
              const std::optional<std::string> &cjk_path);

} // namespace WordCard::Text
