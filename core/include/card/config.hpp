#pragma once
/**
 * @file config.hpp
 * @brief Batch configuration record and its JSON form
 */

#include "card/device_profile.hpp"
#include "card/theme.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace WordCard {

/// Font files and pixel sizes before device scaling
struct FontSpec {
  std::optional<std::string> path_en; ///< none: resolved per OS
  std::optional<std::string> path_cn;
  uint32_t size_en = 60;
  uint32_t size_cn = 45;
  std::optional<uint32_t> size_phonetic; ///< none: round(0.3 * size_en)

  [[nodiscard]] uint32_t effective_phonetic_size() const noexcept;
};

enum class OutputFormat { Png, Jpg };

[[nodiscard]] CardResult<OutputFormat> parse_output_format(std::string_view name);
[[nodiscard]] std::string_view output_format_name(OutputFormat format) noexcept;
/// File extension without the dot
[[nodiscard]] std::string_view output_extension(OutputFormat format) noexcept;

/**
 * @brief Everything a batch run needs
 *
 * Enum-valued settings are already parsed; an unknown name never survives
 * past from_json().
 */
struct CardConfig {
  std::string images_dir;
  std::string words_file;
  std::string output_dir = "output_images";

  FontSpec fonts;
  ThemeName theme = ThemeName::Standard;
  DeviceMode device = DeviceMode::Auto;
  BackgroundStyle background;

  OutputFormat output_format = OutputFormat::Png;
  int jpeg_quality = 95;

  bool shuffle_images = false;
  uint64_t seed = 0;
  bool backdrop_effects = false;

  /// Parse a JSON document; missing keys take their defaults
  [[nodiscard]] static CardResult<CardConfig> from_json(const std::string &text);

  /// from_json() without the final validate(), for callers that still
  /// apply overrides
  [[nodiscard]] static CardResult<CardConfig> parse(const std::string &text);

  /// Read and parse a JSON file
  [[nodiscard]] static CardResult<CardConfig> load(const std::string &path,
                                                   bool validate_now = true);

  /// Serialize back to JSON (all keys, enum values by name)
  [[nodiscard]] std::string to_json() const;

  /// Apply one "key" = "value" override as if it came from the JSON file
  [[nodiscard]] CardResult<void> set(std::string_view key,
                                     const std::string &value);

  /// Range checks shared by from_json() and set()
  [[nodiscard]] CardResult<void> validate() const;
};

} // namespace WordCard
