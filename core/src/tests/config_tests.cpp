/**
 * @file config_tests.cpp
 * @brief Configuration parsing, overrides and the theme table
 */

#include "card/config.hpp"
#include "card/theme.hpp"
#include "test_support.hpp"
#include "testing/card_test.hpp"

#include <nlohmann/json.hpp>

using namespace WordCard;
using namespace WordCard::Testing;

namespace {

const std::string kMinimalJson =
    R"({"images_dir": "bg", "words_file": "words.txt"})";

bool fails_with_invalid_configuration(const std::string &text) {
  auto config = CardConfig::from_json(text);
  return !config && config.error().code == CardErrorCode::InvalidConfiguration;
}

} // namespace

WC_TEST(config, defaults) {
  auto config = CardConfig::from_json(kMinimalJson);
  WC_REQUIRE(config.has_value());

  WC_EXPECT_EQ(config->images_dir, std::string("bg"));
  WC_EXPECT_EQ(config->words_file, std::string("words.txt"));
  WC_EXPECT_EQ(config->output_dir, std::string("output_images"));
  WC_EXPECT_EQ(config->fonts.size_en, 60u);
  WC_EXPECT_EQ(config->fonts.size_cn, 45u);
  WC_EXPECT(!config->fonts.size_phonetic.has_value());
  WC_EXPECT_EQ(config->fonts.effective_phonetic_size(), 18u);
  WC_EXPECT(!config->fonts.path_en.has_value());
  WC_EXPECT(config->theme == ThemeName::Standard);
  WC_EXPECT(config->device == DeviceMode::Auto);
  WC_EXPECT(config->background.shape == BackgroundShape::Rectangle);
  WC_EXPECT(config->output_format == OutputFormat::Png);
  WC_EXPECT(!config->shuffle_images);
  WC_EXPECT(!config->backdrop_effects);
}

WC_TEST(config, full_document) {
  auto config = CardConfig::from_json(R"({
    "images_dir": "backgrounds",
    "words_file": "vocab.txt",
    "output_dir": "cards",
    "font_path_en": "/fonts/en.ttf",
    "font_path_cn": "/fonts/cn.ttc",
    "font_size_en": 72,
    "font_size_cn": 50,
    "font_size_phonetic": 24,
    "theme": "elegant",
    "device": "tablet",
    "bg_style": "wave",
    "output_format": "jpeg",
    "jpeg_quality": 80,
    "shuffle_images": true,
    "seed": 42,
    "backdrop_effects": true
  })");
  WC_REQUIRE(config.has_value());

  WC_EXPECT_EQ(config->output_dir, std::string("cards"));
  WC_EXPECT(config->fonts.path_en == std::optional<std::string>("/fonts/en.ttf"));
  WC_EXPECT(config->fonts.path_cn == std::optional<std::string>("/fonts/cn.ttc"));
  WC_EXPECT_EQ(config->fonts.size_en, 72u);
  WC_EXPECT_EQ(config->fonts.size_cn, 50u);
  WC_EXPECT_EQ(config->fonts.effective_phonetic_size(), 24u);
  WC_EXPECT(config->theme == ThemeName::Elegant);
  WC_EXPECT(config->device == DeviceMode::Tablet);
  WC_EXPECT(config->background.shape == BackgroundShape::Wave);
  WC_EXPECT(config->output_format == OutputFormat::Jpg);
  WC_EXPECT_EQ(config->jpeg_quality, 80);
  WC_EXPECT(config->shuffle_images);
  WC_EXPECT_EQ(config->seed, 42u);
  WC_EXPECT(config->backdrop_effects);
}

WC_TEST(config, phonetic_size_follows_english_size) {
  FontSpec fonts;
  fonts.size_en = 100;
  WC_EXPECT_EQ(fonts.effective_phonetic_size(), 30u);
  fonts.size_en = 1;
  WC_EXPECT_EQ(fonts.effective_phonetic_size(), 1u);
  fonts.size_phonetic = 7;
  WC_EXPECT_EQ(fonts.effective_phonetic_size(), 7u);
}

WC_TEST(config, rejects_unknown_enum_values) {
  WC_EXPECT(fails_with_invalid_configuration(
      R"({"images_dir": "a", "words_file": "b", "theme": "neon"})"));
  WC_EXPECT(fails_with_invalid_configuration(
      R"({"images_dir": "a", "words_file": "b", "device": "watch"})"));
  WC_EXPECT(fails_with_invalid_configuration(
      R"({"images_dir": "a", "words_file": "b", "bg_style": "circle"})"));
  WC_EXPECT(fails_with_invalid_configuration(
      R"({"images_dir": "a", "words_file": "b", "output_format": "gif"})"));
}

WC_TEST(config, rejects_bad_values) {
  WC_EXPECT(fails_with_invalid_configuration(
      R"({"images_dir": "a", "words_file": "b", "font_size_en": 0})"));
  WC_EXPECT(fails_with_invalid_configuration(
      R"({"images_dir": "a", "words_file": "b", "font_size_cn": -5})"));
  WC_EXPECT(fails_with_invalid_configuration(
      R"({"images_dir": "a", "words_file": "b", "font_size_en": "big"})"));
  WC_EXPECT(fails_with_invalid_configuration(
      R"({"images_dir": "a", "words_file": "b", "jpeg_quality": 0})"));
  WC_EXPECT(fails_with_invalid_configuration(
      R"({"images_dir": "a", "words_file": "b", "output_dir": ""})"));
  WC_EXPECT(fails_with_invalid_configuration(R"({"words_file": "b"})"));
  WC_EXPECT(fails_with_invalid_configuration(R"({"images_dir": "a"})"));
  WC_EXPECT(fails_with_invalid_configuration("{ not json"));
  WC_EXPECT(fails_with_invalid_configuration("[1, 2, 3]"));
}

WC_TEST(config, unknown_keys_are_ignored) {
  auto config = CardConfig::from_json(
      R"({"images_dir": "a", "words_file": "b", "font_colour": "red"})");
  WC_EXPECT(config.has_value());
}

WC_TEST(config, parse_defers_validation) {
  auto config = CardConfig::parse("{}");
  WC_REQUIRE(config.has_value());
  WC_EXPECT(!config->validate().has_value());

  WC_EXPECT(config->set("images_dir", "bg").has_value());
  WC_EXPECT(config->set("words_file", "words.txt").has_value());
  WC_EXPECT(config->validate().has_value());
}

WC_TEST(config, set_overrides) {
  auto config = CardConfig::from_json(kMinimalJson);
  WC_REQUIRE(config.has_value());

  WC_EXPECT(config->set("theme", "dark").has_value());
  WC_EXPECT(config->theme == ThemeName::Dark);
  WC_EXPECT(config->set("font_size_en", "80").has_value());
  WC_EXPECT_EQ(config->fonts.size_en, 80u);
  WC_EXPECT(config->set("shuffle_images", "true").has_value());
  WC_EXPECT(config->shuffle_images);
  WC_EXPECT(config->set("output_dir", "123").has_value());
  WC_EXPECT_EQ(config->output_dir, std::string("123"));

  auto bad_theme = config->set("theme", "neon");
  WC_EXPECT(!bad_theme.has_value());
  WC_EXPECT(config->theme == ThemeName::Dark);

  WC_EXPECT(!config->set("font_size_en", "eighty").has_value());
  WC_EXPECT(!config->set("shuffle_images", "maybe").has_value());
}

WC_TEST(config, json_round_trip) {
  auto original = CardConfig::from_json(
      R"({"images_dir": "a", "words_file": "b", "theme": "focus",
          "device": "mobile", "bg_style": "wave", "font_size_phonetic": 20,
          "seed": 7})");
  WC_REQUIRE(original.has_value());

  std::string text = original->to_json();
  auto parsed = nlohmann::json::parse(text);
  WC_EXPECT_EQ(parsed["theme"].get<std::string>(), std::string("focus"));
  WC_EXPECT_EQ(parsed["device"].get<std::string>(), std::string("mobile"));
  WC_EXPECT(parsed["font_path_en"].is_null());

  auto reloaded = CardConfig::from_json(text);
  WC_REQUIRE(reloaded.has_value());
  WC_EXPECT_EQ(reloaded->to_json(), text);
}

WC_TEST(config, load_missing_file) {
  ScopedTempDir dir("config");
  auto config = CardConfig::load(dir.file("absent.json"));
  WC_REQUIRE(!config.has_value());
  WC_EXPECT(config.error().code == CardErrorCode::IoFailure);

  write_text_file(dir.file("card.json"), kMinimalJson);
  auto loaded = CardConfig::load(dir.file("card.json"));
  WC_EXPECT(loaded.has_value());
}

WC_TEST(config, theme_table) {
  for (ThemeName name : kAllThemes) {
    auto parsed = parse_theme_name(theme_name(name));
    WC_REQUIRE(parsed.has_value());
    WC_EXPECT(*parsed == name);
    WC_EXPECT(theme_spec(name).name == name);
  }

  float widest = 0.0f;
  ThemeName widest_theme = ThemeName::Standard;
  for (ThemeName name : kAllThemes) {
    if (theme_spec(name).padding > widest) {
      widest = theme_spec(name).padding;
      widest_theme = name;
    }
  }
  WC_EXPECT(widest_theme == ThemeName::Elegant);

  const ThemeSpec &minimal = theme_spec(ThemeName::Minimal);
  WC_EXPECT(minimal.panel_fill == PanelFill::None);
  WC_EXPECT_EQ(minimal.padding, 0.0f);
  WC_EXPECT(!minimal.decoration);
  WC_EXPECT(minimal.draws_shadow());

  const ThemeSpec &dark = theme_spec(ThemeName::Dark);
  WC_EXPECT(dark.stroke_width > 0.0f);
  WC_EXPECT(!dark.draws_shadow());
  WC_EXPECT(dark.corner_style == CornerStyle::Square);

  WC_EXPECT(theme_spec(ThemeName::Focus).panel_fill == PanelFill::Blurred);
  WC_EXPECT(theme_spec(ThemeName::Elegant).panel_fill == PanelFill::Gradient);
  WC_EXPECT(!parse_theme_name("Standard").has_value());
}
