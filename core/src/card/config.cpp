/**
 * @file config.cpp
 * @brief JSON configuration parser implementation
 */

#include "card/config.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace WordCard {

using json = nlohmann::json;

namespace {

constexpr std::array<std::string_view, 9> kStringKeys = {
    "images_dir",   "words_file", "output_dir", "font_path_en", "font_path_cn",
    "theme",        "device",     "bg_style",   "output_format"};

bool is_string_key(std::string_view key) {
  for (std::string_view k : kStringKeys) {
    if (k == key) {
      return true;
    }
  }
  return false;
}

CardError invalid(const std::string &message) {
  return make_error(CardErrorCode::InvalidConfiguration, message);
}

CardResult<uint32_t> parse_font_size(const json &j, const char *key) {
  auto size = j.at(key).get<int64_t>();
  if (size <= 0 || size > 4096) {
    return invalid(std::string(key) + " must be a positive pixel size, got " +
                   std::to_string(size));
  }
  return static_cast<uint32_t>(size);
}

std::optional<std::string> parse_optional_path(const json &j, const char *key) {
  const json &v = j.at(key);
  if (v.is_null()) {
    return std::nullopt;
  }
  auto path = v.get<std::string>();
  if (path.empty()) {
    return std::nullopt;
  }
  return path;
}

/// Copy every recognized key of @p j into @p config
CardResult<void> apply_json(const json &j, CardConfig &config) {
  if (!j.is_object()) {
    return invalid("Configuration must be a JSON object");
  }

  try {
    for (auto it = j.begin(); it != j.end(); ++it) {
      const std::string &key = it.key();
      const json &value = it.value();
      if (key == "images_dir") {
        config.images_dir = value.get<std::string>();
      } else if (key == "words_file") {
        config.words_file = value.get<std::string>();
      } else if (key == "output_dir") {
        config.output_dir = value.get<std::string>();
      } else if (key == "font_path_en") {
        config.fonts.path_en = parse_optional_path(j, "font_path_en");
      } else if (key == "font_path_cn") {
        config.fonts.path_cn = parse_optional_path(j, "font_path_cn");
      } else if (key == "font_size_en") {
        auto size = parse_font_size(j, "font_size_en");
        if (!size)
          return size.error();
        config.fonts.size_en = *size;
      } else if (key == "font_size_cn") {
        auto size = parse_font_size(j, "font_size_cn");
        if (!size)
          return size.error();
        config.fonts.size_cn = *size;
      } else if (key == "font_size_phonetic") {
        if (value.is_null()) {
          config.fonts.size_phonetic.reset();
        } else {
          auto size = parse_font_size(j, "font_size_phonetic");
          if (!size)
            return size.error();
          config.fonts.size_phonetic = *size;
        }
      } else if (key == "theme") {
        auto theme = parse_theme_name(value.get<std::string>());
        if (!theme)
          return theme.error();
        config.theme = *theme;
      } else if (key == "device") {
        auto mode = parse_device_mode(value.get<std::string>());
        if (!mode)
          return mode.error();
        config.device = *mode;
      } else if (key == "bg_style") {
        auto shape = parse_background_shape(value.get<std::string>());
        if (!shape)
          return shape.error();
        config.background.shape = *shape;
      } else if (key == "output_format") {
        auto format = parse_output_format(value.get<std::string>());
        if (!format)
          return format.error();
        config.output_format = *format;
      } else if (key == "jpeg_quality") {
        config.jpeg_quality = value.get<int>();
      } else if (key == "shuffle_images") {
        config.shuffle_images = value.get<bool>();
      } else if (key == "seed") {
        config.seed = value.get<uint64_t>();
      } else if (key == "backdrop_effects") {
        config.backdrop_effects = value.get<bool>();
      } else {
        std::cerr << "⚠️ Ignoring unknown configuration key: " << key
                  << std::endl;
      }
    }
  } catch (const json::exception &e) {
    return invalid(std::string("Bad configuration value: ") + e.what());
  }
  return {};
}

} // anonymous namespace

uint32_t FontSpec::effective_phonetic_size() const noexcept {
  if (size_phonetic) {
    return *size_phonetic;
  }
  auto size = static_cast<uint32_t>(std::lround(0.3 * size_en));
  return size > 0 ? size : 1;
}

CardResult<OutputFormat> parse_output_format(std::string_view name) {
  if (name == "png")
    return OutputFormat::Png;
  if (name == "jpg" || name == "jpeg")
    return OutputFormat::Jpg;
  return invalid("Unknown output format: '" + std::string(name) +
                 "' (expected png or jpg)");
}

std::string_view output_format_name(OutputFormat format) noexcept {
  return format == OutputFormat::Jpg ? "jpg" : "png";
}

std::string_view output_extension(OutputFormat format) noexcept {
  return output_format_name(format);
}

CardResult<CardConfig> CardConfig::from_json(const std::string &text) {
  auto config = parse(text);
  if (!config) {
    return config;
  }
  auto valid = config->validate();
  if (!valid) {
    return valid.error();
  }
  return config;
}

CardResult<CardConfig> CardConfig::parse(const std::string &text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error &e) {
    return invalid(std::string("Configuration is not valid JSON: ") + e.what());
  }

  CardConfig config;
  auto applied = apply_json(j, config);
  if (!applied) {
    return applied.error();
  }
  return config;
}

CardResult<CardConfig> CardConfig::load(const std::string &path,
                                        bool validate_now) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return make_error(CardErrorCode::IoFailure,
                      "Cannot open configuration: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return validate_now ? from_json(buffer.str()) : parse(buffer.str());
}

std::string CardConfig::to_json() const {
  json j;
  j["images_dir"] = images_dir;
  j["words_file"] = words_file;
  j["output_dir"] = output_dir;
  j["font_path_en"] = fonts.path_en ? json(*fonts.path_en) : json(nullptr);
  j["font_path_cn"] = fonts.path_cn ? json(*fonts.path_cn) : json(nullptr);
  j["font_size_en"] = fonts.size_en;
  j["font_size_cn"] = fonts.size_cn;
  j["font_size_phonetic"] =
      fonts.size_phonetic ? json(*fonts.size_phonetic) : json(nullptr);
  j["theme"] = std::string(theme_name(theme));
  j["device"] = std::string(device_mode_name(device));
  j["bg_style"] = std::string(background_shape_name(background.shape));
  j["output_format"] = std::string(output_format_name(output_format));
  j["jpeg_quality"] = jpeg_quality;
  j["shuffle_images"] = shuffle_images;
  j["seed"] = seed;
  j["backdrop_effects"] = backdrop_effects;
  return j.dump(2);
}

CardResult<void> CardConfig::set(std::string_view key,
                                 const std::string &value) {
  json j = json::object();
  if (is_string_key(key)) {
    j[std::string(key)] = value;
  } else {
    // Numbers and booleans arrive as their JSON spelling
    json parsed = json::parse(value, nullptr, false);
    if (parsed.is_discarded()) {
      return invalid("Bad value for " + std::string(key) + ": '" + value + "'");
    }
    j[std::string(key)] = parsed;
  }
  return apply_json(j, *this);
}

CardResult<void> CardConfig::validate() const {
  if (images_dir.empty()) {
    return invalid("images_dir is required");
  }
  if (words_file.empty()) {
    return invalid("words_file is required");
  }
  if (output_dir.empty()) {
    return invalid("output_dir must not be empty");
  }
  if (jpeg_quality < 1 || jpeg_quality > 100) {
    return invalid("jpeg_quality must be in [1, 100], got " +
                   std::to_string(jpeg_quality));
  }
  return {};
}

} // namespace WordCard
