/**
 * @file main.cpp
 * @brief wordcard launcher: JSON configuration plus --key value overrides
 *
 * Usage:
 *   wordcard [config.json] [--key value ...]
 *   wordcard --list-themes
 *   wordcard --help
 */

#include "card/batch.hpp"
#include "card/config.hpp"
#include "card/theme.hpp"
#include "card/word_list.hpp"
#include "text/font_resolver.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace WordCard;

namespace {

void print_usage() {
  std::cout << "Usage:" << std::endl;
  std::cout << "  wordcard [config.json] [--key value ...]" << std::endl;
  std::cout << "      Render one card per word. Any configuration key can be\n"
               "      given as --key value (dashes or underscores).\n"
            << std::endl;
  std::cout << "      --images <dir>    same as --images_dir" << std::endl;
  std::cout << "      --words <file>    same as --words_file" << std::endl;
  std::cout << "      --output <dir>    same as --output_dir\n" << std::endl;
  std::cout << "  wordcard --list-themes" << std::endl;
  std::cout << "      Show themes, background styles and devices\n"
            << std::endl;
  std::cout << "  wordcard --help" << std::endl;
  std::cout << "      Show this help message" << std::endl;
}

void print_themes() {
  std::cout << "Themes:" << std::endl;
  for (ThemeName name : kAllThemes) {
    const ThemeSpec &theme = theme_spec(name);
    std::cout << "  • " << theme_name(name) << " (padding " << theme.padding
              << (theme.draws_panel() ? "" : ", no panel")
              << (theme.stroke_width > 0.0f ? ", outlined text" : "") << ")"
              << std::endl;
  }
  std::cout << "Background styles:" << std::endl;
  for (BackgroundShape shape : kAllShapes) {
    std::cout << "  • " << background_shape_name(shape) << std::endl;
  }
  std::cout << "Devices:" << std::endl;
  for (DeviceMode mode : {DeviceMode::Auto, DeviceMode::Mobile,
                          DeviceMode::Tablet, DeviceMode::Desktop}) {
    DeviceProfile profile = resolve_device_profile(mode);
    std::cout << "  • " << device_mode_name(mode);
    if (profile.canvas_size) {
      std::cout << " " << profile.canvas_size->width << "x"
                << profile.canvas_size->height << ", font x"
                << profile.font_scale;
    } else {
      std::cout << " (background size)";
    }
    std::cout << std::endl;
  }
}

/// "--images-dir" -> "images_dir", with the short aliases expanded
std::string option_key(std::string flag) {
  flag.erase(0, 2);
  std::replace(flag.begin(), flag.end(), '-', '_');
  if (flag == "images")
    return "images_dir";
  if (flag == "words")
    return "words_file";
  if (flag == "output")
    return "output_dir";
  return flag;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::vector<std::pair<std::string, std::string>> overrides;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
    if (arg == "--list-themes") {
      print_themes();
      return 0;
    }
    if (arg.rfind("--", 0) == 0) {
      if (i + 1 >= argc) {
        std::cerr << "❌ Missing value for " << arg << std::endl;
        return 1;
      }
      overrides.emplace_back(option_key(arg), argv[++i]);
      continue;
    }
    if (!config_path.empty()) {
      std::cerr << "❌ Unexpected argument: " << arg << std::endl;
      print_usage();
      return 1;
    }
    config_path = arg;
  }

  auto config = config_path.empty() ? CardConfig::parse("{}")
                                    : CardConfig::load(config_path, false);
  if (!config) {
    std::cerr << "❌ " << config.error().describe() << std::endl;
    return 1;
  }

  for (const auto &[key, value] : overrides) {
    auto applied = config->set(key, value);
    if (!applied) {
      std::cerr << "❌ --" << key << ": " << applied.error().describe()
                << std::endl;
      return 1;
    }
  }

  auto valid = config->validate();
  if (!valid) {
    std::cerr << "❌ " << valid.error().describe() << std::endl;
    print_usage();
    return 1;
  }

  // Missing backgrounds outrank every other failure, fonts included
  auto pool = load_background_pool(config->images_dir);
  if (!pool) {
    std::cerr << "❌ " << pool.error().describe() << std::endl;
    return 1;
  }

  auto fonts = Text::load_font_set(Text::current_os(), config->fonts.path_en,
                                   config->fonts.path_cn);
  if (!fonts) {
    std::cerr << "❌ " << fonts.error().describe() << std::endl;
    return 1;
  }

  auto words = load_word_list(config->words_file);
  if (!words) {
    std::cerr << "❌ " << words.error().describe() << std::endl;
    return 1;
  }

  std::cout << "✅ Theme " << theme_name(config->theme) << ", device "
            << device_mode_name(config->device) << ", "
            << background_shape_name(config->background.shape) << " panels"
            << std::endl;

  CardBatch batch(std::move(*config), std::move(*fonts));
  auto report = batch.run(*words, *pool);
  if (!report) {
    std::cerr << "❌ " << report.error().describe() << std::endl;
    return 1;
  }
  return report->words_skipped > 0 ? 2 : 0;
}
