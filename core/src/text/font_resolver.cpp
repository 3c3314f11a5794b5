/**
 * @file font_resolver.cpp
 * @brief Per-OS default fonts and FontSet loading
 */

#include "text/font_resolver.hpp"
#include "text/freetype_face.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace WordCard::Text {

OsFamily current_os() noexcept {
#if defined(_WIN32)
  return OsFamily::Windows;
#elif defined(__APPLE__)
  return OsFamily::MacOS;
#else
  return OsFamily::Linux;
#endif
}

std::string_view os_family_name(OsFamily os) noexcept {
  switch (os) {
  case OsFamily::Windows:
    return "Windows";
  case OsFamily::MacOS:
    return "macOS";
  case OsFamily::Linux:
    return "Linux";
  }
  return "Unknown";
}

std::string bundled_font_path(FontScript script) {
  const std::string dir = WC_BUNDLED_FONT_DIR;
  return script == FontScript::Latin ? dir + "/DejaVuSans.ttf"
                                     : dir + "/NotoSansSC-Regular.otf";
}

std::vector<std::string>
resolve_font_candidates(OsFamily os, FontScript script,
                        const std::optional<std::string> &explicit_path) {
  std::vector<std::string> candidates;
  if (explicit_path && !explicit_path->empty()) {
    candidates.push_back(*explicit_path);
  }

  switch (os) {
  case OsFamily::Windows:
    if (script == FontScript::Latin) {
      candidates.insert(candidates.end(), {"C:/Windows/Fonts/arial.ttf",
                                           "C:/Windows/Fonts/calibri.ttf"});
    } else {
      candidates.insert(candidates.end(), {"C:/Windows/Fonts/simhei.ttf",
                                           "C:/Windows/Fonts/msyh.ttc",
                                           "C:/Windows/Fonts/simsun.ttc"});
    }
    break;
  case OsFamily::MacOS:
    if (script == FontScript::Latin) {
      candidates.insert(candidates.end(), {"/System/Library/Fonts/Helvetica.ttc",
                                           "/Library/Fonts/Arial.ttf"});
    } else {
      candidates.insert(candidates.end(),
                        {"/System/Library/Fonts/PingFang.ttc",
                         "/System/Library/Fonts/STHeiti Medium.ttc",
                         "/Library/Fonts/Arial Unicode.ttf"});
    }
    break;
  case OsFamily::Linux:
    if (script == FontScript::Latin) {
      candidates.insert(candidates.end(),
                        {"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
                         "/usr/share/fonts/TTF/DejaVuSans.ttf",
                         "/usr/share/fonts/TTF/Arial.ttf"});
    } else {
      candidates.insert(
          candidates.end(),
          {"/usr/share/fonts/opentype/noto/NotoSansCJK-Regular.ttc",
           "/usr/share/fonts/noto-cjk/NotoSansCJK-Regular.ttc",
           "/usr/share/fonts/truetype/droid/DroidSansFallbackFull.ttf",
           "/usr/share/fonts/truetype/wqy/wqy-microhei.ttc"});
    }
    break;
  }

  candidates.push_back(bundled_font_path(script));
  return candidates;
}

CardResult<std::shared_ptr<const GlyphSource>>
load_first_font(const std::vector<std::string> &candidates) {
  std::string tried;
  for (const auto &path : candidates) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      continue;
    }
    auto face = FreeTypeFace::load(path);
    if (face) {
      return std::shared_ptr<const GlyphSource>(std::move(*face));
    }
    std::cerr << "⚠️ " << face.error().message << std::endl;
    tried += (tried.empty() ? "" : ", ") + path;
  }

  std::string message = "No usable font among " +
                        std::to_string(candidates.size()) + " candidates";
  if (!tried.empty()) {
    message += " (failed to parse: " + tried + ")";
  }
  return make_error(CardErrorCode::InvalidConfiguration, message);
}

CardResult<FontSet> load_font_set(OsFamily os,
                                  const std::optional<std::string> &latin_path,
                                  const std::optional<std::string> &cjk_path) {
  std::cout << "🔤 Resolving fonts for " << os_family_name(os) << std::endl;

  auto latin =
      load_first_font(resolve_font_candidates(os, FontScript::Latin, latin_path));
  if (!latin) {
    return make_error(latin.error().code,
                      "English font: " + latin.error().message);
  }

  auto cjk =
      load_first_font(resolve_font_candidates(os, FontScript::Cjk, cjk_path));
  if (!cjk) {
    return make_error(cjk.error().code, "Chinese font: " + cjk.error().message);
  }

  FontSet fonts;
  fonts.latin = std::move(*latin);
  fonts.cjk = std::move(*cjk);
  return fonts;
}

} // namespace WordCard::Text
