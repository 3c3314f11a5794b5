/**
 * @file batch.cpp
 * @brief Batch driver: one card per word, failures skipped and counted
 */

#include "card/batch.hpp"
#include "io/image_io.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <new>
#include <sstream>
#include <system_error>

namespace WordCard {

namespace fs = std::filesystem;

namespace {

bool is_unsafe_file_char(unsigned char c) {
  if (c < 0x20 || c == 0x7F) {
    return true;
  }
  switch (c) {
  case '<':
  case '>':
  case ':':
  case '"':
  case '/':
  case '\\':
  case '|':
  case '?':
  case '*':
    return true;
  default:
    return false;
  }
}

/// Longest English stem kept in a file name, in bytes
constexpr size_t kMaxFileStemBytes = 200;

/// Cut @p text to at most @p max_bytes without splitting a UTF-8 sequence
void truncate_utf8(std::string &text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return;
  }
  size_t cut = max_bytes;
  while (cut > 0 &&
         (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  text.resize(cut);
}

size_t decimal_digits(size_t n) {
  size_t digits = 1;
  while (n >= 10) {
    n /= 10;
    ++digits;
  }
  return digits;
}

} // anonymous namespace

std::string card_file_name(size_t index, size_t word_count,
                           const std::string &english, OutputFormat format) {
  const size_t width = std::max<size_t>(3, decimal_digits(word_count));

  std::string safe = english;
  truncate_utf8(safe, kMaxFileStemBytes);
  for (char &c : safe) {
    if (is_unsafe_file_char(static_cast<unsigned char>(c))) {
      c = '_';
    }
  }

  std::ostringstream name;
  name << std::setw(static_cast<int>(width)) << std::setfill('0') << index + 1
       << '_' << safe << '.' << output_extension(format);
  return name.str();
}

CardBatch::CardBatch(CardConfig config, Text::FontSet fonts)
    : config_(std::move(config)), compositor_(std::move(fonts)) {}

CardResult<IO::ImagePool> load_background_pool(const std::string &images_dir) {
  auto pool = IO::ImagePool::scan(images_dir);
  if (!pool) {
    return make_error(CardErrorCode::NoBackgroundImages,
                      pool.error().message);
  }
  if (pool->empty()) {
    return make_error(CardErrorCode::NoBackgroundImages,
                      "No usable background images in '" + images_dir + "'");
  }
  return pool;
}

CardResult<BatchReport> CardBatch::run() {
  auto pool = load_background_pool(config_.images_dir);
  if (!pool) {
    return pool.error();
  }

  auto words = load_word_list(config_.words_file);
  if (!words) {
    return words.error();
  }
  return run(*words, *pool);
}

CardResult<BatchReport> CardBatch::run(const WordList &words,
                                       const IO::ImagePool &pool) {
  BatchReport report;
  report.words_total = words.size();
  report.images_skipped = pool.skipped();
  report.lines_skipped = words.skipped_lines;

  if (pool.empty()) {
    return make_error(CardErrorCode::NoBackgroundImages,
                      "No usable background images in '" + config_.images_dir +
                          "'");
  }
  if (words.empty()) {
    std::cout << "⚠️ Word list is empty, nothing to render" << std::endl;
    print_summary(report);
    return report;
  }

  std::error_code ec;
  fs::create_directories(config_.output_dir, ec);
  if (ec) {
    return make_error(CardErrorCode::IoFailure,
                      "Cannot create output directory '" + config_.output_dir +
                          "': " + ec.message());
  }

  IO::ImagePool ordered = pool;
  if (config_.shuffle_images) {
    ordered.shuffle(config_.seed);
  }

  const DeviceProfile device = resolve_device_profile(config_.device);
  const ThemeSpec &theme = theme_spec(config_.theme);

  for (size_t i = 0; i < words.records.size(); ++i) {
    const WordRecord &record = words.records[i];

    RenderJob job;
    job.word = record.entry;
    job.phonetic = record.phonetic;
    job.background = ordered.for_word(i).image;
    job.device = device;
    job.theme = theme;
    job.style = config_.background;
    job.fonts = config_.fonts;
    job.backdrop_effects = config_.backdrop_effects;

    auto card = render_job(job);
    if (!card) {
      std::cerr << "❌ Skipping '" << record.entry.english
                << "': " << card.error().describe() << std::endl;
      ++report.words_skipped;
      continue;
    }

    const std::string path =
        (fs::path(config_.output_dir) /
         card_file_name(i, words.size(), record.entry.english,
                        config_.output_format))
            .string();
    auto written = IO::write_image(path, *card, config_.output_format,
                                   config_.jpeg_quality);
    if (!written) {
      std::cerr << "❌ Skipping '" << record.entry.english
                << "': " << written.error().describe() << std::endl;
      ++report.words_skipped;
      continue;
    }

    std::cout << "✅ " << path << std::endl;
    ++report.cards_written;
    report.outputs.push_back(path);
  }

  print_summary(report);
  return report;
}

CardResult<ImageBuffer> CardBatch::render_job(const RenderJob &job) const {
  try {
    return compositor_.render(job);
  } catch (const std::bad_alloc &) {
    return make_error(CardErrorCode::RenderFailure,
                      "Out of memory while rendering '" + job.word.english +
                          "'");
  } catch (const std::exception &e) {
    return make_error(CardErrorCode::RenderFailure,
                      "Render of '" + job.word.english +
                          "' failed: " + e.what());
  }
}

void CardBatch::print_summary(const BatchReport &report) const {
  std::cout << "\n📊 " << report.cards_written << "/" << report.words_total
            << " cards written to " << config_.output_dir << std::endl;
  if (report.words_skipped > 0) {
    std::cout << "   ⚠️ " << report.words_skipped << " words skipped"
              << std::endl;
  }
  if (report.images_skipped > 0) {
    std::cout << "   ⚠️ " << report.images_skipped
              << " background images unreadable" << std::endl;
  }
  if (report.lines_skipped > 0) {
    std::cout << "   ⚠️ " << report.lines_skipped
              << " word list lines malformed" << std::endl;
  }
}

} // namespace WordCard
