#pragma once
/**
 * @file batch.hpp
 * @brief Word list x image pool loop writing one card per word
 */

#include "card/compositor.hpp"
#include "card/config.hpp"
#include "card/word_list.hpp"
#include "core/result.hpp"
#include "io/image_pool.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace WordCard {

/// Outcome of a batch run
struct BatchReport {
  size_t words_total = 0;
  size_t cards_written = 0;
  size_t words_skipped = 0;  ///< Render or write failures
  size_t images_skipped = 0; ///< Unreadable background files
  size_t lines_skipped = 0;  ///< Malformed word list lines
  std::vector<std::string> outputs;
};

/**
 * @brief Output file name for the word at @p index (0-based)
 *
 * 1-based index zero-padded to max(3, digits of @p word_count), then the
 * English text with characters unsafe in file names replaced by '_'. The
 * English part is cut to at most 200 bytes on a UTF-8 boundary so the name
 * stays under the usual 255-byte file name limit.
 */
[[nodiscard]] std::string card_file_name(size_t index, size_t word_count,
                                         const std::string &english,
                                         OutputFormat format);

/**
 * @brief Scan a background folder for the batch
 * @return NoBackgroundImages when the folder is missing or holds no
 *         decodable image
 */
[[nodiscard]] CardResult<IO::ImagePool>
load_background_pool(const std::string &images_dir);

class CardBatch {
public:
  CardBatch(CardConfig config, Text::FontSet fonts);

  /// Load the word list and image pool named by the config, then run
  [[nodiscard]] CardResult<BatchReport> run();

  /**
   * @brief Render every word in file order
   *
   * The pool is checked before any word: an empty pool fails with
   * NoBackgroundImages and the output directory is not created. Per-word
   * failures are logged and counted; the run continues.
   */
  [[nodiscard]] CardResult<BatchReport> run(const WordList &words,
                                            const IO::ImagePool &pool);

  [[nodiscard]] const CardConfig &config() const noexcept { return config_; }

private:
  CardConfig config_;
  CardCompositor compositor_;

  /// Render one job; exceptions from allocation or glyph sources become
  /// RenderFailure so the word is skipped instead of ending the run
  [[nodiscard]] CardResult<ImageBuffer>
  render_job(const RenderJob &job) const;

  void print_summary(const BatchReport &report) const;
};

} // namespace WordCard
