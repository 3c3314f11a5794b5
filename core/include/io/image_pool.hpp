#pragma once
/**
 * @file image_pool.hpp
 * @brief Decoded background images shared read-only by every card
 */

#include "core/image_buffer.hpp"
#include "core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace WordCard::IO {

/// One decoded background and where it came from
struct PoolImage {
  std::string path;
  std::shared_ptr<const ImageBuffer> image;
};

class ImagePool {
public:
  ImagePool() = default;

  /**
   * @brief Scan a directory for jpg/jpeg/png/gif files and decode them
   *
   * Files are taken in lexical path order; extensions match without case.
   * Files that fail to decode are skipped with a warning and counted.
   * @return IoFailure if the directory cannot be listed
   */
  [[nodiscard]] static CardResult<ImagePool> scan(const std::string &directory);

  /// Add an already decoded image
  void add(std::string path, ImageBuffer image);

  /// Deterministic permutation (same seed, same order everywhere)
  void shuffle(uint64_t seed);

  /// Background for the word at @p index: images[index mod size]
  [[nodiscard]] const PoolImage &for_word(size_t index) const;

  [[nodiscard]] bool empty() const noexcept { return images_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return images_.size(); }
  [[nodiscard]] size_t skipped() const noexcept { return skipped_; }
  [[nodiscard]] const std::vector<PoolImage> &images() const noexcept {
    return images_;
  }

private:
  std::vector<PoolImage> images_;
  size_t skipped_ = 0;
};

/// True for .jpg .jpeg .png .gif in any letter case
[[nodiscard]] bool is_supported_image(const std::string &path);

} // namespace WordCard::IO
