#pragma once
/**
 * @file image_io.hpp
 * @brief Image file decode and encode (stb_image / stb_image_write)
 */

#include "card/config.hpp"
#include "core/image_buffer.hpp"
#include "core/result.hpp"

#include <string>

namespace WordCard::IO {

/**
 * @brief Decode a jpg/png/gif file into an opaque RGBA buffer
 *
 * Alpha is dropped: cards are flattened photographs. Animated GIFs
 * contribute their first frame.
 * @return UnreadableImage if the file is missing or fails to decode
 */
[[nodiscard]] CardResult<ImageBuffer> load_image(const std::string &path);

/// Encode as PNG (RGB); IoFailure on write errors
[[nodiscard]] CardResult<void> write_png(const std::string &path,
                                         const ImageBuffer &img);

/// Encode as baseline JPEG (RGB) at @p quality in [1, 100]
[[nodiscard]] CardResult<void> write_jpg(const std::string &path,
                                         const ImageBuffer &img, int quality);

/// Dispatch on the configured output format
[[nodiscard]] CardResult<void> write_image(const std::string &path,
                                           const ImageBuffer &img,
                                           OutputFormat format,
                                           int jpeg_quality);

} // namespace WordCard::IO
