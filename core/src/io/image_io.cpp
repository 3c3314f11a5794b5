/**
 * @file image_io.cpp
 * @brief stb-backed image decode and encode
 */

#include "io/image_io.hpp"

#include <algorithm>
#include <cstring>
#include <vector>

// stb implementations live in exactly this translation unit
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

namespace WordCard::IO {

namespace {

std::vector<uint8_t> to_rgb(const ImageBuffer &img) {
  std::vector<uint8_t> rgb(static_cast<size_t>(img.width) * img.height * 3);
  for (size_t i = 0, j = 0; i < img.data.size(); i += 4, j += 3) {
    rgb[j + 0] = img.data[i + 0];
    rgb[j + 1] = img.data[i + 1];
    rgb[j + 2] = img.data[i + 2];
  }
  return rgb;
}

CardResult<void> check_writable(const std::string &path, const ImageBuffer &img) {
  if (img.empty() || img.data.size() < static_cast<size_t>(img.width) *
                                           img.height * 4) {
    return make_error(CardErrorCode::IoFailure,
                      "Refusing to write an empty image: " + path);
  }
  return {};
}

} // anonymous namespace

CardResult<ImageBuffer> load_image(const std::string &path) {
  int w = 0;
  int h = 0;
  int channels_in_file = 0;

  // Force 4 channels so we always get RGBA8
  unsigned char *data = stbi_load(path.c_str(), &w, &h, &channels_in_file, 4);
  if (!data) {
    const char *reason = stbi_failure_reason();
    return make_error(CardErrorCode::UnreadableImage,
                      "Failed to load image " + path + ": " +
                          (reason ? reason : "unknown error"));
  }

  if (w <= 0 || h <= 0) {
    stbi_image_free(data);
    return make_error(CardErrorCode::UnreadableImage,
                      "Invalid image dimensions: " + path);
  }

  ImageBuffer img = ImageBuffer::create(static_cast<uint32_t>(w),
                                        static_cast<uint32_t>(h));
  std::memcpy(img.data.data(), data, img.data.size());
  stbi_image_free(data);

  for (size_t i = 3; i < img.data.size(); i += 4) {
    img.data[i] = 255;
  }
  return img;
}

CardResult<void> write_png(const std::string &path, const ImageBuffer &img) {
  auto ok = check_writable(path, img);
  if (!ok) {
    return ok;
  }
  std::vector<uint8_t> rgb = to_rgb(img);
  const int stride = static_cast<int>(img.width) * 3;
  if (!stbi_write_png(path.c_str(), static_cast<int>(img.width),
                      static_cast<int>(img.height), 3, rgb.data(), stride)) {
    return make_error(CardErrorCode::IoFailure,
                      "stbi_write_png() failed: " + path);
  }
  return {};
}

CardResult<void> write_jpg(const std::string &path, const ImageBuffer &img,
                           int quality) {
  auto ok = check_writable(path, img);
  if (!ok) {
    return ok;
  }
  quality = std::clamp(quality, 1, 100);

  // stb writes JPEG from RGB; drop alpha
  std::vector<uint8_t> rgb = to_rgb(img);
  if (!stbi_write_jpg(path.c_str(), static_cast<int>(img.width),
                      static_cast<int>(img.height), 3, rgb.data(), quality)) {
    return make_error(CardErrorCode::IoFailure,
                      "stbi_write_jpg() failed: " + path);
  }
  return {};
}

CardResult<void> write_image(const std::string &path, const ImageBuffer &img,
                             OutputFormat format, int jpeg_quality) {
  if (format == OutputFormat::Jpg) {
    return write_jpg(path, img, jpeg_quality);
  }
  return write_png(path, img);
}

} // namespace WordCard::IO
