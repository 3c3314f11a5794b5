/**
 * @file image_pool.cpp
 * @brief Background directory scan and pool ordering
 */

#include "io/image_pool.hpp"
#include "core/deterministic.hpp"
#include "io/image_io.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace WordCard::IO {

namespace fs = std::filesystem;

bool is_supported_image(const std::string &path) {
  std::string ext = fs::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext == ".jpg" || ext == ".jpeg" || ext == ".png" || ext == ".gif";
}

CardResult<ImagePool> ImagePool::scan(const std::string &directory) {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    return make_error(CardErrorCode::IoFailure,
                      "Not a directory: " + directory);
  }

  std::vector<std::string> paths;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_regular_file(ec) && is_supported_image(it->path().string())) {
      paths.push_back(it->path().string());
    }
  }
  if (ec) {
    return make_error(CardErrorCode::IoFailure,
                      "Cannot list " + directory + ": " + ec.message());
  }
  std::sort(paths.begin(), paths.end());

  ImagePool pool;
  for (const std::string &path : paths) {
    auto image = load_image(path);
    if (!image) {
      std::cerr << "⚠️ Skipping background: " << image.error().describe()
                << std::endl;
      ++pool.skipped_;
      continue;
    }
    pool.add(path, std::move(*image));
  }

  std::cout << "🖼️ Loaded " << pool.size() << " background images from "
            << directory;
  if (pool.skipped_ > 0) {
    std::cout << " (" << pool.skipped_ << " unreadable)";
  }
  std::cout << std::endl;
  return pool;
}

void ImagePool::add(std::string path, ImageBuffer image) {
  images_.push_back(
      {std::move(path), std::make_shared<const ImageBuffer>(std::move(image))});
}

void ImagePool::shuffle(uint64_t seed) {
  Deterministic::shuffle(images_, seed);
}

const PoolImage &ImagePool::for_word(size_t index) const {
  return images_[index % images_.size()];
}

} // namespace WordCard::IO
