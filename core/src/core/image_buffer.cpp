/**
 * @file image_buffer.cpp
 * @brief ImageBuffer pixel operations (resample, blur, brightness)
 */

#include "core/image_buffer.hpp"

#include <algorithm>
#include <cmath>

namespace WordCard {

// ImageBuffer implementation
ImageBuffer ImageBuffer::create(uint32_t w, uint32_t h) {
  ImageBuffer buf;
  buf.width = w;
  buf.height = h;
  buf.channels = 4;
  buf.data.resize(static_cast<size_t>(w) * h * 4, 0);
  return buf;
}

uint8_t *ImageBuffer::pixel(uint32_t x, uint32_t y) {
  if (x >= width || y >= height)
    return nullptr;
  return &data[(static_cast<size_t>(y) * width + x) * channels];
}

const uint8_t *ImageBuffer::pixel(uint32_t x, uint32_t y) const {
  if (x >= width || y >= height)
    return nullptr;
  return &data[(static_cast<size_t>(y) * width + x) * channels];
}

void ImageBuffer::fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
  for (size_t i = 0; i < data.size(); i += 4) {
    data[i + 0] = r;
    data[i + 1] = g;
    data[i + 2] = b;
    data[i + 3] = a;
  }
}

ImageBuffer ImageBuffer::crop(const Math::RectI &rect) const {
  int32_t x0 = Math::clamp(rect.x, 0, static_cast<int32_t>(width));
  int32_t y0 = Math::clamp(rect.y, 0, static_cast<int32_t>(height));
  int32_t x1 = Math::clamp(rect.x + rect.width, x0, static_cast<int32_t>(width));
  int32_t y1 =
      Math::clamp(rect.y + rect.height, y0, static_cast<int32_t>(height));

  ImageBuffer out = create(static_cast<uint32_t>(x1 - x0),
                           static_cast<uint32_t>(y1 - y0));
  const size_t row_bytes = static_cast<size_t>(out.width) * 4;
  for (int32_t y = y0; y < y1; ++y) {
    const uint8_t *src = pixel(static_cast<uint32_t>(x0), static_cast<uint32_t>(y));
    std::copy(src, src + row_bytes,
              &out.data[static_cast<size_t>(y - y0) * row_bytes]);
  }
  return out;
}

namespace {

/// Filter taps for one output sample
struct Taps {
  int32_t first = 0;
  std::vector<float> weights;
};

std::vector<Taps> build_taps(uint32_t src_len, uint32_t dst_len) {
  std::vector<Taps> taps(dst_len);
  const float scale = static_cast<float>(dst_len) / static_cast<float>(src_len);
  const float support = std::max(1.0f, 1.0f / scale);

  for (uint32_t i = 0; i < dst_len; ++i) {
    float center = (static_cast<float>(i) + 0.5f) / scale - 0.5f;
    auto lo = static_cast<int32_t>(std::floor(center - support));
    auto hi = static_cast<int32_t>(std::ceil(center + support));
    lo = std::max(lo, 0);
    hi = std::min(hi, static_cast<int32_t>(src_len) - 1);

    Taps &t = taps[i];
    t.first = lo;
    float total = 0.0f;
    for (int32_t s = lo; s <= hi; ++s) {
      float w = 1.0f - std::fabs(static_cast<float>(s) - center) / support;
      w = std::max(w, 0.0f);
      t.weights.push_back(w);
      total += w;
    }
    if (total <= 0.0f) {
      // Degenerate window: nearest sample
      t.first = Math::clamp(static_cast<int32_t>(std::lround(center)), 0,
                            static_cast<int32_t>(src_len) - 1);
      t.weights.assign(1, 1.0f);
      continue;
    }
    for (float &w : t.weights) {
      w /= total;
    }
  }
  return taps;
}

inline uint8_t to_u8(float v) {
  return static_cast<uint8_t>(Math::clamp(v, 0.0f, 255.0f) + 0.5f);
}

std::vector<float> gaussian_kernel(float sigma, int32_t &radius) {
  radius = std::max(1, static_cast<int32_t>(std::ceil(sigma * 3.0f)));
  std::vector<float> kernel(static_cast<size_t>(radius) * 2 + 1);
  float total = 0.0f;
  for (int32_t i = -radius; i <= radius; ++i) {
    float w = std::exp(-(static_cast<float>(i * i)) / (2.0f * sigma * sigma));
    kernel[static_cast<size_t>(i + radius)] = w;
    total += w;
  }
  for (float &w : kernel) {
    w /= total;
  }
  return kernel;
}

} // anonymous namespace

ImageBuffer resample(const ImageBuffer &src, uint32_t new_width,
                     uint32_t new_height) {
  if (src.empty() || new_width == 0 || new_height == 0) {
    return ImageBuffer::create(new_width, new_height);
  }
  if (src.width == new_width && src.height == new_height) {
    return src;
  }

  const auto x_taps = build_taps(src.width, new_width);
  const auto y_taps = build_taps(src.height, new_height);

  // Horizontal pass: src.height rows x new_width columns
  std::vector<float> tmp(static_cast<size_t>(new_width) * src.height * 4);
  for (uint32_t y = 0; y < src.height; ++y) {
    for (uint32_t x = 0; x < new_width; ++x) {
      const Taps &t = x_taps[x];
      float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
      for (size_t k = 0; k < t.weights.size(); ++k) {
        const uint8_t *p =
            src.pixel(static_cast<uint32_t>(t.first) + static_cast<uint32_t>(k), y);
        for (int c = 0; c < 4; ++c) {
          acc[c] += p[c] * t.weights[k];
        }
      }
      float *dst = &tmp[(static_cast<size_t>(y) * new_width + x) * 4];
      std::copy(acc, acc + 4, dst);
    }
  }

  // Vertical pass
  ImageBuffer out = ImageBuffer::create(new_width, new_height);
  for (uint32_t y = 0; y < new_height; ++y) {
    const Taps &t = y_taps[y];
    for (uint32_t x = 0; x < new_width; ++x) {
      float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
      for (size_t k = 0; k < t.weights.size(); ++k) {
        const float *p =
            &tmp[((static_cast<size_t>(t.first) + k) * new_width + x) * 4];
        for (int c = 0; c < 4; ++c) {
          acc[c] += p[c] * t.weights[k];
        }
      }
      uint8_t *dst = out.pixel(x, y);
      for (int c = 0; c < 4; ++c) {
        dst[c] = to_u8(acc[c]);
      }
    }
  }
  return out;
}

void gaussian_blur(ImageBuffer &img, const Math::RectI &region, float sigma) {
  if (img.empty() || region.empty() || sigma <= 0.0f) {
    return;
  }

  const auto w = static_cast<int32_t>(img.width);
  const auto h = static_cast<int32_t>(img.height);
  const int32_t rx0 = Math::clamp(region.x, 0, w);
  const int32_t ry0 = Math::clamp(region.y, 0, h);
  const int32_t rx1 = Math::clamp(region.x + region.width, rx0, w);
  const int32_t ry1 = Math::clamp(region.y + region.height, ry0, h);
  if (rx1 <= rx0 || ry1 <= ry0) {
    return;
  }

  int32_t radius = 0;
  const std::vector<float> kernel = gaussian_kernel(sigma, radius);

  // Horizontal pass over the rows the vertical pass will read
  const int32_t sy0 = std::max(0, ry0 - radius);
  const int32_t sy1 = std::min(h, ry1 + radius);
  const int32_t rw = rx1 - rx0;
  std::vector<float> tmp(static_cast<size_t>(rw) * (sy1 - sy0) * 4);

  for (int32_t y = sy0; y < sy1; ++y) {
    for (int32_t x = rx0; x < rx1; ++x) {
      float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
      for (int32_t k = -radius; k <= radius; ++k) {
        int32_t sx = Math::clamp(x + k, 0, w - 1);
        const uint8_t *p =
            img.pixel(static_cast<uint32_t>(sx), static_cast<uint32_t>(y));
        float kw = kernel[static_cast<size_t>(k + radius)];
        for (int c = 0; c < 4; ++c) {
          acc[c] += p[c] * kw;
        }
      }
      float *dst =
          &tmp[(static_cast<size_t>(y - sy0) * rw + (x - rx0)) * 4];
      std::copy(acc, acc + 4, dst);
    }
  }

  // Vertical pass back into the image
  for (int32_t y = ry0; y < ry1; ++y) {
    for (int32_t x = rx0; x < rx1; ++x) {
      float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
      for (int32_t k = -radius; k <= radius; ++k) {
        int32_t sy = Math::clamp(y + k, sy0, sy1 - 1);
        const float *p =
            &tmp[(static_cast<size_t>(sy - sy0) * rw + (x - rx0)) * 4];
        float kw = kernel[static_cast<size_t>(k + radius)];
        for (int c = 0; c < 4; ++c) {
          acc[c] += p[c] * kw;
        }
      }
      uint8_t *dst =
          img.pixel(static_cast<uint32_t>(x), static_cast<uint32_t>(y));
      for (int c = 0; c < 4; ++c) {
        dst[c] = to_u8(acc[c]);
      }
    }
  }
}

void scale_brightness(ImageBuffer &img, float factor) {
  if (factor == 1.0f) {
    return;
  }
  for (size_t i = 0; i < img.data.size(); i += 4) {
    img.data[i + 0] = to_u8(img.data[i + 0] * factor);
    img.data[i + 1] = to_u8(img.data[i + 1] * factor);
    img.data[i + 2] = to_u8(img.data[i + 2] * factor);
  }
}

} // namespace WordCard
