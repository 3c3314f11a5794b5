/**
 * @file glyph_source.cpp
 * @brief FontSet helpers
 */

#include "text/glyph_source.hpp"

#include <algorithm>

namespace WordCard::Text {

FaceMetrics FontSet::line_metrics(uint32_t pixel_size) const {
  FaceMetrics a = latin->metrics(pixel_size);
  FaceMetrics b = cjk->metrics(pixel_size);
  return {std::max(a.ascent, b.ascent), std::max(a.descent, b.descent),
          std::max(a.line_gap, b.line_gap)};
}

} // namespace WordCard::Text
