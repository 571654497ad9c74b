#include "CoordinateTransform.hpp"

#include <algorithm>
#include <cmath>

namespace annot {

namespace {

struct MarkupTraits {
  MarkupKind kind;
  const char *name;
  float contextMultiplier;
};

constexpr MarkupTraits kMarkupTraits[] = {
    {MarkupKind::None, "none", 1.0f},
    {MarkupKind::Highlight, "highlight", 1.0f},
    {MarkupKind::Popup, "popup", 2.0f},
};

const MarkupTraits &traitsFor(MarkupKind markup) {
  for (const auto &traits : kMarkupTraits) {
    if (traits.kind == markup) {
      return traits;
    }
  }
  return kMarkupTraits[0];
}

} // anonymous namespace

float contextMultiplier(MarkupKind markup) {
  return traitsFor(markup).contextMultiplier;
}

const char *markupName(MarkupKind markup) { return traitsFor(markup).name; }

int roundHalfUp(float value) {
  return truncateToInt(std::floor(value + 0.5f));
}

cv::Rect subImageRect(const QuadPoints &quadPoints, const cv::Size &pageSize,
                      MarkupKind markup) {
  // Union of all quads, upper left corner first
  int left = minX(quadPoints);
  int bottom = minY(quadPoints);

  float scaledBorder = kBorderWidth * contextMultiplier(markup);

  int x = roundHalfUp((left - scaledBorder) * kScaleUpFactor);
  x = std::max(x, 0); // keep sub image on the page
  int y = roundHalfUp((bottom - scaledBorder) * kScaleUpFactor);
  y = std::max(y, 0);

  int width = roundHalfUp((static_cast<float>(maxX(quadPoints)) - left +
                           2 * scaledBorder) *
                          kScaleUpFactor);
  width = std::min(width, pageSize.width - x);
  int height = roundHalfUp((static_cast<float>(maxY(quadPoints)) - bottom +
                            2 * scaledBorder) *
                           kScaleUpFactor);
  height = std::min(height, pageSize.height - y);

  // PDF y counts from the bottom of the page
  y = truncateToInt(static_cast<double>(pageSize.height) - y - height);

  return cv::Rect(x, y, width, height);
}

cv::Rect annotationRect(const QuadPoints &quad, const cv::Rect &boundingRect,
                        int pageHeight) {
  int x = minX(quad);
  int y = minY(quad);

  int width =
      roundHalfUp((static_cast<float>(maxX(quad)) - x) * kScaleUpFactor);
  int height =
      roundHalfUp((static_cast<float>(maxY(quad)) - y) * kScaleUpFactor);

  x = truncateToInt(static_cast<double>(x) * kScaleUpFactor);
  y = truncateToInt(static_cast<double>(y) * kScaleUpFactor);

  x = truncateToInt(static_cast<double>(x) - boundingRect.x);
  // invert y again, relative to the crop
  y = truncateToInt(static_cast<double>(pageHeight) - y - boundingRect.y -
                    height);

  return cv::Rect(x, y, width, height);
}

} // namespace annot
