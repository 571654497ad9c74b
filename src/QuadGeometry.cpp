#include "QuadGeometry.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace annot {

namespace {

// Walks every second value starting at `first`. The raw coordinate is
// compared first and truncated toward zero once it wins.
int scanMin(const QuadPoints &quadPoints, std::size_t first) {
  int min = std::numeric_limits<int>::max();
  for (std::size_t i = first; i < quadPoints.size(); i += 2) {
    double value = quadPoints[i];
    if (value < min) {
      min = truncateToInt(value);
    }
  }
  return min;
}

int scanMax(const QuadPoints &quadPoints, std::size_t first) {
  int max = 0;
  for (std::size_t i = first; i < quadPoints.size(); i += 2) {
    double value = quadPoints[i];
    if (value > max) {
      max = truncateToInt(value);
    }
  }
  return max;
}

} // anonymous namespace

int truncateToInt(double value) {
  if (std::isnan(value)) {
    return 0;
  }
  if (value >= static_cast<double>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  if (value <= static_cast<double>(std::numeric_limits<int>::min())) {
    return std::numeric_limits<int>::min();
  }
  return static_cast<int>(value);
}

int minX(const QuadPoints &quadPoints) { return scanMin(quadPoints, 0); }

int minY(const QuadPoints &quadPoints) { return scanMin(quadPoints, 1); }

int maxX(const QuadPoints &quadPoints) { return scanMax(quadPoints, 0); }

int maxY(const QuadPoints &quadPoints) { return scanMax(quadPoints, 1); }

QuadPoints rectToQuad(const PDFRect &rect) {
  return {rect.lowerLeftX,  rect.lowerLeftY,  rect.upperRightX,
          rect.lowerLeftY,  rect.lowerLeftX,  rect.upperRightY,
          rect.upperRightX, rect.upperRightY};
}

std::size_t quadCount(const QuadPoints &quadPoints) {
  return quadPoints.size() / kValuesPerQuad;
}

QuadPoints quadAt(const QuadPoints &quadPoints, std::size_t index) {
  if (index >= quadCount(quadPoints)) {
    throw std::out_of_range("Quad index " + std::to_string(index) +
                            " out of range");
  }
  auto begin = quadPoints.begin() +
               static_cast<std::ptrdiff_t>(index * kValuesPerQuad);
  return QuadPoints(begin, begin + kValuesPerQuad);
}

} // namespace annot
