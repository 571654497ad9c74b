#include "QuadGeometry.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

static int failures = 0;

void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << description
            << std::endl;
  if (!condition) {
    failures++;
  }
}

int main() {
  std::cout << "=== Test quad geometry ===" << std::endl << std::endl;

  std::cout << "Bounding extent of one quad:" << std::endl;
  annot::QuadPoints quad = {100.7f, 200.2f, 150.9f, 200.2f,
                            100.7f, 230.8f, 150.9f, 230.8f};
  check(annot::minX(quad) == 100, "minX truncates 100.7 to 100");
  check(annot::maxX(quad) == 150, "maxX truncates 150.9 to 150");
  check(annot::minY(quad) == 200, "minY truncates 200.2 to 200");
  check(annot::maxY(quad) == 230, "maxY truncates 230.8 to 230");

  std::cout << std::endl << "Negative coordinates:" << std::endl;
  annot::QuadPoints negative = {-10.5f, -20.5f, -5.2f, -20.5f,
                                -10.5f, -1.9f,  -5.2f, -1.9f};
  check(annot::minX(negative) == -10, "minX truncates -10.5 toward zero");
  check(annot::minY(negative) == -20, "minY truncates -20.5 toward zero");
  check(annot::maxX(negative) == 0, "maxX of an all-negative quad is 0");
  check(annot::maxY(negative) == 0, "maxY of an all-negative quad is 0");

  annot::QuadPoints nearZero = {-0.9f, 5.0f, 3.0f, 5.0f,
                                -0.9f, 8.0f, 3.0f, 8.0f};
  check(annot::minX(nearZero) == 0, "minX of -0.9 is 0");

  std::cout << std::endl << "Union over several quads:" << std::endl;
  annot::QuadPoints lines = {100.0f, 200.0f, 150.0f, 200.0f, 100.0f, 230.0f,
                             150.0f, 230.0f, 90.0f,  160.0f, 180.0f, 160.0f,
                             90.0f,  190.0f, 180.0f, 190.0f};
  check(annot::minX(lines) == 90, "minX spans both quads");
  check(annot::maxX(lines) == 180, "maxX spans both quads");
  check(annot::minY(lines) == 160, "minY spans both quads");
  check(annot::maxY(lines) == 230, "maxY spans both quads");

  std::cout << std::endl << "Out of range and NaN coordinates:" << std::endl;
  const int intMax = std::numeric_limits<int>::max();
  const int intMin = std::numeric_limits<int>::min();
  const float nan = std::numeric_limits<float>::quiet_NaN();
  check(annot::truncateToInt(3e9) == intMax, "3e9 saturates to INT_MAX");
  check(annot::truncateToInt(-3e9) == intMin, "-3e9 saturates to INT_MIN");
  check(annot::truncateToInt(nan) == 0, "NaN truncates to 0");
  check(annot::truncateToInt(-1.7) == -1, "-1.7 truncates to -1");

  annot::QuadPoints huge = {3e9f, 10.0f, 3e9f, 10.0f,
                            3e9f, 20.0f, 3e9f, 20.0f};
  check(annot::minX(huge) == intMax, "minX of 3e9 saturates to INT_MAX");
  check(annot::maxX(huge) == intMax, "maxX of 3e9 saturates to INT_MAX");

  annot::QuadPoints tiny = {-3e9f, 10.0f, 5.0f, 10.0f,
                            -3e9f, 20.0f, 5.0f, 20.0f};
  check(annot::minX(tiny) == intMin, "minX of -3e9 saturates to INT_MIN");

  annot::QuadPoints withNaN = {nan, 10.0f, 5.0f, 10.0f,
                               nan, 20.0f, 5.0f, 20.0f};
  check(annot::minX(withNaN) == 5, "minX skips NaN values");
  check(annot::maxX(withNaN) == 5, "maxX skips NaN values");
  check(annot::minY(withNaN) == 10, "minY unaffected by NaN in X");

  std::cout << std::endl << "Rectangle conversion:" << std::endl;
  annot::PDFRect rect;
  rect.lowerLeftX = 10.0f;
  rect.lowerLeftY = 20.0f;
  rect.upperRightX = 30.0f;
  rect.upperRightY = 40.0f;
  annot::QuadPoints converted = annot::rectToQuad(rect);
  annot::QuadPoints expected = {10.0f, 20.0f, 30.0f, 20.0f,
                                10.0f, 40.0f, 30.0f, 40.0f};
  check(converted == expected, "corners are (llx,lly,urx,lly,llx,ury,urx,ury)");

  std::cout << std::endl << "Quad slicing:" << std::endl;
  check(annot::quadCount(lines) == 2, "16 values hold 2 quads");
  check(annot::quadCount(annot::QuadPoints(12, 1.0f)) == 1,
        "12 values hold 1 complete quad");
  check(annot::quadCount(annot::QuadPoints(7, 1.0f)) == 0,
        "7 values hold no quad");

  annot::QuadPoints second = annot::quadAt(lines, 1);
  check(second.size() == annot::kValuesPerQuad && second[0] == 90.0f &&
            second[7] == 190.0f,
        "quadAt(1) returns the second segment");

  bool threw = false;
  try {
    annot::quadAt(lines, 2);
  } catch (const std::out_of_range &) {
    threw = true;
  }
  check(threw, "quadAt past the end throws std::out_of_range");

  std::cout << std::endl;
  if (failures > 0) {
    std::cerr << failures << " check(s) failed" << std::endl;
    return 1;
  }

  std::cout << "Test completed successfully!" << std::endl;
  return 0;
}
