#include "CoordinateTransform.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

static int failures = 0;

void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << description
            << std::endl;
  if (!condition) {
    failures++;
  }
}

std::string describe(const cv::Rect &rect) {
  return "(" + std::to_string(rect.x) + "," + std::to_string(rect.y) + "," +
         std::to_string(rect.width) + "," + std::to_string(rect.height) + ")";
}

annot::QuadPoints makeQuad(float llx, float lly, float urx, float ury) {
  annot::PDFRect rect;
  rect.lowerLeftX = llx;
  rect.lowerLeftY = lly;
  rect.upperRightX = urx;
  rect.upperRightY = ury;
  return annot::rectToQuad(rect);
}

bool inside(const cv::Rect &rect, const cv::Size &bounds) {
  return rect.x >= 0 && rect.y >= 0 && rect.x + rect.width <= bounds.width &&
         rect.y + rect.height <= bounds.height;
}

int main() {
  std::cout << "=== Test coordinate transform ===" << std::endl << std::endl;

  const cv::Size page(1200, 1600); // 600 x 800 pt at 144 DPI

  std::cout << "Markup table:" << std::endl;
  check(annot::contextMultiplier(annot::MarkupKind::None) == 1.0f,
        "none uses multiplier 1");
  check(annot::contextMultiplier(annot::MarkupKind::Highlight) == 1.0f,
        "highlight uses multiplier 1");
  check(annot::contextMultiplier(annot::MarkupKind::Popup) == 2.0f,
        "popup uses multiplier 2");
  check(std::string(annot::markupName(annot::MarkupKind::Popup)) == "popup",
        "popup is named \"popup\"");

  std::cout << std::endl << "Rounding:" << std::endl;
  check(annot::roundHalfUp(2.5f) == 3, "2.5 rounds to 3");
  check(annot::roundHalfUp(-2.5f) == -2, "-2.5 rounds to -2");
  check(annot::roundHalfUp(-2.6f) == -3, "-2.6 rounds to -3");

  std::cout << std::endl << "Sub image rectangle:" << std::endl;
  annot::QuadPoints quad = makeQuad(100, 200, 150, 230);

  cv::Rect highlight =
      annot::subImageRect(quad, page, annot::MarkupKind::Highlight);
  check(highlight == cv::Rect(140, 1080, 220, 180),
        "highlight with a 30pt border is (140,1080,220,180), got " +
            describe(highlight));

  cv::Rect popup = annot::subImageRect(quad, page, annot::MarkupKind::Popup);
  check(popup == cv::Rect(80, 1020, 340, 300),
        "popup with a 60pt border is (80,1020,340,300), got " +
            describe(popup));

  cv::Rect plain = annot::subImageRect(quad, page, annot::MarkupKind::None);
  check(plain == highlight, "none uses the same border as highlight");

  std::cout << std::endl << "Clamping and Y flip:" << std::endl;
  cv::Rect bottomLeft = annot::subImageRect(makeQuad(10, 10, 40, 20), page,
                                            annot::MarkupKind::Highlight);
  check(bottomLeft == cv::Rect(0, 1460, 180, 140),
        "bottom-left annotation clamps to x=0 and ends on the last row, got " +
            describe(bottomLeft));

  cv::Rect topRight = annot::subImageRect(makeQuad(580, 780, 600, 800), page,
                                          annot::MarkupKind::Highlight);
  check(topRight == cv::Rect(1100, 0, 100, 100),
        "top-right annotation clamps to the page and maps to y=0, got " +
            describe(topRight));

  cv::Rect offPage = annot::subImageRect(makeQuad(700, 100, 750, 120), page,
                                         annot::MarkupKind::Highlight);
  check(offPage.width <= 0, "annotation right of the page has no width");

  std::cout << std::endl << "Page bounds over random rectangles:" << std::endl;
  cv::RNG rng(20240611);
  bool allInside = true;
  for (int i = 0; i < 2000; ++i) {
    float llx = rng.uniform(0.0f, 599.0f);
    float lly = rng.uniform(0.0f, 799.0f);
    float urx = rng.uniform(llx, 600.0f);
    float ury = rng.uniform(lly, 800.0f);
    auto markup = static_cast<annot::MarkupKind>(rng.uniform(0, 3));

    cv::Rect rect =
        annot::subImageRect(makeQuad(llx, lly, urx, ury), page, markup);
    if (rect.width <= 0 || rect.height <= 0 || !inside(rect, page)) {
      std::cout << "    outside: " << describe(rect) << std::endl;
      allInside = false;
      break;
    }
  }
  check(allInside, "every rectangle lies within the 1200x1600 page");

  std::cout << std::endl << "Scaling:" << std::endl;
  // The border is a fixed number of PDF units, so only the annotation part
  // of the crop scales with the document.
  annot::QuadPoints small = makeQuad(100, 200, 150, 230);
  annot::QuadPoints large = makeQuad(200, 400, 300, 460);
  cv::Size largePage(page.width * 2, page.height * 2);
  cv::Rect smallRect =
      annot::subImageRect(small, page, annot::MarkupKind::Highlight);
  cv::Rect largeRect =
      annot::subImageRect(large, largePage, annot::MarkupKind::Highlight);
  check(std::abs((largeRect.width - smallRect.width) - 2 * 50) <= 1,
        "width grows by the scaled annotation width");
  check(std::abs((largeRect.height - smallRect.height) - 2 * 30) <= 1,
        "height grows by the scaled annotation height");

  cv::Rect smallLocal = annot::annotationRect(small, smallRect, page.height);
  cv::Rect largeLocal =
      annot::annotationRect(large, largeRect, largePage.height);
  check(largeLocal.width == 2 * smallLocal.width &&
            largeLocal.height == 2 * smallLocal.height,
        "annotation rectangle size doubles");

  std::cout << std::endl << "Annotation rectangle:" << std::endl;
  cv::Rect local = annot::annotationRect(quad, highlight, page.height);
  check(local == cv::Rect(60, 60, 100, 60),
        "highlight sits one scaled border inside the crop, got " +
            describe(local));

  cv::Rect popupLocal = annot::annotationRect(quad, popup, page.height);
  check(popupLocal == cv::Rect(120, 120, 100, 60),
        "popup sits two scaled borders inside the crop, got " +
            describe(popupLocal));

  cv::Rect clampedLocal =
      annot::annotationRect(makeQuad(10, 10, 40, 20), bottomLeft, page.height);
  check(clampedLocal == cv::Rect(20, 100, 60, 20),
        "clamped crop flips with the full page height, got " +
            describe(clampedLocal));

  std::cout << std::endl
            << "Highlight containment over random selections:" << std::endl;
  bool allContained = true;
  for (int i = 0; i < 500 && allContained; ++i) {
    annot::QuadPoints selection;
    int lineCount = rng.uniform(1, 5);
    for (int line = 0; line < lineCount; ++line) {
      float llx = rng.uniform(30.0f, 500.0f);
      float lly = rng.uniform(30.0f, 700.0f);
      float urx = rng.uniform(llx, 570.0f);
      float ury = rng.uniform(lly, 770.0f);
      annot::QuadPoints one = makeQuad(llx, lly, urx, ury);
      selection.insert(selection.end(), one.begin(), one.end());
    }

    cv::Rect crop =
        annot::subImageRect(selection, page, annot::MarkupKind::Highlight);
    for (std::size_t n = 0; n < annot::quadCount(selection); ++n) {
      cv::Rect lineRect = annot::annotationRect(annot::quadAt(selection, n),
                                                crop, page.height);
      if (!inside(lineRect, crop.size())) {
        std::cout << "    " << describe(lineRect) << " outside crop "
                  << describe(crop) << std::endl;
        allContained = false;
        break;
      }
    }
  }
  check(allContained, "every highlight line lies within its crop");

  std::cout << std::endl;
  if (failures > 0) {
    std::cerr << failures << " check(s) failed" << std::endl;
    return 1;
  }

  std::cout << "Test completed successfully!" << std::endl;
  return 0;
}
