#include "AnnotationContext.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>

namespace annot {

namespace {

/**
 * @brief Express a BGR color in the channel layout of the target image
 *
 * Gray targets get the luminance of the color. Alpha channels are opaque.
 */
cv::Scalar colorFor(const cv::Mat &image, const cv::Scalar &bgr) {
  double gray = 0.114 * bgr[0] + 0.587 * bgr[1] + 0.299 * bgr[2];
  switch (image.channels()) {
  case 1:
    return cv::Scalar(gray);
  case 2:
    return cv::Scalar(gray, 255);
  case 4:
    return cv::Scalar(bgr[0], bgr[1], bgr[2], 255);
  default:
    return bgr;
  }
}

/**
 * @brief Visible part of rect inside an image of the given size
 *
 * Edges are summed in 64 bits so rectangles built from saturated
 * coordinates clip instead of overflowing.
 */
cv::Rect clipToImage(long long x, long long y, long long width,
                     long long height, const cv::Size &bounds) {
  long long left = std::max(x, 0LL);
  long long top = std::max(y, 0LL);
  long long right = std::min(x + width, static_cast<long long>(bounds.width));
  long long bottom =
      std::min(y + height, static_cast<long long>(bounds.height));
  if (right <= left || bottom <= top) {
    return cv::Rect();
  }
  return cv::Rect(static_cast<int>(left), static_cast<int>(top),
                  static_cast<int>(right - left),
                  static_cast<int>(bottom - top));
}

cv::Rect clipToImage(const cv::Rect &rect, const cv::Size &bounds) {
  return clipToImage(rect.x, rect.y, rect.width, rect.height, bounds);
}

/**
 * @brief Convert src to the channel count and depth of target
 */
cv::Mat convertToMatch(const cv::Mat &src, const cv::Mat &target) {
  cv::Mat converted;
  int from = src.channels();
  int to = target.channels();

  if (from == to) {
    converted = src;
  } else if (from == 1 && to == 3) {
    cv::cvtColor(src, converted, cv::COLOR_GRAY2BGR);
  } else if (from == 1 && to == 4) {
    cv::cvtColor(src, converted, cv::COLOR_GRAY2BGRA);
  } else if (from == 3 && to == 1) {
    cv::cvtColor(src, converted, cv::COLOR_BGR2GRAY);
  } else if (from == 3 && to == 4) {
    cv::cvtColor(src, converted, cv::COLOR_BGR2BGRA);
  } else if (from == 4 && to == 1) {
    cv::cvtColor(src, converted, cv::COLOR_BGRA2GRAY);
  } else if (from == 4 && to == 3) {
    cv::cvtColor(src, converted, cv::COLOR_BGRA2BGR);
  } else {
    CV_Error(cv::Error::StsUnsupportedFormat,
             "Cannot convert a " + std::to_string(from) +
                 " channel image to " + std::to_string(to) + " channels");
  }

  if (converted.depth() != target.depth()) {
    converted.convertTo(converted, target.depth());
  }
  return converted;
}

/**
 * @brief Draw a stretched overlay image over rect, clipped to the image
 *
 * Overlays with an alpha channel are blended through it, anything else is
 * copied over the destination pixels.
 */
void compositeImage(cv::Mat &image, const cv::Mat &overlay,
                    const cv::Rect &rect) {
  if (rect.width <= 0 || rect.height <= 0) {
    return;
  }

  cv::Rect visible = clipToImage(rect, image.size());
  if (visible.empty()) {
    return;
  }

  cv::Mat stretched;
  cv::resize(overlay, stretched, rect.size(), 0, 0, cv::INTER_LINEAR);
  cv::Mat source = stretched(cv::Rect(visible.x - rect.x, visible.y - rect.y,
                                      visible.width, visible.height));
  cv::Mat target = image(visible);

  cv::Mat converted = convertToMatch(source, target);

  if (source.channels() != 4) {
    converted.copyTo(target);
    return;
  }

  cv::Mat alpha;
  cv::extractChannel(source, alpha, 3);
  cv::Mat weights;
  alpha.convertTo(weights, CV_32F, 1.0 / 255.0);
  cv::Mat inverse = 1.0 - weights;

  if (converted.channels() == 4) {
    // Source over: the covered alpha becomes a + dst * (1 - a)
    cv::Mat opaque(converted.size(), converted.depth(), cv::Scalar(255));
    converted = converted.clone();
    cv::insertChannel(opaque, converted, 3);
  }

  if (converted.depth() != CV_8U && converted.depth() != CV_32F) {
    converted.copyTo(target, alpha > 0);
    return;
  }

  cv::Mat blended;
  cv::blendLinear(converted, target, weights, inverse, blended);
  blended.copyTo(target);
}

} // anonymous namespace

ContextConfig ContextConfig::fromEnvironment() {
  ContextConfig config;

  const char *envDebug = std::getenv("DEBUG");
  if (envDebug != nullptr) {
    std::string value = envDebug;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) {
                     return static_cast<char>(std::tolower(c));
                   });
    config.debug = (value == "true");
  }

  return config;
}

DebugImageSink makeFileDebugSink(const std::string &outputDir) {
  return [outputDir](const cv::Mat &image) {
    thread_local std::mt19937_64 generator(std::random_device{}());

    std::filesystem::create_directories(outputDir);
    std::filesystem::path output =
        std::filesystem::absolute(std::filesystem::path(outputDir) /
                                  ("subimage_" + std::to_string(generator()) +
                                   ".png"));

    std::cout << "Saving image to disk " << output.string() << std::endl;
    if (!cv::imwrite(output.string(), image)) {
      throw std::runtime_error("Could not write " + output.string());
    }
  };
}

AnnotationContext::AnnotationContext() : m_config() {}

AnnotationContext::AnnotationContext(const ContextConfig &config)
    : m_config(config) {}

SubImageResult AnnotationContext::makePlainSubImage(const cv::Mat &page,
                                                    const PDFRect &rect) const {
  return makeSubImage(page, rectToQuad(rect), MarkupKind::None);
}

SubImageResult
AnnotationContext::makeHighlightedSubImage(const cv::Mat &page,
                                           const QuadPoints &quadPoints) const {
  return makeSubImage(page, quadPoints, MarkupKind::Highlight);
}

SubImageResult
AnnotationContext::makePopupSubImage(const cv::Mat &page, const PDFRect &rect,
                                     const cv::Mat &commentBoxImage) const {
  return makeSubImage(page, rectToQuad(rect), MarkupKind::Popup,
                      commentBoxImage);
}

SubImageResult AnnotationContext::extractSubImage(const cv::Mat &page,
                                                  const QuadPoints &quadPoints,
                                                  MarkupKind markup) const {
  SubImageResult result;
  result.success = false;
  result.quadCount = quadCount(quadPoints);

  auto startTime = std::chrono::high_resolution_clock::now();

  if (quadPoints.size() < kValuesPerQuad) {
    result.errorKind = ErrorKind::InvalidInput;
    result.errorMessage = "Annotation needs at least 8 quad point values, got " +
                          std::to_string(quadPoints.size());
    return result;
  }

  if (page.empty()) {
    result.errorKind = ErrorKind::InvalidInput;
    result.errorMessage = "Page image is empty";
    return result;
  }

  try {
    cv::Rect rect = subImageRect(quadPoints, page.size(), markup);
    result.subImageRect = rect;

    if (m_config.debug) {
      std::cerr << "DEBUG: " << markupName(markup) << " sub image ("
                << rect.x << ", " << rect.y << ") size: " << rect.width << "x"
                << rect.height << " on page " << page.cols << "x" << page.rows
                << std::endl;
    }

    if (rect.width <= 0 || rect.height <= 0 ||
        (rect & cv::Rect(0, 0, page.cols, page.rows)) != rect) {
      result.errorKind = ErrorKind::InvalidInput;
      result.errorMessage = "Annotation lies outside the page image";
      return result;
    }

    // Deep copy so the page is never touched by the overlay
    result.image = page(rect).clone();
    result.success = true;
  } catch (const std::exception &e) {
    result.errorKind = ErrorKind::RenderFailed;
    result.errorMessage = std::string("Sub image extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

SubImageResult AnnotationContext::makeSubImage(
    const cv::Mat &page, const QuadPoints &quadPoints, MarkupKind markup,
    const cv::Mat &commentBoxImage) const {
  auto startTime = std::chrono::high_resolution_clock::now();

  SubImageResult result = extractSubImage(page, quadPoints, markup);
  if (!result.success) {
    return result;
  }

  try {
    switch (markup) {
    case MarkupKind::Highlight:
      for (std::size_t n = 0; n < result.quadCount; ++n) {
        paintHighlight(result.image,
                       annotationRect(quadAt(quadPoints, n),
                                      result.subImageRect, page.rows));
      }
      break;
    case MarkupKind::Popup:
      // A popup has a single quad; longer lists are drawn as their union
      result.degraded = paintCommentBox(
          result.image,
          annotationRect(quadPoints, result.subImageRect, page.rows),
          commentBoxImage);
      if (result.degraded) {
        std::cerr << "Comment box image not available, drawing outline"
                  << std::endl;
      }
      break;
    case MarkupKind::None:
      break;
    }
  } catch (const std::exception &e) {
    result.success = false;
    result.errorKind = ErrorKind::RenderFailed;
    result.errorMessage = std::string("Overlay rendering failed: ") + e.what();
    result.image.release();
    return result;
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  emitDebugImage(result.image);

  return result;
}

const ContextConfig &AnnotationContext::getConfig() const { return m_config; }

void AnnotationContext::paintHighlight(cv::Mat &image,
                                       const cv::Rect &rect) const {
  cv::Rect visible = clipToImage(rect, image.size());
  if (visible.empty()) {
    return;
  }

  if (m_config.debug) {
    std::cerr << "DEBUG: highlight (" << rect.x << ", " << rect.y
              << ") size: " << rect.width << "x" << rect.height << std::endl;
  }

  cv::Mat roi = image(visible);
  cv::Mat tint(roi.size(), roi.type(),
               colorFor(image, m_config.highlightColor));
  cv::addWeighted(tint, m_config.highlightAlpha, roi,
                  1.0 - m_config.highlightAlpha, 0.0, roi);
}

bool AnnotationContext::paintCommentBox(cv::Mat &image, const cv::Rect &rect,
                                        const cv::Mat &commentBoxImage) const {
  if (!commentBoxImage.empty()) {
    compositeImage(image, commentBoxImage, rect);
    return false;
  }

  // Stroke straddles the edge of rect
  long long reach = m_config.outlineThickness + 1;
  cv::Rect visible =
      clipToImage(static_cast<long long>(rect.x) - reach,
                  static_cast<long long>(rect.y) - reach,
                  static_cast<long long>(rect.width) + 2 * reach + 1,
                  static_cast<long long>(rect.height) + 2 * reach + 1,
                  image.size());
  if (visible.empty()) {
    return true;
  }

  cv::Mat roi = image(visible);
  cv::Mat stroked = roi.clone();
  // Corners far outside the region are pulled in; the edges stay outside
  auto local = [&](long long value, int extent) {
    return static_cast<int>(
        std::clamp(value, -reach - 1, extent + reach + 1));
  };
  cv::Point topLeft(local(static_cast<long long>(rect.x) - visible.x, roi.cols),
                    local(static_cast<long long>(rect.y) - visible.y, roi.rows));
  cv::Point bottomRight(
      local(static_cast<long long>(rect.x) + rect.width - visible.x, roi.cols),
      local(static_cast<long long>(rect.y) + rect.height - visible.y,
            roi.rows));
  cv::rectangle(stroked, topLeft, bottomRight,
                colorFor(image, m_config.highlightColor),
                m_config.outlineThickness);
  // Untouched pixels blend with themselves and keep their value
  cv::addWeighted(stroked, m_config.highlightAlpha, roi,
                  1.0 - m_config.highlightAlpha, 0.0, roi);
  return true;
}

void AnnotationContext::emitDebugImage(const cv::Mat &image) const {
  if (!m_config.debug || !m_config.debugSink) {
    return;
  }

  try {
    m_config.debugSink(image);
  } catch (const std::exception &e) {
    std::cerr << "Failed to save debug image: " << e.what() << std::endl;
  }
}

} // namespace annot
