#ifndef ANNOTATION_CONTEXT_HPP
#define ANNOTATION_CONTEXT_HPP

#include "CoordinateTransform.hpp"
#include "QuadGeometry.hpp"

#include <opencv2/core.hpp>

#include <functional>
#include <string>

namespace annot {

/**
 * @brief Receives every produced sub image when debugging is enabled
 *
 * A sink may throw; the exception is logged and never reaches the caller of
 * AnnotationContext.
 */
using DebugImageSink = std::function<void(const cv::Mat &)>;

/**
 * @brief Why a sub image could not be produced
 */
enum class ErrorKind {
  None,         ///< No error
  InvalidInput, ///< Too few quad values, empty page or a crop without area
  RenderFailed  ///< OpenCV failed while cropping or painting
};

/**
 * @brief Configuration options for sub image extraction
 */
struct ContextConfig {
  cv::Scalar highlightColor =
      cv::Scalar(35, 249, 234); ///< Highlight tint (BGR)
  double highlightAlpha = 140.0 / 255.0; ///< Highlight opacity (0-1)
  int outlineThickness = static_cast<int>(
      2 * kScaleUpFactor);     ///< Popup fallback stroke width in pixels
  bool debug = false;          ///< Hand every result to debugSink
  DebugImageSink debugSink;    ///< Diagnostic output (empty = none)

  /**
   * @brief Default configuration with the debug flag taken from $DEBUG
   *
   * DEBUG is enabled when the variable equals "true", ignoring case. Meant
   * to be called once at process start.
   */
  static ContextConfig fromEnvironment();
};

/**
 * @brief Result of a sub image extraction
 */
struct SubImageResult {
  bool success = false;                ///< Whether an image was produced
  ErrorKind errorKind = ErrorKind::None; ///< Failure category
  std::string errorMessage;            ///< Error message if failed
  cv::Mat image;                       ///< Crop with overlay, page pixel type
  cv::Rect subImageRect;               ///< Crop rectangle in page pixels
  std::size_t quadCount = 0;           ///< Number of quads in the request
  bool degraded = false; ///< Popup outline drawn because the asset was absent
  double processingTimeMs = 0;         ///< Processing time in milliseconds
};

/**
 * @brief Writes sub images as PNG files with randomized names
 *
 * Each call writes "<outputDir>/subimage_<random>.png", creating the
 * directory when needed, and logs the absolute path to std::cout.
 *
 * @param outputDir Target directory (default: current directory)
 * @return Sink suitable for ContextConfig::debugSink
 */
DebugImageSink makeFileDebugSink(const std::string &outputDir = ".");

/**
 * @brief Extracts the area surrounding a PDF annotation from a page raster
 *
 * The page raster is expected to be rendered at kScaleUpFactor pixels per
 * PDF point (144 DPI). The page is never modified; every call returns a new
 * image of the same pixel type.
 *
 * Example usage:
 * @code
 * annot::AnnotationContext context;
 * auto result = context.makeHighlightedSubImage(page, quadPoints);
 * if (result.success) {
 *     cv::imwrite("highlight.png", result.image);
 * }
 * @endcode
 */
class AnnotationContext {
public:
  /**
   * @brief Default constructor
   */
  AnnotationContext();

  /**
   * @brief Constructor with custom configuration
   * @param config Extraction configuration
   */
  explicit AnnotationContext(const ContextConfig &config);

  /**
   * @brief Plain image of the annotation and the area surrounding it
   * @param page Image of the entire page the annotation is on
   * @param rect Area of the page the annotation takes up
   */
  SubImageResult makePlainSubImage(const cv::Mat &page,
                                   const PDFRect &rect) const;

  /**
   * @brief Image of a highlight annotation with every quad tinted
   * @param page Image of the entire page the annotation is on
   * @param quadPoints One quad per highlighted line
   */
  SubImageResult makeHighlightedSubImage(const cv::Mat &page,
                                         const QuadPoints &quadPoints) const;

  /**
   * @brief Image of a popup annotation with its comment box drawn on top
   *
   * When commentBoxImage is empty an outline in the highlight color is drawn
   * instead and SubImageResult::degraded is set.
   *
   * @param page Image of the entire page the annotation is on
   * @param rect Area of the page the annotation takes up
   * @param commentBoxImage Comment box glyph, stretched over the annotation
   */
  SubImageResult makePopupSubImage(const cv::Mat &page, const PDFRect &rect,
                                   const cv::Mat &commentBoxImage) const;

  /**
   * @brief Crop the page around the quads and paint the requested markup
   *
   * The QuadPoints array must contain 8*n elements specifying the
   * coordinates of n quadrilaterals. All quadrilaterals are assumed to be
   * axis-aligned rectangles. Trailing values beyond the last complete
   * quad still widen the crop but are never painted as a highlight.
   *
   * @param page Image of the entire page the annotation is on
   * @param quadPoints Flat quad list in PDF points
   * @param markup Overlay to paint
   * @param commentBoxImage Popup glyph, ignored for other markups
   * @return SubImageResult, success == false with InvalidInput when fewer
   * than 8 values are given
   */
  SubImageResult makeSubImage(const cv::Mat &page, const QuadPoints &quadPoints,
                              MarkupKind markup,
                              const cv::Mat &commentBoxImage = cv::Mat()) const;

  /**
   * @brief Crop the page around the quads without painting anything
   *
   * The markup only selects the context border.
   */
  SubImageResult extractSubImage(const cv::Mat &page,
                                 const QuadPoints &quadPoints,
                                 MarkupKind markup) const;

  /**
   * @brief Get the current configuration
   */
  const ContextConfig &getConfig() const;

private:
  /**
   * @brief Tint a rectangle of the sub image with the highlight color
   */
  void paintHighlight(cv::Mat &image, const cv::Rect &rect) const;

  /**
   * @brief Stretch the comment box over rect, or outline rect without one
   * @return true if the outline fallback was used
   */
  bool paintCommentBox(cv::Mat &image, const cv::Rect &rect,
                       const cv::Mat &commentBoxImage) const;

  /**
   * @brief Pass the result to the debug sink, swallowing sink failures
   */
  void emitDebugImage(const cv::Mat &image) const;

  ContextConfig m_config; ///< Immutable configuration
};

} // namespace annot

#endif // ANNOTATION_CONTEXT_HPP
