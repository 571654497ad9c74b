#ifndef COORDINATE_TRANSFORM_HPP
#define COORDINATE_TRANSFORM_HPP

#include "QuadGeometry.hpp"

#include <opencv2/core.hpp>

namespace annot {

/// Context border around an annotation, in PDF units
constexpr int kBorderWidth = 30;

/// Pixels per PDF unit in the rendered page raster
constexpr float kScaleUpFactor = 2.0f;

/**
 * @brief Markup painted onto the extracted sub image
 */
enum class MarkupKind {
  None,      ///< Plain crop, no overlay
  Highlight, ///< Translucent fill over every quad
  Popup      ///< Comment box image (or outline) over a single quad
};

/**
 * @brief Scalar applied to kBorderWidth for the given markup
 *
 * None and Highlight use 1, Popup uses 2 so comment markers get more
 * surrounding context.
 */
float contextMultiplier(MarkupKind markup);

/**
 * @brief Human readable name of the markup ("none", "highlight", "popup")
 */
const char *markupName(MarkupKind markup);

/**
 * @brief Round half up, the way the crop geometry has always been rounded
 *
 * Unlike std::lround, -2.5 rounds to -2.
 */
int roundHalfUp(float value);

/**
 * @brief Compute the crop rectangle around all quads of an annotation
 *
 * Takes the union bounding box of every quad, grows it by the markup's
 * context border, scales it to pixels and clamps it to the page. The Y axis
 * is flipped last, using the clamped height, so the result is in top-left
 * pixel space.
 *
 * The returned rectangle can have a non-positive width or height when the
 * annotation lies beyond the right or top edge of the page.
 *
 * @param quadPoints Flat quad list in PDF points, at least 8 values
 * @param pageSize Size of the rendered page raster in pixels
 * @param markup Markup kind, selects the context multiplier
 * @return Crop rectangle in page pixel coordinates
 */
cv::Rect subImageRect(const QuadPoints &quadPoints, const cv::Size &pageSize,
                      MarkupKind markup);

/**
 * @brief Place one quad inside an already extracted sub image
 *
 * No border and no clamping are applied. The Y flip uses the full page
 * height rather than the sub image height; overlay placement depends on
 * that exact offset.
 *
 * @param quad A single 8-value quad in PDF points
 * @param boundingRect Crop rectangle returned by subImageRect()
 * @param pageHeight Height of the full page raster in pixels
 * @return Rectangle in the sub image's local pixel coordinates
 */
cv::Rect annotationRect(const QuadPoints &quad, const cv::Rect &boundingRect,
                        int pageHeight);

} // namespace annot

#endif // COORDINATE_TRANSFORM_HPP
