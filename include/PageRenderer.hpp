#ifndef PAGE_RENDERER_HPP
#define PAGE_RENDERER_HPP

#include "CoordinateTransform.hpp"

#include <opencv2/core.hpp>

#include <string>

namespace annot {

/// Resolution at which one PDF point maps to kScaleUpFactor pixels
constexpr double kContextDpi = 72.0 * kScaleUpFactor;

/**
 * @brief Result of rendering a single PDF page
 */
struct PageRenderResult {
  bool success = false;        ///< Whether rendering succeeded
  std::string errorMessage;    ///< Error message if failed
  cv::Mat image;               ///< Rendered page (BGR or gray)
  int pageNumber = 0;          ///< 1-indexed page number
  int pageCount = 0;           ///< Number of pages in the document
  double pageWidth = 0;        ///< Page width in points
  double pageHeight = 0;       ///< Page height in points
  double dpi = 0;              ///< Resolution used for rendering
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Render one page of a PDF file with Poppler
 *
 * The default resolution makes the raster line up with the geometry used by
 * AnnotationContext.
 *
 * @param pdfPath Path to the PDF file
 * @param pageNumber 1-indexed page to render
 * @param dpi Resolution for rendering (default: kContextDpi)
 * @return PageRenderResult containing the page raster
 */
PageRenderResult renderPDFPage(const std::string &pdfPath, int pageNumber = 1,
                               double dpi = kContextDpi);

/**
 * @brief Load a page raster from disk, dispatching on the file extension
 *
 * ".pdf" files are rendered with renderPDFPage(), anything else is read
 * with cv::imread unchanged (alpha channels are kept).
 */
PageRenderResult loadPage(const std::string &path, int pageNumber = 1);

} // namespace annot

#endif // PAGE_RENDERER_HPP
