#ifndef QUAD_GEOMETRY_HPP
#define QUAD_GEOMETRY_HPP

#include <cstddef>
#include <vector>

namespace annot {

/**
 * @brief Flat list of quadrilateral corners in PDF point space
 *
 * Every 8 values describe one quadrilateral as (x0,y0,x1,y1,x2,y2,x3,y3).
 * A highlight spanning several lines carries one quad per line.
 */
using QuadPoints = std::vector<float>;

/// Number of values making up a single quadrilateral
constexpr std::size_t kValuesPerQuad = 8;

/**
 * @brief Annotation bounds in PDF point space (origin bottom-left)
 */
struct PDFRect {
  float lowerLeftX = 0.0f;  ///< Left edge in points
  float lowerLeftY = 0.0f;  ///< Bottom edge in points
  float upperRightX = 0.0f; ///< Right edge in points
  float upperRightY = 0.0f; ///< Top edge in points
};

/**
 * @brief Truncate toward zero, saturating at the int range
 *
 * Values beyond the int range clamp to its limits and NaN becomes 0, so
 * malformed coordinates never reach an out-of-range conversion.
 */
int truncateToInt(double value);

/**
 * @brief Smallest X coordinate of the quad points
 *
 * X values sit on the even indices. A value replaces the running minimum
 * when it compares lower, and is then truncated toward zero. NaN never
 * compares lower and is skipped.
 *
 * @param quadPoints Flat coordinate list, at least one (x,y) pair
 * @return Minimum truncated X coordinate
 */
int minX(const QuadPoints &quadPoints);

/**
 * @brief Smallest Y coordinate of the quad points (odd indices)
 * @param quadPoints Flat coordinate list, at least one (x,y) pair
 * @return Minimum truncated Y coordinate
 */
int minY(const QuadPoints &quadPoints);

/**
 * @brief Largest X coordinate of the quad points
 *
 * The running maximum starts at 0, so a quad lying entirely at negative X
 * yields 0.
 *
 * @param quadPoints Flat coordinate list, at least one (x,y) pair
 * @return Maximum truncated X coordinate, never below 0
 */
int maxX(const QuadPoints &quadPoints);

/**
 * @brief Largest Y coordinate of the quad points, never below 0
 */
int maxY(const QuadPoints &quadPoints);

/**
 * @brief Convert rectangle bounds to a single quad
 *
 * Corners are emitted as (llx,lly, urx,lly, llx,ury, urx,ury).
 */
QuadPoints rectToQuad(const PDFRect &rect);

/**
 * @brief Number of complete quads in the list
 */
std::size_t quadCount(const QuadPoints &quadPoints);

/**
 * @brief Copy of the n-th 8-value segment of the list
 * @param quadPoints Flat coordinate list
 * @param index Zero-based quad index, must be below quadCount()
 */
QuadPoints quadAt(const QuadPoints &quadPoints, std::size_t index);

} // namespace annot

#endif // QUAD_GEOMETRY_HPP
