#ifndef DOCPARSE_GEOMETRY_HPP
#define DOCPARSE_GEOMETRY_HPP

#include "docparse/Types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace docparse {

/// Overlaps with an area at or below this are treated as touching edges.
constexpr double kAreaEpsilon = 1e-6;

/**
 * @brief Area of a box, 0 for degenerate boxes
 */
double boxArea(const Box &box);

/**
 * @brief Whether the box has finite coordinates and positive size
 */
bool isValidBox(const Box &box);

/**
 * @brief Area of the intersection of two boxes
 */
double intersectionArea(const Box &a, const Box &b);

/**
 * @brief Whether two boxes share a non-zero area
 */
bool overlaps(const Box &a, const Box &b);

/**
 * @brief Intersection-over-union of two boxes, 0 when either is degenerate
 */
double intersectionOverUnion(const Box &a, const Box &b);

/**
 * @brief Smallest box containing both boxes
 */
Box unionBox(const Box &a, const Box &b);

/**
 * @brief Clamp a box to the page rectangle [0, width] x [0, height]
 */
Box clampToPage(const Box &box, double pageWidth, double pageHeight);

/**
 * @brief The four corners of a box, clockwise from top-left
 */
std::vector<cv::Point2d> toCorners(const Box &box);

/**
 * @brief Whole-pixel rectangle covering the box, clamped to the image
 *
 * Edges are rounded outwards so no part of the box is lost to truncation.
 */
cv::Rect toPixelRect(const Box &box, int imageWidth, int imageHeight);

/**
 * @brief Permutation putting boxes in reading order
 *
 * Boxes whose top edges lie within rowTolerance of the first box of a row
 * form that row. Rows run top to bottom and boxes within a row left to
 * right. Ties fall back to the original index, so the order is total and
 * deterministic.
 *
 * @param boxes Boxes to order
 * @param rowTolerance Maximum top-edge difference within one row, in pixels
 * @return Indices into boxes, in reading order
 */
std::vector<std::size_t> readingOrder(const std::vector<Box> &boxes,
                                      double rowTolerance);

/**
 * @brief Sort regions into reading order (see readingOrder())
 */
void sortByReadingOrder(std::vector<Region> &regions, double rowTolerance);

/**
 * @brief Copy of the string without leading and trailing whitespace
 */
std::string trim(const std::string &text);

/**
 * @brief Split lines on embedded newlines, strip them and drop blank ones
 */
std::vector<std::string> cleanLines(const std::vector<std::string> &lines);

} // namespace docparse

#endif // DOCPARSE_GEOMETRY_HPP
