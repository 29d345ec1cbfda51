#ifndef DOCPARSE_DEBUG_OVERLAY_HPP
#define DOCPARSE_DEBUG_OVERLAY_HPP

#include "docparse/Types.hpp"

#include <opencv2/opencv.hpp>

#include <vector>

namespace docparse {

/**
 * @brief Box colour used for a block type (BGR)
 *
 * Red = inferred, green = ambiguous, orange = text, blue = title,
 * brown = list, purple = table, grey = figure.
 */
cv::Scalar blockTypeColor(BlockType type);

/**
 * @brief Draw regions on a copy of the page image
 *
 * Each region gets a translucent fill and an outline in its type colour,
 * with the type name above the box.
 *
 * @param pageImage Page image (grayscale, BGR or BGRA)
 * @param regions Regions to draw
 * @return BGR image with the overlay
 */
cv::Mat renderLayoutOverlay(const cv::Mat &pageImage,
                            const std::vector<Region> &regions);

} // namespace docparse

#endif // DOCPARSE_DEBUG_OVERLAY_HPP
