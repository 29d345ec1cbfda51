#ifndef DOCPARSE_TYPES_HPP
#define DOCPARSE_TYPES_HPP

#include <opencv2/opencv.hpp>

#include <optional>
#include <string>
#include <vector>

namespace docparse {

/**
 * @brief Rectangle in page-pixel coordinates (origin top-left, y down)
 *
 * x1 = x, y1 = y, x2 = x + width, y2 = y + height. A valid box has positive
 * width and height.
 */
using Box = cv::Rect2d;

/**
 * @brief Labels a layout-detection model can emit
 */
enum class DetectionLabel { Text, Title, List, Table, Figure };

/**
 * @brief Resolved type of a region or text block
 */
enum class BlockType {
  Text,
  Title,
  List,
  Table,
  Figure,
  InferredFromGap, ///< Synthesized in page area no detection covered
  Ambiguous        ///< Label cleared the threshold by too small a margin
};

/**
 * @brief Document content types the parser handles
 */
enum class ContentType { Html, Pdf };

/**
 * @brief Raw labelled rectangle from a layout-detection model
 */
struct Detection {
  Box box;                                     ///< Detected rectangle
  DetectionLabel label = DetectionLabel::Text; ///< Predicted label
  double confidence = 0.0;                     ///< Score in [0, 1]
};

/**
 * @brief Post-disambiguation unit of page layout
 */
struct Region {
  Box box;                              ///< Region rectangle
  BlockType type = BlockType::Text;     ///< Resolved type
  std::optional<double> sourceConfidence; ///< Empty for inferred regions
};

/**
 * @brief Recognized text with its position, type and language
 */
struct TextBlock {
  std::vector<std::string> text;       ///< Text lines in reading order
  std::string blockId;                 ///< Unique within the document
  std::optional<std::string> language; ///< 2-letter ISO code
  BlockType type = BlockType::Text;    ///< Type of the source region
  double typeConfidence = 0.0;         ///< Confidence in the type, [0, 1]
  std::vector<cv::Point2d> coords;     ///< Corners, clockwise from top-left
  int pageNumber = 0;                  ///< 0-indexed page

  /**
   * @brief Lines stripped of surrounding whitespace and joined by spaces
   */
  std::string toString() const;
};

/**
 * @brief Ordered regions of one page plus its dimensions
 */
struct PageLayout {
  int pageNumber = 0;
  double width = 0.0;
  double height = 0.0;
  std::vector<Region> regions;
};

/**
 * @brief Dimensions of one page in pixels
 */
struct PageMetadata {
  int pageNumber = 0;
  double width = 0.0;
  double height = 0.0;
};

/**
 * @brief Canonical display name, e.g. "Inferred from gaps"
 */
std::string blockTypeName(BlockType type);

/**
 * @brief Parse a canonical block type name
 * @return The type, or std::nullopt if the name is unknown
 */
std::optional<BlockType> blockTypeFromName(const std::string &name);

/**
 * @brief Block type a detection label resolves to when trusted
 */
BlockType toBlockType(DetectionLabel label);

std::string contentTypeName(ContentType type);
std::optional<ContentType> contentTypeFromName(const std::string &name);

} // namespace docparse

#endif // DOCPARSE_TYPES_HPP
