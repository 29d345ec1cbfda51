#include "docparse/DebugOverlay.hpp"

#include "docparse/Geometry.hpp"

#include <string>

namespace docparse {

cv::Scalar blockTypeColor(BlockType type) {
  switch (type) {
  case BlockType::InferredFromGap:
    return cv::Scalar(0, 0, 255); // Red (BGR)
  case BlockType::Ambiguous:
    return cv::Scalar(0, 160, 0); // Green
  case BlockType::Text:
    return cv::Scalar(0, 140, 255); // Orange
  case BlockType::Title:
    return cv::Scalar(255, 0, 0); // Blue
  case BlockType::List:
    return cv::Scalar(42, 42, 165); // Brown
  case BlockType::Table:
    return cv::Scalar(160, 32, 160); // Purple
  case BlockType::Figure:
    return cv::Scalar(128, 128, 128); // Grey
  }
  return cv::Scalar(0, 0, 0);
}

cv::Mat renderLayoutOverlay(const cv::Mat &pageImage,
                            const std::vector<Region> &regions) {
  cv::Mat output;
  if (pageImage.empty()) {
    return output;
  }

  if (pageImage.channels() == 1) {
    cv::cvtColor(pageImage, output, cv::COLOR_GRAY2BGR);
  } else if (pageImage.channels() == 4) {
    cv::cvtColor(pageImage, output, cv::COLOR_BGRA2BGR);
  } else {
    output = pageImage.clone();
  }

  // Fills first so outlines and labels stay crisp
  cv::Mat fills = output.clone();
  for (const auto &region : regions) {
    cv::Rect rect = toPixelRect(region.box, output.cols, output.rows);
    cv::rectangle(fills, rect, blockTypeColor(region.type), cv::FILLED);
  }
  cv::addWeighted(fills, 0.2, output, 0.8, 0, output);

  for (const auto &region : regions) {
    cv::Rect rect = toPixelRect(region.box, output.cols, output.rows);
    if (rect.empty()) {
      continue;
    }
    cv::Scalar color = blockTypeColor(region.type);
    cv::rectangle(output, rect, color, 2);

    std::string label = blockTypeName(region.type);
    int labelY = rect.y - 5;
    if (labelY < 15) {
      labelY = rect.y + 15;
    }
    cv::putText(output, label, cv::Point(rect.x + 2, labelY),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 1);
  }

  return output;
}

} // namespace docparse
