#include "docparse/Geometry.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

namespace docparse {

double boxArea(const Box &box) {
  if (box.width <= 0.0 || box.height <= 0.0) {
    return 0.0;
  }
  return box.width * box.height;
}

bool isValidBox(const Box &box) {
  return std::isfinite(box.x) && std::isfinite(box.y) &&
         std::isfinite(box.width) && std::isfinite(box.height) &&
         box.width > 0.0 && box.height > 0.0;
}

double intersectionArea(const Box &a, const Box &b) {
  double left = std::max(a.x, b.x);
  double top = std::max(a.y, b.y);
  double right = std::min(a.x + a.width, b.x + b.width);
  double bottom = std::min(a.y + a.height, b.y + b.height);
  if (right <= left || bottom <= top) {
    return 0.0;
  }
  return (right - left) * (bottom - top);
}

bool overlaps(const Box &a, const Box &b) {
  return intersectionArea(a, b) > kAreaEpsilon;
}

double intersectionOverUnion(const Box &a, const Box &b) {
  double areaA = boxArea(a);
  double areaB = boxArea(b);
  if (areaA <= 0.0 || areaB <= 0.0) {
    return 0.0;
  }
  double intersection = intersectionArea(a, b);
  double unionArea = areaA + areaB - intersection;
  return unionArea > 0.0 ? intersection / unionArea : 0.0;
}

Box unionBox(const Box &a, const Box &b) {
  double left = std::min(a.x, b.x);
  double top = std::min(a.y, b.y);
  double right = std::max(a.x + a.width, b.x + b.width);
  double bottom = std::max(a.y + a.height, b.y + b.height);
  return Box(left, top, right - left, bottom - top);
}

Box clampToPage(const Box &box, double pageWidth, double pageHeight) {
  double left = std::clamp(box.x, 0.0, pageWidth);
  double top = std::clamp(box.y, 0.0, pageHeight);
  double right = std::clamp(box.x + box.width, 0.0, pageWidth);
  double bottom = std::clamp(box.y + box.height, 0.0, pageHeight);
  return Box(left, top, std::max(0.0, right - left),
             std::max(0.0, bottom - top));
}

std::vector<cv::Point2d> toCorners(const Box &box) {
  double x2 = box.x + box.width;
  double y2 = box.y + box.height;
  return {cv::Point2d(box.x, box.y), cv::Point2d(x2, box.y),
          cv::Point2d(x2, y2), cv::Point2d(box.x, y2)};
}

cv::Rect toPixelRect(const Box &box, int imageWidth, int imageHeight) {
  int left = static_cast<int>(std::floor(box.x));
  int top = static_cast<int>(std::floor(box.y));
  int right = static_cast<int>(std::ceil(box.x + box.width));
  int bottom = static_cast<int>(std::ceil(box.y + box.height));
  cv::Rect rect(left, top, right - left, bottom - top);
  return rect & cv::Rect(0, 0, imageWidth, imageHeight);
}

std::vector<std::size_t> readingOrder(const std::vector<Box> &boxes,
                                      double rowTolerance) {
  std::vector<std::size_t> byTop(boxes.size());
  for (std::size_t i = 0; i < boxes.size(); ++i) {
    byTop[i] = i;
  }

  std::stable_sort(byTop.begin(), byTop.end(),
                   [&boxes](std::size_t a, std::size_t b) {
                     if (boxes[a].y != boxes[b].y) {
                       return boxes[a].y < boxes[b].y;
                     }
                     return boxes[a].x < boxes[b].x;
                   });

  // Group into rows anchored on the topmost box of each row, then order
  // each row left to right
  std::vector<std::size_t> order;
  order.reserve(boxes.size());
  std::size_t rowStart = 0;
  while (rowStart < byTop.size()) {
    double anchorY = boxes[byTop[rowStart]].y;
    std::size_t rowEnd = rowStart + 1;
    while (rowEnd < byTop.size() &&
           boxes[byTop[rowEnd]].y - anchorY <= rowTolerance) {
      ++rowEnd;
    }

    std::stable_sort(byTop.begin() + rowStart, byTop.begin() + rowEnd,
                     [&boxes](std::size_t a, std::size_t b) {
                       return boxes[a].x < boxes[b].x;
                     });
    order.insert(order.end(), byTop.begin() + rowStart,
                 byTop.begin() + rowEnd);
    rowStart = rowEnd;
  }

  return order;
}

void sortByReadingOrder(std::vector<Region> &regions, double rowTolerance) {
  std::vector<Box> boxes;
  boxes.reserve(regions.size());
  for (const auto &region : regions) {
    boxes.push_back(region.box);
  }

  std::vector<Region> sorted;
  sorted.reserve(regions.size());
  for (std::size_t index : readingOrder(boxes, rowTolerance)) {
    sorted.push_back(std::move(regions[index]));
  }
  regions = std::move(sorted);
}

std::string trim(const std::string &text) {
  auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
  auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
  if (begin >= end) {
    return "";
  }
  return std::string(begin, end);
}

std::vector<std::string> cleanLines(const std::vector<std::string> &lines) {
  std::vector<std::string> cleaned;
  for (const auto &raw : lines) {
    std::istringstream stream(raw);
    std::string line;
    while (std::getline(stream, line)) {
      std::string stripped = trim(line);
      if (!stripped.empty()) {
        cleaned.push_back(std::move(stripped));
      }
    }
  }
  return cleaned;
}

} // namespace docparse
