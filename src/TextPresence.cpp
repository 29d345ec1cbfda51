#include "docparse/TextPresence.hpp"

#include "docparse/Geometry.hpp"

namespace docparse {

InkDensityOracle::InkDensityOracle(const cv::Mat &pageImage,
                                   double minInkRatio)
    : m_minInkRatio(minInkRatio) {
  if (pageImage.empty()) {
    return;
  }

  cv::Mat gray;
  if (pageImage.channels() == 3) {
    cv::cvtColor(pageImage, gray, cv::COLOR_BGR2GRAY);
  } else if (pageImage.channels() == 4) {
    cv::cvtColor(pageImage, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = pageImage;
  }

  if (gray.depth() != CV_8U) {
    gray.convertTo(gray, CV_8U);
  }

  // Otsu has no meaningful split on a uniform page
  double minValue = 0.0;
  double maxValue = 0.0;
  cv::minMaxLoc(gray, &minValue, &maxValue);
  if (minValue == maxValue) {
    m_inkMask = cv::Mat::zeros(gray.size(), CV_8UC1);
    return;
  }

  // Dark text on a light page becomes 255 in the mask
  cv::threshold(gray, m_inkMask, 0, 255,
                cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
}

bool InkDensityOracle::hasText(const Box &area) const {
  return inkRatio(area) >= m_minInkRatio;
}

double InkDensityOracle::inkRatio(const Box &area) const {
  if (m_inkMask.empty()) {
    return 0.0;
  }

  cv::Rect roi = toPixelRect(area, m_inkMask.cols, m_inkMask.rows);
  if (roi.empty()) {
    return 0.0;
  }

  int inkPixels = cv::countNonZero(m_inkMask(roi));
  return static_cast<double>(inkPixels) / static_cast<double>(roi.area());
}

} // namespace docparse
