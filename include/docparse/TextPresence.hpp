#ifndef DOCPARSE_TEXT_PRESENCE_HPP
#define DOCPARSE_TEXT_PRESENCE_HPP

#include "docparse/Types.hpp"

#include <opencv2/opencv.hpp>

namespace docparse {

/**
 * @brief Decides whether an uncovered page area is worth a gap region
 */
class TextPresenceOracle {
public:
  virtual ~TextPresenceOracle() = default;

  /**
   * @brief Whether the area likely contains text
   * @param area Rectangle in page-pixel coordinates
   */
  virtual bool hasText(const Box &area) const = 0;
};

/**
 * @brief Text-presence check based on the share of dark pixels
 *
 * The page is converted to grayscale and binarised once with Otsu's method.
 * An area is considered to contain text when its ink ratio reaches
 * minInkRatio.
 */
class InkDensityOracle : public TextPresenceOracle {
public:
  /**
   * @param pageImage Page image (BGR, BGRA or grayscale)
   * @param minInkRatio Minimum fraction of ink pixels, in [0, 1]
   */
  explicit InkDensityOracle(const cv::Mat &pageImage,
                            double minInkRatio = 0.01);

  bool hasText(const Box &area) const override;

  /**
   * @brief Fraction of ink pixels inside the area (0 for empty areas)
   */
  double inkRatio(const Box &area) const;

private:
  cv::Mat m_inkMask; ///< 255 where the page has ink
  double m_minInkRatio;
};

} // namespace docparse

#endif // DOCPARSE_TEXT_PRESENCE_HPP
