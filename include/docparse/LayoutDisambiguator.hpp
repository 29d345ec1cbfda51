#ifndef DOCPARSE_LAYOUT_DISAMBIGUATOR_HPP
#define DOCPARSE_LAYOUT_DISAMBIGUATOR_HPP

#include "docparse/TextPresence.hpp"
#include "docparse/Types.hpp"

#include <opencv2/opencv.hpp>

#include <vector>

namespace docparse {

/**
 * @brief Source of raw layout detections for a page image
 */
class DetectionSource {
public:
  virtual ~DetectionSource() = default;

  /**
   * @brief Detect layout boxes on a page
   * @param pageImage Rendered page
   * @return Detections with confidences in [0, 1], possibly empty
   */
  virtual std::vector<Detection> detect(const cv::Mat &pageImage) = 0;
};

/**
 * @brief Thresholds and floors for layout disambiguation
 */
struct DisambiguationConfig {
  double detectionThreshold = 0.8; ///< Detections below are discarded
  double overlapThreshold = 0.7;   ///< IoU at which the weaker box is dropped
  double ambiguityMargin = 0.05;   ///< Band above the threshold -> Ambiguous
  bool trimOverlaps = true;        ///< Cut partial overlaps out of weaker boxes
  bool inferGaps = true;           ///< Synthesize regions in uncovered area
  double minGapArea = 5000.0;      ///< Gap regions must exceed this area
  double minGapWidth = 30.0;       ///< Minimum gap region width in pixels
  double minGapHeight = 15.0;      ///< Minimum gap region height in pixels
  double rowTolerance = 5.0;       ///< Reading-order row tolerance in pixels
};

/**
 * @brief Disambiguated page layout plus counters describing what happened
 */
struct DisambiguationResult {
  bool layoutFound = false; ///< False when no detection was accepted
  PageLayout layout;        ///< Regions in reading order
  int lowConfidenceCount = 0; ///< Discarded below the detection threshold
  int invalidCount = 0;       ///< Discarded for degenerate geometry
  int overlapCount = 0;       ///< Dropped by IoU against a stronger box
  int trimmedAwayCount = 0;   ///< Entirely covered by stronger boxes
  int ambiguousCount = 0;     ///< Relabelled as Ambiguous
  int inferredCount = 0;      ///< Regions synthesized from gaps
};

/**
 * @brief Turns noisy detections into a clean, non-overlapping typed layout
 *
 * Steps, in order:
 * 1. discard detections below the detection threshold or with invalid boxes
 * 2. order by confidence, then area, then original index (all descending
 *    except the index)
 * 3. greedily accept boxes whose IoU with every accepted box stays below the
 *    overlap threshold
 * 4. relabel accepted boxes that cleared the threshold by less than the
 *    ambiguity margin as Ambiguous
 * 5. cut remaining partial overlaps out of the weaker box
 * 6. infer regions in uncovered page area
 * 7. sort into reading order
 *
 * The result depends only on the input, never on hash order or randomness.
 *
 * Example usage:
 * @code
 * docparse::LayoutDisambiguator disambiguator(config);
 * docparse::InkDensityOracle oracle(pageImage);
 * auto result = disambiguator.disambiguate(detections, 0, pageImage.cols,
 *                                          pageImage.rows, &oracle);
 * if (!result.layoutFound) {
 *     // skip the page
 * }
 * @endcode
 */
class LayoutDisambiguator {
public:
  explicit LayoutDisambiguator(
      const DisambiguationConfig &config = DisambiguationConfig());

  /**
   * @brief Disambiguate the detections of one page
   * @param detections Raw detections, in model output order
   * @param pageNumber 0-indexed page number
   * @param pageWidth Page width in pixels
   * @param pageHeight Page height in pixels
   * @param oracle Optional gate for gap regions; without it every gap above
   * the size floors becomes a region
   * @return Layout and counters; layoutFound is false if nothing survived
   */
  DisambiguationResult
  disambiguate(const std::vector<Detection> &detections, int pageNumber,
               double pageWidth, double pageHeight,
               const TextPresenceOracle *oracle = nullptr) const;

  /**
   * @brief Decompose the uncovered page area into disjoint rectangles
   *
   * The page is cut into a grid along every box edge. Uncovered cells of a
   * horizontal band are joined into runs, and runs with identical x extents
   * in consecutive bands are joined vertically.
   *
   * @param covered Boxes covering the page
   * @param pageWidth Page width
   * @param pageHeight Page height
   * @return Rectangles covering exactly the uncovered area
   */
  static std::vector<Box> uncoveredRectangles(const std::vector<Box> &covered,
                                              double pageWidth,
                                              double pageHeight);

  /**
   * @brief Part of box left after removing its overlap with blocker
   *
   * The largest of the strips above, below, left of and right of the
   * intersection is kept.
   *
   * @return The remaining box, or an empty box if nothing remains
   */
  static Box trimAgainst(const Box &box, const Box &blocker);

  const DisambiguationConfig &getConfig() const;

private:
  DisambiguationConfig m_config;
};

} // namespace docparse

#endif // DOCPARSE_LAYOUT_DISAMBIGUATOR_HPP
