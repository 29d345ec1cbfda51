#ifndef DOCPARSE_POST_PROCESSOR_HPP
#define DOCPARSE_POST_PROCESSOR_HPP

#include "docparse/Types.hpp"

#include <vector>

namespace docparse {

/**
 * @brief Tolerances for merging and floors for dropping regions
 */
struct PostProcessingConfig {
  double mergeGapTolerance = 10.0; ///< Max distance between merged regions
  double alignmentRatio = 0.8; ///< Min shared extent vs. the smaller region
  double minWidth = 5.0;       ///< Regions narrower than this are noise
  double minHeight = 5.0;      ///< Regions shorter than this are noise
  double minArea = 100.0;      ///< Regions smaller than this are noise
  double rowTolerance = 5.0;   ///< Reading-order row tolerance in pixels
};

/**
 * @brief Turns a disambiguated layout into OCR-ready regions
 *
 * Adjacent, aligned regions of the same type are merged so a paragraph is
 * not split into several blocks; tables and figures are never merged.
 * Degenerate regions are dropped and the rest sorted into reading order.
 */
class PostProcessor {
public:
  explicit PostProcessor(
      PageLayout layout,
      const PostProcessingConfig &config = PostProcessingConfig());

  /**
   * @brief Run merging, filtering and sorting
   */
  void postprocess();

  /**
   * @brief Final regions, valid after postprocess()
   */
  const std::vector<Region> &ocrBlocks() const;

  /**
   * @brief Whether any region survived post-processing
   */
  bool hasContent() const;

  int mergedCount() const;
  int droppedCount() const;

  /**
   * @brief Whether two regions may be merged, ignoring other regions
   */
  bool canMerge(const Region &a, const Region &b) const;

private:
  void mergeAdjacent();
  void dropDegenerate();

  PageLayout m_layout;
  PostProcessingConfig m_config;
  int m_merged = 0;
  int m_dropped = 0;
};

} // namespace docparse

#endif // DOCPARSE_POST_PROCESSOR_HPP
