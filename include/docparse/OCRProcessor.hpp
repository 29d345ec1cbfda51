#ifndef DOCPARSE_OCR_PROCESSOR_HPP
#define DOCPARSE_OCR_PROCESSOR_HPP

#include "docparse/Types.hpp"

#include <opencv2/opencv.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace docparse {

/**
 * @brief Recognizes text in an image crop
 */
class OcrEngine {
public:
  virtual ~OcrEngine() = default;

  /**
   * @brief Recognize the text in a crop
   * @param crop Image of one region
   * @return Text lines in reading order, possibly empty
   */
  virtual std::vector<std::string> recognize(const cv::Mat &crop) = 0;
};

/**
 * @brief Options for text block assembly
 */
struct OCRProcessorConfig {
  /// Type confidence given to regions without a source confidence
  double inferredTypeConfidence = 0.5;
};

/**
 * @brief Text blocks of one page and the regions that produced them
 */
struct PageOCRResult {
  std::vector<TextBlock> textBlocks; ///< In reading order
  std::vector<Region> layoutBlocks;  ///< Regions that yielded text
  int droppedRegions = 0;            ///< Regions without any text
};

/**
 * @brief Binds recognized text to the final regions of a page
 *
 * Each region is cropped from the page image and passed to the OCR engine.
 * Regions that yield no text are dropped, so the number of text blocks never
 * exceeds the number of regions.
 */
class OCRProcessor {
public:
  /**
   * @param image Page image
   * @param pageNumber 0-indexed page number
   * @param layout Final regions in reading order
   * @param engine OCR engine, borrowed for the processor's lifetime
   * @param config Assembly options
   */
  OCRProcessor(cv::Mat image, int pageNumber, std::vector<Region> layout,
               OcrEngine &engine,
               const OCRProcessorConfig &config = OCRProcessorConfig());

  /**
   * @brief OCR every region and assemble text blocks
   */
  PageOCRResult processLayout();

  /**
   * @brief Block id for the region at a position in the page layout
   * @return e.g. "p0_b3"
   */
  static std::string makeBlockId(int pageNumber, std::size_t regionIndex);

private:
  cv::Mat m_image;
  int m_pageNumber;
  std::vector<Region> m_layout;
  OcrEngine &m_engine;
  OCRProcessorConfig m_config;
};

} // namespace docparse

#endif // DOCPARSE_OCR_PROCESSOR_HPP
