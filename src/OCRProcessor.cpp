#include "docparse/OCRProcessor.hpp"

#include "docparse/Geometry.hpp"
#include "docparse/Log.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace docparse {

OCRProcessor::OCRProcessor(cv::Mat image, int pageNumber,
                           std::vector<Region> layout, OcrEngine &engine,
                           const OCRProcessorConfig &config)
    : m_image(std::move(image)), m_pageNumber(pageNumber),
      m_layout(std::move(layout)), m_engine(engine), m_config(config) {}

PageOCRResult OCRProcessor::processLayout() {
  PageOCRResult result;
  const std::string stage = "ocr p" + std::to_string(m_pageNumber);

  for (std::size_t index = 0; index < m_layout.size(); ++index) {
    const Region &region = m_layout[index];

    cv::Rect roi = toPixelRect(region.box, m_image.cols, m_image.rows);
    if (roi.empty()) {
      result.droppedRegions++;
      continue;
    }

    std::vector<std::string> lines;
    try {
      lines = cleanLines(m_engine.recognize(m_image(roi)));
    } catch (const std::exception &e) {
      log(LogLevel::Warning, stage, "",
          "OCR failed for region " + std::to_string(index) + ": " + e.what());
      result.droppedRegions++;
      continue;
    }

    if (lines.empty()) {
      result.droppedRegions++;
      continue;
    }

    TextBlock block;
    block.text = std::move(lines);
    block.blockId = makeBlockId(m_pageNumber, index);
    block.type = region.type;
    block.typeConfidence =
        region.sourceConfidence
            ? std::clamp(*region.sourceConfidence, 0.0, 1.0)
            : m_config.inferredTypeConfidence;
    block.coords = toCorners(region.box);
    block.pageNumber = m_pageNumber;

    result.textBlocks.push_back(std::move(block));
    result.layoutBlocks.push_back(region);
  }

  return result;
}

std::string OCRProcessor::makeBlockId(int pageNumber,
                                      std::size_t regionIndex) {
  return "p" + std::to_string(pageNumber) + "_b" +
         std::to_string(regionIndex);
}

} // namespace docparse
