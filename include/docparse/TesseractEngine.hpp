#ifndef DOCPARSE_TESSERACT_ENGINE_HPP
#define DOCPARSE_TESSERACT_ENGINE_HPP

#include "docparse/LayoutDisambiguator.hpp"
#include "docparse/OCRProcessor.hpp"
#include "docparse/Types.hpp"

#include <opencv2/opencv.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docparse {

/**
 * @brief Configuration options for the Tesseract collaborators
 */
struct TesseractConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "deu", "fra")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_AUTO;     ///< Page segmentation mode
  bool preprocessImage = true; ///< Apply preprocessing (grayscale, threshold)
  std::string tessDataPath =
      ""; ///< Path to tessdata directory (empty = TESSDATA_PREFIX or default)
  double nonTextConfidence = 0.9; ///< Confidence given to table/image blocks
};

/**
 * @brief Grayscale, blur and adaptive threshold a crop for recognition
 */
cv::Mat preprocessForOcr(const cv::Mat &image);

/**
 * @brief Whether most lines of a text block start with a list marker
 *
 * Markers are bullets ("-", "*", "•", "–") and enumerators such as "1.",
 * "2)" or "a.". At least two lines are required.
 */
bool looksLikeList(const std::vector<std::string> &lines);

/**
 * @brief Line-oriented OCR of region crops with Tesseract
 *
 * Example usage:
 * @code
 * docparse::TesseractOcrEngine engine;
 * if (engine.initialize()) {
 *     auto lines = engine.recognize(crop);
 * }
 * @endcode
 */
class TesseractOcrEngine : public OcrEngine {
public:
  TesseractOcrEngine();
  explicit TesseractOcrEngine(const TesseractConfig &config);
  ~TesseractOcrEngine() override;

  TesseractOcrEngine(const TesseractOcrEngine &) = delete;
  TesseractOcrEngine &operator=(const TesseractOcrEngine &) = delete;

  /**
   * @brief Initialize the Tesseract engine
   * @return true if initialization succeeded
   */
  bool initialize();

  bool isInitialized() const;

  /**
   * @brief Recognize a crop
   * @throws std::runtime_error if the engine is not initialized
   */
  std::vector<std::string> recognize(const cv::Mat &crop) override;

  static std::string getTesseractVersion();

private:
  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
  TesseractConfig m_config;
  bool m_initialized;
};

/**
 * @brief Layout detections from Tesseract's page layout analysis
 *
 * Every Tesseract block becomes one detection. Text blocks take the block's
 * recognition confidence; table and image blocks, which Tesseract does not
 * score, take TesseractConfig::nonTextConfidence. Separator lines and noise
 * are skipped.
 */
class TesseractDetectionSource : public DetectionSource {
public:
  TesseractDetectionSource();
  explicit TesseractDetectionSource(const TesseractConfig &config);
  ~TesseractDetectionSource() override;

  TesseractDetectionSource(const TesseractDetectionSource &) = delete;
  TesseractDetectionSource &
  operator=(const TesseractDetectionSource &) = delete;

  bool initialize();

  bool isInitialized() const;

  /**
   * @throws std::runtime_error if the engine is not initialized
   */
  std::vector<Detection> detect(const cv::Mat &pageImage) override;

  /**
   * @brief Detection label for a Tesseract block type
   * @param blockType Tesseract's PolyBlockType
   * @param lines Text of the block, used to tell lists from paragraphs
   * @return The label, or std::nullopt for blocks that carry no content
   */
  static std::optional<DetectionLabel>
  labelForBlock(tesseract::PolyBlockType blockType,
                const std::vector<std::string> &lines);

private:
  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
  TesseractConfig m_config;
  bool m_initialized;
};

} // namespace docparse

#endif // DOCPARSE_TESSERACT_ENGINE_HPP
