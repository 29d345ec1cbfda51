#ifndef DOCPARSE_PARSER_CONFIG_HPP
#define DOCPARSE_PARSER_CONFIG_HPP

#include "docparse/LayoutDisambiguator.hpp"
#include "docparse/Log.hpp"
#include "docparse/OCRProcessor.hpp"
#include "docparse/PostProcessor.hpp"

#include <map>
#include <optional>
#include <string>

namespace docparse {

/**
 * @brief Which pipeline handles PDF documents
 */
enum class PdfBackend {
  Local,     ///< Rasterize, detect layout, OCR each region
  DocumentAi ///< Send the whole document to the document-AI service
};

std::string pdfBackendName(PdfBackend backend);
std::optional<PdfBackend> pdfBackendFromName(const std::string &name);

/**
 * @brief Everything that tunes a parse run
 */
struct ParserConfig {
  DisambiguationConfig disambiguation;
  PostProcessingConfig postProcessing;
  OCRProcessorConfig ocr;

  double renderDpi = 150.0;             ///< PDF rasterization resolution
  bool gateGapsByInk = false;           ///< OCR only gaps that contain ink
  double minInkRatio = 0.01;            ///< Ink share for a gap to count
  PdfBackend pdfBackend = PdfBackend::Local;
  bool runPdfParser = true;             ///< Skip PDF documents when false
  bool runHtmlParser = true;            ///< Skip HTML documents when false
  int htmlMinLinesForValidText = 6;     ///< Fewer paragraphs -> invalid text
  double minLanguageProportion = 0.4;   ///< Share of blocks to list a language
  LogLevel logLevel = LogLevel::Debug;
  std::string tessDataPath;             ///< Empty -> Tesseract's default
  std::string debugOutputDir;           ///< Empty -> no debug overlays

  /**
   * @brief Defaults overridden by the process environment
   * @throws std::invalid_argument if a variable holds a malformed value
   */
  static ParserConfig fromEnvironment();

  /**
   * @brief Defaults overridden by the given variables
   * @throws std::invalid_argument if a variable holds a malformed value
   */
  static ParserConfig
  fromEnvironment(const std::map<std::string, std::string> &environment);

  /**
   * @brief Check every value is in range
   * @throws std::invalid_argument naming the first offending setting
   */
  void validate() const;
};

} // namespace docparse

#endif // DOCPARSE_PARSER_CONFIG_HPP
