#ifndef DOCPARSE_DOCUMENT_PARSER_HPP
#define DOCPARSE_DOCUMENT_PARSER_HPP

#include "docparse/BackendRetryController.hpp"
#include "docparse/Document.hpp"
#include "docparse/DocumentAssembler.hpp"
#include "docparse/LayoutDisambiguator.hpp"
#include "docparse/OCRProcessor.hpp"
#include "docparse/ParserConfig.hpp"
#include "docparse/PdfRasterizer.hpp"

#include <string>
#include <vector>

namespace docparse {

/**
 * @brief Raw content of a document and the type the source declared
 */
struct FetchedDocument {
  std::vector<char> bytes;
  std::string contentType; ///< MIME type, empty if unknown
};

/**
 * @brief Retrieves the content of a document
 */
class DocumentFetcher {
public:
  virtual ~DocumentFetcher() = default;

  /**
   * @throws std::runtime_error if the document cannot be retrieved
   */
  virtual FetchedDocument fetch(const ParserInput &input) = 0;
};

/**
 * @brief Extracts the main text of a web page
 */
class HtmlExtractor {
public:
  virtual ~HtmlExtractor() = default;

  /**
   * @throws std::runtime_error if the page cannot be parsed
   */
  virtual ExtractedHtml extract(const std::string &html,
                                const std::string &url) = 0;
};

/**
 * @brief External services a parser uses, borrowed for its lifetime
 *
 * Any pointer may be null; a document that needs a missing collaborator
 * fails with an input error.
 */
struct Collaborators {
  DocumentFetcher *fetcher = nullptr;
  PageRasterizer *rasterizer = nullptr;
  DetectionSource *detectionSource = nullptr;
  OcrEngine *ocrEngine = nullptr;
  DocumentAiBackend *backend = nullptr;
  HtmlExtractor *htmlExtractor = nullptr;
  LanguageDetector *languageDetector = nullptr;
};

/**
 * @brief How processing one document went
 */
struct DocumentStatus {
  bool success = false;
  bool skipped = false;      ///< Parser for the content type is disabled
  std::string stage;         ///< Stage that failed, empty on success
  std::string errorMessage;  ///< Error message if failed
  int pagesProcessed = 0;    ///< PDF pages that produced a result
  int pagesFailed = 0;       ///< PDF pages lost to an error
  double processingTimeMs = 0.0;
};

/**
 * @brief Output and status of one document
 *
 * The output is always valid to hand downstream: failed documents carry
 * empty content for their modality.
 */
struct DocumentResult {
  ParserOutput output;
  DocumentStatus status;
};

/**
 * @brief Text blocks of one page plus what the page pipeline did
 */
struct PageParseResult {
  AssembledPage page;
  bool layoutFound = false;
  std::vector<Region> usedRegions; ///< Regions that yielded text
};

/**
 * @brief Runs documents through the PDF and HTML pipelines
 *
 * Local PDF pipeline per page: detect, disambiguate, post-process, OCR.
 * Backend PDF pipeline: the document-AI service with endpoint escalation.
 * Every failure is contained to its page or document; parseBatch() always
 * returns one result per input.
 *
 * Example usage:
 * @code
 * docparse::Collaborators collaborators;
 * collaborators.fetcher = &fetcher;
 * collaborators.rasterizer = &rasterizer;
 * collaborators.detectionSource = &detector;
 * collaborators.ocrEngine = &engine;
 * docparse::DocumentParser parser(config, collaborators);
 * for (const auto &result : parser.parseBatch(inputs)) {
 *     std::cout << result.output.toString() << std::endl;
 * }
 * @endcode
 */
class DocumentParser {
public:
  DocumentParser(const ParserConfig &config,
                 const Collaborators &collaborators);

  /**
   * @brief Run the local pipeline on one rendered page
   * @throws std::runtime_error if a collaborator is missing or fails, or
   *         the page has no image
   */
  PageParseResult parsePage(const std::string &documentId,
                            const RasterizedPage &page);

  /**
   * @brief Run the local pipeline on already rendered pages
   *
   * A failing page is logged and contributes no blocks; later pages are
   * still processed.
   */
  DocumentResult parsePdfPages(const ParserInput &input,
                               const std::vector<char> &bytes,
                               const std::vector<RasterizedPage> &pages);

  /**
   * @brief Parse a PDF with the document-AI backend
   *
   * On backend failure the output has empty PDF data.
   */
  DocumentResult parsePdfWithBackend(const ParserInput &input,
                                     const std::vector<char> &bytes);

  /**
   * @brief Parse an HTML page
   * @throws std::runtime_error if the extractor fails
   */
  DocumentResult parseHtml(const ParserInput &input, const std::string &html);

  /**
   * @brief Fetch a document and dispatch it by content type
   */
  DocumentResult parse(const ParserInput &input);

  /**
   * @brief Parse documents one after another
   * @return One result per input, in input order
   */
  std::vector<DocumentResult>
  parseBatch(const std::vector<ParserInput> &inputs);

  const ParserConfig &getConfig() const;

private:
  DocumentResult parsePdf(const ParserInput &input,
                          const std::vector<char> &bytes);
  void writeDebugOverlay(const std::string &documentId,
                         const RasterizedPage &page,
                         const std::vector<Region> &regions) const;

  ParserConfig m_config;
  Collaborators m_collaborators;
};

} // namespace docparse

#endif // DOCPARSE_DOCUMENT_PARSER_HPP
