#include "docparse/DocumentParser.hpp"

#include "docparse/DebugOverlay.hpp"
#include "docparse/Log.hpp"
#include "docparse/PostProcessor.hpp"
#include "docparse/TextPresence.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace docparse {

namespace {

ParserOutput emptyOutputFor(const ParserInput &input) {
  if (input.documentContentType == ContentType::Pdf) {
    return emptyPdfOutput(input);
  }
  if (input.documentContentType == ContentType::Html) {
    return emptyHtmlOutput(input);
  }
  return ParserOutput::fromInput(input);
}

DocumentResult failed(const ParserInput &input, const std::string &stage,
                      const std::string &message) {
  log(LogLevel::Error, stage, input.documentId, message);

  DocumentResult result;
  result.output = emptyOutputFor(input);
  result.status.success = false;
  result.status.stage = stage;
  result.status.errorMessage = message;
  return result;
}

double elapsedMs(std::chrono::high_resolution_clock::time_point startTime) {
  auto endTime = std::chrono::high_resolution_clock::now();
  return std::chrono::duration<double, std::milli>(endTime - startTime)
      .count();
}

} // anonymous namespace

DocumentParser::DocumentParser(const ParserConfig &config,
                               const Collaborators &collaborators)
    : m_config(config), m_collaborators(collaborators) {}

const ParserConfig &DocumentParser::getConfig() const { return m_config; }

PageParseResult DocumentParser::parsePage(const std::string &documentId,
                                          const RasterizedPage &page) {
  if (m_collaborators.detectionSource == nullptr) {
    throw std::runtime_error("No layout detection source configured");
  }
  if (m_collaborators.ocrEngine == nullptr) {
    throw std::runtime_error("No OCR engine configured");
  }
  if (page.image.empty()) {
    throw std::runtime_error("Page " + std::to_string(page.pageNumber) +
                             " could not be rendered");
  }

  PageParseResult result;
  result.page.metadata.pageNumber = page.pageNumber;
  result.page.metadata.width = page.width;
  result.page.metadata.height = page.height;

  std::vector<Detection> detections =
      m_collaborators.detectionSource->detect(page.image);

  std::unique_ptr<InkDensityOracle> oracle;
  if (m_config.gateGapsByInk && !page.image.empty()) {
    oracle = std::make_unique<InkDensityOracle>(page.image,
                                                m_config.minInkRatio);
  }

  LayoutDisambiguator disambiguator(m_config.disambiguation);
  DisambiguationResult layout =
      disambiguator.disambiguate(detections, page.pageNumber, page.width,
                                 page.height, oracle.get());
  result.layoutFound = layout.layoutFound;
  if (!layout.layoutFound) {
    return result;
  }

  PostProcessor postProcessor(std::move(layout.layout),
                              m_config.postProcessing);
  postProcessor.postprocess();
  if (!postProcessor.hasContent()) {
    log(LogLevel::Info, "postprocess", documentId,
        "No regions left on page " + std::to_string(page.pageNumber));
    return result;
  }

  OCRProcessor ocrProcessor(page.image, page.pageNumber,
                            postProcessor.ocrBlocks(),
                            *m_collaborators.ocrEngine, m_config.ocr);
  PageOCRResult ocrResult = ocrProcessor.processLayout();

  result.page.textBlocks = std::move(ocrResult.textBlocks);
  result.usedRegions = std::move(ocrResult.layoutBlocks);
  if (m_collaborators.languageDetector != nullptr) {
    tagBlockLanguages(result.page.textBlocks,
                      *m_collaborators.languageDetector);
  }

  log(LogLevel::Debug, "ocr", documentId,
      "Page " + std::to_string(page.pageNumber) + ": " +
          std::to_string(result.page.textBlocks.size()) + " text blocks, " +
          std::to_string(ocrResult.droppedRegions) + " regions without text");
  return result;
}

void DocumentParser::writeDebugOverlay(
    const std::string &documentId, const RasterizedPage &page,
    const std::vector<Region> &regions) const {
  namespace fs = std::filesystem;

  fs::path directory(m_config.debugOutputDir);
  std::error_code error;
  fs::create_directories(directory, error);
  if (error) {
    log(LogLevel::Warning, "debug", documentId,
        "Cannot create debug directory " + directory.string() + ": " +
            error.message());
    return;
  }

  cv::Mat overlay = renderLayoutOverlay(page.image, regions);
  if (overlay.empty()) {
    return;
  }

  fs::path file = directory / (documentId + "_page" +
                               std::to_string(page.pageNumber) + ".png");
  if (!cv::imwrite(file.string(), overlay)) {
    log(LogLevel::Warning, "debug", documentId,
        "Failed to write debug overlay " + file.string());
  }
}

DocumentResult
DocumentParser::parsePdfPages(const ParserInput &input,
                              const std::vector<char> &bytes,
                              const std::vector<RasterizedPage> &pages) {
  auto startTime = std::chrono::high_resolution_clock::now();
  DocumentStatus status;

  std::vector<AssembledPage> assembled;
  assembled.reserve(pages.size());
  for (const auto &page : pages) {
    try {
      PageParseResult pageResult = parsePage(input.documentId, page);
      if (!m_config.debugOutputDir.empty()) {
        writeDebugOverlay(input.documentId, page, pageResult.usedRegions);
      }
      assembled.push_back(std::move(pageResult.page));
      ++status.pagesProcessed;
    } catch (const std::exception &e) {
      log(LogLevel::Error, "page", input.documentId,
          "Failed to process page " + std::to_string(page.pageNumber) + ": " +
              e.what());
      AssembledPage empty;
      empty.metadata.pageNumber = page.pageNumber;
      empty.metadata.width = page.width;
      empty.metadata.height = page.height;
      assembled.push_back(std::move(empty));
      ++status.pagesFailed;
    }
  }

  DocumentResult result;
  result.output = assemblePdf(input, bytes, std::move(assembled),
                              m_config.minLanguageProportion);
  status.success = true;
  status.processingTimeMs = elapsedMs(startTime);
  result.status = status;

  log(LogLevel::Info, "pdf", input.documentId,
      "Parsed " + std::to_string(status.pagesProcessed) + " pages (" +
          std::to_string(status.pagesFailed) + " failed), " +
          std::to_string(result.output.textBlocks().size()) + " text blocks");
  return result;
}

DocumentResult DocumentParser::parsePdfWithBackend(
    const ParserInput &input, const std::vector<char> &bytes) {
  auto startTime = std::chrono::high_resolution_clock::now();
  if (m_collaborators.backend == nullptr) {
    return failed(input, "backend", "No document-AI backend configured");
  }

  BackendRetryController controller(*m_collaborators.backend);
  BackendOutcome outcome = controller.analyze(input.documentId, bytes);
  if (!outcome.success || !outcome.result) {
    DocumentResult result =
        failed(input, "backend",
               "Document-AI backend failed (" +
                   failureKindName(outcome.failure.value_or(
                       FailureKind::Unclassified)) +
                   "): " + outcome.errorMessage);
    result.status.processingTimeMs = elapsedMs(startTime);
    return result;
  }

  std::vector<AssembledPage> pages;
  for (const auto &analyzed : outcome.result->pages) {
    AssembledPage page;
    page.metadata.pageNumber = analyzed.pageNumber;
    page.metadata.width = analyzed.width;
    page.metadata.height = analyzed.height;
    page.textBlocks =
        toTextBlocks(analyzed, m_config.postProcessing.rowTolerance);
    if (m_collaborators.languageDetector != nullptr) {
      tagBlockLanguages(page.textBlocks, *m_collaborators.languageDetector);
    }
    pages.push_back(std::move(page));
  }

  DocumentResult result;
  result.status.pagesProcessed = static_cast<int>(pages.size());
  result.output = assemblePdf(input, bytes, std::move(pages),
                              m_config.minLanguageProportion);
  result.status.success = true;
  result.status.processingTimeMs = elapsedMs(startTime);
  return result;
}

DocumentResult DocumentParser::parseHtml(const ParserInput &input,
                                         const std::string &html) {
  auto startTime = std::chrono::high_resolution_clock::now();
  if (m_collaborators.htmlExtractor == nullptr) {
    return failed(input, "html", "No HTML extractor configured");
  }

  ExtractedHtml extracted = m_collaborators.htmlExtractor->extract(
      html, input.documentUrl.value_or(""));

  DocumentResult result;
  result.output =
      assembleHtml(input, extracted, m_config.htmlMinLinesForValidText);
  if (m_collaborators.languageDetector != nullptr) {
    detectAndSetLanguages(result.output, *m_collaborators.languageDetector);
  }

  if (result.output.htmlData && !result.output.htmlData->hasValidText) {
    log(LogLevel::Info, "html", input.documentId,
        "Page has too little text to be valid");
  }

  result.status.success = true;
  result.status.processingTimeMs = elapsedMs(startTime);
  return result;
}

DocumentResult DocumentParser::parsePdf(const ParserInput &input,
                                        const std::vector<char> &bytes) {
  if (m_config.pdfBackend == PdfBackend::DocumentAi) {
    return parsePdfWithBackend(input, bytes);
  }

  if (m_collaborators.rasterizer == nullptr) {
    return failed(input, "rasterize", "No PDF rasterizer configured");
  }

  RasterizedDocument rendered =
      m_collaborators.rasterizer->rasterize(bytes, m_config.renderDpi);
  if (!rendered.success) {
    return failed(input, "rasterize", rendered.errorMessage);
  }

  return parsePdfPages(input, bytes, rendered.pages);
}

DocumentResult DocumentParser::parse(const ParserInput &input) {
  auto startTime = std::chrono::high_resolution_clock::now();
  std::string stage = "input";

  try {
    input.validate();

    if (!input.documentContentType) {
      log(LogLevel::Info, "input", input.documentId,
          "Document has no content type; nothing to parse");
      DocumentResult result;
      result.output = ParserOutput::fromInput(input);
      result.status.success = true;
      return result;
    }

    ContentType contentType = *input.documentContentType;
    if ((contentType == ContentType::Pdf && !m_config.runPdfParser) ||
        (contentType == ContentType::Html && !m_config.runHtmlParser)) {
      log(LogLevel::Info, "input", input.documentId,
          "Parser for " + contentTypeName(contentType) +
              " is disabled; skipping");
      DocumentResult result;
      result.output = emptyOutputFor(input);
      result.status.success = true;
      result.status.skipped = true;
      return result;
    }

    stage = "fetch";
    if (m_collaborators.fetcher == nullptr) {
      return failed(input, stage, "No document fetcher configured");
    }
    FetchedDocument fetched = m_collaborators.fetcher->fetch(input);
    if (!fetched.contentType.empty()) {
      std::optional<ContentType> declared =
          contentTypeFromName(fetched.contentType);
      if (declared != contentType) {
        return failed(input, stage,
                      "Expected " + contentTypeName(contentType) +
                          " content but the source declared " +
                          fetched.contentType);
      }
    }

    stage = contentType == ContentType::Pdf ? "pdf" : "html";
    DocumentResult result =
        contentType == ContentType::Pdf
            ? parsePdf(input, fetched.bytes)
            : parseHtml(input, std::string(fetched.bytes.begin(),
                                           fetched.bytes.end()));

    stage = "assemble";
    result.output.validate();
    result.status.processingTimeMs = elapsedMs(startTime);
    return result;
  } catch (const std::exception &e) {
    DocumentResult result = failed(input, stage, e.what());
    result.status.processingTimeMs = elapsedMs(startTime);
    return result;
  }
}

std::vector<DocumentResult>
DocumentParser::parseBatch(const std::vector<ParserInput> &inputs) {
  std::vector<DocumentResult> results;
  results.reserve(inputs.size());

  int failures = 0;
  for (const auto &input : inputs) {
    results.push_back(parse(input));
    if (!results.back().status.success) {
      ++failures;
    }
  }

  log(LogLevel::Info, "batch", "",
      "Parsed " + std::to_string(inputs.size()) + " documents, " +
          std::to_string(failures) + " failed");
  return results;
}

} // namespace docparse
