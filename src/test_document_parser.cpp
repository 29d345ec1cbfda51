#include "docparse/DocumentParser.hpp"
#include "docparse/Log.hpp"
#include "test_common.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

using docparse::BlockType;
using docparse::Collaborators;
using docparse::DetectionLabel;
using docparse::DocumentParser;
using docparse::HttpResponseError;
using docparse::ParserConfig;
using test::check;
using test::detection;

namespace {

const std::string kReportUrl = "https://example.org/report.pdf";
const std::string kPageUrl = "https://example.org/page.html";

/**
 * @brief A set of fakes wired into Collaborators
 */
struct Fixture {
  Fixture()
      : detector({detection(50, 20, 400, 40, DetectionLabel::Title, 0.95),
                  detection(50, 100, 400, 200, DetectionLabel::Text, 0.9)}) {
    fetcher.documents[kReportUrl] = {test::bytesOf("abc"), "application/pdf"};
    fetcher.documents[kPageUrl] = {
        test::bytesOf("One\nTwo\nThree\nFour\nFive\nSix"),
        "text/html; charset=utf-8"};
    rasterizer.pages = {test::rasterizedPage(0, 600, 800),
                        test::rasterizedPage(1, 600, 800)};

    config.disambiguation.inferGaps = false;
    collaborators.fetcher = &fetcher;
    collaborators.rasterizer = &rasterizer;
    collaborators.detectionSource = &detector;
    collaborators.ocrEngine = &engine;
    collaborators.backend = &backend;
    collaborators.htmlExtractor = &extractor;
    collaborators.languageDetector = &languages;
  }

  DocumentParser parser() const {
    return DocumentParser(config, collaborators);
  }

  test::FakeFetcher fetcher;
  test::FakeRasterizer rasterizer;
  test::FakeDetectionSource detector;
  test::FakeOcrEngine engine;
  test::FakeBackend backend;
  test::FakeHtmlExtractor extractor;
  test::FakeLanguageDetector languages;
  ParserConfig config;
  Collaborators collaborators;
};

void testLocalPdfPipeline() {
  test::section("Local PDF pipeline");

  Fixture fixture;
  fixture.engine.thenReturn({"Annual Report"});
  auto result = fixture.parser().parse(test::pdfInput("report"));

  check(result.status.success && !result.status.skipped, "document parsed");
  check(result.status.pagesProcessed == 2 && result.status.pagesFailed == 0,
        "both pages processed");
  check(result.output.pdfData.has_value(), "PDF data set");
  check(result.output.pdfData->md5sum == "900150983cd24fb0d6963f7d28e17f72",
        "digest of the fetched bytes");
  check(result.output.pdfData->pageMetadata.size() == 2 &&
            result.output.pdfData->pageMetadata[1].width == 600,
        "page metadata for every page");

  const auto &blocks = result.output.textBlocks();
  check(blocks.size() == 4, "two blocks per page");
  if (blocks.size() == 4) {
    check(blocks[0].blockId == "p0_b0" && blocks[0].type == BlockType::Title &&
              blocks[0].toString() == "Annual Report",
          "title first on page 0");
    check(blocks[1].blockId == "p0_b1" && blocks[1].type == BlockType::Text,
          "body second on page 0");
    check(blocks[2].blockId == "p1_b0" && blocks[2].pageNumber == 1,
          "page 1 follows page 0");
  }
  check(fixture.engine.cropSizes.size() == 4 &&
            fixture.engine.cropSizes[0] == cv::Size(400, 40),
        "OCR runs on the detected regions");
  check(!blocks.empty() && blocks[0].language == std::string("en"),
        "each OCR block tagged with its language");
  check(result.output.languages &&
            *result.output.languages == std::vector<std::string>({"en"}),
        "document language voted from the blocks");

  Fixture untagged;
  untagged.collaborators.languageDetector = nullptr;
  auto noDetector = untagged.parser().parse(test::pdfInput("report"));
  check(!noDetector.output.languages,
        "languages unset without a language detector");
}

void testPageFailureContained() {
  test::section("Failing page is contained");

  Fixture fixture;
  fixture.rasterizer.pages.push_back(test::rasterizedPage(2, 600, 800));
  fixture.detector.failOnCall = 2;

  auto result = fixture.parser().parse(test::pdfInput("report"));
  check(result.status.success, "document still succeeds");
  check(result.status.pagesProcessed == 2 && result.status.pagesFailed == 1,
        "one page failed");
  check(result.output.pdfData->pageMetadata.size() == 3,
        "failed page keeps its metadata");

  const auto &blocks = result.output.textBlocks();
  check(blocks.size() == 4 && blocks[2].blockId == "p2_b0",
        "pages after the failure are processed");
}

void testUnrenderedPageContained() {
  test::section("Unrendered page is contained");

  Fixture fixture;
  docparse::RasterizedPage unrendered;
  unrendered.pageNumber = 1;
  fixture.rasterizer.pages = {test::rasterizedPage(0, 600, 800), unrendered,
                              test::rasterizedPage(2, 600, 800)};

  auto result = fixture.parser().parse(test::pdfInput("report"));
  check(result.status.success, "document still succeeds");
  check(result.status.pagesProcessed == 2 && result.status.pagesFailed == 1,
        "empty page image counted as failed");
  check(fixture.detector.calls == 2, "no detection on the empty image");

  const auto &blocks = result.output.textBlocks();
  check(blocks.size() == 4 && blocks[2].blockId == "p2_b0",
        "pages after the unrendered one are processed");

  bool threw = false;
  try {
    fixture.parser().parsePage("report", unrendered);
  } catch (const std::runtime_error &) {
    threw = true;
  }
  check(threw, "parsePage rejects an empty image");
}

void testInkGatedGaps() {
  test::section("Gap regions on blank pages");

  Fixture speculative;
  speculative.config.disambiguation.inferGaps = true;
  auto withGaps = speculative.parser().parse(test::pdfInput("report"));
  check(withGaps.output.textBlocks().size() > 4,
        "uncovered area is sent to OCR by default");

  Fixture gated;
  gated.config.disambiguation.inferGaps = true;
  gated.config.gateGapsByInk = true;
  auto withoutGaps = gated.parser().parse(test::pdfInput("report"));
  check(withoutGaps.output.textBlocks().size() == 4,
        "inkless gaps skipped when gated by ink");
}

void testNoLayout() {
  test::section("Page without layout");

  Fixture fixture;
  fixture.detector = test::FakeDetectionSource(
      {detection(0, 0, 100, 100, DetectionLabel::Text, 0.2)});

  auto result = fixture.parser().parse(test::pdfInput("report"));
  check(result.status.success && result.status.pagesFailed == 0,
        "document succeeds");
  check(result.output.textBlocks().empty(), "no text blocks");
  check(fixture.engine.calls == 0, "OCR never called");
}

void testParsePageRequiresCollaborators() {
  test::section("Page parsing without collaborators");

  Fixture fixture;
  fixture.collaborators.ocrEngine = nullptr;
  bool threw = false;
  try {
    fixture.parser().parsePage("doc", test::rasterizedPage(0, 100, 100));
  } catch (const std::runtime_error &) {
    threw = true;
  }
  check(threw, "missing OCR engine is an error");

  auto result = fixture.parser().parse(test::pdfInput("report"));
  check(result.status.success && result.status.pagesFailed == 2 &&
            result.output.textBlocks().empty(),
        "every page fails but the document is still assembled");
}

void testBackendPipeline() {
  test::section("Document-AI backend");

  Fixture fixture;
  fixture.config.pdfBackend = docparse::PdfBackend::DocumentAi;
  fixture.backend.defaultBehaviour =
      test::FakeBackend::fail<HttpResponseError>("page limit exceeded");
  fixture.backend.largeBehaviour =
      test::FakeBackend::succeedWith(test::onePageResult());

  auto result = fixture.parser().parse(test::pdfInput("report"));
  check(result.status.success, "large endpoint rescues the document");
  check(fixture.detector.calls == 0 && fixture.engine.calls == 0,
        "local pipeline not used");
  const auto &blocks = result.output.textBlocks();
  check(blocks.size() == 2 && blocks[0].type == BlockType::Title,
        "backend paragraphs become blocks, title first");
  check(result.output.pdfData->md5sum == "900150983cd24fb0d6963f7d28e17f72",
        "digest set");
  check(result.output.languages &&
            *result.output.languages == std::vector<std::string>({"en"}),
        "backend blocks tagged and voted into the document language");

  Fixture broken;
  broken.config.pdfBackend = docparse::PdfBackend::DocumentAi;
  broken.backend.defaultBehaviour =
      test::FakeBackend::fail<std::runtime_error>("unexpected payload");
  auto failed = broken.parser().parse(test::pdfInput("report"));
  check(!failed.status.success && failed.status.stage == "backend",
        "unclassified failure fails the document");
  check(broken.backend.largeCalls == 0, "no escalation");
  check(failed.output.pdfData && failed.output.pdfData->md5sum.empty() &&
            failed.output.pdfData->pageMetadata.empty() &&
            failed.output.pdfData->textBlocks.empty(),
        "failed document carries empty PDF data");

  Fixture missing;
  missing.config.pdfBackend = docparse::PdfBackend::DocumentAi;
  missing.collaborators.backend = nullptr;
  check(!missing.parser().parse(test::pdfInput("report")).status.success,
        "no backend configured");
}

void testHtml() {
  test::section("HTML pages");

  Fixture fixture;
  auto result = fixture.parser().parse(test::htmlInput("page"));
  check(result.status.success, "page parsed");
  check(result.output.htmlData && result.output.htmlData->hasValidText,
        "six paragraphs are valid text");
  check(result.output.htmlData->detectedTitle == std::string("A page"),
        "title from the extractor");
  check(result.output.textBlocks().size() == 6, "one block per paragraph");
  check(result.output.languages &&
            *result.output.languages == std::vector<std::string>({"en"}),
        "language detected");

  fixture.collaborators.htmlExtractor = nullptr;
  auto noExtractor = fixture.parser().parse(test::htmlInput("page"));
  check(!noExtractor.status.success && noExtractor.output.htmlData &&
            !noExtractor.output.htmlData->hasValidText,
        "missing extractor fails with empty HTML data");
}

void testInputHandling() {
  test::section("Input handling");

  Fixture fixture;

  docparse::ParserInput bare;
  bare.documentId = "bare";
  auto passThrough = fixture.parser().parse(bare);
  check(passThrough.status.success && !passThrough.output.pdfData &&
            !passThrough.output.htmlData,
        "document without content type passes through");

  auto invalid = test::pdfInput("report");
  invalid.documentUrl.reset();
  auto rejected = fixture.parser().parse(invalid);
  check(!rejected.status.success && rejected.status.stage == "input",
        "type without URL rejected");

  fixture.config.runPdfParser = false;
  auto skipped = fixture.parser().parse(test::pdfInput("report"));
  check(skipped.status.success && skipped.status.skipped &&
            skipped.output.pdfData && fixture.fetcher.calls == 0,
        "disabled parser skips without fetching");

  Fixture mismatch;
  mismatch.fetcher.documents[kReportUrl].contentType = "text/html";
  auto wrongType = mismatch.parser().parse(test::pdfInput("report"));
  check(!wrongType.status.success && wrongType.status.stage == "fetch",
        "declared content type must match");

  Fixture unreadable;
  unreadable.rasterizer.fail = true;
  auto notRendered = unreadable.parser().parse(test::pdfInput("report"));
  check(!notRendered.status.success &&
            notRendered.status.stage == "rasterize" &&
            notRendered.output.pdfData,
        "unreadable PDF fails with empty PDF data");
}

void testBatch() {
  test::section("Batch processing");

  Fixture fixture;
  auto results = fixture.parser().parseBatch(
      {test::pdfInput("missing"), test::pdfInput("report"),
       test::htmlInput("page")});

  check(results.size() == 3, "one result per input");
  if (results.size() == 3) {
    check(!results[0].status.success && results[0].status.stage == "fetch",
          "unfetchable document fails");
    check(results[0].status.errorMessage.find("404") != std::string::npos,
          "fetch error reported");
    check(results[1].status.success && results[1].output.documentId == "report",
          "next document still parsed");
    check(results[2].status.success && results[2].output.htmlData,
          "HTML document parsed in order");
  }
}

void testDebugOverlays() {
  test::section("Debug overlays");

  namespace fs = std::filesystem;
  fs::path directory = fs::temp_directory_path() / "docparse_overlay_test";
  fs::remove_all(directory);

  Fixture fixture;
  fixture.config.debugOutputDir = directory.string();
  auto result = fixture.parser().parse(test::pdfInput("report"));

  check(result.status.success, "document parsed");
  check(fs::exists(directory / "report_page0.png") &&
            fs::exists(directory / "report_page1.png"),
        "one overlay per page");
  fs::remove_all(directory);
}

} // anonymous namespace

int main() {
  std::cout << "=== Test DocumentParser ===" << std::endl;
  docparse::setLogLevel(docparse::LogLevel::Info);

  testLocalPdfPipeline();
  testPageFailureContained();
  testUnrenderedPageContained();
  testInkGatedGaps();
  testNoLayout();
  testParsePageRequiresCollaborators();
  testBackendPipeline();
  testHtml();
  testInputHandling();
  testBatch();
  testDebugOverlays();

  return test::summary("DocumentParser");
}
