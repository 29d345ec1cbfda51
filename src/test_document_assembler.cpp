#include "docparse/DocumentAssembler.hpp"
#include "test_common.hpp"

#include <iostream>
#include <stdexcept>

using docparse::AssembledPage;
using docparse::ContentType;
using docparse::ParserOutput;
using test::check;

namespace {

docparse::TextBlock block(const std::string &id, const std::string &text,
                          std::optional<std::string> language = std::nullopt) {
  docparse::TextBlock result;
  result.blockId = id;
  result.text = {text};
  result.language = std::move(language);
  return result;
}

AssembledPage page(int number, std::vector<docparse::TextBlock> blocks) {
  AssembledPage result;
  result.metadata.pageNumber = number;
  result.metadata.width = 600;
  result.metadata.height = 800;
  result.textBlocks = std::move(blocks);
  return result;
}

bool throwsInvalid(const std::function<void()> &action) {
  try {
    action();
  } catch (const std::invalid_argument &) {
    return true;
  }
  return false;
}

void testMd5() {
  test::section("MD5 digest");

  check(docparse::md5Hex(test::bytesOf("abc")) ==
            "900150983cd24fb0d6963f7d28e17f72",
        "digest of \"abc\"");
  check(docparse::md5Hex({}) == "d41d8cd98f00b204e9800998ecf8427e",
        "digest of empty input");
}

void testAssemblePdf() {
  test::section("PDF assembly");

  auto input = test::pdfInput("report");
  input.documentMetadata["source"] = "upload";
  auto output = docparse::assemblePdf(
      input, test::bytesOf("abc"),
      {page(1, {block("p1_b0", "second page")}),
       page(0, {block("p0_b0", "first"), block("p0_b2", "page")})});

  check(output.pdfData.has_value(), "PDF data set");
  check(!output.htmlData, "HTML data unset");
  check(output.pdfData->md5sum == "900150983cd24fb0d6963f7d28e17f72",
        "digest of the document bytes");
  check(output.pdfData->pageMetadata.size() == 2 &&
            output.pdfData->pageMetadata[0].pageNumber == 0,
        "pages sorted by number");
  check(output.toString() == "first page second page",
        "blocks in page order then reading order");
  check(output.documentMetadata.at("source") == "upload",
        "input fields carried through");
  check(!output.languages, "no languages without block languages");
  check(!throwsInvalid([&output]() { output.validate(); }),
        "assembled output is valid");

  auto empty = docparse::assemblePdf(input, {}, {});
  check(empty.pdfData && empty.pdfData->textBlocks.empty() &&
            empty.pdfData->pageMetadata.empty(),
        "zero pages give empty PDF data");
}

void testLanguages() {
  test::section("Document languages from block languages");

  auto input = test::pdfInput("mixed");
  auto tied = docparse::assemblePdf(
      input, {},
      {page(0, {block("a", "x", "en"), block("b", "x", "en"),
                block("c", "x", "de"), block("d", "x", "fr"),
                block("e", "x")})});
  check(tied.languages && tied.languages->empty(),
        "share equal to the proportion is not enough");

  auto majority = docparse::assemblePdf(
      input, {},
      {page(0, {block("a", "x", "de"), block("b", "x", "en"),
                block("c", "x", "en"), block("d", "x", "de"),
                block("e", "x", "en")})});
  check(majority.languages &&
            *majority.languages == std::vector<std::string>({"en"}),
        "only languages above the proportion");

  docparse::setDocumentLanguagesFromTextBlocks(majority, 0.3);
  check(*majority.languages == std::vector<std::string>({"de", "en"}),
        "languages in first-seen order");
}

void testAssembleHtml() {
  test::section("HTML assembly");

  auto input = test::htmlInput("page");
  docparse::ExtractedHtml extracted;
  extracted.title = "News";
  extracted.date = "2024-03-01";
  extracted.paragraphs = {"One", "", "Three", "Four", "Five", "Six"};

  auto output = docparse::assembleHtml(input, extracted);
  check(output.htmlData.has_value() && !output.pdfData, "HTML data set");
  check(output.htmlData->hasValidText, "six lines are valid text");
  check(output.htmlData->detectedTitle == std::string("News") &&
            output.htmlData->detectedDate == std::string("2024-03-01"),
        "title and date carried");

  const auto &blocks = output.textBlocks();
  check(blocks.size() == 5, "blank paragraph skipped");
  if (blocks.size() == 5) {
    check(blocks[0].blockId == "b0" && blocks[1].blockId == "b2",
          "ids keep the paragraph index");
    check(blocks[1].type == docparse::BlockType::Text &&
              blocks[1].typeConfidence == 1.0,
          "HTML blocks are confident Text");
  }

  extracted.paragraphs.pop_back();
  check(!docparse::assembleHtml(input, extracted).htmlData->hasValidText,
        "five lines are too few");

  auto empty = docparse::assembleHtml(input, docparse::ExtractedHtml());
  check(empty.htmlData && empty.htmlData->detectedTitle == std::string("") &&
            !empty.htmlData->hasValidText &&
            empty.htmlData->textBlocks.empty(),
        "no paragraphs give the empty HTML output");
}

void testLanguageDetection() {
  test::section("Language detection");

  auto input = test::htmlInput("page");
  docparse::ExtractedHtml extracted;
  extracted.paragraphs = {"Hello", "World"};
  auto output = docparse::assembleHtml(input, extracted);

  test::FakeLanguageDetector detector;
  docparse::detectAndSetLanguages(output, detector);
  check(output.languages &&
            *output.languages == std::vector<std::string>({"en"}),
        "document language set");
  check(output.textBlocks()[0].language == std::string("en") &&
            output.textBlocks()[1].language == std::string("en"),
        "every block gets the language");

  auto unknown = docparse::assembleHtml(input, extracted);
  detector.language.reset();
  docparse::detectAndSetLanguages(unknown, detector);
  check(!unknown.languages, "undetected language leaves languages unset");

  auto blank = docparse::emptyHtmlOutput(input);
  detector.language = "de";
  docparse::detectAndSetLanguages(blank, detector);
  check(!blank.languages, "empty document is left alone");
}

/**
 * @brief Calls text with an umlaut German, everything else English
 */
class UmlautDetector : public docparse::LanguageDetector {
public:
  std::optional<std::string> detect(const std::string &text) override {
    if (text.empty()) {
      return std::nullopt;
    }
    return text.find("\xC3\xBC") != std::string::npos ? "de" : "en";
  }
};

void testBlockLanguages() {
  test::section("Per-block languages for PDF text");

  std::vector<docparse::TextBlock> blocks = {
      block("p0_b0", "Annual report"), block("p0_b1", "F\xC3\xBCr alle"),
      block("p0_b2", "Summary"), block("p0_b3", "")};
  UmlautDetector detector;
  docparse::tagBlockLanguages(blocks, detector);

  check(blocks[0].language == std::string("en") &&
            blocks[1].language == std::string("de") &&
            blocks[2].language == std::string("en"),
        "each block gets its own language");
  check(!blocks[3].language, "undetectable block stays untagged");

  auto output = docparse::assemblePdf(test::pdfInput("mixed"), {},
                                      {page(0, std::move(blocks))});
  check(output.languages &&
            *output.languages == std::vector<std::string>({"en"}),
        "majority language of the tagged blocks");
}

void testValidation() {
  test::section("Validation");

  auto input = test::pdfInput("doc");
  check(!throwsInvalid([&input]() { input.validate(); }),
        "type and URL both set");

  auto noUrl = input;
  noUrl.documentUrl.reset();
  check(throwsInvalid([&noUrl]() { noUrl.validate(); }),
        "type without URL rejected");

  docparse::ParserInput bare;
  bare.documentId = "bare";
  check(!throwsInvalid([&bare]() { bare.validate(); }),
        "type and URL both unset");

  ParserOutput missingPdf = ParserOutput::fromInput(input);
  check(throwsInvalid([&missingPdf]() { missingPdf.validate(); }),
        "PDF output without PDF data rejected");

  ParserOutput wrongData = docparse::emptyPdfOutput(input);
  wrongData.documentContentType.reset();
  wrongData.documentUrl.reset();
  check(throwsInvalid([&wrongData]() { wrongData.validate(); }),
        "content data without a content type rejected");

  ParserOutput emptyPdf = docparse::emptyPdfOutput(input);
  check(emptyPdf.pdfData && emptyPdf.pdfData->md5sum.empty() &&
            emptyPdf.textBlocks().empty(),
        "empty PDF output has no digest and no blocks");
  check(emptyPdf.mutableTextBlocks() != nullptr,
        "empty PDF output exposes its block list");
  check(ParserOutput::fromInput(bare).mutableTextBlocks() == nullptr,
        "no block list without content");
}

} // anonymous namespace

int main() {
  std::cout << "=== Test DocumentAssembler ===" << std::endl;

  testMd5();
  testAssemblePdf();
  testLanguages();
  testAssembleHtml();
  testLanguageDetection();
  testBlockLanguages();
  testValidation();

  return test::summary("DocumentAssembler");
}
