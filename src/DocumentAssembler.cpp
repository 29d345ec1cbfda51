#include "docparse/DocumentAssembler.hpp"

#include "docparse/Geometry.hpp"
#include "docparse/Log.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <map>
#include <memory>
#include <stdexcept>
#include <utility>

namespace docparse {

std::string md5Hex(const std::vector<char> &bytes) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(
      EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!mdctx) {
    throw std::runtime_error("Failed to allocate an OpenSSL digest context");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLength = 0;
  if (EVP_DigestInit_ex(mdctx.get(), EVP_md5(), nullptr) != 1 ||
      EVP_DigestUpdate(mdctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(mdctx.get(), digest, &digestLength) != 1) {
    throw std::runtime_error("Failed to compute MD5 digest");
  }

  std::string hex;
  hex.reserve(digestLength * 2);
  char pair[3];
  for (unsigned int i = 0; i < digestLength; ++i) {
    std::snprintf(pair, sizeof(pair), "%02x", digest[i]);
    hex += pair;
  }
  return hex;
}

ParserOutput assemblePdf(const ParserInput &input,
                         const std::vector<char> &bytes,
                         std::vector<AssembledPage> pages,
                         double minLanguageProportion) {
  std::stable_sort(pages.begin(), pages.end(),
                   [](const AssembledPage &a, const AssembledPage &b) {
                     return a.metadata.pageNumber < b.metadata.pageNumber;
                   });

  PdfData pdfData;
  pdfData.md5sum = md5Hex(bytes);
  for (auto &page : pages) {
    pdfData.pageMetadata.push_back(page.metadata);
    std::move(page.textBlocks.begin(), page.textBlocks.end(),
              std::back_inserter(pdfData.textBlocks));
  }

  ParserOutput output = ParserOutput::fromInput(input);
  output.pdfData = std::move(pdfData);
  setDocumentLanguagesFromTextBlocks(output, minLanguageProportion);
  return output;
}

ParserOutput assembleHtml(const ParserInput &input,
                          const ExtractedHtml &extracted,
                          int minLinesForValidText) {
  if (extracted.paragraphs.empty()) {
    return emptyHtmlOutput(input);
  }

  HtmlData htmlData;
  htmlData.detectedTitle = extracted.title;
  htmlData.detectedDate = extracted.date;
  htmlData.hasValidText =
      static_cast<int>(extracted.paragraphs.size()) >= minLinesForValidText;

  for (std::size_t i = 0; i < extracted.paragraphs.size(); ++i) {
    std::string text = trim(extracted.paragraphs[i]);
    if (text.empty()) {
      continue;
    }
    TextBlock block;
    block.text.push_back(std::move(text));
    block.blockId = "b" + std::to_string(i);
    block.type = BlockType::Text;
    block.typeConfidence = 1.0;
    htmlData.textBlocks.push_back(std::move(block));
  }

  ParserOutput output = ParserOutput::fromInput(input);
  output.htmlData = std::move(htmlData);
  return output;
}

void setDocumentLanguagesFromTextBlocks(ParserOutput &output,
                                        double minProportion) {
  const std::vector<TextBlock> &blocks = output.textBlocks();

  // Count in first-seen order so the result is deterministic
  std::vector<std::string> seen;
  std::map<std::string, int> counts;
  for (const auto &block : blocks) {
    if (!block.language) {
      continue;
    }
    if (counts[*block.language]++ == 0) {
      seen.push_back(*block.language);
    }
  }

  if (seen.empty()) {
    output.languages.reset();
    return;
  }

  std::vector<std::string> languages;
  for (const auto &language : seen) {
    double share = static_cast<double>(counts[language]) /
                   static_cast<double>(blocks.size());
    if (share > minProportion) {
      languages.push_back(language);
    }
  }
  output.languages = std::move(languages);
}

void detectAndSetLanguages(ParserOutput &output, LanguageDetector &detector) {
  if (output.documentContentType != ContentType::Html) {
    log(LogLevel::Warning, "language", output.documentId,
        "Language detection should not be required for non-HTML documents; "
        "this overwrites languages detected by other means, e.g. OCR.");
  }

  std::vector<TextBlock> *blocks = output.mutableTextBlocks();
  if (blocks == nullptr || blocks->empty()) {
    return;
  }

  std::optional<std::string> language = detector.detect(output.toString());
  if (!language) {
    log(LogLevel::Info, "language", output.documentId,
        "Could not detect the document language");
    return;
  }

  output.languages = std::vector<std::string>{*language};
  for (auto &block : *blocks) {
    block.language = *language;
  }
}

void tagBlockLanguages(std::vector<TextBlock> &blocks,
                       LanguageDetector &detector) {
  for (auto &block : blocks) {
    block.language = detector.detect(block.toString());
  }
}

ParserOutput emptyPdfOutput(const ParserInput &input) {
  ParserOutput output = ParserOutput::fromInput(input);
  output.pdfData = PdfData();
  return output;
}

ParserOutput emptyHtmlOutput(const ParserInput &input) {
  ParserOutput output = ParserOutput::fromInput(input);
  HtmlData htmlData;
  htmlData.detectedTitle = "";
  htmlData.hasValidText = false;
  output.htmlData = std::move(htmlData);
  return output;
}

} // namespace docparse
