#include "docparse/Document.hpp"

#include "docparse/Geometry.hpp"

#include <stdexcept>

namespace docparse {

namespace {

void checkContentTypeAndUrl(const std::optional<ContentType> &contentType,
                            const std::optional<std::string> &url) {
  if (contentType.has_value() != url.has_value()) {
    throw std::invalid_argument("Both document content type and document url "
                                "must be set or both must be unset");
  }
}

const std::vector<TextBlock> &noBlocks() {
  static const std::vector<TextBlock> empty;
  return empty;
}

} // anonymous namespace

void ParserInput::validate() const {
  checkContentTypeAndUrl(documentContentType, documentUrl);
}

ParserOutput ParserOutput::fromInput(const ParserInput &input) {
  ParserOutput output;
  output.documentId = input.documentId;
  output.documentMetadata = input.documentMetadata;
  output.documentName = input.documentName;
  output.documentDescription = input.documentDescription;
  output.documentUrl = input.documentUrl;
  output.documentContentType = input.documentContentType;
  output.documentSlug = input.documentSlug;
  return output;
}

const std::vector<TextBlock> &ParserOutput::textBlocks() const {
  if (documentContentType == ContentType::Html && htmlData) {
    return htmlData->textBlocks;
  }
  if (documentContentType == ContentType::Pdf && pdfData) {
    return pdfData->textBlocks;
  }
  return noBlocks();
}

std::vector<TextBlock> *ParserOutput::mutableTextBlocks() {
  if (documentContentType == ContentType::Html && htmlData) {
    return &htmlData->textBlocks;
  }
  if (documentContentType == ContentType::Pdf && pdfData) {
    return &pdfData->textBlocks;
  }
  return nullptr;
}

std::string ParserOutput::toString() const {
  std::string result;
  for (const auto &block : textBlocks()) {
    std::string text = trim(block.toString());
    if (!result.empty()) {
      result += ' ';
    }
    result += text;
  }
  return result;
}

void ParserOutput::validate() const {
  if (documentContentType == ContentType::Html && !htmlData) {
    throw std::invalid_argument("htmlData must be set for HTML documents");
  }
  if (documentContentType == ContentType::Pdf && !pdfData) {
    throw std::invalid_argument("pdfData must be set for PDF documents");
  }
  if (!documentContentType && (htmlData || pdfData)) {
    throw std::invalid_argument("htmlData and pdfData must be unset for "
                                "documents with no content type");
  }
  checkContentTypeAndUrl(documentContentType, documentUrl);
}

} // namespace docparse
