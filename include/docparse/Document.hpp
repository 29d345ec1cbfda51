#ifndef DOCPARSE_DOCUMENT_HPP
#define DOCPARSE_DOCUMENT_HPP

#include "docparse/Types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace docparse {

/**
 * @brief A document to parse and the metadata passed through to the output
 */
struct ParserInput {
  std::string documentId;
  std::map<std::string, std::string> documentMetadata;
  std::string documentName;
  std::string documentDescription;
  std::optional<std::string> documentUrl;
  std::optional<ContentType> documentContentType;
  std::string documentSlug;

  /**
   * @brief Content type and URL must both be set or both be unset
   * @throws std::invalid_argument otherwise
   */
  void validate() const;
};

/**
 * @brief Content of a PDF document
 */
struct PdfData {
  std::vector<PageMetadata> pageMetadata; ///< One entry per page, in order
  std::string md5sum;                     ///< Empty when parsing failed
  std::vector<TextBlock> textBlocks;      ///< Page order, then reading order
};

/**
 * @brief Content of an HTML document
 */
struct HtmlData {
  std::optional<std::string> detectedTitle;
  std::optional<std::string> detectedDate; ///< ISO 8601 date
  bool hasValidText = false; ///< Enough paragraphs to be a real page
  std::vector<TextBlock> textBlocks;
};

/**
 * @brief Main text of a web page as found by an HTML extractor
 */
struct ExtractedHtml {
  std::optional<std::string> title;
  std::optional<std::string> date;     ///< ISO 8601 date
  std::vector<std::string> paragraphs; ///< Main text, one entry per line
};

/**
 * @brief Parsed document handed to downstream consumers
 */
struct ParserOutput {
  std::string documentId;
  std::map<std::string, std::string> documentMetadata;
  std::string documentName;
  std::string documentDescription;
  std::optional<std::string> documentUrl;
  std::optional<ContentType> documentContentType;
  std::string documentSlug;

  std::optional<std::vector<std::string>> languages; ///< Unset if unknown
  bool translated = false;
  std::optional<HtmlData> htmlData;
  std::optional<PdfData> pdfData;

  /**
   * @brief Output carrying the input's identity and no content
   */
  static ParserOutput fromInput(const ParserInput &input);

  /**
   * @brief Text blocks of whichever modality the content type selects
   *
   * Empty for documents without a content type or without content.
   */
  const std::vector<TextBlock> &textBlocks() const;

  /**
   * @brief Modifiable text blocks, nullptr when there is no content
   */
  std::vector<TextBlock> *mutableTextBlocks();

  /**
   * @brief Every block's text joined by single spaces
   */
  std::string toString() const;

  /**
   * @brief Content must match the content type
   *
   * HTML documents need htmlData, PDF documents need pdfData, documents
   * without a content type need neither. Content type and URL must both be
   * set or both be unset.
   *
   * @throws std::invalid_argument on the first violation
   */
  void validate() const;
};

} // namespace docparse

#endif // DOCPARSE_DOCUMENT_HPP
