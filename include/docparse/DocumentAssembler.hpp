#ifndef DOCPARSE_DOCUMENT_ASSEMBLER_HPP
#define DOCPARSE_DOCUMENT_ASSEMBLER_HPP

#include "docparse/Document.hpp"
#include "docparse/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace docparse {

/**
 * @brief Detects the language of a piece of text
 */
class LanguageDetector {
public:
  virtual ~LanguageDetector() = default;

  /**
   * @return 2-letter ISO code, or std::nullopt if undecidable
   */
  virtual std::optional<std::string> detect(const std::string &text) = 0;
};

/**
 * @brief Text blocks and dimensions of one processed PDF page
 */
struct AssembledPage {
  PageMetadata metadata;
  std::vector<TextBlock> textBlocks; ///< In reading order
};

/**
 * @brief MD5 digest of the bytes as 32 lowercase hex characters
 * @throws std::runtime_error if OpenSSL cannot compute the digest
 */
std::string md5Hex(const std::vector<char> &bytes);

/**
 * @brief Build the output for a parsed PDF
 *
 * Pages are put in page-number order and their blocks concatenated. The
 * document languages are derived from the block languages.
 *
 * @param input Document identity
 * @param bytes PDF content, hashed into PdfData::md5sum
 * @param pages Processed pages, any order
 * @param minLanguageProportion See setDocumentLanguagesFromTextBlocks()
 */
ParserOutput assemblePdf(const ParserInput &input,
                         const std::vector<char> &bytes,
                         std::vector<AssembledPage> pages,
                         double minLanguageProportion = 0.4);

/**
 * @brief Build the output for an HTML page
 *
 * Every non-blank paragraph becomes a Text block "b{index}" with type
 * confidence 1. The text is valid when there are at least minLinesForValidText
 * paragraphs. A page without paragraphs yields emptyHtmlOutput().
 */
ParserOutput assembleHtml(const ParserInput &input,
                          const ExtractedHtml &extracted,
                          int minLinesForValidText = 6);

/**
 * @brief Set the document languages from the block languages
 *
 * A language is listed when its share of all blocks exceeds
 * minProportion. Languages stay unset when no block has one.
 */
void setDocumentLanguagesFromTextBlocks(ParserOutput &output,
                                        double minProportion = 0.4);

/**
 * @brief Detect one language for the whole document and copy it to blocks
 *
 * Meant for HTML documents; PDF blocks are tagged one by one with
 * tagBlockLanguages().
 */
void detectAndSetLanguages(ParserOutput &output, LanguageDetector &detector);

/**
 * @brief Detect the language of each block on its own
 *
 * Blocks whose language cannot be detected keep an unset language.
 */
void tagBlockLanguages(std::vector<TextBlock> &blocks,
                       LanguageDetector &detector);

/**
 * @brief PDF output with no pages, no blocks and an empty md5sum
 */
ParserOutput emptyPdfOutput(const ParserInput &input);

/**
 * @brief HTML output with no blocks and hasValidText == false
 */
ParserOutput emptyHtmlOutput(const ParserInput &input);

} // namespace docparse

#endif // DOCPARSE_DOCUMENT_ASSEMBLER_HPP
