#include "docparse/ParserConfig.hpp"

#include "docparse/Geometry.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace docparse {

namespace {

const char *const kKnownVariables[] = {
    "LAYOUTPARSER_BOX_DETECTION_THRESHOLD",
    "OVERLAP_THRESHOLD",
    "DOCPARSE_AMBIGUITY_MARGIN",
    "DOCPARSE_RENDER_DPI",
    "PDF_BACKEND",
    "RUN_PDF_PARSER",
    "RUN_HTML_PARSER",
    "HTML_MIN_NO_LINES_FOR_VALID_TEXT",
    "DOCPARSE_GATE_GAPS_BY_INK",
    "LOGGING_LEVEL",
    "TESSDATA_PREFIX",
};

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), ::tolower);
  return text;
}

std::invalid_argument malformed(const std::string &name,
                                const std::string &value,
                                const std::string &expected) {
  return std::invalid_argument("Invalid value for " + name + ": \"" + value +
                               "\" (expected " + expected + ")");
}

double parseDouble(const std::string &name, const std::string &value) {
  std::string text = trim(value);
  std::size_t consumed = 0;
  double result = 0.0;
  try {
    result = std::stod(text, &consumed);
  } catch (const std::exception &) {
    throw malformed(name, value, "a number");
  }
  if (consumed != text.size()) {
    throw malformed(name, value, "a number");
  }
  return result;
}

int parseInt(const std::string &name, const std::string &value) {
  std::string text = trim(value);
  std::size_t consumed = 0;
  int result = 0;
  try {
    result = std::stoi(text, &consumed);
  } catch (const std::exception &) {
    throw malformed(name, value, "an integer");
  }
  if (consumed != text.size()) {
    throw malformed(name, value, "an integer");
  }
  return result;
}

bool parseBool(const std::string &name, const std::string &value) {
  std::string text = toLower(trim(value));
  if (text == "true") {
    return true;
  }
  if (text == "false") {
    return false;
  }
  throw malformed(name, value, "true or false");
}

void requireRange(const std::string &name, double value, double low,
                  double high) {
  if (!(value >= low && value <= high)) {
    throw std::invalid_argument(name + " must be in [" + std::to_string(low) +
                                ", " + std::to_string(high) + "], got " +
                                std::to_string(value));
  }
}

void requirePositive(const std::string &name, double value) {
  if (!(value > 0.0)) {
    throw std::invalid_argument(name + " must be positive, got " +
                                std::to_string(value));
  }
}

void requireNonNegative(const std::string &name, double value) {
  if (!(value >= 0.0)) {
    throw std::invalid_argument(name + " must not be negative, got " +
                                std::to_string(value));
  }
}

} // anonymous namespace

std::string pdfBackendName(PdfBackend backend) {
  switch (backend) {
  case PdfBackend::Local:
    return "local";
  case PdfBackend::DocumentAi:
    return "documentai";
  }
  return "local";
}

std::optional<PdfBackend> pdfBackendFromName(const std::string &name) {
  std::string lower = toLower(trim(name));
  if (lower == "local") {
    return PdfBackend::Local;
  }
  if (lower == "documentai" || lower == "document_ai") {
    return PdfBackend::DocumentAi;
  }
  return std::nullopt;
}

ParserConfig ParserConfig::fromEnvironment() {
  std::map<std::string, std::string> environment;
  for (const char *name : kKnownVariables) {
    const char *value = std::getenv(name);
    if (value != nullptr) {
      environment[name] = value;
    }
  }
  return fromEnvironment(environment);
}

ParserConfig ParserConfig::fromEnvironment(
    const std::map<std::string, std::string> &environment) {
  ParserConfig config;

  auto lookup = [&environment](const char *name) -> const std::string * {
    auto it = environment.find(name);
    return it == environment.end() ? nullptr : &it->second;
  };

  if (auto value = lookup("LAYOUTPARSER_BOX_DETECTION_THRESHOLD")) {
    config.disambiguation.detectionThreshold =
        parseDouble("LAYOUTPARSER_BOX_DETECTION_THRESHOLD", *value);
  }
  if (auto value = lookup("OVERLAP_THRESHOLD")) {
    config.disambiguation.overlapThreshold =
        parseDouble("OVERLAP_THRESHOLD", *value);
  }
  if (auto value = lookup("DOCPARSE_AMBIGUITY_MARGIN")) {
    config.disambiguation.ambiguityMargin =
        parseDouble("DOCPARSE_AMBIGUITY_MARGIN", *value);
  }
  if (auto value = lookup("DOCPARSE_RENDER_DPI")) {
    config.renderDpi = parseDouble("DOCPARSE_RENDER_DPI", *value);
  }
  if (auto value = lookup("PDF_BACKEND")) {
    std::optional<PdfBackend> backend = pdfBackendFromName(*value);
    if (!backend) {
      throw malformed("PDF_BACKEND", *value, "local or documentai");
    }
    config.pdfBackend = *backend;
  }
  if (auto value = lookup("RUN_PDF_PARSER")) {
    config.runPdfParser = parseBool("RUN_PDF_PARSER", *value);
  }
  if (auto value = lookup("RUN_HTML_PARSER")) {
    config.runHtmlParser = parseBool("RUN_HTML_PARSER", *value);
  }
  if (auto value = lookup("HTML_MIN_NO_LINES_FOR_VALID_TEXT")) {
    config.htmlMinLinesForValidText =
        parseInt("HTML_MIN_NO_LINES_FOR_VALID_TEXT", *value);
  }
  if (auto value = lookup("DOCPARSE_GATE_GAPS_BY_INK")) {
    config.gateGapsByInk = parseBool("DOCPARSE_GATE_GAPS_BY_INK", *value);
  }
  if (auto value = lookup("LOGGING_LEVEL")) {
    std::optional<LogLevel> level = parseLogLevel(trim(*value));
    if (!level) {
      throw malformed("LOGGING_LEVEL", *value,
                      "DEBUG, INFO, WARNING or ERROR");
    }
    config.logLevel = *level;
  }
  if (auto value = lookup("TESSDATA_PREFIX")) {
    config.tessDataPath = *value;
  }

  return config;
}

void ParserConfig::validate() const {
  requireRange("detectionThreshold", disambiguation.detectionThreshold, 0.0,
               1.0);
  requireRange("overlapThreshold", disambiguation.overlapThreshold, 0.0, 1.0);
  requireRange("ambiguityMargin", disambiguation.ambiguityMargin, 0.0, 1.0);
  requireNonNegative("minGapArea", disambiguation.minGapArea);
  requireNonNegative("minGapWidth", disambiguation.minGapWidth);
  requireNonNegative("minGapHeight", disambiguation.minGapHeight);
  requireNonNegative("rowTolerance", disambiguation.rowTolerance);

  requireNonNegative("mergeGapTolerance", postProcessing.mergeGapTolerance);
  requireRange("alignmentRatio", postProcessing.alignmentRatio, 0.0, 1.0);
  requireNonNegative("minWidth", postProcessing.minWidth);
  requireNonNegative("minHeight", postProcessing.minHeight);
  requireNonNegative("minArea", postProcessing.minArea);

  requireRange("inferredTypeConfidence", ocr.inferredTypeConfidence, 0.0, 1.0);

  requirePositive("renderDpi", renderDpi);
  requireRange("minInkRatio", minInkRatio, 0.0, 1.0);
  requireNonNegative("htmlMinLinesForValidText", htmlMinLinesForValidText);
  requireRange("minLanguageProportion", minLanguageProportion, 0.0, 1.0);
}

} // namespace docparse
