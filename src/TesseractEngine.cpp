#include "docparse/TesseractEngine.hpp"

#include "docparse/Geometry.hpp"
#include "docparse/Log.hpp"

#include <tesseract/publictypes.h>
#include <tesseract/resultiterator.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>

namespace docparse {

namespace {

bool initTesseract(tesseract::TessBaseAPI &api, const TesseractConfig &config) {
  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!config.tessDataPath.empty()) {
    tessDataPath = config.tessDataPath.c_str();
  }
  // Priority 2: Check TESSDATA_PREFIX environment variable
  else {
    const char *envPath = std::getenv("TESSDATA_PREFIX");
    if (envPath != nullptr) {
      tessDataPath = envPath;
    } else {
      // Priority 3: Tesseract's compiled-in default
      log(LogLevel::Debug, "ocr", "",
          "TESSDATA_PREFIX not set, using Tesseract's default tessdata path");
    }
  }

  int result = api.Init(tessDataPath, config.language.c_str());
  if (result != 0) {
    log(LogLevel::Error, "ocr", "",
        "Failed to initialize Tesseract with language: " + config.language);
    return false;
  }

  api.SetPageSegMode(config.pageSegMode);
  return true;
}

void setImage(tesseract::TessBaseAPI &api, const cv::Mat &image) {
  cv::Mat rgbImage;

  // Tesseract expects RGB
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  api.SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
               static_cast<int>(rgbImage.step));
}

std::string takeText(char *text) {
  std::string result;
  if (text) {
    result = text;
    delete[] text;
  }
  return result;
}

std::vector<std::string> splitLines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  return lines;
}

bool startsWith(const std::string &text, const std::string &prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

bool hasListMarker(const std::string &rawLine) {
  std::string line = trim(rawLine);
  if (line.empty()) {
    return false;
  }

  // Bullets: ASCII, U+2022 bullet, U+2013 en dash
  for (const char *bullet : {"-", "*", "\xE2\x80\xA2", "\xE2\x80\x93"}) {
    std::string marker(bullet);
    if (startsWith(line, marker) &&
        (line.size() == marker.size() ||
         std::isspace(static_cast<unsigned char>(line[marker.size()])))) {
      return true;
    }
  }

  // Enumerators: "12." "3)" "a." "b)"
  std::size_t pos = 0;
  while (pos < line.size() &&
         std::isdigit(static_cast<unsigned char>(line[pos]))) {
    ++pos;
  }
  if (pos == 0 && std::isalpha(static_cast<unsigned char>(line[0]))) {
    pos = 1;
  }
  return pos > 0 && pos < line.size() && pos <= 3 &&
         (line[pos] == '.' || line[pos] == ')') &&
         (pos + 1 == line.size() ||
          std::isspace(static_cast<unsigned char>(line[pos + 1])));
}

} // anonymous namespace

cv::Mat preprocessForOcr(const cv::Mat &image) {
  cv::Mat processed;

  // Convert to grayscale if color
  if (image.channels() == 3) {
    cv::cvtColor(image, processed, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, processed, cv::COLOR_BGRA2GRAY);
  } else {
    processed = image.clone();
  }

  cv::GaussianBlur(processed, processed, cv::Size(3, 3), 0);
  cv::adaptiveThreshold(processed, processed, 255,
                        cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 11,
                        2);

  return processed;
}

bool looksLikeList(const std::vector<std::string> &lines) {
  std::vector<std::string> nonBlank = cleanLines(lines);
  if (nonBlank.size() < 2) {
    return false;
  }
  auto marked = std::count_if(nonBlank.begin(), nonBlank.end(), hasListMarker);
  return static_cast<std::size_t>(marked) * 2 >= nonBlank.size();
}

// TesseractOcrEngine

TesseractOcrEngine::TesseractOcrEngine()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_initialized(false) {}

TesseractOcrEngine::TesseractOcrEngine(const TesseractConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

TesseractOcrEngine::~TesseractOcrEngine() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

bool TesseractOcrEngine::initialize() {
  if (!m_initialized) {
    m_initialized = initTesseract(*m_tesseract, m_config);
  }
  return m_initialized;
}

bool TesseractOcrEngine::isInitialized() const { return m_initialized; }

std::vector<std::string> TesseractOcrEngine::recognize(const cv::Mat &crop) {
  if (!m_initialized) {
    throw std::runtime_error(
        "OCR engine not initialized. Call initialize() first.");
  }
  if (crop.empty()) {
    return {};
  }

  cv::Mat processed = m_config.preprocessImage ? preprocessForOcr(crop) : crop;
  setImage(*m_tesseract, processed);

  return splitLines(takeText(m_tesseract->GetUTF8Text()));
}

std::string TesseractOcrEngine::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

// TesseractDetectionSource

TesseractDetectionSource::TesseractDetectionSource()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_initialized(false) {}

TesseractDetectionSource::TesseractDetectionSource(
    const TesseractConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

TesseractDetectionSource::~TesseractDetectionSource() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

bool TesseractDetectionSource::initialize() {
  if (!m_initialized) {
    m_initialized = initTesseract(*m_tesseract, m_config);
  }
  return m_initialized;
}

bool TesseractDetectionSource::isInitialized() const { return m_initialized; }

std::optional<DetectionLabel>
TesseractDetectionSource::labelForBlock(tesseract::PolyBlockType blockType,
                                        const std::vector<std::string> &lines) {
  switch (blockType) {
  case tesseract::PT_FLOWING_TEXT:
  case tesseract::PT_PULLOUT_TEXT:
  case tesseract::PT_CAPTION_TEXT:
  case tesseract::PT_VERTICAL_TEXT:
  case tesseract::PT_EQUATION:
  case tesseract::PT_INLINE_EQUATION:
    return looksLikeList(lines) ? DetectionLabel::List : DetectionLabel::Text;
  case tesseract::PT_HEADING_TEXT:
    return DetectionLabel::Title;
  case tesseract::PT_TABLE:
    return DetectionLabel::Table;
  case tesseract::PT_FLOWING_IMAGE:
  case tesseract::PT_HEADING_IMAGE:
  case tesseract::PT_PULLOUT_IMAGE:
    return DetectionLabel::Figure;
  default:
    // Separator lines, noise and unknown blocks
    return std::nullopt;
  }
}

std::vector<Detection>
TesseractDetectionSource::detect(const cv::Mat &pageImage) {
  if (!m_initialized) {
    throw std::runtime_error(
        "Layout detector not initialized. Call initialize() first.");
  }

  std::vector<Detection> detections;
  if (pageImage.empty()) {
    return detections;
  }

  cv::Mat processed =
      m_config.preprocessImage ? preprocessForOcr(pageImage) : pageImage;
  setImage(*m_tesseract, processed);

  // Must call Recognize before GetIterator
  if (m_tesseract->Recognize(nullptr) != 0) {
    throw std::runtime_error("Tesseract layout analysis failed");
  }

  std::unique_ptr<tesseract::ResultIterator> ri(m_tesseract->GetIterator());
  if (!ri) {
    return detections;
  }

  const tesseract::PageIteratorLevel level = tesseract::RIL_BLOCK;
  do {
    int x1, y1, x2, y2;
    if (!ri->BoundingBox(level, &x1, &y1, &x2, &y2)) {
      continue;
    }

    tesseract::PolyBlockType blockType = ri->BlockType();
    std::vector<std::string> lines;
    if (tesseract::PTIsTextType(blockType)) {
      lines = splitLines(takeText(ri->GetUTF8Text(level)));
    }

    std::optional<DetectionLabel> label = labelForBlock(blockType, lines);
    if (!label) {
      continue;
    }

    Detection detection;
    detection.box = Box(x1, y1, x2 - x1, y2 - y1);
    detection.label = *label;
    if (*label == DetectionLabel::Table || *label == DetectionLabel::Figure) {
      detection.confidence = m_config.nonTextConfidence;
    } else {
      detection.confidence =
          std::clamp(ri->Confidence(level) / 100.0, 0.0, 1.0);
    }
    detections.push_back(detection);
  } while (ri->Next(level));

  log(LogLevel::Debug, "layout", "",
      "Tesseract found " + std::to_string(detections.size()) +
          " layout blocks");
  return detections;
}

} // namespace docparse
