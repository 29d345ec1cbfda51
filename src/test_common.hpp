#ifndef DOCPARSE_TEST_COMMON_HPP
#define DOCPARSE_TEST_COMMON_HPP

#include "docparse/BackendRetryController.hpp"
#include "docparse/DocumentParser.hpp"
#include "docparse/LayoutDisambiguator.hpp"
#include "docparse/OCRProcessor.hpp"
#include "docparse/PdfRasterizer.hpp"

#include <opencv2/opencv.hpp>

#include <cmath>
#include <deque>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace test {

inline int &failureCount() {
  static int failures = 0;
  return failures;
}

inline bool check(bool condition, const std::string &what) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << what << std::endl;
  if (!condition) {
    failureCount()++;
  }
  return condition;
}

inline bool near(double a, double b, double tolerance = 1e-9) {
  return std::fabs(a - b) <= tolerance;
}

inline void section(const std::string &name) {
  std::cout << std::endl << "--- " << name << " ---" << std::endl;
}

inline int summary(const std::string &suite) {
  std::cout << std::endl
            << suite << ": "
            << (failureCount() == 0
                    ? std::string("all checks passed")
                    : std::to_string(failureCount()) + " checks failed")
            << std::endl;
  return failureCount() == 0 ? 0 : 1;
}

inline docparse::Detection detection(double x, double y, double width,
                                     double height,
                                     docparse::DetectionLabel label,
                                     double confidence) {
  docparse::Detection result;
  result.box = docparse::Box(x, y, width, height);
  result.label = label;
  result.confidence = confidence;
  return result;
}

inline docparse::Region region(double x, double y, double width, double height,
                               docparse::BlockType type,
                               std::optional<double> confidence = 0.9) {
  docparse::Region result;
  result.box = docparse::Box(x, y, width, height);
  result.type = type;
  result.sourceConfidence = confidence;
  return result;
}

inline cv::Mat whitePage(int width, int height) {
  return cv::Mat(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
}

/**
 * @brief Returns the same detections for every page
 */
class FakeDetectionSource : public docparse::DetectionSource {
public:
  explicit FakeDetectionSource(
      std::vector<docparse::Detection> detections = {})
      : m_detections(std::move(detections)) {}

  std::vector<docparse::Detection> detect(const cv::Mat &) override {
    ++calls;
    if (failOnCall > 0 && calls == failOnCall) {
      throw std::runtime_error("detector crashed");
    }
    return m_detections;
  }

  int calls = 0;
  int failOnCall = 0; ///< 1-based call that throws, 0 for never

private:
  std::vector<docparse::Detection> m_detections;
};

/**
 * @brief Answers each recognize() call from a script, then with a default
 */
class FakeOcrEngine : public docparse::OcrEngine {
public:
  std::vector<std::string> recognize(const cv::Mat &crop) override {
    ++calls;
    cropSizes.push_back(crop.size());
    if (!script.empty()) {
      std::function<std::vector<std::string>()> next = script.front();
      script.pop_front();
      return next();
    }
    return defaultLines;
  }

  void thenReturn(std::vector<std::string> lines) {
    script.push_back([lines]() { return lines; });
  }

  void thenThrow(const std::string &message) {
    script.push_back([message]() -> std::vector<std::string> {
      throw std::runtime_error(message);
    });
  }

  std::deque<std::function<std::vector<std::string>()>> script;
  std::vector<std::string> defaultLines = {"some text"};
  std::vector<cv::Size> cropSizes;
  int calls = 0;
};

/**
 * @brief Backend whose endpoints fail or succeed as scripted
 */
class FakeBackend : public docparse::DocumentAiBackend {
public:
  using Behaviour = std::function<docparse::AnalyzeResult()>;

  docparse::AnalyzeResult
  analyzeDefault(const std::vector<char> &) override {
    ++defaultCalls;
    return defaultBehaviour();
  }

  docparse::AnalyzeResult analyzeLarge(const std::vector<char> &) override {
    ++largeCalls;
    return largeBehaviour();
  }

  static Behaviour succeedWith(docparse::AnalyzeResult result) {
    return [result]() { return result; };
  }

  template <typename Error> static Behaviour fail(const std::string &message) {
    return [message]() -> docparse::AnalyzeResult { throw Error(message); };
  }

  Behaviour defaultBehaviour = succeedWith(docparse::AnalyzeResult());
  Behaviour largeBehaviour = succeedWith(docparse::AnalyzeResult());
  int defaultCalls = 0;
  int largeCalls = 0;
};

/**
 * @brief One analysed page with a title and a body paragraph
 */
inline docparse::AnalyzeResult onePageResult() {
  docparse::AnalyzedParagraph title;
  title.box = docparse::Box(50, 20, 400, 40);
  title.role = "title";
  title.lines = {"Annual Report"};

  docparse::AnalyzedParagraph body;
  body.box = docparse::Box(50, 100, 400, 200);
  body.lines = {"First line of the body.", "Second line."};

  docparse::AnalyzedPage page;
  page.pageNumber = 0;
  page.width = 600;
  page.height = 800;
  page.paragraphs = {body, title};

  docparse::AnalyzeResult result;
  result.pages.push_back(page);
  return result;
}

/**
 * @brief Serves documents from memory, keyed by URL
 */
class FakeFetcher : public docparse::DocumentFetcher {
public:
  docparse::FetchedDocument
  fetch(const docparse::ParserInput &input) override {
    ++calls;
    auto it = documents.find(input.documentUrl.value_or(""));
    if (it == documents.end()) {
      throw std::runtime_error("404 Not Found: " +
                               input.documentUrl.value_or(""));
    }
    return it->second;
  }

  std::map<std::string, docparse::FetchedDocument> documents;
  int calls = 0;
};

/**
 * @brief Hands out pre-rendered pages instead of rendering PDF bytes
 */
class FakeRasterizer : public docparse::PageRasterizer {
public:
  docparse::RasterizedDocument rasterize(const std::vector<char> &,
                                         double dpi) override {
    docparse::RasterizedDocument result;
    result.dpi = dpi;
    if (fail) {
      result.errorMessage = "Failed to load PDF";
      return result;
    }
    result.pages = pages;
    result.success = true;
    return result;
  }

  std::vector<docparse::RasterizedPage> pages;
  bool fail = false;
};

inline docparse::RasterizedPage rasterizedPage(int pageNumber, int width,
                                               int height) {
  docparse::RasterizedPage page;
  page.image = whitePage(width, height);
  page.pageNumber = pageNumber;
  page.width = width;
  page.height = height;
  return page;
}

/**
 * @brief Splits the HTML body on newlines
 */
class FakeHtmlExtractor : public docparse::HtmlExtractor {
public:
  docparse::ExtractedHtml extract(const std::string &html,
                                  const std::string &) override {
    docparse::ExtractedHtml extracted;
    extracted.title = title;
    std::string line;
    for (char c : html) {
      if (c == '\n') {
        extracted.paragraphs.push_back(line);
        line.clear();
      } else {
        line += c;
      }
    }
    if (!line.empty()) {
      extracted.paragraphs.push_back(line);
    }
    return extracted;
  }

  std::string title = "A page";
};

class FakeLanguageDetector : public docparse::LanguageDetector {
public:
  std::optional<std::string> detect(const std::string &) override {
    return language;
  }

  std::optional<std::string> language = std::string("en");
};

inline docparse::ParserInput pdfInput(const std::string &id) {
  docparse::ParserInput input;
  input.documentId = id;
  input.documentName = id + ".pdf";
  input.documentSlug = id;
  input.documentUrl = "https://example.org/" + id + ".pdf";
  input.documentContentType = docparse::ContentType::Pdf;
  return input;
}

inline docparse::ParserInput htmlInput(const std::string &id) {
  docparse::ParserInput input;
  input.documentId = id;
  input.documentName = id;
  input.documentSlug = id;
  input.documentUrl = "https://example.org/" + id + ".html";
  input.documentContentType = docparse::ContentType::Html;
  return input;
}

inline std::vector<char> bytesOf(const std::string &text) {
  return std::vector<char>(text.begin(), text.end());
}

} // namespace test

#endif // DOCPARSE_TEST_COMMON_HPP
