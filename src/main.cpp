#include "docparse/DocumentParser.hpp"
#include "docparse/Log.hpp"
#include "docparse/ParserConfig.hpp"
#include "docparse/PdfRasterizer.hpp"
#include "docparse/TesseractEngine.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

/**
 * @brief Reads documents from the local file system
 *
 * The document URL is the file path. The content type is left to the
 * input, so a mismatch is never reported.
 */
class LocalFileFetcher : public docparse::DocumentFetcher {
public:
  docparse::FetchedDocument
  fetch(const docparse::ParserInput &input) override {
    std::string path = input.documentUrl.value_or("");
    std::ifstream file(path, std::ios::binary);
    if (!file) {
      throw std::runtime_error("Cannot open file: " + path);
    }

    docparse::FetchedDocument fetched;
    fetched.bytes.assign(std::istreambuf_iterator<char>(file),
                         std::istreambuf_iterator<char>());
    return fetched;
  }
};

docparse::ParserInput makeInput(const std::string &path) {
  std::filesystem::path filePath(path);
  std::string extension = filePath.extension().string();
  for (auto &c : extension) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  docparse::ParserInput input;
  input.documentId = filePath.stem().string();
  input.documentName = filePath.filename().string();
  input.documentSlug = input.documentId;
  if (extension == ".pdf") {
    input.documentContentType = docparse::ContentType::Pdf;
    input.documentUrl = path;
  } else if (extension == ".html" || extension == ".htm") {
    input.documentContentType = docparse::ContentType::Html;
    input.documentUrl = path;
  }
  return input;
}

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <file>... [options]\n"
      << "\nOptions:\n"
      << "  -l, --language <lang>    Set OCR language (default: eng)\n"
      << "  -t, --threshold <val>    Layout detection threshold (0-1)\n"
      << "  -o, --overlap <val>      Overlap (IoU) threshold (0-1)\n"
      << "  --dpi <val>              PDF rendering resolution (default: 150)\n"
      << "  --debug <dir>            Write layout overlays to <dir>\n"
      << "  --tessdata <path>        Path to tessdata directory\n"
      << "  -h, --help               Show this help message\n"
      << "\nEnvironment variables (LAYOUTPARSER_BOX_DETECTION_THRESHOLD,\n"
      << "OVERLAP_THRESHOLD, LOGGING_LEVEL, ...) set the defaults.\n"
      << "\nExamples:\n"
      << "  " << programName << " report.pdf\n"
      << "  " << programName << " report.pdf -l eng+deu -t 0.7\n"
      << "  " << programName << " a.pdf b.pdf --debug debug_pages\n";
}

bool readValue(int argc, char *argv[], int &i, const std::string &option,
               std::string &value) {
  if (i + 1 >= argc) {
    std::cerr << "Error: " << option << " requires an argument\n";
    return false;
  }
  value = argv[++i];
  return true;
}

void printResult(const std::string &path,
                 const docparse::DocumentResult &result) {
  std::cout << "\n=== " << path << " ===\n";
  if (!result.status.success) {
    std::cout << "FAILED at " << result.status.stage << ": "
              << result.status.errorMessage << "\n";
    return;
  }
  if (result.status.skipped) {
    std::cout << "Skipped (parser disabled)\n";
    return;
  }

  const auto &blocks = result.output.textBlocks();
  if (result.output.pdfData) {
    std::cout << "Pages: " << result.output.pdfData->pageMetadata.size()
              << "  md5: " << result.output.pdfData->md5sum << "\n";
  }

  std::cout << std::setw(10) << "Block" << std::setw(20) << "Type"
            << std::setw(8) << "Conf"
            << "  Text\n";
  std::cout << std::string(80, '-') << "\n";
  for (const auto &block : blocks) {
    std::cout << std::setw(10) << block.blockId << std::setw(20)
              << docparse::blockTypeName(block.type) << std::setw(8)
              << std::fixed << std::setprecision(2) << block.typeConfidence
              << "  " << block.toString() << "\n";
  }

  std::cout << "\nText blocks: " << blocks.size()
            << "\nProcessing time: " << std::fixed << std::setprecision(2)
            << result.status.processingTimeMs << " ms\n";
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  docparse::ParserConfig config;
  try {
    config = docparse::ParserConfig::fromEnvironment();
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  docparse::TesseractConfig tesseractConfig;
  std::vector<std::string> paths;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;

    try {
      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-l" || arg == "--language") {
        if (!readValue(argc, argv, i, arg, value)) {
          return 1;
        }
        tesseractConfig.language = value;
      } else if (arg == "-t" || arg == "--threshold") {
        if (!readValue(argc, argv, i, arg, value)) {
          return 1;
        }
        config.disambiguation.detectionThreshold = std::stod(value);
      } else if (arg == "-o" || arg == "--overlap") {
        if (!readValue(argc, argv, i, arg, value)) {
          return 1;
        }
        config.disambiguation.overlapThreshold = std::stod(value);
      } else if (arg == "--dpi") {
        if (!readValue(argc, argv, i, arg, value)) {
          return 1;
        }
        config.renderDpi = std::stod(value);
      } else if (arg == "--debug") {
        if (!readValue(argc, argv, i, arg, config.debugOutputDir)) {
          return 1;
        }
      } else if (arg == "--tessdata") {
        if (!readValue(argc, argv, i, arg, config.tessDataPath)) {
          return 1;
        }
      } else if (arg[0] != '-') {
        paths.push_back(arg);
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    } catch (const std::logic_error &) {
      // std::stod throws invalid_argument or out_of_range
      std::cerr << "Error: invalid value for " << arg << ": " << value << "\n";
      return 1;
    }
  }

  if (paths.empty()) {
    std::cerr << "Error: No input files provided\n";
    printUsage(argv[0]);
    return 1;
  }

  try {
    config.validate();
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  docparse::setLogLevel(config.logLevel);
  tesseractConfig.tessDataPath = config.tessDataPath;

  std::cout << "=== docparse ===\n"
            << "Tesseract version: "
            << docparse::TesseractOcrEngine::getTesseractVersion() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Language: " << tesseractConfig.language << "\n"
            << "Detection threshold: "
            << config.disambiguation.detectionThreshold << "\n"
            << "Overlap threshold: " << config.disambiguation.overlapThreshold
            << "\n"
            << "================\n";

  docparse::TesseractDetectionSource detectionSource(tesseractConfig);
  docparse::TesseractOcrEngine ocrEngine(tesseractConfig);
  if (!detectionSource.initialize() || !ocrEngine.initialize()) {
    std::cerr
        << "Failed to initialize OCR engine.\n"
        << "Make sure Tesseract is installed and tessdata is available.\n";
    return 1;
  }

  LocalFileFetcher fetcher;
  docparse::PopplerRasterizer rasterizer;

  docparse::Collaborators collaborators;
  collaborators.fetcher = &fetcher;
  collaborators.rasterizer = &rasterizer;
  collaborators.detectionSource = &detectionSource;
  collaborators.ocrEngine = &ocrEngine;

  std::vector<docparse::ParserInput> inputs;
  for (const auto &path : paths) {
    inputs.push_back(makeInput(path));
  }

  docparse::DocumentParser parser(config, collaborators);
  std::vector<docparse::DocumentResult> results = parser.parseBatch(inputs);

  int failures = 0;
  for (std::size_t i = 0; i < results.size(); ++i) {
    printResult(paths[i], results[i]);
    if (!results[i].status.success) {
      ++failures;
    }
  }

  std::cout << "\nDocuments: " << results.size() << ", failed: " << failures
            << "\n";
  return failures == 0 ? 0 : 2;
}
