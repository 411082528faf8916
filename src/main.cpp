#include "pdftrans/Config.hpp"
#include "pdftrans/Errors.hpp"
#include "pdftrans/GoogleTranslator.hpp"
#include "pdftrans/OCREngine.hpp"
#include "pdftrans/PdfTranslator.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <vector>

namespace {

const char *kVersion = "1.0.0";

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <pdf_file|-> [options]\n"
      << "\nExtracts the text of a PDF (OCR for scanned pages) and translates "
         "it.\nUse '-' to read the PDF from standard input.\n"
      << "\nOptions:\n"
      << "  -t, --target <lang>     Target language (default: zh-CN)\n"
      << "  -s, --source <lang>     Source language (default: auto)\n"
      << "  -l, --ocr-lang <lang>   Tesseract language (default: eng)\n"
      << "  -d, --dpi <n>           Rendering DPI for OCR pages (default: 300)\n"
      << "  -m, --max-chunk <n>     Max characters per request (default: 4500)\n"
      << "      --ocr-threshold <n> Characters below which a page is OCRed "
         "(default: 40)\n"
      << "  -j, --jobs <n>          Concurrent translation requests "
         "(default: 1)\n"
      << "  -r, --retries <n>       Retries per failed chunk (default: 0)\n"
      << "      --timeout <sec>     Abort the whole run after <sec> seconds\n"
      << "      --api-key <key>     Google Cloud Translation API key\n"
      << "                          (default: $GOOGLE_TRANSLATE_API_KEY)\n"
      << "      --psm <n>           Tesseract page segmentation mode "
         "(default: 3)\n"
      << "      --tessdata <dir>    Tesseract tessdata directory\n"
      << "      --preprocess        Threshold page images before OCR\n"
      << "      --strict-pages      Abort when any page fails to extract\n"
      << "  -x, --extract-only      Print the extracted text, do not translate\n"
      << "  -o, --output <file>     Write the result to <file> (default: "
         "stdout)\n"
      << "  -v, --verbose           Print diagnostics to stderr\n"
      << "      --version           Show version information\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " paper.pdf\n"
      << "  " << programName << " scan.pdf -t de -l eng+deu -j 4 -o out.txt\n"
      << "  cat paper.pdf | " << programName << " - --extract-only\n";
}

void printVersion() {
  std::cout << "pdftrans " << kVersion << "\n"
            << "Tesseract version: "
            << pdftrans::OCREngine::getTesseractVersion() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n";
}

int fail(pdftrans::ErrorKind kind, const std::string &message) {
  std::cerr << "Error: " << message << " [" << pdftrans::errorKindName(kind)
            << "]\n";
  return pdftrans::exitCodeFor(kind);
}

bool hasPdfExtension(const std::string &path) {
  std::string extension = std::filesystem::path(path).extension().string();
  for (auto &c : extension) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return extension == ".pdf";
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  using pdftrans::ErrorKind;

  if (argc < 2) {
    printUsage(argv[0]);
    return pdftrans::exitCodeFor(ErrorKind::ConfigurationError);
  }

  std::string pdfPath;
  std::string outputPath;
  pdftrans::PipelineConfig config;
  pdftrans::PipelineMode mode = pdftrans::PipelineMode::Translate;

  if (const char *key = std::getenv("GOOGLE_TRANSLATE_API_KEY")) {
    config.apiKey = key;
  }

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    // Fetches the value of an option that takes one
    auto nextValue = [&](std::string &out) {
      if (i + 1 < argc) {
        out = argv[++i];
        return true;
      }
      std::cerr << "Error: " << arg << " requires an argument\n";
      return false;
    };
    auto nextInteger = [&](int &out) {
      std::string value;
      if (!nextValue(value)) {
        return false;
      }
      if (!pdftrans::parseIntegerOption(value, out)) {
        std::cerr << "Error: " << arg << " expects an integer, got '" << value
                  << "'\n";
        return false;
      }
      return true;
    };

    bool ok = true;
    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "--version") {
      printVersion();
      return 0;
    } else if (arg == "-t" || arg == "--target") {
      ok = nextValue(config.targetLanguage);
    } else if (arg == "-s" || arg == "--source") {
      ok = nextValue(config.sourceLanguage);
    } else if (arg == "-l" || arg == "--ocr-lang") {
      ok = nextValue(config.ocrLanguage);
    } else if (arg == "-d" || arg == "--dpi") {
      ok = nextInteger(config.dpi);
    } else if (arg == "-m" || arg == "--max-chunk") {
      ok = nextInteger(config.maxChunkLength);
    } else if (arg == "--ocr-threshold") {
      int threshold = 0;
      ok = nextInteger(threshold);
      if (ok && threshold < 0) {
        std::cerr << "Error: --ocr-threshold must not be negative\n";
        ok = false;
      }
      if (ok) {
        config.meaningfulTextThreshold = static_cast<std::size_t>(threshold);
      }
    } else if (arg == "-j" || arg == "--jobs") {
      ok = nextInteger(config.maxConcurrentRequests);
    } else if (arg == "-r" || arg == "--retries") {
      ok = nextInteger(config.maxRetries);
    } else if (arg == "--timeout") {
      std::string value;
      ok = nextValue(value);
      if (ok && !pdftrans::parseSecondsOption(value, config.deadlineSeconds)) {
        std::cerr << "Error: --timeout expects a number of seconds, got '"
                  << value << "'\n";
        ok = false;
      }
    } else if (arg == "--api-key") {
      ok = nextValue(config.apiKey);
    } else if (arg == "--psm") {
      ok = nextInteger(config.pageSegMode);
    } else if (arg == "--tessdata") {
      ok = nextValue(config.tessDataPath);
    } else if (arg == "--preprocess") {
      config.preprocessImage = true;
    } else if (arg == "--strict-pages") {
      config.isolatePageFailures = false;
    } else if (arg == "-x" || arg == "--extract-only") {
      mode = pdftrans::PipelineMode::ExtractOnly;
    } else if (arg == "-o" || arg == "--output") {
      ok = nextValue(outputPath);
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg == "-" || arg[0] != '-') {
      if (!pdfPath.empty()) {
        std::cerr << "Error: more than one input given\n";
        ok = false;
      }
      pdfPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      ok = false;
    }

    if (!ok) {
      return pdftrans::exitCodeFor(ErrorKind::ConfigurationError);
    }
  }

  if (pdfPath.empty()) {
    std::cerr << "Error: No PDF file provided\n";
    printUsage(argv[0]);
    return pdftrans::exitCodeFor(ErrorKind::ConfigurationError);
  }

  std::string invalid = pdftrans::validateConfig(config);
  if (!invalid.empty()) {
    return fail(ErrorKind::ConfigurationError, invalid);
  }

  const bool fromStdin = pdfPath == "-";
  if (!fromStdin && !hasPdfExtension(pdfPath)) {
    return fail(ErrorKind::InputError, "Only PDF files are supported: " +
                                           pdfPath);
  }

  pdftrans::OCREngine ocrEngine(pdftrans::makeOCRConfig(config));
  pdftrans::GoogleTranslator translator(pdftrans::makeTranslatorConfig(config));
  pdftrans::PdfTranslator pipeline(config, ocrEngine, translator);

  if (config.verbose) {
    std::cerr << "DEBUG: Input: " << (fromStdin ? "<stdin>" : pdfPath) << "\n"
              << "DEBUG: OCR language: " << config.ocrLanguage
              << ", DPI: " << config.dpi << "\n";
    if (mode == pdftrans::PipelineMode::Translate) {
      std::cerr << "DEBUG: Translating " << config.sourceLanguage << " -> "
                << config.targetLanguage << " via " << translator.name()
                << "\n";
    }
  }

  pdftrans::PipelineResult result;
  if (fromStdin) {
    std::vector<char> data((std::istreambuf_iterator<char>(std::cin)),
                           std::istreambuf_iterator<char>());
    result = pipeline.translateData(data, mode);
  } else {
    result = pipeline.translateFile(pdfPath, mode);
  }

  if (!result.success) {
    return fail(result.errorKind, result.errorMessage);
  }

  const std::string &output = mode == pdftrans::PipelineMode::ExtractOnly
                                  ? result.extractedText
                                  : result.translatedText;

  if (outputPath.empty()) {
    std::cout << output << "\n";
  } else {
    std::ofstream file(outputPath, std::ios::binary);
    if (!file) {
      return fail(ErrorKind::InputError,
                  "Cannot open output file: " + outputPath);
    }
    file << output << "\n";
    if (!file) {
      return fail(ErrorKind::InputError,
                  "Failed to write output file: " + outputPath);
    }
  }

  if (config.verbose) {
    std::cerr << std::fixed << std::setprecision(2)
              << "DEBUG: Pages: " << result.pageCount
              << " (OCR: " << result.ocrPageCount
              << ", failed: " << result.failedPageCount << ")\n"
              << "DEBUG: Chunks: " << result.chunkCount
              << ", requests: " << result.requestCount << "\n"
              << "DEBUG: Extraction time: " << result.extractionTimeMs
              << " ms, translation time: " << result.translationTimeMs
              << " ms\n";
  }

  return 0;
}
