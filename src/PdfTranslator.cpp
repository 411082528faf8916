#include "pdftrans/PdfTranslator.hpp"

#include "pdftrans/CancellationToken.hpp"
#include "pdftrans/DocumentExtractor.hpp"
#include "pdftrans/PageExtractor.hpp"
#include "pdftrans/PdfDocument.hpp"

#include <iostream>

namespace pdftrans {

namespace {

PipelineResult configurationFailure(const std::string &message) {
  PipelineResult result;
  result.errorKind = ErrorKind::ConfigurationError;
  result.errorMessage = message;
  return result;
}

PipelineResult inputFailure(const std::string &message) {
  PipelineResult result;
  result.errorKind = ErrorKind::InputError;
  result.errorMessage = message;
  return result;
}

} // anonymous namespace

OCRConfig makeOCRConfig(const PipelineConfig &config) {
  OCRConfig ocr;
  ocr.language = config.ocrLanguage;
  ocr.pageSegMode = static_cast<tesseract::PageSegMode>(config.pageSegMode);
  ocr.preprocessImage = config.preprocessImage;
  ocr.tessDataPath = config.tessDataPath;
  return ocr;
}

OrchestratorOptions makeOrchestratorOptions(const PipelineConfig &config) {
  OrchestratorOptions options;
  options.maxChunkLength =
      config.maxChunkLength > 0 ? static_cast<std::size_t>(config.maxChunkLength)
                                : 0;
  options.sourceLanguage = config.sourceLanguage;
  options.maxConcurrentRequests = config.maxConcurrentRequests;
  options.maxRetries = config.maxRetries;
  options.retryBackoffMs = config.retryBackoffMs;
  options.verbose = config.verbose;
  return options;
}

GoogleTranslatorConfig makeTranslatorConfig(const PipelineConfig &config) {
  GoogleTranslatorConfig translator;
  translator.apiKey = config.apiKey;
  translator.connectTimeoutMs = config.connectTimeoutMs;
  translator.timeoutMs = config.requestTimeoutMs;
  return translator;
}

PdfTranslator::PdfTranslator(const PipelineConfig &config,
                             ITextRecognizer &recognizer,
                             ITranslator &translator)
    : m_config(config), m_recognizer(recognizer), m_translator(translator) {}

PipelineResult PdfTranslator::translateFile(const std::string &pdfPath,
                                            PipelineMode mode,
                                            const CancellationToken *cancel) {
  std::string invalid = validateConfig(m_config);
  if (!invalid.empty()) {
    return configurationFailure(invalid);
  }

  CancellationToken runDeadline;
  if (!cancel && m_config.deadlineSeconds > 0) {
    runDeadline.setDeadlineAfter(m_config.deadlineSeconds);
    cancel = &runDeadline;
  }

  PdfLoadResult loaded = PdfDocument::loadFromFile(pdfPath);
  if (!loaded.success) {
    return inputFailure(loaded.errorMessage);
  }

  return translateDocument(*loaded.document, mode, cancel);
}

PipelineResult PdfTranslator::translateData(const std::vector<char> &pdfData,
                                            PipelineMode mode,
                                            const CancellationToken *cancel) {
  std::string invalid = validateConfig(m_config);
  if (!invalid.empty()) {
    return configurationFailure(invalid);
  }

  CancellationToken runDeadline;
  if (!cancel && m_config.deadlineSeconds > 0) {
    runDeadline.setDeadlineAfter(m_config.deadlineSeconds);
    cancel = &runDeadline;
  }

  PdfLoadResult loaded = PdfDocument::loadFromData(pdfData);
  if (!loaded.success) {
    return inputFailure(loaded.errorMessage);
  }

  return translateDocument(*loaded.document, mode, cancel);
}

PipelineResult PdfTranslator::translateDocument(IDocument &document,
                                                PipelineMode mode,
                                                const CancellationToken *cancel) {
  std::string invalid = validateConfig(m_config);
  if (!invalid.empty()) {
    return configurationFailure(invalid);
  }

  CancellationToken runDeadline;
  if (!cancel && m_config.deadlineSeconds > 0) {
    runDeadline.setDeadlineAfter(m_config.deadlineSeconds);
    cancel = &runDeadline;
  }

  PipelineResult result;
  result.success = false;

  PageExtractor pageExtractor(m_recognizer, m_config.meaningfulTextThreshold);
  DocumentExtractor extractor(pageExtractor);
  extractor.setIsolatePageFailures(m_config.isolatePageFailures);
  extractor.setVerbose(m_config.verbose);

  ExtractionResult extraction = extractor.extractDocument(
      document, m_config.dpi, m_config.ocrLanguage, cancel);

  result.pageCount = extraction.pageCount;
  result.ocrPageCount = extraction.ocrPageCount;
  result.failedPageCount = extraction.failedPageCount;
  result.extractionTimeMs = extraction.processingTimeMs;

  if (m_config.verbose) {
    std::cerr << "DEBUG: Extracted " << extraction.pageCount << " pages ("
              << extraction.ocrPageCount << " with OCR, "
              << extraction.failedPageCount << " failed) in "
              << extraction.processingTimeMs << " ms" << std::endl;
  }

  if (!extraction.success) {
    result.errorKind = extraction.errorKind;
    result.errorMessage = extraction.errorMessage;
    return result;
  }

  result.extractedText = std::move(extraction.fullText);

  if (mode == PipelineMode::ExtractOnly) {
    result.success = true;
    return result;
  }

  TranslationOrchestrator orchestrator(m_translator,
                                       makeOrchestratorOptions(m_config));
  TranslationResult translation = orchestrator.translate(
      result.extractedText, m_config.targetLanguage, cancel);

  result.chunkCount = translation.chunkCount;
  result.requestCount = translation.requestCount;
  result.translationTimeMs = translation.processingTimeMs;

  if (m_config.verbose) {
    std::cerr << "DEBUG: Translated " << translation.chunkCount
              << " chunks with " << translation.requestCount << " requests in "
              << translation.processingTimeMs << " ms" << std::endl;
  }

  if (!translation.success) {
    result.errorKind = translation.errorKind;
    result.errorMessage = translation.errorMessage;
    return result;
  }

  result.translatedText = std::move(translation.text);
  result.success = true;
  return result;
}

} // namespace pdftrans
