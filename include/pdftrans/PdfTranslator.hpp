#ifndef PDFTRANS_PDF_TRANSLATOR_HPP
#define PDFTRANS_PDF_TRANSLATOR_HPP

#include "pdftrans/Config.hpp"
#include "pdftrans/Errors.hpp"
#include "pdftrans/GoogleTranslator.hpp"
#include "pdftrans/OCREngine.hpp"
#include "pdftrans/TranslationOrchestrator.hpp"

#include <string>
#include <vector>

namespace pdftrans {

class CancellationToken;
class IDocument;

enum class PipelineMode {
  Translate,  ///< Extract, chunk and translate
  ExtractOnly ///< Stop after extraction and return the document text
};

/**
 * @brief Result of a whole PDF translation run
 */
struct PipelineResult {
  std::string translatedText; ///< Final output (empty in ExtractOnly mode)
  std::string extractedText;  ///< Page-marked document text

  int pageCount = 0;       ///< Pages in the document
  int ocrPageCount = 0;    ///< Pages that went through OCR
  int failedPageCount = 0; ///< Pages that failed and were left empty
  int chunkCount = 0;      ///< Chunks sent for translation
  int requestCount = 0;    ///< Translation requests, retries included

  double extractionTimeMs = 0;  ///< Time spent extracting
  double translationTimeMs = 0; ///< Time spent translating

  bool success = false;                  ///< Whether the run succeeded
  ErrorKind errorKind = ErrorKind::None; ///< Failure kind
  std::string errorMessage;              ///< Error message if failed
};

/// OCR engine settings derived from the pipeline configuration
OCRConfig makeOCRConfig(const PipelineConfig &config);

/// Orchestrator settings derived from the pipeline configuration
OrchestratorOptions makeOrchestratorOptions(const PipelineConfig &config);

/// Translator connection settings derived from the pipeline configuration
GoogleTranslatorConfig makeTranslatorConfig(const PipelineConfig &config);

/**
 * @brief Runs document extraction and translation end to end
 *
 * The configuration is validated before any document is touched. No
 * partial translation is ever returned: on failure translatedText is empty
 * and errorKind says which stage failed.
 *
 * Without a caller token, a positive PipelineConfig::deadlineSeconds starts
 * its own deadline when the run begins. A caller token takes precedence.
 *
 * Example usage:
 * @code
 * pdftrans::PipelineConfig config;
 * config.targetLanguage = "de";
 * pdftrans::OCREngine ocr(pdftrans::makeOCRConfig(config));
 * pdftrans::GoogleTranslator translator(pdftrans::makeTranslatorConfig(config));
 * pdftrans::PdfTranslator pipeline(config, ocr, translator);
 * auto result = pipeline.translateFile("paper.pdf");
 * @endcode
 */
class PdfTranslator {
public:
  /**
   * @param config Pipeline configuration (copied)
   * @param recognizer OCR capability, must outlive the pipeline
   * @param translator Translation capability, must outlive the pipeline
   */
  PdfTranslator(const PipelineConfig &config, ITextRecognizer &recognizer,
                ITranslator &translator);

  PipelineResult translateFile(const std::string &pdfPath,
                               PipelineMode mode = PipelineMode::Translate,
                               const CancellationToken *cancel = nullptr);

  PipelineResult translateData(const std::vector<char> &pdfData,
                               PipelineMode mode = PipelineMode::Translate,
                               const CancellationToken *cancel = nullptr);

  /**
   * @brief Run the pipeline on an already opened document
   */
  PipelineResult translateDocument(IDocument &document,
                                   PipelineMode mode = PipelineMode::Translate,
                                   const CancellationToken *cancel = nullptr);

private:
  PipelineConfig m_config;
  ITextRecognizer &m_recognizer;
  ITranslator &m_translator;
};

} // namespace pdftrans

#endif // PDFTRANS_PDF_TRANSLATOR_HPP
