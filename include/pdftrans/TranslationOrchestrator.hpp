#ifndef PDFTRANS_TRANSLATION_ORCHESTRATOR_HPP
#define PDFTRANS_TRANSLATION_ORCHESTRATOR_HPP

#include "pdftrans/Config.hpp"
#include "pdftrans/Errors.hpp"
#include "pdftrans/ITranslator.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pdftrans {

class CancellationToken;

/**
 * @brief Options for driving a translator over many chunks
 */
struct OrchestratorOptions {
  std::size_t maxChunkLength = kDefaultMaxChunkLength; ///< Code points
  std::string sourceLanguage = "auto"; ///< Source language or "auto"
  int maxConcurrentRequests = 1;       ///< Requests in flight at once
  int maxRetries = 0;                  ///< Extra attempts per chunk
  int retryBackoffMs = 200; ///< Wait before attempt n is n * backoff
  bool verbose = false;     ///< Print DEBUG diagnostics to stderr
};

/**
 * @brief Result of translating a whole text
 */
struct TranslationResult {
  std::string text;            ///< Translated chunks joined by a blank line
  int chunkCount = 0;          ///< Chunks the text was split into
  int requestCount = 0;        ///< Requests sent, retries included
  double processingTimeMs = 0; ///< Processing time in milliseconds
  bool success = false;        ///< Whether every chunk was translated
  ErrorKind errorKind = ErrorKind::None; ///< Failure kind
  std::string errorMessage;              ///< Error message if failed
};

/**
 * @brief Splits text into chunks and translates them in order
 *
 * Chunks are dispatched to up to maxConcurrentRequests worker threads.
 * Every translation lands in the slot of its chunk, so the output order is
 * the chunk order whatever the completion order. If any chunk still fails
 * after its retries the whole operation fails and no partial text is
 * returned.
 */
class TranslationOrchestrator {
public:
  /**
   * @param translator Translation capability, must outlive the orchestrator
   * @param options Chunking, concurrency and retry settings
   */
  explicit TranslationOrchestrator(ITranslator &translator,
                                   OrchestratorOptions options = {});

  /**
   * @brief Translate a text of any length
   *
   * Empty input gives an empty, successful result without calling the
   * translator.
   */
  TranslationResult translate(const std::string &text,
                              const std::string &targetLanguage,
                              const CancellationToken *cancel = nullptr);

  /**
   * @brief Translate already chunked text, joining the results in order
   */
  TranslationResult translateChunks(const std::vector<std::string> &chunks,
                                    const std::string &targetLanguage,
                                    const CancellationToken *cancel = nullptr);

private:
  TranslationResponse translateWithRetry(const std::string &chunk,
                                         std::size_t index,
                                         const std::string &targetLanguage,
                                         const CancellationToken *cancel,
                                         int &requests);

  ITranslator &m_translator;
  OrchestratorOptions m_options;
};

} // namespace pdftrans

#endif // PDFTRANS_TRANSLATION_ORCHESTRATOR_HPP
