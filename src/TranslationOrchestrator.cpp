#include "pdftrans/TranslationOrchestrator.hpp"

#include "pdftrans/CancellationToken.hpp"
#include "pdftrans/Chunker.hpp"
#include "pdftrans/TextUtils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace pdftrans {

namespace {

// Sleep in short slices so a cancelled request does not wait out the backoff
void waitBeforeRetry(int milliseconds, const CancellationToken *cancel) {
  const auto slice = std::chrono::milliseconds(50);
  auto remaining = std::chrono::milliseconds(milliseconds);
  while (remaining.count() > 0) {
    if (cancel && cancel->isCancelled()) {
      return;
    }
    auto step = std::min(slice, remaining);
    std::this_thread::sleep_for(step);
    remaining -= step;
  }
}

std::string cancelMessage(const CancellationToken *cancel) {
  return cancel && cancel->deadlineExpired() ? "Deadline exceeded"
                                             : "Translation cancelled";
}

} // anonymous namespace

TranslationOrchestrator::TranslationOrchestrator(ITranslator &translator,
                                                 OrchestratorOptions options)
    : m_translator(translator), m_options(std::move(options)) {}

TranslationResult
TranslationOrchestrator::translate(const std::string &text,
                                   const std::string &targetLanguage,
                                   const CancellationToken *cancel) {
  TranslationResult result;

  if (text.empty()) {
    result.success = true;
    return result;
  }

  std::vector<std::string> chunks;
  try {
    chunks = chunkText(text, m_options.maxChunkLength);
  } catch (const std::invalid_argument &e) {
    result.errorKind = ErrorKind::ConfigurationError;
    result.errorMessage = e.what();
    return result;
  }

  if (m_options.verbose) {
    std::cerr << "DEBUG: Split " << text::codePointLength(text)
              << " characters into " << chunks.size() << " chunks (max "
              << m_options.maxChunkLength << ")" << std::endl;
  }

  return translateChunks(chunks, targetLanguage, cancel);
}

TranslationResult TranslationOrchestrator::translateChunks(
    const std::vector<std::string> &chunks, const std::string &targetLanguage,
    const CancellationToken *cancel) {
  TranslationResult result;
  result.success = false;
  result.chunkCount = static_cast<int>(chunks.size());

  auto startTime = std::chrono::high_resolution_clock::now();

  std::vector<std::string> translated(chunks.size());
  std::atomic<std::size_t> nextIndex{0};
  std::atomic<bool> failed{false};
  std::atomic<int> requestCount{0};

  // The failure with the lowest chunk index is reported
  std::mutex failureMutex;
  std::size_t failedIndex = std::numeric_limits<std::size_t>::max();
  ErrorKind failureKind = ErrorKind::None;
  std::string failureMessage;

  auto recordFailure = [&](std::size_t index, ErrorKind kind,
                           const std::string &message) {
    std::lock_guard<std::mutex> lock(failureMutex);
    if (index < failedIndex) {
      failedIndex = index;
      failureKind = kind;
      failureMessage = message;
    }
    failed.store(true);
  };

  auto worker = [&]() {
    while (!failed.load()) {
      const std::size_t index = nextIndex.fetch_add(1);
      if (index >= chunks.size()) {
        return;
      }

      if (cancel && cancel->isCancelled()) {
        recordFailure(index, ErrorKind::CancelledError, cancelMessage(cancel));
        return;
      }

      int requests = 0;
      TranslationResponse response;
      try {
        response = translateWithRetry(chunks[index], index, targetLanguage,
                                      cancel, requests);
      } catch (const std::exception &e) {
        response = TranslationResponse();
        response.errorMessage = e.what();
      }
      requestCount.fetch_add(requests);

      if (!response.success) {
        if (cancel && cancel->isCancelled()) {
          recordFailure(index, ErrorKind::CancelledError,
                        cancelMessage(cancel));
        } else {
          recordFailure(index, ErrorKind::TranslationServiceError,
                        "Translation failed on chunk " +
                            std::to_string(index + 1) + " of " +
                            std::to_string(chunks.size()) + ": " +
                            response.errorMessage);
        }
        return;
      }

      translated[index] = std::move(response.text);
    }
  };

  const std::size_t workerCount = std::min<std::size_t>(
      static_cast<std::size_t>(std::max(1, m_options.maxConcurrentRequests)),
      chunks.size());

  if (workerCount <= 1) {
    worker();
  } else {
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i) {
      workers.emplace_back(worker);
    }
    for (auto &thread : workers) {
      thread.join();
    }
  }

  result.requestCount = requestCount.load();

  if (failed.load()) {
    result.errorKind = failureKind;
    result.errorMessage = failureMessage;
  } else {
    result.text = text::join(translated, kParagraphSeparator);
    result.success = true;
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

TranslationResponse TranslationOrchestrator::translateWithRetry(
    const std::string &chunk, std::size_t index,
    const std::string &targetLanguage, const CancellationToken *cancel,
    int &requests) {
  TranslationResponse response;

  for (int attempt = 0;; ++attempt) {
    if (attempt > 0) {
      waitBeforeRetry(m_options.retryBackoffMs * attempt, cancel);
      if (cancel && cancel->isCancelled()) {
        return response;
      }
    }

    ++requests;
    response = m_translator.translate(chunk, m_options.sourceLanguage,
                                      targetLanguage, cancel);

    if (response.success) {
      if (m_options.verbose) {
        std::cerr << "DEBUG: Chunk " << (index + 1) << " translated by "
                  << m_translator.name() << " ("
                  << text::codePointLength(chunk) << " -> "
                  << text::codePointLength(response.text) << " characters)"
                  << std::endl;
      }
      return response;
    }

    if (!response.retryable || attempt >= m_options.maxRetries ||
        (cancel && cancel->isCancelled())) {
      return response;
    }

    std::cerr << "WARNING: Chunk " << (index + 1) << " failed (attempt "
              << (attempt + 1) << " of " << (m_options.maxRetries + 1)
              << "): " << response.errorMessage << ", retrying" << std::endl;
  }
}

} // namespace pdftrans
