#ifndef PDFTRANS_ERRORS_HPP
#define PDFTRANS_ERRORS_HPP

#include <string>

namespace pdftrans {

/**
 * @brief Kind of failure reported by a pipeline stage
 *
 * Every result struct carries one of these next to its error message so the
 * caller can react to the kind of failure without parsing text.
 */
enum class ErrorKind {
  None,                    ///< No error
  ConfigurationError,      ///< Invalid parameter, rejected before any work
  InputError,              ///< Document cannot be opened or has no pages
  ExtractionEmptyError,    ///< No text found anywhere, even with OCR
  PageExtractionError,     ///< A page failed and page isolation is disabled
  TranslationServiceError, ///< The translation service failed on a chunk
  CancelledError           ///< Cancelled or past the request deadline
};

/**
 * @brief Short stable name of an error kind (e.g. "InputError")
 */
const char *errorKindName(ErrorKind kind);

/**
 * @brief Process exit status used by the command-line front end
 */
int exitCodeFor(ErrorKind kind);

} // namespace pdftrans

#endif // PDFTRANS_ERRORS_HPP
