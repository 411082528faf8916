#include "pdftrans/Errors.hpp"

namespace pdftrans {

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::ConfigurationError:
    return "ConfigurationError";
  case ErrorKind::InputError:
    return "InputError";
  case ErrorKind::ExtractionEmptyError:
    return "ExtractionEmptyError";
  case ErrorKind::PageExtractionError:
    return "PageExtractionError";
  case ErrorKind::TranslationServiceError:
    return "TranslationServiceError";
  case ErrorKind::CancelledError:
    return "CancelledError";
  }
  return "Unknown";
}

int exitCodeFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return 0;
  case ErrorKind::ConfigurationError:
    return 2;
  case ErrorKind::InputError:
    return 3;
  case ErrorKind::ExtractionEmptyError:
    return 4;
  case ErrorKind::PageExtractionError:
    return 5;
  case ErrorKind::TranslationServiceError:
    return 6;
  case ErrorKind::CancelledError:
    return 7;
  }
  return 1;
}

} // namespace pdftrans
