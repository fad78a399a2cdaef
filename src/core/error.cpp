#include "core/error.hpp"

namespace dsb {

const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NOT_FOUND: return "Not found";
    case ErrorKind::MANIFEST_NOT_FOUND: return "Manifest not found";
    case ErrorKind::CHUNK_INTEGRITY_MISMATCH: return "Chunk integrity mismatch";
    case ErrorKind::SIZE_MISMATCH: return "Size mismatch";
    case ErrorKind::CONTENT_INTEGRITY_MISMATCH: return "Content integrity mismatch";
    case ErrorKind::INCONSISTENT_MANIFEST: return "Inconsistent manifest";
    case ErrorKind::SIGNATURE_INVALID: return "Signature invalid";
    case ErrorKind::CHAIN_LINKAGE_BROKEN: return "Chain linkage broken";
    case ErrorKind::INVALID_ARGUMENT: return "Invalid argument";
    case ErrorKind::UNAVAILABLE: return "Backend unavailable";
    case ErrorKind::TIMEOUT: return "Timeout";
    case ErrorKind::IO: return "I/O error";
    default: return "Undefined error";
  }
}

//==============================================
// CONSTRUCTORS
//==============================================

Error::Error(ErrorKind kind, const std::string& message, const std::string& subject)
  : std::runtime_error(message)
  , kind_(kind)
  , subject_(subject) {}

Error::Error(ErrorKind kind, const std::string& message, const std::string& subject,
             std::exception_ptr cause)
  : std::runtime_error(compose(message, cause))
  , kind_(kind)
  , subject_(subject)
  , cause_(cause) {}

Error Error::wrap_current(ErrorKind kind, const std::string& context, const std::string& subject) {
  return Error(kind, context, subject, std::current_exception());
}

bool Error::is_retryable() const noexcept {
  return kind_ == ErrorKind::UNAVAILABLE
      || kind_ == ErrorKind::TIMEOUT
      || kind_ == ErrorKind::IO;
}

// "failed to X: <inner error>"
std::string Error::compose(const std::string& message, const std::exception_ptr& cause) {
  if (!cause) {
    return message;
  }
  try {
    std::rethrow_exception(cause);
  } catch (const std::exception& e) {
    return message + ": " + e.what();
  } catch (...) {
    return message + ": unknown error";
  }
}

} // namespace dsb
