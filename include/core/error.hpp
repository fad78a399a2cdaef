#ifndef DSB_CORE_ERROR_HPP
#define DSB_CORE_ERROR_HPP

#include <exception>
#include <stdexcept>
#include <string>

namespace dsb {

enum class ErrorKind {
  NOT_FOUND = 0,
  MANIFEST_NOT_FOUND,
  CHUNK_INTEGRITY_MISMATCH,
  SIZE_MISMATCH,
  CONTENT_INTEGRITY_MISMATCH,
  INCONSISTENT_MANIFEST,
  SIGNATURE_INVALID,
  CHAIN_LINKAGE_BROKEN,
  INVALID_ARGUMENT,
  UNAVAILABLE,
  TIMEOUT,
  IO
};

const char* error_kind_to_string(ErrorKind kind);

// Typed failure carrying a machine-checkable kind, the identifier it concerns
// (chunk id, manifest id, block index) and an optional chained cause.
class Error : public std::runtime_error {
public:
  // ---- CONSTRUCTORS ----
  Error(ErrorKind kind, const std::string& message, const std::string& subject = "");
  Error(ErrorKind kind, const std::string& message, const std::string& subject,
        std::exception_ptr cause);

  // Wraps the exception currently being handled as the cause
  static Error wrap_current(ErrorKind kind, const std::string& context,
                            const std::string& subject = "");


  // ---- GETTERS ----
  ErrorKind kind() const noexcept { return kind_; }
  const std::string& subject() const noexcept { return subject_; }
  std::exception_ptr cause() const noexcept { return cause_; }

  // Transient backend failures are the only class a caller may retry
  bool is_retryable() const noexcept;

private:
  ErrorKind kind_;
  std::string subject_;
  std::exception_ptr cause_;

  static std::string compose(const std::string& message, const std::exception_ptr& cause);
};

// Returns true if the error is of the given kind
inline bool is_kind(const Error& error, ErrorKind kind) {
  return error.kind() == kind;
}

} // namespace dsb

#endif // DSB_CORE_ERROR_HPP
