#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace trigraph {

// ═══════════════════════════════════════════════════════════════════════════
// Error taxonomy
// ═══════════════════════════════════════════════════════════════════════════

enum class ErrorCode {
  Format,                ///< Bad magic, version, checksum or truncated entry
  Storage,               ///< Underlying I/O or mapping failure
  ReadOnly,              ///< Write through a read-only provider or store
  NotFound,              ///< Id absent, soft-deleted, or path missing
  InvalidArgument,       ///< Oversized type name / payload, bad endpoint
  UnregisteredOperation, ///< Metadata names an op with no registered handler
  ClosedTransaction,     ///< Transaction already committed or rolled back
  InconsistentState,     ///< Store violates a structural invariant on open
  NoPath,                ///< Decision traversal found no accepting edge
  OperationFailed        ///< A registered op reported failure
};

const char *to_string(ErrorCode code) noexcept;

struct Error {
  ErrorCode code;
  std::string message;

  /// "<code>: <message>", for logs and test diagnostics.
  std::string describe() const;
};

template <typename T> using Result = std::expected<T, Error>;
using Status = std::expected<void, Error>;

inline std::unexpected<Error> fail(ErrorCode code, std::string message) {
  return std::unexpected(Error{code, std::move(message)});
}

/// Prepends context to an error travelling up the stack.
inline std::unexpected<Error> fail(const Error &cause, std::string_view context) {
  return std::unexpected(
      Error{cause.code, std::string(context) + ": " + cause.message});
}

} // namespace trigraph
