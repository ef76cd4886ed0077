#pragma once

#include <map>
#include <string>
#include <utility>

namespace freya::core {

/// Error categories. The controller does not branch on them; they exist
/// for logging and tests.
enum class ErrorCategory {
  Input,    // Input missing/unreadable/directory, output not creatable
  Format,   // Decoder rejected the container format
  Io,       // Read/write/flush failure mid-stream (disk full included)
  Busy,     // start() rejected while a job is running
  Internal, // Codec allocation failure, runner invariant violation
  Unknown
};

/// Structured error for every job and controller operation.
struct JobError {
  ErrorCategory category = ErrorCategory::Unknown;
  int code = 0;        // errno for OS failures, codec error code otherwise
  std::string message; // Shown verbatim on the status line
  std::map<std::string, std::string> details; // e.g. {"path": "..."}

  JobError() = default;

  JobError(ErrorCategory cat, int c, std::string msg,
           std::map<std::string, std::string> dets = {})
      : category(cat), code(c), message(std::move(msg)),
        details(std::move(dets)) {}

  static JobError Input(std::string msg, int err = 0) {
    return {ErrorCategory::Input, err, std::move(msg)};
  }
  static JobError Format(std::string msg, int err = 0) {
    return {ErrorCategory::Format, err, std::move(msg)};
  }
  static JobError Io(std::string msg, int err = 0) {
    return {ErrorCategory::Io, err, std::move(msg)};
  }
  static JobError Busy(std::string msg = "A job is already running") {
    return {ErrorCategory::Busy, 0, std::move(msg)};
  }
  static JobError Internal(std::string msg) {
    return {ErrorCategory::Internal, 0, std::move(msg)};
  }

  /// Build an error from an errno value: "<what> '<path>': <strerror>".
  static JobError from_errno(ErrorCategory cat, int err,
                             const std::string &what,
                             const std::string &path);
};

inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::Input:
    return "Input";
  case ErrorCategory::Format:
    return "Format";
  case ErrorCategory::Io:
    return "Io";
  case ErrorCategory::Busy:
    return "Busy";
  case ErrorCategory::Internal:
    return "Internal";
  case ErrorCategory::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

} // namespace freya::core
