#pragma once
#ifndef CHUNKFORGE_ERRORS_H
#define CHUNKFORGE_ERRORS_H

#include <stdexcept>
#include <string>

namespace chunkforge {

/// Machine-readable failure categories surfaced to callers.
enum class ErrorKind {
  Validation,      ///< Missing or malformed input, rejected before storage.
  NotFound,        ///< Referenced upload, chunk set or artifact is absent.
  NoChunks,        ///< Merge requested with zero stored chunks.
  MergeInProgress, ///< A merge for the same fileHash is already running.
  Storage,         ///< Disk I/O failure on read, write or delete.
  Io               ///< Stream read failure while digesting.
};

std::string ErrorKindToString(ErrorKind kind);

/// HTTP status code a front end should answer with for @p kind.
int HttpStatusFor(ErrorKind kind);

/**
 * @brief Exception type for every failure of the upload engine.
 */
class UploadException : public std::runtime_error {
public:
  UploadException(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind GetErrorKind() const { return kind_; }

private:
  ErrorKind kind_;
};

/**
 * @brief Log @p message at ERROR level and throw an UploadException.
 *
 * Client-side kinds (Validation, NotFound) are logged at WARN instead.
 */
[[noreturn]] void ThrowUploadException(ErrorKind kind,
                                       const std::string &message);

} // namespace chunkforge

#endif // CHUNKFORGE_ERRORS_H
