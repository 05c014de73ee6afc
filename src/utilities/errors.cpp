#include "chunkforge/utilities/errors.h"
#include "chunkforge/utilities/logger.h"

#include <iostream>

namespace chunkforge {

std::string ErrorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
    return "ValidationError";
  case ErrorKind::NotFound:
    return "NotFoundError";
  case ErrorKind::NoChunks:
    return "NoChunksError";
  case ErrorKind::MergeInProgress:
    return "MergeInProgressError";
  case ErrorKind::Storage:
    return "StorageError";
  case ErrorKind::Io:
    return "IoError";
  }
  return "UnknownError";
}

int HttpStatusFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
  case ErrorKind::NoChunks:
    return 400;
  case ErrorKind::NotFound:
    return 404;
  case ErrorKind::MergeInProgress:
    return 409;
  case ErrorKind::Storage:
  case ErrorKind::Io:
    return 500;
  }
  return 500;
}

void ThrowUploadException(ErrorKind kind, const std::string &message) {
  std::string msg = ErrorKindToString(kind) + ": " + message;
  LogLevel level =
      (kind == ErrorKind::Validation || kind == ErrorKind::NotFound)
          ? LogLevel::WARN
          : LogLevel::ERROR;
  try {
    Logger::getInstance().log(level, msg);
  } catch (const std::exception &e) {
    std::cerr << "Logger unavailable. Original error: " << msg
              << " Logger error: " << e.what() << std::endl;
  }
  throw UploadException(kind, message);
}

} // namespace chunkforge
