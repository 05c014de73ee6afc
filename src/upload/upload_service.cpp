#include "chunkforge/upload/upload_service.hpp"
#include "chunkforge/utilities/errors.h"
#include "chunkforge/utilities/logger.h"

#include <filesystem>

namespace chunkforge {

UploadService::UploadService(const ServerConfig &config)
    : maxChunkBytes_(config.maxChunkBytes), chunks_(config.chunksDir),
      artifacts_(config.uploadDir), verifier_(config.hashAlgorithm),
      dedup_(artifacts_, verifier_),
      coordinator_(chunks_, artifacts_, scheduler_, config.cleanupDelay) {}

UploadService::~UploadService() { stop(); }

void UploadService::start() {
  artifacts_.ensureRoot();
  std::error_code ec;
  std::filesystem::create_directories(chunks_.root(), ec);
  if (ec) {
    ThrowUploadException(ErrorKind::Storage,
                         "Cannot create chunk directory " +
                             chunks_.root().string() + ": " + ec.message());
  }
  scheduler_.start();
  Logger::getInstance().log(LogLevel::INFO,
                            "Upload directory: " + artifacts_.root().string() +
                                ", chunk directory: " +
                                chunks_.root().string() + ", digest: " +
                                HashAlgorithmToString(verifier_.algorithm()));
}

void UploadService::stop() { scheduler_.stop(); }

void UploadService::requireField(const std::string &value,
                                 const std::string &name) {
  if (value.empty()) {
    ThrowUploadException(ErrorKind::Validation,
                         "Missing required field " + name);
  }
}

DedupResult UploadService::checkExisting(const std::string &fileHash,
                                         const std::string &fileName,
                                         std::optional<std::uint64_t> size) {
  requireField(fileHash, "fileHash");
  requireField(fileName, "fileName");
  requireSafePathComponent(fileName, "fileName");
  // Without a declared size there is nothing to compare against.
  if (!size) {
    return DedupResult{};
  }
  return dedup_.exists(fileName, *size);
}

void UploadService::uploadChunk(const std::string &fileHash,
                                const std::string &chunkKey,
                                std::string_view bytes) {
  requireField(fileHash, "fileHash");
  requireField(chunkKey, "hash");
  if (bytes.size() > maxChunkBytes_) {
    ThrowUploadException(ErrorKind::Validation,
                         "Chunk " + chunkKey + " exceeds " +
                             std::to_string(maxChunkBytes_) + " bytes");
  }
  chunks_.putChunk(fileHash, chunkKey, bytes);
}

MergeResult UploadService::merge(const std::string &fileHash,
                                 const std::string &fileName,
                                 std::optional<std::uint64_t> size) {
  requireField(fileHash, "fileHash");
  requireField(fileName, "fileName");
  return coordinator_.merge(fileHash, fileName, size);
}

VerifyResult UploadService::verify(const std::string &fileHash,
                                   const std::string &fileName) {
  requireField(fileHash, "fileHash");
  requireField(fileName, "fileName");
  return dedup_.verify(fileHash, fileName);
}

std::vector<ArtifactInfo> UploadService::listArtifacts() const {
  return artifacts_.list();
}

} // namespace chunkforge
