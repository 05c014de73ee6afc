#ifndef CHUNKFORGE_UPLOAD_SERVICE_HPP
#define CHUNKFORGE_UPLOAD_SERVICE_HPP

#include "chunkforge/upload/artifact_store.hpp"
#include "chunkforge/upload/chunk_store.hpp"
#include "chunkforge/upload/cleanup_scheduler.hpp"
#include "chunkforge/upload/dedup_index.hpp"
#include "chunkforge/upload/hash_verifier.hpp"
#include "chunkforge/upload/merge_coordinator.hpp"
#include "chunkforge/utilities/config.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunkforge {

/**
 * @brief The five logical operations offered to the HTTP front end.
 *
 * Owns the storage components and wires them together. Required fields are
 * checked here so that no storage call ever sees a malformed request.
 */
class UploadService {
public:
  explicit UploadService(const ServerConfig &config);
  ~UploadService();

  UploadService(const UploadService &) = delete;
  UploadService &operator=(const UploadService &) = delete;

  /** Create storage directories and start background cleanup. */
  void start();
  /** Run outstanding cleanup and stop the background thread. */
  void stop();

  DedupResult checkExisting(const std::string &fileHash,
                            const std::string &fileName,
                            std::optional<std::uint64_t> size);

  void uploadChunk(const std::string &fileHash, const std::string &chunkKey,
                   std::string_view bytes);

  MergeResult merge(const std::string &fileHash, const std::string &fileName,
                    std::optional<std::uint64_t> size);

  VerifyResult verify(const std::string &fileHash, const std::string &fileName);

  std::vector<ArtifactInfo> listArtifacts() const;

  ChunkStore &chunks() { return chunks_; }
  MergeCoordinator &coordinator() { return coordinator_; }
  CleanupScheduler &scheduler() { return scheduler_; }
  std::size_t maxChunkBytes() const { return maxChunkBytes_; }

private:
  static void requireField(const std::string &value, const std::string &name);

  std::size_t maxChunkBytes_;
  ChunkStore chunks_;
  ArtifactStore artifacts_;
  HashVerifier verifier_;
  DedupIndex dedup_;
  CleanupScheduler scheduler_;
  MergeCoordinator coordinator_;
};

} // namespace chunkforge

#endif // CHUNKFORGE_UPLOAD_SERVICE_HPP
