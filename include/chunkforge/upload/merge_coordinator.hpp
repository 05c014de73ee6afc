#ifndef CHUNKFORGE_MERGE_COORDINATOR_HPP
#define CHUNKFORGE_MERGE_COORDINATOR_HPP

#include "chunkforge/upload/artifact_store.hpp"
#include "chunkforge/upload/chunk_store.hpp"
#include "chunkforge/upload/cleanup_scheduler.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_set>
#include <vector>

namespace chunkforge {

/**
 * @brief Per-fileHash mutual exclusion for merges.
 *
 * Only active merges are tracked; an entry disappears as soon as its merge
 * finishes, so the set never grows past the number of merges in flight.
 */
class MergeLockTable {
public:
  /// Claim @p fileHash. @return false if a merge already holds it.
  bool tryAcquire(const std::string &fileHash);
  void release(const std::string &fileHash);
  bool isActive(const std::string &fileHash) const;
  std::size_t activeCount() const;

  /// RAII holder that releases the claim on destruction.
  class Guard {
  public:
    Guard(MergeLockTable &table, std::string fileHash)
        : table_(table), fileHash_(std::move(fileHash)) {}
    ~Guard() { table_.release(fileHash_); }
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;

  private:
    MergeLockTable &table_;
    std::string fileHash_;
  };

private:
  mutable std::mutex mtx_;
  std::unordered_set<std::string> active_;
};

struct MergeResult {
  std::string url;               ///< Public artifact reference.
  std::filesystem::path path;    ///< Location on disk.
  std::uint64_t bytesWritten = 0;
  std::size_t chunkCount = 0;
};

/**
 * @brief Reassembles the chunks of one upload into its final artifact.
 *
 * The artifact is written to a hidden staging file in the artifact
 * directory and renamed into place only once complete, so readers never see
 * a partial artifact. Chunks are deleted only after that rename; a merge
 * that fails for any reason leaves every chunk in place and can be retried.
 */
class MergeCoordinator {
public:
  /// Invoked after each chunk is appended, with the running chunk count.
  using ProgressHook =
      std::function<void(const std::string &fileHash, std::size_t written)>;

  static constexpr std::size_t kCopyBufferSize = 64 * 1024;
  /// Subtracted from the merge completion time to form the orphan cutoff.
  static constexpr std::chrono::milliseconds kOrphanCutoffMargin{50};

  MergeCoordinator(ChunkStore &chunks, const ArtifactStore &artifacts,
                   CleanupScheduler &scheduler,
                   std::chrono::milliseconds cleanupDelay =
                       std::chrono::milliseconds(1000));

  /**
   * @brief Merge every stored chunk of @p fileHash into @p fileName.
   *
   * @param declaredSize When set, the assembled byte count must match it.
   * @throw UploadException (Validation) Unsafe names or a size mismatch.
   * @throw UploadException (MergeInProgress) Another merge holds fileHash.
   * @throw UploadException (NoChunks) Nothing is stored for fileHash.
   * @throw UploadException (Storage) Reading chunks or writing the artifact
   *        failed.
   */
  MergeResult merge(const std::string &fileHash, const std::string &fileName,
                    std::optional<std::uint64_t> declaredSize = std::nullopt);

  bool isMerging(const std::string &fileHash) const {
    return locks_.isActive(fileHash);
  }

  void setProgressHook(ProgressHook hook) { progressHook_ = std::move(hook); }

  /**
   * @brief Order chunk keys by their numeric prefix.
   *
   * Keys sharing a prefix are ordered lexically among themselves. Keys
   * without a numeric prefix are dropped.
   */
  static std::vector<std::string> orderChunkKeys(std::vector<std::string> keys);

private:
  MergeResult mergeLocked(const std::string &fileHash,
                          const std::string &fileName,
                          std::optional<std::uint64_t> declaredSize);
  std::uint64_t appendChunk(std::ostream &out, const std::string &fileHash,
                            const std::string &chunkKey,
                            std::vector<char> &buffer);
  void discardChunks(const std::string &fileHash,
                     const std::vector<std::string> &keys);

  ChunkStore &chunks_;
  const ArtifactStore &artifacts_;
  CleanupScheduler &scheduler_;
  std::chrono::milliseconds cleanupDelay_;
  MergeLockTable locks_;
  ProgressHook progressHook_;
  std::atomic<std::uint64_t> stagingCounter_{0};
};

} // namespace chunkforge

#endif // CHUNKFORGE_MERGE_COORDINATOR_HPP
