#ifndef CHUNKFORGE_CHUNK_STORE_HPP
#define CHUNKFORGE_CHUNK_STORE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunkforge {

/**
 * @brief Check that @p value can be used as a single path component.
 *
 * Rejects empty strings, ".", "..", anything with a separator or NUL, and
 * names starting with '.' (reserved for staging files).
 */
bool isSafePathComponent(const std::string &value);

/**
 * @brief Throw ValidationError unless @p value is a safe path component.
 * @param field Field name used in the error message.
 */
void requireSafePathComponent(const std::string &value,
                              const std::string &field);

/**
 * @brief Parse the ordering index from the leading decimal segment of a
 *        chunk key, e.g. 12 for "12-ab34".
 * @return std::nullopt if the key does not start with a digit or the value
 *         overflows 64 bits.
 */
std::optional<std::uint64_t> parseChunkIndex(const std::string &chunkKey);

/**
 * @brief fsync the file at @p path so its contents survive a crash.
 * @throw UploadException (Storage) If the file cannot be opened or synced.
 */
void syncFileToDisk(const std::filesystem::path &path);

/**
 * @brief Disk-backed staging area for uploaded chunks.
 *
 * Layout is one directory per fileHash under the root, holding one file per
 * chunk key. Writes for distinct keys never touch shared state, so no lock
 * is taken; rewriting a key replaces the previous bytes atomically.
 */
class ChunkStore {
public:
  explicit ChunkStore(std::filesystem::path root);

  /**
   * @brief Store the bytes of one chunk.
   *
   * The upload container is created on first use. Bytes are staged in a
   * hidden fixed-length sibling file, synced to disk and renamed into place,
   * so a failed write leaves any previous version of the slot intact.
   *
   * @throw UploadException (Validation) For unsafe identifiers or a key
   *        without a numeric prefix.
   * @throw UploadException (Storage) If the bytes cannot be persisted.
   */
  void putChunk(const std::string &fileHash, const std::string &chunkKey,
                std::string_view bytes);

  /**
   * @brief Enumerate the chunk keys stored for an upload, in lexical order.
   *
   * Staging files are never reported.
   *
   * @throw UploadException (NotFound) If no container exists for fileHash.
   * @throw UploadException (Storage) If the container cannot be read.
   */
  std::vector<std::string> listChunks(const std::string &fileHash) const;

  /** True if a container exists for @p fileHash. */
  bool hasUpload(const std::string &fileHash) const;

  /**
   * @brief Delete one chunk slot.
   * @return false if the slot was already gone.
   * @throw UploadException (Storage) If the slot exists but cannot be deleted.
   */
  bool removeChunk(const std::string &fileHash, const std::string &chunkKey);

  /**
   * @brief Best-effort removal of an upload container.
   *
   * When @p orphanCutoff is set, leftover entries last written at or before
   * the cutoff are deleted first; newer entries belong to a fresh upload
   * and are kept, which leaves the directory in place. Failures are logged
   * and reported through the return value only.
   *
   * @return true if the container no longer exists.
   */
  bool removeContainer(
      const std::string &fileHash,
      std::optional<std::filesystem::file_time_type> orphanCutoff =
          std::nullopt) noexcept;

  std::filesystem::path containerPath(const std::string &fileHash) const;
  std::filesystem::path chunkPath(const std::string &fileHash,
                                  const std::string &chunkKey) const;

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
  std::atomic<std::uint64_t> stagingCounter_{0};
};

} // namespace chunkforge

#endif // CHUNKFORGE_CHUNK_STORE_HPP
