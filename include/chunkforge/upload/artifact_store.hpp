#ifndef CHUNKFORGE_ARTIFACT_STORE_HPP
#define CHUNKFORGE_ARTIFACT_STORE_HPP

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkforge {

/// Metadata of a completed artifact.
struct ArtifactInfo {
  std::string name;
  std::uint64_t size = 0;
  std::string createTime; ///< ISO-8601 UTC, millisecond precision.
};

/**
 * @brief Flat directory of completed artifacts keyed by file name.
 */
class ArtifactStore {
public:
  explicit ArtifactStore(std::filesystem::path root);

  /** Make sure the directory exists. @throw UploadException (Storage) */
  void ensureRoot() const;

  /**
   * @brief Look up an artifact by name.
   * @return std::nullopt if no regular file of that name exists.
   * @throw UploadException (Validation) For an unsafe name.
   */
  std::optional<ArtifactInfo> stat(const std::string &fileName) const;

  /**
   * @brief List every completed artifact, sorted by name.
   *
   * Merge staging files are not reported.
   *
   * @throw UploadException (Storage) If the directory cannot be read.
   */
  std::vector<ArtifactInfo> list() const;

  std::filesystem::path pathFor(const std::string &fileName) const;

  /** Public reference handed back to clients, e.g. "/uploads/a.bin". */
  static std::string urlFor(const std::string &fileName);

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

/**
 * @brief Birth time of @p path as ISO-8601 UTC, falling back to the
 *        modification time where the filesystem has no birth time.
 */
std::string fileCreateTime(const std::filesystem::path &path);

} // namespace chunkforge

#endif // CHUNKFORGE_ARTIFACT_STORE_HPP
