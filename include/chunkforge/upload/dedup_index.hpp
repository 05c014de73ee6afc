#ifndef CHUNKFORGE_DEDUP_INDEX_HPP
#define CHUNKFORGE_DEDUP_INDEX_HPP

#include "chunkforge/upload/artifact_store.hpp"
#include "chunkforge/upload/hash_verifier.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace chunkforge {

struct DedupResult {
  bool found = false;
  std::optional<ArtifactInfo> metadata;
};

/// Outcome of comparing a declared hash against an artifact's content.
struct VerifyResult {
  bool verified = false;
  std::string expected;
  std::string actual;
};

/**
 * @brief Answers "is this upload already here?" before any chunk moves, and
 *        checks artifact content against a declared hash afterwards.
 */
class DedupIndex {
public:
  DedupIndex(const ArtifactStore &artifacts, const HashVerifier &verifier)
      : artifacts_(artifacts), verifier_(verifier) {}

  /**
   * @brief Name-and-size lookup used for instant upload.
   *
   * Only an exact size match counts; a name reused for different content
   * reports found=false. Content is not hashed here.
   */
  DedupResult exists(const std::string &fileName,
                     std::uint64_t declaredSize) const;

  /**
   * @brief Digest the artifact and compare it with @p declaredHash.
   *
   * A "temp-<digits>-" prefix added by clients before the real hash was
   * known is ignored. A mismatch is a normal result, not an error.
   *
   * @throw UploadException (NotFound) If the artifact does not exist.
   * @throw UploadException (Io) If the artifact cannot be read completely.
   */
  VerifyResult verify(const std::string &declaredHash,
                      const std::string &fileName) const;

private:
  const ArtifactStore &artifacts_;
  const HashVerifier &verifier_;
};

/// Strip a leading "temp-<digits>-" marker and lowercase the remainder.
std::string normalizeDeclaredHash(const std::string &declaredHash);

} // namespace chunkforge

#endif // CHUNKFORGE_DEDUP_INDEX_HPP
