#ifndef CHUNKFORGE_HASH_VERIFIER_HPP
#define CHUNKFORGE_HASH_VERIFIER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <openssl/evp.h>
#include <sodium.h>
#include <string>

namespace chunkforge {

/// Supported content digests.
enum class HashAlgorithm { MD5, SHA256 };

/**
 * @brief Parse "md5" or "sha256" (case-insensitive).
 * @throw std::invalid_argument For any other name.
 */
HashAlgorithm parseHashAlgorithm(const std::string &name);
std::string HashAlgorithmToString(HashAlgorithm algo);

/**
 * @brief Incremental digest over a byte stream.
 *
 * MD5 goes through OpenSSL EVP, SHA-256 through libsodium. The object can be
 * finalized exactly once.
 */
class StreamingDigest {
public:
  explicit StreamingDigest(HashAlgorithm algo);

  StreamingDigest(const StreamingDigest &) = delete;
  StreamingDigest &operator=(const StreamingDigest &) = delete;

  void update(const char *data, std::size_t size);

  /**
   * @brief Finish the digest and return it as lowercase hex.
   * @throw std::logic_error If called twice.
   */
  std::string finalizeHex();

private:
  struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
  };

  HashAlgorithm algo_;
  std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter> evp_ctx_;
  crypto_hash_sha256_state sha_state_;
  bool finalized_ = false;
};

/**
 * @brief Computes content digests of artifacts without loading them whole.
 *
 * Data is folded in fixed-size blocks. A read that fails or stops short of
 * the expected length raises IoError; no digest is ever returned for a
 * truncated stream.
 */
class HashVerifier {
public:
  static constexpr std::size_t kDefaultBufferSize = 64 * 1024;

  explicit HashVerifier(HashAlgorithm algo = HashAlgorithm::MD5,
                        std::size_t bufferSize = kDefaultBufferSize);

  /**
   * @brief Digest the full contents of a file.
   * @throw UploadException (Io) If the file cannot be opened or read to the
   *        size it had when digesting began.
   */
  std::string digestFile(const std::filesystem::path &path) const;

  /**
   * @brief Digest everything remaining in @p in.
   * @throw UploadException (Io) If the stream reports an error before EOF.
   */
  std::string digestStream(std::istream &in) const;

  HashAlgorithm algorithm() const { return algo_; }

private:
  std::uint64_t fold(std::istream &in, StreamingDigest &digest,
                     const std::string &source) const;

  HashAlgorithm algo_;
  std::size_t bufferSize_;
};

} // namespace chunkforge

#endif // CHUNKFORGE_HASH_VERIFIER_HPP
