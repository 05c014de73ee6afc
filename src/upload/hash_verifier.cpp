#include "chunkforge/upload/hash_verifier.hpp"
#include "chunkforge/utilities/errors.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chunkforge {

HashAlgorithm parseHashAlgorithm(const std::string &name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "md5")
    return HashAlgorithm::MD5;
  if (lower == "sha256" || lower == "sha-256")
    return HashAlgorithm::SHA256;
  throw std::invalid_argument("Unsupported hash algorithm: " + name);
}

std::string HashAlgorithmToString(HashAlgorithm algo) {
  return algo == HashAlgorithm::MD5 ? "md5" : "sha256";
}

static std::string toHex(const unsigned char *data, std::size_t len) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::setw(2) << static_cast<unsigned int>(data[i]);
  }
  return oss.str();
}

StreamingDigest::StreamingDigest(HashAlgorithm algo) : algo_(algo) {
  if (algo_ == HashAlgorithm::MD5) {
    evp_ctx_.reset(EVP_MD_CTX_new());
    if (!evp_ctx_ || EVP_DigestInit_ex(evp_ctx_.get(), EVP_md5(), nullptr) != 1) {
      throw std::runtime_error("Failed to initialize MD5 digest");
    }
  } else {
    // sodium_init() returns -1 on error, 0 on success, 1 if already
    // initialized.
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
    crypto_hash_sha256_init(&sha_state_);
  }
}

void StreamingDigest::update(const char *data, std::size_t size) {
  if (finalized_) {
    throw std::logic_error("Cannot update a finalized digest");
  }
  if (!data || size == 0) {
    return;
  }
  if (algo_ == HashAlgorithm::MD5) {
    if (EVP_DigestUpdate(evp_ctx_.get(), data, size) != 1) {
      throw std::runtime_error("MD5 update failed");
    }
  } else {
    crypto_hash_sha256_update(
        &sha_state_, reinterpret_cast<const unsigned char *>(data), size);
  }
}

std::string StreamingDigest::finalizeHex() {
  if (finalized_) {
    throw std::logic_error("finalizeHex() already called");
  }
  finalized_ = true;
  if (algo_ == HashAlgorithm::MD5) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(evp_ctx_.get(), out.data(), &len) != 1) {
      throw std::runtime_error("MD5 finalization failed");
    }
    return toHex(out.data(), len);
  }
  std::array<unsigned char, crypto_hash_sha256_BYTES> out{};
  crypto_hash_sha256_final(&sha_state_, out.data());
  return toHex(out.data(), out.size());
}

HashVerifier::HashVerifier(HashAlgorithm algo, std::size_t bufferSize)
    : algo_(algo), bufferSize_(bufferSize == 0 ? kDefaultBufferSize : bufferSize) {}

std::uint64_t HashVerifier::fold(std::istream &in, StreamingDigest &digest,
                                 const std::string &source) const {
  std::vector<char> buffer(bufferSize_);
  std::uint64_t total = 0;
  try {
    while (in) {
      in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      std::streamsize got = in.gcount();
      if (in.bad()) {
        break;
      }
      if (got > 0) {
        digest.update(buffer.data(), static_cast<std::size_t>(got));
        total += static_cast<std::uint64_t>(got);
      }
    }
  } catch (const std::ios_base::failure &e) {
    ThrowUploadException(ErrorKind::Io,
                         "Read failure while digesting " + source + ": " +
                             e.what());
  }
  // A clean end of data sets eofbit; anything else means the read broke off.
  if (in.bad() || !in.eof()) {
    ThrowUploadException(ErrorKind::Io, "Read failure while digesting " +
                                            source + " after " +
                                            std::to_string(total) + " bytes");
  }
  return total;
}

std::string HashVerifier::digestStream(std::istream &in) const {
  StreamingDigest digest(algo_);
  fold(in, digest, "stream");
  return digest.finalizeHex();
}

std::string HashVerifier::digestFile(const std::filesystem::path &path) const {
  std::error_code ec;
  const std::uintmax_t expected = std::filesystem::file_size(path, ec);
  if (ec) {
    ThrowUploadException(ErrorKind::Io, "Cannot stat " + path.string() + ": " +
                                            ec.message());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    ThrowUploadException(ErrorKind::Io, "Cannot open " + path.string());
  }
  StreamingDigest digest(algo_);
  std::uint64_t total = fold(in, digest, path.string());
  if (total != expected) {
    ThrowUploadException(ErrorKind::Io,
                         "Short read on " + path.string() + ": expected " +
                             std::to_string(expected) + " bytes, read " +
                             std::to_string(total));
  }
  return digest.finalizeHex();
}

} // namespace chunkforge
