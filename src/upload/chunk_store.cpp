#include "chunkforge/upload/chunk_store.hpp"
#include "chunkforge/utilities/errors.h"
#include "chunkforge/utilities/logger.h"
#include "chunkforge/utilities/metrics.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <limits>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chunkforge {

bool isSafePathComponent(const std::string &value) {
  if (value.empty() || value.size() > 255)
    return false;
  if (value.front() == '.')
    return false;
  return value.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

void requireSafePathComponent(const std::string &value,
                              const std::string &field) {
  if (value.empty()) {
    ThrowUploadException(ErrorKind::Validation, "Missing required field " + field);
  }
  if (!isSafePathComponent(value)) {
    ThrowUploadException(ErrorKind::Validation,
                         "Field " + field + " is not a valid name: " + value);
  }
}

std::optional<std::uint64_t> parseChunkIndex(const std::string &chunkKey) {
  std::uint64_t value = 0;
  std::size_t i = 0;
  for (; i < chunkKey.size() &&
         std::isdigit(static_cast<unsigned char>(chunkKey[i]));
       ++i) {
    std::uint64_t digit = static_cast<std::uint64_t>(chunkKey[i] - '0');
    if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 + digit;
  }
  if (i == 0)
    return std::nullopt;
  return value;
}

void syncFileToDisk(const fs::path &path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    ThrowUploadException(ErrorKind::Storage, "Cannot open " + path.string() +
                                                 " to sync: " +
                                                 std::strerror(errno));
  }
  int rc = ::fsync(fd);
  int savedErrno = errno;
  ::close(fd);
  if (rc != 0) {
    ThrowUploadException(ErrorKind::Storage, "fsync failed for " +
                                                 path.string() + ": " +
                                                 std::strerror(savedErrno));
  }
}

ChunkStore::ChunkStore(fs::path root) : root_(std::move(root)) {}

fs::path ChunkStore::containerPath(const std::string &fileHash) const {
  return root_ / fileHash;
}

fs::path ChunkStore::chunkPath(const std::string &fileHash,
                               const std::string &chunkKey) const {
  return root_ / fileHash / chunkKey;
}

bool ChunkStore::hasUpload(const std::string &fileHash) const {
  std::error_code ec;
  return isSafePathComponent(fileHash) &&
         fs::is_directory(containerPath(fileHash), ec);
}

void ChunkStore::putChunk(const std::string &fileHash,
                          const std::string &chunkKey, std::string_view bytes) {
  requireSafePathComponent(fileHash, "fileHash");
  requireSafePathComponent(chunkKey, "hash");
  if (!parseChunkIndex(chunkKey)) {
    ThrowUploadException(ErrorKind::Validation,
                         "Chunk key must start with a numeric index: " +
                             chunkKey);
  }

  const fs::path dir = containerPath(fileHash);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    ThrowUploadException(ErrorKind::Storage, "Cannot create chunk directory " +
                                                 dir.string() + ": " +
                                                 ec.message());
  }

  // Unique per writer so two retries of the same key never share a file.
  // The name does not embed the key, which may already be NAME_MAX long.
  const fs::path staging =
      dir / (".part-" + std::to_string(stagingCounter_.fetch_add(1)));
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      ThrowUploadException(ErrorKind::Storage,
                           "Cannot open " + staging.string() + " for writing");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out.good()) {
      out.close();
      fs::remove(staging, ec);
      ThrowUploadException(ErrorKind::Storage,
                           "Write failed for chunk " + chunkKey + " of " +
                               fileHash);
    }
  }
  try {
    syncFileToDisk(staging);
  } catch (const UploadException &) {
    fs::remove(staging, ec);
    throw;
  }

  fs::rename(staging, dir / chunkKey, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(staging, ignored);
    ThrowUploadException(ErrorKind::Storage, "Cannot commit chunk " + chunkKey +
                                                 " of " + fileHash + ": " +
                                                 ec.message());
  }

  MetricsRegistry::instance().incrementCounter("chunkforge_chunks_stored_total");
  MetricsRegistry::instance().incrementCounter(
      "chunkforge_chunk_bytes_total", static_cast<double>(bytes.size()));
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Stored chunk " + chunkKey + " for " + fileHash +
                                " (" + std::to_string(bytes.size()) +
                                " bytes)");
}

std::vector<std::string>
ChunkStore::listChunks(const std::string &fileHash) const {
  requireSafePathComponent(fileHash, "fileHash");
  const fs::path dir = containerPath(fileHash);
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    ThrowUploadException(ErrorKind::NotFound,
                         "No chunk container for " + fileHash);
  }

  std::vector<std::string> keys;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    ThrowUploadException(ErrorKind::Storage, "Cannot list " + dir.string() +
                                                 ": " + ec.message());
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      break;
    std::string name = it->path().filename().string();
    if (!isSafePathComponent(name))
      continue; // staging file
    std::error_code typeEc;
    if (!it->is_regular_file(typeEc))
      continue;
    keys.push_back(std::move(name));
  }
  if (ec) {
    ThrowUploadException(ErrorKind::Storage, "Cannot list " + dir.string() +
                                                 ": " + ec.message());
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

bool ChunkStore::removeChunk(const std::string &fileHash,
                             const std::string &chunkKey) {
  std::error_code ec;
  bool removed = fs::remove(chunkPath(fileHash, chunkKey), ec);
  if (ec) {
    ThrowUploadException(ErrorKind::Storage, "Cannot delete chunk " + chunkKey +
                                                 " of " + fileHash + ": " +
                                                 ec.message());
  }
  return removed;
}

bool ChunkStore::removeContainer(
    const std::string &fileHash,
    std::optional<fs::file_time_type> orphanCutoff) noexcept {
  try {
    const fs::path dir = containerPath(fileHash);
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
      return true;
    }
    if (orphanCutoff) {
      std::size_t purged = 0;
      for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
           it.increment(ec)) {
        std::error_code entryEc;
        auto written = it->last_write_time(entryEc);
        if (!entryEc && written <= *orphanCutoff &&
            fs::remove(it->path(), entryEc)) {
          ++purged;
        }
      }
      if (purged > 0) {
        Logger::getInstance().log(LogLevel::WARN,
                                  "Purged " + std::to_string(purged) +
                                      " orphaned chunk(s) for " + fileHash);
      }
    }
    fs::remove(dir, ec);
    if (ec) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Failed to remove chunk directory " +
                                    dir.string() + ": " + ec.message());
      return false;
    }
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Removed chunk directory " + dir.string());
    return true;
  } catch (const std::exception &e) {
    std::cerr << "Chunk directory cleanup failed for " << fileHash << ": "
              << e.what() << std::endl;
    return false;
  }
}

} // namespace chunkforge
