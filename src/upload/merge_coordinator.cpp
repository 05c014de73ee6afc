#include "chunkforge/upload/merge_coordinator.hpp"
#include "chunkforge/utilities/errors.h"
#include "chunkforge/utilities/logger.h"
#include "chunkforge/utilities/metrics.h"

#include <algorithm>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace chunkforge {

bool MergeLockTable::tryAcquire(const std::string &fileHash) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!active_.insert(fileHash).second)
    return false;
  MetricsRegistry::instance().setGauge("chunkforge_active_merges",
                                       static_cast<double>(active_.size()));
  return true;
}

void MergeLockTable::release(const std::string &fileHash) {
  std::lock_guard<std::mutex> lk(mtx_);
  active_.erase(fileHash);
  MetricsRegistry::instance().setGauge("chunkforge_active_merges",
                                       static_cast<double>(active_.size()));
}

bool MergeLockTable::isActive(const std::string &fileHash) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return active_.count(fileHash) > 0;
}

std::size_t MergeLockTable::activeCount() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return active_.size();
}

namespace {

/// Removes the staging file unless it was committed.
struct StagingFile {
  fs::path path;
  bool committed = false;

  explicit StagingFile(fs::path p) : path(std::move(p)) {}
  ~StagingFile() {
    if (!committed) {
      std::error_code ec;
      fs::remove(path, ec);
    }
  }
};

std::string mergeResultLabel(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
    return "size_mismatch";
  case ErrorKind::NoChunks:
    return "no_chunks";
  case ErrorKind::Storage:
    return "storage_error";
  default:
    return "error";
  }
}

class MergeTimer {
public:
  MergeTimer() : start_(std::chrono::steady_clock::now()) {}
  double seconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         start_)
        .count();
  }

private:
  std::chrono::steady_clock::time_point start_;
};

} // namespace

MergeCoordinator::MergeCoordinator(ChunkStore &chunks,
                                   const ArtifactStore &artifacts,
                                   CleanupScheduler &scheduler,
                                   std::chrono::milliseconds cleanupDelay)
    : chunks_(chunks), artifacts_(artifacts), scheduler_(scheduler),
      cleanupDelay_(cleanupDelay) {}

std::vector<std::string>
MergeCoordinator::orderChunkKeys(std::vector<std::string> keys) {
  std::vector<std::pair<std::uint64_t, std::string>> indexed;
  indexed.reserve(keys.size());
  for (auto &key : keys) {
    auto index = parseChunkIndex(key);
    if (!index) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Ignoring chunk without numeric index: " + key);
      continue;
    }
    indexed.emplace_back(*index, std::move(key));
  }
  std::sort(indexed.begin(), indexed.end());

  std::vector<std::string> ordered;
  ordered.reserve(indexed.size());
  for (std::size_t i = 0; i < indexed.size(); ++i) {
    if (i > 0 && indexed[i].first == indexed[i - 1].first) {
      Logger::getInstance().log(
          LogLevel::WARN, "Duplicate chunk index " +
                              std::to_string(indexed[i].first) + ": " +
                              indexed[i - 1].second + " and " +
                              indexed[i].second);
    }
    ordered.push_back(std::move(indexed[i].second));
  }
  return ordered;
}

std::uint64_t MergeCoordinator::appendChunk(std::ostream &out,
                                            const std::string &fileHash,
                                            const std::string &chunkKey,
                                            std::vector<char> &buffer) {
  const fs::path src = chunks_.chunkPath(fileHash, chunkKey);
  std::ifstream in(src, std::ios::binary);
  if (!in.is_open()) {
    ThrowUploadException(ErrorKind::Storage,
                         "Cannot open chunk " + src.string());
  }
  std::uint64_t copied = 0;
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize got = in.gcount();
    if (got > 0) {
      out.write(buffer.data(), got);
      copied += static_cast<std::uint64_t>(got);
    }
    if (!out) {
      ThrowUploadException(ErrorKind::Storage,
                           "Write failed while appending chunk " + chunkKey);
    }
  }
  if (in.bad() || !in.eof()) {
    ThrowUploadException(ErrorKind::Storage,
                         "Read failed for chunk " + src.string());
  }
  return copied;
}

void MergeCoordinator::discardChunks(const std::string &fileHash,
                                     const std::vector<std::string> &keys) {
  for (const auto &key : keys) {
    try {
      chunks_.removeChunk(fileHash, key);
    } catch (const UploadException &e) {
      // The artifact is already complete; a stray chunk is only garbage.
      Logger::getInstance().log(LogLevel::WARN,
                                std::string("Chunk cleanup failed: ") +
                                    e.what());
    }
  }
}

MergeResult MergeCoordinator::merge(const std::string &fileHash,
                                    const std::string &fileName,
                                    std::optional<std::uint64_t> declaredSize) {
  requireSafePathComponent(fileHash, "fileHash");
  requireSafePathComponent(fileName, "fileName");

  if (!locks_.tryAcquire(fileHash)) {
    MetricsRegistry::instance().incrementCounter(
        "chunkforge_merges_total", 1.0, {{"result", "rejected"}});
    ThrowUploadException(ErrorKind::MergeInProgress,
                         "A merge is already running for " + fileHash);
  }
  MergeLockTable::Guard guard(locks_, fileHash);
  try {
    return mergeLocked(fileHash, fileName, declaredSize);
  } catch (const UploadException &e) {
    MetricsRegistry::instance().incrementCounter(
        "chunkforge_merges_total", 1.0,
        {{"result", mergeResultLabel(e.GetErrorKind())}});
    throw;
  }
}

MergeResult
MergeCoordinator::mergeLocked(const std::string &fileHash,
                              const std::string &fileName,
                              std::optional<std::uint64_t> declaredSize) {
  MergeTimer timer;

  std::vector<std::string> keys;
  try {
    keys = chunks_.listChunks(fileHash);
  } catch (const UploadException &e) {
    if (e.GetErrorKind() != ErrorKind::NotFound)
      throw;
    ThrowUploadException(ErrorKind::NoChunks, "No chunks found for " + fileHash);
  }
  keys = orderChunkKeys(std::move(keys));
  if (keys.empty()) {
    ThrowUploadException(ErrorKind::NoChunks,
                         "No chunk files found for " + fileHash);
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "Merging " + std::to_string(keys.size()) +
                                " chunk(s) of " + fileHash + " into " +
                                fileName);

  artifacts_.ensureRoot();
  const fs::path target = artifacts_.pathFor(fileName);
  // Fixed-length name: fileName alone may already be NAME_MAX long.
  StagingFile staging(artifacts_.root() /
                      (".merging-" +
                       std::to_string(stagingCounter_.fetch_add(1))));

  std::uint64_t total = 0;
  {
    std::ofstream out(staging.path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      ThrowUploadException(ErrorKind::Storage,
                           "Cannot open " + staging.path.string() +
                               " for writing");
    }
    std::vector<char> buffer(kCopyBufferSize);
    std::size_t written = 0;
    // Strictly sequential: the artifact is a plain append in index order.
    for (const auto &key : keys) {
      total += appendChunk(out, fileHash, key, buffer);
      ++written;
      if (progressHook_)
        progressHook_(fileHash, written);
    }
    out.flush();
    out.close();
    if (out.fail()) {
      ThrowUploadException(ErrorKind::Storage,
                           "Failed to finalize " + staging.path.string());
    }
  }

  if (declaredSize && *declaredSize != total) {
    ThrowUploadException(ErrorKind::Validation,
                         "Assembled " + std::to_string(total) +
                             " bytes for " + fileName + " but " +
                             std::to_string(*declaredSize) +
                             " were declared; chunks kept for retry");
  }
  syncFileToDisk(staging.path);

  std::error_code ec;
  fs::rename(staging.path, target, ec);
  if (ec) {
    ThrowUploadException(ErrorKind::Storage, "Cannot publish " +
                                                 target.string() + ": " +
                                                 ec.message());
  }
  staging.committed = true;

  discardChunks(fileHash, keys);

  // Chunks that land after this point belong to a new upload and survive
  // the delayed cleanup. The margin covers kernel mtimes trailing the clock
  // by up to one tick; orphans written inside it keep the directory alive.
  const auto cutoff = fs::file_time_type::clock::now() - kOrphanCutoffMargin;
  ChunkStore &store = chunks_;
  scheduler_.schedule(cleanupDelay_, "remove chunk dir " + fileHash,
                      [&store, fileHash, cutoff] {
                        store.removeContainer(fileHash, cutoff);
                      });

  const double elapsed = timer.seconds();
  MetricsRegistry::instance().incrementCounter("chunkforge_merges_total", 1.0,
                                               {{"result", "success"}});
  MetricsRegistry::instance().observe("chunkforge_merge_seconds", elapsed);
  Logger::getInstance().log(LogLevel::INFO,
                            "Merged " + fileHash + " into " + target.string() +
                                " (" + std::to_string(total) + " bytes, " +
                                std::to_string(elapsed) + "s)");

  MergeResult result;
  result.url = ArtifactStore::urlFor(fileName);
  result.path = target;
  result.bytesWritten = total;
  result.chunkCount = keys.size();
  return result;
}

} // namespace chunkforge
