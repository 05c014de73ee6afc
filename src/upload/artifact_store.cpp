#include "chunkforge/upload/artifact_store.hpp"
#include "chunkforge/upload/chunk_store.hpp"
#include "chunkforge/utilities/errors.h"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace chunkforge {

static std::string formatIsoUtc(std::time_t seconds, long nanos) {
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03ldZ", buf, nanos / 1000000);
  return out;
}

std::string fileCreateTime(const fs::path &path) {
#ifdef STATX_BTIME
  struct statx stx {};
  if (statx(AT_FDCWD, path.c_str(), 0, STATX_BTIME | STATX_MTIME, &stx) == 0) {
    if (stx.stx_mask & STATX_BTIME) {
      return formatIsoUtc(static_cast<std::time_t>(stx.stx_btime.tv_sec),
                          static_cast<long>(stx.stx_btime.tv_nsec));
    }
    return formatIsoUtc(static_cast<std::time_t>(stx.stx_mtime.tv_sec),
                        static_cast<long>(stx.stx_mtime.tv_nsec));
  }
#endif
  struct stat st {};
  if (::stat(path.c_str(), &st) == 0) {
    return formatIsoUtc(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
  }
  return formatIsoUtc(0, 0);
}

ArtifactStore::ArtifactStore(fs::path root) : root_(std::move(root)) {}

void ArtifactStore::ensureRoot() const {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec || !fs::is_directory(root_)) {
    ThrowUploadException(ErrorKind::Storage,
                         "Cannot create artifact directory " + root_.string() +
                             (ec ? ": " + ec.message() : std::string()));
  }
}

fs::path ArtifactStore::pathFor(const std::string &fileName) const {
  return root_ / fileName;
}

std::string ArtifactStore::urlFor(const std::string &fileName) {
  return "/uploads/" + fileName;
}

std::optional<ArtifactInfo>
ArtifactStore::stat(const std::string &fileName) const {
  requireSafePathComponent(fileName, "fileName");
  const fs::path path = pathFor(fileName);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  std::uintmax_t size = fs::file_size(path, ec);
  if (ec) {
    return std::nullopt; // vanished between the two calls
  }
  return ArtifactInfo{fileName, static_cast<std::uint64_t>(size),
                      fileCreateTime(path)};
}

std::vector<ArtifactInfo> ArtifactStore::list() const {
  std::vector<ArtifactInfo> out;
  std::error_code ec;
  if (!fs::exists(root_, ec)) {
    return out;
  }
  fs::directory_iterator it(root_, ec);
  if (ec) {
    ThrowUploadException(ErrorKind::Storage, "Cannot list " + root_.string() +
                                                 ": " + ec.message());
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      break;
    std::string name = it->path().filename().string();
    std::error_code typeEc;
    if (!isSafePathComponent(name) || !it->is_regular_file(typeEc))
      continue;
    std::uintmax_t size = it->file_size(typeEc);
    if (typeEc)
      continue;
    out.push_back(ArtifactInfo{name, static_cast<std::uint64_t>(size),
                               fileCreateTime(it->path())});
  }
  if (ec) {
    ThrowUploadException(ErrorKind::Storage, "Cannot list " + root_.string() +
                                                 ": " + ec.message());
  }
  std::sort(out.begin(), out.end(),
            [](const ArtifactInfo &a, const ArtifactInfo &b) {
              return a.name < b.name;
            });
  return out;
}

} // namespace chunkforge
