#include "chunkforge/upload/dedup_index.hpp"
#include "chunkforge/utilities/errors.h"
#include "chunkforge/utilities/logger.h"
#include "chunkforge/utilities/metrics.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace chunkforge {

static std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string normalizeDeclaredHash(const std::string &declaredHash) {
  static const std::regex tempPrefix("^temp-[0-9]+-");
  return toLower(std::regex_replace(declaredHash, tempPrefix, "",
                                    std::regex_constants::format_first_only));
}

DedupResult DedupIndex::exists(const std::string &fileName,
                               std::uint64_t declaredSize) const {
  DedupResult result;
  auto info = artifacts_.stat(fileName);
  if (!info) {
    return result;
  }
  if (info->size != declaredSize) {
    Logger::getInstance().log(
        LogLevel::DEBUG, "Artifact " + fileName + " exists with size " +
                             std::to_string(info->size) + ", declared " +
                             std::to_string(declaredSize) +
                             "; treating as different content");
    return result;
  }
  result.found = true;
  result.metadata = std::move(info);
  MetricsRegistry::instance().incrementCounter("chunkforge_dedup_hits_total");
  return result;
}

VerifyResult DedupIndex::verify(const std::string &declaredHash,
                                const std::string &fileName) const {
  if (!artifacts_.stat(fileName)) {
    ThrowUploadException(ErrorKind::NotFound, "Artifact not found: " + fileName);
  }

  VerifyResult result;
  result.expected = normalizeDeclaredHash(declaredHash);
  result.actual = verifier_.digestFile(artifacts_.pathFor(fileName));
  result.verified = result.actual == result.expected ||
                    result.actual == toLower(declaredHash);

  MetricsRegistry::instance().incrementCounter(
      "chunkforge_verifications_total",
      1.0, {{"result", result.verified ? "match" : "mismatch"}});
  if (!result.verified) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Integrity mismatch for " + fileName +
                                  ": expected " + result.expected +
                                  ", actual " + result.actual);
  }
  return result;
}

} // namespace chunkforge
