#include "chunkforge/utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace chunkforge {

static std::string varDir = [] {
  const char *env = std::getenv("CHUNKFORGE_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/chunkforge"))
    return std::string("/var/chunkforge");
  return std::string("var/chunkforge");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string defaultUploadDir() { return getVarDir() + "/uploads"; }

std::string defaultChunksDir() { return getVarDir() + "/chunks"; }

} // namespace chunkforge
