#pragma once

#include <string>

namespace chunkforge {

void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string defaultUploadDir();
std::string defaultChunksDir();

} // namespace chunkforge
