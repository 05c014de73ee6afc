#pragma once
#ifndef CHUNKFORGE_CONFIG_H
#define CHUNKFORGE_CONFIG_H

#include "chunkforge/upload/hash_verifier.hpp"
#include "chunkforge/utilities/logger.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace chunkforge {

/**
 * @brief Runtime options for the upload server.
 *
 * Defaults are resolved against the var dir at construction time so that
 * tests can redirect everything with setVarDir().
 */
struct ServerConfig {
  ServerConfig();

  unsigned short port = 3000;
  std::string bindAddress = "0.0.0.0";
  std::string uploadDir;
  std::string chunksDir;
  std::size_t maxChunkBytes = 20 * 1024 * 1024;
  std::chrono::milliseconds cleanupDelay{1000};
  HashAlgorithm hashAlgorithm = HashAlgorithm::MD5;
  unsigned int workerThreads = 4;
  std::string logFile;
  LogLevel logLevel = LogLevel::INFO;
};

/**
 * @brief Load a configuration file and apply environment overrides.
 *
 * A missing file yields the defaults. A file that exists but cannot be
 * parsed, or holds a value of the wrong type, is an error.
 *
 * @param path YAML file path.
 * @throw std::runtime_error On malformed configuration.
 */
ServerConfig loadServerConfig(const std::string &path);

/**
 * @brief Resolve the configuration path from CHUNKFORGE_CONFIG, falling back
 *        to "chunkforge_config.yaml" in the working directory.
 */
std::string defaultConfigPath();

/// Override fields from CHUNKFORGE_* environment variables.
void applyEnvironmentOverrides(ServerConfig &cfg);

} // namespace chunkforge

#endif // CHUNKFORGE_CONFIG_H
