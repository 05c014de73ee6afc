#include "chunkforge/utilities/config.h"
#include "chunkforge/utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace chunkforge {

ServerConfig::ServerConfig()
    : uploadDir(defaultUploadDir()), chunksDir(defaultChunksDir()),
      logFile(logsDir() + "/chunkforge.log") {}

std::string defaultConfigPath() {
  const char *cfg = std::getenv("CHUNKFORGE_CONFIG");
  if (cfg && cfg[0] != '\0')
    return cfg;
  return "chunkforge_config.yaml";
}

static unsigned short parsePort(long value) {
  if (value <= 0 || value > 65535)
    throw std::runtime_error("port out of range: " + std::to_string(value));
  return static_cast<unsigned short>(value);
}

void applyEnvironmentOverrides(ServerConfig &cfg) {
  if (const char *env = std::getenv("CHUNKFORGE_PORT"))
    cfg.port = parsePort(std::strtol(env, nullptr, 10));
  if (const char *env = std::getenv("CHUNKFORGE_UPLOAD_DIR"))
    cfg.uploadDir = env;
  if (const char *env = std::getenv("CHUNKFORGE_CHUNKS_DIR"))
    cfg.chunksDir = env;
  if (const char *env = std::getenv("CHUNKFORGE_LOG_LEVEL"))
    cfg.logLevel = parseLogLevel(env);
}

ServerConfig loadServerConfig(const std::string &path) {
  ServerConfig cfg;
  if (std::filesystem::exists(path)) {
    try {
      YAML::Node node = YAML::LoadFile(path);
      if (node["port"])
        cfg.port = parsePort(node["port"].as<long>());
      if (node["bind_address"])
        cfg.bindAddress = node["bind_address"].as<std::string>();
      if (node["upload_dir"])
        cfg.uploadDir = node["upload_dir"].as<std::string>();
      if (node["chunks_dir"])
        cfg.chunksDir = node["chunks_dir"].as<std::string>();
      if (node["max_chunk_bytes"])
        cfg.maxChunkBytes = node["max_chunk_bytes"].as<std::size_t>();
      if (node["cleanup_delay_ms"])
        cfg.cleanupDelay =
            std::chrono::milliseconds(node["cleanup_delay_ms"].as<long>());
      if (node["hash_algorithm"])
        cfg.hashAlgorithm =
            parseHashAlgorithm(node["hash_algorithm"].as<std::string>());
      if (node["worker_threads"])
        cfg.workerThreads = node["worker_threads"].as<unsigned int>();
      if (node["log_file"])
        cfg.logFile = node["log_file"].as<std::string>();
      if (node["log_level"])
        cfg.logLevel = parseLogLevel(node["log_level"].as<std::string>());
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("Invalid configuration file " + path + ": " +
                               e.what());
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error("Invalid configuration file " + path + ": " +
                               e.what());
    }
  }
  applyEnvironmentOverrides(cfg);
  if (cfg.workerThreads == 0)
    cfg.workerThreads = 1;
  return cfg;
}

} // namespace chunkforge
