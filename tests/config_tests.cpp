#include "chunkforge/utilities/config.h"
#include "chunkforge/utilities/var_dir.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace chunkforge;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  fs::path file_;

  void SetUp() override {
    file_ = fs::temp_directory_path() /
            ("chunkforge_config_" +
             std::string(::testing::UnitTest::GetInstance()
                             ->current_test_info()
                             ->name()) +
             ".yaml");
    fs::remove(file_);
    for (const char *var : {"CHUNKFORGE_PORT", "CHUNKFORGE_UPLOAD_DIR",
                            "CHUNKFORGE_CHUNKS_DIR", "CHUNKFORGE_LOG_LEVEL"})
      unsetenv(var);
  }

  void TearDown() override {
    fs::remove(file_);
    unsetenv("CHUNKFORGE_PORT");
    unsetenv("CHUNKFORGE_LOG_LEVEL");
  }

  void write(const std::string &yaml) { std::ofstream(file_) << yaml; }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
  ServerConfig cfg = loadServerConfig(file_.string());
  EXPECT_EQ(cfg.port, 3000);
  EXPECT_EQ(cfg.bindAddress, "0.0.0.0");
  EXPECT_EQ(cfg.uploadDir, getVarDir() + "/uploads");
  EXPECT_EQ(cfg.chunksDir, getVarDir() + "/chunks");
  EXPECT_EQ(cfg.maxChunkBytes, 20u * 1024 * 1024);
  EXPECT_EQ(cfg.cleanupDelay, std::chrono::milliseconds(1000));
  EXPECT_EQ(cfg.hashAlgorithm, HashAlgorithm::MD5);
  EXPECT_EQ(cfg.workerThreads, 4u);
  EXPECT_EQ(cfg.logLevel, LogLevel::INFO);
}

TEST_F(ConfigTest, ReadsEveryKey) {
  write("port: 8081\n"
        "bind_address: 127.0.0.1\n"
        "upload_dir: /srv/uploads\n"
        "chunks_dir: /srv/chunks\n"
        "max_chunk_bytes: 1048576\n"
        "cleanup_delay_ms: 250\n"
        "hash_algorithm: SHA256\n"
        "worker_threads: 0\n"
        "log_file: /tmp/cf.log\n"
        "log_level: debug\n");
  ServerConfig cfg = loadServerConfig(file_.string());
  EXPECT_EQ(cfg.port, 8081);
  EXPECT_EQ(cfg.bindAddress, "127.0.0.1");
  EXPECT_EQ(cfg.uploadDir, "/srv/uploads");
  EXPECT_EQ(cfg.chunksDir, "/srv/chunks");
  EXPECT_EQ(cfg.maxChunkBytes, 1048576u);
  EXPECT_EQ(cfg.cleanupDelay, std::chrono::milliseconds(250));
  EXPECT_EQ(cfg.hashAlgorithm, HashAlgorithm::SHA256);
  EXPECT_EQ(cfg.workerThreads, 1u); // clamped
  EXPECT_EQ(cfg.logFile, "/tmp/cf.log");
  EXPECT_EQ(cfg.logLevel, LogLevel::DEBUG);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
  write("port: 8081\nlog_level: error\n");
  setenv("CHUNKFORGE_PORT", "9090", 1);
  setenv("CHUNKFORGE_LOG_LEVEL", "warn", 1);
  ServerConfig cfg = loadServerConfig(file_.string());
  EXPECT_EQ(cfg.port, 9090);
  EXPECT_EQ(cfg.logLevel, LogLevel::WARN);
}

TEST_F(ConfigTest, MalformedValuesAreErrors) {
  write("port: not-a-number\n");
  EXPECT_THROW(loadServerConfig(file_.string()), std::runtime_error);

  write("port: 70000\n");
  EXPECT_THROW(loadServerConfig(file_.string()), std::runtime_error);

  write("hash_algorithm: crc32\n");
  EXPECT_THROW(loadServerConfig(file_.string()), std::runtime_error);

  write("port: [1, 2\n");
  EXPECT_THROW(loadServerConfig(file_.string()), std::runtime_error);
}

TEST_F(ConfigTest, ConfigPathFromEnvironment) {
  unsetenv("CHUNKFORGE_CONFIG");
  EXPECT_EQ(defaultConfigPath(), "chunkforge_config.yaml");
  setenv("CHUNKFORGE_CONFIG", "/etc/chunkforge.yaml", 1);
  EXPECT_EQ(defaultConfigPath(), "/etc/chunkforge.yaml");
  unsetenv("CHUNKFORGE_CONFIG");
}
