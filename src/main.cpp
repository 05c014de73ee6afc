// Main entry point for the chunkforge_server executable

#include "chunkforge/server/rest_server.h"
#include "chunkforge/upload/upload_service.hpp"
#include "chunkforge/utilities/config.h"
#include "chunkforge/utilities/logger.h"

#include <boost/asio.hpp>
#include <filesystem>
#include <iostream>
#include <memory>
#include <signal.h> // For signal(), SIGPIPE, SIG_IGN
#include <sodium.h>
#include <thread>
#include <vector>

using namespace chunkforge;

int main(int argc, char *argv[]) {
  // Ignore SIGPIPE: prevents termination if writing to a closed socket
  signal(SIGPIPE, SIG_IGN);

  ServerConfig config;
  try {
    config = loadServerConfig(defaultConfigPath());
  } catch (const std::exception &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }
  if (argc > 1) {
    try {
      int port = std::stoi(argv[1]);
      if (port < 0 || port > 65535)
        throw std::out_of_range("port");
      config.port = static_cast<unsigned short>(port);
    } catch (const std::logic_error &) {
      std::cerr << "FATAL: Invalid port number provided: " << argv[1]
                << std::endl;
      return 1;
    }
  }

  try {
    std::filesystem::path logPath(config.logFile);
    if (logPath.has_parent_path())
      std::filesystem::create_directories(logPath.parent_path());
    Logger::init(config.logFile, config.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Logger initialization failed: " << e.what()
              << std::endl;
    return 1;
  }

  if (sodium_init() < 0) {
    Logger::getInstance().log(LogLevel::FATAL, "libsodium failed to start");
    return 1;
  }

  UploadService service(config);
  try {
    service.start();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::FATAL,
                              std::string("Storage setup failed: ") + e.what());
    return 1;
  }

  boost::asio::io_context ioc{static_cast<int>(config.workerThreads)};
  std::unique_ptr<RestServer> server;
  try {
    server = std::make_unique<RestServer>(ioc, config.bindAddress, config.port,
                                          service);
  } catch (const boost::system::system_error &e) {
    Logger::getInstance().log(LogLevel::FATAL,
                              "Cannot listen on " + config.bindAddress + ":" +
                                  std::to_string(config.port) + ": " +
                                  e.what());
    service.stop();
    return 1;
  }

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &, int signo) {
    Logger::getInstance().log(LogLevel::INFO,
                              "Received signal " + std::to_string(signo) +
                                  ", shutting down");
    server->stop();
    ioc.stop();
  });

  server->run();
  Logger::getInstance().log(
      LogLevel::INFO,
      "ChunkForge listening on " + config.bindAddress + ":" +
          std::to_string(server->port()) + " with " +
          std::to_string(config.workerThreads) + " worker threads");

  std::vector<std::thread> workers;
  for (unsigned int i = 1; i < config.workerThreads; ++i) {
    workers.emplace_back([&ioc] { ioc.run(); });
  }
  ioc.run();
  for (auto &t : workers) {
    t.join();
  }

  service.stop();
  Logger::getInstance().log(LogLevel::INFO, "ChunkForge stopped");
  return 0;
}
