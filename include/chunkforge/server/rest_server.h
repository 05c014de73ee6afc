#pragma once
#ifndef CHUNKFORGE_REST_SERVER_H
#define CHUNKFORGE_REST_SERVER_H

#include "chunkforge/upload/upload_service.hpp"
#include "chunkforge/utilities/http.hpp"

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace chunkforge {

/**
 * @brief HTTP front end for the upload engine.
 *
 * One request per connection. Every JSON answer carries a numeric "code"
 * (0 on success, 1 on failure) and a human-readable "message".
 */
class RestServer {
public:
  /**
   * @brief Bind the listening socket.
   * @param ioc     Boost.Asio I/O context; may be run from several threads.
   * @param address Address to bind, e.g. "0.0.0.0".
   * @param port    Port number; 0 picks a free port.
   * @param service Upload operations to expose.
   */
  RestServer(boost::asio::io_context &ioc, const std::string &address,
             unsigned short port, UploadService &service);

  /** Begin accepting connections. */
  void run() { do_accept(); }

  /** Stop accepting new connections. */
  void stop();

  /** Port actually bound, useful when 0 was requested. */
  unsigned short port() const;

  /**
   * @brief Route a parsed request to the matching operation.
   *
   * Exposed separately from the socket loop so it can be exercised
   * without a network round trip.
   */
  HTTP::HTTPRESPONSE handle(const HTTP::HTTPREQUEST &req);

private:
  using tcp = boost::asio::ip::tcp;

  void do_accept();
  void on_accept(boost::system::error_code ec, tcp::socket socket);
  void serve(tcp::socket &socket);

  HTTP::HTTPRESPONSE handleCheckFile(const HTTP::HTTPREQUEST &req);
  HTTP::HTTPRESPONSE handleUpload(const HTTP::HTTPREQUEST &req);
  HTTP::HTTPRESPONSE handleMerge(const HTTP::HTTPREQUEST &req);
  HTTP::HTTPRESPONSE handleVerify(const HTTP::HTTPREQUEST &req);
  HTTP::HTTPRESPONSE handleListFiles();
  HTTP::HTTPRESPONSE handleMetrics();

  std::size_t maxRequestBytes() const;

  tcp::acceptor acceptor_;
  UploadService &service_;
};

/// Build a JSON response with the given status.
HTTP::HTTPRESPONSE JsonResponse(int status, const nlohmann::json &body);

} // namespace chunkforge

#endif // CHUNKFORGE_REST_SERVER_H
