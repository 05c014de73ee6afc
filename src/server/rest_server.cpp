#include "chunkforge/server/rest_server.h"
#include "chunkforge/utilities/errors.h"
#include "chunkforge/utilities/logger.h"
#include "chunkforge/utilities/metrics.h"

#include <sstream>

namespace chunkforge {

using json = nlohmann::json;

// Room for multipart framing around a maximum-size chunk.
static constexpr std::size_t kMultipartOverhead = 64 * 1024;
// Header block limit; anything bigger is not a legitimate client.
static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

HTTP::HTTPRESPONSE JsonResponse(int status, const json &body) {
  HTTP::HTTPRESPONSE res;
  res.statusCodeNumber = status;
  auto it = HTTP::statusCode.find(status);
  res.reasonPhrase = it != HTTP::statusCode.end() ? it->second : "Unknown";
  res.contentType = "application/json";
  res.headers["Access-Control-Allow-Origin"] = "*";
  res.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
  return res;
}

static HTTP::HTTPRESPONSE errorResponse(int status, const std::string &kind,
                                        const std::string &message) {
  json body;
  body["code"] = 1;
  body["kind"] = kind;
  body["message"] = message;
  return JsonResponse(status, body);
}

static HTTP::HTTPRESPONSE errorResponse(const UploadException &e) {
  return errorResponse(HttpStatusFor(e.GetErrorKind()),
                       ErrorKindToString(e.GetErrorKind()), e.what());
}

/**
 * @brief Read the request body as a JSON object.
 *
 * application/x-www-form-urlencoded bodies are accepted as well and turned
 * into an object of strings.
 */
static json parseFields(const HTTP::HTTPREQUEST &req) {
  auto contentType = HTTP::FindHeader(req, "Content-Type").value_or("");
  if (contentType.rfind("application/x-www-form-urlencoded", 0) == 0) {
    json fields = json::object();
    for (const auto &kv : HTTP::ParseQueryString(req.body))
      fields[kv.first] = kv.second;
    return fields;
  }
  if (trim(req.body).empty())
    return json::object();
  json fields = json::parse(req.body, nullptr, false);
  if (fields.is_discarded() || !fields.is_object()) {
    ThrowUploadException(ErrorKind::Validation,
                         "Request body is not a JSON object");
  }
  return fields;
}

static std::string stringField(const json &fields, const std::string &key) {
  auto it = fields.find(key);
  if (it == fields.end() || it->is_null())
    return "";
  if (it->is_string())
    return it->get<std::string>();
  ThrowUploadException(ErrorKind::Validation, "Field " + key +
                                                  " must be a string");
}

static std::optional<std::uint64_t> sizeField(const json &fields) {
  auto it = fields.find("size");
  if (it == fields.end() || it->is_null())
    return std::nullopt;
  if (it->is_number_unsigned())
    return it->get<std::uint64_t>();
  if (it->is_number_integer() && it->get<std::int64_t>() >= 0)
    return static_cast<std::uint64_t>(it->get<std::int64_t>());
  if (it->is_string()) {
    const std::string text = it->get<std::string>();
    if (!text.empty() &&
        text.find_first_not_of("0123456789") == std::string::npos) {
      try {
        return std::stoull(text);
      } catch (const std::out_of_range &) {
      }
    }
  }
  ThrowUploadException(ErrorKind::Validation,
                       "Field size must be a non-negative integer");
}

RestServer::RestServer(boost::asio::io_context &ioc,
                       const std::string &address, unsigned short port,
                       UploadService &service)
    : acceptor_(ioc, tcp::endpoint(boost::asio::ip::make_address(address),
                                   port)),
      service_(service) {}

unsigned short RestServer::port() const {
  return acceptor_.local_endpoint().port();
}

void RestServer::stop() {
  boost::system::error_code ec;
  acceptor_.close(ec);
}

std::size_t RestServer::maxRequestBytes() const {
  return service_.maxChunkBytes() + kMultipartOverhead;
}

void RestServer::do_accept() {
  acceptor_.async_accept(
      [this](const boost::system::error_code &ec, tcp::socket socket) {
        on_accept(ec, std::move(socket));
      });
}

void RestServer::on_accept(boost::system::error_code ec, tcp::socket socket) {
  if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
    return; // stopped
  }
  if (!ec) {
    boost::asio::post(acceptor_.get_executor(),
                      [this, s = std::move(socket)]() mutable { serve(s); });
  } else {
    Logger::getInstance().log(LogLevel::WARN,
                              "Accept failed: " + ec.message());
  }
  do_accept();
}

void RestServer::serve(tcp::socket &socket) {
  HTTP::HTTPRESPONSE res;
  try {
    std::string header;
    boost::asio::read_until(
        socket, boost::asio::dynamic_buffer(header, kMaxHeaderBytes),
        "\r\n\r\n");
    std::size_t pos = header.find("\r\n\r\n");
    std::string body_prefix = header.substr(pos + 4);
    header.erase(pos + 4);

    auto temp_req = HTTP::ParseHttpRequest(header);
    std::size_t remaining = 0;
    if (auto len = HTTP::FindHeader(temp_req, "Content-Length")) {
      remaining = std::stoul(*len);
    }

    if (remaining > maxRequestBytes()) {
      res = errorResponse(413, ErrorKindToString(ErrorKind::Validation),
                          "Request body exceeds " +
                              std::to_string(maxRequestBytes()) + " bytes");
    } else {
      std::string body = std::move(body_prefix);
      if (body.size() < remaining) {
        std::string rest(remaining - body.size(), '\0');
        boost::asio::read(socket, boost::asio::buffer(rest));
        body += rest;
      }
      HTTP::HTTPREQUEST req = std::move(temp_req);
      req.body = std::move(body);
      res = handle(req);
    }
  } catch (const boost::system::system_error &e) {
    Logger::getInstance().log(LogLevel::WARN, std::string("Connection dropped "
                                                          "while reading: ") +
                                                  e.what());
    return;
  } catch (const std::logic_error &e) {
    // std::stoul on a bad Content-Length.
    res = errorResponse(400, ErrorKindToString(ErrorKind::Validation),
                        std::string("Malformed request: ") + e.what());
  }

  boost::system::error_code ec;
  boost::asio::write(socket,
                     boost::asio::buffer(HTTP::GenerateHttpResponseString(res)),
                     ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Failed to send response: " + ec.message());
  }
  socket.shutdown(tcp::socket::shutdown_send, ec);
}

HTTP::HTTPRESPONSE RestServer::handle(const HTTP::HTTPREQUEST &req) {
  const std::string path = HTTP::SplitUri(req.uri).first;
  try {
    if (req.method == HTTP::HttpMethod::OPTIONS) {
      HTTP::HTTPRESPONSE res;
      res.statusCodeNumber = 204;
      res.reasonPhrase = HTTP::statusCode.at(204);
      res.headers["Access-Control-Allow-Origin"] = "*";
      res.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
      res.headers["Access-Control-Allow-Headers"] = "Content-Type";
      return res;
    }
    if (req.method == HTTP::HttpMethod::POST && path == "/check-file")
      return handleCheckFile(req);
    if (req.method == HTTP::HttpMethod::POST && path == "/upload")
      return handleUpload(req);
    if (req.method == HTTP::HttpMethod::POST && path == "/merge")
      return handleMerge(req);
    if (req.method == HTTP::HttpMethod::POST && path == "/verify")
      return handleVerify(req);
    if (req.method == HTTP::HttpMethod::GET && path == "/files")
      return handleListFiles();
    if (req.method == HTTP::HttpMethod::GET && path == "/metrics")
      return handleMetrics();
  } catch (const UploadException &e) {
    return errorResponse(e);
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "Unhandled error on " + path +
                                                   ": " + e.what());
    return errorResponse(500, "InternalError", e.what());
  }
  return errorResponse(404, ErrorKindToString(ErrorKind::NotFound),
                       "No route for " + HTTP::HttpMethodToString(req.method) +
                           " " + path);
}

HTTP::HTTPRESPONSE RestServer::handleCheckFile(const HTTP::HTTPREQUEST &req) {
  json fields = parseFields(req);
  DedupResult found =
      service_.checkExisting(stringField(fields, "fileHash"),
                             stringField(fields, "fileName"), sizeField(fields));
  json body;
  body["code"] = 0;
  body["exists"] = found.found;
  if (found.found && found.metadata) {
    body["message"] = "File already exists";
    body["file"] = {{"name", found.metadata->name},
                    {"size", found.metadata->size},
                    {"createTime", found.metadata->createTime}};
  } else {
    body["message"] = "File does not exist";
  }
  return JsonResponse(200, body);
}

HTTP::HTTPRESPONSE RestServer::handleUpload(const HTTP::HTTPREQUEST &req) {
  std::string fileHash;
  std::string chunkKey;
  std::string data;

  auto contentType = HTTP::FindHeader(req, "Content-Type").value_or("");
  if (auto boundary = HTTP::MultipartBoundary(contentType)) {
    std::vector<HTTP::FormPart> parts;
    try {
      parts = HTTP::ParseMultipartFormData(req.body, *boundary);
    } catch (const std::invalid_argument &e) {
      ThrowUploadException(ErrorKind::Validation,
                           std::string("Malformed multipart body: ") + e.what());
    }
    bool haveChunk = false;
    for (auto &part : parts) {
      if (part.name == "chunk") {
        data = std::move(part.data);
        haveChunk = true;
      } else if (part.name == "hash") {
        chunkKey = part.data;
      } else if (part.name == "fileHash") {
        fileHash = part.data;
      }
    }
    if (!haveChunk) {
      ThrowUploadException(ErrorKind::Validation, "Missing chunk payload");
    }
  } else {
    auto params = HTTP::ParseQueryString(HTTP::SplitUri(req.uri).second);
    fileHash = params["fileHash"];
    chunkKey = params["hash"];
    data = req.body;
  }

  service_.uploadChunk(fileHash, chunkKey, data);
  return JsonResponse(200, {{"code", 0}, {"message", "Chunk uploaded"}});
}

HTTP::HTTPRESPONSE RestServer::handleMerge(const HTTP::HTTPREQUEST &req) {
  json fields = parseFields(req);
  MergeResult merged =
      service_.merge(stringField(fields, "fileHash"),
                     stringField(fields, "fileName"), sizeField(fields));
  return JsonResponse(200, {{"code", 0},
                            {"message", "File merged"},
                            {"url", merged.url},
                            {"size", merged.bytesWritten}});
}

HTTP::HTTPRESPONSE RestServer::handleVerify(const HTTP::HTTPREQUEST &req) {
  json fields = parseFields(req);
  VerifyResult result;
  try {
    result = service_.verify(stringField(fields, "fileHash"),
                             stringField(fields, "fileName"));
  } catch (const UploadException &e) {
    HTTP::HTTPRESPONSE res = errorResponse(e);
    if (e.GetErrorKind() == ErrorKind::NotFound) {
      json body = json::parse(res.body);
      body["verified"] = false;
      res = JsonResponse(res.statusCodeNumber, body);
    }
    return res;
  }
  json body;
  body["code"] = 0;
  body["verified"] = result.verified;
  if (result.verified) {
    body["message"] = "Integrity check passed";
  } else {
    body["message"] = "Integrity check failed";
    body["details"] = {{"expected", result.expected},
                       {"actual", result.actual}};
  }
  return JsonResponse(200, body);
}

HTTP::HTTPRESPONSE RestServer::handleListFiles() {
  json data = json::array();
  for (const auto &info : service_.listArtifacts()) {
    data.push_back({{"name", info.name},
                    {"size", info.size},
                    {"createTime", info.createTime}});
  }
  return JsonResponse(200, {{"code", 0}, {"data", data}});
}

HTTP::HTTPRESPONSE RestServer::handleMetrics() {
  HTTP::HTTPRESPONSE res;
  res.contentType = "text/plain; version=0.0.4";
  res.body = MetricsRegistry::instance().toPrometheus();
  return res;
}

} // namespace chunkforge
