#pragma once
#ifndef CHUNKFORGE_HTTP_HPP
#define CHUNKFORGE_HTTP_HPP

#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkforge {

std::string trim(const std::string &str);

namespace HTTP {

// Status codes mapping
const std::unordered_map<int, std::string> statusCode = {
    {200, "OK"},
    {204, "No Content"},
    {400, "Bad Request"},
    {404, "Not Found"},
    {405, "Method Not Allowed"},
    {409, "Conflict"},
    {413, "Payload Too Large"},
    {500, "Internal Server Error"}};

enum class HttpMethod { GET, POST, PUT, DELETE, OPTIONS, HEAD, PATCH, INVALID };

HttpMethod StringToHttpMethod(const std::string &methodStr);
std::string HttpMethodToString(HttpMethod method);

struct HTTPREQUEST {
  HttpMethod method = HttpMethod::INVALID;
  std::string uri;
  std::string protocol;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

struct HTTPRESPONSE {
  std::string protocol = "HTTP/1.1";
  int statusCodeNumber = 200;
  std::string reasonPhrase = "OK";
  std::string contentType;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

/// One part of a multipart/form-data body.
struct FormPart {
  std::string name;
  std::optional<std::string> filename;
  std::string contentType;
  std::string data;
};

HTTPREQUEST ParseHttpRequest(const std::string &requestStr);
HTTPRESPONSE ParseHttpResponse(const std::string &responseStr);

/// Serialize a response, filling in Content-Length.
std::string GenerateHttpResponseString(const HTTPRESPONSE &response);

/// Case-insensitive header lookup.
std::optional<std::string> FindHeader(const HTTPREQUEST &request,
                                      const std::string &name);

/// Split "/path?query" into its path and raw query string.
std::pair<std::string, std::string> SplitUri(const std::string &uri);

/// Decode %XX escapes and '+' as used in URLs and form bodies.
std::string UrlDecode(const std::string &value);

std::map<std::string, std::string> ParseQueryString(const std::string &query);

/**
 * @brief Extract the boundary parameter of a multipart Content-Type.
 * @return std::nullopt if @p contentType is not multipart/form-data.
 */
std::optional<std::string> MultipartBoundary(const std::string &contentType);

/**
 * @brief Split a multipart/form-data body into its parts.
 * @throw std::invalid_argument If the body is not framed by @p boundary.
 */
std::vector<FormPart> ParseMultipartFormData(const std::string &body,
                                             const std::string &boundary);

} // namespace HTTP
} // namespace chunkforge

#endif // CHUNKFORGE_HTTP_HPP
