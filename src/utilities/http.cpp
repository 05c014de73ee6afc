#include "chunkforge/utilities/http.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace chunkforge {

std::string trim(const std::string &str) {
  const std::string whitespace = " \t\n\r";
  size_t start = str.find_first_not_of(whitespace);
  size_t end = str.find_last_not_of(whitespace);

  if (start == std::string::npos) // No non-whitespace characters found
    return "";

  return str.substr(start, end - start + 1);
}

namespace HTTP {

static std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

HttpMethod StringToHttpMethod(const std::string &methodStr) {
  if (methodStr == "GET")
    return HttpMethod::GET;
  else if (methodStr == "POST")
    return HttpMethod::POST;
  else if (methodStr == "PUT")
    return HttpMethod::PUT;
  else if (methodStr == "DELETE")
    return HttpMethod::DELETE;
  else if (methodStr == "OPTIONS")
    return HttpMethod::OPTIONS;
  else if (methodStr == "HEAD")
    return HttpMethod::HEAD;
  else if (methodStr == "PATCH")
    return HttpMethod::PATCH;
  else
    return HttpMethod::INVALID;
}

std::string HttpMethodToString(HttpMethod method) {
  switch (method) {
  case HttpMethod::GET:
    return "GET";
  case HttpMethod::POST:
    return "POST";
  case HttpMethod::PUT:
    return "PUT";
  case HttpMethod::DELETE:
    return "DELETE";
  case HttpMethod::OPTIONS:
    return "OPTIONS";
  case HttpMethod::HEAD:
    return "HEAD";
  case HttpMethod::PATCH:
    return "PATCH";
  default:
    return "INVALID";
  }
}

HTTPREQUEST ParseHttpRequest(const std::string &requestStr) {
  HTTPREQUEST request;
  std::istringstream requestStream(requestStr);
  std::string requestLine;
  std::getline(requestStream, requestLine);

  // Remove trailing carriage return if present
  if (!requestLine.empty() && requestLine.back() == '\r') {
    requestLine.pop_back();
  }

  std::istringstream requestLineStream(requestLine);

  // Read the method, URI, and protocol from the request line
  std::string methodStr;
  requestLineStream >> methodStr >> request.uri >> request.protocol;
  request.method = StringToHttpMethod(methodStr);

  std::string line;
  // Parse headers
  while (std::getline(requestStream, line) && line != "\r") {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();

    if (line.empty())
      break;

    size_t delimiterPos = line.find(':');
    if (delimiterPos != std::string::npos) {
      std::string headerName = trim(line.substr(0, delimiterPos));
      std::string headerValue = trim(line.substr(delimiterPos + 1));
      request.headers[headerName] = headerValue;
    }
  }

  // Read the body
  std::ostringstream bodyStream;
  bodyStream << requestStream.rdbuf();
  request.body = bodyStream.str();

  return request;
}

std::string GenerateHttpResponseString(const HTTPRESPONSE &response) {
  std::ostringstream out;
  out << response.protocol << ' ' << response.statusCodeNumber << ' '
      << response.reasonPhrase << "\r\n";
  if (!response.contentType.empty())
    out << "Content-Type: " << response.contentType << "\r\n";
  for (const auto &header : response.headers) {
    out << header.first << ": " << header.second << "\r\n";
  }
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n\r\n";
  out << response.body;
  return out.str();
}

HTTPRESPONSE ParseHttpResponse(const std::string &responseStr) {
  HTTPRESPONSE response;
  std::istringstream responseStream(responseStr);
  std::string statusLine;
  std::getline(responseStream, statusLine);

  if (!statusLine.empty() && statusLine.back() == '\r') {
    statusLine.pop_back();
  }

  std::istringstream statusLineStream(statusLine);
  statusLineStream >> response.protocol >> response.statusCodeNumber;
  std::getline(statusLineStream, response.reasonPhrase);
  response.reasonPhrase = trim(response.reasonPhrase);

  std::string line;
  while (std::getline(responseStream, line) && line != "\r") {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty())
      break;

    size_t delimiterPos = line.find(':');
    if (delimiterPos != std::string::npos) {
      std::string headerName = trim(line.substr(0, delimiterPos));
      std::string headerValue = trim(line.substr(delimiterPos + 1));
      if (headerName == "Content-Type") {
        response.contentType = headerValue;
      } else {
        response.headers[headerName] = headerValue;
      }
    }
  }

  std::ostringstream bodyStream;
  bodyStream << responseStream.rdbuf();
  response.body = bodyStream.str();

  return response;
}

std::optional<std::string> FindHeader(const HTTPREQUEST &request,
                                      const std::string &name) {
  const std::string wanted = toLower(name);
  for (const auto &header : request.headers) {
    if (toLower(header.first) == wanted)
      return header.second;
  }
  return std::nullopt;
}

std::pair<std::string, std::string> SplitUri(const std::string &uri) {
  auto pos = uri.find('?');
  if (pos == std::string::npos)
    return {uri, ""};
  return {uri.substr(0, pos), uri.substr(pos + 1)};
}

std::string UrlDecode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < value.size() &&
               std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
               std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::map<std::string, std::string> ParseQueryString(const std::string &query) {
  std::map<std::string, std::string> params;
  size_t start = 0;
  while (start <= query.size()) {
    size_t end = query.find('&', start);
    if (end == std::string::npos)
      end = query.size();
    std::string pair = query.substr(start, end - start);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      if (eq == std::string::npos)
        params[UrlDecode(pair)] = "";
      else
        params[UrlDecode(pair.substr(0, eq))] = UrlDecode(pair.substr(eq + 1));
    }
    start = end + 1;
  }
  return params;
}

std::optional<std::string> MultipartBoundary(const std::string &contentType) {
  if (toLower(contentType).rfind("multipart/form-data", 0) != 0)
    return std::nullopt;
  auto pos = toLower(contentType).find("boundary=");
  if (pos == std::string::npos)
    return std::nullopt;
  std::string boundary = contentType.substr(pos + 9);
  auto semi = boundary.find(';');
  if (semi != std::string::npos)
    boundary.erase(semi);
  boundary = trim(boundary);
  if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"')
    boundary = boundary.substr(1, boundary.size() - 2);
  if (boundary.empty())
    return std::nullopt;
  return boundary;
}

// Reads a quoted or bare parameter such as name="chunk" from a header value.
static std::optional<std::string> headerParam(const std::string &header,
                                              const std::string &key) {
  const std::string lowered = toLower(header);
  size_t pos = 0;
  while ((pos = lowered.find(key + "=", pos)) != std::string::npos) {
    // Make sure we matched a whole parameter name, not "filename" for "name".
    if (pos > 0 && lowered[pos - 1] != ' ' && lowered[pos - 1] != ';') {
      pos += key.size();
      continue;
    }
    size_t valueStart = pos + key.size() + 1;
    if (valueStart < header.size() && header[valueStart] == '"') {
      size_t close = header.find('"', valueStart + 1);
      if (close == std::string::npos)
        return std::nullopt;
      return header.substr(valueStart + 1, close - valueStart - 1);
    }
    size_t end = header.find(';', valueStart);
    return trim(header.substr(valueStart, end == std::string::npos
                                              ? std::string::npos
                                              : end - valueStart));
  }
  return std::nullopt;
}

std::vector<FormPart> ParseMultipartFormData(const std::string &body,
                                             const std::string &boundary) {
  const std::string delimiter = "--" + boundary;
  std::vector<FormPart> parts;

  size_t pos = body.find(delimiter);
  if (pos == std::string::npos)
    throw std::invalid_argument("multipart body does not contain boundary");

  while (true) {
    pos += delimiter.size();
    if (body.compare(pos, 2, "--") == 0)
      break; // closing delimiter
    if (body.compare(pos, 2, "\r\n") != 0)
      throw std::invalid_argument("malformed multipart delimiter line");
    pos += 2;

    size_t headerEnd = body.find("\r\n\r\n", pos);
    if (headerEnd == std::string::npos)
      throw std::invalid_argument("multipart part without header terminator");

    FormPart part;
    std::istringstream headerStream(body.substr(pos, headerEnd - pos));
    std::string line;
    while (std::getline(headerStream, line)) {
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      size_t colon = line.find(':');
      if (colon == std::string::npos)
        continue;
      std::string name = toLower(trim(line.substr(0, colon)));
      std::string value = trim(line.substr(colon + 1));
      if (name == "content-disposition") {
        part.name = headerParam(value, "name").value_or("");
        part.filename = headerParam(value, "filename");
      } else if (name == "content-type") {
        part.contentType = value;
      }
    }

    size_t dataStart = headerEnd + 4;
    size_t next = body.find("\r\n" + delimiter, dataStart);
    if (next == std::string::npos)
      throw std::invalid_argument("multipart part is not terminated");
    part.data = body.substr(dataStart, next - dataStart);
    parts.push_back(std::move(part));
    pos = next + 2;
  }
  return parts;
}

} // namespace HTTP
} // namespace chunkforge
