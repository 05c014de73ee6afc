#include "chunkforge/utilities/http.hpp"
#include <gtest/gtest.h>

using namespace chunkforge;

TEST(HttpUtils, ParsesMergeRequest) {
  const std::string body = "{\"fileHash\":\"abc\"}";
  const std::string raw = "POST /merge HTTP/1.1\r\n"
                          "Content-Type: application/json\r\n"
                          "\r\n" +
                          body;

  auto parsed = HTTP::ParseHttpRequest(raw);
  EXPECT_EQ(parsed.method, HTTP::HttpMethod::POST);
  EXPECT_EQ(parsed.uri, "/merge");
  EXPECT_EQ(parsed.protocol, "HTTP/1.1");
  ASSERT_EQ(parsed.headers.at("Content-Type"), "application/json");
  EXPECT_EQ(parsed.body, body);
}

TEST(HttpUtils, ResponseCarriesLengthAndHeaders) {
  HTTP::HTTPRESPONSE res;
  res.statusCodeNumber = 409;
  res.reasonPhrase = HTTP::statusCode.at(409);
  res.contentType = "application/json";
  res.headers["Access-Control-Allow-Origin"] = "*";
  res.body = "{\"code\":1}";

  auto parsed = HTTP::ParseHttpResponse(HTTP::GenerateHttpResponseString(res));
  EXPECT_EQ(parsed.statusCodeNumber, 409);
  EXPECT_EQ(parsed.reasonPhrase, "Conflict");
  EXPECT_EQ(parsed.contentType, "application/json");
  EXPECT_EQ(parsed.headers.at("Content-Length"), "10");
  EXPECT_EQ(parsed.headers.at("Access-Control-Allow-Origin"), "*");
  EXPECT_EQ(parsed.body, res.body);
}

TEST(HttpUtils, FindHeaderIgnoresCase) {
  HTTP::HTTPREQUEST req;
  req.headers["content-length"] = "42";
  ASSERT_TRUE(HTTP::FindHeader(req, "Content-Length").has_value());
  EXPECT_EQ(*HTTP::FindHeader(req, "CONTENT-LENGTH"), "42");
  EXPECT_FALSE(HTTP::FindHeader(req, "Content-Type").has_value());
}

TEST(HttpUtils, QueryStringDecoding) {
  auto [path, query] = HTTP::SplitUri("/upload?fileHash=ab%2Fcd&hash=0-x+y&flag");
  EXPECT_EQ(path, "/upload");
  auto params = HTTP::ParseQueryString(query);
  EXPECT_EQ(params["fileHash"], "ab/cd");
  EXPECT_EQ(params["hash"], "0-x y");
  ASSERT_EQ(params.count("flag"), 1u);
  EXPECT_EQ(params["flag"], "");

  EXPECT_EQ(HTTP::SplitUri("/files").second, "");
}

TEST(HttpUtils, MultipartBoundaryExtraction) {
  EXPECT_EQ(HTTP::MultipartBoundary("multipart/form-data; boundary=XyZ"), "XyZ");
  EXPECT_EQ(HTTP::MultipartBoundary("Multipart/Form-Data; boundary=\"q q\"; x=1"),
            "q q");
  EXPECT_FALSE(HTTP::MultipartBoundary("application/json").has_value());
  EXPECT_FALSE(HTTP::MultipartBoundary("multipart/form-data").has_value());
}

TEST(HttpUtils, ParsesMultipartFormData) {
  const std::string boundary = "----chunkforge";
  std::string payload("AB\r\nC\0D", 7);
  std::string body = "--" + boundary + "\r\n" +
                     "Content-Disposition: form-data; name=\"chunk\"; "
                     "filename=\"blob\"\r\n"
                     "Content-Type: application/octet-stream\r\n\r\n" +
                     payload + "\r\n--" + boundary + "\r\n" +
                     "Content-Disposition: form-data; name=\"hash\"\r\n\r\n"
                     "0-abc\r\n--" + boundary + "--\r\n";

  auto parts = HTTP::ParseMultipartFormData(body, boundary);
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0].name, "chunk");
  ASSERT_TRUE(parts[0].filename.has_value());
  EXPECT_EQ(*parts[0].filename, "blob");
  EXPECT_EQ(parts[0].contentType, "application/octet-stream");
  EXPECT_EQ(parts[0].data, payload);
  EXPECT_EQ(parts[1].name, "hash");
  EXPECT_FALSE(parts[1].filename.has_value());
  EXPECT_EQ(parts[1].data, "0-abc");
}

TEST(HttpUtils, RejectsMalformedMultipart) {
  EXPECT_THROW(HTTP::ParseMultipartFormData("no delimiters here", "b"),
               std::invalid_argument);
  EXPECT_THROW(HTTP::ParseMultipartFormData(
                   "--b\r\nContent-Disposition: form-data; name=\"x\"\r\n\r\n"
                   "unterminated",
                   "b"),
               std::invalid_argument);
}
