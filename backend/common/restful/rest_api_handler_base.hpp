#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "common/logger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

// Byte span of a file sent as the response body
struct FileSlice {
  std::filesystem::path path;
  std::uint64_t offset{0};
  std::uint64_t length{0};
};

// Headers (and body, when no file is attached) of a reply. When `file` is set
// the session streams that slice; `message` must already carry Content-Length.
struct RestResponse {
  http::response<http::string_body> message;
  std::optional<FileSlice> file;

  RestResponse() = default;
  RestResponse(http::response<http::string_body>&& msg) : message(std::move(msg)) {}
};

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  RestResponse handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {

    auto addCorsHeaders = [](auto& res) {
      res.set(http::field::access_control_allow_origin, "*");
      res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
      res.set(http::field::access_control_allow_headers, "Content-Type, Authorization, Range");
      res.set(http::field::access_control_expose_headers,
              "Content-Range, Accept-Ranges, Content-Length, Content-Disposition");
    };

    const auto version = req.version();
    const auto keep_alive = req.keep_alive();

    if (req.method() == http::verb::options) {
      http::response<http::string_body> res{http::status::ok, version};
      addCorsHeaders(res);
      res.keep_alive(keep_alive);
      res.prepare_payload();
      return RestResponse{std::move(res)};
    }

    RestResponse response;
    try {
      response = doHandleRequest(std::move(req));
    } catch (const std::exception& e) {
      LOG_ERROR("http", "Unhandled error while serving request: " << e.what());
      response = RestResponse{createErrorResponse(http::status::internal_server_error,
                                                  "Internal server error: " + std::string(e.what()))};
    }
    addCorsHeaders(response.message);
    response.message.version(version);
    response.message.keep_alive(keep_alive);
    return response;
  }

protected:
  virtual RestResponse doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;

  http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);

  http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message);

  nlohmann::json parseRequestBody(const std::string& body);
};

}
