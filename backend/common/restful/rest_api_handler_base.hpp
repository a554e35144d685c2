#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <variant>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

// Writes one chunk to the client; false once the connection is gone.
using ChunkWriter = std::function<bool(std::span<const std::uint8_t>)>;

// Produces the whole body through the writer. Returns true when the body is
// complete; false makes the session drop the connection without the final
// chunk so the client sees a truncated transfer.
using StreamBody = std::function<bool(const ChunkWriter&)>;

struct StreamingResponse {
  http::response<http::empty_body> header;
  StreamBody body;
};

using ApiResponse = std::variant<http::response<http::string_body>, StreamingResponse>;

// Header part of either response alternative.
inline http::response<http::string_body>& headerOf(http::response<http::string_body>& res) { return res; }
inline http::response<http::empty_body>& headerOf(StreamingResponse& res) { return res.header; }

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  ApiResponse handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {

    auto addCorsHeaders = [](auto& res) {
      auto& fields = headerOf(res);
      fields.set(http::field::access_control_allow_origin, "*");
      fields.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
      fields.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
      fields.set(http::field::access_control_expose_headers,
                 "Content-Disposition, X-Download-Id, X-Total-Size, X-Resume-Offset");
    };

    if (req.method() == http::verb::options) {
      http::response<http::string_body> res{http::status::ok, req.version()};
      addCorsHeaders(res);
      res.prepare_payload();
      return res;
    }

    try {
      auto response = doHandleRequest(std::move(req));
      std::visit([&](auto& res) { addCorsHeaders(res); }, response);
      return response;
    } catch (const std::exception& e) {
      auto response = createErrorResponse(http::status::internal_server_error,
                                        "Internal server error: " + std::string(e.what()));
      addCorsHeaders(response);
      return response;
    }
  }

protected:
  virtual ApiResponse doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;

  http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);

  http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message);

  StreamingResponse createStreamingResponse(
    const std::string& content_type, StreamBody body);
};

}
