#include "rest_api_handler_base.hpp"

namespace common {

http::response<http::string_body> RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, "application/json");
  res.set(http::field::cache_control, "no-cache");
  res.body() = json.dump();
  res.prepare_payload();
  return res;
}

http::response<http::string_body> RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {

  nlohmann::json error_json = {
    {"success", false},
    {"error", message}
  };
  return createJsonResponse(status, error_json);
}

StreamingResponse RestApiHandlerBase::createStreamingResponse(
  const std::string& content_type, StreamBody body) {

  StreamingResponse res;
  res.header = http::response<http::empty_body>{http::status::ok, 11};
  res.header.set(http::field::content_type, content_type);
  res.header.set(http::field::cache_control, "no-cache");
  res.body = std::move(body);
  return res;
}

}
