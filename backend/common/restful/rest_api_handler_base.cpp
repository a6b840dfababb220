#include "rest_api_handler_base.hpp"

#include <stdexcept>

namespace common {

http::response<http::string_body> RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, "application/json");
  // job and artifact state changes between polls
  res.set(http::field::cache_control, "no-store");
  res.body() = json.dump();
  res.prepare_payload();
  return res;
}

http::response<http::string_body> RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {

  if (status >= http::status::internal_server_error) {
    LOG_WARN("http", static_cast<unsigned>(status) << " " << message);
  }
  return createJsonResponse(status, nlohmann::json{{"success", false}, {"error", message}});
}

nlohmann::json RestApiHandlerBase::parseRequestBody(const std::string& body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }

  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded()) {
    throw std::invalid_argument("Invalid JSON in request body");
  }
  if (!json.is_object()) {
    throw std::invalid_argument("Request body must be a JSON object");
  }
  return json;
}

}
