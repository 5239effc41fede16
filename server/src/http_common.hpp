#pragma once

#include <boost/beast/http.hpp>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "drcv/error_codes.hpp"

namespace drcv::server::http_common
{

    namespace http = boost::beast::http;

    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;

    std::string_view request_target(const Request &request);

    std::string_view request_path(std::string_view target);

    // Percent-decodes a query component; '+' becomes a space.
    std::string url_decode(std::string_view value);

    std::optional<std::string> query_parameter(std::string_view target, std::string_view key);

    std::optional<std::string> header(const Request &request, http::field field);

    Response make_text_response(const Request &request, http::status status, std::string body);

    Response make_html_response(const Request &request, std::string body);

    Response make_json_response(const Request &request, const nlohmann::json &body);

    Response make_error_response(const Request &request, drcv::ErrorCode code, std::string message);

} // namespace drcv::server::http_common
