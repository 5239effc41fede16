#include "http_common.hpp"

#include <cctype>

#include "drcv/version.hpp"

namespace drcv::server::http_common
{

    namespace
    {
        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
            {
                return c - '0';
            }
            const auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (lower >= 'a' && lower <= 'f')
            {
                return lower - 'a' + 10;
            }
            return -1;
        }

        Response make_response(const Request &request, http::status status, std::string body,
                               std::string_view content_type)
        {
            Response response{status, request.version()};
            response.set(http::field::server, std::string("drcv/") + std::string(drcv::version()));
            response.set(http::field::content_type, std::string(content_type));
            response.keep_alive(request.keep_alive());
            response.body() = std::move(body);
            response.prepare_payload();
            return response;
        }
    } // namespace

    std::string_view request_target(const Request &request)
    {
        const auto target = request.target();
        return {target.data(), target.size()};
    }

    std::string_view request_path(std::string_view target)
    {
        return target.substr(0, target.find('?'));
    }

    std::string url_decode(std::string_view value)
    {
        std::string out;
        out.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            const char c = value[i];
            if (c == '+')
            {
                out.push_back(' ');
            }
            else if (c == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0 && hex_value(value[i + 2]) >= 0)
            {
                out.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2])));
                i += 2;
            }
            else
            {
                out.push_back(c);
            }
        }
        return out;
    }

    std::optional<std::string> query_parameter(std::string_view target, std::string_view key)
    {
        const auto question = target.find('?');
        if (question == std::string_view::npos)
        {
            return std::nullopt;
        }
        auto query = target.substr(question + 1);
        while (!query.empty())
        {
            const auto amp = query.find('&');
            const auto item = query.substr(0, amp);
            const auto eq = item.find('=');
            const auto name = url_decode(item.substr(0, eq));
            if (name == key)
            {
                return eq == std::string_view::npos ? std::string{} : url_decode(item.substr(eq + 1));
            }
            if (amp == std::string_view::npos)
            {
                break;
            }
            query.remove_prefix(amp + 1);
        }
        return std::nullopt;
    }

    std::optional<std::string> header(const Request &request, http::field field)
    {
        const auto it = request.find(field);
        if (it == request.end() || it->value().empty())
        {
            return std::nullopt;
        }
        return std::string(it->value().data(), it->value().size());
    }

    Response make_text_response(const Request &request, http::status status, std::string body)
    {
        return make_response(request, status, std::move(body), "text/plain; charset=utf-8");
    }

    Response make_html_response(const Request &request, std::string body)
    {
        return make_response(request, http::status::ok, std::move(body), "text/html; charset=utf-8");
    }

    Response make_json_response(const Request &request, const nlohmann::json &body)
    {
        return make_response(request, http::status::ok, body.dump(), "application/json");
    }

    Response make_error_response(const Request &request, drcv::ErrorCode code, std::string message)
    {
        const auto status = static_cast<http::status>(drcv::http_status(code));
        auto response = make_text_response(request, status, std::move(message));
        response.set("x-error-code", std::string(drcv::to_string(code)));
        return response;
    }

} // namespace drcv::server::http_common
