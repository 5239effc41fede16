/**
 * drcv - multipart/form-data codec for chunk uploads.
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace drcv::multipart
{

    class MultipartError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct Part
    {
        std::string name;
        std::optional<std::string> filename{};
        std::string content_type{};
        std::string data;
    };

    // Extracts the boundary parameter of a multipart/form-data Content-Type.
    std::optional<std::string> boundary_from_content_type(std::string_view content_type);

    std::vector<Part> decode(std::string_view body, std::string_view boundary);

    std::string encode(const std::vector<Part> &parts, std::string_view boundary);

    const Part *find_part(const std::vector<Part> &parts, std::string_view name) noexcept;

} // namespace drcv::multipart
