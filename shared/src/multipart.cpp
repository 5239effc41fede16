#include "drcv/multipart.hpp"

#include <algorithm>
#include <cctype>

namespace drcv::multipart
{

    namespace
    {
        constexpr std::string_view kCrlf = "\r\n";
        constexpr std::string_view kHeaderEnd = "\r\n\r\n";

        std::string to_lower(std::string_view value)
        {
            std::string out(value);
            std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        std::string unquote(std::string_view value)
        {
            value = trim(value);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            {
                value = value.substr(1, value.size() - 2);
            }
            return std::string(value);
        }

        // Finds `key=value` among `;`-separated parameters. Keys compare case-insensitively.
        std::optional<std::string> header_parameter(std::string_view header, std::string_view key)
        {
            const auto wanted = to_lower(key);
            std::size_t start = 0;
            while (start <= header.size())
            {
                auto end = header.find(';', start);
                if (end == std::string_view::npos)
                {
                    end = header.size();
                }
                const auto item = trim(header.substr(start, end - start));
                const auto eq = item.find('=');
                if (eq != std::string_view::npos && to_lower(trim(item.substr(0, eq))) == wanted)
                {
                    return unquote(item.substr(eq + 1));
                }
                start = end + 1;
            }
            return std::nullopt;
        }

        void parse_part_headers(std::string_view block, Part &part)
        {
            bool has_disposition = false;
            while (!block.empty())
            {
                auto end = block.find(kCrlf);
                const auto line = block.substr(0, end);
                const auto colon = line.find(':');
                if (colon != std::string_view::npos)
                {
                    const auto name = to_lower(trim(line.substr(0, colon)));
                    const auto value = trim(line.substr(colon + 1));
                    if (name == "content-disposition")
                    {
                        auto field = header_parameter(value, "name");
                        if (!field)
                        {
                            throw MultipartError("Content-Disposition without a name");
                        }
                        part.name = std::move(*field);
                        part.filename = header_parameter(value, "filename");
                        has_disposition = true;
                    }
                    else if (name == "content-type")
                    {
                        part.content_type = std::string(value);
                    }
                }
                if (end == std::string_view::npos)
                {
                    break;
                }
                block.remove_prefix(end + kCrlf.size());
            }
            if (!has_disposition)
            {
                throw MultipartError("Part is missing Content-Disposition");
            }
        }

    } // namespace

    std::optional<std::string> boundary_from_content_type(std::string_view content_type)
    {
        const auto semicolon = content_type.find(';');
        const auto media_type = to_lower(trim(content_type.substr(0, semicolon)));
        if (media_type != "multipart/form-data" || semicolon == std::string_view::npos)
        {
            return std::nullopt;
        }
        auto boundary = header_parameter(content_type.substr(semicolon + 1), "boundary");
        if (!boundary || boundary->empty() || boundary->size() > 70)
        {
            return std::nullopt;
        }
        return boundary;
    }

    std::vector<Part> decode(std::string_view body, std::string_view boundary)
    {
        if (boundary.empty())
        {
            throw MultipartError("Empty multipart boundary");
        }
        const std::string delimiter = "--" + std::string(boundary);
        const std::string separator = std::string(kCrlf) + delimiter;

        auto position = body.find(delimiter);
        if (position == std::string_view::npos)
        {
            throw MultipartError("Multipart boundary not found");
        }
        position += delimiter.size();

        std::vector<Part> parts;
        while (true)
        {
            const auto rest = body.substr(position);
            if (rest.starts_with("--"))
            {
                return parts;
            }
            if (!rest.starts_with(kCrlf))
            {
                throw MultipartError("Malformed multipart delimiter");
            }
            position += kCrlf.size();

            const auto header_end = body.find(kHeaderEnd, position);
            if (header_end == std::string_view::npos)
            {
                throw MultipartError("Unterminated part headers");
            }
            Part part{};
            parse_part_headers(body.substr(position, header_end - position), part);

            const auto content_begin = header_end + kHeaderEnd.size();
            const auto content_end = body.find(separator, content_begin);
            if (content_end == std::string_view::npos)
            {
                throw MultipartError("Unterminated part body");
            }
            part.data.assign(body.substr(content_begin, content_end - content_begin));
            parts.push_back(std::move(part));
            position = content_end + separator.size();
        }
    }

    std::string encode(const std::vector<Part> &parts, std::string_view boundary)
    {
        std::string out;
        for (const auto &part : parts)
        {
            out.append("--").append(boundary).append(kCrlf);
            out.append("Content-Disposition: form-data; name=\"").append(part.name).append("\"");
            if (part.filename)
            {
                out.append("; filename=\"").append(*part.filename).append("\"");
            }
            out.append(kCrlf);
            if (!part.content_type.empty())
            {
                out.append("Content-Type: ").append(part.content_type).append(kCrlf);
            }
            out.append(kCrlf);
            out.append(part.data);
            out.append(kCrlf);
        }
        out.append("--").append(boundary).append("--").append(kCrlf);
        return out;
    }

    const Part *find_part(const std::vector<Part> &parts, std::string_view name) noexcept
    {
        const auto it = std::find_if(parts.begin(), parts.end(), [name](const Part &part)
                                     { return part.name == name; });
        return it == parts.end() ? nullptr : &*it;
    }

} // namespace drcv::multipart
