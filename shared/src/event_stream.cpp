#include "drcv/event_stream.hpp"

#include <stdexcept>

namespace drcv::protocol
{

    namespace
    {
        constexpr std::string_view kEventPrefix = "event: ";
        constexpr std::string_view kDataPrefix = "data: ";
        constexpr std::string_view kTerminator = "\n\n";
    } // namespace

    std::string encode_event(const ChangeFeedEvent &event)
    {
        return encode_event(to_string(event.kind), nlohmann::json(event));
    }

    std::string encode_event(std::string_view name, const nlohmann::json &data)
    {
        if (name.find('\n') != std::string_view::npos)
        {
            throw std::invalid_argument("Event name must be a single line");
        }
        // dump() escapes control characters, so the payload stays on one data line.
        std::string frame;
        frame.append(kEventPrefix);
        frame.append(name);
        frame.push_back('\n');
        frame.append(kDataPrefix);
        frame.append(data.dump());
        frame.append(kTerminator);
        return frame;
    }

    std::optional<DecodedEvent> try_decode_event(std::string_view buffer)
    {
        const auto end = buffer.find(kTerminator);
        if (end == std::string_view::npos)
        {
            return std::nullopt;
        }

        DecodedEvent result{};
        std::string data_text;
        auto block = buffer.substr(0, end);
        while (!block.empty())
        {
            const auto newline = block.find('\n');
            const auto line = block.substr(0, newline);
            if (line.starts_with(kEventPrefix))
            {
                result.name = std::string(line.substr(kEventPrefix.size()));
            }
            else if (line.starts_with(kDataPrefix))
            {
                if (!data_text.empty())
                {
                    data_text.push_back('\n');
                }
                data_text.append(line.substr(kDataPrefix.size()));
            }
            if (newline == std::string_view::npos)
            {
                break;
            }
            block.remove_prefix(newline + 1);
        }

        result.data = data_text.empty() ? nlohmann::json() : nlohmann::json::parse(data_text);
        result.bytes_consumed = end + kTerminator.size();
        return result;
    }

} // namespace drcv::protocol
