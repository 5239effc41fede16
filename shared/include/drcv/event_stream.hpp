/**
 * drcv - Server-Sent Events framing for the change feed.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "drcv/protocol.hpp"

namespace drcv::protocol
{

    struct DecodedEvent
    {
        std::string name;
        nlohmann::json data;
        std::size_t bytes_consumed{};
    };

    std::string encode_event(const ChangeFeedEvent &event);

    std::string encode_event(std::string_view name, const nlohmann::json &data);

    // Returns nullopt until a full event (terminated by a blank line) is buffered.
    std::optional<DecodedEvent> try_decode_event(std::string_view buffer);

} // namespace drcv::protocol
