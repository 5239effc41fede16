/**
 * drcv - Error codes shared by the upload engine and both HTTP front ends.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace drcv
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidPayload = 1,
        PayloadTooLarge = 2,
        NotFound = 3,
        Timeout = 4,
        StorageFailure = 5,
        Unsupported = 6,
        InternalError = 7
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // HTTP status a client sees for the code.
    unsigned http_status(ErrorCode code) noexcept;

} // namespace drcv
