#include "drcv/error_codes.hpp"

#include <array>

namespace drcv
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            unsigned status;
        };

        constexpr std::array<ErrorCodeDescription, 8> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::InvalidPayload, "invalid_payload", 400},
            {ErrorCode::PayloadTooLarge, "payload_too_large", 413},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::Timeout, "timeout", 408},
            {ErrorCode::StorageFailure, "storage_failure", 500},
            {ErrorCode::Unsupported, "unsupported", 405},
            {ErrorCode::InternalError, "internal_error", 500},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    unsigned http_status(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.status;
            }
        }
        return 500;
    }

} // namespace drcv
