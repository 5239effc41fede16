#include "drcv/crypto.hpp"

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string_view>

#include <sodium.h>

namespace drcv::crypto
{

    namespace
    {

        constexpr std::string_view kTokenAlphabet = "abcdefghijklmnopqrstuvwxyz0123456789";

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    std::string random_token(std::size_t length)
    {
        ensure_initialized_once();
        std::string token;
        token.reserve(length);
        for (std::size_t i = 0; i < length; ++i)
        {
            const auto index = randombytes_uniform(static_cast<std::uint32_t>(kTokenAlphabet.size()));
            token.push_back(kTokenAlphabet[index]);
        }
        return token;
    }

} // namespace drcv::crypto
