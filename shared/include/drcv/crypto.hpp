/**
 * drcv - Randomness helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <string>

namespace drcv::crypto
{

    // Lowercase alphanumeric token drawn uniformly from [a-z0-9].
    std::string random_token(std::size_t length);

} // namespace drcv::crypto
