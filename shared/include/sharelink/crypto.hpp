/**
 * ShareLink - Randomness helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sharelink::crypto
{

    void ensure_sodium_init();

    // Bytes drawn from the libsodium CSPRNG.
    std::vector<std::byte> random_bytes(std::size_t count);

    // Uniformly distributed value in [0, upper_bound).
    std::uint32_t random_uniform(std::uint32_t upper_bound);

} // namespace sharelink::crypto
