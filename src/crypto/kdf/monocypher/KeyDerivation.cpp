#include "sigil/crypto/KeyDerivation.hpp"

#include "monocypher.h"

#include <limits>
#include <new>
#include <stdexcept>
#include <vector>

namespace sigil::crypto
{

void requireArgon2idParamsSafe(const Argon2idParams& params)
{
    if (params.iterations == 0U || params.parallelism == 0U)
    {
        throw std::invalid_argument("argon2id: invalid parameters");
    }

    constexpr std::uint32_t kParallelismCap{ 16U };
    constexpr std::uint32_t kMemoryKiBCap{ 1024U * 1024U };
    constexpr std::uint32_t kIterationsCap{ 10U };
    if (params.parallelism > kParallelismCap || params.memoryKiB > kMemoryKiBCap || params.iterations > kIterationsCap)
    {
        throw std::invalid_argument("argon2id: unsafe parameters");
    }

    if (params.memoryKiB < params.parallelism * 8U)
    {
        throw std::invalid_argument("argon2id: memory below 8 KiB per lane");
    }
    if ((params.memoryKiB % (params.parallelism * 4U)) != 0U)
    {
        throw std::invalid_argument("argon2id: memory must be a multiple of 4 KiB per lane");
    }
}

sigil::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> password, std::span<const std::byte> salt,
                                                const Argon2idParams& params)
{
    requireArgon2idParamsSafe(params);

    if (salt.size() < g_argon2MinSaltBytes)
    {
        throw std::invalid_argument("argon2id: salt too short");
    }
    if (password.size() > std::numeric_limits<std::uint32_t>::max() ||
        salt.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("argon2id: input too large");
    }

    // One block is 1 KiB, i.e. 128 words of 64 bits.
    constexpr std::size_t kWordsPerBlock{ 128U };
    if (params.memoryKiB > (std::numeric_limits<std::size_t>::max() / kWordsPerBlock))
    {
        throw std::bad_alloc{};
    }
    std::vector<std::uint64_t, sigil::security::ZeroAllocator<std::uint64_t>> workArea(
        static_cast<std::size_t>(params.memoryKiB) * kWordsPerBlock);

    sigil::security::SecureBuffer key(g_derivedKeyBytes);

    const crypto_argon2_config config{
        .algorithm = CRYPTO_ARGON2_ID,
        .nb_blocks = params.memoryKiB,
        .nb_passes = params.iterations,
        .nb_lanes = params.parallelism,
    };
    const crypto_argon2_inputs inputs{
        .pass = reinterpret_cast<const std::uint8_t*>(password.data()),
        .salt = reinterpret_cast<const std::uint8_t*>(salt.data()),
        .pass_size = static_cast<std::uint32_t>(password.size()),
        .salt_size = static_cast<std::uint32_t>(salt.size()),
    };

    crypto_argon2(key.data(), static_cast<std::uint32_t>(key.size()), workArea.data(), config, inputs,
                  crypto_argon2_no_extras);
    return key;
}

} // namespace sigil::crypto
