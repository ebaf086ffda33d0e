#ifndef INCLUDE_SIGIL_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_SIGIL_CRYPTO_KEYDERIVATION_HPP

#include "sigil/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace sigil::crypto
{

constexpr std::size_t g_derivedKeyBytes{ 32 };
constexpr std::size_t g_argon2MinSaltBytes{ 8 };

struct Argon2idParams final
{
    std::uint32_t iterations{};
    std::uint32_t memoryKiB{};
    std::uint32_t parallelism{};

    friend bool operator==(const Argon2idParams&, const Argon2idParams&) = default;
};

// Throws std::invalid_argument for parameters Argon2id rejects or that exceed the safety caps.
void requireArgon2idParamsSafe(const Argon2idParams& params);

// Argon2id v1.3 raw hash, 32 bytes. Deterministic for equal inputs.
[[nodiscard]] sigil::security::SecureBuffer
deriveKeyArgon2id(std::span<const std::byte> password, std::span<const std::byte> salt, const Argon2idParams& params);

} // namespace sigil::crypto

#endif // INCLUDE_SIGIL_CRYPTO_KEYDERIVATION_HPP
