#include "sigil/core/KeyDerivationService.hpp"

#include "sigil/core/VaultErrors.hpp"
#include "sigil/crypto/Encoding.hpp"
#include <exception>
#include <new>
#include <stdexcept>
#include <vector>

namespace sigil::core
{

KeyDerivationService::KeyDerivationService(sigil::crypto::ICryptoProvider& crypto,
                                           sigil::crypto::Argon2idParams params) noexcept
    : m_crypto(&crypto), m_params(params)
{
}

DerivedKey KeyDerivationService::derive(const sigil::security::SecureString& password, std::string_view saltHex) const
{
    const auto salt{ sigil::crypto::fromHex(saltHex) };
    if (!salt || salt->size() != g_kdfSaltBytes)
    {
        throw DerivationFailure("derive: salt must be 32 bytes of hex");
    }

    DerivedKey out{};
    try
    {
        out.key = m_crypto->deriveArgon2id(sigil::security::asBytes(password), std::as_bytes(std::span{ *salt }),
                                           m_params);
        out.fingerprint = fingerprintOf(out.key);
    }
    catch (const std::bad_alloc&)
    {
        throw DerivationFailure("derive: out of memory in argon2id");
    }
    catch (const std::exception& e)
    {
        throw DerivationFailure(e.what());
    }
    return out;
}

std::string KeyDerivationService::fingerprintOf(std::span<const std::uint8_t> key) const
{
    const auto digest{ m_crypto->sha256(key) };
    return sigil::crypto::toHex(digest);
}

std::string KeyDerivationService::generateSalt()
{
    return randomHex(g_kdfSaltBytes);
}

std::string KeyDerivationService::generateNonce()
{
    return randomHex(g_fieldNonceBytes);
}

std::string KeyDerivationService::randomHex(std::size_t bytes)
{
    std::vector<std::uint8_t> raw(bytes);
    if (!m_crypto->randomBytes(std::span<std::uint8_t>{ raw }))
    {
        throw RandomFailure("CSPRNG failure");
    }
    return sigil::crypto::toHex(raw);
}

} // namespace sigil::core
