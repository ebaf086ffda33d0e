#ifndef INCLUDE_SIGIL_CORE_MASTERSECRETAUTHENTICATOR_HPP
#define INCLUDE_SIGIL_CORE_MASTERSECRETAUTHENTICATOR_HPP

#include "sigil/core/KeyDerivationService.hpp"
#include "sigil/core/Records.hpp"
#include "sigil/core/VaultErrors.hpp"
#include "sigil/log/Logger.hpp"
#include "sigil/security/SecureMemory.hpp"
#include "sigil/storage/IStorageRepository.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <variant>

namespace sigil::core
{

constexpr std::size_t g_minMasterPasswordChars{ 8 };

// Runs inside the master-key transaction when an existing password is replaced.
// Returning an error rolls the change back.
using MasterKeyRotation = std::function<std::optional<VaultError>(const sigil::security::SecureString& current,
                                                                  const sigil::security::SecureString& replacement)>;

class MasterSecretAuthenticator final
{
public:
    MasterSecretAuthenticator(KeyDerivationService& kdf, sigil::storage::IStorageRepository& storage,
                              sigil::log::ILogger& logger) noexcept;

    // Throws DerivationFailure.
    [[nodiscard]] bool verify(const sigil::security::SecureString& password, std::string_view storedFingerprint,
                              std::string_view storedSalt) const;

    // Like verify(), but keeps the derived key for the caller. Throws DerivationFailure.
    [[nodiscard]] std::optional<DerivedKey> verifyAndDerive(const sigil::security::SecureString& password,
                                                            std::string_view storedFingerprint,
                                                            std::string_view storedSalt) const;

    [[nodiscard]] VaultResult<bool> hasMasterPassword(std::string_view userId) const noexcept;

    // Checks `password` against the user's MasterKeyRecord.
    [[nodiscard]] VaultResult<std::monostate> verifyUser(std::string_view userId,
                                                         const sigil::security::SecureString& password) const noexcept;

    // Installs or replaces the master password. Salt and fingerprint are always regenerated together.
    [[nodiscard]] VaultResult<MasterKeyRecord>
    setOrChange(std::string_view userId, const std::optional<sigil::security::SecureString>& currentPassword,
                const sigil::security::SecureString& newPassword, const MasterKeyRotation& rotation = {}) noexcept;

private:
    KeyDerivationService* m_kdf{ nullptr };
    sigil::storage::IStorageRepository* m_storage{ nullptr };
    sigil::log::ILogger* m_logger{ nullptr };
};

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_MASTERSECRETAUTHENTICATOR_HPP
