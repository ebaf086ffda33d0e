#ifndef INCLUDE_SIGIL_CORE_SECRETVAULTMANAGER_HPP
#define INCLUDE_SIGIL_CORE_SECRETVAULTMANAGER_HPP

#include "sigil/core/CipherService.hpp"
#include "sigil/core/KeyDerivationService.hpp"
#include "sigil/core/MasterSecretAuthenticator.hpp"
#include "sigil/core/Records.hpp"
#include "sigil/core/VaultErrors.hpp"
#include "sigil/log/Logger.hpp"
#include "sigil/security/SecureMemory.hpp"
#include "sigil/storage/IStorageRepository.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sigil::core
{

// Secrets and their version history. Every encryption uses a fresh salt, a fresh base nonce and
// one key derivation; the three fields are sealed under per-field nonces derived from the base.
class SecretVaultManager final
{
public:
    SecretVaultManager(KeyDerivationService& kdf, CipherService& cipher, MasterSecretAuthenticator& authenticator,
                       sigil::storage::IStorageRepository& storage, sigil::log::ILogger& logger) noexcept;

    [[nodiscard]] VaultResult<SecretEnvelope> encryptSecret(const SecretFields& fields,
                                                            const sigil::security::SecureString& masterPassword) noexcept;

    // Fingerprint check first (InvalidMasterPassword), then AEAD (AuthenticationFailure).
    [[nodiscard]] VaultResult<SecretFields> decryptSecret(const SecretEnvelope& envelope,
                                                          const sigil::security::SecureString& masterPassword) const
        noexcept;

    // Decrypts, merges `changes`, re-encrypts from scratch.
    [[nodiscard]] VaultResult<SecretEnvelope>
    updateSecretEnvelope(const SecretEnvelope& envelope, const SecretChanges& changes,
                         const sigil::security::SecureString& masterPassword) noexcept;

    // Requires the user's master password; stores the secret and version 1 together.
    [[nodiscard]] VaultResult<SecretRecord> createSecret(std::string_view userId, const SecretMetadata& metadata,
                                                         const SecretFields& fields,
                                                         const sigil::security::SecureString& masterPassword) noexcept;

    [[nodiscard]] VaultResult<SecretFields> getSecret(std::string_view userId, std::string_view secretId,
                                                      const sigil::security::SecureString& masterPassword) const
        noexcept;

    [[nodiscard]] VaultResult<SecretRecord> updateSecret(std::string_view userId, std::string_view secretId,
                                                         const SecretChanges& changes,
                                                         const sigil::security::SecureString& masterPassword) noexcept;

    // Soft delete; the record stays listable through its versions.
    [[nodiscard]] VaultResult<SecretRecord> deleteSecret(std::string_view userId, std::string_view secretId) noexcept;

    // Active secrets, metadata only, ordered by title.
    [[nodiscard]] VaultResult<std::vector<SecretRecord>> listSecrets(std::string_view userId,
                                                                     const SecretFilter& filter = {}) const noexcept;

    // Distinct categories of the active secrets, ascending.
    [[nodiscard]] VaultResult<std::vector<std::string>> listCategories(std::string_view userId) const noexcept;

    [[nodiscard]] VaultResult<SecretVersion> snapshotVersion(const SecretRecord& record) noexcept;

    // Ascending by version number.
    [[nodiscard]] VaultResult<std::vector<SecretVersion>> listVersions(std::string_view userId,
                                                                       std::string_view secretId) const noexcept;

    [[nodiscard]] VaultResult<SecretFields> decryptVersion(std::string_view userId, std::string_view secretId,
                                                           std::uint32_t version,
                                                           const sigil::security::SecureString& masterPassword) const
        noexcept;

    // Verifies against the snapshot's own key material, then rewrites the live record from it
    // under fresh salt and nonce and records that as a new version.
    [[nodiscard]] VaultResult<SecretRecord> restoreVersion(std::string_view userId, std::string_view secretId,
                                                           std::uint32_t targetVersion,
                                                           const sigil::security::SecureString& masterPassword) noexcept;

    // Moves every active secret sealed under `current` to `replacement`, one version each.
    // Secrets sealed under another password are left untouched. Returns the number moved.
    [[nodiscard]] VaultResult<std::size_t> reencryptAll(std::string_view userId,
                                                        const sigil::security::SecureString& current,
                                                        const sigil::security::SecureString& replacement) noexcept;

private:
    [[nodiscard]] SecretEnvelope seal(const SecretFields& fields, const sigil::security::SecureString& masterPassword);
    [[nodiscard]] SecretFields open(const SecretEnvelope& envelope, const DerivedKey& key,
                                    std::string_view context) const;
    [[nodiscard]] SecretRecord requireActive(std::string_view userId, std::string_view secretId) const;
    [[nodiscard]] SecretVersion versionDraftOf(const SecretRecord& record) const;

    KeyDerivationService* m_kdf{ nullptr };
    CipherService* m_cipher{ nullptr };
    MasterSecretAuthenticator* m_authenticator{ nullptr };
    sigil::storage::IStorageRepository* m_storage{ nullptr };
    sigil::log::ILogger* m_logger{ nullptr };
};

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_SECRETVAULTMANAGER_HPP
