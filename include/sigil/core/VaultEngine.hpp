#ifndef INCLUDE_SIGIL_CORE_VAULTENGINE_HPP
#define INCLUDE_SIGIL_CORE_VAULTENGINE_HPP

#include "sigil/core/BackupCodec.hpp"
#include "sigil/core/CipherService.hpp"
#include "sigil/core/EngineConfig.hpp"
#include "sigil/core/KeyDerivationService.hpp"
#include "sigil/core/MasterSecretAuthenticator.hpp"
#include "sigil/core/NoteService.hpp"
#include "sigil/core/PasswordTools.hpp"
#include "sigil/core/PlaintextExporter.hpp"
#include "sigil/core/Records.hpp"
#include "sigil/core/SecretVaultManager.hpp"
#include "sigil/core/VaultErrors.hpp"
#include "sigil/crypto/ICryptoProvider.hpp"
#include "sigil/log/Logger.hpp"
#include "sigil/security/SecureMemory.hpp"
#include "sigil/storage/IStorageRepository.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sigil::core
{

// The collaborator-facing API. Wired once per process over a crypto provider, a repository and a
// logger; every call is independent and the engine itself keeps no mutable state.
class VaultEngine final
{
public:
    VaultEngine(sigil::crypto::ICryptoProvider& crypto, sigil::storage::IStorageRepository& storage,
                sigil::log::ILogger& logger, const EngineConfig& config = {});

    VaultEngine(const VaultEngine&) = delete;
    VaultEngine& operator=(const VaultEngine&) = delete;
    VaultEngine(VaultEngine&&) = delete;
    VaultEngine& operator=(VaultEngine&&) = delete;
    ~VaultEngine() = default;

    [[nodiscard]] const EngineConfig& config() const noexcept
    {
        return m_config;
    }

    // Users

    [[nodiscard]] VaultResult<UserProfile> createUser(std::string_view email, std::string_view firstName,
                                                      std::string_view lastName) noexcept;
    [[nodiscard]] VaultResult<UserProfile> loadUser(std::string_view userId) const noexcept;

    // Keys and the master password

    [[nodiscard]] VaultResult<DerivedKey> deriveKey(const sigil::security::SecureString& password,
                                                    std::string_view saltHex) const noexcept;
    [[nodiscard]] VaultResult<bool> hasMasterPassword(std::string_view userId) const noexcept;
    [[nodiscard]] VaultResult<std::monostate>
    verifyMasterPassword(std::string_view userId, const sigil::security::SecureString& password) const noexcept;

    // Replacing an existing password re-encrypts every live secret and secure note in the same
    // transaction as the new MasterKeyRecord.
    [[nodiscard]] VaultResult<MasterKeyRecord>
    setMasterPassword(std::string_view userId, const std::optional<sigil::security::SecureString>& currentPassword,
                      const sigil::security::SecureString& newPassword) noexcept;

    // Envelopes

    [[nodiscard]] VaultResult<SecretEnvelope> encryptSecret(const SecretFields& fields,
                                                            const sigil::security::SecureString& masterPassword) noexcept;
    [[nodiscard]] VaultResult<SecretFields> decryptSecret(const SecretEnvelope& envelope,
                                                          const sigil::security::SecureString& masterPassword) const
        noexcept;
    [[nodiscard]] VaultResult<SecretEnvelope>
    updateSecretEnvelope(const SecretEnvelope& envelope, const SecretChanges& changes,
                         const sigil::security::SecureString& masterPassword) noexcept;

    // Secret records

    [[nodiscard]] VaultResult<SecretRecord> createSecret(std::string_view userId, const SecretMetadata& metadata,
                                                         const SecretFields& fields,
                                                         const sigil::security::SecureString& masterPassword) noexcept;
    [[nodiscard]] VaultResult<SecretFields> getSecret(std::string_view userId, std::string_view secretId,
                                                      const sigil::security::SecureString& masterPassword) const
        noexcept;
    [[nodiscard]] VaultResult<SecretRecord> updateSecret(std::string_view userId, std::string_view secretId,
                                                         const SecretChanges& changes,
                                                         const sigil::security::SecureString& masterPassword) noexcept;
    [[nodiscard]] VaultResult<SecretRecord> deleteSecret(std::string_view userId, std::string_view secretId) noexcept;
    [[nodiscard]] VaultResult<std::vector<SecretRecord>> listSecrets(std::string_view userId,
                                                                     const SecretFilter& filter = {}) const noexcept;
    [[nodiscard]] VaultResult<std::vector<std::string>> listCategories(std::string_view userId) const noexcept;

    // Versions

    [[nodiscard]] VaultResult<SecretVersion> snapshotVersion(const SecretRecord& record) noexcept;
    [[nodiscard]] VaultResult<std::vector<SecretVersion>> listVersions(std::string_view userId,
                                                                       std::string_view secretId) const noexcept;
    [[nodiscard]] VaultResult<SecretFields> decryptVersion(std::string_view userId, std::string_view secretId,
                                                           std::uint32_t version,
                                                           const sigil::security::SecureString& masterPassword) const
        noexcept;
    [[nodiscard]] VaultResult<SecretRecord> restoreVersion(std::string_view userId, std::string_view secretId,
                                                           std::uint32_t targetVersion,
                                                           const sigil::security::SecureString& masterPassword) noexcept;

    // Notes

    [[nodiscard]] VaultResult<NoteRecord>
    createNote(std::string_view userId, const NoteDraft& draft,
               const std::optional<sigil::security::SecureString>& masterPassword = std::nullopt) noexcept;
    [[nodiscard]] VaultResult<NoteView>
    getNote(std::string_view userId, std::string_view noteId,
            const std::optional<sigil::security::SecureString>& masterPassword = std::nullopt) const noexcept;
    [[nodiscard]] VaultResult<NoteRecord>
    updateNote(std::string_view userId, std::string_view noteId, const NoteChanges& changes,
               const std::optional<sigil::security::SecureString>& masterPassword = std::nullopt) noexcept;
    [[nodiscard]] VaultResult<std::monostate> deleteNote(std::string_view userId, std::string_view noteId) noexcept;
    [[nodiscard]] VaultResult<std::vector<NoteRecord>> listNotes(std::string_view userId) const noexcept;

    // Backups

    [[nodiscard]] VaultResult<BackupArtifact> exportBackup(std::string_view userId,
                                                           const sigil::security::SecureString& masterPassword) noexcept;
    [[nodiscard]] VaultResult<ParsedBackup> importBackup(std::string_view artifact,
                                                         const sigil::security::SecureString& masterPassword) const
        noexcept;
    [[nodiscard]] VaultResult<RestoreSummary> restoreInto(std::string_view userId, const ParsedBackup& backup) noexcept;

    // importBackup followed by restoreInto.
    [[nodiscard]] VaultResult<RestoreSummary> restoreBackup(std::string_view userId, std::string_view artifact,
                                                            const sigil::security::SecureString& masterPassword) noexcept;

    // Unsealed JSON of every active secret and note, decrypted.
    [[nodiscard]] VaultResult<PlaintextExport>
    exportPlaintext(std::string_view userId, const sigil::security::SecureString& masterPassword) const noexcept;

    // Password tools

    [[nodiscard]] VaultResult<sigil::security::SecureString> generatePassword(const PasswordOptions& options) const
        noexcept;
    [[nodiscard]] StrengthReport analyzePasswordStrength(std::string_view password) const;

private:
    EngineConfig m_config;
    sigil::storage::IStorageRepository* m_storage{ nullptr };
    sigil::log::ILogger* m_logger{ nullptr };
    KeyDerivationService m_kdf;
    CipherService m_cipher;
    MasterSecretAuthenticator m_authenticator;
    SecretVaultManager m_secrets;
    NoteService m_notes;
    BackupCodec m_backup;
    PlaintextExporter m_plaintext;
};

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_VAULTENGINE_HPP
