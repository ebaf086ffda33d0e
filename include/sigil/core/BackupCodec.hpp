#ifndef INCLUDE_SIGIL_CORE_BACKUPCODEC_HPP
#define INCLUDE_SIGIL_CORE_BACKUPCODEC_HPP

#include "sigil/core/EngineConfig.hpp"
#include "sigil/core/MasterSecretAuthenticator.hpp"
#include "sigil/core/Records.hpp"
#include "sigil/core/VaultErrors.hpp"
#include "sigil/crypto/ICryptoProvider.hpp"
#include "sigil/log/Logger.hpp"
#include "sigil/security/SecureMemory.hpp"
#include "sigil/storage/IStorageRepository.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sigil::core
{

constexpr std::size_t g_backupSaltBytes{ 32 };
constexpr std::size_t g_backupIvBytes{ 16 };

struct BackupMetadata final
{
    std::size_t totalCredentials{ 0U };
    std::size_t totalVersions{ 0U };
    std::size_t totalNotes{ 0U };
    std::size_t backupSize{ 0U }; // artifact length; always 0 inside the encrypted document
    std::string formatVersion;
};

struct BackupArtifact final
{
    std::string data; // base64(SALT32 || IV16 || CIPHERTEXT)
    BackupMetadata metadata;
};

struct ParsedBackup final
{
    std::string version; // document schema, "1.0"
    BackupScheme scheme{ BackupScheme::AuthenticatedGcm };
    std::string timestamp;
    UserProfile user;
    std::vector<SecretRecord> secrets;
    std::vector<SecretVersion> versions;
    std::vector<NoteRecord> notes;
    BackupMetadata metadata;
    std::size_t notesDropped{ 0U };
};

struct RestoreSummary final
{
    std::size_t secretsRestored{ 0U };
    std::size_t versionsRestored{ 0U };
    std::size_t versionsDropped{ 0U };
    std::size_t notesRestored{ 0U };
    std::size_t notesDropped{ 0U };
};

// Whole-vault export and import. The document keeps every secret envelope verbatim and is sealed
// under its own PBKDF2-SHA256 key, either AES-256-GCM (format 2.0) or AES-256-CBC (format 1.0).
// The format is recorded in metadata.formatVersion; the top-level "version" stays "1.0".
class BackupCodec final
{
public:
    BackupCodec(sigil::crypto::ICryptoProvider& crypto, MasterSecretAuthenticator& authenticator,
                sigil::storage::IStorageRepository& storage, sigil::log::ILogger& logger,
                std::uint32_t pbkdf2Iterations, BackupScheme scheme) noexcept;

    [[nodiscard]] VaultResult<BackupArtifact> exportBackup(std::string_view userId,
                                                           const sigil::security::SecureString& masterPassword) noexcept;

    // Accepts both formats. A password that opens neither is InvalidMasterPassword; anything that
    // decrypts but does not hold a backup document is CorruptArtifact. Secure notes that carry no
    // key material are skipped and counted in notesDropped.
    [[nodiscard]] VaultResult<ParsedBackup> importBackup(std::string_view artifact,
                                                         const sigil::security::SecureString& masterPassword) const
        noexcept;

    // Inserts everything under fresh ids in one transaction. Versions whose secret is not part of
    // the backup are dropped.
    [[nodiscard]] VaultResult<RestoreSummary> restoreInto(std::string_view userId, const ParsedBackup& backup) noexcept;

private:
    [[nodiscard]] sigil::security::SecureBuffer backupKey(const sigil::security::SecureString& masterPassword,
                                                          std::span<const std::uint8_t> salt) const;

    sigil::crypto::ICryptoProvider* m_crypto{ nullptr };
    MasterSecretAuthenticator* m_authenticator{ nullptr };
    sigil::storage::IStorageRepository* m_storage{ nullptr };
    sigil::log::ILogger* m_logger{ nullptr };
    std::uint32_t m_iterations{ g_defaultBackupPbkdf2Iterations };
    BackupScheme m_scheme{ BackupScheme::AuthenticatedGcm };
};

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_BACKUPCODEC_HPP
