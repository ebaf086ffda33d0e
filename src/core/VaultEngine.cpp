#include "sigil/core/VaultEngine.hpp"

#include "ErrorMapping.hpp"
#include "sigil/core/RecordIds.hpp"
#include "sigil/crypto/KeyDerivation.hpp"
#include <string>

namespace sigil::core
{

VaultEngine::VaultEngine(sigil::crypto::ICryptoProvider& crypto, sigil::storage::IStorageRepository& storage,
                         sigil::log::ILogger& logger, const EngineConfig& config)
    : m_config(config), m_storage(&storage), m_logger(&logger), m_kdf(crypto, config.argon2id), m_cipher(crypto),
      m_authenticator(m_kdf, storage, logger), m_secrets(m_kdf, m_cipher, m_authenticator, storage, logger),
      m_notes(m_secrets, m_authenticator, storage, logger),
      m_backup(crypto, m_authenticator, storage, logger, config.backupPbkdf2Iterations, config.backupScheme),
      m_plaintext(m_secrets, m_notes, m_authenticator, storage, logger)
{
    sigil::crypto::requireArgon2idParamsSafe(m_config.argon2id);
    if (m_config.backupPbkdf2Iterations == 0U)
    {
        throw std::invalid_argument("backup PBKDF2 iterations must be positive");
    }
}

VaultResult<UserProfile> VaultEngine::createUser(std::string_view email, std::string_view firstName,
                                                 std::string_view lastName) noexcept
{
    return detail::guarded<UserProfile>(*m_logger, "createUser", [&]() -> VaultResult<UserProfile> {
        if (email.empty())
        {
            return VaultError::InvalidArgument;
        }
        UserProfile user{};
        user.id = makeRecordId();
        user.email = std::string{ email };
        user.firstName = std::string{ firstName };
        user.lastName = std::string{ lastName };
        user.createdAt = isoTimestampNow();
        m_storage->insertUser(user);
        m_logger->info("user {} created", user.id);
        return user;
    });
}

VaultResult<UserProfile> VaultEngine::loadUser(std::string_view userId) const noexcept
{
    return detail::guarded<UserProfile>(*m_logger, "loadUser", [&]() -> VaultResult<UserProfile> {
        auto user{ m_storage->loadUser(userId) };
        if (!user)
        {
            return VaultError::UserNotFound;
        }
        return std::move(*user);
    });
}

VaultResult<DerivedKey> VaultEngine::deriveKey(const sigil::security::SecureString& password,
                                               std::string_view saltHex) const noexcept
{
    return detail::guarded<DerivedKey>(*m_logger, "deriveKey",
                                       [&]() -> VaultResult<DerivedKey> { return m_kdf.derive(password, saltHex); });
}

VaultResult<bool> VaultEngine::hasMasterPassword(std::string_view userId) const noexcept
{
    return m_authenticator.hasMasterPassword(userId);
}

VaultResult<std::monostate> VaultEngine::verifyMasterPassword(std::string_view userId,
                                                              const sigil::security::SecureString& password) const
    noexcept
{
    return m_authenticator.verifyUser(userId, password);
}

VaultResult<MasterKeyRecord>
VaultEngine::setMasterPassword(std::string_view userId,
                               const std::optional<sigil::security::SecureString>& currentPassword,
                               const sigil::security::SecureString& newPassword) noexcept
{
    const MasterKeyRotation rekey{ [this, userId](const sigil::security::SecureString& current,
                                                  const sigil::security::SecureString& replacement)
                                       -> std::optional<VaultError> {
        const auto secrets{ m_secrets.reencryptAll(userId, current, replacement) };
        if (const auto* error{ std::get_if<VaultError>(&secrets) })
        {
            return *error;
        }
        const auto notes{ m_notes.reencryptAll(userId, current, replacement) };
        if (const auto* error{ std::get_if<VaultError>(&notes) })
        {
            return *error;
        }
        m_logger->info("re-keyed {} secrets and {} secure notes for user {}", std::get<std::size_t>(secrets),
                       std::get<std::size_t>(notes), userId);
        return std::nullopt;
    } };
    return m_authenticator.setOrChange(userId, currentPassword, newPassword, rekey);
}

VaultResult<SecretEnvelope> VaultEngine::encryptSecret(const SecretFields& fields,
                                                       const sigil::security::SecureString& masterPassword) noexcept
{
    return m_secrets.encryptSecret(fields, masterPassword);
}

VaultResult<SecretFields> VaultEngine::decryptSecret(const SecretEnvelope& envelope,
                                                     const sigil::security::SecureString& masterPassword) const
    noexcept
{
    return m_secrets.decryptSecret(envelope, masterPassword);
}

VaultResult<SecretEnvelope> VaultEngine::updateSecretEnvelope(const SecretEnvelope& envelope,
                                                              const SecretChanges& changes,
                                                              const sigil::security::SecureString& masterPassword) noexcept
{
    return m_secrets.updateSecretEnvelope(envelope, changes, masterPassword);
}

VaultResult<SecretRecord> VaultEngine::createSecret(std::string_view userId, const SecretMetadata& metadata,
                                                    const SecretFields& fields,
                                                    const sigil::security::SecureString& masterPassword) noexcept
{
    return m_secrets.createSecret(userId, metadata, fields, masterPassword);
}

VaultResult<SecretFields> VaultEngine::getSecret(std::string_view userId, std::string_view secretId,
                                                 const sigil::security::SecureString& masterPassword) const noexcept
{
    return m_secrets.getSecret(userId, secretId, masterPassword);
}

VaultResult<SecretRecord> VaultEngine::updateSecret(std::string_view userId, std::string_view secretId,
                                                    const SecretChanges& changes,
                                                    const sigil::security::SecureString& masterPassword) noexcept
{
    return m_secrets.updateSecret(userId, secretId, changes, masterPassword);
}

VaultResult<SecretRecord> VaultEngine::deleteSecret(std::string_view userId, std::string_view secretId) noexcept
{
    return m_secrets.deleteSecret(userId, secretId);
}

VaultResult<std::vector<SecretRecord>> VaultEngine::listSecrets(std::string_view userId,
                                                               const SecretFilter& filter) const noexcept
{
    return m_secrets.listSecrets(userId, filter);
}

VaultResult<std::vector<std::string>> VaultEngine::listCategories(std::string_view userId) const noexcept
{
    return m_secrets.listCategories(userId);
}

VaultResult<SecretVersion> VaultEngine::snapshotVersion(const SecretRecord& record) noexcept
{
    return m_secrets.snapshotVersion(record);
}

VaultResult<std::vector<SecretVersion>> VaultEngine::listVersions(std::string_view userId,
                                                                  std::string_view secretId) const noexcept
{
    return m_secrets.listVersions(userId, secretId);
}

VaultResult<SecretFields> VaultEngine::decryptVersion(std::string_view userId, std::string_view secretId,
                                                      std::uint32_t version,
                                                      const sigil::security::SecureString& masterPassword) const noexcept
{
    return m_secrets.decryptVersion(userId, secretId, version, masterPassword);
}

VaultResult<SecretRecord> VaultEngine::restoreVersion(std::string_view userId, std::string_view secretId,
                                                      std::uint32_t targetVersion,
                                                      const sigil::security::SecureString& masterPassword) noexcept
{
    return m_secrets.restoreVersion(userId, secretId, targetVersion, masterPassword);
}

VaultResult<NoteRecord> VaultEngine::createNote(std::string_view userId, const NoteDraft& draft,
                                                const std::optional<sigil::security::SecureString>& masterPassword) noexcept
{
    return m_notes.createNote(userId, draft, masterPassword);
}

VaultResult<NoteView> VaultEngine::getNote(std::string_view userId, std::string_view noteId,
                                           const std::optional<sigil::security::SecureString>& masterPassword) const
    noexcept
{
    return m_notes.getNote(userId, noteId, masterPassword);
}

VaultResult<NoteRecord> VaultEngine::updateNote(std::string_view userId, std::string_view noteId,
                                                const NoteChanges& changes,
                                                const std::optional<sigil::security::SecureString>& masterPassword) noexcept
{
    return m_notes.updateNote(userId, noteId, changes, masterPassword);
}

VaultResult<std::monostate> VaultEngine::deleteNote(std::string_view userId, std::string_view noteId) noexcept
{
    return m_notes.deleteNote(userId, noteId);
}

VaultResult<std::vector<NoteRecord>> VaultEngine::listNotes(std::string_view userId) const noexcept
{
    return m_notes.listNotes(userId);
}

VaultResult<BackupArtifact> VaultEngine::exportBackup(std::string_view userId,
                                                      const sigil::security::SecureString& masterPassword) noexcept
{
    return m_backup.exportBackup(userId, masterPassword);
}

VaultResult<ParsedBackup> VaultEngine::importBackup(std::string_view artifact,
                                                    const sigil::security::SecureString& masterPassword) const noexcept
{
    return m_backup.importBackup(artifact, masterPassword);
}

VaultResult<RestoreSummary> VaultEngine::restoreInto(std::string_view userId, const ParsedBackup& backup) noexcept
{
    return m_backup.restoreInto(userId, backup);
}

VaultResult<RestoreSummary> VaultEngine::restoreBackup(std::string_view userId, std::string_view artifact,
                                                       const sigil::security::SecureString& masterPassword) noexcept
{
    const auto parsed{ m_backup.importBackup(artifact, masterPassword) };
    if (const auto* error{ std::get_if<VaultError>(&parsed) })
    {
        return *error;
    }
    return m_backup.restoreInto(userId, std::get<ParsedBackup>(parsed));
}

VaultResult<PlaintextExport> VaultEngine::exportPlaintext(std::string_view userId,
                                                         const sigil::security::SecureString& masterPassword) const
    noexcept
{
    return m_plaintext.exportPlaintext(userId, masterPassword);
}

VaultResult<sigil::security::SecureString> VaultEngine::generatePassword(const PasswordOptions& options) const noexcept
{
    return sigil::core::generatePassword(options);
}

StrengthReport VaultEngine::analyzePasswordStrength(std::string_view password) const
{
    return sigil::core::analyzePasswordStrength(password);
}

} // namespace sigil::core
