#include "sigil/core/SecretVaultManager.hpp"

#include "ErrorMapping.hpp"
#include "sigil/core/RecordIds.hpp"
#include "sigil/crypto/Encoding.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <fmt/format.h>
#include <stdexcept>

namespace sigil::core
{
namespace
{

using FieldNonce = std::array<std::uint8_t, g_fieldNonceBytes>;

// Each field gets its own GCM nonce: the base nonce with the last byte tweaked by the slot.
enum class FieldSlot : std::uint8_t
{
    Identifier = 1,
    SecretValue = 2,
    Notes = 3,
};

[[nodiscard]] FieldNonce baseNonceOf(std::string_view ivHex)
{
    const auto raw{ sigil::crypto::fromHex(ivHex) };
    if (!raw || raw->size() != g_fieldNonceBytes)
    {
        throw std::invalid_argument("envelope iv must be 16 bytes of hex");
    }
    FieldNonce out{};
    std::copy(raw->begin(), raw->end(), out.begin());
    return out;
}

[[nodiscard]] FieldNonce fieldNonce(const FieldNonce& base, FieldSlot slot) noexcept
{
    FieldNonce out{ base };
    out.back() = static_cast<std::uint8_t>(out.back() ^ static_cast<std::uint8_t>(slot));
    return out;
}

[[nodiscard]] std::optional<std::string_view> viewOf(const std::optional<sigil::security::SecureString>& text) noexcept
{
    if (!text)
    {
        return std::nullopt;
    }
    return sigil::security::asStringView(*text);
}

[[nodiscard]] std::optional<std::string_view> viewOf(const std::optional<std::string>& text) noexcept
{
    if (!text)
    {
        return std::nullopt;
    }
    return std::string_view{ *text };
}

[[nodiscard]] std::string trimmed(std::string_view text)
{
    const auto blank{ [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; } };
    while (!text.empty() && blank(text.front()))
    {
        text.remove_prefix(1U);
    }
    while (!text.empty() && blank(text.back()))
    {
        text.remove_suffix(1U);
    }
    return std::string{ text };
}

// ASCII only; titles are compared byte-wise beyond that.
[[nodiscard]] std::string foldCase(std::string_view text)
{
    std::string out{ text };
    std::transform(out.begin(), out.end(), out.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    return out;
}

// Empty identifier or notes clears the field; an empty secret value is rejected later by seal().
void mergeSensitive(SecretFields& fields, const SecretChanges& changes)
{
    if (changes.identifier)
    {
        fields.identifier = changes.identifier->empty() ? std::optional<sigil::security::SecureString>{}
                                                        : changes.identifier;
    }
    if (changes.secretValue)
    {
        fields.secretValue = *changes.secretValue;
    }
    if (changes.notes)
    {
        fields.notes = changes.notes->empty() ? std::optional<sigil::security::SecureString>{} : changes.notes;
    }
}

void mergeMetadata(SecretMetadata& metadata, const SecretChanges& changes)
{
    if (changes.title)
    {
        if (changes.title->empty())
        {
            throw std::invalid_argument("title must not be empty");
        }
        metadata.title = *changes.title;
    }
    if (changes.description)
    {
        metadata.description =
            changes.description->empty() ? std::optional<std::string>{} : changes.description;
    }
    if (changes.category)
    {
        metadata.category = changes.category->empty() ? std::string{ g_defaultCategory } : *changes.category;
    }
    if (changes.isFavorite)
    {
        metadata.isFavorite = *changes.isFavorite;
    }
}

} // namespace

SecretVaultManager::SecretVaultManager(KeyDerivationService& kdf, CipherService& cipher,
                                       MasterSecretAuthenticator& authenticator,
                                       sigil::storage::IStorageRepository& storage,
                                       sigil::log::ILogger& logger) noexcept
    : m_kdf(&kdf), m_cipher(&cipher), m_authenticator(&authenticator), m_storage(&storage), m_logger(&logger)
{
}

SecretEnvelope SecretVaultManager::seal(const SecretFields& fields, const sigil::security::SecureString& masterPassword)
{
    if (fields.secretValue.empty())
    {
        throw std::invalid_argument("secret value must not be empty");
    }

    SecretEnvelope envelope{};
    envelope.salt = m_kdf->generateSalt();
    envelope.iv = m_kdf->generateNonce();
    const auto derived{ m_kdf->derive(masterPassword, envelope.salt) };
    envelope.keyFingerprint = derived.fingerprint;

    const auto base{ baseNonceOf(envelope.iv) };
    envelope.encryptedIdentifier =
        m_cipher->encrypt(viewOf(fields.identifier), derived.key, fieldNonce(base, FieldSlot::Identifier));
    envelope.encryptedSecretValue =
        m_cipher
            ->encrypt(sigil::security::asStringView(fields.secretValue), derived.key,
                      fieldNonce(base, FieldSlot::SecretValue))
            .value_or(std::string{});
    envelope.encryptedNotes = m_cipher->encrypt(viewOf(fields.notes), derived.key, fieldNonce(base, FieldSlot::Notes));
    return envelope;
}

SecretFields SecretVaultManager::open(const SecretEnvelope& envelope, const DerivedKey& key,
                                      std::string_view context) const
{
    try
    {
        SecretFields fields{};
        fields.identifier = m_cipher->decrypt(viewOf(envelope.encryptedIdentifier), key.key);
        auto secretValue{ m_cipher->decrypt(std::string_view{ envelope.encryptedSecretValue }, key.key) };
        if (!secretValue)
        {
            throw AuthenticationFailure("secret value envelope is empty");
        }
        fields.secretValue = std::move(*secretValue);
        fields.notes = m_cipher->decrypt(viewOf(envelope.encryptedNotes), key.key);
        return fields;
    }
    catch (const AuthenticationFailure& e)
    {
        throw AuthenticationFailure(fmt::format("{}: {}", context, e.what()));
    }
}

SecretRecord SecretVaultManager::requireActive(std::string_view userId, std::string_view secretId) const
{
    auto record{ m_storage->loadSecret(userId, secretId) };
    if (!record || !record->isActive)
    {
        throw detail::VaultAbort{ VaultError::SecretNotFound };
    }
    return std::move(*record);
}

SecretVersion SecretVaultManager::versionDraftOf(const SecretRecord& record) const
{
    SecretVersion draft{};
    draft.id = makeRecordId();
    draft.secretId = record.id;
    draft.userId = record.userId;
    draft.metadata = record.metadata;
    draft.envelope = record.envelope;
    draft.isActive = record.isActive;
    draft.createdAt = isoTimestampNow();
    draft.updatedAt = record.updatedAt;
    return draft;
}

VaultResult<SecretEnvelope> SecretVaultManager::encryptSecret(const SecretFields& fields,
                                                              const sigil::security::SecureString& masterPassword) noexcept
{
    return detail::guarded<SecretEnvelope>(*m_logger, "encryptSecret",
                                           [&]() -> VaultResult<SecretEnvelope> { return seal(fields, masterPassword); });
}

VaultResult<SecretFields> SecretVaultManager::decryptSecret(const SecretEnvelope& envelope,
                                                            const sigil::security::SecureString& masterPassword) const
    noexcept
{
    return detail::guarded<SecretFields>(*m_logger, "decryptSecret", [&]() -> VaultResult<SecretFields> {
        const auto key{ m_authenticator->verifyAndDerive(masterPassword, envelope.keyFingerprint, envelope.salt) };
        if (!key)
        {
            m_logger->debug("decryptSecret: key fingerprint mismatch");
            return VaultError::InvalidMasterPassword;
        }
        return open(envelope, *key, "envelope");
    });
}

VaultResult<SecretEnvelope>
SecretVaultManager::updateSecretEnvelope(const SecretEnvelope& envelope, const SecretChanges& changes,
                                         const sigil::security::SecureString& masterPassword) noexcept
{
    return detail::guarded<SecretEnvelope>(*m_logger, "updateSecretEnvelope", [&]() -> VaultResult<SecretEnvelope> {
        const auto key{ m_authenticator->verifyAndDerive(masterPassword, envelope.keyFingerprint, envelope.salt) };
        if (!key)
        {
            m_logger->debug("updateSecretEnvelope: key fingerprint mismatch");
            return VaultError::InvalidMasterPassword;
        }
        auto fields{ open(envelope, *key, "envelope") };
        mergeSensitive(fields, changes);
        return seal(fields, masterPassword);
    });
}

VaultResult<SecretRecord> SecretVaultManager::createSecret(std::string_view userId, const SecretMetadata& metadata,
                                                           const SecretFields& fields,
                                                           const sigil::security::SecureString& masterPassword) noexcept
{
    return detail::guarded<SecretRecord>(*m_logger, "createSecret", [&]() -> VaultResult<SecretRecord> {
        if (metadata.title.empty())
        {
            return VaultError::InvalidArgument;
        }
        const auto master{ m_storage->loadMasterKey(userId) };
        if (!master)
        {
            return m_storage->loadUser(userId) ? VaultError::MasterPasswordNotSet : VaultError::UserNotFound;
        }
        if (!m_authenticator->verify(masterPassword, master->fingerprint, master->salt))
        {
            m_logger->debug("createSecret: master password rejected for user {}", userId);
            return VaultError::InvalidMasterPassword;
        }

        SecretRecord record{};
        record.id = makeRecordId();
        record.userId = std::string{ userId };
        record.metadata = metadata;
        if (record.metadata.category.empty())
        {
            record.metadata.category = g_defaultCategory;
        }
        record.envelope = seal(fields, masterPassword);
        record.createdAt = isoTimestampNow();
        record.updatedAt = record.createdAt;

        m_storage->runInTransaction([&]() {
            m_storage->insertSecret(record);
            (void)m_storage->appendVersion(versionDraftOf(record));
        });

        m_logger->info("secret {} created for user {}", record.id, userId);
        return record;
    });
}

VaultResult<SecretFields> SecretVaultManager::getSecret(std::string_view userId, std::string_view secretId,
                                                        const sigil::security::SecureString& masterPassword) const
    noexcept
{
    return detail::guarded<SecretFields>(*m_logger, "getSecret", [&]() -> VaultResult<SecretFields> {
        const auto record{ requireActive(userId, secretId) };
        const auto key{ m_authenticator->verifyAndDerive(masterPassword, record.envelope.keyFingerprint,
                                                         record.envelope.salt) };
        if (!key)
        {
            m_logger->debug("getSecret: master password rejected for secret {}", secretId);
            return VaultError::InvalidMasterPassword;
        }
        return open(record.envelope, *key, record.id);
    });
}

VaultResult<SecretRecord> SecretVaultManager::updateSecret(std::string_view userId, std::string_view secretId,
                                                           const SecretChanges& changes,
                                                           const sigil::security::SecureString& masterPassword) noexcept
{
    return detail::guarded<SecretRecord>(*m_logger, "updateSecret", [&]() -> VaultResult<SecretRecord> {
        auto record{ requireActive(userId, secretId) };
        const auto key{ m_authenticator->verifyAndDerive(masterPassword, record.envelope.keyFingerprint,
                                                         record.envelope.salt) };
        if (!key)
        {
            m_logger->debug("updateSecret: master password rejected for secret {}", secretId);
            return VaultError::InvalidMasterPassword;
        }

        mergeMetadata(record.metadata, changes);
        if (changes.touchesSensitiveFields())
        {
            auto fields{ open(record.envelope, *key, record.id) };
            mergeSensitive(fields, changes);
            record.envelope = seal(fields, masterPassword);
        }
        record.updatedAt = isoTimestampNow();

        m_storage->runInTransaction([&]() {
            m_storage->updateSecret(record);
            (void)m_storage->appendVersion(versionDraftOf(record));
        });

        m_logger->info("secret {} updated", record.id);
        return record;
    });
}

VaultResult<SecretRecord> SecretVaultManager::deleteSecret(std::string_view userId, std::string_view secretId) noexcept
{
    return detail::guarded<SecretRecord>(*m_logger, "deleteSecret", [&]() -> VaultResult<SecretRecord> {
        auto record{ requireActive(userId, secretId) };
        record.isActive = false;
        record.updatedAt = isoTimestampNow();

        m_storage->runInTransaction([&]() {
            m_storage->updateSecret(record);
            (void)m_storage->appendVersion(versionDraftOf(record));
        });

        m_logger->info("secret {} deleted", record.id);
        return record;
    });
}

VaultResult<std::vector<SecretRecord>> SecretVaultManager::listSecrets(std::string_view userId,
                                                                      const SecretFilter& filter) const noexcept
{
    return detail::guarded<std::vector<SecretRecord>>(
        *m_logger, "listSecrets", [&]() -> VaultResult<std::vector<SecretRecord>> {
            if (!m_storage->loadUser(userId))
            {
                return VaultError::UserNotFound;
            }
            auto secrets{ m_storage->listSecrets(userId, false) };

            const auto term{ filter.search ? foldCase(trimmed(*filter.search)) : std::string{} };
            std::erase_if(secrets, [&](const SecretRecord& secret) {
                if (filter.category && secret.metadata.category != *filter.category)
                {
                    return true;
                }
                if (filter.favoritesOnly && !secret.metadata.isFavorite)
                {
                    return true;
                }
                if (term.empty())
                {
                    return false;
                }
                const bool inTitle{ foldCase(secret.metadata.title).find(term) != std::string::npos };
                const bool inDescription{ secret.metadata.description &&
                                          foldCase(*secret.metadata.description).find(term) != std::string::npos };
                return !inTitle && !inDescription;
            });
            return secrets;
        });
}

VaultResult<std::vector<std::string>> SecretVaultManager::listCategories(std::string_view userId) const noexcept
{
    return detail::guarded<std::vector<std::string>>(
        *m_logger, "listCategories", [&]() -> VaultResult<std::vector<std::string>> {
            if (!m_storage->loadUser(userId))
            {
                return VaultError::UserNotFound;
            }
            std::vector<std::string> categories{};
            for (const auto& secret : m_storage->listSecrets(userId, false))
            {
                categories.push_back(secret.metadata.category);
            }
            std::sort(categories.begin(), categories.end());
            categories.erase(std::unique(categories.begin(), categories.end()), categories.end());
            return categories;
        });
}

VaultResult<SecretVersion> SecretVaultManager::snapshotVersion(const SecretRecord& record) noexcept
{
    return detail::guarded<SecretVersion>(*m_logger, "snapshotVersion", [&]() -> VaultResult<SecretVersion> {
        if (!m_storage->loadSecret(record.userId, record.id))
        {
            return VaultError::SecretNotFound;
        }
        return m_storage->appendVersion(versionDraftOf(record));
    });
}

VaultResult<std::vector<SecretVersion>> SecretVaultManager::listVersions(std::string_view userId,
                                                                         std::string_view secretId) const noexcept
{
    return detail::guarded<std::vector<SecretVersion>>(*m_logger, "listVersions",
                                                       [&]() -> VaultResult<std::vector<SecretVersion>> {
                                                           if (!m_storage->loadSecret(userId, secretId))
                                                           {
                                                               return VaultError::SecretNotFound;
                                                           }
                                                           return m_storage->listVersions(userId, secretId);
                                                       });
}

VaultResult<SecretFields> SecretVaultManager::decryptVersion(std::string_view userId, std::string_view secretId,
                                                             std::uint32_t version,
                                                             const sigil::security::SecureString& masterPassword) const
    noexcept
{
    return detail::guarded<SecretFields>(*m_logger, "decryptVersion", [&]() -> VaultResult<SecretFields> {
        const auto snapshot{ m_storage->loadVersion(userId, secretId, version) };
        if (!snapshot)
        {
            return m_storage->loadSecret(userId, secretId) ? VaultError::VersionNotFound : VaultError::SecretNotFound;
        }
        const auto key{ m_authenticator->verifyAndDerive(masterPassword, snapshot->envelope.keyFingerprint,
                                                         snapshot->envelope.salt) };
        if (!key)
        {
            m_logger->debug("decryptVersion: master password rejected for {} v{}", secretId, version);
            return VaultError::InvalidMasterPassword;
        }
        return open(snapshot->envelope, *key, fmt::format("{} v{}", secretId, version));
    });
}

VaultResult<SecretRecord> SecretVaultManager::restoreVersion(std::string_view userId, std::string_view secretId,
                                                             std::uint32_t targetVersion,
                                                             const sigil::security::SecureString& masterPassword) noexcept
{
    return detail::guarded<SecretRecord>(*m_logger, "restoreVersion", [&]() -> VaultResult<SecretRecord> {
        auto record{ requireActive(userId, secretId) };
        const auto snapshot{ m_storage->loadVersion(userId, secretId, targetVersion) };
        if (!snapshot)
        {
            return VaultError::VersionNotFound;
        }
        const auto key{ m_authenticator->verifyAndDerive(masterPassword, snapshot->envelope.keyFingerprint,
                                                         snapshot->envelope.salt) };
        if (!key)
        {
            m_logger->debug("restoreVersion: master password rejected for {} v{}", secretId, targetVersion);
            return VaultError::InvalidMasterPassword;
        }

        const auto fields{ open(snapshot->envelope, *key, fmt::format("{} v{}", secretId, targetVersion)) };
        record.metadata = snapshot->metadata;
        record.envelope = seal(fields, masterPassword);
        record.updatedAt = isoTimestampNow();

        m_storage->runInTransaction([&]() {
            m_storage->updateSecret(record);
            (void)m_storage->appendVersion(versionDraftOf(record));
        });

        m_logger->info("secret {} restored from version {}", record.id, targetVersion);
        return record;
    });
}

VaultResult<std::size_t> SecretVaultManager::reencryptAll(std::string_view userId,
                                                          const sigil::security::SecureString& current,
                                                          const sigil::security::SecureString& replacement) noexcept
{
    return detail::guarded<std::size_t>(*m_logger, "reencryptSecrets", [&]() -> VaultResult<std::size_t> {
        std::size_t moved{ 0U };
        std::size_t skipped{ 0U };
        m_storage->runInTransaction([&]() {
            for (auto record : m_storage->listSecrets(userId, false))
            {
                const auto key{ m_authenticator->verifyAndDerive(current, record.envelope.keyFingerprint,
                                                                 record.envelope.salt) };
                if (!key)
                {
                    ++skipped;
                    continue;
                }
                const auto fields{ open(record.envelope, *key, record.id) };
                record.envelope = seal(fields, replacement);
                record.updatedAt = isoTimestampNow();
                m_storage->updateSecret(record);
                (void)m_storage->appendVersion(versionDraftOf(record));
                ++moved;
            }
        });
        if (skipped > 0U)
        {
            m_logger->warn("{} secrets of user {} are sealed under another password and were not re-keyed", skipped,
                           userId);
        }
        return moved;
    });
}

} // namespace sigil::core
