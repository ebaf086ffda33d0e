#include "sigil/core/BackupCodec.hpp"

#include "ErrorMapping.hpp"
#include "sigil/core/RecordIds.hpp"
#include "sigil/crypto/Encoding.hpp"
#include <algorithm>
#include <limits>
#include <nlohmann/json.hpp>
#include <unordered_map>

namespace sigil::core
{
namespace
{

using nlohmann::json;

constexpr std::size_t g_minArtifactBytes{ g_backupSaltBytes + g_backupIvBytes + sigil::crypto::g_aeadTagBytes };

// Top-level "version" of the document schema. The envelope scheme lives in metadata.formatVersion.
constexpr std::string_view g_documentVersion{ "1.0" };

constexpr std::size_t g_fingerprintHexChars{ 64U };
constexpr std::size_t g_ivHexChars{ 32U };
constexpr std::size_t g_saltHexChars{ 64U };

[[nodiscard]] json nullable(const std::optional<std::string>& value)
{
    return value ? json(*value) : json(nullptr);
}

[[nodiscard]] std::optional<std::string> optionalString(const json& entry, const char* key)
{
    const auto it{ entry.find(key) };
    if (it == entry.end() || it->is_null())
    {
        return std::nullopt;
    }
    return it->get<std::string>();
}

template <class T> [[nodiscard]] T valueOr(const json& entry, const char* key, T fallback)
{
    const auto it{ entry.find(key) };
    if (it == entry.end() || it->is_null())
    {
        return fallback;
    }
    return it->get<T>();
}

[[nodiscard]] json envelopeFields(json out, const SecretEnvelope& envelope)
{
    out["username"] = nullable(envelope.encryptedIdentifier);
    out["password"] = envelope.encryptedSecretValue;
    out["notes"] = nullable(envelope.encryptedNotes);
    out["encryptionKey"] = envelope.keyFingerprint;
    out["iv"] = envelope.iv;
    out["salt"] = envelope.salt;
    return out;
}

[[nodiscard]] json toJson(const SecretRecord& secret)
{
    json out{
        { "id", secret.id },
        { "title", secret.metadata.title },
        { "description", nullable(secret.metadata.description) },
        { "category", secret.metadata.category },
        { "isFavorite", secret.metadata.isFavorite },
        { "createdAt", secret.createdAt },
        { "updatedAt", secret.updatedAt },
    };
    return envelopeFields(std::move(out), secret.envelope);
}

[[nodiscard]] json toJson(const SecretVersion& version)
{
    json out{
        { "id", version.id },
        { "credentialId", version.secretId },
        { "version", version.version },
        { "title", version.metadata.title },
        { "description", nullable(version.metadata.description) },
        { "category", version.metadata.category },
        { "isFavorite", version.metadata.isFavorite },
        { "isActive", version.isActive },
        { "createdAt", version.createdAt },
        { "updatedAt", version.updatedAt },
    };
    return envelopeFields(std::move(out), version.envelope);
}

[[nodiscard]] json toJson(const NoteRecord& note)
{
    json out{
        { "id", note.id },
        { "title", note.title },
        { "content", note.content },
        { "isSecure", note.isSecure },
        { "tags", note.tags },
        { "isFavorite", note.isFavorite },
        { "color", note.color },
        { "createdAt", note.createdAt },
        { "updatedAt", note.updatedAt },
    };
    out["encryptionKey"] = note.crypto ? json(note.crypto->keyFingerprint) : json(nullptr);
    out["iv"] = note.crypto ? json(note.crypto->iv) : json(nullptr);
    out["salt"] = note.crypto ? json(note.crypto->salt) : json(nullptr);
    return out;
}

[[nodiscard]] SecretEnvelope envelopeFrom(const json& entry)
{
    SecretEnvelope envelope{};
    envelope.encryptedIdentifier = optionalString(entry, "username");
    envelope.encryptedSecretValue = entry.at("password").get<std::string>();
    envelope.encryptedNotes = optionalString(entry, "notes");
    envelope.keyFingerprint = entry.at("encryptionKey").get<std::string>();
    envelope.iv = entry.at("iv").get<std::string>();
    envelope.salt = entry.at("salt").get<std::string>();
    return envelope;
}

[[nodiscard]] SecretMetadata metadataFrom(const json& entry)
{
    SecretMetadata metadata{};
    metadata.title = entry.at("title").get<std::string>();
    metadata.description = optionalString(entry, "description");
    metadata.category = valueOr<std::string>(entry, "category", g_defaultCategory);
    metadata.isFavorite = valueOr(entry, "isFavorite", false);
    return metadata;
}

[[nodiscard]] SecretRecord secretFrom(const json& entry)
{
    SecretRecord secret{};
    secret.id = entry.at("id").get<std::string>();
    secret.metadata = metadataFrom(entry);
    secret.envelope = envelopeFrom(entry);
    secret.createdAt = valueOr<std::string>(entry, "createdAt", {});
    secret.updatedAt = valueOr<std::string>(entry, "updatedAt", secret.createdAt);
    return secret;
}

[[nodiscard]] SecretVersion versionFrom(const json& entry)
{
    SecretVersion version{};
    version.id = entry.at("id").get<std::string>();
    version.secretId = entry.at("credentialId").get<std::string>();
    const auto number{ entry.at("version").get<std::int64_t>() };
    if (number <= 0 || number > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
    {
        throw std::invalid_argument("version number out of range");
    }
    version.version = static_cast<std::uint32_t>(number);
    version.metadata = metadataFrom(entry);
    version.envelope = envelopeFrom(entry);
    version.isActive = valueOr(entry, "isActive", true);
    version.createdAt = valueOr<std::string>(entry, "createdAt", {});
    version.updatedAt = valueOr<std::string>(entry, "updatedAt", version.createdAt);
    return version;
}

[[nodiscard]] bool isHexOfLength(const std::optional<std::string>& value, std::size_t length) noexcept
{
    return value && value->size() == length && sigil::crypto::isHex(*value);
}

// Secure notes exported without their key material cannot be opened again and yield nullopt.
[[nodiscard]] std::optional<NoteRecord> noteFrom(const json& entry)
{
    NoteRecord note{};
    note.id = entry.at("id").get<std::string>();
    note.title = entry.at("title").get<std::string>();
    note.content = entry.at("content").get<std::string>();
    note.isSecure = valueOr(entry, "isSecure", false);
    note.tags = valueOr<std::vector<std::string>>(entry, "tags", {});
    note.isFavorite = valueOr(entry, "isFavorite", false);
    note.color = valueOr<std::string>(entry, "color", g_defaultNoteColor);
    if (note.isSecure)
    {
        auto fingerprint{ optionalString(entry, "encryptionKey") };
        auto iv{ optionalString(entry, "iv") };
        auto salt{ optionalString(entry, "salt") };
        if (!isHexOfLength(fingerprint, g_fingerprintHexChars) || !isHexOfLength(iv, g_ivHexChars) ||
            !isHexOfLength(salt, g_saltHexChars))
        {
            return std::nullopt;
        }
        note.crypto = NoteCrypto{ std::move(*fingerprint), std::move(*iv), std::move(*salt) };
    }
    note.createdAt = valueOr<std::string>(entry, "createdAt", {});
    note.updatedAt = valueOr<std::string>(entry, "updatedAt", note.createdAt);
    return note;
}

[[nodiscard]] ParsedBackup documentFrom(const json& doc, BackupScheme openedWith)
{
    if (!doc.is_object() || !doc.at("credentials").is_array() || !doc.at("versions").is_array())
    {
        throw std::invalid_argument("not a backup document");
    }

    ParsedBackup parsed{};
    parsed.version = doc.at("version").get<std::string>();
    parsed.scheme = openedWith;
    parsed.metadata.formatVersion = std::string{ formatVersionOf(openedWith) };
    if (const auto metadata{ doc.find("metadata") }; metadata != doc.end() && metadata->is_object())
    {
        const auto declared{ optionalString(*metadata, "formatVersion") };
        if (declared && *declared != parsed.metadata.formatVersion)
        {
            throw std::invalid_argument("declared format version does not match the envelope");
        }
    }
    parsed.timestamp = valueOr<std::string>(doc, "timestamp", {});
    if (const auto user{ doc.find("user") }; user != doc.end() && user->is_object())
    {
        parsed.user.id = valueOr<std::string>(*user, "id", {});
        parsed.user.email = valueOr<std::string>(*user, "email", {});
        parsed.user.firstName = valueOr<std::string>(*user, "firstName", {});
        parsed.user.lastName = valueOr<std::string>(*user, "lastName", {});
        parsed.user.createdAt = valueOr<std::string>(*user, "createdAt", {});
    }
    for (const auto& entry : doc.at("credentials"))
    {
        parsed.secrets.push_back(secretFrom(entry));
    }
    for (const auto& entry : doc.at("versions"))
    {
        parsed.versions.push_back(versionFrom(entry));
    }
    if (const auto notes{ doc.find("notes") }; notes != doc.end() && notes->is_array())
    {
        for (const auto& entry : *notes)
        {
            auto note{ noteFrom(entry) };
            if (!note)
            {
                ++parsed.notesDropped;
                continue;
            }
            parsed.notes.push_back(std::move(*note));
        }
    }

    parsed.metadata.totalCredentials = parsed.secrets.size();
    parsed.metadata.totalVersions = parsed.versions.size();
    parsed.metadata.totalNotes = parsed.notes.size();
    return parsed;
}

} // namespace

BackupCodec::BackupCodec(sigil::crypto::ICryptoProvider& crypto, MasterSecretAuthenticator& authenticator,
                         sigil::storage::IStorageRepository& storage, sigil::log::ILogger& logger,
                         std::uint32_t pbkdf2Iterations, BackupScheme scheme) noexcept
    : m_crypto(&crypto), m_authenticator(&authenticator), m_storage(&storage), m_logger(&logger),
      m_iterations(pbkdf2Iterations), m_scheme(scheme)
{
}

sigil::security::SecureBuffer BackupCodec::backupKey(const sigil::security::SecureString& masterPassword,
                                                     std::span<const std::uint8_t> salt) const
{
    return m_crypto->derivePbkdf2Sha256(sigil::security::asBytes(masterPassword), salt, m_iterations,
                                        sigil::crypto::g_aeadKeyBytes);
}

VaultResult<BackupArtifact> BackupCodec::exportBackup(std::string_view userId,
                                                      const sigil::security::SecureString& masterPassword) noexcept
{
    return detail::guarded<BackupArtifact>(*m_logger, "exportBackup", [&]() -> VaultResult<BackupArtifact> {
        (void)detail::valueOrAbort(m_authenticator->verifyUser(userId, masterPassword));
        const auto user{ m_storage->loadUser(userId) };
        if (!user)
        {
            return VaultError::UserNotFound;
        }

        const auto secrets{ m_storage->listSecrets(userId, false) };
        const auto versions{ m_storage->listAllVersions(userId) };
        const auto notes{ m_storage->listNotes(userId) };
        const auto formatVersion{ std::string{ formatVersionOf(m_scheme) } };

        json doc{
            { "version", std::string{ g_documentVersion } },
            { "timestamp", isoTimestampNow() },
            { "user",
              { { "id", user->id },
                { "email", user->email },
                { "firstName", user->firstName },
                { "lastName", user->lastName },
                { "createdAt", user->createdAt } } },
            { "credentials", json::array() },
            { "versions", json::array() },
            { "notes", json::array() },
        };
        for (const auto& secret : secrets)
        {
            doc["credentials"].push_back(toJson(secret));
        }
        for (const auto& version : versions)
        {
            doc["versions"].push_back(toJson(version));
        }
        for (const auto& note : notes)
        {
            doc["notes"].push_back(toJson(note));
        }
        doc["metadata"] = { { "totalCredentials", secrets.size() },
                            { "totalVersions", versions.size() },
                            { "totalNotes", notes.size() },
                            { "backupSize", 0 },
                            { "formatVersion", formatVersion } };

        auto text{ doc.dump() };

        std::vector<std::uint8_t> payload(g_backupSaltBytes + g_backupIvBytes);
        if (!m_crypto->randomBytes(std::span<std::uint8_t>{ payload }))
        {
            throw RandomFailure("CSPRNG failure");
        }
        const std::span<const std::uint8_t> salt{ payload.data(), g_backupSaltBytes };
        const std::span<const std::uint8_t> iv{ payload.data() + g_backupSaltBytes, g_backupIvBytes };
        auto key{ backupKey(masterPassword, salt) };

        std::vector<std::uint8_t> body{};
        if (m_scheme == BackupScheme::AuthenticatedGcm)
        {
            auto box{ m_crypto->aeadEncrypt(key, iv, sigil::security::asBytes(text), std::span<const std::byte>{}) };
            body = std::move(box.cipherText);
            body.insert(body.end(), box.tag.begin(), box.tag.end());
        }
        else
        {
            body = m_crypto->cbcEncrypt(key, iv, sigil::security::asBytes(text));
        }
        sigil::security::secureWipe(std::span<char>{ text });
        sigil::security::secureRelease(key);
        payload.insert(payload.end(), body.begin(), body.end());

        BackupArtifact artifact{};
        artifact.data = sigil::crypto::toBase64(payload);
        artifact.metadata.totalCredentials = secrets.size();
        artifact.metadata.totalVersions = versions.size();
        artifact.metadata.totalNotes = notes.size();
        artifact.metadata.backupSize = artifact.data.size();
        artifact.metadata.formatVersion = formatVersion;

        m_logger->info("backup exported for user {}: {} secrets, {} versions, {} notes (format {})", userId,
                       secrets.size(), versions.size(), notes.size(), formatVersion);
        return artifact;
    });
}

VaultResult<ParsedBackup> BackupCodec::importBackup(std::string_view artifact,
                                                    const sigil::security::SecureString& masterPassword) const
    noexcept
{
    return detail::guarded<ParsedBackup>(*m_logger, "importBackup", [&]() -> VaultResult<ParsedBackup> {
        const auto payload{ sigil::crypto::fromBase64(artifact) };
        if (!payload || payload->size() < g_minArtifactBytes)
        {
            detail::report(*m_logger, sigil::log::Level::Warn, "importBackup", VaultError::CorruptArtifact,
                           "artifact is not base64 or is truncated");
            return VaultError::CorruptArtifact;
        }

        const std::span<const std::uint8_t> bytes{ *payload };
        const auto salt{ bytes.first(g_backupSaltBytes) };
        const auto iv{ bytes.subspan(g_backupSaltBytes, g_backupIvBytes) };
        const auto body{ bytes.subspan(g_backupSaltBytes + g_backupIvBytes) };
        auto key{ backupKey(masterPassword, salt) };

        sigil::crypto::AeadBox box{};
        std::copy(iv.begin(), iv.end(), box.nonce.begin());
        const auto tagAt{ body.size() - sigil::crypto::g_aeadTagBytes };
        std::copy(body.begin() + static_cast<std::ptrdiff_t>(tagAt), body.end(), box.tag.begin());
        box.cipherText.assign(body.begin(), body.begin() + static_cast<std::ptrdiff_t>(tagAt));

        bool legacy{ false };
        auto plain{ m_crypto->aeadDecrypt(key, box, std::span<const std::byte>{}) };
        if (!plain)
        {
            plain = m_crypto->cbcDecrypt(key, iv, body);
            legacy = true;
        }
        sigil::security::secureRelease(key);
        if (!plain)
        {
            m_logger->debug("importBackup: neither scheme opened the artifact");
            return VaultError::InvalidMasterPassword;
        }

        const auto doc = json::parse(plain->begin(), plain->end(), nullptr, false);
        sigil::security::secureRelease(*plain);
        if (doc.is_discarded())
        {
            // CBC has no integrity check; a wrong key usually fails the padding but can slip through.
            if (legacy)
            {
                m_logger->debug("importBackup: legacy payload is not JSON, treating as wrong password");
                return VaultError::InvalidMasterPassword;
            }
            detail::report(*m_logger, sigil::log::Level::Warn, "importBackup", VaultError::CorruptArtifact,
                           "payload is not JSON");
            return VaultError::CorruptArtifact;
        }

        try
        {
            auto parsed{ documentFrom(doc, legacy ? BackupScheme::LegacyCbc : BackupScheme::AuthenticatedGcm) };
            if (parsed.notesDropped > 0U)
            {
                m_logger->warn("importBackup: skipped {} secure notes without key material", parsed.notesDropped);
            }
            m_logger->info("backup parsed: format {}, {} secrets, {} versions, {} notes",
                           parsed.metadata.formatVersion, parsed.secrets.size(), parsed.versions.size(),
                           parsed.notes.size());
            return parsed;
        }
        catch (const json::exception& e)
        {
            detail::report(*m_logger, sigil::log::Level::Warn, "importBackup", VaultError::CorruptArtifact, e.what());
            return VaultError::CorruptArtifact;
        }
        catch (const std::invalid_argument& e)
        {
            detail::report(*m_logger, sigil::log::Level::Warn, "importBackup", VaultError::CorruptArtifact, e.what());
            return VaultError::CorruptArtifact;
        }
    });
}

VaultResult<RestoreSummary> BackupCodec::restoreInto(std::string_view userId, const ParsedBackup& backup) noexcept
{
    return detail::guarded<RestoreSummary>(*m_logger, "restoreBackup", [&]() -> VaultResult<RestoreSummary> {
        if (!m_storage->loadUser(userId))
        {
            return VaultError::UserNotFound;
        }

        RestoreSummary summary{};
        summary.notesDropped = backup.notesDropped;
        m_storage->runInTransaction([&]() {
            const auto now{ isoTimestampNow() };
            std::unordered_map<std::string, std::string> restoredIds{};

            for (auto secret : backup.secrets)
            {
                const auto originalId{ secret.id };
                secret.id = makeRecordId();
                secret.userId = std::string{ userId };
                secret.isActive = true;
                if (secret.createdAt.empty())
                {
                    secret.createdAt = now;
                }
                if (secret.updatedAt.empty())
                {
                    secret.updatedAt = secret.createdAt;
                }
                m_storage->insertSecret(secret);
                restoredIds.emplace(originalId, secret.id);
                ++summary.secretsRestored;
            }

            for (auto version : backup.versions)
            {
                const auto target{ restoredIds.find(version.secretId) };
                if (target == restoredIds.end())
                {
                    ++summary.versionsDropped;
                    continue;
                }
                version.id = makeRecordId();
                version.secretId = target->second;
                version.userId = std::string{ userId };
                if (version.createdAt.empty())
                {
                    version.createdAt = now;
                }
                if (version.updatedAt.empty())
                {
                    version.updatedAt = version.createdAt;
                }
                m_storage->insertVersion(version);
                ++summary.versionsRestored;
            }

            for (auto note : backup.notes)
            {
                note.id = makeRecordId();
                note.userId = std::string{ userId };
                if (note.createdAt.empty())
                {
                    note.createdAt = now;
                }
                if (note.updatedAt.empty())
                {
                    note.updatedAt = note.createdAt;
                }
                m_storage->insertNote(note);
                ++summary.notesRestored;
            }
        });

        if (summary.versionsDropped > 0U)
        {
            m_logger->warn("restoreBackup: dropped {} versions without a restored secret", summary.versionsDropped);
        }
        m_logger->info("backup restored for user {}: {} secrets, {} versions, {} notes", userId,
                       summary.secretsRestored, summary.versionsRestored, summary.notesRestored);
        return summary;
    });
}

} // namespace sigil::core
