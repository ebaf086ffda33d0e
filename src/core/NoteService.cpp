#include "sigil/core/NoteService.hpp"

#include "ErrorMapping.hpp"
#include "sigil/core/RecordIds.hpp"
#include <stdexcept>
#include <string>

namespace sigil::core
{
namespace
{

[[nodiscard]] SecretEnvelope envelopeOf(const NoteRecord& note)
{
    if (!note.crypto)
    {
        throw AuthenticationFailure("secure note without key material");
    }
    SecretEnvelope envelope{};
    envelope.encryptedIdentifier = note.title;
    envelope.encryptedSecretValue = note.content;
    envelope.keyFingerprint = note.crypto->keyFingerprint;
    envelope.iv = note.crypto->iv;
    envelope.salt = note.crypto->salt;
    return envelope;
}

void requireText(std::string_view title, const sigil::security::SecureString& content)
{
    if (title.empty() || content.empty())
    {
        throw std::invalid_argument("note title and content are required");
    }
}

[[nodiscard]] bool hasPassword(const std::optional<sigil::security::SecureString>& password) noexcept
{
    return password.has_value() && !password->empty();
}

} // namespace

NoteService::NoteService(SecretVaultManager& secrets, MasterSecretAuthenticator& authenticator,
                         sigil::storage::IStorageRepository& storage, sigil::log::ILogger& logger) noexcept
    : m_secrets(&secrets), m_authenticator(&authenticator), m_storage(&storage), m_logger(&logger)
{
}

void NoteService::requireMasterPassword(std::string_view userId,
                                        const std::optional<sigil::security::SecureString>& masterPassword) const
{
    if (!hasPassword(masterPassword))
    {
        throw detail::VaultAbort{ VaultError::MasterPasswordRequired };
    }
    (void)detail::valueOrAbort(m_authenticator->verifyUser(userId, *masterPassword));
}

void NoteService::seal(NoteRecord& note, std::string_view title, const sigil::security::SecureString& content,
                       const sigil::security::SecureString& masterPassword)
{
    SecretFields fields{};
    fields.identifier = sigil::security::secureStringFrom(title);
    fields.secretValue = content;
    auto envelope{ detail::valueOrAbort(m_secrets->encryptSecret(fields, masterPassword)) };

    note.title = envelope.encryptedIdentifier.value_or(std::string{});
    note.content = std::move(envelope.encryptedSecretValue);
    note.crypto = NoteCrypto{ std::move(envelope.keyFingerprint), std::move(envelope.iv), std::move(envelope.salt) };
}

NoteView NoteService::open(const NoteRecord& note, const sigil::security::SecureString& masterPassword) const
{
    auto fields{ detail::valueOrAbort(m_secrets->decryptSecret(envelopeOf(note), masterPassword)) };
    NoteView view{};
    view.record = note;
    if (fields.identifier)
    {
        view.title = std::string{ sigil::security::asStringView(*fields.identifier) };
    }
    view.content = std::move(fields.secretValue);
    return view;
}

VaultResult<NoteRecord> NoteService::createNote(std::string_view userId, const NoteDraft& draft,
                                                const std::optional<sigil::security::SecureString>& masterPassword) noexcept
{
    return detail::guarded<NoteRecord>(*m_logger, "createNote", [&]() -> VaultResult<NoteRecord> {
        requireText(draft.title, draft.content);
        if (!m_storage->loadUser(userId))
        {
            return VaultError::UserNotFound;
        }

        NoteRecord note{};
        note.id = makeRecordId();
        note.userId = std::string{ userId };
        note.isSecure = draft.isSecure;
        note.tags = draft.tags;
        note.isFavorite = draft.isFavorite;
        note.color = draft.color.empty() ? std::string{ g_defaultNoteColor } : draft.color;
        if (draft.isSecure)
        {
            requireMasterPassword(userId, masterPassword);
            seal(note, draft.title, draft.content, *masterPassword);
        }
        else
        {
            note.title = draft.title;
            note.content = std::string{ sigil::security::asStringView(draft.content) };
        }
        note.createdAt = isoTimestampNow();
        note.updatedAt = note.createdAt;

        m_storage->insertNote(note);
        m_logger->info("note {} created for user {}", note.id, userId);
        return note;
    });
}

VaultResult<NoteView> NoteService::getNote(std::string_view userId, std::string_view noteId,
                                           const std::optional<sigil::security::SecureString>& masterPassword) const
    noexcept
{
    return detail::guarded<NoteView>(*m_logger, "getNote", [&]() -> VaultResult<NoteView> {
        const auto note{ m_storage->loadNote(userId, noteId) };
        if (!note)
        {
            return VaultError::NoteNotFound;
        }
        if (!note->isSecure)
        {
            return NoteView{ *note, note->title, sigil::security::secureStringFrom(note->content) };
        }
        if (!hasPassword(masterPassword))
        {
            return VaultError::MasterPasswordRequired;
        }
        return open(*note, *masterPassword);
    });
}

VaultResult<NoteRecord> NoteService::updateNote(std::string_view userId, std::string_view noteId,
                                                const NoteChanges& changes,
                                                const std::optional<sigil::security::SecureString>& masterPassword) noexcept
{
    return detail::guarded<NoteRecord>(*m_logger, "updateNote", [&]() -> VaultResult<NoteRecord> {
        auto existing{ m_storage->loadNote(userId, noteId) };
        if (!existing)
        {
            return VaultError::NoteNotFound;
        }
        auto note{ std::move(*existing) };
        const bool wasSecure{ note.isSecure };
        const bool secure{ changes.isSecure.value_or(wasSecure) };

        std::string title{};
        sigil::security::SecureString content{};
        if (wasSecure)
        {
            if (!hasPassword(masterPassword))
            {
                return VaultError::MasterPasswordRequired;
            }
            auto view{ open(note, *masterPassword) };
            title = std::move(view.title);
            content = std::move(view.content);
        }
        else
        {
            title = note.title;
            content = sigil::security::secureStringFrom(note.content);
        }

        if (changes.title)
        {
            title = *changes.title;
        }
        if (changes.content)
        {
            content = *changes.content;
        }
        requireText(title, content);
        if (changes.tags)
        {
            note.tags = *changes.tags;
        }
        if (changes.isFavorite)
        {
            note.isFavorite = *changes.isFavorite;
        }
        if (changes.color)
        {
            note.color = changes.color->empty() ? std::string{ g_defaultNoteColor } : *changes.color;
        }

        if (secure)
        {
            if (!wasSecure)
            {
                requireMasterPassword(userId, masterPassword);
            }
            seal(note, title, content, *masterPassword);
        }
        else
        {
            note.title = std::move(title);
            note.content = std::string{ sigil::security::asStringView(content) };
            note.crypto.reset();
        }
        note.isSecure = secure;
        note.updatedAt = isoTimestampNow();

        m_storage->updateNote(note);
        m_logger->info("note {} updated", note.id);
        return note;
    });
}

VaultResult<std::monostate> NoteService::deleteNote(std::string_view userId, std::string_view noteId) noexcept
{
    return detail::guarded<std::monostate>(*m_logger, "deleteNote", [&]() -> VaultResult<std::monostate> {
        if (!m_storage->softDeleteNote(userId, noteId, isoTimestampNow()))
        {
            return VaultError::NoteNotFound;
        }
        m_logger->info("note {} deleted", noteId);
        return std::monostate{};
    });
}

VaultResult<std::vector<NoteRecord>> NoteService::listNotes(std::string_view userId) const noexcept
{
    return detail::guarded<std::vector<NoteRecord>>(*m_logger, "listNotes",
                                                    [&]() -> VaultResult<std::vector<NoteRecord>> {
                                                        if (!m_storage->loadUser(userId))
                                                        {
                                                            return VaultError::UserNotFound;
                                                        }
                                                        return m_storage->listNotes(userId);
                                                    });
}

VaultResult<std::size_t> NoteService::reencryptAll(std::string_view userId,
                                                   const sigil::security::SecureString& current,
                                                   const sigil::security::SecureString& replacement) noexcept
{
    return detail::guarded<std::size_t>(*m_logger, "reencryptNotes", [&]() -> VaultResult<std::size_t> {
        std::size_t moved{ 0U };
        std::size_t skipped{ 0U };
        m_storage->runInTransaction([&]() {
            for (auto note : m_storage->listNotes(userId))
            {
                if (!note.isSecure)
                {
                    continue;
                }
                auto fields{ m_secrets->decryptSecret(envelopeOf(note), current) };
                if (const auto* error{ std::get_if<VaultError>(&fields) })
                {
                    if (*error == VaultError::InvalidMasterPassword)
                    {
                        ++skipped;
                        continue;
                    }
                    throw detail::VaultAbort{ *error };
                }
                auto& plain{ std::get<SecretFields>(fields) };
                const auto title{ plain.identifier ? std::string{ sigil::security::asStringView(*plain.identifier) }
                                                   : std::string{} };
                seal(note, title, plain.secretValue, replacement);
                note.updatedAt = isoTimestampNow();
                m_storage->updateNote(note);
                ++moved;
            }
        });
        if (skipped > 0U)
        {
            m_logger->warn("{} secure notes of user {} are sealed under another password and were not re-keyed",
                           skipped, userId);
        }
        return moved;
    });
}

} // namespace sigil::core
