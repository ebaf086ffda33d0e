#include "sigil/core/PlaintextExporter.hpp"

#include "ErrorMapping.hpp"
#include "sigil/core/RecordIds.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>

namespace sigil::core
{
namespace
{

using json = nlohmann::json;

[[nodiscard]] json textOrNull(const std::optional<sigil::security::SecureString>& text)
{
    return text ? json(std::string{ sigil::security::asStringView(*text) }) : json(nullptr);
}

} // namespace

PlaintextExporter::PlaintextExporter(SecretVaultManager& secrets, NoteService& notes,
                                     MasterSecretAuthenticator& authenticator,
                                     sigil::storage::IStorageRepository& storage, sigil::log::ILogger& logger) noexcept
    : m_secrets(&secrets), m_notes(&notes), m_authenticator(&authenticator), m_storage(&storage), m_logger(&logger)
{
}

VaultResult<PlaintextExport> PlaintextExporter::exportPlaintext(std::string_view userId,
                                                                const sigil::security::SecureString& masterPassword)
    const noexcept
{
    return detail::guarded<PlaintextExport>(*m_logger, "exportPlaintext", [&]() -> VaultResult<PlaintextExport> {
        (void)detail::valueOrAbort(m_authenticator->verifyUser(userId, masterPassword));

        json doc = { { "exportedAt", isoTimestampNow() }, { "credentials", json::array() }, { "notes", json::array() } };

        const auto secrets{ m_storage->listSecrets(userId, false) };
        for (const auto& secret : secrets)
        {
            const auto fields{ detail::valueOrAbort(m_secrets->decryptSecret(secret.envelope, masterPassword)) };
            json entry = {
                { "id", secret.id },
                { "title", secret.metadata.title },
                { "description", secret.metadata.description ? json(*secret.metadata.description) : json(nullptr) },
                { "category", secret.metadata.category },
                { "username", textOrNull(fields.identifier) },
                { "password", std::string{ sigil::security::asStringView(fields.secretValue) } },
                { "notes", textOrNull(fields.notes) },
                { "isFavorite", secret.metadata.isFavorite },
                { "createdAt", secret.createdAt },
                { "updatedAt", secret.updatedAt },
            };
            doc["credentials"].push_back(std::move(entry));
        }

        const auto notes{ m_storage->listNotes(userId) };
        for (const auto& note : notes)
        {
            std::string title{ note.title };
            std::string content{ note.content };
            if (note.isSecure)
            {
                const auto view{ detail::valueOrAbort(m_notes->getNote(userId, note.id, masterPassword)) };
                title = view.title;
                content = std::string{ sigil::security::asStringView(view.content) };
            }
            json entry = {
                { "id", note.id },
                { "title", title },
                { "content", content },
                { "isSecure", note.isSecure },
                { "tags", note.tags },
                { "isFavorite", note.isFavorite },
                { "color", note.color },
                { "createdAt", note.createdAt },
                { "updatedAt", note.updatedAt },
            };
            sigil::security::secureWipe(std::span<char>{ content });
            doc["notes"].push_back(std::move(entry));
        }

        auto text{ doc.dump(2) };
        PlaintextExport out{};
        out.document = sigil::security::secureStringFrom(text);
        out.credentials = secrets.size();
        out.notes = notes.size();
        sigil::security::secureWipe(std::span<char>{ text });

        m_logger->warn("plaintext export for user {}: {} secrets, {} notes leave the vault unencrypted", userId,
                       out.credentials, out.notes);
        return out;
    });
}

} // namespace sigil::core
