#ifndef INCLUDE_SIGIL_CORE_NOTESERVICE_HPP
#define INCLUDE_SIGIL_CORE_NOTESERVICE_HPP

#include "sigil/core/MasterSecretAuthenticator.hpp"
#include "sigil/core/Records.hpp"
#include "sigil/core/SecretVaultManager.hpp"
#include "sigil/core/VaultErrors.hpp"
#include "sigil/log/Logger.hpp"
#include "sigil/security/SecureMemory.hpp"
#include "sigil/storage/IStorageRepository.hpp"
#include <cstddef>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace sigil::core
{

// Free-form notes. Plain notes are stored as given; secure notes are sealed like a secret with
// the title as identifier and the content as secret value, so they need the master password.
class NoteService final
{
public:
    NoteService(SecretVaultManager& secrets, MasterSecretAuthenticator& authenticator,
                sigil::storage::IStorageRepository& storage, sigil::log::ILogger& logger) noexcept;

    [[nodiscard]] VaultResult<NoteRecord>
    createNote(std::string_view userId, const NoteDraft& draft,
               const std::optional<sigil::security::SecureString>& masterPassword = std::nullopt) noexcept;

    [[nodiscard]] VaultResult<NoteView>
    getNote(std::string_view userId, std::string_view noteId,
            const std::optional<sigil::security::SecureString>& masterPassword = std::nullopt) const noexcept;

    // Switching isSecure either way re-stores the note in the new form.
    [[nodiscard]] VaultResult<NoteRecord>
    updateNote(std::string_view userId, std::string_view noteId, const NoteChanges& changes,
               const std::optional<sigil::security::SecureString>& masterPassword = std::nullopt) noexcept;

    [[nodiscard]] VaultResult<std::monostate> deleteNote(std::string_view userId, std::string_view noteId) noexcept;

    [[nodiscard]] VaultResult<std::vector<NoteRecord>> listNotes(std::string_view userId) const noexcept;

    // Secure notes sealed under `current` move to `replacement`; others are left as they are.
    [[nodiscard]] VaultResult<std::size_t> reencryptAll(std::string_view userId,
                                                        const sigil::security::SecureString& current,
                                                        const sigil::security::SecureString& replacement) noexcept;

private:
    void requireMasterPassword(std::string_view userId,
                               const std::optional<sigil::security::SecureString>& masterPassword) const;
    void seal(NoteRecord& note, std::string_view title, const sigil::security::SecureString& content,
              const sigil::security::SecureString& masterPassword);
    [[nodiscard]] NoteView open(const NoteRecord& note, const sigil::security::SecureString& masterPassword) const;

    SecretVaultManager* m_secrets{ nullptr };
    MasterSecretAuthenticator* m_authenticator{ nullptr };
    sigil::storage::IStorageRepository* m_storage{ nullptr };
    sigil::log::ILogger* m_logger{ nullptr };
};

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_NOTESERVICE_HPP
