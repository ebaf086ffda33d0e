#ifndef INCLUDE_SIGIL_CORE_PLAINTEXTEXPORTER_HPP
#define INCLUDE_SIGIL_CORE_PLAINTEXTEXPORTER_HPP

#include "sigil/core/MasterSecretAuthenticator.hpp"
#include "sigil/core/NoteService.hpp"
#include "sigil/core/SecretVaultManager.hpp"
#include "sigil/core/VaultErrors.hpp"
#include "sigil/log/Logger.hpp"
#include "sigil/security/SecureMemory.hpp"
#include "sigil/storage/IStorageRepository.hpp"
#include <cstddef>
#include <string_view>

namespace sigil::core
{

struct PlaintextExport final
{
    sigil::security::SecureString document; // JSON: exportedAt, credentials, notes
    std::size_t credentials{ 0U };
    std::size_t notes{ 0U };
};

// Decrypted JSON dump of a user's active secrets and notes. Unlike a backup it is not sealed and
// cannot be imported. A secret or secure note that fails to open aborts the whole export.
class PlaintextExporter final
{
public:
    PlaintextExporter(SecretVaultManager& secrets, NoteService& notes, MasterSecretAuthenticator& authenticator,
                      sigil::storage::IStorageRepository& storage, sigil::log::ILogger& logger) noexcept;

    [[nodiscard]] VaultResult<PlaintextExport> exportPlaintext(std::string_view userId,
                                                               const sigil::security::SecureString& masterPassword)
        const noexcept;

private:
    SecretVaultManager* m_secrets{ nullptr };
    NoteService* m_notes{ nullptr };
    MasterSecretAuthenticator* m_authenticator{ nullptr };
    sigil::storage::IStorageRepository* m_storage{ nullptr };
    sigil::log::ILogger* m_logger{ nullptr };
};

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_PLAINTEXTEXPORTER_HPP
