#include "sigil/core/MasterSecretAuthenticator.hpp"

#include "ErrorMapping.hpp"

namespace sigil::core
{
namespace
{

// Code points, not bytes: a UTF-8 continuation byte does not start a character.
[[nodiscard]] std::size_t characterCount(const sigil::security::SecureString& text) noexcept
{
    std::size_t count{ 0U };
    for (const char c : text)
    {
        if ((static_cast<unsigned char>(c) & 0xC0U) != 0x80U)
        {
            ++count;
        }
    }
    return count;
}

} // namespace

MasterSecretAuthenticator::MasterSecretAuthenticator(KeyDerivationService& kdf,
                                                     sigil::storage::IStorageRepository& storage,
                                                     sigil::log::ILogger& logger) noexcept
    : m_kdf(&kdf), m_storage(&storage), m_logger(&logger)
{
}

bool MasterSecretAuthenticator::verify(const sigil::security::SecureString& password,
                                       std::string_view storedFingerprint, std::string_view storedSalt) const
{
    return verifyAndDerive(password, storedFingerprint, storedSalt).has_value();
}

std::optional<DerivedKey> MasterSecretAuthenticator::verifyAndDerive(const sigil::security::SecureString& password,
                                                                     std::string_view storedFingerprint,
                                                                     std::string_view storedSalt) const
{
    auto derived{ m_kdf->derive(password, storedSalt) };
    if (!sigil::security::secureEquals(derived.fingerprint, storedFingerprint))
    {
        sigil::security::secureRelease(derived.key);
        return std::nullopt;
    }
    return derived;
}

VaultResult<bool> MasterSecretAuthenticator::hasMasterPassword(std::string_view userId) const noexcept
{
    return detail::guarded<bool>(*m_logger, "hasMasterPassword", [&]() -> VaultResult<bool> {
        if (!m_storage->loadUser(userId))
        {
            return VaultError::UserNotFound;
        }
        return m_storage->loadMasterKey(userId).has_value();
    });
}

VaultResult<std::monostate> MasterSecretAuthenticator::verifyUser(std::string_view userId,
                                                                  const sigil::security::SecureString& password) const
    noexcept
{
    return detail::guarded<std::monostate>(*m_logger, "verifyMasterPassword", [&]() -> VaultResult<std::monostate> {
        const auto record{ m_storage->loadMasterKey(userId) };
        if (!record)
        {
            return m_storage->loadUser(userId) ? VaultError::MasterPasswordNotSet : VaultError::UserNotFound;
        }
        if (!verify(password, record->fingerprint, record->salt))
        {
            m_logger->debug("verifyMasterPassword: rejected for user {}", userId);
            return VaultError::InvalidMasterPassword;
        }
        return std::monostate{};
    });
}

VaultResult<MasterKeyRecord>
MasterSecretAuthenticator::setOrChange(std::string_view userId,
                                       const std::optional<sigil::security::SecureString>& currentPassword,
                                       const sigil::security::SecureString& newPassword,
                                       const MasterKeyRotation& rotation) noexcept
{
    return detail::guarded<MasterKeyRecord>(*m_logger, "setMasterPassword", [&]() -> VaultResult<MasterKeyRecord> {
        if (characterCount(newPassword) < g_minMasterPasswordChars)
        {
            return VaultError::WeakMasterPassword;
        }
        if (!m_storage->loadUser(userId))
        {
            return VaultError::UserNotFound;
        }

        MasterKeyRecord record{};
        record.salt = m_kdf->generateSalt();
        auto derived{ m_kdf->derive(newPassword, record.salt) };
        record.fingerprint = derived.fingerprint;
        sigil::security::secureRelease(derived.key);

        // Read, verify, rotate and replace under one write lock.
        bool changed{ false };
        m_storage->runInTransaction([&]() {
            const auto existing{ m_storage->loadMasterKey(userId) };
            if (existing)
            {
                if (!currentPassword || currentPassword->empty())
                {
                    throw detail::VaultAbort{ VaultError::MasterPasswordRequired };
                }
                if (!verify(*currentPassword, existing->fingerprint, existing->salt))
                {
                    m_logger->debug("setMasterPassword: current password rejected for user {}", userId);
                    throw detail::VaultAbort{ VaultError::InvalidMasterPassword };
                }
                if (rotation)
                {
                    if (const auto failed{ rotation(*currentPassword, newPassword) })
                    {
                        throw detail::VaultAbort{ *failed };
                    }
                }
            }
            m_storage->storeMasterKey(userId, record);
            changed = existing.has_value();
        });

        m_logger->info("master password {} for user {}", changed ? "changed" : "configured", userId);
        return record;
    });
}

} // namespace sigil::core
