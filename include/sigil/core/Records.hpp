#ifndef INCLUDE_SIGIL_CORE_RECORDS_HPP
#define INCLUDE_SIGIL_CORE_RECORDS_HPP

#include "sigil/security/SecureMemory.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sigil::core
{

inline constexpr const char* g_defaultCategory{ "General" };
inline constexpr const char* g_defaultNoteColor{ "#4ECDC4" };

struct UserProfile final
{
    std::string id;
    std::string email;
    std::string firstName;
    std::string lastName;
    std::string createdAt;
};

// Both fields set, or the user has no master password yet.
struct MasterKeyRecord final
{
    std::string fingerprint; // 64 hex chars, SHA-256 of the derived key
    std::string salt;        // 64 hex chars
};

// Persisted ciphertext of one secret. Every field envelope is hex(IV) || hex(TAG) || hex(CT).
struct SecretEnvelope final
{
    std::optional<std::string> encryptedIdentifier;
    std::string encryptedSecretValue;
    std::optional<std::string> encryptedNotes;
    std::string keyFingerprint;
    std::string iv;
    std::string salt;
};

struct SecretMetadata final
{
    std::string title;
    std::optional<std::string> description;
    std::string category{ g_defaultCategory };
    bool isFavorite{ false };
};

struct SecretRecord final
{
    std::string id;
    std::string userId;
    SecretMetadata metadata;
    SecretEnvelope envelope;
    bool isActive{ true };
    std::string createdAt;
    std::string updatedAt;
};

// Narrows a secret listing. Unset criteria match everything; `search` matches the title or the
// description case-insensitively.
struct SecretFilter final
{
    std::optional<std::string> category;
    bool favoritesOnly{ false };
    std::optional<std::string> search;
};

// Immutable snapshot; `version` is 1-based and dense per secret.
struct SecretVersion final
{
    std::string id;
    std::string secretId;
    std::string userId;
    std::uint32_t version{ 0U };
    SecretMetadata metadata;
    SecretEnvelope envelope;
    bool isActive{ true };
    std::string createdAt;
    std::string updatedAt;
};

// Decrypted sensitive fields.
struct SecretFields final
{
    std::optional<sigil::security::SecureString> identifier;
    sigil::security::SecureString secretValue;
    std::optional<sigil::security::SecureString> notes;
};

// Partial update. An empty identifier or notes clears the field.
struct SecretChanges final
{
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> category;
    std::optional<bool> isFavorite;
    std::optional<sigil::security::SecureString> identifier;
    std::optional<sigil::security::SecureString> secretValue;
    std::optional<sigil::security::SecureString> notes;

    [[nodiscard]] bool touchesSensitiveFields() const noexcept
    {
        return identifier.has_value() || secretValue.has_value() || notes.has_value();
    }
};

struct NoteCrypto final
{
    std::string keyFingerprint;
    std::string iv;
    std::string salt;
};

// For secure notes `title` and `content` hold field envelopes and `crypto` is set.
struct NoteRecord final
{
    std::string id;
    std::string userId;
    std::string title;
    std::string content;
    bool isSecure{ false };
    std::vector<std::string> tags;
    bool isFavorite{ false };
    std::string color{ g_defaultNoteColor };
    std::optional<NoteCrypto> crypto;
    std::string createdAt;
    std::string updatedAt;
};

struct NoteDraft final
{
    std::string title;
    sigil::security::SecureString content;
    bool isSecure{ false };
    std::vector<std::string> tags;
    bool isFavorite{ false };
    std::string color{ g_defaultNoteColor };
};

struct NoteChanges final
{
    std::optional<std::string> title;
    std::optional<sigil::security::SecureString> content;
    std::optional<bool> isSecure;
    std::optional<std::vector<std::string>> tags;
    std::optional<bool> isFavorite;
    std::optional<std::string> color;
};

// Decrypted view of a note.
struct NoteView final
{
    NoteRecord record;
    std::string title;
    sigil::security::SecureString content;
};

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_RECORDS_HPP
