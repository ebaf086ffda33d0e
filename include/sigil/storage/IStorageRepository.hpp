#ifndef INCLUDE_SIGIL_STORAGE_ISTORAGEREPOSITORY_HPP
#define INCLUDE_SIGIL_STORAGE_ISTORAGEREPOSITORY_HPP

#include "sigil/core/Records.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sigil::storage
{

// Persistence for users, master keys, secrets, versions and notes.
// Failures throw StorageFailure (or a subclass from StorageErrors.hpp).
class IStorageRepository
{
public:
    IStorageRepository() = default;
    IStorageRepository(const IStorageRepository&) = delete;
    IStorageRepository& operator=(const IStorageRepository&) = delete;
    IStorageRepository(IStorageRepository&&) = delete;
    IStorageRepository& operator=(IStorageRepository&&) = delete;
    virtual ~IStorageRepository() = default;

    virtual void insertUser(const sigil::core::UserProfile& user) = 0;
    [[nodiscard]] virtual std::optional<sigil::core::UserProfile> loadUser(std::string_view userId) const = 0;

    [[nodiscard]] virtual std::optional<sigil::core::MasterKeyRecord>
    loadMasterKey(std::string_view userId) const = 0;

    // Replaces fingerprint and salt together. Throws RecordNotFound for an unknown user.
    virtual void storeMasterKey(std::string_view userId, const sigil::core::MasterKeyRecord& record) = 0;

    virtual void insertSecret(const sigil::core::SecretRecord& secret) = 0;

    // Overwrites metadata, envelope, isActive and updatedAt. Throws RecordNotFound.
    virtual void updateSecret(const sigil::core::SecretRecord& secret) = 0;

    [[nodiscard]] virtual std::optional<sigil::core::SecretRecord> loadSecret(std::string_view userId,
                                                                             std::string_view secretId) const = 0;

    // Ordered by title.
    [[nodiscard]] virtual std::vector<sigil::core::SecretRecord> listSecrets(std::string_view userId,
                                                                            bool includeInactive) const = 0;

    // Stores `draft` under the next free version number (max + 1) in one atomic statement and
    // returns the stored row. `draft.version` is ignored.
    [[nodiscard]] virtual sigil::core::SecretVersion appendVersion(const sigil::core::SecretVersion& draft) = 0;

    // Stores `version` with its number as given. Throws VersionConflict if taken.
    virtual void insertVersion(const sigil::core::SecretVersion& version) = 0;

    [[nodiscard]] virtual std::optional<sigil::core::SecretVersion>
    loadVersion(std::string_view userId, std::string_view secretId, std::uint32_t version) const = 0;

    // Ascending by version.
    [[nodiscard]] virtual std::vector<sigil::core::SecretVersion> listVersions(std::string_view userId,
                                                                              std::string_view secretId) const = 0;

    // Every version the user owns, grouped by secret, ascending by version.
    [[nodiscard]] virtual std::vector<sigil::core::SecretVersion> listAllVersions(std::string_view userId) const = 0;

    virtual void insertNote(const sigil::core::NoteRecord& note) = 0;

    // Throws RecordNotFound.
    virtual void updateNote(const sigil::core::NoteRecord& note) = 0;

    [[nodiscard]] virtual std::optional<sigil::core::NoteRecord> loadNote(std::string_view userId,
                                                                         std::string_view noteId) const = 0;

    // Newest update first. Soft-deleted notes are never returned.
    [[nodiscard]] virtual std::vector<sigil::core::NoteRecord> listNotes(std::string_view userId) const = 0;

    // Returns false if no live note matched.
    [[nodiscard]] virtual bool softDeleteNote(std::string_view userId, std::string_view noteId,
                                              std::string_view deletedAt) = 0;

    // Runs `work` atomically. Nested calls join the outer transaction. Exceptions roll back and propagate.
    virtual void runInTransaction(const std::function<void()>& work) = 0;
};

} // namespace sigil::storage

#endif // INCLUDE_SIGIL_STORAGE_ISTORAGEREPOSITORY_HPP
