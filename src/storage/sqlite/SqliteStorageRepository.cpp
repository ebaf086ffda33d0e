#include "sigil/storage/sqlite/SqliteStorageRepositoryFactory.hpp"

#include "sigil/storage/IStorageRepository.hpp"
#include "sigil/storage/StorageErrors.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <sqlite3.h>

namespace sigil::storage::sqlite
{
namespace
{

using sigil::core::MasterKeyRecord;
using sigil::core::NoteCrypto;
using sigil::core::NoteRecord;
using sigil::core::SecretEnvelope;
using sigil::core::SecretMetadata;
using sigil::core::SecretRecord;
using sigil::core::SecretVersion;
using sigil::core::UserProfile;

constexpr std::string_view g_memoryDatabase{ ":memory:" };
constexpr int g_busyTimeoutMs{ 5000 };
constexpr int g_appendVersionAttempts{ 3 };

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "storage: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw StorageFailure(msg);
    }
}

// Prepared statement with 1-based binds and 0-based column reads.
class Statement final
{
public:
    Statement(sqlite3* db, const char* sql) : m_db(db)
    {
        sqlite3_stmt* rawStmt = nullptr;
        const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
        m_stmt.reset(rawStmt);
        if (prepRc != SQLITE_OK || !m_stmt)
        {
            throw StorageFailure(sqliteErr(db, "storage: sqlite3_prepare_v2 failed"));
        }
    }

    void bind(int index, std::string_view text)
    {
        check(sqlite3_bind_text(m_stmt.get(), index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT),
              "storage: bind text failed");
    }

    void bind(int index, const std::optional<std::string>& text)
    {
        if (!text)
        {
            check(sqlite3_bind_null(m_stmt.get(), index), "storage: bind null failed");
            return;
        }
        bind(index, std::string_view{ *text });
    }

    void bind(int index, std::int64_t value)
    {
        check(sqlite3_bind_int64(m_stmt.get(), index, value), "storage: bind integer failed");
    }

    void bind(int index, bool value)
    {
        check(sqlite3_bind_int(m_stmt.get(), index, value ? 1 : 0), "storage: bind flag failed");
    }

    // Returns the raw step code so callers can react to constraint violations.
    [[nodiscard]] int stepRaw() noexcept
    {
        return sqlite3_step(m_stmt.get());
    }

    // true: a row is available; false: done.
    [[nodiscard]] bool step()
    {
        const int rc = stepRaw();
        if (rc == SQLITE_ROW)
        {
            return true;
        }
        if (rc == SQLITE_DONE)
        {
            return false;
        }
        throw StorageFailure(sqliteErr(m_db, "storage: sqlite3_step failed"));
    }

    void run()
    {
        if (step())
        {
            throw StorageFailure("storage: statement unexpectedly returned rows");
        }
    }

    [[nodiscard]] std::string text(int column) const
    {
        const auto* ptr = sqlite3_column_text(m_stmt.get(), column);
        const int bytes = sqlite3_column_bytes(m_stmt.get(), column);
        if (ptr == nullptr || bytes <= 0)
        {
            return {};
        }
        return std::string{ reinterpret_cast<const char*>(ptr), static_cast<std::size_t>(bytes) };
    }

    [[nodiscard]] std::optional<std::string> optionalText(int column) const
    {
        if (sqlite3_column_type(m_stmt.get(), column) == SQLITE_NULL)
        {
            return std::nullopt;
        }
        return text(column);
    }

    [[nodiscard]] std::int64_t integer(int column) const
    {
        return sqlite3_column_int64(m_stmt.get(), column);
    }

    [[nodiscard]] bool flag(int column) const
    {
        return integer(column) != 0;
    }

private:
    void check(int rc, const char* what) const
    {
        if (rc != SQLITE_OK)
        {
            throw StorageFailure(sqliteErr(m_db, what));
        }
    }

    sqlite3* m_db{ nullptr };
    SqliteStmtPtr m_stmt;
};

[[nodiscard]] bool isConstraintViolation(int rc) noexcept
{
    return (rc & 0xFF) == SQLITE_CONSTRAINT;
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path)
{
    const bool inMemory = path.native() == std::filesystem::path{ g_memoryDatabase }.native();
    if (!inMemory && path.has_parent_path())
    {
        std::error_code ec{};
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            throw StorageFailure("storage: failed to create database directory");
        }
    }

    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw StorageFailure(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }

    if (sqlite3_busy_timeout(db.get(), g_busyTimeoutMs) != SQLITE_OK)
    {
        throw StorageFailure(sqliteErr(db.get(), "storage: busy_timeout failed"));
    }
    exec(db.get(), "PRAGMA foreign_keys = ON;");
    if (!inMemory)
    {
        exec(db.get(), "PRAGMA journal_mode = WAL;");
    }
    return db;
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS users ("
             " id TEXT PRIMARY KEY,"
             " email TEXT NOT NULL UNIQUE,"
             " first_name TEXT NOT NULL DEFAULT '',"
             " last_name TEXT NOT NULL DEFAULT '',"
             " created_at TEXT NOT NULL,"
             " master_key_fingerprint TEXT,"
             " master_key_salt TEXT,"
             " CHECK ((master_key_fingerprint IS NULL) = (master_key_salt IS NULL))"
             ");");

    exec(db, "CREATE TABLE IF NOT EXISTS secrets ("
             " id TEXT PRIMARY KEY,"
             " user_id TEXT NOT NULL REFERENCES users(id),"
             " title TEXT NOT NULL,"
             " description TEXT,"
             " category TEXT NOT NULL,"
             " is_favorite INTEGER NOT NULL DEFAULT 0,"
             " encrypted_identifier TEXT,"
             " encrypted_secret_value TEXT NOT NULL,"
             " encrypted_notes TEXT,"
             " key_fingerprint TEXT NOT NULL,"
             " iv TEXT NOT NULL,"
             " salt TEXT NOT NULL,"
             " is_active INTEGER NOT NULL DEFAULT 1,"
             " created_at TEXT NOT NULL,"
             " updated_at TEXT NOT NULL"
             ");");
    exec(db, "CREATE INDEX IF NOT EXISTS secrets_by_user ON secrets(user_id, is_active);");

    // No foreign key on secret_id: history outlives the live row.
    exec(db, "CREATE TABLE IF NOT EXISTS secret_versions ("
             " id TEXT PRIMARY KEY,"
             " secret_id TEXT NOT NULL,"
             " user_id TEXT NOT NULL,"
             " version INTEGER NOT NULL CHECK (version > 0),"
             " title TEXT NOT NULL,"
             " description TEXT,"
             " category TEXT NOT NULL,"
             " is_favorite INTEGER NOT NULL DEFAULT 0,"
             " encrypted_identifier TEXT,"
             " encrypted_secret_value TEXT NOT NULL,"
             " encrypted_notes TEXT,"
             " key_fingerprint TEXT NOT NULL,"
             " iv TEXT NOT NULL,"
             " salt TEXT NOT NULL,"
             " is_active INTEGER NOT NULL,"
             " created_at TEXT NOT NULL,"
             " updated_at TEXT NOT NULL,"
             " UNIQUE (secret_id, version)"
             ");");

    exec(db, "CREATE TABLE IF NOT EXISTS notes ("
             " id TEXT PRIMARY KEY,"
             " user_id TEXT NOT NULL REFERENCES users(id),"
             " title TEXT NOT NULL,"
             " content TEXT NOT NULL,"
             " is_secure INTEGER NOT NULL DEFAULT 0,"
             " tags TEXT NOT NULL DEFAULT '[]',"
             " is_favorite INTEGER NOT NULL DEFAULT 0,"
             " color TEXT NOT NULL,"
             " key_fingerprint TEXT,"
             " iv TEXT,"
             " salt TEXT,"
             " created_at TEXT NOT NULL,"
             " updated_at TEXT NOT NULL,"
             " deleted_at TEXT"
             ");");
    exec(db, "CREATE INDEX IF NOT EXISTS notes_by_user ON notes(user_id, deleted_at);");
}

// Column blocks shared by secrets and secret_versions, in schema order.
constexpr const char* g_metadataColumns{ "title, description, category, is_favorite" };
constexpr const char* g_envelopeColumns{
    "encrypted_identifier, encrypted_secret_value, encrypted_notes, key_fingerprint, iv, salt"
};

void bindMetadata(Statement& stmt, int first, const SecretMetadata& metadata)
{
    stmt.bind(first, std::string_view{ metadata.title });
    stmt.bind(first + 1, metadata.description);
    stmt.bind(first + 2, std::string_view{ metadata.category });
    stmt.bind(first + 3, metadata.isFavorite);
}

void bindEnvelope(Statement& stmt, int first, const SecretEnvelope& envelope)
{
    stmt.bind(first, envelope.encryptedIdentifier);
    stmt.bind(first + 1, std::string_view{ envelope.encryptedSecretValue });
    stmt.bind(first + 2, envelope.encryptedNotes);
    stmt.bind(first + 3, std::string_view{ envelope.keyFingerprint });
    stmt.bind(first + 4, std::string_view{ envelope.iv });
    stmt.bind(first + 5, std::string_view{ envelope.salt });
}

[[nodiscard]] SecretMetadata readMetadata(const Statement& stmt, int first)
{
    SecretMetadata metadata{};
    metadata.title = stmt.text(first);
    metadata.description = stmt.optionalText(first + 1);
    metadata.category = stmt.text(first + 2);
    metadata.isFavorite = stmt.flag(first + 3);
    return metadata;
}

[[nodiscard]] SecretEnvelope readEnvelope(const Statement& stmt, int first)
{
    SecretEnvelope envelope{};
    envelope.encryptedIdentifier = stmt.optionalText(first);
    envelope.encryptedSecretValue = stmt.text(first + 1);
    envelope.encryptedNotes = stmt.optionalText(first + 2);
    envelope.keyFingerprint = stmt.text(first + 3);
    envelope.iv = stmt.text(first + 4);
    envelope.salt = stmt.text(first + 5);
    return envelope;
}

[[nodiscard]] std::string secretSelect(std::string_view where)
{
    std::string sql{ "SELECT id, user_id, " };
    sql.append(g_metadataColumns).append(", ").append(g_envelopeColumns);
    sql.append(", is_active, created_at, updated_at FROM secrets ");
    sql.append(where);
    return sql;
}

[[nodiscard]] SecretRecord readSecret(const Statement& stmt)
{
    SecretRecord secret{};
    secret.id = stmt.text(0);
    secret.userId = stmt.text(1);
    secret.metadata = readMetadata(stmt, 2);
    secret.envelope = readEnvelope(stmt, 6);
    secret.isActive = stmt.flag(12);
    secret.createdAt = stmt.text(13);
    secret.updatedAt = stmt.text(14);
    return secret;
}

[[nodiscard]] std::string versionSelect(std::string_view where)
{
    std::string sql{ "SELECT id, secret_id, user_id, version, " };
    sql.append(g_metadataColumns).append(", ").append(g_envelopeColumns);
    sql.append(", is_active, created_at, updated_at FROM secret_versions ");
    sql.append(where);
    return sql;
}

[[nodiscard]] SecretVersion readVersion(const Statement& stmt)
{
    SecretVersion version{};
    version.id = stmt.text(0);
    version.secretId = stmt.text(1);
    version.userId = stmt.text(2);
    version.version = static_cast<std::uint32_t>(stmt.integer(3));
    version.metadata = readMetadata(stmt, 4);
    version.envelope = readEnvelope(stmt, 8);
    version.isActive = stmt.flag(14);
    version.createdAt = stmt.text(15);
    version.updatedAt = stmt.text(16);
    return version;
}

constexpr const char* g_noteSelect{ "SELECT id, user_id, title, content, is_secure, tags, is_favorite, color,"
                                    " key_fingerprint, iv, salt, created_at, updated_at FROM notes " };

[[nodiscard]] std::string tagsToText(const std::vector<std::string>& tags)
{
    return nlohmann::json(tags).dump();
}

[[nodiscard]] std::vector<std::string> tagsFromText(const std::string& text)
{
    const auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array())
    {
        throw StorageFailure("storage: corrupt note tags");
    }
    std::vector<std::string> tags{};
    for (const auto& tag : parsed)
    {
        if (!tag.is_string())
        {
            throw StorageFailure("storage: corrupt note tags");
        }
        tags.push_back(tag.get<std::string>());
    }
    return tags;
}

[[nodiscard]] NoteRecord readNote(const Statement& stmt)
{
    NoteRecord note{};
    note.id = stmt.text(0);
    note.userId = stmt.text(1);
    note.title = stmt.text(2);
    note.content = stmt.text(3);
    note.isSecure = stmt.flag(4);
    note.tags = tagsFromText(stmt.text(5));
    note.isFavorite = stmt.flag(6);
    note.color = stmt.text(7);
    const auto fingerprint = stmt.optionalText(8);
    const auto iv = stmt.optionalText(9);
    const auto salt = stmt.optionalText(10);
    if (fingerprint && iv && salt)
    {
        note.crypto = NoteCrypto{ *fingerprint, *iv, *salt };
    }
    note.createdAt = stmt.text(11);
    note.updatedAt = stmt.text(12);
    return note;
}

void bindNoteCrypto(Statement& stmt, int first, const std::optional<NoteCrypto>& crypto)
{
    stmt.bind(first, crypto ? std::optional<std::string>{ crypto->keyFingerprint } : std::nullopt);
    stmt.bind(first + 1, crypto ? std::optional<std::string>{ crypto->iv } : std::nullopt);
    stmt.bind(first + 2, crypto ? std::optional<std::string>{ crypto->salt } : std::nullopt);
}

class SqliteStorageRepository final : public sigil::storage::IStorageRepository
{
public:
    explicit SqliteStorageRepository(SqliteDbPtr db) : m_db(std::move(db))
    {
        ensureSchema(m_db.get());
    }

    void insertUser(const UserProfile& user) override
    {
        const std::lock_guard lock{ m_mutex };
        Statement stmt{ m_db.get(),
                        "INSERT INTO users(id, email, first_name, last_name, created_at) VALUES (?, ?, ?, ?, ?);" };
        stmt.bind(1, std::string_view{ user.id });
        stmt.bind(2, std::string_view{ user.email });
        stmt.bind(3, std::string_view{ user.firstName });
        stmt.bind(4, std::string_view{ user.lastName });
        stmt.bind(5, std::string_view{ user.createdAt });
        stmt.run();
    }

    [[nodiscard]] std::optional<UserProfile> loadUser(std::string_view userId) const override
    {
        const std::lock_guard lock{ m_mutex };
        Statement stmt{ m_db.get(), "SELECT id, email, first_name, last_name, created_at FROM users WHERE id = ?;" };
        stmt.bind(1, userId);
        if (!stmt.step())
        {
            return std::nullopt;
        }
        return UserProfile{ stmt.text(0), stmt.text(1), stmt.text(2), stmt.text(3), stmt.text(4) };
    }

    [[nodiscard]] std::optional<MasterKeyRecord> loadMasterKey(std::string_view userId) const override
    {
        const std::lock_guard lock{ m_mutex };
        Statement stmt{ m_db.get(), "SELECT master_key_fingerprint, master_key_salt FROM users WHERE id = ?;" };
        stmt.bind(1, userId);
        if (!stmt.step())
        {
            return std::nullopt;
        }
        auto fingerprint = stmt.optionalText(0);
        auto salt = stmt.optionalText(1);
        if (!fingerprint || !salt)
        {
            return std::nullopt;
        }
        return MasterKeyRecord{ std::move(*fingerprint), std::move(*salt) };
    }

    void storeMasterKey(std::string_view userId, const MasterKeyRecord& record) override
    {
        const std::lock_guard lock{ m_mutex };
        Statement stmt{ m_db.get(),
                        "UPDATE users SET master_key_fingerprint = ?, master_key_salt = ? WHERE id = ?;" };
        stmt.bind(1, std::string_view{ record.fingerprint });
        stmt.bind(2, std::string_view{ record.salt });
        stmt.bind(3, userId);
        stmt.run();
        requireChanged("storage: user not found");
    }

    void insertSecret(const SecretRecord& secret) override
    {
        const std::lock_guard lock{ m_mutex };
        std::string sql{ "INSERT INTO secrets(id, user_id, " };
        sql.append(g_metadataColumns).append(", ").append(g_envelopeColumns);
        sql.append(", is_active, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        Statement stmt{ m_db.get(), sql.c_str() };
        stmt.bind(1, std::string_view{ secret.id });
        stmt.bind(2, std::string_view{ secret.userId });
        bindMetadata(stmt, 3, secret.metadata);
        bindEnvelope(stmt, 7, secret.envelope);
        stmt.bind(13, secret.isActive);
        stmt.bind(14, std::string_view{ secret.createdAt });
        stmt.bind(15, std::string_view{ secret.updatedAt });
        stmt.run();
    }

    void updateSecret(const SecretRecord& secret) override
    {
        const std::lock_guard lock{ m_mutex };
        Statement stmt{ m_db.get(),
                        "UPDATE secrets SET title = ?, description = ?, category = ?, is_favorite = ?,"
                        " encrypted_identifier = ?, encrypted_secret_value = ?, encrypted_notes = ?,"
                        " key_fingerprint = ?, iv = ?, salt = ?, is_active = ?, updated_at = ?"
                        " WHERE id = ? AND user_id = ?;" };
        bindMetadata(stmt, 1, secret.metadata);
        bindEnvelope(stmt, 5, secret.envelope);
        stmt.bind(11, secret.isActive);
        stmt.bind(12, std::string_view{ secret.updatedAt });
        stmt.bind(13, std::string_view{ secret.id });
        stmt.bind(14, std::string_view{ secret.userId });
        stmt.run();
        requireChanged("storage: secret not found");
    }

    [[nodiscard]] std::optional<SecretRecord> loadSecret(std::string_view userId,
                                                         std::string_view secretId) const override
    {
        const std::lock_guard lock{ m_mutex };
        const auto sql = secretSelect("WHERE user_id = ? AND id = ?;");
        Statement stmt{ m_db.get(), sql.c_str() };
        stmt.bind(1, userId);
        stmt.bind(2, secretId);
        if (!stmt.step())
        {
            return std::nullopt;
        }
        return readSecret(stmt);
    }

    [[nodiscard]] std::vector<SecretRecord> listSecrets(std::string_view userId, bool includeInactive) const override
    {
        const std::lock_guard lock{ m_mutex };
        const auto sql = secretSelect(includeInactive
                                          ? "WHERE user_id = ? ORDER BY title COLLATE NOCASE, created_at;"
                                          : "WHERE user_id = ? AND is_active = 1 ORDER BY title COLLATE NOCASE, created_at;");
        Statement stmt{ m_db.get(), sql.c_str() };
        stmt.bind(1, userId);
        std::vector<SecretRecord> out{};
        while (stmt.step())
        {
            out.push_back(readSecret(stmt));
        }
        return out;
    }

    [[nodiscard]] SecretVersion appendVersion(const SecretVersion& draft) override
    {
        const std::lock_guard lock{ m_mutex };
        std::string sql{ "INSERT INTO secret_versions(id, secret_id, user_id, version, " };
        sql.append(g_metadataColumns).append(", ").append(g_envelopeColumns);
        sql.append(", is_active, created_at, updated_at)"
                   " SELECT ?1, ?2, ?3, COALESCE(MAX(version), 0) + 1,"
                   " ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16"
                   " FROM secret_versions WHERE secret_id = ?2;");

        for (int attempt = 0; attempt < g_appendVersionAttempts; ++attempt)
        {
            Statement stmt{ m_db.get(), sql.c_str() };
            stmt.bind(1, std::string_view{ draft.id });
            stmt.bind(2, std::string_view{ draft.secretId });
            stmt.bind(3, std::string_view{ draft.userId });
            bindMetadata(stmt, 4, draft.metadata);
            bindEnvelope(stmt, 8, draft.envelope);
            stmt.bind(14, draft.isActive);
            stmt.bind(15, std::string_view{ draft.createdAt });
            stmt.bind(16, std::string_view{ draft.updatedAt });

            const int rc = stmt.stepRaw();
            if (rc == SQLITE_DONE)
            {
                return loadVersionById(draft.id);
            }
            if (!isConstraintViolation(rc))
            {
                throw StorageFailure(sqliteErr(m_db.get(), "storage: append version failed"));
            }
        }
        throw VersionConflict("storage: could not allocate a version number");
    }

    void insertVersion(const SecretVersion& version) override
    {
        const std::lock_guard lock{ m_mutex };
        std::string sql{ "INSERT INTO secret_versions(id, secret_id, user_id, version, " };
        sql.append(g_metadataColumns).append(", ").append(g_envelopeColumns);
        sql.append(", is_active, created_at, updated_at)"
                   " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        Statement stmt{ m_db.get(), sql.c_str() };
        stmt.bind(1, std::string_view{ version.id });
        stmt.bind(2, std::string_view{ version.secretId });
        stmt.bind(3, std::string_view{ version.userId });
        stmt.bind(4, static_cast<std::int64_t>(version.version));
        bindMetadata(stmt, 5, version.metadata);
        bindEnvelope(stmt, 9, version.envelope);
        stmt.bind(15, version.isActive);
        stmt.bind(16, std::string_view{ version.createdAt });
        stmt.bind(17, std::string_view{ version.updatedAt });

        const int rc = stmt.stepRaw();
        if (rc == SQLITE_DONE)
        {
            return;
        }
        if (isConstraintViolation(rc))
        {
            throw VersionConflict(sqliteErr(m_db.get(), "storage: version already exists"));
        }
        throw StorageFailure(sqliteErr(m_db.get(), "storage: insert version failed"));
    }

    [[nodiscard]] std::optional<SecretVersion> loadVersion(std::string_view userId, std::string_view secretId,
                                                           std::uint32_t version) const override
    {
        const std::lock_guard lock{ m_mutex };
        const auto sql = versionSelect("WHERE user_id = ? AND secret_id = ? AND version = ?;");
        Statement stmt{ m_db.get(), sql.c_str() };
        stmt.bind(1, userId);
        stmt.bind(2, secretId);
        stmt.bind(3, static_cast<std::int64_t>(version));
        if (!stmt.step())
        {
            return std::nullopt;
        }
        return readVersion(stmt);
    }

    [[nodiscard]] std::vector<SecretVersion> listVersions(std::string_view userId,
                                                          std::string_view secretId) const override
    {
        const std::lock_guard lock{ m_mutex };
        const auto sql = versionSelect("WHERE user_id = ? AND secret_id = ? ORDER BY version ASC;");
        Statement stmt{ m_db.get(), sql.c_str() };
        stmt.bind(1, userId);
        stmt.bind(2, secretId);
        std::vector<SecretVersion> out{};
        while (stmt.step())
        {
            out.push_back(readVersion(stmt));
        }
        return out;
    }

    [[nodiscard]] std::vector<SecretVersion> listAllVersions(std::string_view userId) const override
    {
        const std::lock_guard lock{ m_mutex };
        const auto sql = versionSelect("WHERE user_id = ? ORDER BY secret_id, version ASC;");
        Statement stmt{ m_db.get(), sql.c_str() };
        stmt.bind(1, userId);
        std::vector<SecretVersion> out{};
        while (stmt.step())
        {
            out.push_back(readVersion(stmt));
        }
        return out;
    }

    void insertNote(const NoteRecord& note) override
    {
        const std::lock_guard lock{ m_mutex };
        Statement stmt{ m_db.get(),
                        "INSERT INTO notes(id, user_id, title, content, is_secure, tags, is_favorite, color,"
                        " key_fingerprint, iv, salt, created_at, updated_at)"
                        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);" };
        stmt.bind(1, std::string_view{ note.id });
        stmt.bind(2, std::string_view{ note.userId });
        stmt.bind(3, std::string_view{ note.title });
        stmt.bind(4, std::string_view{ note.content });
        stmt.bind(5, note.isSecure);
        stmt.bind(6, std::string_view{ tagsToText(note.tags) });
        stmt.bind(7, note.isFavorite);
        stmt.bind(8, std::string_view{ note.color });
        bindNoteCrypto(stmt, 9, note.crypto);
        stmt.bind(12, std::string_view{ note.createdAt });
        stmt.bind(13, std::string_view{ note.updatedAt });
        stmt.run();
    }

    void updateNote(const NoteRecord& note) override
    {
        const std::lock_guard lock{ m_mutex };
        Statement stmt{ m_db.get(),
                        "UPDATE notes SET title = ?, content = ?, is_secure = ?, tags = ?, is_favorite = ?,"
                        " color = ?, key_fingerprint = ?, iv = ?, salt = ?, updated_at = ?"
                        " WHERE id = ? AND user_id = ? AND deleted_at IS NULL;" };
        stmt.bind(1, std::string_view{ note.title });
        stmt.bind(2, std::string_view{ note.content });
        stmt.bind(3, note.isSecure);
        stmt.bind(4, std::string_view{ tagsToText(note.tags) });
        stmt.bind(5, note.isFavorite);
        stmt.bind(6, std::string_view{ note.color });
        bindNoteCrypto(stmt, 7, note.crypto);
        stmt.bind(10, std::string_view{ note.updatedAt });
        stmt.bind(11, std::string_view{ note.id });
        stmt.bind(12, std::string_view{ note.userId });
        stmt.run();
        requireChanged("storage: note not found");
    }

    [[nodiscard]] std::optional<NoteRecord> loadNote(std::string_view userId, std::string_view noteId) const override
    {
        const std::lock_guard lock{ m_mutex };
        const std::string sql = std::string{ g_noteSelect } + "WHERE user_id = ? AND id = ? AND deleted_at IS NULL;";
        Statement stmt{ m_db.get(), sql.c_str() };
        stmt.bind(1, userId);
        stmt.bind(2, noteId);
        if (!stmt.step())
        {
            return std::nullopt;
        }
        return readNote(stmt);
    }

    [[nodiscard]] std::vector<NoteRecord> listNotes(std::string_view userId) const override
    {
        const std::lock_guard lock{ m_mutex };
        const std::string sql =
            std::string{ g_noteSelect } + "WHERE user_id = ? AND deleted_at IS NULL ORDER BY updated_at DESC, id;";
        Statement stmt{ m_db.get(), sql.c_str() };
        stmt.bind(1, userId);
        std::vector<NoteRecord> out{};
        while (stmt.step())
        {
            out.push_back(readNote(stmt));
        }
        return out;
    }

    [[nodiscard]] bool softDeleteNote(std::string_view userId, std::string_view noteId,
                                      std::string_view deletedAt) override
    {
        const std::lock_guard lock{ m_mutex };
        Statement stmt{ m_db.get(),
                        "UPDATE notes SET deleted_at = ? WHERE id = ? AND user_id = ? AND deleted_at IS NULL;" };
        stmt.bind(1, deletedAt);
        stmt.bind(2, noteId);
        stmt.bind(3, userId);
        stmt.run();
        return sqlite3_changes(m_db.get()) > 0;
    }

    void runInTransaction(const std::function<void()>& work) override
    {
        const std::lock_guard lock{ m_mutex };
        if (m_transactionDepth == 0)
        {
            exec(m_db.get(), "BEGIN IMMEDIATE;");
        }
        ++m_transactionDepth;
        try
        {
            work();
        }
        catch (...)
        {
            --m_transactionDepth;
            if (m_transactionDepth == 0)
            {
                (void)sqlite3_exec(m_db.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
            }
            throw;
        }
        --m_transactionDepth;
        if (m_transactionDepth == 0)
        {
            if (sqlite3_exec(m_db.get(), "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
            {
                const auto msg = sqliteErr(m_db.get(), "storage: commit failed");
                (void)sqlite3_exec(m_db.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
                throw StorageFailure(msg);
            }
        }
    }

private:
    void requireChanged(const char* what) const
    {
        if (sqlite3_changes(m_db.get()) == 0)
        {
            throw RecordNotFound(what);
        }
    }

    [[nodiscard]] SecretVersion loadVersionById(std::string_view id) const
    {
        const auto sql = versionSelect("WHERE id = ?;");
        Statement stmt{ m_db.get(), sql.c_str() };
        stmt.bind(1, id);
        if (!stmt.step())
        {
            throw StorageFailure("storage: appended version vanished");
        }
        return readVersion(stmt);
    }

    mutable std::recursive_mutex m_mutex;
    SqliteDbPtr m_db;
    int m_transactionDepth{ 0 };
};

} // namespace

[[nodiscard]] std::unique_ptr<sigil::storage::IStorageRepository>
makeSqliteStorageRepository(const std::filesystem::path& databasePath)
{
    return std::make_unique<SqliteStorageRepository>(openDb(databasePath));
}

} // namespace sigil::storage::sqlite
