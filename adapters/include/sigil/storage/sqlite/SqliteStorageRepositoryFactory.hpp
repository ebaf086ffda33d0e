#ifndef INCLUDE_SIGIL_STORAGE_SQLITE_SQLITESTORAGEREPOSITORYFACTORY_HPP
#define INCLUDE_SIGIL_STORAGE_SQLITE_SQLITESTORAGEREPOSITORYFACTORY_HPP

#include "sigil/storage/IStorageRepository.hpp"
#include <filesystem>
#include <memory>

namespace sigil::storage::sqlite
{

// Opens (creating if needed) the database at `databasePath`. ":memory:" gives a private
// in-memory database. Throws StorageFailure.
[[nodiscard]] std::unique_ptr<sigil::storage::IStorageRepository>
makeSqliteStorageRepository(const std::filesystem::path& databasePath);

} // namespace sigil::storage::sqlite

#endif // INCLUDE_SIGIL_STORAGE_SQLITE_SQLITESTORAGEREPOSITORYFACTORY_HPP
