#ifndef INCLUDE_SIGIL_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_SIGIL_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace sigil::storage
{

// Any backend failure (I/O, SQL, constraint other than the ones below).
class StorageFailure : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// An update or delete addressed a row that does not exist.
class RecordNotFound final : public StorageFailure
{
public:
    using StorageFailure::StorageFailure;
};

// (secretId, version) already taken.
class VersionConflict final : public StorageFailure
{
public:
    using StorageFailure::StorageFailure;
};

} // namespace sigil::storage

#endif // INCLUDE_SIGIL_STORAGE_STORAGEERRORS_HPP
