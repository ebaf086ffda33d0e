#ifndef SIGIL_SRC_CORE_ERRORMAPPING_HPP
#define SIGIL_SRC_CORE_ERRORMAPPING_HPP

#include "sigil/core/VaultErrors.hpp"
#include "sigil/log/Logger.hpp"
#include "sigil/storage/StorageErrors.hpp"
#include <exception>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <variant>

namespace sigil::core::detail
{

// Aborts a transaction body with a specific result code.
class VaultAbort final : public std::exception
{
public:
    explicit VaultAbort(VaultError error) noexcept : m_error(error)
    {
    }

    [[nodiscard]] const char* what() const noexcept override
    {
        return "vault operation aborted";
    }

    [[nodiscard]] VaultError error() const noexcept
    {
        return m_error;
    }

private:
    VaultError m_error;
};

// Unwraps a nested service result inside a guarded body.
template <class T> [[nodiscard]] T valueOrAbort(VaultResult<T>&& result)
{
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        throw VaultAbort{ *error };
    }
    return std::get<T>(std::move(result));
}

inline void report(sigil::log::ILogger& logger, sigil::log::Level level, std::string_view operation, VaultError error,
                   std::string_view detail) noexcept
{
    if (!logger.enabled(level))
    {
        return;
    }
    try
    {
        logger.log(level, "{}: {} ({})", operation, toString(error), detail);
    }
    catch (const std::exception&)
    {
        logger.write(level, toString(error));
    }
}

// Runs `fn` and turns the exceptions thrown below the service layer into VaultError codes.
template <class T, class Fn>
[[nodiscard]] VaultResult<T> guarded(sigil::log::ILogger& logger, std::string_view operation, Fn&& fn) noexcept
{
    using sigil::log::Level;
    try
    {
        return std::forward<Fn>(fn)();
    }
    catch (const VaultAbort& e)
    {
        return e.error();
    }
    catch (const DerivationFailure& e)
    {
        report(logger, Level::Warn, operation, VaultError::DerivationFailure, e.what());
        return VaultError::DerivationFailure;
    }
    catch (const AuthenticationFailure& e)
    {
        report(logger, Level::Warn, operation, VaultError::AuthenticationFailure, e.what());
        return VaultError::AuthenticationFailure;
    }
    catch (const RandomFailure& e)
    {
        report(logger, Level::Error, operation, VaultError::RandomFailed, e.what());
        return VaultError::RandomFailed;
    }
    catch (const sigil::storage::StorageFailure& e)
    {
        report(logger, Level::Error, operation, VaultError::StorageError, e.what());
        return VaultError::StorageError;
    }
    catch (const std::invalid_argument& e)
    {
        report(logger, Level::Warn, operation, VaultError::InvalidArgument, e.what());
        return VaultError::InvalidArgument;
    }
    catch (const std::exception& e)
    {
        report(logger, Level::Error, operation, VaultError::CryptoError, e.what());
        return VaultError::CryptoError;
    }
}

} // namespace sigil::core::detail

#endif // SIGIL_SRC_CORE_ERRORMAPPING_HPP
