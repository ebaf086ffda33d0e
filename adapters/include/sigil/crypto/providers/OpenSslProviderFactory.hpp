#ifndef INCLUDE_SIGIL_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_SIGIL_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "sigil/crypto/ICryptoProvider.hpp"
#include <memory>

namespace sigil::crypto::providers
{

// OpenSSL 3 EVP for AES, SHA-256 and PBKDF2; Argon2id runs on monocypher.
[[nodiscard]] std::unique_ptr<sigil::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace sigil::crypto::providers

#endif // INCLUDE_SIGIL_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
