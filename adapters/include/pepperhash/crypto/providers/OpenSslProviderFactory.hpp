#ifndef INCLUDE_PEPPERHASH_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_PEPPERHASH_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "pepperhash/crypto/ICryptoProvider.hpp"
#include <memory>
#include <string_view>

namespace pepperhash::crypto::providers
{

constexpr std::string_view g_kOpenSslProviderName{ "openssl" };

// Only defined when built with PEPH_ENABLE_OPENSSL.
// Argon2 needs an OpenSSL build that ships the ARGON2* KDFs (3.2 or later); on older builds
// argon2Raw throws std::runtime_error while the stream cipher still works.
[[nodiscard]] std::unique_ptr<pepperhash::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace pepperhash::crypto::providers

#endif // INCLUDE_PEPPERHASH_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
