#ifndef INCLUDE_PEPPERHASH_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_PEPPERHASH_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "pepperhash/crypto/ICryptoProvider.hpp"
#include <memory>
#include <string_view>

namespace pepperhash::crypto::providers
{

constexpr std::string_view g_kNativeProviderName{ "native" };

// Monocypher backend: Argon2 i/d/id, ChaCha20-IETF keystream, BLAKE2b nonce derivation and
// getrandom(2). Always built.
[[nodiscard]] std::unique_ptr<pepperhash::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace pepperhash::crypto::providers

#endif // INCLUDE_PEPPERHASH_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
