#ifndef INCLUDE_PEPPERHASH_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_PEPPERHASH_CRYPTO_ICRYPTOPROVIDER_HPP

#include "pepperhash/crypto/Argon2Types.hpp"
#include "pepperhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace pepperhash::crypto
{

constexpr std::size_t g_streamKeyBytes{ 32 };
constexpr std::size_t g_streamNonceBytes{ 12 };
constexpr std::size_t g_blake2bBytes{ 64 };

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Raw Argon2 v1.3 output of `outBytes` bytes. No secret key, no associated data.
    // Requests outside the backend limits throw std::invalid_argument.
    [[nodiscard]] virtual pepperhash::security::SecureBuffer argon2Raw(Argon2Subtype subtype,
                                                                       std::span<const std::byte> password,
                                                                       std::span<const std::uint8_t> salt,
                                                                       const Argon2Params& params,
                                                                       std::size_t outBytes) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // ChaCha20 (RFC 8439, block counter 0) keystream XOR. The 12-byte nonce is the prefix of
    // BLAKE2b-512(nonceSeed). Encryption and decryption are the same operation.
    [[nodiscard]] virtual pepperhash::security::SecureBuffer streamXor(std::span<const std::uint8_t> key,
                                                                       std::span<const std::uint8_t> nonceSeed,
                                                                       std::span<const std::uint8_t> input) const = 0;
};

} // namespace pepperhash::crypto

#endif // INCLUDE_PEPPERHASH_CRYPTO_ICRYPTOPROVIDER_HPP
