#ifndef INCLUDE_PEPPERHASH_ENCODER_PEPPERKEYRING_HPP
#define INCLUDE_PEPPERHASH_ENCODER_PEPPERKEYRING_HPP

#include "pepperhash/crypto/ICryptoProvider.hpp"
#include "pepperhash/encoder/IPepperCipher.hpp"
#include "pepperhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace pepperhash::encoder
{

constexpr std::string_view g_kChaCha20CipherName{ "chacha20" };
constexpr std::size_t g_kPepperKeyBytes{ pepperhash::crypto::g_streamKeyBytes };

using PepperKeys = std::map<std::string, pepperhash::security::SecureBuffer, std::less<>>;

// In-memory pepper lookup over the provider's stream cipher. Ciphertext has the digest's length.
class PepperKeyring final : public IPepperCipher
{
public:
    // Throws ConfigError for a key that is not 32 bytes or a key id unusable in hash strings.
    PepperKeyring(pepperhash::crypto::ICryptoProvider& crypto, PepperKeys keys);

    [[nodiscard]] pepperhash::security::SecureBuffer encryptHash(std::string_view cipher, std::string_view keyId,
                                                                 std::span<const std::uint8_t> salt,
                                                                 std::span<const std::uint8_t> plain) const override;
    [[nodiscard]] pepperhash::security::SecureBuffer
    decryptHash(std::string_view cipher, std::string_view keyId, std::span<const std::uint8_t> salt,
                std::span<const std::uint8_t> cipherText) const override;
    [[nodiscard]] bool supportsKey(std::string_view cipher, std::string_view keyId) const noexcept override;

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_keys.size();
    }

private:
    [[nodiscard]] const pepperhash::security::SecureBuffer* findKey(std::string_view cipher,
                                                                    std::string_view keyId) const noexcept;

    pepperhash::crypto::ICryptoProvider* m_crypto{ nullptr };
    PepperKeys m_keys;
};

// Parses "<id>=<64 hex digits>". Throws ConfigError; the message never echoes key material.
[[nodiscard]] std::pair<std::string, pepperhash::security::SecureBuffer> parsePepperSpec(std::string_view spec);

} // namespace pepperhash::encoder

#endif // INCLUDE_PEPPERHASH_ENCODER_PEPPERKEYRING_HPP
