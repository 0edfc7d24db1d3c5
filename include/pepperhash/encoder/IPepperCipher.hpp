#ifndef INCLUDE_PEPPERHASH_ENCODER_IPEPPERCIPHER_HPP
#define INCLUDE_PEPPERHASH_ENCODER_IPEPPERCIPHER_HPP

#include "pepperhash/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>
#include <string_view>

namespace pepperhash::encoder
{

// Symmetric pepper cipher keyed by (cipher name, key id). The salt is associated data, never the key.
class IPepperCipher
{
public:
    IPepperCipher() = default;
    IPepperCipher(const IPepperCipher&) = delete;
    IPepperCipher& operator=(const IPepperCipher&) = delete;
    IPepperCipher(IPepperCipher&&) = delete;
    IPepperCipher& operator=(IPepperCipher&&) = delete;
    virtual ~IPepperCipher() = default;

    // Throws std::invalid_argument for an unknown cipher or key id.
    [[nodiscard]] virtual pepperhash::security::SecureBuffer encryptHash(std::string_view cipher,
                                                                         std::string_view keyId,
                                                                         std::span<const std::uint8_t> salt,
                                                                         std::span<const std::uint8_t> plain) const = 0;

    // Throws DecryptError for an unknown cipher, an unknown key id or unusable ciphertext.
    [[nodiscard]] virtual pepperhash::security::SecureBuffer
    decryptHash(std::string_view cipher, std::string_view keyId, std::span<const std::uint8_t> salt,
                std::span<const std::uint8_t> cipherText) const = 0;

    [[nodiscard]] virtual bool supportsKey(std::string_view cipher, std::string_view keyId) const noexcept = 0;
};

} // namespace pepperhash::encoder

#endif // INCLUDE_PEPPERHASH_ENCODER_IPEPPERCIPHER_HPP
