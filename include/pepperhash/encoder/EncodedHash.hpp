#ifndef INCLUDE_PEPPERHASH_ENCODER_ENCODEDHASH_HPP
#define INCLUDE_PEPPERHASH_ENCODER_ENCODEDHASH_HPP

#include "pepperhash/crypto/Argon2Types.hpp"
#include "pepperhash/security/SecureBuffer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pepperhash::encoder
{

// Structured view of a hash string. `cipherName` and `keyId` are set only for the encrypted form;
// `payload` is the Argon2 digest (plain form) or its ciphertext (encrypted form).
struct EncodedHash final
{
    pepperhash::crypto::Argon2Subtype subtype{ pepperhash::crypto::Argon2Subtype::Argon2id };
    std::optional<std::string> cipherName;
    std::optional<std::string> keyId;
    std::uint64_t memoryCost{ 0U };
    std::uint32_t timeCost{ 0U };
    std::uint32_t parallelism{ 0U };
    std::vector<std::uint8_t> salt;
    pepperhash::security::SecureBuffer payload;

    [[nodiscard]] bool isEncrypted() const noexcept
    {
        return cipherName.has_value() && keyId.has_value();
    }

    [[nodiscard]] pepperhash::crypto::Argon2Params argon2Params() const noexcept
    {
        return pepperhash::crypto::Argon2Params{
            .timeCost = timeCost,
            .memoryKiB = static_cast<std::uint32_t>(memoryCost / 1024U),
            .parallelism = parallelism,
        };
    }

    bool operator==(const EncodedHash&) const = default;
};

} // namespace pepperhash::encoder

#endif // INCLUDE_PEPPERHASH_ENCODER_ENCODEDHASH_HPP
