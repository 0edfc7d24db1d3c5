#ifndef INCLUDE_PEPPERHASH_ENCODER_ARGON2PRIMITIVES_HPP
#define INCLUDE_PEPPERHASH_ENCODER_ARGON2PRIMITIVES_HPP

#include "pepperhash/crypto/ICryptoProvider.hpp"
#include "pepperhash/encoder/CostProfile.hpp"
#include "pepperhash/encoder/EncoderErrors.hpp"
#include "pepperhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace pepperhash::encoder
{

// Raw digest with every failure mapped to EncoderError::HashFailed.
[[nodiscard]] EncoderResult<pepperhash::security::SecureBuffer>
argon2RawOrError(const pepperhash::crypto::ICryptoProvider& crypto, pepperhash::crypto::Argon2Subtype subtype,
                 std::span<const std::byte> password, std::span<const std::uint8_t> salt,
                 const pepperhash::crypto::Argon2Params& params, std::size_t outBytes) noexcept;

// Hashes into the unencrypted grammar. Throws std::invalid_argument for parameters outside the
// backend limits.
[[nodiscard]] std::string argon2Pass(const pepperhash::crypto::ICryptoProvider& crypto,
                                     pepperhash::crypto::Argon2Subtype subtype, std::span<const std::byte> password,
                                     std::span<const std::uint8_t> salt,
                                     const pepperhash::crypto::Argon2Params& params, std::size_t outBytes);

// Fails closed: malformed hashes and primitive failures yield false.
[[nodiscard]] bool argon2Verify(const pepperhash::crypto::ICryptoProvider& crypto, std::string_view hash,
                                std::span<const std::byte> password) noexcept;

// True unless `hash` is in the unencrypted grammar and every parameter, the salt length and the
// digest length match `profile` exactly.
[[nodiscard]] bool argon2NeedsRehash(std::string_view hash, const CostProfile& profile) noexcept;

} // namespace pepperhash::encoder

#endif // INCLUDE_PEPPERHASH_ENCODER_ARGON2PRIMITIVES_HPP
