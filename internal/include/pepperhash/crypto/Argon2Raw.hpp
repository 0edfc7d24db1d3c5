#ifndef INCLUDE_PEPPERHASH_CRYPTO_ARGON2RAW_HPP
#define INCLUDE_PEPPERHASH_CRYPTO_ARGON2RAW_HPP

#include "pepperhash/crypto/Argon2Types.hpp"
#include "pepperhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace pepperhash::crypto
{

// Monocypher-backed Argon2. Lanes are computed sequentially; the output matches the reference
// implementation for any parallelism.
[[nodiscard]] pepperhash::security::SecureBuffer deriveArgon2Raw(Argon2Subtype subtype,
                                                                 std::span<const std::byte> password,
                                                                 std::span<const std::uint8_t> salt,
                                                                 const Argon2Params& params, std::size_t outBytes);

} // namespace pepperhash::crypto

#endif // INCLUDE_PEPPERHASH_CRYPTO_ARGON2RAW_HPP
