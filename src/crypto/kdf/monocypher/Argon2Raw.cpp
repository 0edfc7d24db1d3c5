#include "pepperhash/crypto/Argon2Raw.hpp"

#include "pepperhash/security/SecureBuffer.hpp"
#include <monocypher.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <stdexcept>
#include <vector>

namespace pepperhash::crypto
{
namespace
{

[[nodiscard]] std::uint32_t monocypherAlgorithm(Argon2Subtype subtype) noexcept
{
    switch (subtype)
    {
    case Argon2Subtype::Argon2i:
        return CRYPTO_ARGON2_I;
    case Argon2Subtype::Argon2d:
        return CRYPTO_ARGON2_D;
    case Argon2Subtype::Argon2id:
        return CRYPTO_ARGON2_ID;
    }
    return CRYPTO_ARGON2_ID;
}

} // namespace

[[nodiscard]] pepperhash::security::SecureBuffer deriveArgon2Raw(Argon2Subtype subtype,
                                                                 std::span<const std::byte> password,
                                                                 std::span<const std::uint8_t> salt,
                                                                 const Argon2Params& params, std::size_t outBytes)
{
    requireArgon2InputsSafe(params, password.size(), salt.size(), outBytes);

    constexpr std::size_t kU64WordsPerKiB{ 128U }; // 1024 / sizeof(uint64_t)
    if (params.memoryKiB > (std::numeric_limits<std::size_t>::max() / kU64WordsPerKiB))
    {
        throw std::bad_alloc{};
    }
    const std::size_t workWords{ static_cast<std::size_t>(params.memoryKiB) * kU64WordsPerKiB };
    pepperhash::security::SecureVector<std::uint64_t> workArea(workWords);

    pepperhash::security::SecureBuffer out;
    out.resize(outBytes);

    const crypto_argon2_config cfg{ .algorithm = monocypherAlgorithm(subtype),
                                    .nb_blocks = params.memoryKiB,
                                    .nb_passes = params.timeCost,
                                    .nb_lanes = params.parallelism };

    // Monocypher reads through the pointer even for a zero-length password.
    constexpr std::uint8_t kEmpty{ 0U };
    const auto* passPtr{ password.empty() ? &kEmpty : reinterpret_cast<const std::uint8_t*>(password.data()) };

    const crypto_argon2_inputs inputs{ .pass = passPtr,
                                       .salt = salt.data(),
                                       .pass_size = static_cast<std::uint32_t>(password.size()),
                                       .salt_size = static_cast<std::uint32_t>(salt.size()) };

    crypto_argon2(out.data(), static_cast<std::uint32_t>(out.size()), workArea.data(), cfg, inputs,
                  crypto_argon2_no_extras);

    return out;
}

} // namespace pepperhash::crypto
