#ifndef INCLUDE_PEPPERHASH_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_PEPPERHASH_SECURITY_SECUREEQUALS_HPP

#include "pepperhash/security/SecureBuffer.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>

namespace pepperhash::security
{
// Constant-time in the length of the shorter input. A length mismatch is folded into the
// accumulator instead of returning early, so equal-length inputs are always examined in full.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    volatile unsigned char diff{ static_cast<unsigned char>(a.size() == b.size() ? 0U : 1U) };

    const std::size_t common{ std::min(a.size(), b.size()) };
    for (std::size_t i{}; i < common; ++i)
    {
        const unsigned char x{ std::to_integer<unsigned char>(a[i]) };
        const unsigned char y{ std::to_integer<unsigned char>(b[i]) };

        diff |= (x ^ y);
    }

    return (diff == 0);
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return secureEquals(std::as_bytes(a), std::as_bytes(b));
}

[[nodiscard]] inline bool secureEquals(const SecureBuffer& a, const SecureBuffer& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace pepperhash::security

#endif // INCLUDE_PEPPERHASH_SECURITY_SECUREEQUALS_HPP
