#ifndef INCLUDE_PEPPERHASH_SECURITY_SECURERANDOM_HPP
#define INCLUDE_PEPPERHASH_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace pepperhash::security
{

// Fills `out` from the kernel CSPRNG. Safe to call from any thread.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace pepperhash::security

#endif // INCLUDE_PEPPERHASH_SECURITY_SECURERANDOM_HPP
