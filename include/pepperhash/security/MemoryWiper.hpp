#ifndef INCLUDE_PEPPERHASH_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_PEPPERHASH_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <string>
#include <type_traits>

namespace pepperhash::security
{
// Zeroes memory in a way the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// Wipes the characters and leaves `s` empty. Capacity beyond size() is not touched.
void secureWipe(std::string& s) noexcept;

} // namespace pepperhash::security
#endif // INCLUDE_PEPPERHASH_SECURITY_MEMORYWIPER_HPP
