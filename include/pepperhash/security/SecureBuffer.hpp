#ifndef INCLUDE_PEPPERHASH_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_PEPPERHASH_SECURITY_SECUREBUFFER_HPP

#include "pepperhash/security/MemoryWiper.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace pepperhash::security
{

// Wipes every block before it goes back to the heap. Backs all containers that hold passwords,
// raw digests, pepper keys and keystreams.
template <class T> class WipingAllocator
{
    static_assert(std::is_trivially_copyable_v<T>, "only trivially copyable secrets can be wiped");

public:
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;

    constexpr WipingAllocator() noexcept = default;

    template <class U> constexpr WipingAllocator(const WipingAllocator<U>&) noexcept // NOLINT
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        return std::allocator<T>{}.allocate(n);
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p != nullptr)
        {
            secureWipe(std::span<T>{ p, n });
        }
        std::allocator<T>{}.deallocate(p, n);
    }

    template <class U> [[nodiscard]] constexpr bool operator==(const WipingAllocator<U>&) const noexcept
    {
        return true;
    }
};

template <class T> using SecureVector = std::vector<T, WipingAllocator<T>>;

// Digests, salts, pepper keys.
using SecureBuffer = SecureVector<std::uint8_t>;
// Passwords: raw bytes, no terminator.
using SecureString = SecureVector<char>;

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::uint8_t> bytes)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureBuffer(bytes.begin(), bytes.end());
}

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    return s.empty() ? std::string_view{} : std::string_view{ s.data(), s.size() };
}

template <class T> [[nodiscard]] std::span<const std::byte> asBytes(const SecureVector<T>& v) noexcept
{
    return std::as_bytes(std::span{ v });
}

template <class T> [[nodiscard]] std::span<std::byte> asWritableBytes(SecureVector<T>& v) noexcept
{
    return std::as_writable_bytes(std::span{ v });
}

// Wipes the contents and gives the storage back, leaving `v` empty with no capacity.
template <class T> void secureRelease(SecureVector<T>& v) noexcept
{
    secureWipe(asWritableBytes(v));
    SecureVector<T>{}.swap(v);
}

} // namespace pepperhash::security

#endif // INCLUDE_PEPPERHASH_SECURITY_SECUREBUFFER_HPP
