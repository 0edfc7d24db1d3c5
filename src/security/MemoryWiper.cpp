#include "pepperhash/security/MemoryWiper.hpp"

#include <atomic>

#if defined(__GLIBC__) || defined(__OpenBSD__) || defined(__FreeBSD__)
#include <string.h>
#define PEPH_HAVE_EXPLICIT_BZERO 1
#endif

namespace pepperhash::security
{
void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
#if defined(PEPH_HAVE_EXPLICIT_BZERO)
    ::explicit_bzero(bytes.data(), bytes.size());
#else
    volatile std::byte* p{ bytes.data() };
    for (std::size_t i{}; i < bytes.size(); ++i)
    {
        p[i] = std::byte{ 0 };
    }
    std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
}

void secureWipe(std::string& s) noexcept
{
    secureWipe(std::as_writable_bytes(std::span<char>{ s.data(), s.size() }));
    s.clear();
}
} // namespace pepperhash::security
