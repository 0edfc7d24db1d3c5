#include "pepperhash/security/SecureRandom.hpp"
#include <algorithm>
#include <cerrno>
#include <cstddef>

#if defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace pepperhash::security
{
namespace
{

// getrandom(2) never returns a short read for requests up to 256 bytes once the pool is ready.
constexpr std::size_t g_kGetrandomChunk{ 256U };

[[nodiscard]] bool fillChunk(std::span<std::uint8_t> chunk) noexcept
{
    for (;;)
    {
        const ssize_t got{ ::getrandom(chunk.data(), chunk.size(), 0U) };
        if (got > 0)
        {
            if (static_cast<std::size_t>(got) == chunk.size())
            {
                return true;
            }
            chunk = chunk.subspan(static_cast<std::size_t>(got));
            continue;
        }
        if (got == 0 || errno != EINTR)
        {
            return false;
        }
    }
}

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    while (!out.empty())
    {
        const std::size_t n{ std::min(out.size(), g_kGetrandomChunk) };
        if (!fillChunk(out.first(n)))
        {
            return false;
        }
        out = out.subspan(n);
    }
    return true;
}

} // namespace pepperhash::security
