#ifndef INCLUDE_PEPPERHASH_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_PEPPERHASH_SECURITY_SCOPEWIPE_HPP

#include "pepperhash/security/MemoryWiper.hpp"
#include "pepperhash/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace pepperhash::security
{
class [[nodiscard]] ScopeWipe final
{
public:
    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    explicit ScopeWipe(std::span<std::byte> b) noexcept : m_bytes{ b }
    {
    }

    ScopeWipe(ScopeWipe&& sw) noexcept : m_bytes{ sw.m_bytes }
    {
        sw.m_bytes = {};
    }

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

private:
    std::span<std::byte> m_bytes;
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

// For std::string values that briefly hold secrets (hex-encoded peppers from the command line).
[[nodiscard]] inline ScopeWipe scopeWipe(std::string& s) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<char>{ s.data(), s.size() }) };
}

} // namespace pepperhash::security

#endif // INCLUDE_PEPPERHASH_SECURITY_SCOPEWIPE_HPP
