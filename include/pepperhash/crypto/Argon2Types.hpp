#ifndef INCLUDE_PEPPERHASH_CRYPTO_ARGON2TYPES_HPP
#define INCLUDE_PEPPERHASH_CRYPTO_ARGON2TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace pepperhash::crypto
{

// Argon2 version v1.3 (0x13), the only version written to or accepted from hash strings.
constexpr std::uint32_t g_kArgon2VersionV13{ 0x13 };

enum class Argon2Subtype : std::uint8_t
{
    Argon2i,
    Argon2d,
    Argon2id,
};

constexpr std::array<Argon2Subtype, 3> g_kArgon2Subtypes{ Argon2Subtype::Argon2i, Argon2Subtype::Argon2d,
                                                          Argon2Subtype::Argon2id };

struct Argon2Params final
{
    std::uint32_t timeCost;
    std::uint32_t memoryKiB;
    std::uint32_t parallelism;
};

// Backend safety limits. Hash strings come from storage, so anything beyond these is refused
// instead of letting a tampered record allocate gigabytes or spin for minutes.
constexpr std::uint32_t g_kArgon2TimeCostCap{ 64U };
constexpr std::uint32_t g_kArgon2ParallelismCap{ 64U };
constexpr std::uint32_t g_kArgon2MemoryKiBCap{ 4U * 1024U * 1024U };
constexpr std::uint32_t g_kArgon2MinMemoryKiBPerLane{ 8U };
constexpr std::size_t g_kArgon2MinSaltBytes{ 8U };
constexpr std::size_t g_kArgon2MaxSaltBytes{ 1024U };
constexpr std::size_t g_kArgon2MinOutputBytes{ 4U };
constexpr std::size_t g_kArgon2MaxOutputBytes{ 1024U };

[[nodiscard]] constexpr std::string_view argon2SubtypeName(Argon2Subtype subtype) noexcept
{
    switch (subtype)
    {
    case Argon2Subtype::Argon2i:
        return "argon2i";
    case Argon2Subtype::Argon2d:
        return "argon2d";
    case Argon2Subtype::Argon2id:
        return "argon2id";
    }
    return {};
}

[[nodiscard]] constexpr std::optional<Argon2Subtype> argon2SubtypeFromName(std::string_view name) noexcept
{
    for (const Argon2Subtype subtype : g_kArgon2Subtypes)
    {
        if (argon2SubtypeName(subtype) == name)
        {
            return subtype;
        }
    }
    return std::nullopt;
}

// Throws std::invalid_argument when the request is outside the backend safety limits.
void requireArgon2InputsSafe(const Argon2Params& params, std::size_t passwordBytes, std::size_t saltBytes,
                             std::size_t outBytes);

} // namespace pepperhash::crypto

#endif // INCLUDE_PEPPERHASH_CRYPTO_ARGON2TYPES_HPP
