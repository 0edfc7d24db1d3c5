#include "pepperhash/encoder/CostProfile.hpp"
#include "pepperhash/encoder/EncoderErrors.hpp"

#include <limits>
#include <string>

namespace pepperhash::encoder
{
namespace
{

constexpr std::uint64_t g_kDecimalBase{ 10U };

[[nodiscard]] std::optional<std::uint64_t> suffixMultiplier(char suffix) noexcept
{
    switch (suffix)
    {
    case 'k':
        return std::uint64_t{ 1 } << 10U;
    case 'M':
        return std::uint64_t{ 1 } << 20U;
    case 'G':
        return std::uint64_t{ 1 } << 30U;
    default:
        return std::nullopt;
    }
}

[[nodiscard]] std::uint64_t resolveMemoryCost(const std::optional<MemoryCost>& option)
{
    if (!option)
    {
        const auto fallback{ parseMemorySize(g_kDefaultMemoryCost) };
        return fallback.value_or(0U);
    }
    if (const auto* bytes{ std::get_if<std::uint64_t>(&*option) }; bytes != nullptr)
    {
        return *bytes;
    }

    const auto& text{ std::get<std::string>(*option) };
    const auto parsed{ parseMemorySize(text) };
    if (!parsed)
    {
        throw ConfigError("memory_cost: cannot parse '" + text + "'");
    }
    return *parsed;
}

[[nodiscard]] std::uint32_t requirePositive(const std::optional<std::uint32_t>& option, std::uint32_t fallback,
                                            const char* name)
{
    const std::uint32_t value{ option.value_or(fallback) };
    if (value == 0U)
    {
        throw ConfigError(std::string{ name } + ": must be positive");
    }
    return value;
}

} // namespace

[[nodiscard]] std::optional<std::uint64_t> parseMemorySize(std::string_view text) noexcept
{
    if (text.empty())
    {
        return std::nullopt;
    }

    std::uint64_t multiplier{ 1U };
    if (const auto m{ suffixMultiplier(text.back()) }; m.has_value())
    {
        multiplier = *m;
        text.remove_suffix(1U);
    }
    if (text.empty())
    {
        return std::nullopt;
    }

    std::uint64_t value{ 0U };
    for (const char c : text)
    {
        if (c < '0' || c > '9')
        {
            return std::nullopt;
        }
        const auto digit{ static_cast<std::uint64_t>(c - '0') };
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / g_kDecimalBase)
        {
            return std::nullopt;
        }
        value = value * g_kDecimalBase + digit;
    }

    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier)
    {
        return std::nullopt;
    }
    return value * multiplier;
}

[[nodiscard]] CostProfile CostProfile::build(const CostOptions& options)
{
    const std::string subtypeName{ options.subtype.value_or(std::string{ g_kDefaultSubtype }) };
    const auto subtype{ pepperhash::crypto::argon2SubtypeFromName(subtypeName) };
    if (!subtype)
    {
        throw ConfigError("subtype: unknown Argon2 subtype '" + subtypeName + "'");
    }

    const std::uint64_t memoryCost{ resolveMemoryCost(options.memoryCost) };
    if (memoryCost == 0U)
    {
        throw ConfigError("memory_cost: must be positive");
    }
    if (memoryCost % g_kBytesPerKiB != 0U)
    {
        throw ConfigError("memory_cost: must be a whole number of KiB");
    }
    if (memoryCost / g_kBytesPerKiB > pepperhash::crypto::g_kArgon2MemoryKiBCap)
    {
        throw ConfigError("memory_cost: above the Argon2 limit");
    }

    const std::uint32_t timeCost{ requirePositive(options.timeCost, g_kDefaultTimeCost, "time_cost") };
    const std::uint32_t parallelism{ requirePositive(options.parallelism, g_kDefaultParallelism, "parallelism") };
    const std::uint32_t outputSize{ requirePositive(options.outputSize, g_kDefaultOutputSize, "output_size") };
    const std::uint32_t saltSize{ requirePositive(options.saltSize, g_kDefaultSaltSize, "salt_size") };

    if (timeCost > pepperhash::crypto::g_kArgon2TimeCostCap)
    {
        throw ConfigError("time_cost: above the Argon2 limit");
    }
    if (parallelism > pepperhash::crypto::g_kArgon2ParallelismCap)
    {
        throw ConfigError("parallelism: above the Argon2 limit");
    }
    if (memoryCost / g_kBytesPerKiB < std::uint64_t{ parallelism } * pepperhash::crypto::g_kArgon2MinMemoryKiBPerLane)
    {
        throw ConfigError("memory_cost: below 8 KiB per lane");
    }
    if (outputSize < pepperhash::crypto::g_kArgon2MinOutputBytes ||
        outputSize > pepperhash::crypto::g_kArgon2MaxOutputBytes)
    {
        throw ConfigError("output_size: outside the Argon2 range");
    }
    if (saltSize < pepperhash::crypto::g_kArgon2MinSaltBytes || saltSize > pepperhash::crypto::g_kArgon2MaxSaltBytes)
    {
        throw ConfigError("salt_size: outside the Argon2 range");
    }

    return CostProfile{ *subtype, memoryCost, timeCost, parallelism, outputSize, saltSize };
}

} // namespace pepperhash::encoder
