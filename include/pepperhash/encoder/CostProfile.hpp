#ifndef INCLUDE_PEPPERHASH_ENCODER_COSTPROFILE_HPP
#define INCLUDE_PEPPERHASH_ENCODER_COSTPROFILE_HPP

#include "pepperhash/crypto/Argon2Types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace pepperhash::encoder
{

constexpr std::string_view g_kDefaultSubtype{ "argon2id" };
constexpr std::string_view g_kDefaultMemoryCost{ "256M" };
constexpr std::uint32_t g_kDefaultTimeCost{ 3U };
constexpr std::uint32_t g_kDefaultParallelism{ 1U };
constexpr std::uint32_t g_kDefaultOutputSize{ 16U };
constexpr std::uint32_t g_kDefaultSaltSize{ 16U };

constexpr std::uint64_t g_kBytesPerKiB{ 1024U };

// Memory cost either as a byte count or as shorthand text ("64k", "256M", "1G", "1048576").
using MemoryCost = std::variant<std::uint64_t, std::string>;

// Unset fields take the defaults above.
struct CostOptions final
{
    std::optional<std::string> subtype;
    std::optional<MemoryCost> memoryCost;
    std::optional<std::uint32_t> timeCost;
    std::optional<std::uint32_t> parallelism;
    std::optional<std::uint32_t> outputSize;
    std::optional<std::uint32_t> saltSize;
};

// Parses `<digits>` or `<digits>k|M|G` into a byte count. k=2^10, M=2^20, G=2^30.
[[nodiscard]] std::optional<std::uint64_t> parseMemorySize(std::string_view text) noexcept;

class CostProfile final
{
public:
    // Throws ConfigError for an unknown subtype, a zero field, an unparsable memory size or a
    // memory size that is not a whole number of KiB.
    [[nodiscard]] static CostProfile build(const CostOptions& options);

    [[nodiscard]] pepperhash::crypto::Argon2Subtype subtype() const noexcept
    {
        return m_subtype;
    }
    [[nodiscard]] std::uint64_t memoryCost() const noexcept
    {
        return m_memoryCost;
    }
    [[nodiscard]] std::uint32_t memoryKiB() const noexcept
    {
        return static_cast<std::uint32_t>(m_memoryCost / g_kBytesPerKiB);
    }
    [[nodiscard]] std::uint32_t timeCost() const noexcept
    {
        return m_timeCost;
    }
    [[nodiscard]] std::uint32_t parallelism() const noexcept
    {
        return m_parallelism;
    }
    [[nodiscard]] std::size_t outputSize() const noexcept
    {
        return m_outputSize;
    }
    [[nodiscard]] std::size_t saltSize() const noexcept
    {
        return m_saltSize;
    }

    [[nodiscard]] pepperhash::crypto::Argon2Params argon2Params() const noexcept
    {
        return pepperhash::crypto::Argon2Params{
            .timeCost = m_timeCost,
            .memoryKiB = memoryKiB(),
            .parallelism = m_parallelism,
        };
    }

private:
    CostProfile(pepperhash::crypto::Argon2Subtype subtype, std::uint64_t memoryCost, std::uint32_t timeCost,
                std::uint32_t parallelism, std::size_t outputSize, std::size_t saltSize) noexcept
        : m_subtype(subtype), m_memoryCost(memoryCost), m_timeCost(timeCost), m_parallelism(parallelism),
          m_outputSize(outputSize), m_saltSize(saltSize)
    {
    }

    pepperhash::crypto::Argon2Subtype m_subtype;
    std::uint64_t m_memoryCost;
    std::uint32_t m_timeCost;
    std::uint32_t m_parallelism;
    std::size_t m_outputSize;
    std::size_t m_saltSize;
};

} // namespace pepperhash::encoder

#endif // INCLUDE_PEPPERHASH_ENCODER_COSTPROFILE_HPP
