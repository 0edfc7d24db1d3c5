#ifndef PEPPERHASH_SRC_ENCODER_BASE64_HPP
#define PEPPERHASH_SRC_ENCODER_BASE64_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pepperhash::encoder::detail
{

// Standard alphabet, no padding, as used by PHC hash strings.
constexpr std::string_view g_kBase64Alphabet{ "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };
constexpr std::uint8_t g_kBase64Invalid{ 0xFFU };
constexpr std::uint32_t g_kSextetMask{ 0x3FU };
constexpr std::uint32_t g_kOctetMask{ 0xFFU };

[[nodiscard]] constexpr std::array<std::uint8_t, 256> makeBase64DecodeTable() noexcept
{
    std::array<std::uint8_t, 256> table{};
    table.fill(g_kBase64Invalid);
    for (std::size_t i{}; i < g_kBase64Alphabet.size(); ++i)
    {
        table[static_cast<unsigned char>(g_kBase64Alphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

constexpr std::array<std::uint8_t, 256> g_kBase64DecodeTable{ makeBase64DecodeTable() };

[[nodiscard]] inline std::string encodeBase64Unpadded(std::span<const std::uint8_t> data)
{
    std::string out{};
    out.reserve(((data.size() + 2U) / 3U) * 4U);

    std::size_t i{};
    for (; i + 2U < data.size(); i += 3U)
    {
        const std::uint32_t triple{ (static_cast<std::uint32_t>(data[i]) << 16U) |
                                    (static_cast<std::uint32_t>(data[i + 1U]) << 8U) |
                                    static_cast<std::uint32_t>(data[i + 2U]) };
        out.push_back(g_kBase64Alphabet[(triple >> 18U) & g_kSextetMask]);
        out.push_back(g_kBase64Alphabet[(triple >> 12U) & g_kSextetMask]);
        out.push_back(g_kBase64Alphabet[(triple >> 6U) & g_kSextetMask]);
        out.push_back(g_kBase64Alphabet[triple & g_kSextetMask]);
    }

    const std::size_t rest{ data.size() - i };
    if (rest == 1U)
    {
        const std::uint32_t triple{ static_cast<std::uint32_t>(data[i]) << 16U };
        out.push_back(g_kBase64Alphabet[(triple >> 18U) & g_kSextetMask]);
        out.push_back(g_kBase64Alphabet[(triple >> 12U) & g_kSextetMask]);
    }
    else if (rest == 2U)
    {
        const std::uint32_t triple{ (static_cast<std::uint32_t>(data[i]) << 16U) |
                                    (static_cast<std::uint32_t>(data[i + 1U]) << 8U) };
        out.push_back(g_kBase64Alphabet[(triple >> 18U) & g_kSextetMask]);
        out.push_back(g_kBase64Alphabet[(triple >> 12U) & g_kSextetMask]);
        out.push_back(g_kBase64Alphabet[(triple >> 6U) & g_kSextetMask]);
    }

    return out;
}

// Rejects padding, characters outside the alphabet, a dangling single sextet and non-zero
// trailing bits, so every accepted input is the canonical encoding of its output.
[[nodiscard]] inline std::optional<std::vector<std::uint8_t>> decodeBase64Unpadded(std::string_view text)
{
    if (text.size() % 4U == 1U)
    {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out{};
    out.reserve((text.size() * 3U) / 4U);

    std::uint32_t accumulator{ 0U };
    std::uint32_t bits{ 0U };
    for (const char c : text)
    {
        const std::uint8_t sextet{ g_kBase64DecodeTable[static_cast<unsigned char>(c)] };
        if (sextet == g_kBase64Invalid)
        {
            return std::nullopt;
        }
        accumulator = (accumulator << 6U) | sextet;
        bits += 6U;
        if (bits >= 8U)
        {
            bits -= 8U;
            out.push_back(static_cast<std::uint8_t>((accumulator >> bits) & g_kOctetMask));
        }
    }

    if ((accumulator & ((1U << bits) - 1U)) != 0U)
    {
        return std::nullopt;
    }
    return out;
}

} // namespace pepperhash::encoder::detail

#endif // PEPPERHASH_SRC_ENCODER_BASE64_HPP
