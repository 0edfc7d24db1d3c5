#include "pepperhash/encoder/HashCodec.hpp"

#include "Base64.hpp"
#include "pepperhash/encoder/CostProfile.hpp"
#include <cctype>
#include <cstddef>
#include <limits>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pepperhash::encoder
{
namespace
{

constexpr std::string_view g_kArgon2VersionField{ "v=19" };
constexpr std::string_view g_kEncryptionVersionField{ "v=1" };
constexpr std::size_t g_kUnencryptedFieldCount{ 5U };
constexpr std::size_t g_kEncryptedFieldCount{ 6U };
constexpr std::uint64_t g_kDecimalBase{ 10U };

struct CostFields final
{
    std::uint64_t memoryCost{ 0U };
    std::uint32_t timeCost{ 0U };
    std::uint32_t parallelism{ 0U };
};

[[nodiscard]] std::vector<std::string_view> splitFields(std::string_view text, char delimiter)
{
    std::vector<std::string_view> fields{};
    std::size_t start{ 0U };
    while (true)
    {
        const std::size_t pos{ text.find(delimiter, start) };
        if (pos == std::string_view::npos)
        {
            fields.push_back(text.substr(start));
            return fields;
        }
        fields.push_back(text.substr(start, pos - start));
        start = pos + 1U;
    }
}

// Splits "$a$b$c" into {a, b, c}; empty result if the leading '$' is missing.
[[nodiscard]] std::vector<std::string_view> splitHash(std::string_view hash)
{
    if (hash.empty() || hash.front() != '$')
    {
        return {};
    }
    return splitFields(hash.substr(1U), '$');
}

[[nodiscard]] std::optional<std::uint32_t> parseDecimalU32(std::string_view text) noexcept
{
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
        value = value * g_kDecimalBase + static_cast<std::uint64_t>(c - '0');
        if (value > std::numeric_limits<std::uint32_t>::max())
        {
            return std::nullopt;
        }
    }
    return static_cast<std::uint32_t>(value);
}

// "key=value" with an exact key; returns the value.
[[nodiscard]] std::optional<std::string_view> keyedValue(std::string_view field, std::string_view key) noexcept
{
    if (field.size() <= key.size() + 1U || field.substr(0U, key.size()) != key || field[key.size()] != '=')
    {
        return std::nullopt;
    }
    return field.substr(key.size() + 1U);
}

[[nodiscard]] std::optional<CostFields> parseCostField(std::string_view field)
{
    const auto parts{ splitFields(field, ',') };
    if (parts.size() != 3U)
    {
        return std::nullopt;
    }

    const auto m{ keyedValue(parts[0], "m") };
    const auto t{ keyedValue(parts[1], "t") };
    const auto p{ keyedValue(parts[2], "p") };
    if (!m || !t || !p)
    {
        return std::nullopt;
    }

    const auto memoryKiB{ parseDecimalU32(*m) };
    const auto timeCost{ parseDecimalU32(*t) };
    const auto parallelism{ parseDecimalU32(*p) };
    if (!memoryKiB || !timeCost || !parallelism)
    {
        return std::nullopt;
    }

    return CostFields{ .memoryCost = static_cast<std::uint64_t>(*memoryKiB) * g_kBytesPerKiB,
                       .timeCost = *timeCost,
                       .parallelism = *parallelism };
}

// Fills subtype-independent fields shared by both grammars: costs, salt and payload.
[[nodiscard]] bool parseTail(std::string_view versionField, std::string_view costField, std::string_view saltField,
                             std::string_view payloadField, EncodedHash& out)
{
    if (versionField != g_kArgon2VersionField || saltField.empty() || payloadField.empty())
    {
        return false;
    }

    const auto costs{ parseCostField(costField) };
    if (!costs)
    {
        return false;
    }

    auto salt{ detail::decodeBase64Unpadded(saltField) };
    auto payload{ detail::decodeBase64Unpadded(payloadField) };
    if (!salt || !payload)
    {
        return false;
    }

    out.memoryCost = costs->memoryCost;
    out.timeCost = costs->timeCost;
    out.parallelism = costs->parallelism;
    out.salt = std::move(*salt);
    out.payload = pepperhash::security::secureBufferFrom(*payload);
    return true;
}

void requireHashField(const std::string& field, const char* what)
{
    if (!isValidHashField(field))
    {
        throw std::invalid_argument(what);
    }
}

} // namespace

[[nodiscard]] bool isValidHashField(std::string_view field) noexcept
{
    return !field.empty() && field.find_first_of("$,") == std::string_view::npos;
}

[[nodiscard]] std::string_view hashTag(std::string_view hash) noexcept
{
    if (hash.size() < 3U || hash.front() != '$')
    {
        return {};
    }
    std::size_t end{ 1U };
    while (end < hash.size() &&
           (std::isalnum(static_cast<unsigned char>(hash[end])) != 0 || hash[end] == '-'))
    {
        ++end;
    }
    if (end == 1U || end >= hash.size() || hash[end] != '$')
    {
        return {};
    }
    return hash.substr(1U, end - 1U);
}

[[nodiscard]] std::string packHash(const EncodedHash& record)
{
    if (record.memoryCost % g_kBytesPerKiB != 0U)
    {
        throw std::invalid_argument("packHash: memory cost is not a whole number of KiB");
    }
    if (record.memoryCost / g_kBytesPerKiB > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("packHash: memory cost too large");
    }

    std::string out{ "$" };
    out += pepperhash::crypto::argon2SubtypeName(record.subtype);
    if (record.isEncrypted())
    {
        requireHashField(*record.cipherName, "packHash: invalid cipher name");
        requireHashField(*record.keyId, "packHash: invalid key id");
        out += g_kEncryptedSuffix;
        out += "$";
        out += g_kEncryptionVersionField;
        out += ",cipher=";
        out += *record.cipherName;
        out += ",id=";
        out += *record.keyId;
    }
    out += "$";
    out += g_kArgon2VersionField;
    out += "$m=";
    out += std::to_string(record.memoryCost / g_kBytesPerKiB);
    out += ",t=";
    out += std::to_string(record.timeCost);
    out += ",p=";
    out += std::to_string(record.parallelism);
    out += "$";
    out += detail::encodeBase64Unpadded(std::span<const std::uint8_t>{ record.salt });
    out += "$";
    out += detail::encodeBase64Unpadded(pepperhash::security::asSpan(record.payload));
    return out;
}

[[nodiscard]] std::optional<EncodedHash> parseEncryptedHash(std::string_view hash)
{
    const auto fields{ splitHash(hash) };
    if (fields.size() != g_kEncryptedFieldCount)
    {
        return std::nullopt;
    }

    std::string_view tag{ fields[0] };
    if (tag.size() <= g_kEncryptedSuffix.size() || !tag.ends_with(g_kEncryptedSuffix))
    {
        return std::nullopt;
    }
    tag.remove_suffix(g_kEncryptedSuffix.size());
    const auto subtype{ pepperhash::crypto::argon2SubtypeFromName(tag) };
    if (!subtype)
    {
        return std::nullopt;
    }

    const auto encryption{ splitFields(fields[1], ',') };
    if (encryption.size() != 3U || encryption[0] != g_kEncryptionVersionField)
    {
        return std::nullopt;
    }
    const auto cipherName{ keyedValue(encryption[1], "cipher") };
    const auto keyId{ keyedValue(encryption[2], "id") };
    if (!cipherName || !keyId || !isValidHashField(*cipherName) || !isValidHashField(*keyId))
    {
        return std::nullopt;
    }

    EncodedHash out{};
    out.subtype = *subtype;
    out.cipherName = std::string{ *cipherName };
    out.keyId = std::string{ *keyId };
    if (!parseTail(fields[2], fields[3], fields[4], fields[5], out))
    {
        return std::nullopt;
    }
    return out;
}

[[nodiscard]] std::optional<EncodedHash> parseUnencryptedHash(std::string_view hash)
{
    const auto fields{ splitHash(hash) };
    if (fields.size() != g_kUnencryptedFieldCount)
    {
        return std::nullopt;
    }

    const auto subtype{ pepperhash::crypto::argon2SubtypeFromName(fields[0]) };
    if (!subtype)
    {
        return std::nullopt;
    }

    EncodedHash out{};
    out.subtype = *subtype;
    if (!parseTail(fields[1], fields[2], fields[3], fields[4], out))
    {
        return std::nullopt;
    }
    return out;
}

} // namespace pepperhash::encoder
