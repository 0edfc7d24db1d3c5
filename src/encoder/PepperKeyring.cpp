#include "pepperhash/encoder/PepperKeyring.hpp"

#include "pepperhash/encoder/EncoderErrors.hpp"
#include "pepperhash/encoder/HashCodec.hpp"
#include <optional>
#include <stdexcept>

namespace pepperhash::encoder
{
namespace
{

constexpr std::uint8_t g_kNibbleBits{ 4U };
constexpr std::uint8_t g_kHexLetterOffset{ 10U };

[[nodiscard]] std::optional<std::uint8_t> hexNibble(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + g_kHexLetterOffset);
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint8_t>(c - 'A' + g_kHexLetterOffset);
    }
    return std::nullopt;
}

} // namespace

PepperKeyring::PepperKeyring(pepperhash::crypto::ICryptoProvider& crypto, PepperKeys keys)
    : m_crypto(&crypto), m_keys(std::move(keys))
{
    for (const auto& [keyId, key] : m_keys)
    {
        if (!isValidHashField(keyId))
        {
            throw ConfigError("pepper key id must be non-empty and free of '$' and ','");
        }
        if (key.size() != g_kPepperKeyBytes)
        {
            throw ConfigError("pepper key '" + keyId + "' must be 32 bytes");
        }
    }
}

[[nodiscard]] const pepperhash::security::SecureBuffer* PepperKeyring::findKey(std::string_view cipher,
                                                                                std::string_view keyId) const noexcept
{
    if (cipher != g_kChaCha20CipherName)
    {
        return nullptr;
    }
    const auto it{ m_keys.find(keyId) };
    if (it == m_keys.end())
    {
        return nullptr;
    }
    return &it->second;
}

[[nodiscard]] bool PepperKeyring::supportsKey(std::string_view cipher, std::string_view keyId) const noexcept
{
    return findKey(cipher, keyId) != nullptr;
}

[[nodiscard]] pepperhash::security::SecureBuffer PepperKeyring::encryptHash(std::string_view cipher,
                                                                             std::string_view keyId,
                                                                             std::span<const std::uint8_t> salt,
                                                                             std::span<const std::uint8_t> plain) const
{
    const auto* key{ findKey(cipher, keyId) };
    if (key == nullptr)
    {
        throw std::invalid_argument("no pepper for cipher '" + std::string{ cipher } + "' and key id '" +
                                    std::string{ keyId } + "'");
    }
    return m_crypto->streamXor(pepperhash::security::asSpan(*key), salt, plain);
}

[[nodiscard]] pepperhash::security::SecureBuffer
PepperKeyring::decryptHash(std::string_view cipher, std::string_view keyId, std::span<const std::uint8_t> salt,
                           std::span<const std::uint8_t> cipherText) const
{
    const auto* key{ findKey(cipher, keyId) };
    if (key == nullptr)
    {
        throw DecryptError("no pepper for cipher '" + std::string{ cipher } + "' and key id '" +
                           std::string{ keyId } + "'");
    }
    if (cipherText.empty())
    {
        throw DecryptError("empty ciphertext");
    }
    try
    {
        return m_crypto->streamXor(pepperhash::security::asSpan(*key), salt, cipherText);
    }
    catch (const std::invalid_argument& e)
    {
        throw DecryptError(e.what());
    }
}

[[nodiscard]] std::pair<std::string, pepperhash::security::SecureBuffer> parsePepperSpec(std::string_view spec)
{
    const auto eq{ spec.find('=') };
    if (eq == std::string_view::npos)
    {
        throw ConfigError("pepper must be given as <id>=<hex key>");
    }

    std::string keyId{ spec.substr(0U, eq) };
    if (!isValidHashField(keyId))
    {
        throw ConfigError("pepper key id must be non-empty and free of '$' and ','");
    }

    const std::string_view hex{ spec.substr(eq + 1U) };
    if (hex.size() != g_kPepperKeyBytes * 2U)
    {
        throw ConfigError("pepper key '" + keyId + "' must be 64 hex digits");
    }

    pepperhash::security::SecureBuffer key(g_kPepperKeyBytes);
    for (std::size_t i{}; i < key.size(); ++i)
    {
        const auto hi{ hexNibble(hex[2U * i]) };
        const auto lo{ hexNibble(hex[(2U * i) + 1U]) };
        if (!hi || !lo)
        {
            pepperhash::security::secureRelease(key);
            throw ConfigError("pepper key '" + keyId + "' is not valid hex");
        }
        key[i] = static_cast<std::uint8_t>((*hi << g_kNibbleBits) | *lo);
    }
    return { std::move(keyId), std::move(key) };
}

} // namespace pepperhash::encoder
