#include "pepperhash/encoder/EncryptedEncoder.hpp"

#include "pepperhash/encoder/Argon2Encoder.hpp"
#include "pepperhash/encoder/Argon2Primitives.hpp"
#include "pepperhash/encoder/EncoderErrors.hpp"
#include "pepperhash/encoder/HashCodec.hpp"
#include "pepperhash/security/SecureEquals.hpp"
#include <exception>
#include <new>
#include <utility>
#include <variant>

namespace pepperhash::encoder
{
namespace
{

[[nodiscard]] EncoderResult<pepperhash::security::SecureBuffer>
decryptHashOrError(const IPepperCipher& cipher, const EncodedHash& record) noexcept
{
    try
    {
        return cipher.decryptHash(*record.cipherName, *record.keyId, record.salt,
                                  pepperhash::security::asSpan(record.payload));
    }
    catch (const std::exception&)
    {
        return EncoderError::DecryptFailed;
    }
}

} // namespace

EncryptedEncoder::EncryptedEncoder(pepperhash::crypto::ICryptoProvider& crypto, const IPepperCipher& cipher,
                                   CostProfile profile, std::string cipherName, std::string activeKeyId)
    : m_crypto(&crypto), m_cipher(&cipher), m_profile(std::move(profile)), m_cipherName(std::move(cipherName)),
      m_activeKeyId(std::move(activeKeyId))
{
    if (!isValidHashField(m_cipherName))
    {
        throw ConfigError("cipher name must be non-empty and free of '$' and ','");
    }
    if (!isValidHashField(m_activeKeyId))
    {
        throw ConfigError("active key id must be non-empty and free of '$' and ','");
    }
    if (!m_cipher->supportsKey(m_cipherName, m_activeKeyId))
    {
        throw ConfigError("no pepper for cipher '" + m_cipherName + "' and active key id '" + m_activeKeyId + "'");
    }
}

[[nodiscard]] std::string EncryptedEncoder::hashPassword(const pepperhash::security::SecureString& password) const
{
    const auto salt{ freshSalt(*m_crypto, m_profile.saltSize()) };
    const auto digest{ m_crypto->argon2Raw(m_profile.subtype(), pepperhash::security::asBytes(password),
                                           pepperhash::security::asSpan(salt), m_profile.argon2Params(),
                                           m_profile.outputSize()) };

    EncodedHash record{};
    record.subtype = m_profile.subtype();
    record.cipherName = m_cipherName;
    record.keyId = m_activeKeyId;
    record.memoryCost = m_profile.memoryCost();
    record.timeCost = m_profile.timeCost();
    record.parallelism = m_profile.parallelism();
    record.salt.assign(salt.begin(), salt.end());
    record.payload = m_cipher->encryptHash(m_cipherName, m_activeKeyId, pepperhash::security::asSpan(salt),
                                           pepperhash::security::asSpan(digest));
    return packHash(record);
}

[[nodiscard]] bool EncryptedEncoder::verifyPassword(const pepperhash::security::SecureString& password,
                                                    std::string_view hash) const
{
    try
    {
        const auto parsed{ parseEncryptedHash(hash) };
        if (!parsed)
        {
            return argon2Verify(*m_crypto, hash, pepperhash::security::asBytes(password));
        }

        // Digest first so an unknown key id costs as much as a wrong password.
        const auto digestOrErr{ argon2RawOrError(*m_crypto, parsed->subtype, pepperhash::security::asBytes(password),
                                                 parsed->salt, parsed->argon2Params(), parsed->payload.size()) };
        const auto plainOrErr{ decryptHashOrError(*m_cipher, *parsed) };
        if (std::holds_alternative<EncoderError>(digestOrErr) || std::holds_alternative<EncoderError>(plainOrErr))
        {
            return false;
        }

        return pepperhash::security::secureEquals(std::get<pepperhash::security::SecureBuffer>(digestOrErr),
                                                  std::get<pepperhash::security::SecureBuffer>(plainOrErr));
    }
    catch (const std::bad_alloc&)
    {
        return false;
    }
}

[[nodiscard]] bool EncryptedEncoder::needsRehash(std::string_view hash) const
{
    const auto parsed{ parseEncryptedHash(hash) };
    if (!parsed)
    {
        return true;
    }
    if (parsed->salt.size() != m_profile.saltSize() || parsed->payload.size() != m_profile.outputSize())
    {
        return true;
    }

    EncodedHash current{};
    current.subtype = m_profile.subtype();
    current.cipherName = m_cipherName;
    current.keyId = m_activeKeyId;
    current.memoryCost = m_profile.memoryCost();
    current.timeCost = m_profile.timeCost();
    current.parallelism = m_profile.parallelism();
    current.salt = parsed->salt;
    current.payload = parsed->payload;
    return packHash(current) != hash;
}

[[nodiscard]] std::string EncryptedEncoder::recodeHash(std::string_view hash) const
{
    return recodeHash(hash, m_activeKeyId);
}

[[nodiscard]] std::string EncryptedEncoder::recodeHash(std::string_view hash, std::string_view targetKeyId) const
{
    if (auto parsed{ parseEncryptedHash(hash) })
    {
        if (*parsed->keyId == targetKeyId && *parsed->cipherName == m_cipherName)
        {
            return std::string{ hash };
        }

        const auto digest{ m_cipher->decryptHash(*parsed->cipherName, *parsed->keyId, parsed->salt,
                                                 pepperhash::security::asSpan(parsed->payload)) };
        parsed->payload = m_cipher->encryptHash(m_cipherName, targetKeyId, parsed->salt,
                                                pepperhash::security::asSpan(digest));
        parsed->cipherName = m_cipherName;
        parsed->keyId = std::string{ targetKeyId };
        return packHash(*parsed);
    }

    if (auto legacy{ parseUnencryptedHash(hash) })
    {
        legacy->payload = m_cipher->encryptHash(m_cipherName, targetKeyId, legacy->salt,
                                                pepperhash::security::asSpan(legacy->payload));
        legacy->cipherName = m_cipherName;
        legacy->keyId = std::string{ targetKeyId };
        return packHash(*legacy);
    }

    return std::string{ hash };
}

[[nodiscard]] std::set<std::string> EncryptedEncoder::supportedSubtypes() const
{
    std::set<std::string> out{};
    for (const auto subtype : pepperhash::crypto::g_kArgon2Subtypes)
    {
        const std::string name{ pepperhash::crypto::argon2SubtypeName(subtype) };
        out.insert(name);
        out.insert(name + std::string{ g_kEncryptedSuffix });
    }
    return out;
}

} // namespace pepperhash::encoder
