#include "pepperhash/encoder/Argon2Encoder.hpp"

#include "pepperhash/encoder/Argon2Primitives.hpp"
#include "pepperhash/encoder/HashCodec.hpp"
#include <stdexcept>
#include <utility>

namespace pepperhash::encoder
{

[[nodiscard]] pepperhash::security::SecureBuffer freshSalt(pepperhash::crypto::ICryptoProvider& crypto,
                                                           std::size_t size)
{
    pepperhash::security::SecureBuffer salt(size);
    if (!crypto.randomBytes(salt))
    {
        throw std::runtime_error("CSPRNG failure while generating salt");
    }
    return salt;
}

Argon2Encoder::Argon2Encoder(pepperhash::crypto::ICryptoProvider& crypto, CostProfile profile) noexcept
    : m_crypto(&crypto), m_profile(std::move(profile))
{
}

[[nodiscard]] std::string Argon2Encoder::hashPassword(const pepperhash::security::SecureString& password) const
{
    const auto salt{ freshSalt(*m_crypto, m_profile.saltSize()) };
    return argon2Pass(*m_crypto, m_profile.subtype(), pepperhash::security::asBytes(password),
                      pepperhash::security::asSpan(salt), m_profile.argon2Params(), m_profile.outputSize());
}

[[nodiscard]] bool Argon2Encoder::verifyPassword(const pepperhash::security::SecureString& password,
                                                 std::string_view hash) const
{
    const auto subtype{ pepperhash::crypto::argon2SubtypeFromName(hashTag(hash)) };
    if (!subtype)
    {
        return false;
    }
    return argon2Verify(*m_crypto, hash, pepperhash::security::asBytes(password));
}

[[nodiscard]] bool Argon2Encoder::needsRehash(std::string_view hash) const
{
    return argon2NeedsRehash(hash, m_profile);
}

[[nodiscard]] std::set<std::string> Argon2Encoder::supportedSubtypes() const
{
    std::set<std::string> out{};
    for (const auto subtype : pepperhash::crypto::g_kArgon2Subtypes)
    {
        out.emplace(pepperhash::crypto::argon2SubtypeName(subtype));
    }
    return out;
}

} // namespace pepperhash::encoder
