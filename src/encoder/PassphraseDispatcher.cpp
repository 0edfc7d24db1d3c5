#include "pepperhash/encoder/PassphraseDispatcher.hpp"

#include "pepperhash/encoder/HashCodec.hpp"
#include <stdexcept>
#include <utility>

namespace pepperhash::encoder
{

PassphraseDispatcher::PassphraseDispatcher(const IPasswordEncoder& primary,
                                           std::vector<const IPasswordEncoder*> validators)
    : m_primary(&primary), m_validators(std::move(validators))
{
    for (const auto* validator : m_validators)
    {
        if (validator == nullptr)
        {
            throw std::invalid_argument("PassphraseDispatcher: null validator");
        }
    }
}

[[nodiscard]] std::string PassphraseDispatcher::hashPassword(const pepperhash::security::SecureString& password) const
{
    return m_primary->hashPassword(password);
}

[[nodiscard]] bool PassphraseDispatcher::needsRehash(std::string_view hash) const
{
    return m_primary->needsRehash(hash);
}

[[nodiscard]] std::string PassphraseDispatcher::recodeHash(std::string_view hash) const
{
    return m_primary->recodeHash(hash);
}

[[nodiscard]] const IPasswordEncoder* PassphraseDispatcher::encoderFor(std::string_view hash) const
{
    const std::string tag{ hashTag(hash) };
    if (tag.empty())
    {
        return nullptr;
    }
    if (m_primary->supportedSubtypes().contains(tag))
    {
        return m_primary;
    }
    for (const auto* validator : m_validators)
    {
        if (validator->supportedSubtypes().contains(tag))
        {
            return validator;
        }
    }
    return nullptr;
}

[[nodiscard]] bool PassphraseDispatcher::verifyPassword(const pepperhash::security::SecureString& password,
                                                        std::string_view hash) const
{
    const auto* encoder{ encoderFor(hash) };
    if (encoder == nullptr)
    {
        return false;
    }
    return encoder->verifyPassword(password, hash);
}

[[nodiscard]] VerifyOutcome PassphraseDispatcher::verifyAndRecode(const pepperhash::security::SecureString& password,
                                                                  std::string_view hash) const
{
    VerifyOutcome outcome{};
    outcome.matched = verifyPassword(password, hash);
    if (!outcome.matched)
    {
        return outcome;
    }

    std::string recoded{ m_primary->recodeHash(hash) };
    if (m_primary->needsRehash(recoded))
    {
        outcome.newHash = m_primary->hashPassword(password);
    }
    else if (recoded != hash)
    {
        outcome.newHash = std::move(recoded);
    }
    return outcome;
}

} // namespace pepperhash::encoder
