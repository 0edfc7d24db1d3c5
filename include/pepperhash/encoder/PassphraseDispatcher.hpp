#ifndef INCLUDE_PEPPERHASH_ENCODER_PASSPHRASEDISPATCHER_HPP
#define INCLUDE_PEPPERHASH_ENCODER_PASSPHRASEDISPATCHER_HPP

#include "pepperhash/encoder/IPasswordEncoder.hpp"
#include "pepperhash/security/SecureBuffer.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pepperhash::encoder
{

struct VerifyOutcome final
{
    bool matched{ false };
    // Set when the stored hash should be replaced.
    std::optional<std::string> newHash;
};

// Hashes with the primary encoder and verifies with whichever encoder claims the hash's `$<tag>$`.
// Encoders are borrowed and must outlive the dispatcher.
class PassphraseDispatcher final
{
public:
    PassphraseDispatcher(const IPasswordEncoder& primary, std::vector<const IPasswordEncoder*> validators = {});

    [[nodiscard]] std::string hashPassword(const pepperhash::security::SecureString& password) const;
    [[nodiscard]] bool needsRehash(std::string_view hash) const;
    [[nodiscard]] std::string recodeHash(std::string_view hash) const;
    [[nodiscard]] bool verifyPassword(const pepperhash::security::SecureString& password,
                                      std::string_view hash) const;

    // Verifies, then upgrades a matching hash: a recode when that is enough, a full rehash otherwise.
    [[nodiscard]] VerifyOutcome verifyAndRecode(const pepperhash::security::SecureString& password,
                                                std::string_view hash) const;

private:
    [[nodiscard]] const IPasswordEncoder* encoderFor(std::string_view hash) const;

    const IPasswordEncoder* m_primary{ nullptr };
    std::vector<const IPasswordEncoder*> m_validators;
};

} // namespace pepperhash::encoder

#endif // INCLUDE_PEPPERHASH_ENCODER_PASSPHRASEDISPATCHER_HPP
