#ifndef INCLUDE_PEPPERHASH_ENCODER_IPASSWORDENCODER_HPP
#define INCLUDE_PEPPERHASH_ENCODER_IPASSWORDENCODER_HPP

#include "pepperhash/security/SecureBuffer.hpp"
#include <set>
#include <string>
#include <string_view>

namespace pepperhash::encoder
{

class IPasswordEncoder
{
public:
    IPasswordEncoder() = default;
    IPasswordEncoder(const IPasswordEncoder&) = delete;
    IPasswordEncoder& operator=(const IPasswordEncoder&) = delete;
    IPasswordEncoder(IPasswordEncoder&&) = delete;
    IPasswordEncoder& operator=(IPasswordEncoder&&) = delete;
    virtual ~IPasswordEncoder() = default;

    [[nodiscard]] virtual std::string hashPassword(const pepperhash::security::SecureString& password) const = 0;

    // Never throws for malformed or foreign hashes; those simply do not verify.
    [[nodiscard]] virtual bool verifyPassword(const pepperhash::security::SecureString& password,
                                              std::string_view hash) const = 0;

    [[nodiscard]] virtual bool needsRehash(std::string_view hash) const = 0;

    // Brings `hash` up to date without the password where the encoder can. Returns the input otherwise.
    [[nodiscard]] virtual std::string recodeHash(std::string_view hash) const
    {
        return std::string{ hash };
    }

    // The `$<tag>$` prefixes this encoder can verify.
    [[nodiscard]] virtual std::set<std::string> supportedSubtypes() const = 0;
};

} // namespace pepperhash::encoder

#endif // INCLUDE_PEPPERHASH_ENCODER_IPASSWORDENCODER_HPP
