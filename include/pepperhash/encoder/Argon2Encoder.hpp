#ifndef INCLUDE_PEPPERHASH_ENCODER_ARGON2ENCODER_HPP
#define INCLUDE_PEPPERHASH_ENCODER_ARGON2ENCODER_HPP

#include "pepperhash/crypto/ICryptoProvider.hpp"
#include "pepperhash/encoder/CostProfile.hpp"
#include "pepperhash/encoder/IPasswordEncoder.hpp"
#include "pepperhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <set>
#include <string>
#include <string_view>

namespace pepperhash::encoder
{

class Argon2Encoder final : public IPasswordEncoder
{
public:
    Argon2Encoder(pepperhash::crypto::ICryptoProvider& crypto, CostProfile profile) noexcept;

    // Throws std::runtime_error if the CSPRNG fails.
    [[nodiscard]] std::string hashPassword(const pepperhash::security::SecureString& password) const override;
    [[nodiscard]] bool verifyPassword(const pepperhash::security::SecureString& password,
                                      std::string_view hash) const override;
    [[nodiscard]] bool needsRehash(std::string_view hash) const override;
    [[nodiscard]] std::set<std::string> supportedSubtypes() const override;

    [[nodiscard]] const CostProfile& profile() const noexcept
    {
        return m_profile;
    }

private:
    pepperhash::crypto::ICryptoProvider* m_crypto{ nullptr };
    CostProfile m_profile;
};

// Fresh salt of `size` bytes from the provider. Throws std::runtime_error on CSPRNG failure.
[[nodiscard]] pepperhash::security::SecureBuffer freshSalt(pepperhash::crypto::ICryptoProvider& crypto,
                                                           std::size_t size);

} // namespace pepperhash::encoder

#endif // INCLUDE_PEPPERHASH_ENCODER_ARGON2ENCODER_HPP
