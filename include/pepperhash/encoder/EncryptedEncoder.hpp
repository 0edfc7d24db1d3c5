#ifndef INCLUDE_PEPPERHASH_ENCODER_ENCRYPTEDENCODER_HPP
#define INCLUDE_PEPPERHASH_ENCODER_ENCRYPTEDENCODER_HPP

#include "pepperhash/crypto/ICryptoProvider.hpp"
#include "pepperhash/encoder/CostProfile.hpp"
#include "pepperhash/encoder/IPasswordEncoder.hpp"
#include "pepperhash/encoder/IPepperCipher.hpp"
#include <set>
#include <string>
#include <string_view>

namespace pepperhash::encoder
{

// Argon2 with the raw digest encrypted under a pepper selected by key id. Rotating the active key
// id lets stored hashes be re-keyed by recodeHash without the password.
class EncryptedEncoder final : public IPasswordEncoder
{
public:
    // Throws ConfigError if the cipher name or key id cannot be embedded in a hash string or the
    // cipher has no key for them.
    EncryptedEncoder(pepperhash::crypto::ICryptoProvider& crypto, const IPepperCipher& cipher, CostProfile profile,
                     std::string cipherName, std::string activeKeyId);

    // Throws std::runtime_error if the CSPRNG fails.
    [[nodiscard]] std::string hashPassword(const pepperhash::security::SecureString& password) const override;

    // Accepts the encrypted grammar and, for migration, the unencrypted one.
    [[nodiscard]] bool verifyPassword(const pepperhash::security::SecureString& password,
                                      std::string_view hash) const override;

    // True for anything but an encrypted hash under the current cipher, active key id, costs,
    // salt size and output size.
    [[nodiscard]] bool needsRehash(std::string_view hash) const override;

    [[nodiscard]] std::string recodeHash(std::string_view hash) const override;

    // Re-keys an encrypted or unencrypted hash to (own cipher, targetKeyId), keeping subtype, costs,
    // salt and digest. Unrecognized input is returned unchanged. Throws DecryptError if the stored
    // ciphertext cannot be decrypted and std::invalid_argument if targetKeyId has no pepper.
    [[nodiscard]] std::string recodeHash(std::string_view hash, std::string_view targetKeyId) const;

    [[nodiscard]] std::set<std::string> supportedSubtypes() const override;

    [[nodiscard]] const CostProfile& profile() const noexcept
    {
        return m_profile;
    }
    [[nodiscard]] const std::string& cipherName() const noexcept
    {
        return m_cipherName;
    }
    [[nodiscard]] const std::string& activeKeyId() const noexcept
    {
        return m_activeKeyId;
    }

private:
    pepperhash::crypto::ICryptoProvider* m_crypto{ nullptr };
    const IPepperCipher* m_cipher{ nullptr };
    CostProfile m_profile;
    std::string m_cipherName;
    std::string m_activeKeyId;
};

} // namespace pepperhash::encoder

#endif // INCLUDE_PEPPERHASH_ENCODER_ENCRYPTEDENCODER_HPP
