#include "pepperhash/crypto/Argon2Raw.hpp"
#include "pepperhash/crypto/providers/NativeProviderFactory.hpp"
#include "pepperhash/security/ScopeWipe.hpp"
#include "pepperhash/security/SecureBuffer.hpp"
#include "pepperhash/security/SecureRandom.hpp"
#include <monocypher.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

namespace pepperhash::crypto::providers
{
namespace
{

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

class NativeCryptoProvider final : public pepperhash::crypto::ICryptoProvider
{
public:
    [[nodiscard]] pepperhash::security::SecureBuffer argon2Raw(pepperhash::crypto::Argon2Subtype subtype,
                                                               std::span<const std::byte> password,
                                                               std::span<const std::uint8_t> salt,
                                                               const pepperhash::crypto::Argon2Params& params,
                                                               std::size_t outBytes) const override
    {
        return pepperhash::crypto::deriveArgon2Raw(subtype, password, salt, params, outBytes);
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return pepperhash::security::secureRandomFill(out);
    }

    [[nodiscard]] pepperhash::security::SecureBuffer streamXor(std::span<const std::uint8_t> key,
                                                               std::span<const std::uint8_t> nonceSeed,
                                                               std::span<const std::uint8_t> input) const override
    {
        requireExactSize(key, pepperhash::crypto::g_streamKeyBytes, "streamXor: key");

        std::array<std::uint8_t, pepperhash::crypto::g_blake2bBytes> digest{};
        auto wipeDigest = pepperhash::security::scopeWipe(std::span<std::uint8_t>{ digest });
        crypto_blake2b(digest.data(), digest.size(), nonceSeed.data(), nonceSeed.size());

        pepperhash::security::SecureBuffer out{};
        out.resize(input.size());
        if (input.empty())
        {
            return out;
        }

        // The return value is the next block counter, which a single-shot call has no use for.
        static_cast<void>(crypto_chacha20_ietf(out.data(), input.data(), input.size(), key.data(), digest.data(), 0U));
        return out;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<pepperhash::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace pepperhash::crypto::providers
