#include "pepperhash/crypto/providers/OpenSslProviderFactory.hpp"
#include "pepperhash/security/ScopeWipe.hpp"
#include "pepperhash/security/SecureBuffer.hpp"
#include "pepperhash/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <span>
#include <stdexcept>

namespace pepperhash::crypto::providers
{
namespace
{

constexpr const char* g_kKdfParamArgon2Memcost{ "memcost" };
constexpr const char* g_kKdfParamArgon2Lanes{ "lanes" };
constexpr const char* g_kKdfParamThreads{ "threads" };
constexpr const char* g_kKdfParamArgon2Version{ "version" };

// EVP_chacha20 takes a 16-byte IV: 32-bit little-endian block counter followed by the nonce.
constexpr std::size_t g_kChaChaIvBytes{ 16U };
constexpr std::size_t g_kChaChaCounterBytes{ 4U };

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

[[nodiscard]] const char* kdfName(pepperhash::crypto::Argon2Subtype subtype) noexcept
{
    switch (subtype)
    {
    case pepperhash::crypto::Argon2Subtype::Argon2i:
        return "ARGON2I";
    case pepperhash::crypto::Argon2Subtype::Argon2d:
        return "ARGON2D";
    case pepperhash::crypto::Argon2Subtype::Argon2id:
        return "ARGON2ID";
    }
    return "ARGON2ID";
}

EvpKdfPtr fetchArgon2Kdf(pepperhash::crypto::Argon2Subtype subtype)
{
    if (EVP_KDF * kdf{ EVP_KDF_fetch(nullptr, kdfName(subtype), nullptr) }; kdf != nullptr)
    {
        return EvpKdfPtr{ kdf, &EVP_KDF_free };
    }
    return EvpKdfPtr{ nullptr, &EVP_KDF_free };
}

class OpenSslCryptoProvider final : public pepperhash::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider()
        : m_argon2iKdf{ fetchArgon2Kdf(pepperhash::crypto::Argon2Subtype::Argon2i) },
          m_argon2dKdf{ fetchArgon2Kdf(pepperhash::crypto::Argon2Subtype::Argon2d) },
          m_argon2idKdf{ fetchArgon2Kdf(pepperhash::crypto::Argon2Subtype::Argon2id) }
    {
    }

    [[nodiscard]] pepperhash::security::SecureBuffer argon2Raw(pepperhash::crypto::Argon2Subtype subtype,
                                                               std::span<const std::byte> password,
                                                               std::span<const std::uint8_t> salt,
                                                               const pepperhash::crypto::Argon2Params& params,
                                                               std::size_t outBytes) const override
    {
        pepperhash::crypto::requireArgon2InputsSafe(params, password.size(), salt.size(), outBytes);

        EVP_KDF* kdf{ kdfFor(subtype) };
        if (kdf == nullptr)
        {
            throw std::runtime_error("argon2Raw: OpenSSL Argon2 KDF not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(kdf), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("argon2Raw: EVP_KDF_CTX_new failed");
        }

        std::uint32_t iter{ params.timeCost };
        std::uint32_t memcostKiB{ params.memoryKiB };
        std::uint32_t lanes{ params.parallelism };
        std::uint32_t threads{ 1U };
        std::uint32_t version{ pepperhash::crypto::g_kArgon2VersionV13 };

        // OpenSSL's OSSL_PARAM API uses non-const pointers even for read-only octet string inputs.
        // Copy inputs to local buffers instead of casting const away.
        pepperhash::security::SecureBuffer passwordCopy{};
        passwordCopy.resize(password.size());
        if (!password.empty())
        {
            std::memcpy(passwordCopy.data(), password.data(), password.size());
        }
        auto saltCopy{ pepperhash::security::secureBufferFrom(salt) };

        OSSL_PARAM kdfParams[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Memcost, &memcostKiB),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Lanes, &lanes),
            OSSL_PARAM_construct_uint32(g_kKdfParamThreads, &threads),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Version, &version),
            OSSL_PARAM_construct_end(),
        };

        pepperhash::security::SecureBuffer out{};
        out.resize(outBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), kdfParams) <= 0)
        {
            throw std::runtime_error("argon2Raw: EVP_KDF_derive failed");
        }
        return out;
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
        if (input.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::invalid_argument("streamXor: input too large");
        }

        std::array<std::uint8_t, pepperhash::crypto::g_blake2bBytes> digest{};
        auto wipeDigest = pepperhash::security::scopeWipe(std::span<std::uint8_t>{ digest });
        unsigned int digestLen{ 0U };
        if (EVP_Digest(nonceSeed.data(), nonceSeed.size(), digest.data(), &digestLen, EVP_blake2b512(), nullptr) != 1 ||
            digestLen != digest.size())
        {
            throw std::runtime_error("streamXor: BLAKE2b failed");
        }

        std::array<std::uint8_t, g_kChaChaIvBytes> iv{};
        std::memcpy(iv.data() + g_kChaChaCounterBytes, digest.data(), pepperhash::crypto::g_streamNonceBytes);

        pepperhash::security::SecureBuffer out{};
        out.resize(input.size());
        if (input.empty())
        {
            return out;
        }

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("streamXor: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20(), nullptr, key.data(), iv.data()) != 1)
        {
            throw std::runtime_error("streamXor: EVP_EncryptInit_ex failed");
        }

        int outLen{ 0 };
        if (EVP_EncryptUpdate(ctx.get(), out.data(), &outLen, input.data(), static_cast<int>(input.size())) != 1)
        {
            throw std::runtime_error("streamXor: encrypt update failed");
        }
        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), out.data() + outLen, &finalLen) != 1)
        {
            throw std::runtime_error("streamXor: encrypt final failed");
        }
        if (outLen < 0 || finalLen < 0 ||
            static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) != input.size())
        {
            throw std::runtime_error("streamXor: invalid output length");
        }

        return out;
    }

private:
    [[nodiscard]] EVP_KDF* kdfFor(pepperhash::crypto::Argon2Subtype subtype) const noexcept
    {
        switch (subtype)
        {
        case pepperhash::crypto::Argon2Subtype::Argon2i:
            return m_argon2iKdf.get();
        case pepperhash::crypto::Argon2Subtype::Argon2d:
            return m_argon2dKdf.get();
        case pepperhash::crypto::Argon2Subtype::Argon2id:
            return m_argon2idKdf.get();
        }
        return nullptr;
    }

    EvpKdfPtr m_argon2iKdf{ nullptr, &EVP_KDF_free };
    EvpKdfPtr m_argon2dKdf{ nullptr, &EVP_KDF_free };
    EvpKdfPtr m_argon2idKdf{ nullptr, &EVP_KDF_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<pepperhash::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace pepperhash::crypto::providers
