#include "pepperhash/encoder/Argon2Primitives.hpp"

#include "pepperhash/encoder/HashCodec.hpp"
#include "pepperhash/security/SecureEquals.hpp"
#include <exception>
#include <new>
#include <variant>

namespace pepperhash::encoder
{

[[nodiscard]] EncoderResult<pepperhash::security::SecureBuffer>
argon2RawOrError(const pepperhash::crypto::ICryptoProvider& crypto, pepperhash::crypto::Argon2Subtype subtype,
                 std::span<const std::byte> password, std::span<const std::uint8_t> salt,
                 const pepperhash::crypto::Argon2Params& params, std::size_t outBytes) noexcept
{
    try
    {
        return crypto.argon2Raw(subtype, password, salt, params, outBytes);
    }
    catch (const std::exception&)
    {
        return EncoderError::HashFailed;
    }
}

[[nodiscard]] std::string argon2Pass(const pepperhash::crypto::ICryptoProvider& crypto,
                                     pepperhash::crypto::Argon2Subtype subtype, std::span<const std::byte> password,
                                     std::span<const std::uint8_t> salt,
                                     const pepperhash::crypto::Argon2Params& params, std::size_t outBytes)
{
    EncodedHash record{};
    record.subtype = subtype;
    record.memoryCost = static_cast<std::uint64_t>(params.memoryKiB) * g_kBytesPerKiB;
    record.timeCost = params.timeCost;
    record.parallelism = params.parallelism;
    record.salt.assign(salt.begin(), salt.end());
    record.payload = crypto.argon2Raw(subtype, password, salt, params, outBytes);
    return packHash(record);
}

[[nodiscard]] bool argon2Verify(const pepperhash::crypto::ICryptoProvider& crypto, std::string_view hash,
                                std::span<const std::byte> password) noexcept
{
    try
    {
        const auto parsed{ parseUnencryptedHash(hash) };
        if (!parsed)
        {
            return false;
        }

        const auto digestOrErr{ argon2RawOrError(crypto, parsed->subtype, password, parsed->salt,
                                                 parsed->argon2Params(), parsed->payload.size()) };
        if (std::holds_alternative<EncoderError>(digestOrErr))
        {
            return false;
        }

        return pepperhash::security::secureEquals(std::get<pepperhash::security::SecureBuffer>(digestOrErr),
                                                  parsed->payload);
    }
    catch (const std::bad_alloc&)
    {
        return false;
    }
}

[[nodiscard]] bool argon2NeedsRehash(std::string_view hash, const CostProfile& profile) noexcept
{
    try
    {
        const auto parsed{ parseUnencryptedHash(hash) };
        if (!parsed)
        {
            return true;
        }

        return parsed->subtype != profile.subtype() || parsed->memoryCost != profile.memoryCost() ||
               parsed->timeCost != profile.timeCost() || parsed->parallelism != profile.parallelism() ||
               parsed->salt.size() != profile.saltSize() || parsed->payload.size() != profile.outputSize();
    }
    catch (const std::bad_alloc&)
    {
        return true;
    }
}

} // namespace pepperhash::encoder
