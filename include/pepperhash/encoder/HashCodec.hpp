#ifndef INCLUDE_PEPPERHASH_ENCODER_HASHCODEC_HPP
#define INCLUDE_PEPPERHASH_ENCODER_HASHCODEC_HPP

#include "pepperhash/encoder/EncodedHash.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace pepperhash::encoder
{

constexpr std::string_view g_kEncryptedSuffix{ "-encrypted" };

// Unencrypted: $<subtype>$v=19$m=<KiB>,t=<t>,p=<p>$<salt>$<digest>
// Encrypted:   $<subtype>-encrypted$v=1,cipher=<cipher>,id=<id>$v=19$m=<KiB>,t=<t>,p=<p>$<salt>$<ciphertext>
// Salt and payload are standard base64 without padding.

// Packs the encrypted form when the record carries both cipherName and keyId, the plain form
// otherwise. Throws std::invalid_argument if memoryCost is not a whole number of KiB, a KiB count
// does not fit 32 bits, or a cipher name / key id is empty or contains '$' or ','.
[[nodiscard]] std::string packHash(const EncodedHash& record);

// Strict parsers: any deviation from the grammar yields std::nullopt, never a partial record.
[[nodiscard]] std::optional<EncodedHash> parseEncryptedHash(std::string_view hash);
[[nodiscard]] std::optional<EncodedHash> parseUnencryptedHash(std::string_view hash);

// True if `field` can be embedded as a cipher name or key id.
[[nodiscard]] bool isValidHashField(std::string_view field) noexcept;

// The `<tag>` of a leading `$<tag>$`, where tag is [0-9A-Za-z-]+; empty if absent.
[[nodiscard]] std::string_view hashTag(std::string_view hash) noexcept;

} // namespace pepperhash::encoder

#endif // INCLUDE_PEPPERHASH_ENCODER_HASHCODEC_HPP
