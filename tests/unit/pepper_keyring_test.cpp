#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "pepperhash/crypto/providers/NativeProviderFactory.hpp"
#include "pepperhash/encoder/EncoderErrors.hpp"
#include "pepperhash/encoder/PepperKeyring.hpp"
#include "pepperhash/security/SecureEquals.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

using pepperhash::encoder::ConfigError;
using pepperhash::encoder::DecryptError;
using pepperhash::encoder::PepperKeyring;
using pepperhash::encoder::PepperKeys;
using pepperhash::test_utils::asU8;
using pepperhash::test_utils::makePepper;

constexpr std::string_view g_kCipher{ "chacha20" };
constexpr std::string_view g_kSalt{ "0123456789abcdef" };
constexpr std::string_view g_kDigest{ "raw argon2 digest bytes!" };

class PepperKeyringTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_crypto = pepperhash::crypto::providers::makeNativeCryptoProvider();

        PepperKeys keys{};
        keys.emplace("12", makePepper(12U));
        keys.emplace("42", makePepper(42U));
        m_keyring = std::make_unique<PepperKeyring>(*m_crypto, std::move(keys));
    }

    std::unique_ptr<pepperhash::crypto::ICryptoProvider> m_crypto; // NOLINT
    std::unique_ptr<PepperKeyring> m_keyring;                      // NOLINT
};

} // namespace

TEST_F(PepperKeyringTest, EncryptDecryptRoundTripPreservesLength)
{
    const auto cipherText{ m_keyring->encryptHash(g_kCipher, "12", asU8(g_kSalt), asU8(g_kDigest)) };
    ASSERT_EQ(cipherText.size(), g_kDigest.size());

    const auto plain{ m_keyring->decryptHash(g_kCipher, "12", asU8(g_kSalt),
                                             pepperhash::security::asSpan(cipherText)) };
    EXPECT_EQ(std::string(plain.begin(), plain.end()), g_kDigest);
}

TEST_F(PepperKeyringTest, KeysProduceDistinctCiphertexts)
{
    const auto a{ m_keyring->encryptHash(g_kCipher, "12", asU8(g_kSalt), asU8(g_kDigest)) };
    const auto b{ m_keyring->encryptHash(g_kCipher, "42", asU8(g_kSalt), asU8(g_kDigest)) };
    EXPECT_FALSE(pepperhash::security::secureEquals(a, b));
}

TEST_F(PepperKeyringTest, SupportsOnlyKnownCipherAndKeys)
{
    EXPECT_TRUE(m_keyring->supportsKey(g_kCipher, "12"));
    EXPECT_TRUE(m_keyring->supportsKey(g_kCipher, "42"));
    EXPECT_FALSE(m_keyring->supportsKey(g_kCipher, "7"));
    EXPECT_FALSE(m_keyring->supportsKey("aes-256-cbc", "12"));
    EXPECT_EQ(m_keyring->size(), 2U);
}

TEST_F(PepperKeyringTest, UnknownKeyOrCipherFailsDecryptWithDecryptError)
{
    EXPECT_THROW((void)m_keyring->decryptHash(g_kCipher, "7", asU8(g_kSalt), asU8(g_kDigest)), DecryptError);
    EXPECT_THROW((void)m_keyring->decryptHash("aes-256-cbc", "12", asU8(g_kSalt), asU8(g_kDigest)), DecryptError);
    EXPECT_THROW((void)m_keyring->decryptHash(g_kCipher, "12", asU8(g_kSalt), asU8("")), DecryptError);
}

TEST_F(PepperKeyringTest, UnknownKeyFailsEncryptWithInvalidArgument)
{
    EXPECT_THROW((void)m_keyring->encryptHash(g_kCipher, "7", asU8(g_kSalt), asU8(g_kDigest)), std::invalid_argument);
}

TEST_F(PepperKeyringTest, ErrorMessagesNameKeyIdButNotKeyBytes)
{
    try
    {
        (void)m_keyring->decryptHash(g_kCipher, "missing-id", asU8(g_kSalt), asU8(g_kDigest));
        FAIL() << "expected DecryptError";
    }
    catch (const DecryptError& e)
    {
        const std::string message{ e.what() };
        EXPECT_NE(message.find("missing-id"), std::string::npos);
        EXPECT_EQ(message.find(pepperhash::test_utils::toHex(pepperhash::security::asSpan(makePepper(12U)))),
                  std::string::npos);
    }
}

TEST(PepperKeyring, RejectsBadKeysAtConstruction)
{
    auto crypto{ pepperhash::crypto::providers::makeNativeCryptoProvider() };

    PepperKeys shortKey{};
    shortKey.emplace("1", pepperhash::security::SecureBuffer(16U));
    EXPECT_THROW((void)PepperKeyring(*crypto, std::move(shortKey)), ConfigError);

    PepperKeys dollarId{};
    dollarId.emplace("a$b", makePepper(0U));
    EXPECT_THROW((void)PepperKeyring(*crypto, std::move(dollarId)), ConfigError);

    PepperKeys commaId{};
    commaId.emplace("a,b", makePepper(0U));
    EXPECT_THROW((void)PepperKeyring(*crypto, std::move(commaId)), ConfigError);

    PepperKeys emptyId{};
    emptyId.emplace("", makePepper(0U));
    EXPECT_THROW((void)PepperKeyring(*crypto, std::move(emptyId)), ConfigError);
}

TEST(ParsePepperSpec, DecodesIdAndHexKey)
{
    const auto spec{ pepperhash::test_utils::pepperSpec("2024", 0xA0U) };
    const auto [keyId, key]{ pepperhash::encoder::parsePepperSpec(spec) };

    EXPECT_EQ(keyId, "2024");
    EXPECT_TRUE(pepperhash::security::secureEquals(key, makePepper(0xA0U)));
}

TEST(ParsePepperSpec, AcceptsUppercaseHex)
{
    const std::string spec{ "k=" + std::string(64U, 'F') };
    const auto [keyId, key]{ pepperhash::encoder::parsePepperSpec(spec) };

    EXPECT_EQ(keyId, "k");
    ASSERT_EQ(key.size(), 32U);
    EXPECT_EQ(key.front(), 0xFFU);
}

TEST(ParsePepperSpec, RejectsMalformedSpecs)
{
    const std::string validHex(64U, 'a');
    EXPECT_THROW((void)pepperhash::encoder::parsePepperSpec(validHex), ConfigError);
    EXPECT_THROW((void)pepperhash::encoder::parsePepperSpec("=" + validHex), ConfigError);
    EXPECT_THROW((void)pepperhash::encoder::parsePepperSpec("a$b=" + validHex), ConfigError);
    EXPECT_THROW((void)pepperhash::encoder::parsePepperSpec("k=" + validHex.substr(2U)), ConfigError);
    EXPECT_THROW((void)pepperhash::encoder::parsePepperSpec("k=" + validHex + "aa"), ConfigError);
    EXPECT_THROW((void)pepperhash::encoder::parsePepperSpec("k=" + std::string(64U, 'g')), ConfigError);
}

TEST(ParsePepperSpec, ErrorDoesNotEchoKeyMaterial)
{
    const std::string badHex{ std::string(62U, 'b') + "zz" };
    try
    {
        (void)pepperhash::encoder::parsePepperSpec("k=" + badHex);
        FAIL() << "expected ConfigError";
    }
    catch (const ConfigError& e)
    {
        EXPECT_EQ(std::string{ e.what() }.find("bbbbbbbb"), std::string::npos);
    }
}
