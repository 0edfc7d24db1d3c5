#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <memory>
#include <cstdint>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "pepperhash/crypto/providers/NativeProviderFactory.hpp"
#include "pepperhash/encoder/Argon2Encoder.hpp"
#include "pepperhash/encoder/EncoderErrors.hpp"
#include "pepperhash/encoder/EncryptedEncoder.hpp"
#include "pepperhash/encoder/HashCodec.hpp"
#include "pepperhash/encoder/PepperKeyring.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

using pepperhash::encoder::ConfigError;
using pepperhash::encoder::CostOptions;
using pepperhash::encoder::CostProfile;
using pepperhash::encoder::DecryptError;
using pepperhash::encoder::EncryptedEncoder;
using pepperhash::security::SecureBuffer;
using pepperhash::security::secureStringFrom;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::StartsWith;
using ::testing::Throw;

constexpr std::string_view g_kCipher{ "chacha20" };

// Reference argon2id digest of "password"/"somesalt" (m=64M, t=2, p=1) encrypted under pepper 00..1f.
constexpr std::string_view g_kEncryptedVector{ "$argon2id-encrypted$v=1,cipher=chacha20,id=12$v=19$m=65536,t=2,p=1$"
                                               "c29tZXNhbHQ$HObG8ddVt2yJQ2IkvCzd6vsPoZrD+AB/Gx7RVZu+xL8" };

class MockPepperCipher final : public pepperhash::encoder::IPepperCipher
{
public:
    MOCK_METHOD(SecureBuffer, encryptHash,
                (std::string_view, std::string_view, std::span<const std::uint8_t>, std::span<const std::uint8_t>),
                (const, override));
    MOCK_METHOD(SecureBuffer, decryptHash,
                (std::string_view, std::string_view, std::span<const std::uint8_t>, std::span<const std::uint8_t>),
                (const, override));
    MOCK_METHOD(bool, supportsKey, (std::string_view, std::string_view), (const, noexcept, override));
};

class EncryptedEncoderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_crypto = pepperhash::crypto::providers::makeNativeCryptoProvider();

        pepperhash::encoder::PepperKeys keys{};
        keys.emplace("12", pepperhash::test_utils::makePepper(0U));
        keys.emplace("42", pepperhash::test_utils::makePepper(42U));
        m_keyring = std::make_unique<pepperhash::encoder::PepperKeyring>(*m_crypto, std::move(keys));
    }

    [[nodiscard]] std::unique_ptr<EncryptedEncoder> makeEncoder(std::string activeKeyId,
                                                                const CostOptions& options) const
    {
        return std::make_unique<EncryptedEncoder>(*m_crypto, *m_keyring, CostProfile::build(options),
                                                  std::string{ g_kCipher }, std::move(activeKeyId));
    }

    [[nodiscard]] std::unique_ptr<EncryptedEncoder> makeEncoder(std::string activeKeyId) const
    {
        return makeEncoder(std::move(activeKeyId), pepperhash::test_utils::fastCostOptions());
    }

    std::unique_ptr<pepperhash::crypto::ICryptoProvider> m_crypto;     // NOLINT
    std::unique_ptr<pepperhash::encoder::PepperKeyring> m_keyring; // NOLINT
};

} // namespace

TEST_F(EncryptedEncoderTest, HashVerifiesAndIsCurrent)
{
    const auto encoder{ makeEncoder("12") };
    const auto password{ secureStringFrom("s3cret") };
    const auto hash{ encoder->hashPassword(password) };

    EXPECT_THAT(hash, StartsWith("$argon2id-encrypted$v=1,cipher=chacha20,id=12$v=19$m=8,t=1,p=1$"));
    EXPECT_TRUE(encoder->verifyPassword(password, hash));
    EXPECT_FALSE(encoder->verifyPassword(secureStringFrom("s3cret!"), hash));
    EXPECT_FALSE(encoder->needsRehash(hash));
}

TEST_F(EncryptedEncoderTest, CiphertextIsNotThePlainDigest)
{
    const auto encoder{ makeEncoder("12") };
    const auto hash{ encoder->hashPassword(secureStringFrom("pw")) };
    const auto parsed{ pepperhash::encoder::parseEncryptedHash(hash) };
    ASSERT_TRUE(parsed.has_value());

    const auto digest{ m_crypto->argon2Raw(parsed->subtype, pepperhash::test_utils::asBytes("pw"), parsed->salt,
                                           parsed->argon2Params(), parsed->payload.size()) };
    EXPECT_NE(digest, parsed->payload);
}

TEST_F(EncryptedEncoderTest, VerifiesReferenceVector)
{
    CostOptions options{};
    options.memoryCost = pepperhash::encoder::MemoryCost{ std::string{ "64M" } };
    options.timeCost = 2U;
    options.outputSize = 32U;
    options.saltSize = 8U;
    const auto encoder{ makeEncoder("12", options) };

    EXPECT_TRUE(encoder->verifyPassword(secureStringFrom("password"), g_kEncryptedVector));
    EXPECT_FALSE(encoder->verifyPassword(secureStringFrom("passwore"), g_kEncryptedVector));
    EXPECT_FALSE(encoder->needsRehash(g_kEncryptedVector));
}

TEST_F(EncryptedEncoderTest, CrossKeyVerificationAndRotationSignal)
{
    const auto oldEncoder{ makeEncoder("12") };
    const auto newEncoder{ makeEncoder("42") };
    const auto password{ secureStringFrom("rotate me") };
    const auto hash{ oldEncoder->hashPassword(password) };

    EXPECT_TRUE(newEncoder->verifyPassword(password, hash));
    EXPECT_TRUE(newEncoder->needsRehash(hash));
    EXPECT_FALSE(oldEncoder->needsRehash(hash));
}

TEST_F(EncryptedEncoderTest, RecodeIsIdempotentForItsOwnTarget)
{
    const auto encoder{ makeEncoder("12") };
    const auto hash{ encoder->hashPassword(secureStringFrom("pw")) };

    EXPECT_EQ(encoder->recodeHash(hash), hash);
    EXPECT_EQ(encoder->recodeHash(hash, "12"), hash);

    const auto moved{ encoder->recodeHash(hash, "42") };
    EXPECT_EQ(encoder->recodeHash(moved, "42"), moved);
}

TEST_F(EncryptedEncoderTest, RecodeRekeysWithoutThePassword)
{
    const auto oldEncoder{ makeEncoder("12") };
    const auto newEncoder{ makeEncoder("42") };
    const auto password{ secureStringFrom("rekey") };
    const auto hash{ oldEncoder->hashPassword(password) };

    const auto recoded{ newEncoder->recodeHash(hash) };
    EXPECT_NE(recoded, hash);
    EXPECT_THAT(recoded, HasSubstr(",id=42$"));
    EXPECT_TRUE(newEncoder->verifyPassword(password, recoded));
    EXPECT_FALSE(newEncoder->needsRehash(recoded));
    EXPECT_EQ(oldEncoder->recodeHash(hash, "42"), recoded);

    const auto before{ pepperhash::encoder::parseEncryptedHash(hash) };
    const auto after{ pepperhash::encoder::parseEncryptedHash(recoded) };
    ASSERT_TRUE(before.has_value());
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->salt, before->salt);
    EXPECT_EQ(after->memoryCost, before->memoryCost);
    EXPECT_EQ(after->timeCost, before->timeCost);
    EXPECT_EQ(after->parallelism, before->parallelism);
    EXPECT_EQ(after->subtype, before->subtype);
}

TEST_F(EncryptedEncoderTest, RecodeKeepsLegacyCostsOfOlderHashes)
{
    auto strongerOptions{ pepperhash::test_utils::fastCostOptions() };
    strongerOptions.timeCost = 2U;
    const auto oldEncoder{ makeEncoder("12") };
    const auto newEncoder{ makeEncoder("42", strongerOptions) };
    const auto hash{ oldEncoder->hashPassword(secureStringFrom("pw")) };

    const auto recoded{ newEncoder->recodeHash(hash) };
    EXPECT_THAT(recoded, HasSubstr("$m=8,t=1,p=1$"));
    EXPECT_TRUE(newEncoder->verifyPassword(secureStringFrom("pw"), recoded));
    EXPECT_TRUE(newEncoder->needsRehash(recoded));
}

TEST_F(EncryptedEncoderTest, LegacyHashesVerifyAndMigrate)
{
    const pepperhash::encoder::Argon2Encoder legacy{ *m_crypto, pepperhash::test_utils::fastProfile() };
    const auto encoder{ makeEncoder("12") };
    const auto password{ secureStringFrom("legacy") };
    const auto legacyHash{ legacy.hashPassword(password) };

    EXPECT_TRUE(encoder->verifyPassword(password, legacyHash));
    EXPECT_FALSE(encoder->verifyPassword(secureStringFrom("wrong"), legacyHash));
    EXPECT_TRUE(encoder->needsRehash(legacyHash));

    const auto migrated{ encoder->recodeHash(legacyHash) };
    EXPECT_THAT(migrated, StartsWith("$argon2id-encrypted$v=1,cipher=chacha20,id=12$"));
    EXPECT_TRUE(encoder->verifyPassword(password, migrated));
    EXPECT_FALSE(encoder->needsRehash(migrated));

    const auto legacyParsed{ pepperhash::encoder::parseUnencryptedHash(legacyHash) };
    const auto migratedParsed{ pepperhash::encoder::parseEncryptedHash(migrated) };
    ASSERT_TRUE(legacyParsed.has_value());
    ASSERT_TRUE(migratedParsed.has_value());
    EXPECT_EQ(migratedParsed->salt, legacyParsed->salt);
}

TEST_F(EncryptedEncoderTest, MalformedInputFailsClosedAndPassesThroughRecode)
{
    const auto encoder{ makeEncoder("12") };
    constexpr std::array kBad{
        std::string_view{ "" },
        std::string_view{ "plaintext" },
        std::string_view{ "$argon2id-encrypted$v=1,cipher=chacha20,id=12$v=19$m=8,t=1,p=1$c29tZXNhbHQ" },
        std::string_view{ "$argon2id-encrypted$v=1,cipher=chacha20,id=12$v=19$m=8,t=1,p=1$c29tZXNhbHQ$A===" },
        std::string_view{ "$2b$12$abcdefghijklmnopqrstuuQWERTYUIOPASDFGHJKLZXCVBNM012345" },
    };

    for (const auto hash : kBad)
    {
        EXPECT_FALSE(encoder->verifyPassword(secureStringFrom("pw"), hash)) << hash;
        EXPECT_EQ(encoder->recodeHash(hash), hash);
        EXPECT_TRUE(encoder->needsRehash(hash)) << hash;
    }
}

TEST_F(EncryptedEncoderTest, UnknownKeyIdFailsVerifyButThrowsOnRecode)
{
    const auto encoder{ makeEncoder("12") };
    const auto hash{ encoder->hashPassword(secureStringFrom("pw")) };

    auto parsed{ pepperhash::encoder::parseEncryptedHash(hash) };
    ASSERT_TRUE(parsed.has_value());
    parsed->keyId = "99";
    const auto orphan{ pepperhash::encoder::packHash(*parsed) };

    EXPECT_FALSE(encoder->verifyPassword(secureStringFrom("pw"), orphan));
    EXPECT_TRUE(encoder->needsRehash(orphan));
    EXPECT_THROW((void)encoder->recodeHash(orphan), DecryptError);
}

TEST_F(EncryptedEncoderTest, RecodeToUnknownTargetIsRejected)
{
    const auto encoder{ makeEncoder("12") };
    const auto hash{ encoder->hashPassword(secureStringFrom("pw")) };

    EXPECT_THROW((void)encoder->recodeHash(hash, "99"), std::invalid_argument);
}

TEST_F(EncryptedEncoderTest, NeedsRehashTracksProfileChanges)
{
    const auto encoder{ makeEncoder("12") };
    const auto hash{ encoder->hashPassword(secureStringFrom("pw")) };

    auto options{ pepperhash::test_utils::fastCostOptions() };
    options.subtype = "argon2d";
    EXPECT_TRUE(makeEncoder("12", options)->needsRehash(hash));

    options = pepperhash::test_utils::fastCostOptions();
    options.memoryCost = pepperhash::encoder::MemoryCost{ std::string{ "16k" } };
    EXPECT_TRUE(makeEncoder("12", options)->needsRehash(hash));

    options = pepperhash::test_utils::fastCostOptions();
    options.outputSize = 32U;
    EXPECT_TRUE(makeEncoder("12", options)->needsRehash(hash));

    options = pepperhash::test_utils::fastCostOptions();
    options.saltSize = 32U;
    EXPECT_TRUE(makeEncoder("12", options)->needsRehash(hash));
}

TEST_F(EncryptedEncoderTest, ConstructionValidatesCipherAndKey)
{
    const auto profile{ pepperhash::test_utils::fastProfile() };

    EXPECT_THROW((void)EncryptedEncoder(*m_crypto, *m_keyring, profile, "chacha20", "7"), ConfigError);
    EXPECT_THROW((void)EncryptedEncoder(*m_crypto, *m_keyring, profile, "aes-256-cbc", "12"), ConfigError);
    EXPECT_THROW((void)EncryptedEncoder(*m_crypto, *m_keyring, profile, "cha$cha", "12"), ConfigError);
    EXPECT_THROW((void)EncryptedEncoder(*m_crypto, *m_keyring, profile, "chacha20", ""), ConfigError);
    EXPECT_THROW((void)EncryptedEncoder(*m_crypto, *m_keyring, profile, "chacha20", "1,2"), ConfigError);
}

TEST_F(EncryptedEncoderTest, SupportsPlainAndEncryptedSubtypes)
{
    const std::set<std::string> expected{ "argon2i",           "argon2d",           "argon2id",
                                          "argon2i-encrypted", "argon2d-encrypted", "argon2id-encrypted" };
    EXPECT_EQ(makeEncoder("12")->supportedSubtypes(), expected);
}

TEST_F(EncryptedEncoderTest, RotationScenarioWithProductionShapedProfile)
{
    CostOptions options{};
    options.timeCost = 2U;
    options.memoryCost = pepperhash::encoder::MemoryCost{ std::string{ "64M" } };
    options.parallelism = 1U;
    options.outputSize = 32U;

    const auto encoder12{ makeEncoder("12", options) };
    const auto encoder42{ makeEncoder("42", options) };
    const auto password{ secureStringFrom("password") };

    const auto hash{ encoder12->hashPassword(password) };
    EXPECT_THAT(hash, StartsWith("$argon2id-encrypted$v=1,cipher=chacha20,id=12$v=19$m=65536,t=2,p=1$"));
    EXPECT_TRUE(encoder12->verifyPassword(password, hash));
    EXPECT_FALSE(encoder12->needsRehash(hash));

    EXPECT_TRUE(encoder42->verifyPassword(password, hash));
    EXPECT_TRUE(encoder42->needsRehash(hash));

    const auto recoded{ encoder42->recodeHash(hash) };
    EXPECT_THAT(recoded, StartsWith("$argon2id-encrypted$v=1,cipher=chacha20,id=42$v=19$m=65536,t=2,p=1$"));
    EXPECT_TRUE(encoder42->verifyPassword(password, recoded));
    EXPECT_FALSE(encoder42->needsRehash(recoded));
    EXPECT_EQ(encoder42->recodeHash(recoded), recoded);
}

TEST_F(EncryptedEncoderTest, ConcurrentUseOfOneInstance)
{
    const auto encoder{ makeEncoder("12") };
    constexpr int kThreads{ 4 };
    constexpr int kRounds{ 8 };
    std::atomic<int> failures{ 0 };

    std::vector<std::thread> threads{};
    threads.reserve(kThreads);
    for (int t{}; t < kThreads; ++t)
    {
        threads.emplace_back(
            [&encoder, &failures, t]()
            {
                const auto password{ secureStringFrom("thread-" + std::to_string(t)) };
                for (int i{}; i < kRounds; ++i)
                {
                    const auto hash{ encoder->hashPassword(password) };
                    if (!encoder->verifyPassword(password, hash) || encoder->needsRehash(hash) ||
                        encoder->recodeHash(hash, "42") == hash)
                    {
                        failures.fetch_add(1);
                    }
                }
            });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
}

TEST(EncryptedEncoderWithMockCipher, PassesSaltAsAssociatedDataAndActiveKey)
{
    auto crypto{ pepperhash::crypto::providers::makeNativeCryptoProvider() };
    MockPepperCipher cipher{};
    EXPECT_CALL(cipher, supportsKey(std::string_view{ "mock" }, std::string_view{ "k1" })).WillOnce(Return(true));

    const EncryptedEncoder encoder{ *crypto, cipher, pepperhash::test_utils::fastProfile(), "mock", "k1" };

    EXPECT_CALL(cipher, encryptHash(std::string_view{ "mock" }, std::string_view{ "k1" }, _, _))
        .WillOnce(
            [](std::string_view, std::string_view, std::span<const std::uint8_t> salt,
               std::span<const std::uint8_t> plain)
            {
                EXPECT_EQ(salt.size(), 16U);
                EXPECT_EQ(plain.size(), 16U);
                return SecureBuffer(plain.begin(), plain.end());
            });

    const auto hash{ encoder.hashPassword(secureStringFrom("pw")) };
    EXPECT_THAT(hash, StartsWith("$argon2id-encrypted$v=1,cipher=mock,id=k1$"));
}

TEST(EncryptedEncoderWithMockCipher, DecryptAndBackendFailuresAreMismatches)
{
    auto crypto{ pepperhash::crypto::providers::makeNativeCryptoProvider() };
    MockPepperCipher cipher{};
    EXPECT_CALL(cipher, supportsKey(_, _)).WillRepeatedly(Return(true));
    EXPECT_CALL(cipher, encryptHash(_, _, _, _))
        .WillOnce([](std::string_view, std::string_view, std::span<const std::uint8_t>,
                     std::span<const std::uint8_t> plain) { return SecureBuffer(plain.begin(), plain.end()); });
    EXPECT_CALL(cipher, decryptHash(_, _, _, _))
        .WillOnce(Throw(DecryptError("bad key")))
        .WillOnce(Throw(std::runtime_error("cipher backend failure")))
        .WillOnce(Throw(std::invalid_argument("bad ciphertext length")));

    const EncryptedEncoder encoder{ *crypto, cipher, pepperhash::test_utils::fastProfile(), "mock", "k1" };
    const auto hash{ encoder.hashPassword(secureStringFrom("pw")) };

    EXPECT_FALSE(encoder.verifyPassword(secureStringFrom("pw"), hash));
    EXPECT_FALSE(encoder.verifyPassword(secureStringFrom("pw"), hash));
    EXPECT_FALSE(encoder.verifyPassword(secureStringFrom("pw"), hash));
}
