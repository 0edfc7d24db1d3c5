#include "CommandLine.hpp"
#include "ArgvBuffer.hpp"

#include "pepperhash/crypto/providers/NativeProviderFactory.hpp"
#include "pepperhash/crypto/providers/OpenSslProviderFactory.hpp"
#include "pepperhash/encoder/Argon2Encoder.hpp"
#include "pepperhash/encoder/CostProfile.hpp"
#include "pepperhash/encoder/EncoderErrors.hpp"
#include "pepperhash/encoder/EncryptedEncoder.hpp"
#include "pepperhash/encoder/PassphraseDispatcher.hpp"
#include "pepperhash/encoder/PepperKeyring.hpp"
#include "pepperhash/security/ScopeWipe.hpp"

#include <CLI/CLI.hpp>
#include <cstdint>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace pepperhash::ui::cli
{
namespace
{

using pepperhash::encoder::ConfigError;
namespace providers = pepperhash::crypto::providers;

struct Settings final
{
    pepperhash::encoder::CostOptions costs{};
    std::string cipherName{ pepperhash::encoder::g_kChaCha20CipherName };
    std::optional<std::string> activeKeyId;
    std::vector<std::string> pepperSpecs;
    std::string provider{ providers::g_kNativeProviderName };
};

enum class Command : std::uint8_t
{
    Hash,
    Verify,
    NeedsRehash,
    Recode,
};

struct Invocation final
{
    Command command{ Command::Hash };
    std::string hash;
    std::optional<std::string> targetKeyId;
};

[[nodiscard]] std::unique_ptr<pepperhash::crypto::ICryptoProvider> makeProvider(const std::string& name)
{
    if (name == providers::g_kNativeProviderName)
    {
        return providers::makeNativeCryptoProvider();
    }
#if defined(PEPH_ENABLE_OPENSSL)
    if (name == providers::g_kOpenSslProviderName)
    {
        return providers::makeOpenSslCryptoProvider();
    }
#endif
    throw ConfigError("crypto provider '" + name + "' is not available in this build");
}

void appendPepperList(std::string_view list, std::vector<std::string>& out)
{
    std::size_t start{ 0U };
    while (start <= list.size())
    {
        const std::size_t comma{ list.find(',', start) };
        const std::size_t end{ comma == std::string_view::npos ? list.size() : comma };
        if (end > start)
        {
            out.emplace_back(list.substr(start, end - start));
        }
        if (comma == std::string_view::npos)
        {
            break;
        }
        start = comma + 1U;
    }
}

[[nodiscard]] pepperhash::encoder::PepperKeys collectPeppers(std::vector<std::string>& specs)
{
    pepperhash::encoder::PepperKeys keys{};
    for (auto& spec : specs)
    {
        const auto wipeSpec{ pepperhash::security::scopeWipe(spec) };
        auto [keyId, key]{ pepperhash::encoder::parsePepperSpec(spec) };
        if (keys.contains(keyId))
        {
            throw ConfigError("duplicate pepper key id '" + keyId + "'");
        }
        keys.emplace(std::move(keyId), std::move(key));
    }
    return keys;
}

[[nodiscard]] int execute(const Invocation& invocation, Settings& settings, const PasswordReader& readPassword,
                          std::ostream& out)
{
    auto crypto{ makeProvider(settings.provider) };
    const auto profile{ pepperhash::encoder::CostProfile::build(settings.costs) };

    auto keys{ collectPeppers(settings.pepperSpecs) };
    // Without an active key the first pepper still lets encrypted hashes verify.
    std::optional<std::string> keyIdForEncrypted{ settings.activeKeyId };
    if (!keyIdForEncrypted && !keys.empty())
    {
        keyIdForEncrypted = keys.begin()->first;
    }
    const pepperhash::encoder::PepperKeyring keyring{ *crypto, std::move(keys) };

    const pepperhash::encoder::Argon2Encoder plain{ *crypto, profile };
    std::unique_ptr<pepperhash::encoder::EncryptedEncoder> encrypted{};
    if (keyIdForEncrypted)
    {
        encrypted = std::make_unique<pepperhash::encoder::EncryptedEncoder>(*crypto, keyring, profile,
                                                                            settings.cipherName, *keyIdForEncrypted);
    }

    const bool pepperedPrimary{ settings.activeKeyId.has_value() };
    const pepperhash::encoder::IPasswordEncoder* primary{ &plain };
    if (pepperedPrimary)
    {
        primary = encrypted.get();
    }
    std::vector<const pepperhash::encoder::IPasswordEncoder*> validators{};
    if (pepperedPrimary)
    {
        validators.push_back(&plain);
    }
    else if (encrypted)
    {
        validators.push_back(encrypted.get());
    }
    const pepperhash::encoder::PassphraseDispatcher dispatcher{ *primary, std::move(validators) };

    switch (invocation.command)
    {
    case Command::Hash:
    {
        auto password{ readPassword("Password: ") };
        auto wipePassword{ pepperhash::security::scopeWipe(password) };
        out << dispatcher.hashPassword(password) << "\n";
        return g_kExitOk;
    }
    case Command::Verify:
    {
        auto password{ readPassword("Password: ") };
        auto wipePassword{ pepperhash::security::scopeWipe(password) };
        const bool matched{ dispatcher.verifyPassword(password, invocation.hash) };
        out << (matched ? "match" : "mismatch") << "\n";
        return matched ? g_kExitOk : g_kExitNegative;
    }
    case Command::NeedsRehash:
    {
        const bool stale{ dispatcher.needsRehash(invocation.hash) };
        out << (stale ? "yes" : "no") << "\n";
        return stale ? g_kExitOk : g_kExitNegative;
    }
    case Command::Recode:
    {
        if (!pepperedPrimary)
        {
            if (invocation.targetKeyId)
            {
                throw ConfigError("recode --to requires --active-id");
            }
            out << dispatcher.recodeHash(invocation.hash) << "\n";
            return g_kExitOk;
        }
        out << encrypted->recodeHash(invocation.hash, invocation.targetKeyId.value_or(*settings.activeKeyId))
            << "\n";
        return g_kExitOk;
    }
    }
    return g_kExitUsage;
}

} // namespace

CommandLine::CommandLine(std::ostream& out, std::ostream& err, PasswordReader pwdReader,
                         std::optional<std::string> envPeppers)
    : m_out(out), m_err(err), m_pwdReader(std::move(pwdReader)), m_envPeppers(std::move(envPeppers))
{
}

int CommandLine::run(const std::vector<std::string>& args)
{
    CLI::App app{ "Argon2 password hashing with rotating peppers", "pepperhash" };
    app.require_subcommand(1);
    app.fallthrough();

    Settings settings{};
    std::string subtype;
    std::string memoryCost;
    std::uint32_t timeCost{};
    std::uint32_t parallelism{};
    std::uint32_t outputSize{};
    std::uint32_t saltSize{};
    std::string activeKeyId;

    auto* optSubtype = app.add_option("--subtype", subtype, "argon2i, argon2d or argon2id (default argon2id)");
    auto* optMemory = app.add_option("--memory-cost", memoryCost, "Bytes, or with a k/M/G suffix (default 256M)");
    auto* optTime = app.add_option("--time-cost", timeCost, "Argon2 passes (default 3)");
    auto* optLanes = app.add_option("--parallelism", parallelism, "Argon2 lanes (default 1)");
    auto* optOutput = app.add_option("--output-size", outputSize, "Digest bytes (default 16)");
    auto* optSalt = app.add_option("--salt-size", saltSize, "Salt bytes (default 16)");
    app.add_option("--cipher", settings.cipherName, "Pepper cipher")->capture_default_str();
    auto* optActive = app.add_option("--active-id", activeKeyId, "Pepper key id for new hashes");
    app.add_option("--pepper", settings.pepperSpecs, "<id>=<64 hex digits>, repeatable")->allow_extra_args(false);
    app.add_option("--provider", settings.provider, "Crypto backend")
        ->check(CLI::IsMember(
            { std::string{ providers::g_kNativeProviderName }, std::string{ providers::g_kOpenSslProviderName } }))
        ->capture_default_str();

    Invocation invocation{};
    std::string targetKeyId;

    auto* subHash = app.add_subcommand("hash", "Hash a password read from the terminal");
    subHash->callback([&]() { invocation.command = Command::Hash; });

    auto* subVerify = app.add_subcommand("verify", "Check a password against a stored hash");
    subVerify->add_option("hash", invocation.hash, "Stored hash")->required();
    subVerify->callback([&]() { invocation.command = Command::Verify; });

    auto* subNeeds = app.add_subcommand("needs-rehash", "Tell whether a stored hash is out of date");
    subNeeds->add_option("hash", invocation.hash, "Stored hash")->required();
    subNeeds->callback([&]() { invocation.command = Command::NeedsRehash; });

    auto* subRecode = app.add_subcommand("recode", "Re-encrypt a stored hash under another pepper");
    subRecode->add_option("hash", invocation.hash, "Stored hash")->required();
    auto* optTo = subRecode->add_option("--to", targetKeyId, "Target key id (default --active-id)");
    subRecode->callback([&]() { invocation.command = Command::Recode; });

    try
    {
        ArgvBuffer argv{ "pepperhash", args };
        app.parse(argv.argc(), argv.argv());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
        return g_kExitOk;
    }
    catch (const CLI::ParseError& e)
    {
        m_err << "error: " << e.what() << "\n";
        return g_kExitUsage;
    }

    if (optSubtype->count() > 0U)
    {
        settings.costs.subtype = subtype;
    }
    if (optMemory->count() > 0U)
    {
        settings.costs.memoryCost = pepperhash::encoder::MemoryCost{ memoryCost };
    }
    if (optTime->count() > 0U)
    {
        settings.costs.timeCost = timeCost;
    }
    if (optLanes->count() > 0U)
    {
        settings.costs.parallelism = parallelism;
    }
    if (optOutput->count() > 0U)
    {
        settings.costs.outputSize = outputSize;
    }
    if (optSalt->count() > 0U)
    {
        settings.costs.saltSize = saltSize;
    }
    if (optActive->count() > 0U)
    {
        settings.activeKeyId = activeKeyId;
    }
    if (optTo->count() > 0U)
    {
        invocation.targetKeyId = targetKeyId;
    }
    if (m_envPeppers)
    {
        std::vector<std::string> specs{};
        appendPepperList(*m_envPeppers, specs);
        specs.insert(specs.end(), std::make_move_iterator(settings.pepperSpecs.begin()),
                     std::make_move_iterator(settings.pepperSpecs.end()));
        settings.pepperSpecs = std::move(specs);
    }

    try
    {
        return execute(invocation, settings, m_pwdReader, m_out);
    }
    catch (const ConfigError& e)
    {
        m_err << "configuration error: " << e.what() << "\n";
        return g_kExitUsage;
    }
    catch (const pepperhash::encoder::DecryptError& e)
    {
        m_err << "decryption failed: " << e.what() << "\n";
        return g_kExitFailure;
    }
    catch (const std::invalid_argument& e)
    {
        m_err << "error: " << e.what() << "\n";
        return g_kExitUsage;
    }
    catch (const std::exception& e)
    {
        m_err << "error: " << e.what() << "\n";
        return g_kExitFailure;
    }
}

} // namespace pepperhash::ui::cli
