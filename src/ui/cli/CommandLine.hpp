#ifndef PEPPERHASH_UI_CLI_COMMANDLINE_HPP
#define PEPPERHASH_UI_CLI_COMMANDLINE_HPP

#include "pepperhash/security/SecureBuffer.hpp"

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace pepperhash::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<pepperhash::security::SecureString(const std::string&)>;

constexpr int g_kExitOk{ 0 };
constexpr int g_kExitNegative{ 1 };
constexpr int g_kExitUsage{ 2 };
constexpr int g_kExitFailure{ 3 };

constexpr const char* g_kPeppersEnvVar{ "PEPPERHASH_PEPPERS" };

class CommandLine final
{
public:
    // `envPeppers` is the comma separated "<id>=<hex>" list from the environment, if any.
    CommandLine(std::ostream& out, std::ostream& err, PasswordReader pwdReader,
                std::optional<std::string> envPeppers = std::nullopt);

    // `args` excludes the program name. Returns the process exit code.
    [[nodiscard]] int run(const std::vector<std::string>& args);

private:
    std::ostream& m_out;
    std::ostream& m_err;
    PasswordReader m_pwdReader;
    std::optional<std::string> m_envPeppers;
};

} // namespace pepperhash::ui::cli

#endif // PEPPERHASH_UI_CLI_COMMANDLINE_HPP
