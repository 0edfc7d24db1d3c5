#ifndef PEPPERHASH_UI_CLI_CONSOLEUTILS_HPP
#define PEPPERHASH_UI_CLI_CONSOLEUTILS_HPP

#include "pepperhash/security/SecureBuffer.hpp"
#include <string>

namespace pepperhash::ui::cli
{

// Locks pages in RAM and disables core dumps. Best effort.
void lockProcessMemory() noexcept;

// Reads one line from stdin with terminal echo off. The prompt goes to stderr so stdout carries
// only results.
[[nodiscard]] pepperhash::security::SecureString readPassword(const std::string& prompt);

} // namespace pepperhash::ui::cli

#endif // PEPPERHASH_UI_CLI_CONSOLEUTILS_HPP
