#include "ConsoleUtils.hpp"

#include "pepperhash/security/ScopeWipe.hpp"
#include <iostream>
#include <string>

#if defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace pepperhash::ui::cli
{

namespace
{

// Restores the terminal mode captured at construction. Inactive when stdin is not a terminal.
class EchoGuard final
{
public:
    EchoGuard() noexcept
    {
        if (isatty(STDIN_FILENO) == 0 || tcgetattr(STDIN_FILENO, &m_saved) != 0)
        {
            return;
        }
        struct termios quiet
        {
            m_saved
        };
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        m_active = (tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0);
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;
    EchoGuard(EchoGuard&&) = delete;
    EchoGuard& operator=(EchoGuard&&) = delete;

    ~EchoGuard() noexcept
    {
        if (m_active && tcsetattr(STDIN_FILENO, TCSANOW, &m_saved) != 0)
        {
            std::cerr << "warning: could not restore terminal echo\n";
        }
    }

    [[nodiscard]] bool active() const noexcept
    {
        return m_active;
    }

private:
    struct termios m_saved
    {
    };
    bool m_active{ false };
};

} // namespace

void lockProcessMemory() noexcept
{
    // Unprivileged processes may lack RLIMIT_MEMLOCK headroom; hashing still works unlocked.
    if (mlockall(MCL_CURRENT | MCL_FUTURE) != 0)
    {
        std::cerr << "warning: could not lock process memory\n";
    }
    struct rlimit lim
    {
        0, 0
    };
    if (setrlimit(RLIMIT_CORE, &lim) != 0)
    {
        std::cerr << "warning: could not disable core dumps\n";
    }
}

pepperhash::security::SecureString readPassword(const std::string& prompt)
{
    std::cerr << prompt << std::flush;

    std::string line;
    {
        const EchoGuard guard{};
        std::getline(std::cin, line);
        if (guard.active())
        {
            std::cerr << "\n";
        }
    }

    const auto wipeLine{ pepperhash::security::scopeWipe(line) };
    return pepperhash::security::secureStringFrom(line);
}

} // namespace pepperhash::ui::cli
