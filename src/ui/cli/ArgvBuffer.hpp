#ifndef PEPPERHASH_UI_CLI_ARGVBUFFER_HPP
#define PEPPERHASH_UI_CLI_ARGVBUFFER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace pepperhash::ui::cli
{

// Mutable argc/argv copy of the arguments for CLI11. Arguments may carry pepper keys, so every
// copy is wiped on destruction.
class ArgvBuffer final
{
public:
    ArgvBuffer(std::string_view programName, const std::vector<std::string>& args);
    ~ArgvBuffer() noexcept;

    ArgvBuffer(const ArgvBuffer&) = delete;
    ArgvBuffer& operator=(const ArgvBuffer&) = delete;
    ArgvBuffer(ArgvBuffer&&) = delete;
    ArgvBuffer& operator=(ArgvBuffer&&) = delete;

    [[nodiscard]] int argc() const noexcept;
    [[nodiscard]] char** argv() noexcept;

    // Zeroes every argument. argv() pointers stay valid and point at empty strings.
    void wipe() noexcept;

private:
    std::vector<std::string> m_storage;
    std::vector<char*> m_argv;
};

} // namespace pepperhash::ui::cli

#endif // PEPPERHASH_UI_CLI_ARGVBUFFER_HPP
