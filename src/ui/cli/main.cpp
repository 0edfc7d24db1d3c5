#include "CommandLine.hpp"
#include "ConsoleUtils.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

int main(int argc, char** argv)
{
    try
    {
        pepperhash::ui::cli::lockProcessMemory();

        std::optional<std::string> envPeppers{};
        if (const char* value{ std::getenv(pepperhash::ui::cli::g_kPeppersEnvVar) }; value != nullptr)
        {
            envPeppers = std::string{ value };
        }

        const std::vector<std::string> args(argc > 1 ? argv + 1 : argv, argc > 1 ? argv + argc : argv);
        pepperhash::ui::cli::CommandLine cli{ std::cout, std::cerr, &pepperhash::ui::cli::readPassword,
                                              std::move(envPeppers) };
        return cli.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return pepperhash::ui::cli::g_kExitFailure;
    }
}
