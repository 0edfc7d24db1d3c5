#include "ArgvBuffer.hpp"

#include "pepperhash/security/MemoryWiper.hpp"

namespace pepperhash::ui::cli
{

ArgvBuffer::ArgvBuffer(std::string_view programName, const std::vector<std::string>& args)
{
    m_storage.reserve(args.size() + 1U);
    m_storage.emplace_back(programName);
    m_storage.insert(m_storage.end(), args.begin(), args.end());

    m_argv.reserve(m_storage.size());
    for (auto& arg : m_storage)
    {
        m_argv.push_back(arg.data());
    }
}

ArgvBuffer::~ArgvBuffer() noexcept
{
    wipe();
}

int ArgvBuffer::argc() const noexcept
{
    return static_cast<int>(m_argv.size());
}

char** ArgvBuffer::argv() noexcept
{
    return m_argv.data();
}

void ArgvBuffer::wipe() noexcept
{
    for (auto& arg : m_storage)
    {
        pepperhash::security::secureWipe(arg);
    }
}

} // namespace pepperhash::ui::cli
