#include "ArgvBuffer.hpp"
#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "test_utils/TestUtils.hpp"

TEST(ArgvBuffer, ExposesProgramNameThenArguments)
{
    const std::vector<std::string> args{ "verify", "$argon2id$v=19$m=8,t=1,p=1$c29tZXNhbHQ$AAAAAA" };
    pepperhash::ui::cli::ArgvBuffer buffer{ "pepperhash", args };

    ASSERT_EQ(buffer.argc(), 3);
    EXPECT_EQ(std::string_view{ buffer.argv()[0] }, "pepperhash");
    EXPECT_EQ(std::string_view{ buffer.argv()[1] }, args[0]);
    EXPECT_EQ(std::string_view{ buffer.argv()[2] }, args[1]);
}

TEST(ArgvBuffer, WipeZeroesPepperSpecs)
{
    const std::string spec{ pepperhash::test_utils::pepperSpec("1", 1U) };
    const std::vector<std::string> args{ "--pepper", spec, "hash" };
    pepperhash::ui::cli::ArgvBuffer buffer{ "pepperhash", args };

    char* pepperArg{ buffer.argv()[2] };
    ASSERT_EQ(std::string_view{ pepperArg }, spec);

    buffer.wipe();

    for (std::size_t i{}; i < spec.size(); ++i)
    {
        EXPECT_EQ(pepperArg[i], '\0') << "byte " << i;
    }
    EXPECT_EQ(std::string_view{ buffer.argv()[1] }, "");
}
