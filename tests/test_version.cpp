#include <agentmux/version.hpp>
#include <gtest/gtest.h>

TEST(VersionTest, VersionString)
{
    std::string version = agentmux::version_string();
    EXPECT_FALSE(version.empty());
    std::string expected = std::to_string(agentmux::VERSION_MAJOR) + "." +
                           std::to_string(agentmux::VERSION_MINOR) + "." +
                           std::to_string(agentmux::VERSION_PATCH);
    EXPECT_EQ(version, expected);
}

TEST(VersionTest, VersionConstants)
{
    EXPECT_GE(agentmux::VERSION_MAJOR, 0);
    EXPECT_GE(agentmux::VERSION_MINOR, 0);
    EXPECT_GE(agentmux::VERSION_PATCH, 0);
}
