#include <gtest/gtest.h>
#include <xpipe/configuration.hpp>

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

using xpipe::Configuration;

TEST(ConfigurationTest, Defaults) {
    Configuration config({"ls"}, YAML::Node());
    EXPECT_EQ(config.command(), "ls");
    EXPECT_TRUE(config.command_args().empty());
    EXPECT_EQ(config.base_url(), "http://127.0.0.1:21721");
    EXPECT_FALSE(config.token().has_value());
    EXPECT_FALSE(config.ptb());
    EXPECT_TRUE(config.verify());
    EXPECT_EQ(config.log_level(), boost::log::trivial::info);
    EXPECT_EQ(config.chunk_size(), 1024u);
}

TEST(ConfigurationTest, PtbSelectsOtherPort) {
    Configuration config({"--ptb", "ls"}, YAML::Node());
    EXPECT_TRUE(config.ptb());
    EXPECT_EQ(config.base_url(), "http://127.0.0.1:21722");
}

TEST(ConfigurationTest, CommandArgumentsKeepTheirOptions) {
    Configuration config({"--token", "abc", "exec", "work", "uname -a", "--raw"}, YAML::Node());
    EXPECT_EQ(config.command(), "exec");
    const std::vector<std::string> expected = {"work", "uname -a", "--raw"};
    EXPECT_EQ(config.command_args(), expected);
    EXPECT_EQ(config.token(), "abc");
}

TEST(ConfigurationTest, FileValues) {
    const YAML::Node file = YAML::Load(
        "server:\n"
        "  url: https://xpipe.example.com:8443\n"
        "  token: from-file\n"
        "  verify: false\n"
        "misc:\n"
        "  level: debug\n"
        "transfer:\n"
        "  chunk_size: 65536\n");
    Configuration config({"ls"}, file);
    EXPECT_EQ(config.base_url(), "https://xpipe.example.com:8443");
    EXPECT_EQ(config.token(), "from-file");
    EXPECT_FALSE(config.verify());
    EXPECT_EQ(config.log_level(), boost::log::trivial::debug);
    EXPECT_EQ(config.chunk_size(), 65536u);
}

TEST(ConfigurationTest, CommandLineOverridesFile) {
    const YAML::Node file = YAML::Load(
        "server:\n"
        "  url: http://file-host:1\n"
        "  token: from-file\n"
        "misc:\n"
        "  level: debug\n");
    Configuration config({"--base-url=http://cli-host:2", "--token", "from-cli", "--log-level", "warning", "ls"}, file);
    EXPECT_EQ(config.base_url(), "http://cli-host:2");
    EXPECT_EQ(config.token(), "from-cli");
    EXPECT_EQ(config.log_level(), boost::log::trivial::warning);
}

TEST(ConfigurationTest, PtbFromFile) {
    Configuration config({}, YAML::Load("server:\n  ptb: true\n"));
    EXPECT_TRUE(config.ptb());
    EXPECT_EQ(config.base_url(), "http://127.0.0.1:21722");
    EXPECT_TRUE(config.command().empty());
}

TEST(ConfigurationTest, InsecureDisablesVerification) {
    Configuration config({"--insecure", "ls"}, YAML::Node());
    EXPECT_FALSE(config.verify());
}

TEST(ConfigurationTest, HelpFlag) {
    Configuration config({"--help"}, YAML::Node());
    EXPECT_TRUE(config.help());
}

TEST(ConfigurationTest, UnknownOptionIsUsageError) {
    EXPECT_THROW(Configuration({"--verbose", "ls"}, YAML::Node()), xpipe::UsageError);
}

TEST(ConfigurationTest, MissingOptionValueIsUsageError) {
    EXPECT_THROW(Configuration({"--base-url"}, YAML::Node()), xpipe::UsageError);
}

TEST(ConfigurationTest, InvalidLogLevelRejected) {
    EXPECT_THROW(Configuration({"--log-level", "loud", "ls"}, YAML::Node()), std::invalid_argument);
}

TEST(ConfigurationTest, ZeroChunkSizeRejected) {
    Configuration config({"ls"}, YAML::Load("transfer:\n  chunk_size: 0\n"));
    EXPECT_THROW(config.chunk_size(), std::invalid_argument);
}

TEST(ConfigurationTest, ParamFallsBackOnMissingKeys) {
    Configuration config({"ls"}, YAML::Load("server: just-a-string\n"));
    EXPECT_EQ(config.param<std::string>({"server", "url"}, "fallback"), "fallback");
    EXPECT_EQ(config.param<int>({"nothing", "here"}, 7), 7);
}
