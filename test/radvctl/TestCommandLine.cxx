// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "radvctl/CommandLine.hxx"

#include <gtest/gtest.h>

#include <initializer_list>

using namespace std::chrono_literals;

static CommandLine
Parse(std::initializer_list<const char *> args)
{
    return ParseCommandLine({args.begin(), args.size()});
}

TEST(CommandLineTest, Status)
{
    const auto cmdline = Parse({"status"});
    ASSERT_EQ(cmdline.command, Command::STATUS);
    ASSERT_EQ(cmdline.config_path.native(), DEFAULT_CONFIG_PATH);
    ASSERT_FALSE(cmdline.explicit_config);
    ASSERT_FALSE(cmdline.host);
    ASSERT_FALSE(cmdline.timeout);
    ASSERT_EQ(cmdline.verbose, 0u);
    ASSERT_FALSE(cmdline.json);
    ASSERT_FALSE(cmdline.help);
}

TEST(CommandLineTest, Reload)
{
    auto cmdline = Parse({"reload", "/tmp/config.json"});
    ASSERT_EQ(cmdline.command, Command::RELOAD);
    ASSERT_EQ(cmdline.reload_path, "/tmp/config.json");

    cmdline = Parse({"reload", "-"});
    ASSERT_EQ(cmdline.command, Command::RELOAD);
    ASSERT_EQ(cmdline.reload_path, "-");
}

TEST(CommandLineTest, Options)
{
    const auto cmdline = Parse({"-v", "--verbose", "--json",
                                "--config=/tmp/radvctl.conf",
                                "--host=[::1]:9999",
                                "--timeout=1500",
                                "status"});
    ASSERT_EQ(cmdline.command, Command::STATUS);
    ASSERT_EQ(cmdline.verbose, 2u);
    ASSERT_TRUE(cmdline.json);
    ASSERT_EQ(cmdline.config_path.native(), "/tmp/radvctl.conf");
    ASSERT_TRUE(cmdline.explicit_config);
    ASSERT_EQ(cmdline.host, "[::1]:9999");
    ASSERT_EQ(cmdline.timeout, 1500ms);
}

TEST(CommandLineTest, Help)
{
    ASSERT_TRUE(Parse({"-h"}).help);
    ASSERT_TRUE(Parse({"--help"}).help);
    ASSERT_TRUE(Parse({"--help", "bogus"}).help);
}

TEST(CommandLineTest, Malformed)
{
    ASSERT_THROW(Parse({}), UsageError);
    ASSERT_THROW(Parse({"-v"}), UsageError);
    ASSERT_THROW(Parse({"bogus"}), UsageError);
    ASSERT_THROW(Parse({"reload"}), UsageError);
    ASSERT_THROW(Parse({"reload", "a", "b"}), UsageError);
    ASSERT_THROW(Parse({"status", "extra"}), UsageError);
    ASSERT_THROW(Parse({"--bogus", "status"}), UsageError);
    ASSERT_THROW(Parse({"--host=", "status"}), UsageError);
    ASSERT_THROW(Parse({"--config=", "status"}), UsageError);
    ASSERT_THROW(Parse({"--timeout=", "status"}), UsageError);
    ASSERT_THROW(Parse({"--timeout=1s", "status"}), UsageError);
    ASSERT_THROW(Parse({"--timeout=99999999999", "status"}), UsageError);
    ASSERT_THROW(Parse({"--hostname=x", "status"}), UsageError);
}
