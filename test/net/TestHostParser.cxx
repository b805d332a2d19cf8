// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "net/HostParser.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(HostParserTest, Name)
{
    const auto input = "foo";
    const auto eh = ExtractHost(input);
    ASSERT_EQ(eh.host.data(), input);
    ASSERT_EQ(eh.host.size(), 3u);
    ASSERT_EQ(eh.end, input + 3);
}

TEST(HostParserTest, NamePort)
{
    const auto input = "foo:80";
    const auto eh = ExtractHost(input);
    ASSERT_EQ(eh.host.data(), input);
    ASSERT_EQ(eh.host.size(), 3u);
    ASSERT_EQ(eh.end, input + 3);
}

TEST(HostParserTest, IPv4)
{
    const auto input = "1.2.3.4";
    const auto eh = ExtractHost(input);
    ASSERT_EQ(eh.host.data(), input);
    ASSERT_EQ(eh.host.size(), 7u);
    ASSERT_EQ(eh.end, input + 7);
}

TEST(HostParserTest, IPv6Wildcard)
{
    const auto input = "::";
    const auto eh = ExtractHost(input);
    ASSERT_EQ(eh.host.data(), input);
    ASSERT_EQ(eh.host.size(), 2u);
    ASSERT_EQ(eh.end, input + 2);
}

TEST(HostParserTest, IPv6Local)
{
    const auto input = "::1";
    const auto eh = ExtractHost(input);
    ASSERT_EQ(eh.host.data(), input);
    ASSERT_EQ(eh.host.size(), 3u);
    ASSERT_EQ(eh.end, input + 3);
}

TEST(HostParserTest, IPv6Static)
{
    const auto input = "2001:affe::";
    const auto eh = ExtractHost(input);
    ASSERT_EQ(eh.host.data(), input);
    ASSERT_EQ(eh.host.size(), 11u);
    ASSERT_EQ(eh.end, input + 11);
}

TEST(HostParserTest, IPv6StaticPort)
{
    const auto input = "[2001:affe::]:80";
    const auto eh = ExtractHost(input);
    ASSERT_EQ(eh.host.data(), input + 1);
    ASSERT_EQ(eh.host.size(), 11u);
    ASSERT_EQ(eh.end, input + 13);
}

TEST(HostParserTest, Garbage)
{
    const auto input = " foo";
    const auto eh = ExtractHost(input);
    ASSERT_TRUE(eh.HasFailed());
    ASSERT_EQ(eh.end, input);

    ASSERT_TRUE(ExtractHost("").HasFailed());
    ASSERT_TRUE(ExtractHost("[]:80").HasFailed());
    ASSERT_TRUE(ExtractHost("[::1").HasFailed());
}

TEST(HostParserTest, HostAndPort)
{
    auto hp = ParseHostAndPort("localhost:8888");
    ASSERT_EQ(hp.host, "localhost");
    ASSERT_EQ(hp.port, 8888u);
    ASSERT_FALSE(hp.ipv6);

    hp = ParseHostAndPort("192.168.1.1");
    ASSERT_EQ(hp.host, "192.168.1.1");
    ASSERT_EQ(hp.port, 0u);
    ASSERT_FALSE(hp.ipv6);

    hp = ParseHostAndPort("[::1]:65535");
    ASSERT_EQ(hp.host, "::1");
    ASSERT_EQ(hp.port, 65535u);
    ASSERT_TRUE(hp.ipv6);

    hp = ParseHostAndPort("2001:affe::1");
    ASSERT_EQ(hp.host, "2001:affe::1");
    ASSERT_EQ(hp.port, 0u);
    ASSERT_TRUE(hp.ipv6);

    hp = ParseHostAndPort("my_host.example.com:1");
    ASSERT_EQ(hp.host, "my_host.example.com");
    ASSERT_EQ(hp.port, 1u);
}

TEST(HostParserTest, HostAndPortMalformed)
{
    ASSERT_THROW(ParseHostAndPort(""), std::invalid_argument);
    ASSERT_THROW(ParseHostAndPort("foo bar"), std::invalid_argument);
    ASSERT_THROW(ParseHostAndPort("foo/"), std::invalid_argument);
    ASSERT_THROW(ParseHostAndPort("foo:"), std::invalid_argument);
    ASSERT_THROW(ParseHostAndPort("foo:8x"), std::invalid_argument);
    ASSERT_THROW(ParseHostAndPort("foo:0"), std::invalid_argument);
    ASSERT_THROW(ParseHostAndPort("foo:65536"), std::invalid_argument);
    ASSERT_THROW(ParseHostAndPort("foo:99999999999"), std::invalid_argument);
    ASSERT_THROW(ParseHostAndPort("[::1]x"), std::invalid_argument);
}
