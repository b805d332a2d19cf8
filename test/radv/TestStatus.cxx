// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "radv/Status.hxx"
#include "radv/Error.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <string_view>

using std::string_view_literals::operator""sv;
using namespace RadvControl;

TEST(StatusTest, State)
{
    EXPECT_STREQ(ToString(InterfaceState::INIT), "Init");
    EXPECT_STREQ(ToString(InterfaceState::RUNNING), "Running");

    EXPECT_EQ(ParseInterfaceState("Init"), InterfaceState::INIT);
    EXPECT_EQ(ParseInterfaceState("Running"), InterfaceState::RUNNING);
    EXPECT_FALSE(ParseInterfaceState("running"));
    EXPECT_FALSE(ParseInterfaceState("Stopped"));
    EXPECT_FALSE(ParseInterfaceState(""));
}

TEST(StatusTest, Decode)
{
    const auto status = DecodeStatus(R"({"interfaces":[)"
                                     R"({"name":"eth1","state":"Running"},)"
                                     R"({"name":"eth0","state":"Init"}]})");

    /* the order is preserved */
    const Status expected{{
        {"eth1", InterfaceState::RUNNING},
        {"eth0", InterfaceState::INIT},
    }};

    EXPECT_EQ(status, expected);
}

TEST(StatusTest, DecodeEmpty)
{
    EXPECT_TRUE(DecodeStatus(R"({"interfaces":[]})").interfaces.empty());
    EXPECT_TRUE(DecodeStatus(R"({"interfaces":null})").interfaces.empty());
    EXPECT_TRUE(DecodeStatus("{}").interfaces.empty());
}

TEST(StatusTest, DecodeUnknownState)
{
    try {
        DecodeStatus(R"({"interfaces":[{"name":"eth0","state":"Running"},{"name":"eth1","state":"Stopped"}]})");
        FAIL();
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.GetKind(), ControlErrorKind::DECODE);

        const auto msg = GetFullMessage(std::current_exception());
        EXPECT_NE(msg.find("Stopped"sv), msg.npos);
        EXPECT_NE(msg.find("eth1"sv), msg.npos);
    }
}

TEST(StatusTest, DecodeMalformed)
{
    EXPECT_THROW(DecodeStatus(""), DecodeError);
    EXPECT_THROW(DecodeStatus("<html>"), DecodeError);
    EXPECT_THROW(DecodeStatus("[]"), DecodeError);
    EXPECT_THROW(DecodeStatus(R"({"interfaces":"eth0"})"), DecodeError);

    /* trailing data after the JSON value */
    EXPECT_THROW(DecodeStatus(R"({"interfaces":[]} garbage)"), DecodeError);
    EXPECT_THROW(DecodeStatus(R"({"interfaces":[]}{"interfaces":[]})"), DecodeError);

    /* missing or empty name */
    EXPECT_THROW(DecodeStatus(R"({"interfaces":[{"state":"Init"}]})"), DecodeError);
    EXPECT_THROW(DecodeStatus(R"({"interfaces":[{"name":"","state":"Init"}]})"), DecodeError);

    /* missing or non-string state */
    EXPECT_THROW(DecodeStatus(R"({"interfaces":[{"name":"eth0"}]})"), DecodeError);
    EXPECT_THROW(DecodeStatus(R"({"interfaces":[{"name":"eth0","state":1}]})"), DecodeError);
}

TEST(StatusTest, Encode)
{
    const Status status{{{"eth0", InterfaceState::RUNNING}}};
    EXPECT_EQ(EncodeStatus(status),
              R"({"interfaces":[{"name":"eth0","state":"Running"}]})");
    EXPECT_EQ(DecodeStatus(EncodeStatus(status)), status);
}
