// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <system_error>

TEST(ExceptionTest, RuntimeError)
{
    ASSERT_EQ(GetFullMessage(std::make_exception_ptr(std::runtime_error("Foo"))), "Foo");
}

TEST(ExceptionTest, DerivedError)
{
    class DerivedError : public std::runtime_error {
    public:
        explicit DerivedError(const char *_msg)
            :std::runtime_error(_msg) {}
    };

    ASSERT_EQ(GetFullMessage(std::make_exception_ptr(DerivedError("Foo"))), "Foo");
}

static std::exception_ptr
MakeNested()
{
    try {
        try {
            throw std::invalid_argument("Inner");
        } catch (...) {
            std::throw_with_nested(std::runtime_error("Outer"));
        }
    } catch (...) {
        return std::current_exception();
    }
}

TEST(ExceptionTest, Nested)
{
    const auto ep = MakeNested();
    ASSERT_EQ(GetFullMessage(ep), "Outer; Inner");
    ASSERT_EQ(GetFullMessage(ep, "Unknown", " -> "), "Outer -> Inner");
}

TEST(ExceptionTest, FindNested)
{
    const auto ep = MakeNested();

    const auto *inner = FindNested<std::invalid_argument>(ep);
    ASSERT_NE(inner, nullptr);
    ASSERT_STREQ(inner->what(), "Inner");

    const auto *outer = FindNested<std::runtime_error>(ep);
    ASSERT_NE(outer, nullptr);
    ASSERT_STREQ(outer->what(), "Outer");

    ASSERT_EQ(FindNested<std::system_error>(ep), nullptr);
}

TEST(ExceptionTest, NonStandard)
{
    ASSERT_EQ(GetFullMessage(std::make_exception_ptr("Foo")), "Foo");
    ASSERT_EQ(GetFullMessage(std::make_exception_ptr(42)), "Unknown exception");
    ASSERT_EQ(GetFullMessage(std::make_exception_ptr(42), "Bar"), "Bar");
}
