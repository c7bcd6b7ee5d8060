/**
 * @file test_named_value.cpp
 * @brief Unit tests for NamedValue (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "pyson/Errors.hpp"
#include "pyson/NamedValue.hpp"

using namespace pyson;

TEST(NamedValue, Construct) {
    NamedValue nv("answer", 42);
    EXPECT_EQ(nv.name(), "answer");
    EXPECT_EQ(nv.value(), Value(42));
    EXPECT_EQ(nv.type(), Type(Type::Kind::Int));
}

TEST(NamedValue, EmptyNameThrows) {
    EXPECT_THROW(NamedValue("", 1), InvalidArgument);
}

TEST(NamedValue, ChangeName) {
    NamedValue nv("a", "x");
    nv.change_name("b");
    EXPECT_EQ(nv.name(), "b");
    EXPECT_EQ(nv.value(), Value("x"));
}

TEST(NamedValue, SwapNameReturnsPrevious) {
    NamedValue nv("old", 1);
    std::string prev = nv.swap_name("new");
    EXPECT_EQ(prev, "old");
    EXPECT_EQ(nv.name(), "new");
}

TEST(NamedValue, RenameToEmptyThrowsAndKeepsName) {
    NamedValue nv("keep", 1);
    EXPECT_THROW(nv.change_name(""), InvalidArgument);
    EXPECT_THROW(nv.swap_name(""), InvalidArgument);
    EXPECT_EQ(nv.name(), "keep");
}

TEST(NamedValue, ChangeValueReplacesWholesale) {
    NamedValue nv("v", 1);
    nv.change_value(Value::List{"a", "b"});
    EXPECT_TRUE(nv.value().is_list());
    EXPECT_EQ(nv.type().to_string(), "list");
}

TEST(NamedValue, SwapValueReturnsPrevious) {
    NamedValue nv("v", 2.5);
    Value prev = nv.swap_value("text");
    EXPECT_EQ(prev, Value(2.5));
    EXPECT_EQ(nv.value(), Value("text"));
}

TEST(NamedValue, ToTupleCopies) {
    NamedValue nv("n", 7);
    auto [name, value] = nv.to_tuple();
    EXPECT_EQ(name, "n");
    EXPECT_EQ(value, Value(7));

    nv.change_value(8);
    EXPECT_EQ(value, Value(7));
}

TEST(NamedValue, EncodeLine) {
    EXPECT_EQ(NamedValue("a", 42).encode(), "a:int:42");
    EXPECT_EQ(NamedValue("pi", 3.5).encode(), "pi:float:3.5");
    EXPECT_EQ(NamedValue("s", "hello world").encode(), "s:str:hello world");
    EXPECT_EQ(NamedValue("u", "http://h:80/p").encode(), "u:str:http://h:80/p");
    EXPECT_EQ(NamedValue("l", Value::List{"x", "y", "z"}).encode(), "l:list:x(*)y(*)z");
}

TEST(NamedValue, Equality) {
    EXPECT_EQ(NamedValue("a", 1), NamedValue("a", 1));
    EXPECT_NE(NamedValue("a", 1), NamedValue("b", 1));
    EXPECT_NE(NamedValue("a", 1), NamedValue("a", "1"));
}
