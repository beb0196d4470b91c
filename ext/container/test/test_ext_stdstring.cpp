#include <gtest/gtest.h>
#include <shared_test_lib.hpp>
#include <asbridge/ext/stdstring.hpp>

using namespace asbridge_test;

TEST(utf8, validate)
{
    using asbridge::ext::utf8::u8_validate;

    EXPECT_TRUE(u8_validate(""));
    EXPECT_TRUE(u8_validate("hello"));
    EXPECT_TRUE(u8_validate("\xC3\xA9t\xC3\xA9"));
    EXPECT_TRUE(u8_validate("\xF0\x9F\x98\x80"));

    // Lone continuation byte
    EXPECT_FALSE(u8_validate("\x80"));
    // Truncated sequence
    EXPECT_FALSE(u8_validate("\xE4\xB8"));
    // Overlong encoding of '/'
    EXPECT_FALSE(u8_validate("\xC0\xAF"));
    // Surrogate half
    EXPECT_FALSE(u8_validate("\xED\xA0\x80"));
    // Beyond U+10FFFF
    EXPECT_FALSE(u8_validate("\xF4\x90\x80\x80"));
}

TEST(utf8, length_and_substr)
{
    using namespace std::literals;
    using namespace asbridge::ext::utf8;

    constexpr std::string_view str = "\xE4\xBD\xA0\xE5\xA5\xBD, world";
    static_assert(u8_strlen(str) == 9);

    EXPECT_EQ(u8_substr(str, 0, 2), "\xE4\xBD\xA0\xE5\xA5\xBD"sv);
    EXPECT_EQ(u8_substr(str, 4), "world"sv);
    EXPECT_EQ(u8_substr(str, 20), ""sv);
}

class ext_string_suite : public asbridge_test_suite
{};

TEST_F(ext_string_suite, script_methods)
{
    run_string(
        "script_methods",
        "string s = \"hello\";\n"
        "assert(s.length == 5);\n"
        "assert(!s.empty());\n"
        "assert(s + \" world\" == \"hello world\");\n"
        "s += \"!\";\n"
        "assert(s == \"hello!\");\n"
        "assert(s.starts_with(\"he\"));\n"
        "assert(s.ends_with(\"!\"));\n"
        "assert(s.contains(\"ll\"));\n"
        "assert(s.substr(1, 3) == \"ell\");\n"
        "assert(\"a\" < \"b\");\n"
        "assert(\"n = \" + 42 == \"n = 42\");\n"
        "assert(1 + \"st\" == \"1st\");\n"
        "assert(to_string(true) == \"true\");\n"
        "assert(to_string(-7) == \"-7\");\n"
        "string e;\n"
        "assert(e.empty());\n"
    );
}

TEST_F(ext_string_suite, unicode_length)
{
    run_string(
        "unicode_length",
        "string s = \"\xC3\xA9t\xC3\xA9\";\n"
        "assert(s.length == 3);\n"
        "assert(s.size_bytes == 5);\n"
        "assert(s.substr(1) == \"t\xC3\xA9\");\n"
    );
}

TEST_F(ext_string_suite, exchange_with_native)
{
    build_module(
        "exchange_with_native",
        "string shout(const string&in s) { return s + \"!\"; }\n"
    );

    auto shout = get_function<std::string(std::string)>("string shout(const string&in)");
    EXPECT_EQ(shout("hey"), "hey!");

    auto result = shout.invoke(std::string("\xFF"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), asbridge::error_kind::invalid_encoding);
}
