#include <gtest/gtest.h>
#include <shared_test_lib.hpp>
#include <climits>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <asbridge/ext/demo.hpp>

namespace test_demo
{
class demo_suite : public asbridge_test::asbridge_test_suite
{
protected:
    void register_with_runtime(asbridge::runtime& rt) override
    {
        asbridge_test_suite::register_with_runtime(rt);
        asbridge::ext::register_demo_module(rt);
    }
};
} // namespace test_demo

using test_demo::demo_suite;

TEST(demo_native, functions)
{
    using namespace asbridge::ext;

    EXPECT_EQ(demo::add(2, 3), 5);
    EXPECT_EQ(demo::add(INT_MAX, 1), INT_MIN);
    EXPECT_EQ(demo::greet("World"), "Hello, World!");
    EXPECT_EQ(demo::get_magic_number(), 42);
    EXPECT_EQ(demo::describe_person(demo::create_person("Alice", 30)), "Alice is 30 years old");
    EXPECT_EQ(demo::double_array({1, -2, 3}), (std::vector<int>{2, -4, 6}));
    EXPECT_EQ(demo::array_length({}), 0u);
    EXPECT_EQ(demo::maybe_double(0), 0);
    EXPECT_EQ(demo::maybe_double(-1), std::nullopt);
    EXPECT_EQ(demo::greet_optional(std::nullopt), "Hello, stranger!");
    EXPECT_EQ(demo::greet_optional("Bob"), "Hello, Bob!");

    EXPECT_EQ(demo::divide(7, 2), 3);
    EXPECT_EQ(demo::divide(-7, 2), -3);
    EXPECT_THROW((void)demo::divide(1, 0), asbridge::domain_error);
    EXPECT_THROW((void)demo::divide(INT_MIN, -1), asbridge::domain_error);
}

TEST(demo_native, counter)
{
    asbridge::ext::counter c(5);
    c.increment();
    c.increment();
    c.decrement();
    c.add(10);
    EXPECT_EQ(c.value(), 16);
    c.set_value(INT_MAX);
    c.increment();
    EXPECT_EQ(c.value(), INT_MIN);
    c.reset();
    EXPECT_EQ(c.value(), 0);
}

TEST_F(demo_suite, sync_functions)
{
    run_string(
        "sync_functions",
        "assert(add(2, 3) == 5);\n"
        "assert(add(-4, 4) == 0);\n"
        "assert(greet(\"World\") == \"Hello, World!\");\n"
        "assert(get_magic_number() == 42);\n"
        "dictionary@ p = create_person(\"Alice\", 30);\n"
        "string name;\n"
        "assert(p.get(\"name\", name));\n"
        "assert(name == \"Alice\");\n"
        "assert(describe_person(p) == \"Alice is 30 years old\");\n"
        "dictionary d;\n"
        "d.set(\"name\", \"Bob\");\n"
        "d.set(\"age\", 7);\n"
        "assert(describe_person(d) == \"Bob is 7 years old\");\n"
        "array<int> doubled = double_array({1, 2, 3});\n"
        "assert(doubled.size == 3);\n"
        "assert(doubled[0] == 2 && doubled[1] == 4 && doubled[2] == 6);\n"
        "assert(double_array(array<int>()).empty());\n"
        "assert(array_length({4, 5, 6, 7}) == 4);\n"
        "assert(array_length(array<int>()) == 0);\n"
    );
}

TEST_F(demo_suite, describe_person_errors)
{
    build_module(
        "describe_person_errors",
        "string no_age()\n"
        "{\n"
        "    dictionary d;\n"
        "    d.set(\"name\", \"Carol\");\n"
        "    return describe_person(d);\n"
        "}\n"
        "string negative_age()\n"
        "{\n"
        "    dictionary d;\n"
        "    d.set(\"name\", \"Dave\");\n"
        "    d.set(\"age\", -1);\n"
        "    return describe_person(d);\n"
        "}\n"
    );

    auto no_age = get_function<std::string()>("string no_age()");
    auto no_age_result = no_age.invoke();
    ASSERT_FALSE(no_age_result.has_value());
    EXPECT_STREQ(no_age_result.error().what(), "missing field \"age\"");

    auto negative_age = get_function<std::string()>("string negative_age()");
    auto negative_age_result = negative_age.invoke();
    ASSERT_FALSE(negative_age_result.has_value());
    EXPECT_EQ(negative_age_result.error().kind(), asbridge::error_kind::host_threw);
}

TEST_F(demo_suite, callbacks)
{
    build_module(
        "callbacks",
        "array<int> g_seen;\n"
        "int square(int x) { return x * x; }\n"
        "int record(int x) { g_seen.push_back(x); return x + 1; }\n"
        "int throw_on_two(int x)\n"
        "{\n"
        "    if(x == 2) { int zero = 0; return x / zero; }\n"
        "    return x;\n"
        "}\n"
        "int call_square() { return call_with_value(square, 7); }\n"
        "int call_lambda() { return call_with_value(function(x) { return x - 1; }, 10); }\n"
        "int sum_squares() { return map_and_sum({1, 2, 3}, square); }\n"
        "int sum_recorded() { return map_and_sum({3, 1, 2}, record); }\n"
        "int sum_empty() { return map_and_sum(array<int>(), record); }\n"
        "int sum_throwing() { return map_and_sum({1, 2, 3}, throw_on_two); }\n"
        "array<int>@ seen() { return g_seen; }\n"
    );

    EXPECT_EQ(get_function<int()>("int call_square()")(), 49);
    EXPECT_EQ(get_function<int()>("int call_lambda()")(), 9);
    EXPECT_EQ(get_function<int()>("int sum_squares()")(), 14);

    // Elements are visited in order
    EXPECT_EQ(get_function<int()>("int sum_recorded()")(), 9);
    auto seen = get_function<std::vector<int>()>("array<int>@ seen()");
    EXPECT_EQ(seen(), (std::vector<int>{3, 1, 2}));

    EXPECT_EQ(get_function<int()>("int sum_empty()")(), 0);
    EXPECT_EQ(seen().size(), 3);

    auto sum_throwing = get_function<int()>("int sum_throwing()");
    auto result = sum_throwing.invoke();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), asbridge::error_kind::host_threw);
}

TEST_F(demo_suite, counter)
{
    run_string(
        "counter",
        "Counter c(5);\n"
        "c.increment();\n"
        "c.increment();\n"
        "c.decrement();\n"
        "assert(c.value == 6);\n"
        "c.add(10);\n"
        "assert(c.value == 16);\n"
        "c.value = 100;\n"
        "assert(c.value == 100);\n"
        "c.reset();\n"
        "assert(c.value == 0);\n"
        "Counter d;\n"
        "assert(d.value == 0);\n"
        "d.decrement();\n"
        "assert(d.value == -1);\n"
        "Counter@ alias = c;\n"
        "alias.add(3);\n"
        "assert(c.value == 3);\n"
        "c.value = 2147483647;\n"
        "c.increment();\n"
        "assert(c.value == -2147483648);\n"
    );

    EXPECT_TRUE(get_runtime().arena<asbridge::ext::counter>().empty());
}

TEST_F(demo_suite, counter_after_clear)
{
    build_module(
        "counter_after_clear",
        "Counter@ g_counter;\n"
        "void make() { @g_counter = Counter(3); }\n"
        "void bump() { g_counter.increment(); }\n"
        "int read() { return g_counter.value; }\n"
    );

    get_function<void()>("void make()")();
    get_function<void()>("void bump()")();
    auto read = get_function<int()>("int read()");
    EXPECT_EQ(read(), 4);
    EXPECT_EQ(get_runtime().arena<asbridge::ext::counter>().size(), 1);

    get_runtime().arena<asbridge::ext::counter>().clear();

    auto result = read.invoke();
    ASSERT_FALSE(result.has_value());
    EXPECT_STREQ(result.error().what(), "invalid handle");

    auto bump_result = get_function<void()>("void bump()").invoke();
    ASSERT_FALSE(bump_result.has_value());
    EXPECT_STREQ(bump_result.error().what(), "invalid handle");
}

TEST_F(demo_suite, divide)
{
    build_module(
        "divide",
        "int call_divide(int a, int b) { return divide(a, b); }\n"
    );

    auto call_divide = get_function<int(int, int)>("int call_divide(int, int)");
    EXPECT_EQ(call_divide(10, 2), 5);
    EXPECT_EQ(call_divide(-9, 4), -2);

    auto by_zero = call_divide.invoke(10, 0);
    ASSERT_FALSE(by_zero.has_value());
    EXPECT_EQ(by_zero.error().kind(), asbridge::error_kind::host_threw);
    EXPECT_STREQ(by_zero.error().what(), "Division by zero");

    auto overflow = call_divide.invoke(INT_MIN, -1);
    ASSERT_FALSE(overflow.has_value());
    EXPECT_STREQ(overflow.error().what(), "Division overflow");
}

TEST_F(demo_suite, optionals)
{
    run_string(
        "optionals",
        "optional<int> d = maybe_double(21);\n"
        "assert(d.has_value);\n"
        "assert(d.value == 42);\n"
        "assert(maybe_double(0).value == 0);\n"
        "assert(!maybe_double(-5).has_value);\n"
        "assert(greet_optional() == \"Hello, stranger!\");\n"
        "assert(greet_optional(\"Eve\") == \"Hello, Eve!\");\n"
        "optional<string> none;\n"
        "assert(greet_optional(none) == \"Hello, stranger!\");\n"
        "optional<string> some(\"Frank\");\n"
        "assert(greet_optional(some) == \"Hello, Frank!\");\n"
    );
}

TEST_F(demo_suite, async_functions)
{
    run_string(
        "async_functions",
        "promise<int>@ a = async_add(20, 22);\n"
        "a.wait();\n"
        "assert(a.is_resolved);\n"
        "assert(a.value == 42);\n"
        "promise<int>@ d = delayed_value(7, 10);\n"
        "assert(d.is_pending);\n"
        "d.wait();\n"
        "assert(d.value == 7);\n"
        "promise<int>@ s = async_sum({1, 2, 3, 4});\n"
        "s.wait();\n"
        "assert(s.value == 10);\n"
        "promise<int>@ e = async_sum(array<int>());\n"
        "e.wait();\n"
        "assert(e.value == 0);\n"
        "promise<int>@ z = delayed_value(3, 0);\n"
        "z.wait();\n"
        "assert(z.value == 3);\n"
    );
}

TEST_F(demo_suite, async_divide_matches_divide)
{
    build_module(
        "async_divide",
        "int sync_divide(int a, int b) { return divide(a, b); }\n"
        "string async_outcome(int a, int b)\n"
        "{\n"
        "    promise<int>@ p = async_divide(a, b);\n"
        "    p.wait();\n"
        "    if(p.is_resolved)\n"
        "        return \"ok \" + p.value;\n"
        "    return \"error \" + p.reason;\n"
        "}\n"
    );

    auto sync_divide = get_function<int(int, int)>("int sync_divide(int, int)");
    auto async_outcome = get_function<std::string(int, int)>("string async_outcome(int, int)");

    const std::vector<std::pair<int, int>> inputs{
        {10, 2}, {7, -2}, {1, 0}, {0, 0}, {INT_MIN, -1}
    };
    for(auto [a, b] : inputs)
    {
        auto sync_result = sync_divide.invoke(a, b);
        std::string expected = sync_result.has_value() ?
                                   asbridge::string_concat("ok ", std::to_string(sync_result.value())) :
                                   asbridge::string_concat("error ", sync_result.error().what());

        auto async_result = async_outcome.invoke(a, b);
        ASSERT_TRUE(asbridge_test::result_has_value(async_result));
        EXPECT_EQ(async_result.value(), expected) << a << " / " << b;
    }

    EXPECT_EQ(async_outcome(10, 2), "ok 5");
    EXPECT_EQ(async_outcome(1, 0), "error Division by zero");
}

TEST_F(demo_suite, async_then)
{
    build_module(
        "async_then",
        "array<int> g_values;\n"
        "array<string> g_errors;\n"
        "void start()\n"
        "{\n"
        "    async_add(1, 2).then(function(v) { g_values.push_back(v); });\n"
        "    async_divide(1, 0).then(\n"
        "        function(v) { g_values.push_back(v); },\n"
        "        function(msg) { g_errors.push_back(msg); }\n"
        "    );\n"
        "}\n"
        "array<int>@ values() { return g_values; }\n"
        "array<string>@ errors() { return g_errors; }\n"
    );

    get_function<void()>("void start()")();
    get_runtime().run();

    EXPECT_EQ(get_function<std::vector<int>()>("array<int>@ values()")(), (std::vector<int>{3}));
    EXPECT_EQ(
        get_function<std::vector<std::string>()>("array<string>@ errors()")(),
        (std::vector<std::string>{"Division by zero"})
    );
}
