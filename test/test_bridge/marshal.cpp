#include <gtest/gtest.h>
#include <shared_test_lib.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include <asbridge/ext/stdstring.hpp>
#include <asbridge/ext/array.hpp>
#include <asbridge/ext/dictionary.hpp>

namespace test_marshal
{
struct point
{
    std::string label;
    std::int32_t x = 0;
    std::int32_t y = 0;
};
} // namespace test_marshal

template <>
struct asbridge::record_traits<test_marshal::point>
{
    static constexpr std::tuple fields{
        record_field{"label", &test_marshal::point::label},
        record_field{"x", &test_marshal::point::x},
        record_field{"y", &test_marshal::point::y}
    };
};

namespace test_marshal
{
static std::string describe_point(const point& p)
{
    return asbridge::string_concat(p.label, '(', std::to_string(p.x), ", ", std::to_string(p.y), ')');
}

static point make_point(const std::string& label, int x, int y)
{
    return point{label, x, y};
}

static std::string describe_any(asbridge::runtime& rt, asbridge::host_ref ref)
{
    return describe_point(asbridge::to_native<point>(rt.get_engine(), ref));
}

class marshal_suite : public asbridge_test::asbridge_test_suite
{
protected:
    void register_all() override
    {
        asbridge_test_suite::register_all();

        asbridge::global(get_engine())
            .function("string describe_point(const dictionary@ p)", asbridge::fp<&describe_point>)
            .function("dictionary@ make_point(const string&in label, int x, int y)", asbridge::fp<&make_point>)
            .function("string describe_any(const ?&in p)", asbridge::fp<&describe_any>);
    }
};

template <typename T, typename Source>
asbridge::marshal_error expect_marshal_error(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, const Source& src)
{
    asbridge::host_value val = asbridge::to_host(engine, src);
    try
    {
        (void)asbridge::to_native<T>(engine, val.ref());
    }
    catch(const asbridge::marshal_error& e)
    {
        return e;
    }

    ADD_FAILURE() << "no marshal_error thrown";
    return asbridge::marshal_error(asbridge::error_kind::generic, "no error");
}
} // namespace test_marshal

using test_marshal::marshal_suite;

TEST_F(marshal_suite, integer_range)
{
    using namespace asbridge;
    auto* engine = get_engine();

    EXPECT_EQ(to_native<std::int8_t>(engine, to_host(engine, 127).ref()), 127);
    EXPECT_EQ(to_native<std::uint32_t>(engine, to_host(engine, std::int64_t(4'000'000'000)).ref()), 4'000'000'000u);
    EXPECT_EQ(to_native<std::int64_t>(engine, to_host(engine, std::uint8_t(255)).ref()), 255);

    {
        marshal_error e = test_marshal::expect_marshal_error<std::int8_t>(engine, 300);
        EXPECT_EQ(e.kind(), error_kind::type_mismatch);
        EXPECT_STREQ(e.what(), "integer 300 out of range of int8");
    }

    {
        marshal_error e = test_marshal::expect_marshal_error<std::uint32_t>(engine, -1);
        EXPECT_EQ(e.kind(), error_kind::type_mismatch);
    }

    {
        marshal_error e = test_marshal::expect_marshal_error<int>(
            engine, std::numeric_limits<std::int64_t>::max()
        );
        EXPECT_EQ(e.kind(), error_kind::type_mismatch);
    }
}

TEST_F(marshal_suite, bool_is_strict)
{
    using namespace asbridge;
    auto* engine = get_engine();

    EXPECT_TRUE(to_native<bool>(engine, to_host(engine, true).ref()));

    EXPECT_STREQ(
        test_marshal::expect_marshal_error<bool>(engine, 1).what(),
        "type mismatch: expected bool, got int"
    );
    EXPECT_STREQ(
        test_marshal::expect_marshal_error<int>(engine, false).what(),
        "type mismatch: expected int, got bool"
    );
}

TEST_F(marshal_suite, floating_point)
{
    using namespace asbridge;
    auto* engine = get_engine();

    EXPECT_DOUBLE_EQ(to_native<double>(engine, to_host(engine, 1.5f).ref()), 1.5);
    EXPECT_FLOAT_EQ(to_native<float>(engine, to_host(engine, 0.25).ref()), 0.25f);

    marshal_error e = test_marshal::expect_marshal_error<double>(engine, 2);
    EXPECT_EQ(e.kind(), error_kind::type_mismatch);

    e = test_marshal::expect_marshal_error<float>(engine, 1e300);
    EXPECT_EQ(e.kind(), error_kind::type_mismatch);
    EXPECT_TRUE(std::isinf(to_native<float>(engine, to_host(engine, std::numeric_limits<double>::infinity()).ref())));
}

TEST_F(marshal_suite, string_encoding)
{
    using namespace asbridge;
    auto* engine = get_engine();

    const std::string text = "h\xC3\xA9llo \xE4\xB8\x96\xE7\x95\x8C";
    host_value val = to_host(engine, text);
    EXPECT_EQ(val.type_id(), get_script_string_type(engine));
    EXPECT_EQ(to_native<std::string>(engine, val.ref()), text);

    // Truncated multi-byte sequence
    const std::string bad = "abc\xE4\xB8";
    try
    {
        (void)to_host(engine, bad);
        ADD_FAILURE() << "invalid UTF-8 accepted";
    }
    catch(const marshal_error& e)
    {
        EXPECT_EQ(e.kind(), error_kind::invalid_encoding);
    }

    marshal_error e = test_marshal::expect_marshal_error<std::string>(engine, 42);
    EXPECT_EQ(e.kind(), error_kind::type_mismatch);
}

TEST_F(marshal_suite, sequence_element_index)
{
    using namespace asbridge;
    auto* engine = get_engine();

    {
        host_value val = to_host(engine, std::vector<int>{1, 2, 3});
        EXPECT_EQ(to_native<std::vector<int>>(engine, val.ref()), (std::vector<int>{1, 2, 3}));
        EXPECT_EQ(to_native<std::vector<std::int64_t>>(engine, val.ref()), (std::vector<std::int64_t>{1, 2, 3}));
    }

    {
        marshal_error e = test_marshal::expect_marshal_error<std::vector<std::int8_t>>(
            engine, std::vector<int>{1, 2, 1000}
        );
        EXPECT_EQ(e.kind(), error_kind::type_mismatch);
        ASSERT_TRUE(e.index().has_value());
        EXPECT_EQ(*e.index(), 2);
    }

    {
        marshal_error e = test_marshal::expect_marshal_error<std::vector<int>>(
            engine, std::vector<std::string>{"a", "b"}
        );
        EXPECT_EQ(e.kind(), error_kind::type_mismatch);
        ASSERT_TRUE(e.index().has_value());
        EXPECT_EQ(*e.index(), 0);
    }

    {
        marshal_error e = test_marshal::expect_marshal_error<std::vector<int>>(engine, 1);
        EXPECT_EQ(e.kind(), error_kind::type_mismatch);
        EXPECT_FALSE(e.index().has_value());
    }
}

TEST_F(marshal_suite, record_from_native)
{
    using namespace asbridge;
    auto* engine = get_engine();

    host_value val = to_host(engine, test_marshal::point{"origin", 0, -1});
    test_marshal::point p = to_native<test_marshal::point>(engine, val.ref());
    EXPECT_EQ(p.label, "origin");
    EXPECT_EQ(p.x, 0);
    EXPECT_EQ(p.y, -1);
}

TEST_F(marshal_suite, record_missing_field)
{
    using namespace asbridge;
    auto* engine = get_engine();

    auto* dict = ext::script_dictionary::create(engine);
    host_value val = host_value::adopt_handle(engine, ext::dictionary_handle_type_id(engine), dict);
    dict->set("label", to_host(engine, std::string("p")));
    dict->set("x", to_host(engine, 1));

    try
    {
        (void)to_native<test_marshal::point>(engine, val.ref());
        ADD_FAILURE() << "missing field accepted";
    }
    catch(const marshal_error& e)
    {
        EXPECT_EQ(e.kind(), error_kind::missing_field);
        EXPECT_EQ(e.field(), "y");
    }

    dict->set("y", to_host(engine, std::string("2")));
    try
    {
        (void)to_native<test_marshal::point>(engine, val.ref());
        ADD_FAILURE() << "wrong field type accepted";
    }
    catch(const marshal_error& e)
    {
        EXPECT_EQ(e.kind(), error_kind::type_mismatch);
        EXPECT_EQ(e.field(), "y");
    }
}

TEST_F(marshal_suite, record_in_script)
{
    build_module(
        "test_record",
        "class point_obj\n"
        "{\n"
        "    string label = \"obj\";\n"
        "    int x = 3;\n"
        "    int y = 4;\n"
        "}\n"
        "class partial_obj { string label; }\n"
        "string from_dict()\n"
        "{\n"
        "    dictionary d;\n"
        "    d.set(\"label\", \"dict\");\n"
        "    d.set(\"x\", 1);\n"
        "    d.set(\"y\", 2);\n"
        "    return describe_point(d);\n"
        "}\n"
        "string from_object() { return describe_any(point_obj()); }\n"
        "string from_partial() { return describe_any(partial_obj()); }\n"
        "int made_x()\n"
        "{\n"
        "    dictionary@ d = make_point(\"m\", 10, 20);\n"
        "    int x = 0;\n"
        "    d.get(\"x\", x);\n"
        "    return x;\n"
        "}\n"
    );

    auto from_dict = get_function<std::string()>("string from_dict()");
    auto from_dict_result = from_dict.invoke();
    ASSERT_TRUE(asbridge_test::result_has_value(from_dict_result));
    EXPECT_EQ(from_dict_result.value(), "dict(1, 2)");

    auto from_object = get_function<std::string()>("string from_object()");
    auto from_object_result = from_object.invoke();
    ASSERT_TRUE(asbridge_test::result_has_value(from_object_result));
    EXPECT_EQ(from_object_result.value(), "obj(3, 4)");

    auto from_partial = get_function<std::string()>("string from_partial()");
    auto from_partial_result = from_partial.invoke();
    ASSERT_FALSE(from_partial_result.has_value());
    EXPECT_EQ(from_partial_result.error().kind(), asbridge::error_kind::host_threw);
    EXPECT_STREQ(from_partial_result.error().what(), "missing field \"x\"");

    auto made_x = get_function<int()>("int made_x()");
    auto made_x_result = made_x.invoke();
    ASSERT_TRUE(asbridge_test::result_has_value(made_x_result));
    EXPECT_EQ(made_x_result.value(), 10);
}
