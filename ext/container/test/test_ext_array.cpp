#include <gtest/gtest.h>
#include <shared_test_lib.hpp>
#include <string>
#include <vector>
#include <asbridge/ext/array.hpp>
#include <asbridge/ext/stdstring.hpp>

using namespace asbridge_test;

namespace test_ext_array
{
class ext_array_suite : public asbridge_test_suite
{
protected:
    asbridge::ext::script_array* make_int_array()
    {
        auto* ti = get_engine()->GetTypeInfoByDecl("array<int>");
        EXPECT_TRUE(ti != nullptr);
        return asbridge::ext::script_array::create(ti);
    }
};
} // namespace test_ext_array

using test_ext_array::ext_array_suite;

TEST_F(ext_array_suite, script_interface)
{
    run_string(
        "script_interface",
        "array<int> a = {1, 2, 3};\n"
        "assert(a.size == 3);\n"
        "assert(a[0] == 1 && a[2] == 3);\n"
        "a.push_back(4);\n"
        "a.insert(0, 0);\n"
        "assert(a.size == 5 && a[0] == 0 && a[4] == 4);\n"
        "a.erase(1);\n"
        "assert(a[1] == 2);\n"
        "a.pop_back();\n"
        "a.reverse();\n"
        "assert(a[0] == 3 && a[1] == 2 && a[2] == 0);\n"
        "int[] b(3, 7);\n"
        "assert(b.size == 3 && b[1] == 7);\n"
        "b = a;\n"
        "assert(b.size == 3 && b[0] == 3);\n"
        "b[0] = 100;\n"
        "assert(a[0] == 3);\n"
        "b.clear();\n"
        "assert(b.empty());\n"
    );
}

TEST_F(ext_array_suite, strings_and_handles)
{
    run_string(
        "strings_and_handles",
        "array<string> words = {\"alpha\", \"beta\"};\n"
        "words.push_back(\"gamma\");\n"
        "assert(words[2] == \"gamma\");\n"
        "array<array<int>@> nested = {{1}, {2, 3}};\n"
        "assert(nested[1].size == 2);\n"
        "nested.push_back(null);\n"
        "assert(nested[2] is null);\n"
    );
}

TEST_F(ext_array_suite, out_of_range)
{
    build_module(
        "out_of_range",
        "int read_at(uint idx) { array<int> a = {1, 2}; return a[idx]; }\n"
        "void pop_empty() { array<int> a; a.pop_back(); }\n"
        "void insert_past_end() { array<int> a; a.insert(1, 0); }\n"
    );

    auto read_at = get_function<int(asbridge::ext::script_array::size_type)>("int read_at(uint)");
    EXPECT_EQ(read_at(1), 2);

    auto result = read_at.invoke(2);
    ASSERT_FALSE(result.has_value());
    EXPECT_STREQ(result.error().what(), "index out of range");

    auto pop_empty = get_function<void()>("void pop_empty()");
    auto pop_result = pop_empty.invoke();
    ASSERT_FALSE(pop_result.has_value());
    EXPECT_STREQ(pop_result.error().what(), "pop_back() on empty array");

    auto insert_past_end = get_function<void()>("void insert_past_end()");
    EXPECT_FALSE(insert_past_end.invoke().has_value());
}

TEST_F(ext_array_suite, native_access)
{
    using namespace asbridge;
    auto* engine = get_engine();

    ext::script_array* arr = make_int_array();
    host_value owner = host_value::adopt_handle(
        engine, arr->get_type_info()->GetTypeId() | AS_NAMESPACE_QUALIFIER asTYPEID_OBJHANDLE, arr
    );

    arr->push_back(to_host(engine, 10));
    arr->emplace_back();
    EXPECT_EQ(arr->size(), 2);
    EXPECT_EQ(to_native<int>(engine, arr->at(0)), 10);
    EXPECT_EQ(to_native<int>(engine, arr->at(1)), 0);

    // Elements must have the element type
    EXPECT_THROW(arr->push_back(to_host(engine, std::string("x"))), marshal_error);
    EXPECT_EQ(arr->size(), 2);

    EXPECT_EQ(to_native<std::vector<int>>(engine, owner.ref()), (std::vector<int>{10, 0}));
    EXPECT_EQ(ext::as_script_array(engine, owner.ref()), arr);
    EXPECT_EQ(ext::as_script_array(engine, to_host(engine, 1).ref()), nullptr);
}

TEST_F(ext_array_suite, sequence_from_script)
{
    build_module(
        "sequence_from_script",
        "array<string>@ make() { return {\"a\", \"b\", \"c\"}; }\n"
        "uint count(const array<int>&in a) { return a.size; }\n"
    );

    auto make = get_function<std::vector<std::string>()>("array<string>@ make()");
    EXPECT_EQ(make(), (std::vector<std::string>{"a", "b", "c"}));

    auto count = get_function<asbridge::ext::script_array::size_type(std::vector<int>)>(
        "uint count(const array<int>&in)"
    );
    EXPECT_EQ(count(std::vector<int>{1, 2, 3, 4}), 4);
}

TEST_F(ext_array_suite, garbage_collection)
{
    build_module(
        "garbage_collection",
        "class node { array<node@> links; }\n"
        "void make_cycle()\n"
        "{\n"
        "    node a;\n"
        "    node b;\n"
        "    a.links.push_back(b);\n"
        "    b.links.push_back(a);\n"
        "    a.links.push_back(a);\n"
        "}\n"
    );

    auto make_cycle = get_function<void()>("void make_cycle()");
    for(int i = 0; i < 3; ++i)
        make_cycle();

    auto* engine = get_engine();
    int r = engine->GarbageCollect(AS_NAMESPACE_QUALIFIER asGC_FULL_CYCLE);
    EXPECT_GE(r, 0);

    AS_NAMESPACE_QUALIFIER asUINT current_size = 0;
    AS_NAMESPACE_QUALIFIER asUINT total_destroyed = 0;
    engine->GetGCStatistics(&current_size, &total_destroyed);
    EXPECT_GT(total_destroyed, 0);
}

TEST_F(ext_array_suite, allocated_by_engine_memory_functions)
{
    allocation_recorder rec;
    asbridge::ext::script_array* arr = make_int_array();
    ASSERT_TRUE(arr != nullptr);
    EXPECT_GE(rec.count(sizeof(asbridge::ext::script_array)), 1u);
    arr->release();
}
