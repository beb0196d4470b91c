#include <gtest/gtest.h>
#include <shared_test_lib.hpp>
#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include <asbridge/ext/buffer.hpp>

using namespace asbridge_test;

namespace test_ext_buffer
{
static std::vector<std::byte> reversed(std::span<const std::byte> bytes)
{
    return std::vector<std::byte>(bytes.rbegin(), bytes.rend());
}

static void fill(std::span<std::byte> bytes, std::uint8_t val)
{
    std::fill(bytes.begin(), bytes.end(), static_cast<std::byte>(val));
}

static std::uint32_t byte_sum(std::span<const std::byte> bytes)
{
    std::uint32_t sum = 0;
    for(std::byte b : bytes)
        sum += std::to_integer<std::uint32_t>(b);
    return sum;
}

class ext_buffer_suite : public asbridge_test_suite
{
protected:
    void register_all() override
    {
        asbridge_test_suite::register_all();

        asbridge::global(get_engine())
            .function("buffer@ reversed(const buffer@ bytes)", asbridge::fp<&reversed>)
            .function("void fill(buffer@ bytes, uint8 val)", asbridge::fp<&fill>)
            .function("uint byte_sum(const buffer@ bytes)", asbridge::fp<&byte_sum>);
    }

    asbridge::host_value make_buffer(std::size_t byte_length)
    {
        auto* engine = get_engine();
        auto* buf = asbridge::ext::script_buffer::create(
            engine, static_cast<asbridge::ext::script_buffer::size_type>(byte_length)
        );
        return asbridge::host_value::adopt_handle(engine, asbridge::ext::buffer_handle_type_id(engine), buf);
    }
};
} // namespace test_ext_buffer

using test_ext_buffer::ext_buffer_suite;

TEST_F(ext_buffer_suite, script_interface)
{
    run_string(
        "script_interface",
        "buffer b(16);\n"
        "assert(b.byte_length == 16);\n"
        "assert(!b.detached);\n"
        "for(uint i = 0; i < b.byte_length; ++i)\n"
        "    assert(b[i] == 0);\n"
        "b[0] = 42;\n"
        "b[15] = 255;\n"
        "assert(b[0] == 42 && b[15] == 255);\n"
        "array<uint8> init = {72, 105, 33};\n"
        "buffer@ from_array = buffer(init);\n"
        "assert(from_array.byte_length == 3);\n"
        "assert(from_array[1] == 105);\n"
        "array<uint8>@ bytes = from_array.to_array();\n"
        "assert(bytes.size == 3 && bytes[2] == 33);\n"
        "buffer@ part = b.slice(14, 16);\n"
        "assert(part.byte_length == 2 && part[1] == 255);\n"
        "part[1] = 1;\n"
        "assert(b[15] == 255);\n"
        "assert(b.slice(3, 3).byte_length == 0);\n"
        "buffer empty;\n"
        "assert(empty.byte_length == 0);\n"
        "b.detach();\n"
        "assert(b.detached);\n"
        "assert(b.byte_length == 0);\n"
    );
}

TEST_F(ext_buffer_suite, numbers)
{
    run_string(
        "numbers",
        "buffer b(16);\n"
        "b[0] = 0x01; b[1] = 0x02; b[2] = 0x03; b[3] = 0x04;\n"
        "assert(b.get_int32(0) == 0x04030201);\n"
        "assert(b.get_uint32(0, false) == 0x01020304);\n"
        "b.set_uint32(4, 0xDEADBEEF);\n"
        "assert(b[4] == 0xEF && b[5] == 0xBE && b[6] == 0xAD && b[7] == 0xDE);\n"
        "b.set_int16(8, -2, false);\n"
        "assert(b[8] == 0xFF && b[9] == 0xFE);\n"
        "assert(b.get_int16(8, false) == -2);\n"
        "b.set_float64(8, -273.15);\n"
        "assert(b.get_float64(8) == -273.15);\n"
        "b.set_int64(8, -1);\n"
        "assert(b.get_uint64(8) == 0xFFFFFFFFFFFFFFFF);\n"
        "b.set_int8(15, -128);\n"
        "assert(b.get_uint8(15) == 128);\n"
    );
}

TEST_F(ext_buffer_suite, out_of_range)
{
    build_module(
        "out_of_range",
        "void index() { buffer b(4); b[4] = 1; }\n"
        "void read_past_end() { buffer b(4); b.get_int32(1); }\n"
        "void bad_slice() { buffer b(4); b.slice(3, 2); }\n"
        "void after_detach() { buffer b(4); b.detach(); b.get_uint8(0); }\n"
    );

    auto expect_error = [&](const char* decl, const char* msg)
    {
        auto result = get_function<void()>(decl).invoke();
        ASSERT_FALSE(result.has_value()) << decl;
        EXPECT_STREQ(result.error().what(), msg);
    };

    expect_error("void index()", "buffer index out of range");
    expect_error("void read_past_end()", "offset is outside the bounds of the data view");
    expect_error("void bad_slice()", "slice range is outside the buffer");
    expect_error("void after_detach()", "offset is outside the bounds of the data view");
}

TEST_F(ext_buffer_suite, native_functions)
{
    run_string(
        "native_functions",
        "array<uint8> init = {1, 2, 3};\n"
        "buffer b(init);\n"
        "buffer@ r = reversed(b);\n"
        "assert(r.byte_length == 3);\n"
        "assert(r[0] == 3 && r[1] == 2 && r[2] == 1);\n"
        "assert(byte_sum(b) == 6);\n"
        "fill(b, 7);\n"
        "assert(b[0] == 7 && b[2] == 7);\n"
        "assert(byte_sum(b) == 21);\n"
        "buffer empty;\n"
        "assert(reversed(empty).byte_length == 0);\n"
        "b.detach();\n"
        "assert(byte_sum(b) == 0);\n"
    );

    build_module(
        "null_buffer",
        "uint sum_null() { buffer@ b = null; return byte_sum(b); }\n"
    );
    auto result = get_function<std::uint32_t()>("uint sum_null()").invoke();
    ASSERT_FALSE(result.has_value());
    EXPECT_STREQ(result.error().what(), "cannot pass a null buffer");
}

TEST_F(ext_buffer_suite, conversion)
{
    using namespace asbridge;
    auto* engine = get_engine();

    std::vector<std::byte> data{std::byte{0xDE}, std::byte{0xAD}, std::byte{0xBE}, std::byte{0xEF}};
    host_value val = to_host(engine, data);
    EXPECT_EQ(val.type_id(), ext::buffer_handle_type_id(engine));

    ext::script_buffer* buf = ext::as_script_buffer(engine, val.ref());
    ASSERT_TRUE(buf != nullptr);
    EXPECT_EQ(buf->byte_length(), 4);

    // The view shares the storage of the script buffer
    auto view = to_native<std::span<std::byte>>(engine, val.ref());
    EXPECT_EQ(view.data(), buf->bytes().data());
    view[0] = std::byte{0x01};
    EXPECT_EQ(to_native<std::vector<std::byte>>(engine, val.ref())[0], std::byte{0x01});

    host_value empty = to_host(engine, std::vector<std::byte>{});
    EXPECT_TRUE(to_native<std::vector<std::byte>>(engine, empty.ref()).empty());

    EXPECT_THROW((void)to_native<std::vector<std::byte>>(engine, to_host(engine, 1).ref()), marshal_error);
}

TEST_F(ext_buffer_suite, typed_view)
{
    using namespace asbridge;

    host_value val = make_buffer(16);
    std::span<std::byte> bytes = ext::as_script_buffer(get_engine(), val.ref())->bytes();

    ext::typed_view<std::uint8_t> u8(bytes);
    EXPECT_EQ(u8.size(), 16);
    EXPECT_EQ(u8.byte_offset(), 0);
    ext::typed_view<std::int32_t> i32(bytes);
    EXPECT_EQ(i32.size(), 4);
    EXPECT_EQ(i32.byte_length(), 16);

    u8.set(0, 0x01);
    u8.set(1, 0x02);
    u8.set(2, 0x03);
    u8.set(3, 0x04);
    std::int32_t expected = std::endian::native == std::endian::little ? 0x04030201 : 0x01020304;
    EXPECT_EQ(i32.get(0), expected);

    i32.set(1, -1);
    for(std::size_t i = 4; i < 8; ++i)
        EXPECT_EQ(u8.get(i), 0xFF);

    ext::typed_view<double> f64(bytes, 8, 1);
    f64.set(0, 1e100);
    EXPECT_DOUBLE_EQ(f64.get(0), 1e100);
    EXPECT_THROW((void)f64.get(1), range_error);

    ext::typed_view<std::uint8_t> tail(bytes, 4, 8);
    EXPECT_EQ(tail.size(), 8);
    EXPECT_EQ(tail.byte_offset(), 4);
    EXPECT_EQ(tail.get(0), 0xFF);

    ext::typed_view<std::uint8_t> zero(bytes, 0, 0);
    EXPECT_EQ(zero.size(), 0);
    EXPECT_EQ(zero.byte_length(), 0);

    try
    {
        ext::typed_view<std::int32_t> misaligned(bytes, 3);
        ADD_FAILURE() << "no exception";
    }
    catch(const range_error& e)
    {
        EXPECT_EQ(e.kind(), error_kind::out_of_range);
        EXPECT_STREQ(e.what(), "start offset of a typed view should be a multiple of 4");
    }

    EXPECT_THROW(ext::typed_view<std::uint8_t>(bytes, 0, 100), range_error);
    EXPECT_THROW(ext::typed_view<std::uint8_t>(bytes, 17), range_error);
    EXPECT_EQ(ext::typed_view<std::uint8_t>(bytes, 16).size(), 0);
}

TEST_F(ext_buffer_suite, data_view)
{
    using namespace asbridge;

    host_value val = make_buffer(16);
    std::span<std::byte> bytes = ext::as_script_buffer(get_engine(), val.ref())->bytes();

    ext::data_view dv(bytes);
    EXPECT_EQ(dv.byte_length(), 16);

    ext::data_view part(bytes, 4, 8);
    EXPECT_EQ(part.byte_offset(), 4);
    EXPECT_EQ(part.byte_length(), 8);

    part.set<std::uint16_t>(0, 0x1234, false);
    EXPECT_EQ(dv.get<std::uint8_t>(4), 0x12);
    EXPECT_EQ(dv.get<std::uint8_t>(5), 0x34);
    EXPECT_EQ(dv.get<std::uint16_t>(4, true), 0x3412);

    part.set<float>(4, 3.5f);
    EXPECT_FLOAT_EQ(dv.get<float>(8), 3.5f);
    EXPECT_THROW((void)part.get<double>(1), range_error);

    ext::data_view zero(bytes, 0, 0);
    EXPECT_EQ(zero.byte_length(), 0);

    EXPECT_THROW(ext::data_view(bytes, 10, 10), range_error);
}

TEST_F(ext_buffer_suite, allocated_by_engine_memory_functions)
{
    allocation_recorder rec;
    asbridge::host_value val = make_buffer(4);
    EXPECT_GE(rec.count(sizeof(asbridge::ext::script_buffer)), 1u);
}
