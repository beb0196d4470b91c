/**
 * @file buffer.hpp
 * @brief Script byte buffer `buffer` with typed views for native code
 *
 * @details A `buffer` owns a contiguous block of bytes. Native functions can take it as a
 *          `std::span` without copying, or exchange it as `std::vector<std::byte>`.
 *          `typed_view<T>` and `data_view` read and write numbers inside a byte range.
 */

#ifndef ASBRIDGE_EXT_CONTAINER_BUFFER_HPP
#define ASBRIDGE_EXT_CONTAINER_BUFFER_HPP

#pragma once

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>
#include <asbridge/asbridge.hpp>

namespace asbridge::ext
{
/**
 * @brief Object of the script type `buffer`
 *
 * A detached buffer has released its storage. Its byte length is 0 and it stays empty.
 */
class script_buffer
{
public:
    using size_type = AS_NAMESPACE_QUALIFIER asUINT;

    script_buffer(const script_buffer&) = delete;
    script_buffer& operator=(const script_buffer&) = delete;

    void* operator new(std::size_t bytes);
    void operator delete(void* p);

    /**
     * @brief Create a zero-filled buffer
     *
     * @return New buffer, whose reference belongs to the caller
     *
     * @exception bridge_error `buffer` is not registered
     */
    [[nodiscard]]
    static script_buffer* create(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, size_type byte_length = 0);

    /**
     * @brief Create a buffer holding a copy of the bytes
     */
    [[nodiscard]]
    static script_buffer* create(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, std::span<const std::byte> bytes);

    void addref() noexcept
    {
        ++m_refcount;
    }

    void release() noexcept
    {
        if(m_refcount.dec() == 0)
            delete this;
    }

    [[nodiscard]]
    size_type byte_length() const noexcept
    {
        return static_cast<size_type>(m_data.size());
    }

    [[nodiscard]]
    bool detached() const noexcept
    {
        return m_detached;
    }

    /**
     * @brief Release the storage. Views taken before are invalidated.
     */
    void detach() noexcept;

    [[nodiscard]]
    std::span<std::byte> bytes() noexcept
    {
        return m_data;
    }

    [[nodiscard]]
    std::span<const std::byte> bytes() const noexcept
    {
        return m_data;
    }

    /**
     * @name Script interface
     */
    /// @{

    std::uint8_t& script_at(size_type idx);

    /**
     * @brief Copy of the bytes in [begin, end)
     *
     * @exception range_error The range is not inside the buffer
     */
    [[nodiscard]]
    script_buffer* slice(size_type begin, size_type end) const;

    /// @}

private:
    explicit script_buffer(AS_NAMESPACE_QUALIFIER asITypeInfo* ti);
    ~script_buffer();

    AS_NAMESPACE_QUALIFIER asITypeInfo* m_ti;
    atomic_counter m_refcount;
    bool m_detached = false;
    std::vector<std::byte> m_data;
};

/**
 * @brief Register `buffer`
 *
 * @pre `array<T>` is registered
 */
void register_script_buffer(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);

[[nodiscard]]
int buffer_handle_type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);

/**
 * @brief Get the buffer of a script value, which may be a handle or a reference to a buffer
 *
 * @return Null if the value is not a buffer or is a null handle
 */
[[nodiscard]]
script_buffer* as_script_buffer(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref);

namespace detail
{
    template <typename T>
    concept view_element = std::is_arithmetic_v<T> && !std::same_as<T, bool>;

    template <view_element T>
    T load_bytes(const std::byte* src, bool little_endian) noexcept
    {
        std::byte tmp[sizeof(T)];
        std::memcpy(tmp, src, sizeof(T));
        if(little_endian != (std::endian::native == std::endian::little))
            std::reverse(tmp, tmp + sizeof(T));

        T val;
        std::memcpy(&val, tmp, sizeof(T));
        return val;
    }

    template <view_element T>
    void store_bytes(std::byte* dst, T val, bool little_endian) noexcept
    {
        std::byte tmp[sizeof(T)];
        std::memcpy(tmp, &val, sizeof(T));
        if(little_endian != (std::endian::native == std::endian::little))
            std::reverse(tmp, tmp + sizeof(T));
        std::memcpy(dst, tmp, sizeof(T));
    }
} // namespace detail

/**
 * @brief Array of T laid over a byte range, in native byte order
 *
 * The view does not own the bytes.
 */
template <detail::view_element T>
class typed_view
{
public:
    using value_type = T;

    /**
     * @param length Number of elements. If absent, the view extends to the end of the bytes.
     *
     * @exception range_error The offset is not a multiple of the element size, or the view does not fit
     */
    explicit typed_view(
        std::span<std::byte> bytes,
        std::size_t byte_offset = 0,
        std::optional<std::size_t> length = std::nullopt
    )
        : m_offset(byte_offset)
    {
        if(byte_offset % sizeof(T) != 0)
        {
            throw range_error(string_concat(
                "start offset of a typed view should be a multiple of ", std::to_string(sizeof(T))
            ));
        }
        if(byte_offset > bytes.size())
            throw range_error("invalid typed view length");

        std::size_t count = length.value_or((bytes.size() - byte_offset) / sizeof(T));
        if(count > (bytes.size() - byte_offset) / sizeof(T))
            throw range_error("invalid typed view length");

        m_bytes = bytes.subspan(byte_offset, count * sizeof(T));
    }

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_bytes.size() / sizeof(T);
    }

    [[nodiscard]]
    std::size_t byte_offset() const noexcept
    {
        return m_offset;
    }

    [[nodiscard]]
    std::size_t byte_length() const noexcept
    {
        return m_bytes.size();
    }

    /**
     * @exception range_error Index out of range
     */
    [[nodiscard]]
    T get(std::size_t idx) const
    {
        check_index(idx);
        return detail::load_bytes<T>(m_bytes.data() + idx * sizeof(T), std::endian::native == std::endian::little);
    }

    void set(std::size_t idx, T val)
    {
        check_index(idx);
        detail::store_bytes<T>(m_bytes.data() + idx * sizeof(T), val, std::endian::native == std::endian::little);
    }

private:
    void check_index(std::size_t idx) const
    {
        if(idx >= size())
            throw range_error("typed view index out of range");
    }

    std::span<std::byte> m_bytes;
    std::size_t m_offset;
};

/**
 * @brief Numbers of any type at any offset of a byte range, in either byte order
 */
class data_view
{
public:
    /**
     * @param byte_length If absent, the view extends to the end of the bytes
     *
     * @exception range_error The view does not fit
     */
    explicit data_view(
        std::span<std::byte> bytes,
        std::size_t byte_offset = 0,
        std::optional<std::size_t> byte_length = std::nullopt
    )
        : m_offset(byte_offset)
    {
        if(byte_offset > bytes.size() ||
           byte_length.value_or(0) > bytes.size() - byte_offset)
        {
            throw range_error(
                "byte_offset + byte_length should be less than or equal to the size in bytes of the buffer"
            );
        }

        m_bytes = bytes.subspan(byte_offset, byte_length.value_or(bytes.size() - byte_offset));
    }

    [[nodiscard]]
    std::size_t byte_offset() const noexcept
    {
        return m_offset;
    }

    [[nodiscard]]
    std::size_t byte_length() const noexcept
    {
        return m_bytes.size();
    }

    /**
     * @exception range_error The value does not fit at the offset
     */
    template <detail::view_element T>
    [[nodiscard]]
    T get(std::size_t offset, bool little_endian = true) const
    {
        check_offset(offset, sizeof(T));
        return detail::load_bytes<T>(m_bytes.data() + offset, little_endian);
    }

    template <detail::view_element T>
    void set(std::size_t offset, T val, bool little_endian = true)
    {
        check_offset(offset, sizeof(T));
        detail::store_bytes<T>(m_bytes.data() + offset, val, little_endian);
    }

private:
    void check_offset(std::size_t offset, std::size_t size) const
    {
        if(offset > m_bytes.size() || size > m_bytes.size() - offset)
            throw range_error("offset is outside the bounds of the data view");
    }

    std::span<std::byte> m_bytes;
    std::size_t m_offset;
};
} // namespace asbridge::ext

namespace asbridge
{
/**
 * @brief Bytes are exchanged as `buffer@` by copy
 */
template <>
struct converter<std::vector<std::byte>>
{
    static int type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
    {
        return ext::buffer_handle_type_id(engine);
    }

    static std::vector<std::byte> to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref);
    static host_value to_host(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, const std::vector<std::byte>& bytes);
};

/**
 * @brief View of the bytes of a script buffer, valid while the script value is alive and not detached
 */
template <>
struct converter<std::span<const std::byte>>
{
    static std::span<const std::byte> to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref);
};

/**
 * @brief Writable view of the bytes of a script buffer
 */
template <>
struct converter<std::span<std::byte>>
{
    static std::span<std::byte> to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref);
};
} // namespace asbridge

#endif
