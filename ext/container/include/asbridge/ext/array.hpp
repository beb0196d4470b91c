/**
 * @file array.hpp
 * @brief Script array `array<T>`
 */

#ifndef ASBRIDGE_EXT_CONTAINER_ARRAY_HPP
#define ASBRIDGE_EXT_CONTAINER_ARRAY_HPP

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <asbridge/asbridge.hpp>

namespace asbridge::ext
{
/**
 * @brief Object of the script type `array<T>`
 *
 * Elements are stored as `host_value`. Reference types can only be stored by handle.
 */
class script_array
{
public:
    using size_type = AS_NAMESPACE_QUALIFIER asUINT;

    script_array(const script_array&) = delete;
    script_array& operator=(const script_array&) = delete;

    void* operator new(std::size_t bytes);
    void operator delete(void* p);

    /**
     * @brief Create an empty array of the template instance
     *
     * @return New array, whose reference belongs to the caller
     */
    [[nodiscard]]
    static script_array* create(AS_NAMESPACE_QUALIFIER asITypeInfo* ti);

    void addref() noexcept
    {
        m_gc_flag = false;
        ++m_refcount;
    }

    void release() noexcept
    {
        m_gc_flag = false;
        if(m_refcount.dec() == 0)
            delete this;
    }

    [[nodiscard]]
    int get_refcount() const noexcept
    {
        return m_refcount;
    }

    void set_gc_flag() noexcept
    {
        m_gc_flag = true;
    }

    [[nodiscard]]
    bool get_gc_flag() const noexcept
    {
        return m_gc_flag;
    }

    void enum_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);
    void release_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);

    [[nodiscard]]
    AS_NAMESPACE_QUALIFIER asITypeInfo* get_type_info() const noexcept
    {
        return m_ti;
    }

    [[nodiscard]]
    int element_type_id() const noexcept
    {
        return m_ti->GetSubTypeId();
    }

    [[nodiscard]]
    size_type size() const noexcept
    {
        return static_cast<size_type>(m_data.size());
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_data.empty();
    }

    /**
     * @pre idx < size()
     */
    [[nodiscard]]
    host_ref at(size_type idx) const noexcept
    {
        return m_data[idx].ref();
    }

    /**
     * @brief Append a value
     *
     * @exception marshal_error The value type differs from the element type
     */
    void push_back(host_value&& val);

    /**
     * @brief Append a default-constructed element
     */
    void emplace_back();

    void append_copy(host_ref val);

    /**
     * @name Script interface
     */
    /// @{

    void* script_at(size_type idx);
    void script_insert(size_type idx, const void* val);
    void script_erase(size_type idx);
    void pop_back();
    void clear() noexcept;
    void reverse() noexcept;
    void assign(const script_array& other);

    /// @}

private:
    explicit script_array(AS_NAMESPACE_QUALIFIER asITypeInfo* ti);
    ~script_array();

    [[nodiscard]]
    AS_NAMESPACE_QUALIFIER asIScriptEngine* get_engine() const noexcept
    {
        return m_ti->GetEngine();
    }

    AS_NAMESPACE_QUALIFIER asITypeInfo* m_ti;
    atomic_counter m_refcount;
    bool m_gc_flag = false;
    std::vector<host_value> m_data;
};

/**
 * @brief Register `array<T>` as the default array type
 */
void register_script_array(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);

/**
 * @brief Type ID of the handle `array<T>@` for an element type
 *
 * @exception marshal_error The array type cannot be instantiated for the element type
 */
[[nodiscard]]
int array_handle_type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, int element_type_id);

/**
 * @brief Get the array of a script value, which may be a handle or a reference to an array
 *
 * @return Null if the value is not an array or is a null handle
 */
[[nodiscard]]
const script_array* as_script_array(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref);
} // namespace asbridge::ext

namespace asbridge
{
/**
 * @brief Sequences are exchanged as `array<T>@`
 *
 * A failure to convert an element reports the index of the first failing element.
 */
template <host_typed T>
requires native_convertible<T>
struct converter<std::vector<T>>
{
    static int type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
    {
        return ext::array_handle_type_id(engine, host_type_id<T>(engine));
    }

    static std::vector<T> to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
    {
        const ext::script_array* arr = ext::as_script_array(engine, ref);
        if(!arr)
            throw marshal_error::type_mismatch(type_decl(engine, type_id(engine)), type_decl(engine, ref.type_id));

        std::vector<T> result;
        result.reserve(arr->size());
        for(ext::script_array::size_type i = 0; i < arr->size(); ++i)
        {
            try
            {
                result.push_back(asbridge::to_native<T>(engine, arr->at(i)));
            }
            catch(const marshal_error& e)
            {
                throw e.at_index(i);
            }
        }

        return result;
    }

    static host_value to_host(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, const std::vector<T>& vec)
    {
        int tid = type_id(engine);
        auto* arr = ext::script_array::create(engine->GetTypeInfoById(tid));
        host_value result = host_value::adopt_handle(engine, tid, arr);

        for(std::size_t i = 0; i < vec.size(); ++i)
        {
            try
            {
                arr->push_back(asbridge::to_host(engine, vec[i]));
            }
            catch(const marshal_error& e)
            {
                throw e.at_index(i);
            }
        }

        return result;
    }
};
} // namespace asbridge

#endif
