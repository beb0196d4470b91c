/**
 * @file dictionary.hpp
 * @brief Script dictionary with string keys, and the record converter built on it
 */

#ifndef ASBRIDGE_EXT_CONTAINER_DICTIONARY_HPP
#define ASBRIDGE_EXT_CONTAINER_DICTIONARY_HPP

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <asbridge/asbridge.hpp>
#include "stdstring.hpp"

namespace asbridge::ext
{
/**
 * @brief Object of the script type `dictionary`
 *
 * Maps string keys to values of any script type.
 */
class script_dictionary
{
public:
    using key_type = std::string;
    using container_type = std::map<key_type, host_value, std::less<>>;

    script_dictionary(const script_dictionary&) = delete;
    script_dictionary& operator=(const script_dictionary&) = delete;

    void* operator new(std::size_t bytes);
    void operator delete(void* p);

    /**
     * @return New dictionary, whose reference belongs to the caller
     *
     * @exception bridge_error `dictionary` is not registered
     */
    [[nodiscard]]
    static script_dictionary* create(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);

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
    AS_NAMESPACE_QUALIFIER asIScriptEngine* get_engine() const noexcept
    {
        return m_ti->GetEngine();
    }

    /**
     * @brief Insert or replace a value
     */
    void set(std::string_view key, host_value&& val);

    /**
     * @return Null if the key does not exist
     */
    [[nodiscard]]
    const host_value* find(std::string_view key) const;

    bool erase(std::string_view key);

    [[nodiscard]]
    bool contains(std::string_view key) const
    {
        return find(key) != nullptr;
    }

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_data.size();
    }

    void clear() noexcept
    {
        m_data.clear();
    }

    /**
     * @brief Keys in ascending order
     */
    [[nodiscard]]
    std::vector<std::string> keys() const;

    /**
     * @brief Copy the value of a key to a script variable
     *
     * @return False if the key does not exist or the value cannot be assigned to the variable
     */
    bool get_to(std::string_view key, void* dst, int dst_type_id) const;

private:
    explicit script_dictionary(AS_NAMESPACE_QUALIFIER asITypeInfo* ti);
    ~script_dictionary();

    AS_NAMESPACE_QUALIFIER asITypeInfo* m_ti;
    atomic_counter m_refcount;
    bool m_gc_flag = false;
    container_type m_data;
};

/**
 * @brief Register `dictionary`
 *
 * @pre `string` and `array<T>` are registered
 */
void register_script_dictionary(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);

/**
 * @brief Type ID of `dictionary@`
 *
 * @exception marshal_error `dictionary` is not registered
 */
[[nodiscard]]
int dictionary_handle_type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);

/**
 * @return Null if the value is not a dictionary or is a null handle
 */
[[nodiscard]]
const script_dictionary* as_script_dictionary(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref);
} // namespace asbridge::ext

namespace asbridge
{
/**
 * @brief Records are sent to scripts as `dictionary@`
 *
 * They are read back from a dictionary or from a script class object with properties of the same names.
 * Errors name the failing field.
 */
template <record_type T>
struct converter<T>
{
    static int type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
    {
        return ext::dictionary_handle_type_id(engine);
    }

    static T to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
    {
        const ext::script_dictionary* dict = ext::as_script_dictionary(engine, ref);
        if(!dict && !(ref.type_id & AS_NAMESPACE_QUALIFIER asTYPEID_SCRIPTOBJECT))
            throw marshal_error::type_mismatch("record", type_decl(engine, ref.type_id));
        if(ref.is_null())
            throw marshal_error::type_mismatch("record", "null");

        T result{};
        for_each_field(
            result,
            [&]<typename Field>(const char* name, Field& field)
            {
                std::optional<host_ref> val;
                if(dict)
                {
                    if(const host_value* v = dict->find(name))
                        val = v->ref();
                }
                else
                    val = find_object_property(ref, name);

                if(!val)
                    throw marshal_error::missing_field(name);

                try
                {
                    field = asbridge::to_native<Field>(engine, *val);
                }
                catch(const marshal_error& e)
                {
                    throw e.in_field(name);
                }
            }
        );

        return result;
    }

    static host_value to_host(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, const T& rec)
    {
        auto* dict = ext::script_dictionary::create(engine);
        host_value result = host_value::adopt_handle(engine, type_id(engine), dict);

        for_each_field(
            rec,
            [&](const char* name, const auto& field)
            {
                try
                {
                    dict->set(name, asbridge::to_host(engine, field));
                }
                catch(const marshal_error& e)
                {
                    throw e.in_field(name);
                }
            }
        );

        return result;
    }
};
} // namespace asbridge

#endif
