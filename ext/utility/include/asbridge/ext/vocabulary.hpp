/**
 * @file vocabulary.hpp
 * @brief Script optional `optional<T>` and `nullopt`
 */

#ifndef ASBRIDGE_EXT_VOCABULARY_HPP
#define ASBRIDGE_EXT_VOCABULARY_HPP

#pragma once

#include <optional>
#include <string>
#include <asbridge/asbridge.hpp>

namespace asbridge::ext
{
/**
 * @brief Object of the value template type `optional<T>`
 */
class script_optional
{
public:
    script_optional() = delete;

    /**
     * @brief Empty optional
     */
    explicit script_optional(AS_NAMESPACE_QUALIFIER asITypeInfo* ti);

    script_optional(AS_NAMESPACE_QUALIFIER asITypeInfo* ti, const void* value);

    script_optional(const script_optional& other);

    ~script_optional();

    script_optional& operator=(const script_optional& other);

    [[nodiscard]]
    bool has_value() const noexcept
    {
        return !m_value.empty();
    }

    explicit operator bool() const noexcept
    {
        return has_value();
    }

    /**
     * @brief View of the contained value, or an empty view
     */
    [[nodiscard]]
    host_ref ref() const noexcept
    {
        return m_value.ref();
    }

    /**
     * @brief Replace the contained value
     *
     * @exception marshal_error The value type differs from the element type
     */
    void set(host_value&& val);

    void assign(const void* val);
    void reset() noexcept;

    /**
     * @brief Contained value, or a script exception if empty
     */
    void* value();
    const void* value_or(const void* val) const noexcept;

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

    void enum_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);
    void release_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);

private:
    AS_NAMESPACE_QUALIFIER asITypeInfo* m_ti;
    host_value m_value;
};

/**
 * @brief Register `nullopt_t`, the global `nullopt` and `optional<T>`
 */
void register_script_optional(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);

/**
 * @return Null if the value is not an `optional<T>`
 */
[[nodiscard]]
const script_optional* as_script_optional(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref);
} // namespace asbridge::ext

namespace asbridge
{
/**
 * @brief Optionals are exchanged as `optional<T>`
 *
 * `null`, a null handle and an empty `optional<U>` are read as absent.
 * Any other value is converted to T, so plain values are accepted as well.
 */
template <host_typed T>
requires native_convertible<T>
struct converter<std::optional<T>>
{
    static int type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
    {
        std::string decl = string_concat("optional<", type_decl(engine, host_type_id<T>(engine)), '>');
        int tid = engine->GetTypeIdByDecl(decl.c_str());
        if(tid < 0)
            throw marshal_error(error_kind::type_mismatch, string_concat("script type \"", decl, "\" is not available"));
        return tid;
    }

    static std::optional<T> to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
    {
        if(ref.is_null())
            return std::nullopt;

        if(const ext::script_optional* opt = ext::as_script_optional(engine, ref))
        {
            if(!opt->has_value())
                return std::nullopt;
            return asbridge::to_native<T>(engine, opt->ref());
        }

        return asbridge::to_native<T>(engine, ref);
    }

    static host_value to_host(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, const std::optional<T>& val)
    {
        host_value result(engine, type_id(engine));
        if(val)
            static_cast<ext::script_optional*>(result.address())->set(asbridge::to_host(engine, *val));
        return result;
    }
};
} // namespace asbridge

#endif
