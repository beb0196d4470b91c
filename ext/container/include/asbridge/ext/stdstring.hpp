/**
 * @file stdstring.hpp
 * @brief Script string backed by std::string
 *
 * @note Strings are UTF-8. `configure_engine_for_ext_string` sets the engine properties accordingly.
 */

#ifndef ASBRIDGE_EXT_CONTAINER_STDSTRING_HPP
#define ASBRIDGE_EXT_CONTAINER_STDSTRING_HPP

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <asbridge/asbridge.hpp>
#include "utf8.hpp"

namespace asbridge::ext
{
/**
 * @brief Set engine properties for the string extension
 */
void configure_engine_for_ext_string(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine
);

/**
 * @brief String constants shared by all engines, counted by usage
 */
class string_factory : public AS_NAMESPACE_QUALIFIER asIStringFactory
{
public:
    struct string_hash
    {
        using is_transparent = void;

        std::size_t operator()(std::string_view txt) const
        {
            return std::hash<std::string_view>{}(txt);
        }

        std::size_t operator()(const std::string& txt) const
        {
            return std::hash<std::string>{}(txt);
        }
    };

    using container_type = std::unordered_map<
        std::string,
        std::size_t,
        string_hash,
        std::equal_to<>,
        as_allocator<std::pair<const std::string, std::size_t>>>;

    const void* GetStringConstant(
        const char* data, AS_NAMESPACE_QUALIFIER asUINT length
    ) override;

    int ReleaseStringConstant(const void* str) override;

    int GetRawStringData(
        const void* str, char* data, AS_NAMESPACE_QUALIFIER asUINT* length
    ) const override;

    static string_factory& get();

private:
    container_type m_cache;
};

/**
 * @brief Register `string` and make it the type of string literals
 */
void register_std_string(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);

/**
 * @brief Register `to_string()` for primitive types
 *
 * @pre `string` is registered
 */
void register_string_utils(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);
} // namespace asbridge::ext

namespace asbridge
{
/**
 * @brief Text is exchanged as UTF-8 and validated in both directions
 *
 * @pre The script string type is registered by `ext::register_std_string`
 */
template <>
struct converter<std::string>
{
    static int type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
    {
        int tid = get_script_string_type(engine);
        if(tid < 0) [[unlikely]]
            throw marshal_error(error_kind::type_mismatch, "string type is not registered");
        return tid;
    }

    static std::string to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
    {
        if(!ref.address || ref.type_id != type_id(engine))
            throw marshal_error::type_mismatch("string", type_decl(engine, ref.type_id));

        const auto& str = *static_cast<const std::string*>(ref.address);
        if(!ext::utf8::u8_validate(str))
            throw marshal_error::invalid_encoding();
        return str;
    }

    static host_value to_host(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, const std::string& val)
    {
        if(!ext::utf8::u8_validate(val))
            throw marshal_error::invalid_encoding();
        return host_value::copy_of(engine, host_ref{&val, type_id(engine)});
    }
};
} // namespace asbridge

#endif
