/**
 * @file marshal.hpp
 * @brief Conversion of values between native types and script values
 *
 * @details A script value is viewed through `host_ref` (address + type ID) and owned through `host_value`.
 *          Native types opt in by specializing `converter<T>`, which may provide
 *          - `static int type_id(asIScriptEngine*)`: script type produced by `to_host`
 *          - `static T to_native(asIScriptEngine*, host_ref)`: throws `marshal_error` on failure
 *          - `static host_value to_host(asIScriptEngine*, const T&)`
 *
 *          Converters of the script types registered by extensions (`string`, `array<T>`,
 *          `optional<T>`, `dictionary`) live beside those extensions.
 */

#ifndef ASBRIDGE_MARSHAL_HPP
#define ASBRIDGE_MARSHAL_HPP

#pragma once

#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include "detail/include_as.hpp"
#include "utility.hpp"
#include "memory.hpp"
#include "error.hpp"

namespace asbridge
{
/**
 * @brief Borrowed view of a script value
 *
 * For handles, `address` points to the handle variable. For other objects it points to the object itself.
 */
struct host_ref
{
    const void* address = nullptr;
    int type_id = AS_NAMESPACE_QUALIFIER asTYPEID_VOID;

    /**
     * @brief Referenced object of a handle or an object value
     */
    [[nodiscard]]
    void* object() const noexcept
    {
        if(!address || is_primitive_type(type_id))
            return nullptr;
        if(is_objhandle(type_id))
            return *static_cast<void* const*>(address);
        return const_cast<void*>(address);
    }

    /**
     * @brief True for the `null` literal and for null handles
     */
    [[nodiscard]]
    bool is_null() const noexcept
    {
        if(is_void_type(type_id) || !address)
            return true;
        return is_objhandle(type_id) && object() == nullptr;
    }
};

/**
 * @brief Owned script value
 */
class host_value
{
public:
    host_value() noexcept = default;

    /**
     * @brief Default-construct a value of the type
     */
    host_value(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, int type_id)
        : m_engine(engine), m_type_id(type_id)
    {
        if(!m_data.construct(engine, type_id))
        {
            m_type_id = AS_NAMESPACE_QUALIFIER asTYPEID_VOID;
            throw marshal_error::type_mismatch("default constructible type", type_decl(engine, type_id));
        }
    }

    host_value(const host_value&) = delete;

    host_value(host_value&& other) noexcept
        : m_engine(other.m_engine),
          m_type_id(std::exchange(other.m_type_id, AS_NAMESPACE_QUALIFIER asTYPEID_VOID)),
          m_data(std::move(other.m_data)) {}

    ~host_value()
    {
        reset();
    }

    host_value& operator=(const host_value&) = delete;

    host_value& operator=(host_value&& other) noexcept
    {
        if(this != &other)
        {
            reset();
            m_engine = other.m_engine;
            m_type_id = std::exchange(other.m_type_id, AS_NAMESPACE_QUALIFIER asTYPEID_VOID);
            m_data = std::move(other.m_data);
        }
        return *this;
    }

    /**
     * @brief Copy of the viewed value
     */
    [[nodiscard]]
    static host_value copy_of(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
    {
        host_value result;
        if(is_void_type(ref.type_id))
            return result;
        if(!result.m_data.copy_construct(engine, ref.type_id, ref.address))
            throw marshal_error::type_mismatch("copyable type", type_decl(engine, ref.type_id));
        result.m_engine = engine;
        result.m_type_id = ref.type_id;
        return result;
    }

    /**
     * @brief Take ownership of a handle whose reference is already counted, e.g. a newly created object
     *
     * @param type_id Type ID with the handle flag
     */
    [[nodiscard]]
    static host_value adopt_handle(
        AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, int type_id, void* obj
    ) noexcept
    {
        assert(is_objhandle(type_id));

        host_value result;
        result.m_engine = engine;
        result.m_type_id = type_id;
        result.m_data.adopt_handle(obj);
        return result;
    }

    template <typename T>
    requires std::is_arithmetic_v<T>
    [[nodiscard]]
    static host_value from_primitive(int type_id, T val) noexcept
    {
        host_value result;
        result.m_type_id = type_id;
        std::memcpy(result.m_data.data_address(type_id), &val, sizeof(T));
        return result;
    }

    [[nodiscard]]
    int type_id() const noexcept
    {
        return m_type_id;
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return is_void_type(m_type_id);
    }

    /**
     * @brief Address following the `host_ref` convention
     */
    [[nodiscard]]
    void* address() noexcept
    {
        return empty() ? nullptr : m_data.data_address(m_type_id);
    }

    [[nodiscard]]
    const void* address() const noexcept
    {
        return empty() ? nullptr : m_data.data_address(m_type_id);
    }

    [[nodiscard]]
    host_ref ref() const noexcept
    {
        return {address(), m_type_id};
    }

    void reset() noexcept
    {
        if(!empty())
        {
            m_data.destroy(m_engine, m_type_id);
            m_type_id = AS_NAMESPACE_QUALIFIER asTYPEID_VOID;
        }
    }

    void enum_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine) const
    {
        if(empty() || is_primitive_type(m_type_id))
            return;
        m_data.enum_refs(engine->GetTypeInfoById(m_type_id));
    }

private:
    AS_NAMESPACE_QUALIFIER asIScriptEngine* m_engine = nullptr;
    int m_type_id = AS_NAMESPACE_QUALIFIER asTYPEID_VOID;
    container::single m_data;
};

template <typename T>
struct converter;

template <typename T>
concept native_convertible = requires(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref) {
    { converter<std::remove_cvref_t<T>>::to_native(engine, ref) } -> std::convertible_to<std::remove_cvref_t<T>>;
};

template <typename T>
concept host_convertible = requires(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, const std::remove_cvref_t<T>& val) {
    { converter<std::remove_cvref_t<T>>::to_host(engine, val) } -> std::same_as<host_value>;
};

/**
 * @brief The script type produced by `to_host` is known without a value
 */
template <typename T>
concept host_typed = host_convertible<T> &&
                     requires(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine) {
                         { converter<std::remove_cvref_t<T>>::type_id(engine) } -> std::convertible_to<int>;
                     };

template <native_convertible T>
[[nodiscard]]
std::remove_cvref_t<T> to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
{
    return converter<std::remove_cvref_t<T>>::to_native(engine, ref);
}

template <host_convertible T>
[[nodiscard]]
host_value to_host(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, const T& val)
{
    return converter<std::remove_cvref_t<T>>::to_host(engine, val);
}

template <host_typed T>
[[nodiscard]]
int host_type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    return converter<std::remove_cvref_t<T>>::type_id(engine);
}

namespace detail
{
    template <typename T>
    constexpr int integer_type_id() noexcept
    {
        if constexpr(std::is_signed_v<T>)
        {
            if constexpr(sizeof(T) == 1)
                return AS_NAMESPACE_QUALIFIER asTYPEID_INT8;
            else if constexpr(sizeof(T) == 2)
                return AS_NAMESPACE_QUALIFIER asTYPEID_INT16;
            else if constexpr(sizeof(T) == 4)
                return AS_NAMESPACE_QUALIFIER asTYPEID_INT32;
            else
                return AS_NAMESPACE_QUALIFIER asTYPEID_INT64;
        }
        else
        {
            if constexpr(sizeof(T) == 1)
                return AS_NAMESPACE_QUALIFIER asTYPEID_UINT8;
            else if constexpr(sizeof(T) == 2)
                return AS_NAMESPACE_QUALIFIER asTYPEID_UINT16;
            else if constexpr(sizeof(T) == 4)
                return AS_NAMESPACE_QUALIFIER asTYPEID_UINT32;
            else
                return AS_NAMESPACE_QUALIFIER asTYPEID_UINT64;
        }
    }

    template <typename T>
    concept script_integer = std::integral<T> && !std::same_as<T, bool> && sizeof(T) <= 8;
} // namespace detail

template <detail::script_integer T>
struct converter<T>
{
    static int type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine*) noexcept
    {
        return detail::integer_type_id<T>();
    }

    static T to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
    {
        if(!is_integral(ref.type_id) || !ref.address)
            throw marshal_error::type_mismatch(type_decl(engine, type_id(engine)), type_decl(engine, ref.type_id));

        return visit_primitive_type(
            [&]<typename U>(const U* val) -> T
            {
                if constexpr(detail::script_integer<U>)
                {
                    if(!std::in_range<T>(*val))
                    {
                        throw marshal_error(
                            error_kind::type_mismatch,
                            string_concat(
                                "integer ", std::to_string(*val), " out of range of ", type_decl(engine, type_id(engine))
                            )
                        );
                    }
                    return static_cast<T>(*val);
                }
                else
                    throw marshal_error::type_mismatch(type_decl(engine, type_id(engine)), type_decl(engine, ref.type_id));
            },
            ref.type_id,
            ref.address
        );
    }

    static host_value to_host(AS_NAMESPACE_QUALIFIER asIScriptEngine*, T val) noexcept
    {
        return host_value::from_primitive(detail::integer_type_id<T>(), val);
    }
};

template <>
struct converter<bool>
{
    static int type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine*) noexcept
    {
        return AS_NAMESPACE_QUALIFIER asTYPEID_BOOL;
    }

    static bool to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
    {
        if(!is_bool_type(ref.type_id) || !ref.address)
            throw marshal_error::type_mismatch("bool", type_decl(engine, ref.type_id));
        return *static_cast<const bool*>(ref.address);
    }

    static host_value to_host(AS_NAMESPACE_QUALIFIER asIScriptEngine*, bool val) noexcept
    {
        return host_value::from_primitive(AS_NAMESPACE_QUALIFIER asTYPEID_BOOL, val);
    }
};

template <std::floating_point T>
requires(std::same_as<T, float> || std::same_as<T, double>)
struct converter<T>
{
    static int type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine*) noexcept
    {
        return std::same_as<T, float> ?
                   AS_NAMESPACE_QUALIFIER asTYPEID_FLOAT :
                   AS_NAMESPACE_QUALIFIER asTYPEID_DOUBLE;
    }

    static T to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
    {
        if(ref.type_id == AS_NAMESPACE_QUALIFIER asTYPEID_FLOAT && ref.address)
            return static_cast<T>(*static_cast<const float*>(ref.address));
        if(ref.type_id == AS_NAMESPACE_QUALIFIER asTYPEID_DOUBLE && ref.address)
        {
            double val = *static_cast<const double*>(ref.address);
            if constexpr(std::same_as<T, float>)
            {
                if(std::isfinite(val) && std::abs(val) > std::numeric_limits<float>::max())
                {
                    throw marshal_error(
                        error_kind::type_mismatch,
                        string_concat("double ", std::to_string(val), " out of range of float")
                    );
                }
            }
            return static_cast<T>(val);
        }

        throw marshal_error::type_mismatch(type_decl(engine, type_id(engine)), type_decl(engine, ref.type_id));
    }

    static host_value to_host(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, T val) noexcept
    {
        return host_value::from_primitive(type_id(engine), val);
    }
};

/**
 * @brief Raw view of any script value, for functions taking `?&in`
 */
template <>
struct converter<host_ref>
{
    static host_ref to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine*, host_ref ref) noexcept
    {
        return ref;
    }
};

/**
 * @brief Named field of a record, see `record_traits`
 */
template <typename Class, typename Member>
struct record_field
{
    const char* name;
    Member Class::* member;
};

/**
 * @brief Describes a native aggregate as a record of named fields
 *
 * Specializations provide `static constexpr std::tuple fields{record_field{"name", &T::name}, ...};`
 */
template <typename T>
struct record_traits;

template <typename T>
concept record_type = requires {
    record_traits<T>::fields;
    std::tuple_size<std::remove_cvref_t<decltype(record_traits<T>::fields)>>::value;
};

/**
 * @brief Call `fn(name, member_ref)` for every field of a record
 */
template <record_type T, typename Fn>
void for_each_field(T& rec, Fn&& fn)
{
    std::apply(
        [&](const auto&... f)
        { (fn(f.name, rec.*(f.member)), ...); },
        record_traits<T>::fields
    );
}

template <record_type T, typename Fn>
void for_each_field(const T& rec, Fn&& fn)
{
    std::apply(
        [&](const auto&... f)
        { (fn(f.name, rec.*(f.member)), ...); },
        record_traits<T>::fields
    );
}

/**
 * @brief Find a property of a script class object by name
 *
 * @return View of the property, or nothing if the value is not a script object or has no such property
 */
[[nodiscard]]
std::optional<host_ref> find_object_property(host_ref obj, std::string_view name);

/**
 * @name Reading arguments and writing return values of generic calls
 */
/// @{

/**
 * @brief View an argument of a generic call following the `host_ref` convention
 */
[[nodiscard]]
host_ref generic_arg(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen, AS_NAMESPACE_QUALIFIER asUINT idx);

/**
 * @brief Store a value as the return value of a generic call
 *
 * @exception marshal_error The value's type differs from the declared return type
 */
void set_generic_return(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen, host_value& val);

/**
 * @brief View the return value of a finished context
 */
[[nodiscard]]
host_ref context_return(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx, AS_NAMESPACE_QUALIFIER asIScriptFunction* func);

/**
 * @brief Pass a value as an argument of a prepared context
 *
 * The value must outlive the execution when the parameter is a reference.
 *
 * @exception marshal_error The value's type differs from the declared parameter type
 */
void set_context_arg(
    AS_NAMESPACE_QUALIFIER asIScriptContext* ctx,
    AS_NAMESPACE_QUALIFIER asIScriptFunction* func,
    AS_NAMESPACE_QUALIFIER asUINT idx,
    host_value& val
);

/// @}

/**
 * @brief Assign a value to a script variable, e.g. an `?&out` argument
 *
 * Numbers are converted between integer and floating point types. Other values require the same type.
 *
 * @param dst Address of the variable following the `host_ref` convention
 * @return False if the types are not compatible
 */
bool assign_to(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine,
    void* dst,
    int dst_type_id,
    host_ref src
);

/**
 * @brief Compare type IDs ignoring the const flag of handles
 */
[[nodiscard]]
constexpr bool same_script_type(int lhs, int rhs) noexcept
{
    constexpr int mask = ~AS_NAMESPACE_QUALIFIER asTYPEID_HANDLETOCONST;
    return (lhs & mask) == (rhs & mask);
}
} // namespace asbridge

#endif
