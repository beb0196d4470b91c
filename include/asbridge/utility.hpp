/**
 * @file utility.hpp
 * @brief Type ID helpers and small utilities shared by the bridge
 */

#ifndef ASBRIDGE_UTILITY_HPP
#define ASBRIDGE_UTILITY_HPP

#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>
#include <mutex> // IWYU pragma: export `std::lock_guard`
#include <functional>
#include <type_traits>
#include <stdexcept>
#include <concepts>
#include "detail/config.hpp" // IWYU pragma: export configs
#include "detail/include_as.hpp"

namespace asbridge
{
template <int TypeId>
requires(!(TypeId & ~(AS_NAMESPACE_QUALIFIER asTYPEID_MASK_SEQNBR)))
struct primitive_type_of;

#define ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF(as_type_id, cpp_type, script_decl) \
    template <>                                                               \
    struct primitive_type_of<AS_NAMESPACE_QUALIFIER as_type_id>               \
    {                                                                         \
        using type = cpp_type;                                                \
        static constexpr char decl[] = script_decl;                           \
    };

ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF(asTYPEID_BOOL, bool, "bool");
ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF(asTYPEID_INT8, std::int8_t, "int8");
ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF(asTYPEID_INT16, std::int16_t, "int16");
ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF(asTYPEID_INT32, std::int32_t, "int");
ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF(asTYPEID_INT64, std::int64_t, "int64");
ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF(asTYPEID_UINT8, std::uint8_t, "uint8");
ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF(asTYPEID_UINT16, std::uint16_t, "uint16");
ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF(asTYPEID_UINT32, std::uint32_t, "uint");
ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF(asTYPEID_UINT64, std::uint64_t, "uint64");
ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF(asTYPEID_FLOAT, float, "float");
ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF(asTYPEID_DOUBLE, double, "double");

#undef ASBRIDGE_UTILITY_PRIMITIVE_TYPE_OF

template <int TypeId>
using primitive_type_of_t = typename primitive_type_of<TypeId>::type;

/**
 * @name Type ID predicates
 */
/// @{

[[nodiscard]]
constexpr bool is_void_type(int type_id) noexcept
{
    return type_id == AS_NAMESPACE_QUALIFIER asTYPEID_VOID;
}

/**
 * @brief Primitive types include enums but exclude void
 */
[[nodiscard]]
constexpr bool is_primitive_type(int type_id) noexcept
{
    return !is_void_type(type_id) &&
           !(type_id & ~(AS_NAMESPACE_QUALIFIER asTYPEID_MASK_SEQNBR));
}

[[nodiscard]]
constexpr bool is_enum_type(int type_id) noexcept
{
    return is_primitive_type(type_id) &&
           type_id > AS_NAMESPACE_QUALIFIER asTYPEID_DOUBLE;
}

[[nodiscard]]
constexpr bool is_bool_type(int type_id) noexcept
{
    return type_id == AS_NAMESPACE_QUALIFIER asTYPEID_BOOL;
}

[[nodiscard]]
constexpr bool is_floating_point(int type_id) noexcept
{
    return type_id == AS_NAMESPACE_QUALIFIER asTYPEID_FLOAT ||
           type_id == AS_NAMESPACE_QUALIFIER asTYPEID_DOUBLE;
}

/**
 * @brief Integer types and enums, bool excluded
 */
[[nodiscard]]
constexpr bool is_integral(int type_id) noexcept
{
    return (type_id >= AS_NAMESPACE_QUALIFIER asTYPEID_INT8 &&
            type_id <= AS_NAMESPACE_QUALIFIER asTYPEID_UINT64) ||
           is_enum_type(type_id);
}

[[nodiscard]]
constexpr bool is_objhandle(int type_id) noexcept
{
    return type_id & AS_NAMESPACE_QUALIFIER asTYPEID_OBJHANDLE;
}

/// @}

/**
 * @brief Get the type ID of the registered script string, or a negative value if no string factory exists
 */
[[nodiscard]]
inline int get_script_string_type(
    const AS_NAMESPACE_QUALIFIER asIScriptEngine* engine
)
{
    return engine->GetStringFactory();
}

/**
 * @brief Readable declaration of a type ID, used in error messages
 */
[[nodiscard]]
inline std::string type_decl(
    const AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, int type_id
)
{
    if(is_void_type(type_id))
        return "void";
    const char* decl = engine->GetTypeDeclaration(type_id, true);
    return decl ? std::string(decl) : std::string("<unknown type>");
}

/**
 * @brief Check if objects of a type may take part in a reference cycle
 *
 * @param ti Type info, or null for primitive types
 */
[[nodiscard]]
inline bool type_requires_gc(const AS_NAMESPACE_QUALIFIER asITypeInfo* ti)
{
    if(!ti) [[unlikely]]
        return false;

    auto flags = ti->GetFlags();

    if(flags & AS_NAMESPACE_QUALIFIER asOBJ_REF)
        return !(flags & AS_NAMESPACE_QUALIFIER asOBJ_NOCOUNT);

    return (flags & AS_NAMESPACE_QUALIFIER asOBJ_VALUE) &&
           (flags & AS_NAMESPACE_QUALIFIER asOBJ_GC);
}

/**
 * @brief Copy a primitive value of the given type
 *
 * @return Bytes copied
 */
inline std::size_t copy_primitive_value(void* dst, const void* src, int type_id)
{
    assert(is_primitive_type(type_id));

    switch(type_id)
    {
    case AS_NAMESPACE_QUALIFIER asTYPEID_BOOL:
    case AS_NAMESPACE_QUALIFIER asTYPEID_INT8:
    case AS_NAMESPACE_QUALIFIER asTYPEID_UINT8:
        std::memcpy(dst, src, 1);
        return 1;

    case AS_NAMESPACE_QUALIFIER asTYPEID_INT16:
    case AS_NAMESPACE_QUALIFIER asTYPEID_UINT16:
        std::memcpy(dst, src, 2);
        return 2;

    case AS_NAMESPACE_QUALIFIER asTYPEID_INT64:
    case AS_NAMESPACE_QUALIFIER asTYPEID_UINT64:
    case AS_NAMESPACE_QUALIFIER asTYPEID_DOUBLE:
        std::memcpy(dst, src, 8);
        return 8;

    default: // 32-bit values and enums
        std::memcpy(dst, src, 4);
        return 4;
    }
}

/**
 * @brief Dispatch a pointer to a primitive value to a visitor taking a typed pointer
 *
 * @param vis Callable accepting a pointer to every primitive type
 * @param type_id Primitive type ID. Enums are visited as `std::int32_t`.
 * @param ptr Address of the value
 */
template <typename Visitor, typename VoidPtr>
requires std::same_as<std::remove_cv_t<std::remove_pointer_t<VoidPtr>>, void>
decltype(auto) visit_primitive_type(Visitor&& vis, int type_id, VoidPtr ptr)
{
    assert(is_primitive_type(type_id));

    auto as = [&]<typename T>(std::in_place_type_t<T>) -> decltype(auto)
    {
        using pointer = std::conditional_t<
            std::is_const_v<std::remove_pointer_t<VoidPtr>>,
            const T*,
            T*>;
        return std::invoke(std::forward<Visitor>(vis), static_cast<pointer>(ptr));
    };

#define ASBRIDGE_VISIT_CASE(as_type_id) \
case AS_NAMESPACE_QUALIFIER as_type_id: \
    return as(std::in_place_type<primitive_type_of_t<AS_NAMESPACE_QUALIFIER as_type_id>>)

    switch(type_id)
    {
        ASBRIDGE_VISIT_CASE(asTYPEID_BOOL);
        ASBRIDGE_VISIT_CASE(asTYPEID_INT8);
        ASBRIDGE_VISIT_CASE(asTYPEID_INT16);
        ASBRIDGE_VISIT_CASE(asTYPEID_INT64);
        ASBRIDGE_VISIT_CASE(asTYPEID_UINT8);
        ASBRIDGE_VISIT_CASE(asTYPEID_UINT16);
        ASBRIDGE_VISIT_CASE(asTYPEID_UINT32);
        ASBRIDGE_VISIT_CASE(asTYPEID_UINT64);
        ASBRIDGE_VISIT_CASE(asTYPEID_FLOAT);
        ASBRIDGE_VISIT_CASE(asTYPEID_DOUBLE);
    default: // int32 and enums
        ASBRIDGE_VISIT_CASE(asTYPEID_INT32);
    }

#undef ASBRIDGE_VISIT_CASE
}

namespace detail
{
    class as_exclusive_lock_t
    {
    public:
        static void lock()
        {
            AS_NAMESPACE_QUALIFIER asAcquireExclusiveLock();
        }

        static void unlock()
        {
            AS_NAMESPACE_QUALIFIER asReleaseExclusiveLock();
        }
    };

    template <typename T>
    concept concat_accepted =
        std::convertible_to<T, std::string_view> ||
        std::same_as<std::remove_cvref_t<T>, char>;

    inline void concat_one(std::string& out, std::string_view sv)
    {
        out.append(sv);
    }

    inline void concat_one(std::string& out, char ch)
    {
        out.push_back(ch);
    }
} // namespace detail

/**
 * @brief Lockable wrapper of `asAcquireExclusiveLock()` / `asReleaseExclusiveLock()`
 */
inline constexpr detail::as_exclusive_lock_t as_exclusive_lock = {};

/**
 * @brief Concatenate string-like values and characters
 */
template <detail::concat_accepted... Args>
std::string string_concat(Args&&... args)
{
    std::string out;
    (detail::concat_one(out, std::forward<Args>(args)), ...);
    return out;
}

inline std::string to_string(AS_NAMESPACE_QUALIFIER asEContextState state)
{
    switch(state)
    {
    case AS_NAMESPACE_QUALIFIER asEXECUTION_FINISHED:
        return "asEXECUTION_FINISHED";
    case AS_NAMESPACE_QUALIFIER asEXECUTION_SUSPENDED:
        return "asEXECUTION_SUSPENDED";
    case AS_NAMESPACE_QUALIFIER asEXECUTION_ABORTED:
        return "asEXECUTION_ABORTED";
    case AS_NAMESPACE_QUALIFIER asEXECUTION_EXCEPTION:
        return "asEXECUTION_EXCEPTION";
    case AS_NAMESPACE_QUALIFIER asEXECUTION_PREPARED:
        return "asEXECUTION_PREPARED";
    case AS_NAMESPACE_QUALIFIER asEXECUTION_UNINITIALIZED:
        return "asEXECUTION_UNINITIALIZED";
    case AS_NAMESPACE_QUALIFIER asEXECUTION_ACTIVE:
        return "asEXECUTION_ACTIVE";
    case AS_NAMESPACE_QUALIFIER asEXECUTION_ERROR:
        return "asEXECUTION_ERROR";
    case AS_NAMESPACE_QUALIFIER asEXECUTION_DESERIALIZATION:
        return "asEXECUTION_DESERIALIZATION";

    [[unlikely]] default:
        return string_concat("asEContextState(", std::to_string(static_cast<int>(state)), ')');
    }
}

/**
 * @brief Name of a return code, only the codes produced by registration and execution are spelled out
 */
inline std::string to_string(AS_NAMESPACE_QUALIFIER asERetCodes ret)
{
    switch(ret)
    {
    case AS_NAMESPACE_QUALIFIER asSUCCESS:
        return "asSUCCESS";
    case AS_NAMESPACE_QUALIFIER asERROR:
        return "asERROR";
    case AS_NAMESPACE_QUALIFIER asCONTEXT_ACTIVE:
        return "asCONTEXT_ACTIVE";
    case AS_NAMESPACE_QUALIFIER asCONTEXT_NOT_PREPARED:
        return "asCONTEXT_NOT_PREPARED";
    case AS_NAMESPACE_QUALIFIER asINVALID_ARG:
        return "asINVALID_ARG";
    case AS_NAMESPACE_QUALIFIER asNO_FUNCTION:
        return "asNO_FUNCTION";
    case AS_NAMESPACE_QUALIFIER asNOT_SUPPORTED:
        return "asNOT_SUPPORTED";
    case AS_NAMESPACE_QUALIFIER asINVALID_NAME:
        return "asINVALID_NAME";
    case AS_NAMESPACE_QUALIFIER asNAME_TAKEN:
        return "asNAME_TAKEN";
    case AS_NAMESPACE_QUALIFIER asINVALID_DECLARATION:
        return "asINVALID_DECLARATION";
    case AS_NAMESPACE_QUALIFIER asINVALID_OBJECT:
        return "asINVALID_OBJECT";
    case AS_NAMESPACE_QUALIFIER asINVALID_TYPE:
        return "asINVALID_TYPE";
    case AS_NAMESPACE_QUALIFIER asALREADY_REGISTERED:
        return "asALREADY_REGISTERED";
    case AS_NAMESPACE_QUALIFIER asWRONG_CONFIG_GROUP:
        return "asWRONG_CONFIG_GROUP";
    case AS_NAMESPACE_QUALIFIER asILLEGAL_BEHAVIOUR_FOR_TYPE:
        return "asILLEGAL_BEHAVIOUR_FOR_TYPE";
    case AS_NAMESPACE_QUALIFIER asWRONG_CALLING_CONV:
        return "asWRONG_CALLING_CONV";
    case AS_NAMESPACE_QUALIFIER asOUT_OF_MEMORY:
        return "asOUT_OF_MEMORY";

    [[unlikely]] default:
        return string_concat("asERetCodes(", std::to_string(static_cast<int>(ret)), ')');
    }
}

/**
 * @brief Get the context executing the current script function, or null outside of script execution
 */
[[nodiscard]]
inline auto current_context()
    -> AS_NAMESPACE_QUALIFIER asIScriptContext*
{
    return AS_NAMESPACE_QUALIFIER asGetActiveContext();
}

/**
 * @brief Set the script exception on the active context. No effect outside of script execution.
 */
inline void set_script_exception(std::string_view info)
{
    AS_NAMESPACE_QUALIFIER asIScriptContext* ctx = current_context();
    if(!ctx)
        return;
    std::string buf(info);
    ctx->SetException(buf.c_str());
}

/**
 * @brief Script string created by the string factory of an engine
 *
 * Lets code without knowledge of the registered string type pass text to script functions.
 */
class string_constant
{
public:
    string_constant(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, std::string_view str)
    {
        engine->GetStringFactory(nullptr, &m_factory);
        if(!m_factory) [[unlikely]]
            throw std::runtime_error("string factory is not registered");

        m_str = m_factory->GetStringConstant(
            str.data(), static_cast<AS_NAMESPACE_QUALIFIER asUINT>(str.size())
        );
        if(!m_str) [[unlikely]]
            throw std::runtime_error("failed to create string constant");
    }

    string_constant(const string_constant&) = delete;
    string_constant& operator=(const string_constant&) = delete;

    ~string_constant()
    {
        m_factory->ReleaseStringConstant(m_str);
    }

    /**
     * @brief Address of the script string object
     */
    [[nodiscard]]
    const void* get() const noexcept
    {
        return m_str;
    }

private:
    AS_NAMESPACE_QUALIFIER asIStringFactory* m_factory = nullptr;
    const void* m_str = nullptr;
};

/**
 * @brief Reference counter built on `asAtomicInc` and `asAtomicDec`
 *
 * @note The initial value is 1
 */
class atomic_counter
{
public:
    atomic_counter() noexcept
        : m_val(1) {}

    atomic_counter(const atomic_counter&) = delete;

    int inc() noexcept
    {
        return AS_NAMESPACE_QUALIFIER asAtomicInc(m_val);
    }

    int dec() noexcept
    {
        return AS_NAMESPACE_QUALIFIER asAtomicDec(m_val);
    }

    operator int() const noexcept
    {
        return m_val;
    }

    int operator++() noexcept
    {
        return inc();
    }

    int operator--() noexcept
    {
        return dec();
    }

private:
    int m_val;
};

/**
 * @brief View of an initialization list buffer with repeated elements, e.g. `{repeat T}`
 */
class script_init_list_repeat
{
public:
    using size_type = AS_NAMESPACE_QUALIFIER asUINT;

    explicit script_init_list_repeat(void* list_buf) noexcept
    {
        assert(list_buf);
        m_size = *static_cast<size_type*>(list_buf);
        m_data = static_cast<std::byte*>(list_buf) + sizeof(size_type);
    }

    /**
     * @param idx Parameter index of the list. Template types receive the type info first, so it is 1 for them.
     */
    explicit script_init_list_repeat(
        AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen,
        size_type idx = 0
    )
        : script_init_list_repeat(*static_cast<void**>(gen->GetAddressOfArg(idx))) {}

    [[nodiscard]]
    size_type size() const noexcept
    {
        return m_size;
    }

    [[nodiscard]]
    void* data() const noexcept
    {
        return m_data;
    }

private:
    size_type m_size;
    void* m_data;
};
} // namespace asbridge

#endif
