/**
 * @file bind.hpp
 * @brief Registering native functions and stateful native objects
 *
 * @details Every function is registered with the generic calling convention.
 *          The wrappers convert arguments with `to_native`, call the native function,
 *          and convert its result with `to_host`. A native exception becomes a script exception.
 *
 *          A native function may take `runtime&` as its first parameter, which receives the runtime
 *          bound to the engine instead of a script argument.
 */

#ifndef ASBRIDGE_BIND_HPP
#define ASBRIDGE_BIND_HPP

#pragma once

#include <cassert>
#include <cstddef>
#include <functional>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include "detail/include_as.hpp"
#include "utility.hpp"
#include "meta.hpp"
#include "error.hpp"
#include "marshal.hpp"
#include "runtime.hpp"
#include "handle.hpp"

namespace asbridge
{
namespace detail
{
    template <typename Fn>
    int with_cstr(Fn&& fn, std::string_view str)
    {
        std::string buf(str);
        return fn(buf.c_str());
    }

    template <typename T>
    constexpr bool is_runtime_param = std::is_same_v<std::remove_cvref_t<T>, runtime>;

    template <typename ArgsTuple>
    constexpr std::size_t script_arg_offset() noexcept
    {
        if constexpr(std::tuple_size_v<ArgsTuple> == 0)
            return 0;
        else
            return is_runtime_param<std::tuple_element_t<0, ArgsTuple>> ? 1 : 0;
    }

    inline runtime& generic_runtime(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        runtime* rt = runtime::from_engine(gen->GetEngine());
        if(!rt) [[unlikely]]
            throw bridge_error(error_kind::generic, "no runtime is bound to the engine");
        return *rt;
    }

    template <typename ArgsTuple, std::size_t Idx>
    auto fetch_arg(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        using param_t = std::tuple_element_t<Idx, ArgsTuple>;

        if constexpr(is_runtime_param<param_t>)
        {
            static_assert(Idx == 0, "runtime& must be the first parameter");
            return std::ref(generic_runtime(gen));
        }
        else
        {
            static_assert(
                !std::is_lvalue_reference_v<param_t> || std::is_const_v<std::remove_reference_t<param_t>>,
                "output parameters are not supported"
            );

            constexpr auto script_idx = static_cast<AS_NAMESPACE_QUALIFIER asUINT>(
                Idx - script_arg_offset<ArgsTuple>()
            );
            return to_native<std::remove_cvref_t<param_t>>(gen->GetEngine(), generic_arg(gen, script_idx));
        }
    }

    template <typename ArgsTuple, std::size_t... Is>
    auto fetch_args_impl(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen, std::index_sequence<Is...>)
    {
        // Braced initialization converts the arguments from left to right
        return std::tuple<decltype(fetch_arg<ArgsTuple, Is>(gen))...>{fetch_arg<ArgsTuple, Is>(gen)...};
    }

    template <typename ArgsTuple>
    auto fetch_args(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        return fetch_args_impl<ArgsTuple>(
            gen, std::make_index_sequence<std::tuple_size_v<ArgsTuple>>()
        );
    }

    template <typename R, typename Fn>
    void invoke_and_return(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen, Fn&& fn)
    {
        if constexpr(std::is_void_v<R>)
            fn();
        else if constexpr(std::same_as<std::remove_cvref_t<R>, host_value>)
        {
            host_value result = fn();
            set_generic_return(gen, result);
        }
        else
        {
            host_value result = to_host(gen->GetEngine(), fn());
            set_generic_return(gen, result);
        }
    }

    template <auto Function>
    void generic_function(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        using traits = function_traits<decltype(Function)>;
        static_assert(!traits::is_method_v);

        try
        {
            invoke_and_return<typename traits::return_type>(
                gen,
                [gen]() -> decltype(auto)
                { return std::apply(Function, fetch_args<typename traits::args_tuple>(gen)); }
            );
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }
} // namespace detail

/**
 * @brief Register global functions, funcdefs and properties
 */
class global
{
public:
    explicit global(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
        : m_engine(engine)
    {
        assert(m_engine != nullptr);
    }

    [[nodiscard]]
    AS_NAMESPACE_QUALIFIER asIScriptEngine* get_engine() const noexcept
    {
        return m_engine;
    }

    template <auto Function>
    global& function(std::string_view decl, fp_wrapper<Function>)
    {
        return function(decl, &detail::generic_function<Function>);
    }

    global& function(
        std::string_view decl,
        AS_NAMESPACE_QUALIFIER asGENFUNC_t gfn,
        void* auxiliary = nullptr
    )
    {
        [[maybe_unused]]
        int r = detail::with_cstr(
            [&](const char* decl)
            {
                return m_engine->RegisterGlobalFunction(
                    decl,
                    AS_NAMESPACE_QUALIFIER asFUNCTION(gfn),
                    AS_NAMESPACE_QUALIFIER asCALL_GENERIC,
                    auxiliary
                );
            },
            decl
        );
        assert(r >= 0);

        return *this;
    }

    global& funcdef(std::string_view decl)
    {
        [[maybe_unused]]
        int r = detail::with_cstr(
            [this](const char* decl)
            { return m_engine->RegisterFuncdef(decl); },
            decl
        );
        assert(r >= 0);

        return *this;
    }

    /**
     * @brief Register a global property
     *
     * @note A const value must be declared as const in `decl`
     */
    template <typename T>
    global& property(std::string_view decl, T& val)
    {
        void* ptr = const_cast<std::remove_const_t<T>*>(std::addressof(val));

        [[maybe_unused]]
        int r = detail::with_cstr(
            [&](const char* decl)
            { return m_engine->RegisterGlobalProperty(decl, ptr); },
            decl
        );
        assert(r >= 0);

        return *this;
    }

    global& message_callback(
        void (*callback)(const AS_NAMESPACE_QUALIFIER asSMessageInfo*, void*),
        void* param = nullptr
    )
    {
        [[maybe_unused]]
        int r = m_engine->SetMessageCallback(
            AS_NAMESPACE_QUALIFIER asFUNCTION(callback), param, AS_NAMESPACE_QUALIFIER asCALL_CDECL
        );
        assert(r >= 0);

        return *this;
    }

    /**
     * @brief Translate native exceptions escaping from registered functions
     */
    global& exception_translator()
    {
        [[maybe_unused]]
        int r = set_exception_translator(m_engine);
        // Without native calling conventions only the generic wrappers translate exceptions
        assert(r >= 0 || r == AS_NAMESPACE_QUALIFIER asNOT_SUPPORTED);

        return *this;
    }

private:
    AS_NAMESPACE_QUALIFIER asIScriptEngine* m_engine;
};

/**
 * @brief Script object referring to a native object in a `handle_arena`
 *
 * The native object is erased when the last script reference is released.
 * After the arena is cleared or the runtime is destroyed, every access raises `handle_error`.
 */
template <typename T>
class handle_shell
{
public:
    handle_shell(std::weak_ptr<handle_arena<T>> arena, handle_id id) noexcept
        : m_arena(std::move(arena)), m_id(id) {}

    handle_shell(const handle_shell&) = delete;
    handle_shell& operator=(const handle_shell&) = delete;

    void* operator new(std::size_t bytes)
    {
        return AS_NAMESPACE_QUALIFIER asAllocMem(bytes);
    }

    void operator delete(void* p)
    {
        AS_NAMESPACE_QUALIFIER asFreeMem(p);
    }

    void addref() noexcept
    {
        m_refcount.inc();
    }

    void release() noexcept
    {
        if(m_refcount.dec() == 0)
        {
            if(auto a = m_arena.lock())
                a->erase(m_id);
            delete this;
        }
    }

    /**
     * @exception handle_error The native object is gone
     */
    [[nodiscard]]
    T& get() const
    {
        auto a = m_arena.lock();
        T* ptr = a ? a->get(m_id) : nullptr;
        if(!ptr)
            throw handle_error();
        return *ptr;
    }

    [[nodiscard]]
    handle_id id() const noexcept
    {
        return m_id;
    }

private:
    ~handle_shell() = default;

    atomic_counter m_refcount;
    std::weak_ptr<handle_arena<T>> m_arena;
    handle_id m_id;
};

namespace detail
{
    template <typename Tuple>
    struct tuple_tail;

    template <typename First, typename... Rest>
    struct tuple_tail<std::tuple<First, Rest...>>
    {
        using type = std::tuple<Rest...>;
    };

    template <typename T>
    void shell_addref(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        static_cast<handle_shell<T>*>(gen->GetObject())->addref();
    }

    template <typename T>
    void shell_release(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        static_cast<handle_shell<T>*>(gen->GetObject())->release();
    }

    template <typename T, typename... Args>
    void shell_factory(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            auto args = fetch_args<std::tuple<Args...>>(gen);
            auto arena = generic_runtime(gen).arena_ptr<T>();
            handle_id id = std::apply(
                [&](auto&&... xs)
                { return arena->emplace(std::forward<decltype(xs)>(xs)...); },
                std::move(args)
            );

            auto* shell = new handle_shell<T>(arena, id);
            // The new reference belongs to the script
            gen->SetReturnAddress(shell);
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    template <typename T>
    struct value_self
    {
        using type = T;

        static T& get(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen) noexcept
        {
            return *static_cast<T*>(gen->GetObject());
        }
    };

    template <typename T>
    struct shell_self
    {
        using type = T;

        static T& get(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
        {
            return static_cast<handle_shell<T>*>(gen->GetObject())->get();
        }
    };

    /**
     * @brief Wrapper of a member function, or of a free function taking the object as its first parameter
     */
    template <typename Self, auto Method>
    void generic_method(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        using T = typename Self::type;
        using traits = function_traits<decltype(Method)>;

        try
        {
            T& self = Self::get(gen);
            if constexpr(traits::is_method_v)
            {
                static_assert(std::is_base_of_v<typename traits::class_type, T>);
                invoke_and_return<typename traits::return_type>(
                    gen,
                    [&]() -> decltype(auto)
                    {
                        return std::apply(
                            [&](auto&&... xs) -> decltype(auto)
                            { return (self.*Method)(std::forward<decltype(xs)>(xs)...); },
                            fetch_args<typename traits::args_tuple>(gen)
                        );
                    }
                );
            }
            else
            {
                using args_tuple = typename traits::args_tuple;
                static_assert(std::is_same_v<std::remove_cvref_t<std::tuple_element_t<0, args_tuple>>, T>);
                using rest_tuple = typename tuple_tail<args_tuple>::type;
                invoke_and_return<typename traits::return_type>(
                    gen,
                    [&]() -> decltype(auto)
                    {
                        return std::apply(
                            [&](auto&&... xs) -> decltype(auto)
                            { return Method(self, std::forward<decltype(xs)>(xs)...); },
                            fetch_args<rest_tuple>(gen)
                        );
                    }
                );
            }
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    template <typename T>
    void value_default_construct(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        new(gen->GetObject()) T();
    }

    template <typename T>
    void value_copy_construct(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        new(gen->GetObject()) T(*static_cast<const T*>(gen->GetArgObject(0)));
    }

    template <typename T>
    void value_destruct(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        static_cast<T*>(gen->GetObject())->~T();
    }

    template <typename T>
    void value_assign(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        T* self = static_cast<T*>(gen->GetObject());
        *self = *static_cast<const T*>(gen->GetArgObject(0));
        gen->SetReturnAddress(self);
    }

    template <typename T, typename... Args>
    void value_construct(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            std::apply(
                [gen](auto&&... xs)
                { new(gen->GetObject()) T(std::forward<decltype(xs)>(xs)...); },
                fetch_args<std::tuple<Args...>>(gen)
            );
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }
} // namespace detail

/**
 * @brief Register a reference type whose objects live in the runtime's `handle_arena<T>`
 */
template <typename T>
class handle_class
{
public:
    using value_type = T;

    handle_class(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, std::string name)
        : m_engine(engine), m_name(std::move(name))
    {
        [[maybe_unused]] int r = 0;
        r = m_engine->RegisterObjectType(m_name.c_str(), 0, AS_NAMESPACE_QUALIFIER asOBJ_REF);
        assert(r >= 0);

        behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_ADDREF, "void f()", &detail::shell_addref<T>);
        behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_RELEASE, "void f()", &detail::shell_release<T>);
    }

    [[nodiscard]]
    const std::string& name() const noexcept
    {
        return m_name;
    }

    /**
     * @brief Register a factory constructing T from the converted arguments
     *
     * @param params Parameter list of the script declaration, e.g. "int initial"
     */
    template <typename... Args>
    handle_class& factory(std::string_view params = {})
    {
        std::string decl = string_concat(m_name, "@ f(", params, ')');
        behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_FACTORY, decl.c_str(), &detail::shell_factory<T, Args...>);
        return *this;
    }

    /**
     * @brief Register a member function, or a free function taking `T&` as its first parameter
     */
    template <auto Method>
    handle_class& method(std::string_view decl, fp_wrapper<Method>)
    {
        [[maybe_unused]]
        int r = detail::with_cstr(
            [this](const char* decl)
            {
                return m_engine->RegisterObjectMethod(
                    m_name.c_str(),
                    decl,
                    AS_NAMESPACE_QUALIFIER asFUNCTION(&detail::generic_method<detail::shell_self<T>, Method>),
                    AS_NAMESPACE_QUALIFIER asCALL_GENERIC
                );
            },
            decl
        );
        assert(r >= 0);

        return *this;
    }

private:
    void behaviour(
        AS_NAMESPACE_QUALIFIER asEBehaviours beh,
        const char* decl,
        AS_NAMESPACE_QUALIFIER asGENFUNC_t gfn
    )
    {
        [[maybe_unused]]
        int r = m_engine->RegisterObjectBehaviour(
            m_name.c_str(), beh, decl, AS_NAMESPACE_QUALIFIER asFUNCTION(gfn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
        );
        assert(r >= 0);
    }

    AS_NAMESPACE_QUALIFIER asIScriptEngine* m_engine;
    std::string m_name;
};

/**
 * @brief Register a value type stored inline in script variables
 */
template <typename T>
class value_class
{
public:
    using value_type = T;

    value_class(
        AS_NAMESPACE_QUALIFIER asIScriptEngine* engine,
        std::string name,
        AS_NAMESPACE_QUALIFIER asQWORD flags = 0
    )
        : m_engine(engine), m_name(std::move(name))
    {
        [[maybe_unused]]
        int r = m_engine->RegisterObjectType(
            m_name.c_str(),
            sizeof(T),
            AS_NAMESPACE_QUALIFIER asOBJ_VALUE | AS_NAMESPACE_QUALIFIER asGetTypeTraits<T>() | flags
        );
        assert(r >= 0);
    }

    [[nodiscard]]
    const std::string& name() const noexcept
    {
        return m_name;
    }

    /**
     * @brief Register default constructor, copy constructor, destructor and copy assignment
     */
    value_class& behaviours_by_traits()
    {
        behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_CONSTRUCT, "void f()", &detail::value_default_construct<T>);
        behaviour(
            AS_NAMESPACE_QUALIFIER asBEHAVE_CONSTRUCT,
            string_concat("void f(const ", m_name, "&in)").c_str(),
            &detail::value_copy_construct<T>
        );
        behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_DESTRUCT, "void f()", &detail::value_destruct<T>);
        register_method(
            string_concat(m_name, "& opAssign(const ", m_name, "&in)"), &detail::value_assign<T>
        );
        return *this;
    }

    /**
     * @brief Register a constructor from the converted arguments
     */
    template <typename... Args>
    value_class& constructor(std::string_view params)
    {
        behaviour(
            AS_NAMESPACE_QUALIFIER asBEHAVE_CONSTRUCT,
            string_concat("void f(", params, ')').c_str(),
            &detail::value_construct<T, Args...>
        );
        return *this;
    }

    /**
     * @brief Register a member function, or a free function taking `T&` or `const T&` as its first parameter
     */
    template <auto Method>
    value_class& method(std::string_view decl, fp_wrapper<Method>)
    {
        register_method(decl, &detail::generic_method<detail::value_self<T>, Method>);
        return *this;
    }

    value_class& method(std::string_view decl, AS_NAMESPACE_QUALIFIER asGENFUNC_t gfn)
    {
        register_method(decl, gfn);
        return *this;
    }

    /**
     * @brief Use this type for string literals
     */
    value_class& as_string(AS_NAMESPACE_QUALIFIER asIStringFactory* factory)
    {
        [[maybe_unused]]
        int r = m_engine->RegisterStringFactory(m_name.c_str(), factory);
        assert(r >= 0);
        return *this;
    }

private:
    void behaviour(
        AS_NAMESPACE_QUALIFIER asEBehaviours beh,
        const char* decl,
        AS_NAMESPACE_QUALIFIER asGENFUNC_t gfn
    )
    {
        [[maybe_unused]]
        int r = m_engine->RegisterObjectBehaviour(
            m_name.c_str(), beh, decl, AS_NAMESPACE_QUALIFIER asFUNCTION(gfn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
        );
        assert(r >= 0);
    }

    void register_method(std::string_view decl, AS_NAMESPACE_QUALIFIER asGENFUNC_t gfn)
    {
        [[maybe_unused]]
        int r = detail::with_cstr(
            [&](const char* decl)
            {
                return m_engine->RegisterObjectMethod(
                    m_name.c_str(), decl, AS_NAMESPACE_QUALIFIER asFUNCTION(gfn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
                );
            },
            decl
        );
        assert(r >= 0);
    }

    AS_NAMESPACE_QUALIFIER asIScriptEngine* m_engine;
    std::string m_name;
};
} // namespace asbridge

#endif
