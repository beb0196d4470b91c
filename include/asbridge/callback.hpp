/**
 * @file callback.hpp
 * @brief Invoking script functions from native code
 */

#ifndef ASBRIDGE_CALLBACK_HPP
#define ASBRIDGE_CALLBACK_HPP

#pragma once

#include <array>
#include <optional>
#include <utility>
#include <variant>
#include "detail/include_as.hpp"
#include "utility.hpp"
#include "memory.hpp"
#include "error.hpp"
#include "marshal.hpp"
#include "runtime.hpp"

namespace asbridge
{
/**
 * @brief Result of a call into script code. Holds either the converted return value or a `call_error`.
 */
template <typename R>
class call_result
{
public:
    using value_type = R;

    call_result(R val)
        : m_data(std::in_place_index<0>, std::move(val)) {}

    call_result(call_error err)
        : m_data(std::in_place_index<1>, std::move(err)) {}

    [[nodiscard]]
    bool has_value() const noexcept
    {
        return m_data.index() == 0;
    }

    explicit operator bool() const noexcept
    {
        return has_value();
    }

    /**
     * @exception call_error The call failed
     */
    R& value() &
    {
        if(!has_value())
            throw error();
        return std::get<0>(m_data);
    }

    const R& value() const&
    {
        if(!has_value())
            throw error();
        return std::get<0>(m_data);
    }

    R&& value() &&
    {
        if(!has_value())
            throw error();
        return std::get<0>(std::move(m_data));
    }

    template <typename U>
    R value_or(U&& default_val) const&
    {
        if(!has_value())
            return static_cast<R>(std::forward<U>(default_val));
        return std::get<0>(m_data);
    }

    /**
     * @pre The call failed
     */
    [[nodiscard]]
    const call_error& error() const
    {
        return std::get<1>(m_data);
    }

private:
    std::variant<R, call_error> m_data;
};

template <>
class call_result<void>
{
public:
    using value_type = void;

    call_result() noexcept = default;

    call_result(call_error err)
        : m_err(std::move(err)) {}

    [[nodiscard]]
    bool has_value() const noexcept
    {
        return !m_err.has_value();
    }

    explicit operator bool() const noexcept
    {
        return has_value();
    }

    void value() const
    {
        if(m_err)
            throw *m_err;
    }

    [[nodiscard]]
    const call_error& error() const
    {
        return *m_err;
    }

private:
    std::optional<call_error> m_err;
};

template <typename Signature>
class script_callback;

/**
 * @brief Reference to a script function or delegate, callable as a native function
 *
 * Arguments are converted with `to_host`, and the return value with `to_native<R>`.
 * A call made off the host thread is posted to the event loop of the engine's runtime
 * and the calling thread blocks until the result is ready.
 * During a script call the active context is reused, so callbacks may be invoked from registered functions.
 */
template <typename R, typename... Args>
class script_callback<R(Args...)>
{
public:
    using result_type = call_result<R>;

    script_callback() noexcept = default;

    explicit script_callback(AS_NAMESPACE_QUALIFIER asIScriptFunction* fn) noexcept
        : m_fn(fn)
    {
        if(m_fn)
            m_fn->AddRef();
    }

    script_callback(const script_callback& other) noexcept
        : script_callback(other.m_fn) {}

    script_callback(script_callback&& other) noexcept
        : m_fn(std::exchange(other.m_fn, nullptr)) {}

    ~script_callback()
    {
        reset();
    }

    script_callback& operator=(const script_callback& other) noexcept
    {
        if(this != &other)
        {
            reset();
            m_fn = other.m_fn;
            if(m_fn)
                m_fn->AddRef();
        }
        return *this;
    }

    script_callback& operator=(script_callback&& other) noexcept
    {
        if(this != &other)
        {
            reset();
            m_fn = std::exchange(other.m_fn, nullptr);
        }
        return *this;
    }

    void reset() noexcept
    {
        if(m_fn)
        {
            m_fn->Release();
            m_fn = nullptr;
        }
    }

    [[nodiscard]]
    AS_NAMESPACE_QUALIFIER asIScriptFunction* target() const noexcept
    {
        return m_fn;
    }

    explicit operator bool() const noexcept
    {
        return m_fn != nullptr;
    }

    /**
     * @brief Call the script function, reporting failures in the result
     */
    result_type invoke(const Args&... args) const
    {
        if(!m_fn)
            return call_error(error_kind::invalid_handle, "callback is empty");

        runtime* rt = runtime::from_engine(m_fn->GetEngine());
        if(rt && !rt->loop().in_host_thread())
        {
            return rt->loop().call(
                [&]() -> result_type
                { return invoke_here(args...); }
            );
        }

        return invoke_here(args...);
    }

    /**
     * @brief Call the script function
     *
     * @exception call_error The call failed
     */
    R operator()(const Args&... args) const
    {
        if constexpr(std::is_void_v<R>)
            invoke(args...).value();
        else
            return invoke(args...).value();
    }

private:
    result_type invoke_here(const Args&... args) const
    {
        AS_NAMESPACE_QUALIFIER asIScriptEngine* engine = m_fn->GetEngine();

        if(m_fn->GetParamCount() != sizeof...(Args))
        {
            return call_error(
                error_kind::type_mismatch,
                string_concat(
                    "callback expects ",
                    std::to_string(m_fn->GetParamCount()),
                    " argument(s), got ",
                    std::to_string(sizeof...(Args))
                )
            );
        }

        try
        {
            // Converted arguments must outlive the execution
            std::array<host_value, sizeof...(Args)> hosted{to_host(engine, args)...};

            reuse_active_context ctx(engine);
            int r = ctx->Prepare(m_fn);
            if(r < 0)
            {
                return call_error::host_threw(string_concat(
                    "cannot prepare script function: ",
                    to_string(static_cast<AS_NAMESPACE_QUALIFIER asERetCodes>(r))
                ));
            }

            for(AS_NAMESPACE_QUALIFIER asUINT i = 0; i < hosted.size(); ++i)
                set_context_arg(ctx, m_fn, i, hosted[i]);

            // A top-level call on the host thread may wait for promises
            runtime* rt = runtime::from_engine(engine);
            if(rt && !ctx.is_nested())
                r = rt->execute(ctx);
            else
                r = ctx->Execute();
            switch(r)
            {
            case AS_NAMESPACE_QUALIFIER asEXECUTION_FINISHED:
                if constexpr(std::is_void_v<R>)
                    return result_type();
                else
                {
                    try
                    {
                        return to_native<R>(engine, context_return(ctx, m_fn));
                    }
                    catch(const marshal_error& e)
                    {
                        return call_error::bad_return_type(e.what());
                    }
                }

            case AS_NAMESPACE_QUALIFIER asEXECUTION_EXCEPTION:
                return from_host_exception(ctx);

            default:
                return call_error::host_threw(string_concat(
                    "script execution ended as ",
                    to_string(static_cast<AS_NAMESPACE_QUALIFIER asEContextState>(r))
                ));
            }
        }
        catch(const marshal_error& e)
        {
            return call_error(e.kind(), e.what());
        }
    }

    AS_NAMESPACE_QUALIFIER asIScriptFunction* m_fn = nullptr;
};

/**
 * @brief Script functions and delegates are received as callbacks. A null handle gives an empty callback.
 */
template <typename R, typename... Args>
struct converter<script_callback<R(Args...)>>
{
    static script_callback<R(Args...)> to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
    {
        if(is_void_type(ref.type_id))
            return {};

        auto* ti = engine->GetTypeInfoById(ref.type_id);
        if(!is_objhandle(ref.type_id) || !ti || !ti->GetFuncdefSignature())
            throw marshal_error::type_mismatch("function handle", type_decl(engine, ref.type_id));

        return script_callback<R(Args...)>(
            static_cast<AS_NAMESPACE_QUALIFIER asIScriptFunction*>(ref.object())
        );
    }
};
} // namespace asbridge

#endif
