/**
 * @file promise.hpp
 * @brief Script promise settled by native computations
 *
 * @details A native async function creates a `promise<T>` with `spawn` and returns it to the script immediately.
 *          The computation runs on the task scheduler and settles the promise through a `completion<T>`.
 *          Settlement, value conversion and callbacks always happen on the host thread.
 */

#ifndef ASBRIDGE_PROMISE_HPP
#define ASBRIDGE_PROMISE_HPP

#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>
#include "detail/include_as.hpp"
#include "utility.hpp"
#include "error.hpp"
#include "marshal.hpp"
#include "runtime.hpp"

namespace asbridge
{
namespace detail
{
    struct promise_access;
} // namespace detail

/**
 * @brief Object of the script type `promise<T>`
 *
 * A promise starts pending and is settled at most once. After that its state and value never change.
 */
class script_promise
{
public:
    enum class state_type
    {
        pending,
        resolved,
        rejected
    };

    script_promise(const script_promise&) = delete;
    script_promise& operator=(const script_promise&) = delete;

    void* operator new(std::size_t bytes);
    void operator delete(void* p);

    /**
     * @brief Create a pending promise of a value type
     *
     * @return New promise, whose reference belongs to the caller
     *
     * @exception bridge_error `promise<T>` is not registered or cannot be instantiated for the type
     */
    [[nodiscard]]
    static script_promise* create(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, int value_type_id);

    void addref() noexcept;
    void release() noexcept;

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
    AS_NAMESPACE_QUALIFIER asIScriptEngine* get_engine() const noexcept
    {
        return m_ti->GetEngine();
    }

    [[nodiscard]]
    int value_type_id() const noexcept
    {
        return m_ti->GetSubTypeId();
    }

    [[nodiscard]]
    state_type state() const noexcept
    {
        return m_state;
    }

    [[nodiscard]]
    bool is_pending() const noexcept
    {
        return m_state == state_type::pending;
    }

    [[nodiscard]]
    bool is_resolved() const noexcept
    {
        return m_state == state_type::resolved;
    }

    [[nodiscard]]
    bool is_rejected() const noexcept
    {
        return m_state == state_type::rejected;
    }

    /**
     * @brief View of the resolved value
     *
     * @pre The promise is resolved
     */
    [[nodiscard]]
    host_ref value() const noexcept
    {
        assert(is_resolved());
        return m_value.ref();
    }

    /**
     * @pre The promise is rejected
     */
    [[nodiscard]]
    const error_value& reason() const noexcept
    {
        assert(is_rejected());
        return m_reason;
    }

    /**
     * @name Script interface
     */
    /// @{

    /**
     * @brief Resolved value, or a script exception if the promise is not resolved
     */
    const void* script_value() const;

    /**
     * @brief Rejection message, or an empty string unless rejected
     */
    [[nodiscard]]
    std::string script_reason() const;

    /**
     * @brief Register callbacks run on the event loop after settlement, in registration order
     *
     * Callbacks of an already settled promise are scheduled immediately.
     */
    void then(
        AS_NAMESPACE_QUALIFIER asIScriptFunction* on_resolved,
        AS_NAMESPACE_QUALIFIER asIScriptFunction* on_rejected
    );

    /**
     * @brief Suspend the calling context until the promise is settled
     *
     * The context must be executed by `runtime::execute`, which runs the event loop in the meantime.
     */
    void wait();

    /// @}

private:
    friend struct detail::promise_access;

    explicit script_promise(AS_NAMESPACE_QUALIFIER asITypeInfo* ti);
    ~script_promise();

    void resolve(host_value&& val);
    void reject(error_value err);
    void schedule_callbacks();

    struct callback_pair
    {
        AS_NAMESPACE_QUALIFIER asIScriptFunction* on_resolved = nullptr;
        AS_NAMESPACE_QUALIFIER asIScriptFunction* on_rejected = nullptr;
    };

    void run_callback(const callback_pair& cb);

    AS_NAMESPACE_QUALIFIER asITypeInfo* m_ti;
    atomic_counter m_refcount;
    bool m_gc_flag = false;
    state_type m_state = state_type::pending;
    host_value m_value;
    error_value m_reason;
    std::vector<callback_pair> m_callbacks;
};

namespace detail
{
    struct promise_access
    {
        static void resolve(script_promise& p, host_value&& val)
        {
            p.resolve(std::move(val));
        }

        static void reject(script_promise& p, error_value err)
        {
            p.reject(std::move(err));
        }
    };
} // namespace detail

/**
 * @brief Counted reference to a promise
 */
class promise_handle
{
public:
    promise_handle() noexcept = default;

    /**
     * @brief Take over a reference that is already counted
     */
    explicit promise_handle(script_promise* p) noexcept
        : m_ptr(p) {}

    promise_handle(const promise_handle& other) noexcept
        : m_ptr(other.m_ptr)
    {
        if(m_ptr)
            m_ptr->addref();
    }

    promise_handle(promise_handle&& other) noexcept
        : m_ptr(std::exchange(other.m_ptr, nullptr)) {}

    ~promise_handle()
    {
        reset();
    }

    promise_handle& operator=(promise_handle other) noexcept
    {
        std::swap(m_ptr, other.m_ptr);
        return *this;
    }

    void reset() noexcept
    {
        if(m_ptr)
            std::exchange(m_ptr, nullptr)->release();
    }

    /**
     * @brief Give up the reference without releasing it
     */
    [[nodiscard]]
    script_promise* release() noexcept
    {
        return std::exchange(m_ptr, nullptr);
    }

    [[nodiscard]]
    script_promise* get() const noexcept
    {
        return m_ptr;
    }

    script_promise* operator->() const noexcept
    {
        return m_ptr;
    }

    script_promise& operator*() const noexcept
    {
        return *m_ptr;
    }

    explicit operator bool() const noexcept
    {
        return m_ptr != nullptr;
    }

private:
    script_promise* m_ptr = nullptr;
};

template <>
struct converter<promise_handle>
{
    static promise_handle to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref);
    static host_value to_host(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, const promise_handle& p);
};

/**
 * @brief One-shot right to settle a promise
 *
 * Resolving or rejecting consumes the completion. A completion destroyed without being consumed
 * rejects its promise with "computation abandoned". It may be used from any thread.
 */
template <host_typed T>
class completion
{
public:
    completion(const completion&) = delete;
    completion& operator=(const completion&) = delete;

    completion(completion&& other) noexcept
        : m_rt(other.m_rt), m_promise(std::exchange(other.m_promise, nullptr)) {}

    ~completion()
    {
        if(m_promise)
            std::move(*this).reject(error_value{error_kind::generic, "computation abandoned"});
    }

    /**
     * @brief Create a completion of a promise
     *
     * @note Host thread only
     */
    [[nodiscard]]
    static completion make(runtime& rt, script_promise& p)
    {
        p.addref();
        rt.loop().add_work();
        return completion(rt, p);
    }

    /**
     * @brief Resolve the promise. The value is converted on the host thread.
     *
     * @exception bridge_error The completion has already settled its promise
     */
    void resolve(T val) &&
    {
        settle(
            [val = std::move(val)](script_promise& p)
            {
                try
                {
                    detail::promise_access::resolve(p, to_host(p.get_engine(), val));
                }
                catch(...)
                {
                    detail::promise_access::reject(p, error_value::from_exception(std::current_exception()));
                }
            }
        );
    }

    void reject(error_value err) &&
    {
        settle(
            [err = std::move(err)](script_promise& p)
            { detail::promise_access::reject(p, err); }
        );
    }

    void reject(std::exception_ptr ex) &&
    {
        std::move(*this).reject(error_value::from_exception(ex));
    }

    [[nodiscard]]
    bool consumed() const noexcept
    {
        return m_promise == nullptr;
    }

private:
    completion(runtime& rt, script_promise& p) noexcept
        : m_rt(&rt), m_promise(&p) {}

    template <typename Fn>
    void settle(Fn&& fn)
    {
        if(!m_promise)
            throw bridge_error(error_kind::generic, "completion already settled");

        script_promise* p = std::exchange(m_promise, nullptr);
        event_loop& loop = m_rt->loop();
        loop.post(
            [p, &loop, fn = std::forward<Fn>(fn)]()
            {
                fn(*p);
                p->release();
                loop.finish_work();
            }
        );
    }

    runtime* m_rt;
    script_promise* m_promise;
};

/**
 * @brief Run a computation on the task scheduler and return a promise of its result
 *
 * An exception thrown by the computation rejects the promise.
 *
 * @note Host thread only
 */
template <host_typed T, std::invocable Fn>
requires std::convertible_to<std::invoke_result_t<Fn&>, T>
[[nodiscard]]
promise_handle spawn(runtime& rt, Fn fn)
{
    promise_handle p(script_promise::create(rt.get_engine(), host_type_id<T>(rt.get_engine())));
    auto done = std::make_shared<completion<T>>(completion<T>::make(rt, *p));

    rt.scheduler().post(
        [done, fn = std::move(fn)]() mutable
        {
            std::optional<T> result;
            try
            {
                result.emplace(fn());
            }
            catch(...)
            {
                std::move(*done).reject(std::current_exception());
                return;
            }
            std::move(*done).resolve(std::move(*result));
        }
    );

    return p;
}

/**
 * @brief Start an asynchronous operation on the task scheduler that settles the promise later
 *
 * The operation receives the completion and may hand it to a timer or another thread.
 *
 * @note Host thread only
 */
template <host_typed T, typename Fn>
requires std::invocable<Fn&, completion<T>>
[[nodiscard]]
promise_handle spawn_continuation(runtime& rt, Fn fn)
{
    promise_handle p(script_promise::create(rt.get_engine(), host_type_id<T>(rt.get_engine())));
    auto done = std::make_shared<completion<T>>(completion<T>::make(rt, *p));

    rt.scheduler().post(
        [done, fn = std::move(fn)]() mutable
        {
            try
            {
                fn(std::move(*done));
            }
            catch(...)
            {
                if(!done->consumed())
                    std::move(*done).reject(std::current_exception());
            }
        }
    );

    return p;
}

/**
 * @brief Register `promise<T>`
 *
 * @pre A string type is registered
 */
void register_script_promise(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);
} // namespace asbridge

#endif
