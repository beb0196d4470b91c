/**
 * @file runtime.hpp
 * @brief Per-engine state of the bridge
 */

#ifndef ASBRIDGE_RUNTIME_HPP
#define ASBRIDGE_RUNTIME_HPP

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include "detail/include_as.hpp"
#include "utility.hpp"
#include "async.hpp"
#include "handle.hpp"

namespace asbridge
{
struct runtime_options
{
    /**
     * @brief Threads of the task scheduler
     */
    std::size_t worker_threads = 2;

    /**
     * @brief Receives errors with no script caller to report to, e.g. an exception inside a promise callback
     *
     * Errors are printed to `std::cerr` if empty.
     */
    std::function<void(std::string_view)> on_error;
};

/**
 * @brief Event loop, task scheduler and handle arenas bound to a script engine
 *
 * Create it on the host thread after the engine, and destroy it before the engine.
 * The engine keeps a pointer to the runtime as user data.
 */
class runtime
{
public:
    explicit runtime(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, runtime_options opts = {});

    runtime(const runtime&) = delete;
    runtime& operator=(const runtime&) = delete;

    /**
     * @brief Finish outstanding work, then clear every arena
     */
    ~runtime();

    /**
     * @brief Get the runtime bound to an engine
     *
     * @return Null if no runtime is bound
     */
    [[nodiscard]]
    static runtime* from_engine(const AS_NAMESPACE_QUALIFIER asIScriptEngine* engine) noexcept
    {
        if(!engine) [[unlikely]]
            return nullptr;
        return static_cast<runtime*>(engine->GetUserData(ASBRIDGE_RUNTIME_USER_ID));
    }

    [[nodiscard]]
    AS_NAMESPACE_QUALIFIER asIScriptEngine* get_engine() const noexcept
    {
        return m_engine;
    }

    [[nodiscard]]
    event_loop& loop() noexcept
    {
        return m_loop;
    }

    [[nodiscard]]
    task_scheduler& scheduler() noexcept
    {
        return m_scheduler;
    }

    /**
     * @brief Execute a prepared context, running the event loop whenever the script waits for a promise
     *
     * @return Final state of the context
     */
    int execute(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx);

    /**
     * @brief Run the event loop until all outstanding work is finished
     */
    void run();

    /**
     * @brief Report an error that has no caller to propagate to
     */
    void report_error(std::string_view msg);

    /**
     * @brief Arena of native objects of type T, created on first use
     */
    template <typename T>
    handle_arena<T>& arena()
    {
        return *arena_ptr<T>();
    }

    /**
     * @brief Shared ownership of an arena, for script objects that may outlive the runtime
     */
    template <typename T>
    std::shared_ptr<handle_arena<T>> arena_ptr()
    {
        auto& p = m_arenas[std::type_index(typeid(T))];
        if(!p)
            p = std::make_shared<handle_arena<T>>();
        return std::static_pointer_cast<handle_arena<T>>(p);
    }

private:
    AS_NAMESPACE_QUALIFIER asIScriptEngine* m_engine;
    runtime_options m_opts;
    event_loop m_loop;
    task_scheduler m_scheduler;
    std::unordered_map<std::type_index, std::shared_ptr<arena_base>> m_arenas;
};
} // namespace asbridge

#endif
