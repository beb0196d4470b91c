/**
 * @file concurrent/threading.hpp
 * @brief AngelScript thread setup for the scheduler workers and the host
 */

#ifndef ASBRIDGE_CONCURRENT_THREADING_HPP
#define ASBRIDGE_CONCURRENT_THREADING_HPP

#pragma once

#include "../detail/include_as.hpp"

namespace asbridge::concurrent
{
/**
 * @brief Release the AngelScript data of the calling thread when it terminates
 *
 * Called by every worker of the task scheduler. Calling it again in the same thread has no effect.
 */
inline void auto_thread_cleanup() noexcept
{
    struct cleanup_guard
    {
        ~cleanup_guard()
        {
            AS_NAMESPACE_QUALIFIER asThreadCleanup();
        }
    };

    static thread_local cleanup_guard guard{};
}

/**
 * @brief Prepare AngelScript for worker threads
 *
 * @warning Call it on the host thread before creating any engine.
 *          The matching `asUnprepareMultithread` runs at program exit.
 */
inline void prepare_multithread(
    AS_NAMESPACE_QUALIFIER asIThreadManager* external_mgr = nullptr
)
{
    struct prepare_guard
    {
        explicit prepare_guard(AS_NAMESPACE_QUALIFIER asIThreadManager* mgr)
        {
            AS_NAMESPACE_QUALIFIER asPrepareMultithread(mgr);
        }

        ~prepare_guard()
        {
            AS_NAMESPACE_QUALIFIER asUnprepareMultithread();
        }
    };

    static prepare_guard guard{external_mgr};
}
} // namespace asbridge::concurrent

#endif
