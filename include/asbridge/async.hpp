/**
 * @file async.hpp
 * @brief Host event loop and native task scheduler
 *
 * @details Script objects are only touched on the host thread, which runs the `event_loop`.
 *          Native computations run on the `task_scheduler` and hand their results back
 *          by posting tasks to the loop.
 */

#ifndef ASBRIDGE_ASYNC_HPP
#define ASBRIDGE_ASYNC_HPP

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace asbridge
{
/**
 * @brief Task queue of the host thread
 *
 * Besides queued tasks the loop counts outstanding asynchronous operations,
 * so that `run()` knows whether more tasks can still arrive.
 */
class event_loop
{
public:
    using task_type = std::function<void()>;

    /**
     * @brief Create a loop owned by the calling thread
     */
    event_loop();

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;

    ~event_loop();

    /**
     * @brief Queue a task for the host thread. Thread-safe.
     */
    void post(task_type task);

    [[nodiscard]]
    bool in_host_thread() const noexcept
    {
        return std::this_thread::get_id() == m_host_thread;
    }

    /**
     * @brief Mark the start of an asynchronous operation that will post its completion later
     */
    void add_work();

    /**
     * @brief Mark the end of an asynchronous operation
     */
    void finish_work();

    [[nodiscard]]
    std::size_t pending_work() const;

    /**
     * @brief Run the tasks already queued without waiting
     *
     * If a task throws, the exception propagates and the tasks after it are kept in the queue.
     *
     * @return Number of tasks executed
     */
    std::size_t run_pending();

    /**
     * @brief Run tasks until the predicate holds
     *
     * @return False if the predicate is still false while no task is queued and no work is outstanding
     */
    bool run_until(const std::function<bool()>& done);

    /**
     * @brief Run tasks until no task is queued and no work is outstanding
     */
    void run();

    /**
     * @brief Run a callable on the host thread and wait for its result
     *
     * Called on the host thread, the callable runs immediately.
     * Exceptions thrown by the callable are rethrown to the caller.
     */
    template <typename Fn>
    auto call(Fn&& fn) -> std::invoke_result_t<Fn&>
    {
        if(in_host_thread())
            return fn();

        using result_type = std::invoke_result_t<Fn&>;
        auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<Fn>(fn));
        std::future<result_type> result = task->get_future();
        post([task]()
             { (*task)(); });
        return result.get();
    }

private:
    bool wait_and_run_one(std::unique_lock<std::mutex>& lock);

    std::thread::id m_host_thread;
    mutable std::mutex m_mx;
    std::condition_variable m_cv;
    std::deque<task_type> m_tasks;
    std::size_t m_pending_work = 0;
};

/**
 * @brief Worker pool with a timer queue for native computations
 *
 * Tasks must not throw.
 * Destruction finishes every queued and timed task before joining the workers.
 */
class task_scheduler
{
public:
    using task_type = std::function<void()>;
    using clock_type = std::chrono::steady_clock;

    explicit task_scheduler(std::size_t worker_count);

    task_scheduler(const task_scheduler&) = delete;
    task_scheduler& operator=(const task_scheduler&) = delete;

    ~task_scheduler();

    void post(task_type task);

    /**
     * @brief Run a task on a worker after a delay. The wait does not occupy any worker.
     */
    void post_after(std::chrono::milliseconds delay, task_type task);

    [[nodiscard]]
    std::size_t worker_count() const noexcept
    {
        return m_workers.size();
    }

    /**
     * @brief Finish all tasks and join the workers. Safe to call more than once.
     */
    void shutdown();

private:
    void worker_main();

    std::mutex m_mx;
    std::condition_variable m_cv;
    std::deque<task_type> m_ready;
    std::multimap<clock_type::time_point, task_type> m_timers;
    std::vector<std::thread> m_workers;
    bool m_stopping = false;
};
} // namespace asbridge

#endif
