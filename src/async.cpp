#include <asbridge/async.hpp>
#include <cassert>
#include <iterator>
#include <asbridge/concurrent/threading.hpp>

namespace asbridge
{
event_loop::event_loop()
    : m_host_thread(std::this_thread::get_id()) {}

event_loop::~event_loop()
{
    assert(m_pending_work == 0 && "event loop destroyed with outstanding work");
}

void event_loop::post(task_type task)
{
    {
        std::lock_guard lock(m_mx);
        m_tasks.push_back(std::move(task));
    }
    m_cv.notify_all();
}

void event_loop::add_work()
{
    std::lock_guard lock(m_mx);
    ++m_pending_work;
}

void event_loop::finish_work()
{
    {
        std::lock_guard lock(m_mx);
        assert(m_pending_work > 0);
        --m_pending_work;
    }
    m_cv.notify_all();
}

std::size_t event_loop::pending_work() const
{
    std::lock_guard lock(m_mx);
    return m_pending_work;
}

std::size_t event_loop::run_pending()
{
    assert(in_host_thread());

    std::deque<task_type> batch;
    {
        std::lock_guard lock(m_mx);
        batch.swap(m_tasks);
    }

    std::size_t count = 0;
    while(!batch.empty())
    {
        task_type task = std::move(batch.front());
        batch.pop_front();
        try
        {
            task();
        }
        catch(...)
        {
            // Tasks after the failed one stay queued ahead of the ones posted meanwhile
            std::lock_guard lock(m_mx);
            m_tasks.insert(
                m_tasks.begin(),
                std::make_move_iterator(batch.begin()),
                std::make_move_iterator(batch.end())
            );
            throw;
        }
        ++count;
    }

    return count;
}

bool event_loop::wait_and_run_one(std::unique_lock<std::mutex>& lock)
{
    m_cv.wait(
        lock,
        [this]
        { return !m_tasks.empty() || m_pending_work == 0; }
    );
    if(m_tasks.empty())
        return false;

    task_type task = std::move(m_tasks.front());
    m_tasks.pop_front();

    lock.unlock();
    task();
    lock.lock();

    return true;
}

bool event_loop::run_until(const std::function<bool()>& done)
{
    assert(in_host_thread());

    std::unique_lock lock(m_mx);
    while(true)
    {
        lock.unlock();
        bool finished = done();
        lock.lock();

        if(finished)
            return true;
        if(!wait_and_run_one(lock))
            return false;
    }
}

void event_loop::run()
{
    assert(in_host_thread());

    std::unique_lock lock(m_mx);
    while(wait_and_run_one(lock))
    {}
}

task_scheduler::task_scheduler(std::size_t worker_count)
{
    if(worker_count == 0)
        worker_count = 1;

    m_workers.reserve(worker_count);
    for(std::size_t i = 0; i < worker_count; ++i)
        m_workers.emplace_back(&task_scheduler::worker_main, this);
}

task_scheduler::~task_scheduler()
{
    shutdown();
}

void task_scheduler::post(task_type task)
{
    {
        std::lock_guard lock(m_mx);
        assert(!m_stopping);
        m_ready.push_back(std::move(task));
    }
    m_cv.notify_one();
}

void task_scheduler::post_after(std::chrono::milliseconds delay, task_type task)
{
    {
        std::lock_guard lock(m_mx);
        assert(!m_stopping);
        m_timers.emplace(clock_type::now() + delay, std::move(task));
    }
    // The earliest deadline may have changed
    m_cv.notify_all();
}

void task_scheduler::shutdown()
{
    {
        std::lock_guard lock(m_mx);
        if(m_stopping)
            return;
        m_stopping = true;
    }
    m_cv.notify_all();

    for(auto& t : m_workers)
    {
        if(t.joinable())
            t.join();
    }
}

void task_scheduler::worker_main()
{
    concurrent::auto_thread_cleanup();

    std::unique_lock lock(m_mx);
    while(true)
    {
        auto now = clock_type::now();
        while(!m_timers.empty() && m_timers.begin()->first <= now)
        {
            auto node = m_timers.extract(m_timers.begin());
            m_ready.push_back(std::move(node.mapped()));
        }

        if(!m_ready.empty())
        {
            task_type task = std::move(m_ready.front());
            m_ready.pop_front();
            if(!m_ready.empty())
                m_cv.notify_one();

            lock.unlock();
            task();
            lock.lock();
            continue;
        }

        if(m_stopping && m_timers.empty())
            break;

        if(m_timers.empty())
            m_cv.wait(lock);
        else
            m_cv.wait_until(lock, m_timers.begin()->first);
    }
}
} // namespace asbridge
