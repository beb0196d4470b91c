#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>
#include <asbridge/async.hpp>

TEST(event_loop, run_pending_in_order)
{
    asbridge::event_loop loop;
    EXPECT_TRUE(loop.in_host_thread());

    std::vector<int> order;
    loop.post([&]()
              { order.push_back(1); });
    loop.post([&]()
              { order.push_back(2); });
    loop.post([&]()
              { order.push_back(3); });

    EXPECT_EQ(loop.run_pending(), 3);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(loop.run_pending(), 0);
}

TEST(event_loop, throwing_task_keeps_the_rest)
{
    asbridge::event_loop loop;

    std::vector<int> order;
    loop.post(
        [&]()
        {
            order.push_back(1);
            loop.post([&]()
                      { order.push_back(4); });
        }
    );
    loop.post([]()
              { throw std::runtime_error("task failed"); });
    loop.post([&]()
              { order.push_back(3); });

    EXPECT_THROW((void)loop.run_pending(), std::runtime_error);
    EXPECT_EQ(order, (std::vector<int>{1}));

    EXPECT_EQ(loop.run_pending(), 2);
    EXPECT_EQ(order, (std::vector<int>{1, 3, 4}));
}

TEST(event_loop, tasks_posted_by_tasks)
{
    asbridge::event_loop loop;

    std::vector<int> order;
    loop.post(
        [&]()
        {
            order.push_back(1);
            loop.post([&]()
                      { order.push_back(3); });
        }
    );
    loop.post([&]()
              { order.push_back(2); });

    loop.run();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(event_loop, run_waits_for_outstanding_work)
{
    asbridge::event_loop loop;

    int result = 0;
    loop.add_work();
    std::thread worker(
        [&]()
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            loop.post(
                [&]()
                {
                    result = 42;
                    loop.finish_work();
                }
            );
        }
    );

    loop.run();
    worker.join();

    EXPECT_EQ(result, 42);
    EXPECT_EQ(loop.pending_work(), 0);
}

TEST(event_loop, run_until)
{
    asbridge::event_loop loop;

    int counter = 0;
    for(int i = 0; i < 5; ++i)
    {
        loop.post([&]()
                  { ++counter; });
    }

    EXPECT_TRUE(loop.run_until([&]()
                               { return counter == 2; }));
    EXPECT_EQ(counter, 2);

    // Nothing can satisfy the condition after the queue is drained
    EXPECT_FALSE(loop.run_until([&]()
                                { return counter == 10; }));
    EXPECT_EQ(counter, 5);
}

TEST(event_loop, call_from_other_thread)
{
    asbridge::event_loop loop;

    std::atomic_bool ran_on_host = false;
    int result = 0;

    loop.add_work();
    std::thread worker(
        [&]()
        {
            result = loop.call(
                [&]()
                {
                    ran_on_host = loop.in_host_thread();
                    return 1013;
                }
            );
            loop.post([&]()
                      { loop.finish_work(); });
        }
    );

    loop.run();
    worker.join();

    EXPECT_TRUE(ran_on_host);
    EXPECT_EQ(result, 1013);
}

TEST(event_loop, call_on_host_thread_runs_inline)
{
    asbridge::event_loop loop;

    int result = loop.call([]()
                           { return 42; });
    EXPECT_EQ(result, 42);
    EXPECT_EQ(loop.run_pending(), 0);
}
