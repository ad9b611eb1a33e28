#include <gtest/gtest.h>
#include "CallbackQueue.hpp"
#include "SerialExecutor.hpp"
#include "ThreadPool.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(CallbackQueueTest, ExecuteAllRunsSnapshot)
{
    CallbackQueue queue;
    std::vector<int> order;

    queue.post([&] {
        order.push_back(1);
        queue.post([&] { order.push_back(3); });
    });
    queue.post([&] { order.push_back(2); });

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.execute_all(), 2u);
    EXPECT_EQ(order, (std::vector<int>{ 1, 2 }));

    // Task posted while draining is left for the next round
    EXPECT_FALSE(queue.empty());
    EXPECT_EQ(queue.run_until_idle(), 1u);
    EXPECT_EQ(order, (std::vector<int>{ 1, 2, 3 }));
    EXPECT_TRUE(queue.empty());
}

TEST(CallbackQueueTest, ThrowingTaskDoesNotStopQueue)
{
    CallbackQueue queue;
    int ran = 0;

    queue.post([] { throw std::runtime_error("boom"); });
    queue.post([&] { ++ran; });

    EXPECT_EQ(queue.execute_all(), 2u);
    EXPECT_EQ(ran, 1);
}

TEST(CallbackQueueTest, WaitForWorkWakesOnPost)
{
    CallbackQueue queue;
    EXPECT_FALSE(queue.wait_for_work(1ms));

    std::thread producer([&] {
        std::this_thread::sleep_for(10ms);
        queue.post([] {});
    });

    EXPECT_TRUE(queue.wait_for_work(5s));
    producer.join();
    EXPECT_EQ(queue.execute_all(), 1u);
}

TEST(ThreadPoolTest, QueueTaskReturnsFuture)
{
    ThreadPool pool(2);
    auto f = pool.queue_task([] { return 6 * 7; });

    EXPECT_EQ(f.get(), 42);
    EXPECT_EQ(pool.nbr_threads(), 2u);
}

TEST(ThreadPoolTest, ZeroThreadsClampedToOne)
{
    ThreadPool pool(0);
    EXPECT_EQ(pool.nbr_threads(), 1u);
    EXPECT_EQ(pool.queue_task([] { return 1; }).get(), 1);
}

TEST(ThreadPoolTest, PostRunsEveryTaskBeforeShutdown)
{
    std::atomic<int> counter{ 0 };
    {
        ThreadPool pool(4);
        for (int i = 0; i < 1000; ++i)
            pool.post([&] { counter.fetch_add(1, std::memory_order_relaxed); });
        pool.post([] { throw std::runtime_error("worker survives this"); });
    }
    EXPECT_EQ(counter.load(), 1000);
}

TEST(ThreadPoolTest, ShutdownDrainsThenRejects)
{
    ThreadPool pool(2, "test-pool");
    std::atomic<int> chained{ 0 };

    pool.post([&] {
        std::this_thread::sleep_for(5ms);
        // Posting from a running task is still fine while shutting down
        pool.post([&] { chained = 1; });
    });
    pool.shutdown();

    EXPECT_EQ(chained.load(), 1);
    EXPECT_TRUE(pool.is_stopped());
    EXPECT_EQ(pool.nbr_completed_tasks(), 2u);
    EXPECT_THROW(pool.post([] {}), PoolStoppedError);
    EXPECT_THROW(pool.queue_task([] { return 0; }), PoolStoppedError);
    EXPECT_EQ(pool.name(), "test-pool");
}

TEST(ThreadPoolTest, WaitIdle)
{
    ThreadPool pool(3);
    std::atomic<int> counter{ 0 };
    for (int i = 0; i < 30; ++i)
        pool.post([&] {
            std::this_thread::sleep_for(1ms);
            ++counter;
        });

    pool.wait_idle();
    EXPECT_EQ(counter.load(), 30);
    EXPECT_EQ(pool.nbr_working_threads(), 0u);
    EXPECT_TRUE(pool.is_task_queue_empty());
}

TEST(SerialExecutorTest, TasksRunInOrderAndNeverOverlap)
{
    ThreadPool pool(4);
    gload::SerialExecutor strand(pool);

    std::vector<int> order;
    std::atomic<int> in_flight{ 0 };
    std::atomic<bool> overlap{ false };

    for (int i = 0; i < 500; ++i)
    {
        strand.post([&, i] {
            if (in_flight.fetch_add(1) != 0)
                overlap = true;
            order.push_back(i);
            in_flight.fetch_sub(1);
        });
    }
    strand.wait_idle();

    EXPECT_FALSE(overlap.load());
    ASSERT_EQ(order.size(), 500u);
    for (int i = 0; i < 500; ++i)
        EXPECT_EQ(order[i], i);
    EXPECT_FALSE(strand.is_busy());
    EXPECT_EQ(strand.executed(), 500u);
}

TEST(SerialExecutorTest, ConcurrentPostersAllServed)
{
    ThreadPool pool(4);
    gload::SerialExecutor strand(pool);
    int counter = 0; // only touched on the strand

    std::vector<std::thread> posters;
    for (int t = 0; t < 4; ++t)
    {
        posters.emplace_back([&] {
            for (int i = 0; i < 250; ++i)
                strand.post([&] { ++counter; });
        });
    }
    for (auto& th : posters) th.join();
    strand.wait_idle();

    EXPECT_EQ(counter, 1000);
}

TEST(SerialExecutorTest, StoppedUpstreamIsReported)
{
    ThreadPool pool(1);
    gload::SerialExecutor strand(pool);
    pool.shutdown();

    EXPECT_THROW(strand.post([] {}), PoolStoppedError);
    EXPECT_FALSE(strand.is_busy());
    EXPECT_EQ(strand.queued(), 0u);
}
