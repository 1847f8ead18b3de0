// EN: Unit tests for the ThreadPool running dispatched stages
// FR: Tests unitaires pour le ThreadPool exécutant les étapes dispatchées

#include <gtest/gtest.h>
#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace CIP;
using namespace std::chrono_literals;

// EN: Test fixture for ThreadPool tests
// FR: Fixture de test pour les tests ThreadPool
class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    static ThreadPoolConfig poolConfig(size_t threads, size_t max_queue = 1000) {
        ThreadPoolConfig config;
        config.threads = threads;
        config.max_queue_size = max_queue;
        return config;
    }
};

TEST_F(ThreadPoolTest, RejectsZeroThreads) {
    EXPECT_THROW({ ThreadPool pool(poolConfig(0)); }, std::invalid_argument);
}

TEST_F(ThreadPoolTest, SubmitReturnsFutureValue) {
    ThreadPool pool(poolConfig(2));

    auto sum = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    auto text = pool.submitNamed("build", TaskPriority::HIGH, []() { return std::string("success"); });

    EXPECT_EQ(sum.get(), 5);
    EXPECT_EQ(text.get(), "success");
}

// EN: Exceptions reach the caller through the future
// FR: Les exceptions atteignent l'appelant via le future
TEST_F(ThreadPoolTest, ExceptionsPropagateThroughFuture) {
    ThreadPool pool(poolConfig(1));

    auto failing = pool.submit([]() -> int { throw std::runtime_error("step failed"); });
    EXPECT_THROW(failing.get(), std::runtime_error);

    auto next = pool.submit([]() { return 1; });
    EXPECT_EQ(next.get(), 1);
}

// EN: Never more tasks in flight than threads
// FR: Jamais plus de tâches en cours que de threads
TEST_F(ThreadPoolTest, BoundsConcurrencyToThreadCount) {
    ThreadPool pool(poolConfig(2));

    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool.submit([&in_flight, &peak]() {
            int now = ++in_flight;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(20ms);
            --in_flight;
        }));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

// EN: Higher priority first, FIFO inside a priority
// FR: Priorité plus haute d'abord, FIFO dans une même priorité
TEST_F(ThreadPoolTest, PriorityOrdering) {
    ThreadPool pool(poolConfig(1));

    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    auto blocker = pool.submit([opened]() { opened.wait(); });

    // EN: Let the single worker pick up the blocker
    // FR: Laisse l'unique worker prendre le bloqueur
    while (pool.getStats().active_threads == 0) {
        std::this_thread::sleep_for(1ms);
    }

    std::mutex order_mutex;
    std::vector<std::string> order;
    auto record = [&order_mutex, &order](const std::string& name) {
        std::lock_guard<std::mutex> lock(order_mutex);
        order.push_back(name);
    };

    std::vector<std::future<void>> futures;
    futures.push_back(pool.submit(TaskPriority::LOW, record, std::string("low")));
    futures.push_back(pool.submit(TaskPriority::NORMAL, record, std::string("normal-1")));
    futures.push_back(pool.submit(TaskPriority::URGENT, record, std::string("urgent")));
    futures.push_back(pool.submit(TaskPriority::NORMAL, record, std::string("normal-2")));
    futures.push_back(pool.submit(TaskPriority::HIGH, record, std::string("high")));

    gate.set_value();
    blocker.get();
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_EQ(order, (std::vector<std::string>{"urgent", "high", "normal-1", "normal-2", "low"}));
}

TEST_F(ThreadPoolTest, BoundedQueueRejectsOverflow) {
    ThreadPool pool(poolConfig(1, 1));

    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    auto blocker = pool.submit([opened]() { opened.wait(); });
    while (pool.getStats().active_threads == 0) {
        std::this_thread::sleep_for(1ms);
    }

    auto queued = pool.submit([]() {});
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);

    gate.set_value();
    blocker.get();
    queued.get();
}

TEST_F(ThreadPoolTest, WaitForAllAndStats) {
    ThreadPool pool(poolConfig(3, 0));

    std::atomic<int> done{0};
    for (int i = 0; i < 20; ++i) {
        pool.submit([&done]() { ++done; });
    }
    pool.waitForAll();

    EXPECT_EQ(done.load(), 20);
    ThreadPoolStats stats = pool.getStats();
    EXPECT_EQ(stats.total_threads, 3u);
    EXPECT_EQ(stats.completed_tasks, 20u);
    EXPECT_EQ(stats.failed_tasks, 0u);
    EXPECT_EQ(stats.queued_tasks, 0u);
    EXPECT_GE(stats.peak_queue_size, 1u);
}

TEST_F(ThreadPoolTest, TaskCallbackReceivesNames) {
    ThreadPool pool(poolConfig(1));

    std::mutex names_mutex;
    std::vector<std::string> names;
    pool.setTaskCallback([&names_mutex, &names](const std::string& name, bool success, std::chrono::milliseconds) {
        std::lock_guard<std::mutex> lock(names_mutex);
        if (success) {
            names.push_back(name);
        }
    });

    pool.submitNamed("wpt-2020", TaskPriority::NORMAL, []() {}).get();
    pool.waitForAll();

    std::lock_guard<std::mutex> lock(names_mutex);
    EXPECT_EQ(names, (std::vector<std::string>{"wpt-2020"}));
}

// EN: Shutdown drains the queue, then refuses new work
// FR: L'arrêt vide la queue, puis refuse le nouveau travail
TEST_F(ThreadPoolTest, ShutdownDrainsQueue) {
    ThreadPool pool(poolConfig(2));

    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([&done]() {
            std::this_thread::sleep_for(2ms);
            ++done;
        }));
    }

    pool.shutdown();
    EXPECT_EQ(done.load(), 10);
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);

    // EN: A second shutdown is a no-op
    // FR: Un second arrêt est sans effet
    pool.shutdown();
}
