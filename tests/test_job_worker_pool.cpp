#include <doctest/doctest.h>
#include "core/threading/JobWorkerPool.h"
#include <future>
#include <stdexcept>
#include <thread>

using namespace LabPBR;

namespace {

// Occupies the single worker until released
struct Gate {
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    std::function<void()> task() {
        return [this]() {
            started.set_value();
            released.wait();
        };
    }
};

} // namespace

TEST_SUITE("JobWorkerPool") {
    TEST_CASE("zero workers is rejected") {
        CHECK(JobWorkerPool::create(0) == nullptr);
    }

    TEST_CASE("runs tasks on the requested number of workers") {
        auto pool = JobWorkerPool::create(3);
        REQUIRE(pool);
        CHECK(pool->getWorkerCount() == 3);

        std::atomic<int> counter{0};
        for (int i = 0; i < 20; ++i) {
            REQUIRE(pool->submit("inc", [&counter]() { ++counter; }));
        }
        pool->waitForIdle();
        CHECK(counter.load() == 20);

        PoolStats stats = pool->getStats();
        CHECK(stats.completedTasks == 20);
        CHECK(stats.queuedTasks == 0);
        CHECK(stats.activeTasks == 0);
    }

    TEST_CASE("lower priority value runs first, FIFO within a priority") {
        auto pool = JobWorkerPool::create(1);
        REQUIRE(pool);

        Gate gate;
        REQUIRE(pool->submit("gate", gate.task()));
        gate.started.get_future().wait();

        std::mutex orderMutex;
        std::vector<std::string> order;
        auto record = [&](std::string name) {
            return [&orderMutex, &order, name]() {
                std::lock_guard<std::mutex> lock(orderMutex);
                order.push_back(name);
            };
        };

        REQUIRE(pool->submit("convert-a", record("convert-a"), 10));
        REQUIRE(pool->submit("validate", record("validate"), 0));
        REQUIRE(pool->submit("convert-b", record("convert-b"), 10));
        REQUIRE(pool->submit("analyze", record("analyze"), 0));
        CHECK(pool->getStats().queuedTasks == 4);

        gate.release.set_value();
        pool->waitForIdle();

        std::vector<std::string> expected = {"validate", "analyze", "convert-a", "convert-b"};
        CHECK(order == expected);
    }

    TEST_CASE("a throwing task is counted and the worker keeps going") {
        auto pool = JobWorkerPool::create(1);
        REQUIRE(pool);

        bool ranAfter = false;
        REQUIRE(pool->submit("boom", []() { throw std::runtime_error("boom"); }));
        REQUIRE(pool->submit("after", [&ranAfter]() { ranAfter = true; }));
        pool->waitForIdle();

        CHECK(ranAfter);
        PoolStats stats = pool->getStats();
        CHECK(stats.failedTasks == 1);
        CHECK(stats.completedTasks == 1);
    }

    TEST_CASE("drop handlers do not run for executed tasks") {
        auto pool = JobWorkerPool::create(1);
        REQUIRE(pool);

        bool ran = false;
        bool dropped = false;
        REQUIRE(pool->submit("task", [&ran]() { ran = true; }, 0, [&dropped]() { dropped = true; }));
        pool->waitForIdle();
        pool->shutdown();

        CHECK(ran);
        CHECK_FALSE(dropped);
    }

    TEST_CASE("shutdown drops queued tasks and rejects new ones") {
        auto pool = JobWorkerPool::create(1);
        REQUIRE(pool);

        Gate gate;
        REQUIRE(pool->submit("gate", gate.task()));
        gate.started.get_future().wait();

        bool queuedRan = false;
        int dropHandlers = 0;
        REQUIRE(pool->submit("queued", [&queuedRan]() { queuedRan = true; }, 0,
                             [&dropHandlers]() { ++dropHandlers; }));
        REQUIRE(pool->submit("queued-plain", [&queuedRan]() { queuedRan = true; }));

        std::thread releaser([&gate]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            gate.release.set_value();
        });
        pool->shutdown();
        releaser.join();

        CHECK_FALSE(queuedRan);
        CHECK(dropHandlers == 1);
        CHECK(pool->getWorkerCount() == 0);
        CHECK_FALSE(pool->submit("late", []() {}));

        // Second shutdown is a no-op
        pool->shutdown();
    }
}
