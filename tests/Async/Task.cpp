#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <thread>
#include <vector>

#include <SHARC/Async/Task.hpp>
#include <SHARC/Execution/CooperativeScheduler.hpp>
#include <SHARC/Execution/InlineScheduler.hpp>

namespace
{
    SHARC::Async::Task<int> Add(int a, int b)
    {
        co_return a + b;
    }

    SHARC::Async::Task<int> Throws()
    {
        throw std::runtime_error("boom");
        co_return 0;
    }

    SHARC::Async::Task<int> AwaitChild()
    {
        auto child = Add(1, 2);
        co_return co_await child;
    }

    SHARC::Async::Task<void> AwaitChildThatThrows()
    {
        auto child = Throws();
        (void)co_await child;
    }

    /// Suspends once through the executor of the awaiting task.
    struct Reschedule
    {
        bool await_ready() const noexcept { return false; }

        template<typename TPromise>
        void await_suspend(std::coroutine_handle<TPromise> handle) const noexcept
        {
            handle.promise().GetExecutor().ExecuteOrResume(handle);
        }

        void await_resume() const noexcept {}
    };

    SHARC::Async::Task<void> Steps(std::vector<int>& log)
    {
        log.push_back(1);
        co_await Reschedule {};
        log.push_back(2);
    }
}// namespace

TEST_CASE("Task is lazy until started", "[Async][Task]")
{
    SHARC::Execution::InlineScheduler scheduler;

    auto task = Add(2, 3);
    CHECK_FALSE(task.IsStarted());
    CHECK_FALSE(task.IsCompleted());

    task.Start(scheduler);
    CHECK(task.IsStarted());
    CHECK(task.IsCompleted());
    CHECK(task.Get() == 5);
}

TEST_CASE("Task awaiting a child task returns its value", "[Async][Task]")
{
    SHARC::Execution::InlineScheduler scheduler;

    auto task = AwaitChild();
    task.Start(scheduler);
    CHECK(task.Get() == 3);
}

TEST_CASE("Task propagates exceptions from children", "[Async][Task]")
{
    SHARC::Execution::InlineScheduler scheduler;

    auto task = AwaitChildThatThrows();
    task.Start(scheduler);
    CHECK(task.IsFaulted());
    REQUIRE_THROWS_AS(task.Get(), std::runtime_error);
}

TEST_CASE("Task resumes through the scheduler it was started on", "[Async][Task]")
{
    SHARC::Execution::CooperativeScheduler scheduler;
    std::vector<int>                       log;

    auto task = Steps(log);
    task.Start(scheduler);
    CHECK(log.empty());

    REQUIRE(scheduler.RunOne());
    CHECK(log == std::vector<int> {1});
    CHECK_FALSE(task.IsCompleted());

    scheduler.RunUntilIdle();
    CHECK(log == std::vector<int> {1, 2});
    CHECK(task.IsCompleted());
}

TEST_CASE("Task Wait blocks until another thread completes it", "[Async][Task]")
{
    SHARC::Execution::CooperativeScheduler scheduler;

    auto task = Add(20, 22);
    task.Start(scheduler);

    std::thread driver([&scheduler] { scheduler.RunUntilIdle(); });
    task.Wait();
    driver.join();

    CHECK(task.Get() == 42);
}

TEST_CASE("Task can be destroyed right after Get returns on another thread", "[Async][Task]")
{
    for (int i = 0; i < 1000; ++i)
    {
        SHARC::Execution::CooperativeScheduler scheduler;
        std::thread                            driver;
        {
            auto task = Add(i, 1);
            task.Start(scheduler);
            driver = std::thread([&scheduler] { scheduler.RunUntilIdle(); });
            REQUIRE(task.Get() == i + 1);
            // The frame is destroyed here, possibly while the driver is still completing it.
        }
        driver.join();
    }
}

TEST_CASE("Destroying an unstarted Task does not run it", "[Async][Task]")
{
    std::vector<int> log;
    {
        auto task = Steps(log);
        (void)task;
    }
    CHECK(log.empty());
}
