#include <catch2/catch_test_macros.hpp>

#include <vector>

#include <SHARC/Async/Task.hpp>
#include <SHARC/Execution/CooperativeScheduler.hpp>
#include <SHARC/Execution/ExecutorRef.hpp>
#include <SHARC/Execution/InlineScheduler.hpp>

namespace
{
    SHARC::Async::Task<void> Record(std::vector<int>& log, int id)
    {
        log.push_back(id);
        co_return;
    }
}// namespace

TEST_CASE("CooperativeScheduler runs work only when pumped, in FIFO order", "[Execution][CooperativeScheduler]")
{
    SHARC::Execution::CooperativeScheduler scheduler;
    std::vector<int>                       log;

    auto first  = Record(log, 1);
    auto second = Record(log, 2);
    first.Start(scheduler);
    second.Start(scheduler);

    CHECK(log.empty());
    CHECK(scheduler.PendingReady() == 2);

    REQUIRE(scheduler.RunOne());
    CHECK(log == std::vector<int> {1});

    scheduler.RunUntilIdle();
    CHECK(log == std::vector<int> {1, 2});
    CHECK_FALSE(scheduler.RunOne());
    CHECK(first.IsCompleted());
    CHECK(second.IsCompleted());
}

TEST_CASE("ExecutorRef resumes inline when it refers to no scheduler", "[Execution][ExecutorRef]")
{
    std::vector<int> log;

    SHARC::Execution::ExecutorRef none;
    CHECK_FALSE(none.IsValid());

    auto task = Record(log, 5);
    none.ExecuteOrResume(task.Handle());
    CHECK(log == std::vector<int> {5});

    SHARC::Execution::InlineScheduler inlineScheduler;
    auto                              executor = SHARC::Execution::ExecutorRef::From(inlineScheduler);
    CHECK(executor.IsValid());

    auto other = Record(log, 6);
    other.Start(executor);
    CHECK(other.IsCompleted());
    CHECK(log == std::vector<int> {5, 6});
}
