/// @file AsyncShared.cpp
/// @brief Tests for containers on the suspending backend and the async accessors of synchronous backends.

#include <SHARC/Containers/Container.hpp>
#include <SHARC/Async/Task.hpp>
#include <SHARC/Execution/CooperativeScheduler.hpp>
#include <SHARC/Execution/InlineScheduler.hpp>

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{
    using SHARC::AccessError;
    using SHARC::AsyncShared;
    using SHARC::Async::Task;

    Task<int> ReadValue(AsyncShared<int> shared)
    {
        auto guard = co_await shared.ReadAsync();
        co_return *guard;
    }

    Task<SHARC::ReadGuard<int, SHARC::SuspendingBackend>> AcquireRead(AsyncShared<int> shared)
    {
        co_return co_await shared.ReadAsync();
    }

    Task<void> Append(AsyncShared<std::vector<int>> shared, int value)
    {
        auto guard = co_await shared.WriteAsync();
        guard->push_back(value);
    }

    Task<void> Increment(AsyncShared<int> shared)
    {
        auto guard = co_await shared.WriteAsync();
        ++*guard;
    }

    Task<std::string> CloneValue(AsyncShared<std::string> shared)
    {
        co_return co_await shared.GetClonedAsync();
    }

    template<typename TContainer>
    concept CanReadAsync = requires(TContainer&& container) { std::forward<TContainer>(container).ReadAsync(); };

    template<typename TContainer>
    concept CanWriteAsync = requires(TContainer&& container) { std::forward<TContainer>(container).WriteAsync(); };

    Task<bool> ReadLocalAsync(SHARC::LocalShared<int> shared, AccessError& error)
    {
        auto writer = shared.Write();
        auto nested = co_await shared.ReadAsync();
        if (!nested)
            error = nested.error();
        co_return writer.has_value() && !nested.has_value();
    }
}// namespace

TEST_CASE("AsyncShared synchronous accessors report UnsupportedMode", "[Containers][AsyncShared]")
{
    AsyncShared<int> shared(1);

    CHECK(shared.Read().error() == AccessError::UnsupportedMode);
    CHECK(shared.Write().error() == AccessError::UnsupportedMode);
    CHECK(shared.GetCloned().error() == AccessError::UnsupportedMode);
    CHECK_FALSE(shared == shared.Clone());
}

TEST_CASE("AsyncShared read and write complete through a scheduler", "[Containers][AsyncShared]")
{
    SHARC::Execution::CooperativeScheduler scheduler;
    AsyncShared<std::vector<int>>          shared(std::vector<int> {});

    auto first  = Append(shared, 1);
    auto second = Append(shared.Clone(), 2);
    first.Start(scheduler);
    second.Start(scheduler);
    scheduler.RunUntilIdle();

    CHECK(first.IsCompleted());
    CHECK(second.IsCompleted());

    // Uncontended, the awaiter completes without suspending.
    auto clone = shared.GetClonedAsync();
    REQUIRE(clone.await_ready());
    CHECK(clone.await_resume() == std::vector<int> {1, 2});
}

TEST_CASE("AsyncShared writer waits for an outstanding reader", "[Containers][AsyncShared]")
{
    SHARC::Execution::CooperativeScheduler scheduler;
    AsyncShared<int>                       shared(0);

    auto reading = AcquireRead(shared);
    reading.Start(scheduler);
    scheduler.RunUntilIdle();
    std::optional<SHARC::ReadGuard<int, SHARC::SuspendingBackend>> guard {reading.Get()};
    REQUIRE(**guard == 0);

    auto writer = Increment(shared);
    writer.Start(scheduler);
    scheduler.RunUntilIdle();
    CHECK_FALSE(writer.IsCompleted());

    guard.reset();
    scheduler.RunUntilIdle();
    CHECK(writer.IsCompleted());

    auto check = ReadValue(shared);
    check.Start(scheduler);
    scheduler.RunUntilIdle();
    CHECK(check.Get() == 1);
}

TEST_CASE("AsyncShared abandoned acquisition leaves the container usable", "[Containers][AsyncShared]")
{
    SHARC::Execution::CooperativeScheduler scheduler;
    AsyncShared<int>                       shared(10);

    auto reading = AcquireRead(shared);
    reading.Start(scheduler);
    scheduler.RunUntilIdle();
    std::optional<SHARC::ReadGuard<int, SHARC::SuspendingBackend>> guard {reading.Get()};

    {
        auto cancelled = Increment(shared);
        cancelled.Start(scheduler);
        scheduler.RunUntilIdle();
        CHECK_FALSE(cancelled.IsCompleted());
    }

    auto later = Increment(shared);
    later.Start(scheduler);
    scheduler.RunUntilIdle();
    CHECK_FALSE(later.IsCompleted());

    guard.reset();
    scheduler.RunUntilIdle();
    CHECK(later.IsCompleted());

    auto check = ReadValue(shared);
    check.Start(scheduler);
    scheduler.RunUntilIdle();
    CHECK(check.Get() == 11);
}

TEST_CASE("AsyncShared GetClonedAsync yields the value directly", "[Containers][AsyncShared]")
{
    SHARC::Execution::InlineScheduler scheduler;
    AsyncShared<std::string>          shared(std::string("value"));

    auto task = CloneValue(shared);
    task.Start(scheduler);
    CHECK(task.Get() == "value");
}

TEST_CASE("AsyncShared awaiters are only available on a named container", "[Containers][AsyncShared]")
{
    STATIC_REQUIRE(CanReadAsync<const AsyncShared<int>&>);
    STATIC_REQUIRE(CanWriteAsync<AsyncShared<int>&>);
    STATIC_REQUIRE_FALSE(CanReadAsync<AsyncShared<int>>);
    STATIC_REQUIRE_FALSE(CanWriteAsync<AsyncShared<int>>);
    STATIC_REQUIRE_FALSE(CanReadAsync<SHARC::ThreadShared<int>>);
}

TEST_CASE("AsyncShared weak handle upgrades while alive", "[Containers][AsyncShared]")
{
    SHARC::WeakAsyncShared<int> weak;
    {
        AsyncShared<int> shared(1);
        weak = shared.Downgrade();
        REQUIRE(weak.Upgrade().has_value());
    }
    CHECK_FALSE(weak.Upgrade().has_value());
}

TEST_CASE("Synchronous backends resolve async accessors immediately", "[Containers][AsyncShared]")
{
    SHARC::ThreadShared<int> shared(4);

    SHARC::Execution::InlineScheduler scheduler;
    auto                              task = [](SHARC::ThreadShared<int> handle) -> Task<int> {
        {
            auto guard = co_await handle.WriteAsync();
            if (!guard)
                co_return -1;
            **guard += 1;
        }
        auto cloned = co_await handle.GetClonedAsync();
        co_return cloned.value_or(-1);
    }(shared);
    task.Start(scheduler);
    CHECK(task.IsCompleted());
    CHECK(task.Get() == 5);

    AccessError error {};
    auto        local = ReadLocalAsync(SHARC::LocalShared<int>(0), error);
    local.Start(scheduler);
    CHECK(local.Get());
    CHECK(error == AccessError::BorrowConflict);
}
