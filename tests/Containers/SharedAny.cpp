/// @file SharedAny.cpp
/// @brief Tests for the backend-erased SharedAny wrapper.

#include <SHARC/Containers/SharedAny.hpp>
#include <SHARC/Async/Task.hpp>
#include <SHARC/Execution/CooperativeScheduler.hpp>
#include <SHARC/Execution/InlineScheduler.hpp>

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <utility>

namespace
{
    using SHARC::AccessError;
    using SHARC::BackendKind;
    using SHARC::Async::Task;

    using AnyInt   = SHARC::SharedAny<int, SHARC::ThreadSafeBackend>;
    using LocalAny = SHARC::SharedAny<int, SHARC::SingleThreadBackend>;

    Task<int> AddThroughAny(AnyInt shared, int amount)
    {
        {
            auto guard = co_await shared.WriteAsync();
            if (!guard)
                co_return -1;
            **guard += amount;
        }
        auto value = co_await shared.GetClonedAsync();
        co_return value.value_or(-1);
    }

    Task<int> ReadThroughAny(AnyInt shared)
    {
        auto guard = co_await shared.ReadAsync();
        co_return guard ? guard->Get() : -1;
    }

    template<typename TAny>
    concept CanRead = requires(TAny&& any) { std::forward<TAny>(any).Read(); };

    template<typename TAny>
    concept CanReadAsync = requires(TAny&& any) { std::forward<TAny>(any).ReadAsync(); };

    template<typename TAny>
    concept CanWriteAsync = requires(TAny&& any) { std::forward<TAny>(any).WriteAsync(); };
}// namespace

TEST_CASE("SharedAny wraps a synchronous container without copying it", "[Containers][SharedAny]")
{
    SHARC::ThreadShared<int> shared(1);
    AnyInt                   any = shared;

    CHECK(any.Kind() == BackendKind::ThreadSafe);
    CHECK_FALSE(any.IsAsync());
    REQUIRE(any.AsSync() != nullptr);
    CHECK(any.AsSync()->SharesAllocationWith(shared));
    CHECK(any.AsAsync() == nullptr);
    CHECK(any.StrongCount() == 2);

    {
        auto guard = any.Write();
        REQUIRE(guard);
        **guard = 9;
    }
    CHECK(shared.GetCloned() == 9);

    auto guard = any.Read();
    REQUIRE(guard);
    CHECK(**guard == 9);
    CHECK(any.GetCloned() == 9);
}

TEST_CASE("SharedAny forwards synchronous errors", "[Containers][SharedAny]")
{
    SHARC::LocalShared<int> shared(1);
    LocalAny                any = shared;
    CHECK(any.Kind() == BackendKind::SingleThread);

    auto writer = any.Write();
    REQUIRE(writer);
    CHECK(any.Read().error() == AccessError::BorrowConflict);
    CHECK(shared.Read().error() == AccessError::BorrowConflict);
}

TEST_CASE("SharedAny on a suspending container rejects synchronous access", "[Containers][SharedAny]")
{
    SHARC::AsyncShared<int> shared(3);
    AnyInt                  any = shared;

    CHECK(any.IsAsync());
    CHECK(any.Kind() == BackendKind::Suspending);
    REQUIRE(any.AsAsync() != nullptr);
    CHECK(any.AsSync() == nullptr);

    CHECK(any.Read().error() == AccessError::UnsupportedMode);
    CHECK(any.Write().error() == AccessError::UnsupportedMode);
    CHECK(any.GetCloned().error() == AccessError::UnsupportedMode);
}

TEST_CASE("SharedAny async accessors work on both alternatives", "[Containers][SharedAny]")
{
    SHARC::Execution::CooperativeScheduler scheduler;

    SHARC::AsyncShared<int>  asyncShared(10);
    SHARC::ThreadShared<int> syncShared(20);

    auto onAsync = AddThroughAny(asyncShared, 1);
    auto onSync  = AddThroughAny(syncShared, 2);
    onAsync.Start(scheduler);
    onSync.Start(scheduler);
    scheduler.RunUntilIdle();

    CHECK(onAsync.Get() == 11);
    CHECK(onSync.Get() == 22);
    CHECK(syncShared.GetCloned() == 22);
}

TEST_CASE("SharedAny async accessors complete in place when uncontended", "[Containers][SharedAny]")
{
    AnyInt onAsync = SHARC::AsyncShared<int>(5);
    AnyInt onSync  = SHARC::ThreadShared<int>(6);

    // The awaiters are driven by hand: no coroutine frame is involved.
    {
        auto read = onAsync.ReadAsync();
        REQUIRE(read.await_ready());
        auto guard = read.await_resume();
        REQUIRE(guard);
        CHECK(guard->Get() == 5);

        auto clone = onAsync.GetClonedAsync();
        REQUIRE(clone.await_ready());
        CHECK(clone.await_resume() == 5);
    }

    {
        auto write = onSync.WriteAsync();
        REQUIRE(write.await_ready());
        auto guard = write.await_resume();
        REQUIRE(guard);
        **guard = 7;
    }

    auto clone = onSync.GetClonedAsync();
    REQUIRE(clone.await_ready());
    CHECK(clone.await_resume() == 7);
}

TEST_CASE("SharedAny read guard from ReadAsync dereferences to the value", "[Containers][SharedAny]")
{
    SHARC::Execution::InlineScheduler scheduler;
    AnyInt                            any = SHARC::AsyncShared<int>(5);

    auto task = ReadThroughAny(any);
    task.Start(scheduler);
    CHECK(task.Get() == 5);
}

TEST_CASE("SharedAny hands out guards only from a named wrapper", "[Containers][SharedAny]")
{
    STATIC_REQUIRE(CanRead<const AnyInt&>);
    STATIC_REQUIRE_FALSE(CanRead<AnyInt>);
    STATIC_REQUIRE_FALSE(CanReadAsync<AnyInt>);
    STATIC_REQUIRE_FALSE(CanWriteAsync<AnyInt>);
}

TEST_CASE("SharedAny clones and weak handles preserve identity", "[Containers][SharedAny]")
{
    SHARC::ThreadShared<std::string> shared(std::string("x"));
    SHARC::SharedAny<std::string, SHARC::ThreadSafeBackend> any = shared;

    auto clone = any.Clone();
    CHECK(clone.AsSync()->SharesAllocationWith(shared));

    auto weak = any.Downgrade();
    CHECK_FALSE(weak.Expired());
    {
        auto upgraded = weak.Upgrade();
        REQUIRE(upgraded.has_value());
        CHECK(upgraded->GetCloned() == std::string("x"));
        CHECK_FALSE(upgraded->IsAsync());
    }
}

TEST_CASE("WeakSharedAny expires with the last strong handle", "[Containers][SharedAny]")
{
    std::optional<SHARC::WeakSharedAny<int, SHARC::ThreadSafeBackend>> weak;
    {
        AnyInt any = SHARC::AsyncShared<int>(1);
        weak.emplace(any.Downgrade());
        auto upgraded = weak->Upgrade();
        REQUIRE(upgraded.has_value());
        CHECK(upgraded->IsAsync());
    }
    CHECK(weak->Expired());
    CHECK_FALSE(weak->Upgrade().has_value());
}
