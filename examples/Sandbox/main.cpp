// main.cpp
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <SHARC/SHARC.hpp>

using namespace SHARC;

struct Account
{
    std::string owner;
    int         balance {0};
};

// Two OS threads deposit through clones of one thread-safe container.
void ThreadSafeDemo()
{
    ThreadShared<Account> account(Account {"alice", 0});

    auto deposit = [](ThreadShared<Account> handle, int times) {
        for (int i = 0; i < times; ++i)
        {
            auto guard = handle.Write();
            if (!guard)
            {
                std::cout << "[ThreadSafe] write failed: " << guard.error() << "\n";
                return;
            }
            (*guard)->balance += 1;
        }
    };

    std::thread a(deposit, account.Clone(), 500);
    std::thread b(deposit, account.Clone(), 500);
    a.join();
    b.join();

    std::cout << "[ThreadSafe] balance = " << account.GetCloned()->balance << "\n";

    try
    {
        auto guard = account.Write();
        (*guard)->balance = -1;
        throw std::runtime_error("audit failed mid-update");
    }
    catch (const std::runtime_error& ex)
    {
        std::cout << "[ThreadSafe] " << ex.what() << "\n";
    }

    std::cout << "[ThreadSafe] read after abandoned write: " << account.Read().error() << "\n";
    account.ClearPoison();
    std::cout << "[ThreadSafe] poison cleared, balance = " << account.GetCloned()->balance << "\n";
}

// Overlapping borrows on the single-threaded backend fail instead of blocking.
void SingleThreadDemo()
{
    LocalShared<std::vector<int>> values(std::vector<int> {1, 2, 3});
    WeakLocalShared<std::vector<int>> weak = values.Downgrade();

    {
        auto writer = values.Write();
        auto reader = values.Read();
        std::cout << "[SingleThread] nested read while writing: " << reader.error() << "\n";
        (*writer)->push_back(4);
    }

    if (auto upgraded = weak.Upgrade())
        std::cout << "[SingleThread] size through weak handle = " << upgraded->GetCloned()->size() << "\n";
}

#if SHARC_ENABLE_ASYNC
Async::Task<void> Deposit(AsyncShared<Account> account, int amount)
{
    auto guard = co_await account.WriteAsync();
    guard->balance += amount;
    std::cout << "[Suspending] deposited " << amount << ", balance = " << guard->balance << "\n";
}

Async::Task<void> Report(SharedAny<Account> account)
{
    auto snapshot = co_await account.GetClonedAsync();
    if (snapshot)
        std::cout << "[SharedAny] " << snapshot->owner << " has " << snapshot->balance << "\n";
}

void SuspendingDemo()
{
    Execution::CooperativeScheduler scheduler;
    AsyncShared<Account>            account(Account {"bob", 10});

    std::cout << "[Suspending] synchronous read: " << account.Read().error() << "\n";

    auto first  = Deposit(account, 5);
    auto second = Deposit(account, 7);
    auto report = Report(account);
    first.Start(scheduler);
    second.Start(scheduler);
    report.Start(scheduler);
    scheduler.RunUntilIdle();
}
#endif

int main()
{
    ThreadSafeDemo();
    SingleThreadDemo();
#if SHARC_ENABLE_ASYNC
    SuspendingDemo();
#endif
    return 0;
}
