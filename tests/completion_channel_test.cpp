#include <gtest/gtest.h>

#include "capsule/bridge/completion_channel.hpp"
#include "capsule/bridge/host_dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using capsule::bridge::CallCompletion;
using capsule::bridge::CompletionChannel;
using capsule::bridge::HostDispatcher;
using namespace std::chrono_literals;

namespace {

CallCompletion Completion(std::uint64_t id, const std::string& payload = "null") {
    CallCompletion completion;
    completion.call_id = id;
    completion.ok = true;
    completion.payload = payload;
    return completion;
}

} // namespace

TEST(CompletionChannelTest, DeliversInPostingOrder) {
    CompletionChannel channel;
    EXPECT_TRUE(channel.Post(Completion(2)));
    EXPECT_TRUE(channel.Post(Completion(1)));

    auto batch = channel.WaitUntil(std::chrono::steady_clock::now());
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0].call_id, 2u);
    EXPECT_EQ(batch[1].call_id, 1u);
    EXPECT_TRUE(channel.WaitUntil(std::chrono::steady_clock::now()).empty());
}

TEST(CompletionChannelTest, WaitWakesOnPost) {
    CompletionChannel channel;
    auto started = std::chrono::steady_clock::now();

    std::thread poster([&channel] {
        std::this_thread::sleep_for(50ms);
        channel.Post(Completion(7, "[1,2]"));
    });

    auto batch = channel.WaitUntil(std::chrono::steady_clock::now() + 5s);
    poster.join();

    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0].payload, "[1,2]");
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
}

TEST(CompletionChannelTest, WaitReturnsEmptyAtDeadline) {
    CompletionChannel channel;
    auto started = std::chrono::steady_clock::now();

    auto batch = channel.WaitUntil(started + 100ms);

    EXPECT_TRUE(batch.empty());
    EXPECT_GE(std::chrono::steady_clock::now() - started, 100ms);
}

TEST(CompletionChannelTest, ClosedChannelDiscardsAndReleasesWaiters) {
    CompletionChannel channel;
    channel.Post(Completion(1));

    auto waiter = std::async(std::launch::async, [&channel] {
        std::this_thread::sleep_for(20ms);
        return channel.WaitUntil(std::chrono::steady_clock::now() + 10s);
    });
    channel.Close();

    EXPECT_TRUE(channel.IsClosed());
    EXPECT_EQ(waiter.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(waiter.get().empty());

    EXPECT_FALSE(channel.Post(Completion(2)));
    // One dropped by Close(), one refused by Post()
    EXPECT_EQ(channel.DiscardedCount(), 2u);
    EXPECT_FALSE(channel.IsCancelled());
}

TEST(CompletionChannelTest, CancelAlsoCloses) {
    CompletionChannel channel;
    channel.Cancel();

    EXPECT_TRUE(channel.IsCancelled());
    EXPECT_TRUE(channel.IsClosed());
    EXPECT_FALSE(channel.Post(Completion(1)));
}

TEST(HostDispatcherTest, RunsTasksConcurrently) {
    HostDispatcher dispatcher(4);
    EXPECT_EQ(dispatcher.WorkerCount(), 4u);
    auto group = dispatcher.OpenGroup();

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::atomic<int> done{0};
    for (int i = 0; i < 4; ++i) {
        dispatcher.Submit(group, [&] {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(100ms);
            --running;
            ++done;
        });
    }

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (dispatcher.CompletedTasks() < 4 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }

    EXPECT_EQ(done.load(), 4);
    EXPECT_GT(peak.load(), 1);
    EXPECT_EQ(dispatcher.CompletedTasks(), 4u);
}

TEST(HostDispatcherTest, SurvivesThrowingTask) {
    HostDispatcher dispatcher(1);
    std::promise<void> reached;

    auto group = dispatcher.OpenGroup();
    dispatcher.Submit(group, [] { throw std::runtime_error("store exploded"); });
    dispatcher.Submit(group, [&reached] { reached.set_value(); });

    EXPECT_EQ(reached.get_future().wait_for(5s), std::future_status::ready);
}

TEST(HostDispatcherTest, RejectsZeroWorkers) {
    EXPECT_THROW(HostDispatcher(0), std::invalid_argument);
}

TEST(HostDispatcherTest, ReleasedGroupDoesNotHoldWorkers) {
    HostDispatcher dispatcher(1);
    std::promise<void> unblock;
    auto blocked = unblock.get_future().share();

    auto stuck = dispatcher.OpenGroup();
    std::atomic<bool> stuck_running{false};
    dispatcher.Submit(stuck, [&stuck_running, blocked] {
        stuck_running = true;
        blocked.wait();
    });
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!stuck_running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(stuck_running);

    dispatcher.ReleaseGroup(stuck);
    EXPECT_EQ(dispatcher.WorkerCount(), 1u);
    EXPECT_EQ(dispatcher.ThreadCount(), 2u);

    std::promise<void> reached;
    dispatcher.Submit(dispatcher.OpenGroup(), [&reached] { reached.set_value(); });
    EXPECT_EQ(reached.get_future().wait_for(2s), std::future_status::ready);

    unblock.set_value();
    deadline = std::chrono::steady_clock::now() + 5s;
    while (dispatcher.ThreadCount() > 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(dispatcher.ThreadCount(), 1u);
}

TEST(HostDispatcherTest, ReleasingAnIdleGroupIsHarmless) {
    HostDispatcher dispatcher(2);
    auto group = dispatcher.OpenGroup();
    dispatcher.ReleaseGroup(group);
    dispatcher.ReleaseGroup(group);

    EXPECT_EQ(dispatcher.WorkerCount(), 2u);
    EXPECT_EQ(dispatcher.ThreadCount(), 2u);
}
