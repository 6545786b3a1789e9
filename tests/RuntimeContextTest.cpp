#include <gtest/gtest.h>
#include "core/RuntimeContext.hpp"

#include <future>
#include <stdexcept>
#include <thread>

using namespace configdesk;
using namespace std::chrono_literals;

TEST(RuntimeContextTest, RunsTasksOnSeparateThreads) {
    RuntimeContext runtime;
    std::promise<std::thread::id> first;
    std::promise<std::thread::id> second;

    runtime.spawn("first", [&first]() { first.set_value(std::this_thread::get_id()); });
    runtime.spawn("second", [&second]() { second.set_value(std::this_thread::get_id()); });

    auto firstFuture = first.get_future();
    auto secondFuture = second.get_future();
    ASSERT_EQ(firstFuture.wait_for(5s), std::future_status::ready);
    ASSERT_EQ(secondFuture.wait_for(5s), std::future_status::ready);

    const auto a = firstFuture.get();
    const auto b = secondFuture.get();
    EXPECT_NE(a, std::this_thread::get_id());
    EXPECT_NE(b, std::this_thread::get_id());
    EXPECT_NE(a, b);
    EXPECT_EQ(runtime.taskCount(), 2u);
}

TEST(RuntimeContextTest, ThrowingTaskDoesNotTakeDownTheProcess) {
    RuntimeContext runtime;
    std::promise<void> after;

    runtime.spawn("throws", []() { throw std::runtime_error("boom"); });
    runtime.spawn("after", [&after]() { after.set_value(); });

    EXPECT_EQ(after.get_future().wait_for(5s), std::future_status::ready);
}

TEST(RuntimeContextTest, DestructionDoesNotWaitForTasks) {
    auto release = std::make_shared<std::promise<void>>();
    auto released = release->get_future().share();
    {
        RuntimeContext runtime;
        runtime.spawn("blocked", [released]() { released.wait(); });
    }
    // Reaching this line means the destructor detached the task
    release->set_value();
}
