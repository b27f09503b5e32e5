#include <gtest/gtest.h>

#include "callback_executor.hpp"
#include "evaluator.hpp"
#include "test_support.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace condeval {
namespace {

using test_support::RecordingLogger;
using test_support::RecordingResolver;

using namespace std::chrono_literals;

// Разбирает очередь обработчиков, пока future не получит значение
bool drainUntilReady(TaskQueue& queue, std::future<bool>& future) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (future.wait_for(0ms) != std::future_status::ready) {
        if (std::chrono::steady_clock::now() > deadline) {
            ADD_FAILURE() << "результат асинхронной проверки не получен";
            return false;
        }
        queue.runPendingFor(10ms);
    }
    return future.get();
}

// Резолвер, падающий на %boom% (std::runtime_error) и %odd% (не std::exception)
class FailingResolver final : public PlaceholderResolver {
public:
    std::string resolve(const Caller&, const std::string& rawText) const override {
        if (rawText == "%boom%") {
            throw std::runtime_error("резолвер недоступен");
        }
        if (rawText == "%odd%") {
            throw 42;
        }
        return rawText;
    }
};

class InlineAsyncTest : public ::testing::Test {
protected:
    RecordingResolver resolver;
    RecordingLogger logger;
    ThreadPool pool{2};
    InlineExecutor callbacks;
    ConditionEvaluator evaluator{resolver, logger, pool, callbacks};
    std::shared_ptr<const Caller> player = std::make_shared<NamedCaller>("Steve");
};

TEST_F(InlineAsyncTest, FutureAndCallbackReceiveResult) {
    std::promise<bool> seen;
    auto seenFuture = seen.get_future();

    auto future = evaluator.evaluateAsync(player, "2 > 1", [&seen](bool result) { seen.set_value(result); });

    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(future.get());
    ASSERT_EQ(seenFuture.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(seenFuture.get());
}

TEST_F(InlineAsyncTest, MalformedExpressionCompletesWithFalse) {
    auto future = evaluator.evaluateAsync(player, "1 >");
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(future.get());
    EXPECT_EQ(logger.count(LogLevel::Warning), 1u);
}

TEST_F(InlineAsyncTest, NullCallerCompletesWithFalse) {
    auto future = evaluator.evaluateAsync(nullptr, "1 > 0");
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(future.get());
    EXPECT_TRUE(logger.contains(LogLevel::Warning, "1 > 0"));
}

TEST_F(InlineAsyncTest, CallbackExceptionIsLoggedAndFutureDelivered) {
    auto future = evaluator.evaluateAsync(player, "1 > 0", [](bool) {
        throw std::runtime_error("сбой обработчика");
    });
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(future.get());
    EXPECT_TRUE(logger.contains(LogLevel::Error, "сбой обработчика"));
}

TEST_F(InlineAsyncTest, EmptyListIsSatisfied) {
    bool callbackResult = false;
    auto future = evaluator.evaluateAllAsync(player, {}, [&callbackResult](bool result) {
        callbackResult = result;
    });
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(future.get());
    EXPECT_TRUE(callbackResult);
}

TEST_F(InlineAsyncTest, ListStopsAtFirstFalseCondition) {
    auto future = evaluator.evaluateAllAsync(player, {"1>0", "0>1", "%probe% == 1"});
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(future.get());
    EXPECT_FALSE(resolver.wasRequested("%probe%"));
    EXPECT_EQ(logger.count(LogLevel::Warning), 0u);
}

TEST_F(InlineAsyncTest, ListIsEvaluatedInOrder) {
    auto future = evaluator.evaluateAllAsync(player, {"%a% == %a%", "%b% == %b%", "%c% == %c%"});
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(future.get());

    std::vector<std::string> expected = {"%a%", "%a%", "%b%", "%b%", "%c%", "%c%"};
    EXPECT_EQ(resolver.history(), expected);
}

TEST_F(InlineAsyncTest, BrokenLineStopsTheList) {
    auto future = evaluator.evaluateAllAsync(player, {"1>0", "((", "%probe% == 1"});
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(future.get());
    EXPECT_FALSE(resolver.wasRequested("%probe%"));
    EXPECT_TRUE(logger.contains(LogLevel::Warning, "(("));
}

TEST_F(InlineAsyncTest, StopRequestCancelsList) {
    std::stop_source stopSource;
    stopSource.request_stop();

    auto future = evaluator.evaluateAllAsync(player, {"%probe% == %probe%"}, {}, stopSource.get_token());
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(future.get());
    EXPECT_FALSE(resolver.wasRequested("%probe%"));
}

class FailingResolverAsyncTest : public ::testing::TestWithParam<std::string> {
protected:
    FailingResolver resolver;
    RecordingLogger logger;
    ThreadPool pool{2};
    InlineExecutor callbacks;
    ConditionEvaluator evaluator{resolver, logger, pool, callbacks};
    std::shared_ptr<const Caller> player = std::make_shared<NamedCaller>("Steve");
};

TEST_P(FailingResolverAsyncTest, SingleConditionCompletesWithFalse) {
    std::promise<bool> seen;
    auto seenFuture = seen.get_future();

    auto future = evaluator.evaluateAsync(player, GetParam() + " == 1",
                                          [&seen](bool result) { seen.set_value(result); });

    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(future.get());
    ASSERT_EQ(seenFuture.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(seenFuture.get());
    EXPECT_TRUE(logger.contains(LogLevel::Warning, GetParam()));
}

TEST_P(FailingResolverAsyncTest, ListCompletesWithFalse) {
    std::promise<bool> seen;
    auto seenFuture = seen.get_future();

    auto future = evaluator.evaluateAllAsync(player, {"1 > 0", GetParam() + " == 1", "2 > 1"},
                                             [&seen](bool result) { seen.set_value(result); });

    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(future.get());
    ASSERT_EQ(seenFuture.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(seenFuture.get());
    EXPECT_EQ(logger.count(LogLevel::Warning), 1u);
}

INSTANTIATE_TEST_SUITE_P(ResolverFailures, FailingResolverAsyncTest,
                         ::testing::Values(std::string("%boom%"), std::string("%odd%")));

TEST_F(InlineAsyncTest, NonStandardCallbackExceptionIsLogged) {
    auto future = evaluator.evaluateAsync(player, "1 > 0", [](bool) { throw 7; });
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(future.get());
    EXPECT_EQ(logger.count(LogLevel::Error), 1u);
}

TEST(TaskQueueTest, RunsTasksOnlyWhenDrained) {
    TaskQueue queue;
    std::vector<int> order;
    queue.post([&order]() { order.push_back(1); });
    queue.post([&order, &queue]() {
        order.push_back(2);
        queue.post([&order]() { order.push_back(3); });
    });

    EXPECT_EQ(queue.pending(), 2u);
    EXPECT_TRUE(order.empty());

    // Задача, добавленная во время разбора, выполняется в том же вызове
    EXPECT_EQ(queue.runPending(), 3u);
    EXPECT_EQ(queue.pending(), 0u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(queue.runPendingFor(1ms), 0u);
}

class QueuedAsyncTest : public ::testing::Test {
protected:
    RecordingResolver resolver;
    RecordingLogger logger;
    ThreadPool pool{2};
    TaskQueue callbacks;
    ConditionEvaluator evaluator{resolver, logger, pool, callbacks};
    std::shared_ptr<const Caller> player = std::make_shared<NamedCaller>("Steve");
};

TEST_F(QueuedAsyncTest, CallbackRunsOnDrainingThread) {
    const auto testThread = std::this_thread::get_id();
    std::thread::id callbackThread;

    auto future = evaluator.evaluateAsync(player, "5 >= 5", [&callbackThread](bool) {
        callbackThread = std::this_thread::get_id();
    });

    EXPECT_TRUE(drainUntilReady(callbacks, future));
    EXPECT_EQ(callbackThread, testThread);
}

TEST_F(QueuedAsyncTest, ResultWaitsForQueueToBeDrained) {
    auto future = evaluator.evaluateAsync(player, "1 > 0");
    // Без разбора очереди future не заполняется
    std::this_thread::sleep_for(50ms);
    EXPECT_NE(future.wait_for(0ms), std::future_status::ready);
    EXPECT_TRUE(drainUntilReady(callbacks, future));
}

TEST_F(QueuedAsyncTest, ListCompletesThroughQueue) {
    int callbackCalls = 0;
    auto future = evaluator.evaluateAllAsync(player, {"1 > 0", "a << abc", "x != y"},
                                             [&callbackCalls](bool) { ++callbackCalls; });
    EXPECT_TRUE(drainUntilReady(callbacks, future));
    EXPECT_EQ(callbackCalls, 1);
}

TEST_F(QueuedAsyncTest, StopBetweenConditionsCancelsRest) {
    std::stop_source stopSource;
    auto future = evaluator.evaluateAllAsync(player, {"1 > 0", "%probe% == %probe%"}, {},
                                             stopSource.get_token());

    // Первое условие уже в пуле; остановка запрашивается до разбора его результата
    stopSource.request_stop();
    EXPECT_FALSE(drainUntilReady(callbacks, future));
    EXPECT_FALSE(resolver.wasRequested("%probe%"));
}

} // namespace
} // namespace condeval
