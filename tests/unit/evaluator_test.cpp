#include <gtest/gtest.h>

#include "evaluator.hpp"
#include "parse_error.hpp"
#include "test_support.hpp"
#include "variable_table.hpp"

#include <string>
#include <vector>

namespace condeval {
namespace {

using test_support::RecordingLogger;
using test_support::RecordingResolver;

class EvaluatorTest : public ::testing::Test {
protected:
    RecordingResolver resolver;
    RecordingLogger logger;
    ThreadPool pool{1};
    InlineExecutor callbacks;
    ConditionEvaluator evaluator{resolver, logger, pool, callbacks};
    NamedCaller player{"Steve"};
};

TEST_F(EvaluatorTest, EvaluatesWithVariableTable) {
    VariableTable table;
    table.set("level", "12");
    table.set("world", "nether");
    ConditionEvaluator tableEvaluator(table, logger, pool, callbacks);

    EXPECT_TRUE(tableEvaluator.evaluate(player, "%level% >= 10 && %world% == nether"));
    EXPECT_FALSE(tableEvaluator.evaluate(player, "%level% > 50 || %world% == end"));
    EXPECT_TRUE(tableEvaluator.evaluate(player, "%caller% == Steve"));
}

TEST_F(EvaluatorTest, MalformedExpressionThrows) {
    EXPECT_THROW(evaluator.evaluate(player, "1>0)"), ParseError);
    EXPECT_THROW(evaluator.evaluate(player, "(1>0"), ParseError);
    EXPECT_THROW(evaluator.evaluate(player, ""), ParseError);
}

TEST_F(EvaluatorTest, NumericOperatorOnTextIsFalse) {
    EXPECT_FALSE(evaluator.evaluate(player, "abc > 1"));
}

TEST_F(EvaluatorTest, ResultIsLoggedAtDebugLevel) {
    evaluator.evaluate(player, "1 > 0");
    EXPECT_TRUE(logger.contains(LogLevel::Debug, "Steve"));
}

TEST_F(EvaluatorTest, EmptyListIsSatisfied) {
    EXPECT_TRUE(evaluator.evaluateAll(player, {}));
}

TEST_F(EvaluatorTest, ListStopsAtFirstFalseCondition) {
    std::vector<std::string> expressions = {"1>0", "0>1", "%probe% == 1"};
    EXPECT_FALSE(evaluator.evaluateAll(player, expressions));
    EXPECT_FALSE(resolver.wasRequested("%probe%"));
    EXPECT_EQ(logger.count(LogLevel::Warning), 0u);
}

TEST_F(EvaluatorTest, ListWithAllTrueConditionsPasses) {
    resolver.set("%rank%", "supervip");
    EXPECT_TRUE(evaluator.evaluateAll(player, {"%rank% >> vip", "2 >= 2", "a != b"}));
}

TEST_F(EvaluatorTest, BrokenLineInListIsLoggedAndFails) {
    std::vector<std::string> expressions = {"1>0", "1 > (", "%probe% == 1"};
    EXPECT_FALSE(evaluator.evaluateAll(player, expressions));
    EXPECT_TRUE(logger.contains(LogLevel::Warning, "1 > ("));
    EXPECT_FALSE(resolver.wasRequested("%probe%"));
}

TEST_F(EvaluatorTest, CompiledTreeIsReusable) {
    auto ast = ConditionEvaluator::compile("%level% >= 10");
    resolver.setFor("Steve", "%level%", "12");
    resolver.setFor("Alex", "%level%", "3");

    NamedCaller other("Alex");
    EXPECT_TRUE(evaluator.evaluate(*ast, player));
    EXPECT_FALSE(evaluator.evaluate(*ast, other));
}

} // namespace
} // namespace condeval
