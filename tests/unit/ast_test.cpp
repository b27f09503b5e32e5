#include <gtest/gtest.h>

#include "ast.hpp"
#include "evaluator.hpp"
#include "test_support.hpp"

namespace condeval {
namespace {

using test_support::RecordingResolver;

class AstTest : public ::testing::Test {
protected:
    RecordingResolver resolver;
    NamedCaller alice{"alice"};
    NamedCaller bob{"bob"};

    bool run(const std::string& source, const Caller& caller) {
        auto ast = ConditionEvaluator::compile(source);
        return evaluate(*ast, caller, resolver);
    }
};

TEST_F(AstTest, AndSkipsRightSideWhenLeftIsFalse) {
    EXPECT_FALSE(run("0 > 1 && %probe% == 1", alice));
    EXPECT_FALSE(resolver.wasRequested("%probe%"));
}

TEST_F(AstTest, OrSkipsRightSideWhenLeftIsTrue) {
    EXPECT_TRUE(run("1 > 0 || %probe% == 1", alice));
    EXPECT_FALSE(resolver.wasRequested("%probe%"));
}

TEST_F(AstTest, BothSidesEvaluatedWhenNeeded) {
    EXPECT_FALSE(run("1 > 0 && 0 > 1", alice));
    EXPECT_EQ(resolver.requestCount(), 4u);
}

TEST_F(AstTest, PrecedenceGroupsAndUnderOr) {
    resolver.set("%a%", "1");
    resolver.set("%b%", "0");
    // A || (B && C): при истинном A ни B, ни C не вычисляются
    EXPECT_TRUE(run("%a% == 1 || %b% == 1 && %c% == 1", alice));
    EXPECT_FALSE(resolver.wasRequested("%b%"));
    EXPECT_FALSE(resolver.wasRequested("%c%"));
}

TEST_F(AstTest, OperandsAreResolvedInOrder) {
    EXPECT_TRUE(run("%x% == %x%", alice));
    auto history = resolver.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0], "%x%");
}

TEST_F(AstTest, SameTreeServesDifferentCallers) {
    resolver.setFor("alice", "%level%", "30");
    resolver.setFor("bob", "%level%", "5");
    auto ast = ConditionEvaluator::compile("%level% >= 10");

    EXPECT_TRUE(evaluate(*ast, alice, resolver));
    EXPECT_FALSE(evaluate(*ast, bob, resolver));
    EXPECT_TRUE(evaluate(*ast, alice, resolver));
    // Подстановка выполняется при каждом вычислении
    EXPECT_EQ(resolver.requestCount(), 6u);
}

TEST_F(AstTest, QuotedConnectiveIsPlainText) {
    EXPECT_TRUE(run("'a && b' == 'a && b'", alice));
    EXPECT_TRUE(run("'x || y' >> '|'", alice));
}

TEST_F(AstTest, NumericOperatorOnTextIsFalse) {
    EXPECT_FALSE(run("abc > 1", alice));
}

TEST(AstBuildTest, FactoriesProduceExpectedShape) {
    auto tree = makeOr(makeComparison("a", Comparator::Equal, "1"),
                       makeAnd(makeComparison("b", Comparator::Less, "2"),
                               makeComparison("c", Comparator::Contains, "d")));
    EXPECT_EQ(describe(*tree), "((a == 1) || ((b < 2) && (c >> d)))");
    EXPECT_TRUE(std::holds_alternative<OrNode>(tree->value));
}

} // namespace
} // namespace condeval
