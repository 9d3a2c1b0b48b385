#include <gtest/gtest.h>
#include "lock/LockExpressionParser.h"

using namespace RailSeed;
using namespace RailSeed::Locking;

class LockExpressionParserTest : public ::testing::Test {
protected:
    LockExpressionParser parser{"TH65", {"TH66S", "TH64"}};

    LockItem parseSingle(const char* expression) {
        ParseOutcome outcome = parser.parse(QString::fromUtf8(expression), ParseMode::Default);
        EXPECT_TRUE(outcome.result.isOk()) << outcome.result.describe().toStdString();
        EXPECT_EQ(outcome.groups.size(), 1);
        return outcome.groups.isEmpty() ? LockItem() : outcome.groups.first();
    }

    CompileResult::Status parseStatus(const char* expression, ParseMode mode = ParseMode::Default) {
        return parser.parse(QString::fromUtf8(expression), mode).result.getStatus();
    }
};

TEST_F(LockExpressionParserTest, SingleLeaf) {
    LockItem item = parseSingle("A");
    EXPECT_EQ(item.name, "A");
    EXPECT_EQ(item.stationId, "TH65");
    EXPECT_EQ(item.isReverse, ReverseState::Normal);
    EXPECT_FALSE(item.timerSeconds.has_value());
    EXPECT_TRUE(item.children.empty());
}

TEST_F(LockExpressionParserTest, ImplicitAnd) {
    LockItem item = parseSingle("A B");
    ASSERT_TRUE(item.isAnd());
    ASSERT_EQ(item.children.size(), 2u);
    EXPECT_EQ(item.children[0].name, "A");
    EXPECT_EQ(item.children[1].name, "B");
}

TEST_F(LockExpressionParserTest, TimerAttachesToPrecedingItem) {
    LockItem item = parseSingle("A 但 5秒");
    EXPECT_EQ(item.name, "A");
    ASSERT_TRUE(item.timerSeconds.has_value());
    EXPECT_EQ(*item.timerSeconds, 5);
}

TEST_F(LockExpressionParserTest, ButBecomesOrNot) {
    LockItem item = parseSingle("A 但 B");
    ASSERT_TRUE(item.isOr());
    ASSERT_EQ(item.children.size(), 2u);
    EXPECT_EQ(item.children[0].name, "A");

    const LockItem& negated = item.children[1];
    ASSERT_TRUE(negated.isNot());
    ASSERT_EQ(negated.children.size(), 1u);
    EXPECT_EQ(negated.children[0].name, "B");
}

TEST_F(LockExpressionParserTest, ButTakesEverythingParsedSoFar) {
    LockItem item = parseSingle("A B 但 C");
    ASSERT_TRUE(item.isOr());
    ASSERT_EQ(item.children.size(), 2u);
    ASSERT_TRUE(item.children[0].isAnd());
    EXPECT_EQ(item.children[0].children.size(), 2u);
    EXPECT_TRUE(item.children[1].isNot());
}

TEST_F(LockExpressionParserTest, OrOfTwo) {
    LockItem item = parseSingle("A 又は B");
    ASSERT_TRUE(item.isOr());
    ASSERT_EQ(item.children.size(), 2u);
    EXPECT_EQ(item.children[0].name, "A");
    EXPECT_EQ(item.children[1].name, "B");
}

TEST_F(LockExpressionParserTest, RightHandOrIsFlattened) {
    LockItem item = parseSingle("A 又は (B 又は C)");
    ASSERT_TRUE(item.isOr());
    ASSERT_EQ(item.children.size(), 3u);
    EXPECT_EQ(item.children[0].name, "A");
    EXPECT_EQ(item.children[1].name, "B");
    EXPECT_EQ(item.children[2].name, "C");
}

TEST_F(LockExpressionParserTest, ChainedOrIsFlattened) {
    LockItem item = parseSingle("A 又は B 又は C");
    ASSERT_TRUE(item.isOr());
    EXPECT_EQ(item.children.size(), 3u);
}

TEST_F(LockExpressionParserTest, ParenthesisMeansReversed) {
    LockItem item = parseSingle("(21) 22");
    ASSERT_TRUE(item.isAnd());
    ASSERT_EQ(item.children.size(), 2u);
    EXPECT_EQ(item.children[0].name, "21");
    EXPECT_EQ(item.children[0].isReverse, ReverseState::Reversed);
    EXPECT_EQ(item.children[1].isReverse, ReverseState::Normal);
}

TEST_F(LockExpressionParserTest, BracesOnlyGroup) {
    LockItem item = parseSingle("{A B} C");
    ASSERT_TRUE(item.isAnd());
    ASSERT_EQ(item.children.size(), 3u);
    EXPECT_EQ(item.children[2].name, "C");
}

TEST_F(LockExpressionParserTest, TotalControlIsDropped) {
    LockItem item = parseSingle("A ((B))");
    EXPECT_EQ(item.name, "A");
    EXPECT_TRUE(item.children.empty());
}

TEST_F(LockExpressionParserTest, AdjacentStations) {
    LockItem first = parseSingle("[A]");
    EXPECT_EQ(first.name, "A");
    EXPECT_EQ(first.stationId, "TH66S");

    LockItem second = parseSingle("[[A]]");
    EXPECT_EQ(second.name, "A");
    EXPECT_EQ(second.stationId, "TH64");
}

TEST_F(LockExpressionParserTest, AdjacentStationScopeEndsWithBracket) {
    LockItem item = parseSingle("[A] B");
    ASSERT_TRUE(item.isAnd());
    ASSERT_EQ(item.children.size(), 2u);
    EXPECT_EQ(item.children[0].stationId, "TH66S");
    EXPECT_EQ(item.children[1].stationId, "TH65");
}

TEST_F(LockExpressionParserTest, MissingAdjacentStation) {
    LockExpressionParser lonely("TH67", {});
    ParseOutcome outcome = lonely.parse("[A]", ParseMode::Default);
    EXPECT_EQ(outcome.result.getStatus(), CompileResult::Status::MISSING_UPSTREAM_DATA);
    EXPECT_EQ(outcome.result.getStationId(), "TH67");
}

TEST_F(LockExpressionParserTest, EmptyExpressionIsEmptyAnd) {
    ParseOutcome outcome = parser.parse("", ParseMode::Default);
    ASSERT_TRUE(outcome.result.isOk());
    ASSERT_EQ(outcome.groups.size(), 1);
    EXPECT_TRUE(outcome.groups.first().isAnd());
    EXPECT_TRUE(outcome.groups.first().children.empty());
}

TEST_F(LockExpressionParserTest, RouteLockGroupIsReversedAnd) {
    ParseOutcome outcome = parser.parse("(A)", ParseMode::RouteLock);
    ASSERT_TRUE(outcome.result.isOk());
    ASSERT_EQ(outcome.groups.size(), 1);

    const LockItem& group = outcome.groups.first();
    ASSERT_TRUE(group.isAnd());
    EXPECT_EQ(group.isReverse, ReverseState::Reversed);
    ASSERT_EQ(group.children.size(), 1u);
    EXPECT_EQ(group.children[0].name, "A");
    EXPECT_EQ(group.children[0].isReverse, ReverseState::Normal);
}

TEST_F(LockExpressionParserTest, RouteLockKeepsTopLevelItemsApart) {
    ParseOutcome outcome = parser.parse("(A B) C", ParseMode::RouteLock);
    ASSERT_TRUE(outcome.result.isOk());
    ASSERT_EQ(outcome.groups.size(), 2);
    EXPECT_EQ(outcome.groups[0].children.size(), 2u);
    EXPECT_EQ(outcome.groups[1].name, "C");
}

TEST_F(LockExpressionParserTest, EmptyRouteLockHasNoGroups) {
    ParseOutcome outcome = parser.parse("", ParseMode::RouteLock);
    ASSERT_TRUE(outcome.result.isOk());
    EXPECT_TRUE(outcome.groups.isEmpty());
}

TEST_F(LockExpressionParserTest, UnclosedBracket) {
    EXPECT_EQ(parseStatus("(A"), CompileResult::Status::MALFORMED_EXPRESSION);
    EXPECT_EQ(parseStatus("{A B"), CompileResult::Status::MALFORMED_EXPRESSION);
    EXPECT_EQ(parseStatus("[A]]"), CompileResult::Status::MALFORMED_EXPRESSION);
}

TEST_F(LockExpressionParserTest, UnbalancedClosingBracket) {
    ParseOutcome outcome = parser.parse("A) B", ParseMode::Default);
    EXPECT_EQ(outcome.result.getStatus(), CompileResult::Status::MALFORMED_EXPRESSION);
    EXPECT_EQ(outcome.result.getToken(), ")");
}

TEST_F(LockExpressionParserTest, ReversedGroupNeedsOneItem) {
    EXPECT_EQ(parseStatus("(A B)"), CompileResult::Status::MALFORMED_EXPRESSION);
    EXPECT_EQ(parseStatus("()"), CompileResult::Status::MALFORMED_EXPRESSION);
}

TEST_F(LockExpressionParserTest, TimerWithoutItem) {
    EXPECT_EQ(parseStatus("但 5秒"), CompileResult::Status::MALFORMED_EXPRESSION);
}

TEST_F(LockExpressionParserTest, TimerOutOfRange) {
    ParseOutcome outcome = parser.parse(QString::fromUtf8("A 但 99999999999秒"), ParseMode::Default);
    EXPECT_EQ(outcome.result.getStatus(), CompileResult::Status::MALFORMED_EXPRESSION);
    EXPECT_EQ(outcome.result.getToken(), QString::fromUtf8("但 99999999999秒"));
}
