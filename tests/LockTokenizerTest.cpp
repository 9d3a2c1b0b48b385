#include <gtest/gtest.h>
#include "lock/LockTokenizer.h"

using namespace RailSeed::Locking;

TEST(LockTokenizerTest, EmptyExpression) {
    TokenizeResult tokenized = LockTokenizer::tokenize("");
    EXPECT_TRUE(tokenized.result.isOk());
    EXPECT_TRUE(tokenized.tokens.isEmpty());
}

TEST(LockTokenizerTest, BracketsAndNames) {
    TokenizeResult tokenized = LockTokenizer::tokenize("(12T 13R) {21}");
    ASSERT_TRUE(tokenized.result.isOk());
    EXPECT_EQ(tokenized.tokens, QStringList({"(", "12T", "13R", ")", "{", "21", "}"}));
}

TEST(LockTokenizerTest, DoubleBracketsWinOverSingle) {
    TokenizeResult tokenized = LockTokenizer::tokenize("[[21]] ((14)) [3]");
    ASSERT_TRUE(tokenized.result.isOk());
    EXPECT_EQ(tokenized.tokens, QStringList({"[[", "21", "]]", "((", "14", "))", "[", "3", "]"}));
}

TEST(LockTokenizerTest, NamesNeedNoSeparator) {
    TokenizeResult tokenized = LockTokenizer::tokenize("(12T)13R");
    ASSERT_TRUE(tokenized.result.isOk());
    EXPECT_EQ(tokenized.tokens, QStringList({"(", "12T", ")", "13R"}));
}

TEST(LockTokenizerTest, Keywords) {
    TokenizeResult tokenized = LockTokenizer::tokenize(QString::fromUtf8("A 但 5秒 又は B 但 C"));
    ASSERT_TRUE(tokenized.result.isOk());
    EXPECT_EQ(tokenized.tokens, QStringList({"A", QString::fromUtf8("但 5秒"), QString::fromUtf8("又は"), "B",
                                             QString::fromUtf8("但"), "C"}));
}

TEST(LockTokenizerTest, FullWidthSpaceInTimerClause) {
    TokenizeResult tokenized = LockTokenizer::tokenize(QString::fromUtf8("A 但　30秒"));
    ASSERT_TRUE(tokenized.result.isOk());
    ASSERT_EQ(tokenized.tokens.size(), 2);
    EXPECT_TRUE(LockTokenizer::isTimerClause(tokenized.tokens.at(1)));
    EXPECT_EQ(LockTokenizer::timerSeconds(tokenized.tokens.at(1)), 30);
}

TEST(LockTokenizerTest, TimerSecondsOverflow) {
    bool ok = true;
    LockTokenizer::timerSeconds(QString::fromUtf8("但 99999999999秒"), &ok);
    EXPECT_FALSE(ok);

    EXPECT_EQ(LockTokenizer::timerSeconds(QString::fromUtf8("但 45秒"), &ok), 45);
    EXPECT_TRUE(ok);
}

TEST(LockTokenizerTest, HalfWidthKanaNames) {
    TokenizeResult tokenized = LockTokenizer::tokenize(QString::fromUtf8("11ｲR 11ﾛR"));
    ASSERT_TRUE(tokenized.result.isOk());
    EXPECT_EQ(tokenized.tokens, QStringList({QString::fromUtf8("11ｲR"), QString::fromUtf8("11ﾛR")}));
}

TEST(LockTokenizerTest, UnknownCharacterIsMalformed) {
    TokenizeResult tokenized = LockTokenizer::tokenize("12T ? 13");
    EXPECT_EQ(tokenized.result.getStatus(), RailSeed::CompileResult::Status::MALFORMED_EXPRESSION);
    EXPECT_EQ(tokenized.result.getToken(), "?");
    EXPECT_TRUE(tokenized.tokens.isEmpty());
}

TEST(LockTokenizerTest, ClosingBrackets) {
    EXPECT_TRUE(LockTokenizer::isClosingBracket(")"));
    EXPECT_TRUE(LockTokenizer::isClosingBracket("]]"));
    EXPECT_TRUE(LockTokenizer::isClosingBracket("))"));
    EXPECT_TRUE(LockTokenizer::isClosingBracket("}"));
    EXPECT_FALSE(LockTokenizer::isClosingBracket("("));
    EXPECT_FALSE(LockTokenizer::isClosingBracket(QString::fromUtf8("但")));
}

TEST(TokenCursorTest, AdvancingLeavesOriginalUntouched) {
    TokenCursor cursor(QStringList({"A", "B"}));
    TokenCursor next = cursor.next();

    EXPECT_EQ(cursor.current(), "A");
    EXPECT_EQ(next.current(), "B");
    EXPECT_TRUE(next.next().atEnd());
    EXPECT_TRUE(next.next().current().isEmpty());
}
