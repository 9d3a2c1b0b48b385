#include <gtest/gtest.h>
#include "compiler/CompileResult.h"

using RailSeed::CompileResult;

TEST(CompileResultTest, DefaultIsOk) {
    CompileResult result;
    EXPECT_TRUE(result.isOk());
    EXPECT_FALSE(result.isSkipped());
    EXPECT_FALSE(result.isFatal());
}

TEST(CompileResultTest, SkippedIsNotFatal) {
    CompileResult result = CompileResult::skipped("guide route");
    EXPECT_FALSE(result.isOk());
    EXPECT_TRUE(result.isSkipped());
    EXPECT_FALSE(result.isFatal());
}

TEST(CompileResultTest, ErrorKindsAreFatal) {
    EXPECT_TRUE(CompileResult::malformedExpression("x").isFatal());
    EXPECT_TRUE(CompileResult::unresolvedReference("x").isFatal());
    EXPECT_TRUE(CompileResult::missingUpstreamData("x").isFatal());
}

TEST(CompileResultTest, FirstContextWins) {
    CompileResult result = CompileResult::unresolvedReference("No object matches 99");
    result.setStationId("TH66S").setToken("99");
    result.setStationId("TH65").setLeverName("12R").setToken("other");

    EXPECT_EQ(result.getStationId(), "TH66S");
    EXPECT_EQ(result.getLeverName(), "12R");
    EXPECT_EQ(result.getToken(), "99");
}

TEST(CompileResultTest, DescribeCarriesContext) {
    CompileResult result = CompileResult::unresolvedReference("No object matches 99");
    result.setStationId("TH65").setLeverName("12R").setToken("99");

    const QString text = result.describe();
    EXPECT_TRUE(text.contains("UNRESOLVED_REFERENCE"));
    EXPECT_TRUE(text.contains("TH65"));
    EXPECT_TRUE(text.contains("12R"));
    EXPECT_TRUE(text.contains("99"));

    QVariantMap map = result.toVariantMap();
    EXPECT_EQ(map["stationId"].toString(), "TH65");
}
