#include <gtest/gtest.h>
#include "signal/SignalVisibilityExpander.h"
#include "TestFixtures.h"

using namespace RailSeed;
using namespace RailSeed::Testing;

class SignalVisibilityExpanderTest : public ::testing::Test {
protected:
    void addSignals(const QStringList& names) {
        for (const QString& name : names) {
            addSignal(registry, name);
        }
    }

    const NextSignal* find(const QString& signal, const QString& target) const {
        for (const NextSignal& row : registry.nextSignals().rows()) {
            if (row.signalName == signal && row.targetSignalName == target) {
                return &row;
            }
        }
        return nullptr;
    }

    InterlockingRegistry registry;
};

TEST_F(SignalVisibilityExpanderTest, TwoHopChain) {
    addSignals({"X", "Y", "Z"});
    addDirectNextSignal(registry, "X", "Y");
    addDirectNextSignal(registry, "Y", "Z");

    SignalVisibilityExpander expander(registry);
    EXPECT_EQ(expander.expand(), 1);

    const NextSignal* row = find("X", "Z");
    ASSERT_NE(row, nullptr);
    EXPECT_EQ(row->depth, 2);
    EXPECT_EQ(row->sourceSignalName, "Y");
}

TEST_F(SignalVisibilityExpanderTest, DirectEdgeSuppressesDeeperRow) {
    addSignals({"X", "Y", "Z"});
    addDirectNextSignal(registry, "X", "Y");
    addDirectNextSignal(registry, "Y", "Z");
    addDirectNextSignal(registry, "X", "Z");

    SignalVisibilityExpander expander(registry);
    EXPECT_EQ(expander.expand(), 0);

    const NextSignal* row = find("X", "Z");
    ASSERT_NE(row, nullptr);
    EXPECT_EQ(row->depth, 1);
}

TEST_F(SignalVisibilityExpanderTest, StopsAtMaximumDepth) {
    addSignals({"S1", "S2", "S3", "S4", "S5", "S6"});
    addDirectNextSignal(registry, "S1", "S2");
    addDirectNextSignal(registry, "S2", "S3");
    addDirectNextSignal(registry, "S3", "S4");
    addDirectNextSignal(registry, "S4", "S5");
    addDirectNextSignal(registry, "S5", "S6");

    SignalVisibilityExpander expander(registry);
    expander.expand();

    ASSERT_NE(find("S1", "S5"), nullptr);
    EXPECT_EQ(find("S1", "S5")->depth, SignalVisibilityExpander::MAX_DEPTH);
    EXPECT_EQ(find("S1", "S5")->sourceSignalName, "S4");
    EXPECT_EQ(find("S1", "S6"), nullptr);
    EXPECT_EQ(find("S2", "S6")->depth, 4);
}

TEST_F(SignalVisibilityExpanderTest, DiamondKeepsOneRowAtMinimalDepth) {
    // A sees B and C, both of which see D; A -> E only via D
    addSignals({"A", "B", "C", "D", "E"});
    addDirectNextSignal(registry, "A", "B");
    addDirectNextSignal(registry, "A", "C");
    addDirectNextSignal(registry, "B", "D");
    addDirectNextSignal(registry, "C", "D");
    addDirectNextSignal(registry, "D", "E");

    SignalVisibilityExpander expander(registry);
    expander.expand();

    int rowsToD = 0;
    for (const NextSignal& row : registry.nextSignals().rows()) {
        if (row.signalName == "A" && row.targetSignalName == "D") {
            ++rowsToD;
            EXPECT_EQ(row.depth, 2);
            EXPECT_EQ(row.sourceSignalName, "B");
        }
    }
    EXPECT_EQ(rowsToD, 1);

    ASSERT_NE(find("A", "E"), nullptr);
    EXPECT_EQ(find("A", "E")->depth, 3);
}

TEST_F(SignalVisibilityExpanderTest, CycleDoesNotRunAway) {
    addSignals({"P", "Q"});
    addDirectNextSignal(registry, "P", "Q");
    addDirectNextSignal(registry, "Q", "P");

    SignalVisibilityExpander expander(registry);
    // P sees itself through Q, Q through P; nothing further is new
    EXPECT_EQ(expander.expand(), 2);
    EXPECT_EQ(find("P", "P")->depth, 2);
}

TEST_F(SignalVisibilityExpanderTest, SecondExpansionAddsNothing) {
    addSignals({"X", "Y", "Z"});
    addDirectNextSignal(registry, "X", "Y");
    addDirectNextSignal(registry, "Y", "Z");

    SignalVisibilityExpander first(registry);
    first.expand();
    const qsizetype rows = registry.nextSignals().size();

    SignalVisibilityExpander second(registry);
    EXPECT_EQ(second.expand(), 0);
    EXPECT_EQ(registry.nextSignals().size(), rows);
}
