#include <gtest/gtest.h>
#include <QHash>
#include "lock/LockExpressionParser.h"
#include "lock/LockGraphMaterializer.h"
#include "TestFixtures.h"

using namespace RailSeed;
using namespace RailSeed::Locking;
using namespace RailSeed::Testing;

class LockGraphMaterializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        addTrackCircuit(registry, "TH65_11T");
        addTrackCircuit(registry, "TH65_12T");
        addTrackCircuit(registry, "TH65_13T");
        machine21 = addSwitchingMachine(registry, "TH65_W21");
        machine22 = addSwitchingMachine(registry, "TH65_W22");
        owner = addRoute(registry, "TH65_1R2", "TH65_1");
        addRoute(registry, "TH65_16R2", "TH65_16");
        addRoute(registry, "TH65_16R3", "TH65_16");
        registry.freezeObjects();
    }

    CompileResult compile(const char* expression, LockType lockType, ResolveStrategy strategy,
                          ParseMode mode = ParseMode::Default, bool emitRoutes = false) {
        ParseOutcome outcome = parser.parse(QString::fromUtf8(expression), mode);
        if (!outcome.result.isOk()) {
            return outcome.result;
        }

        MaterializeRequest request;
        request.objectId = owner;
        request.lockType = lockType;
        request.strategy = strategy;
        request.emitSwitchingMachineRoutes = emitRoutes;
        return materializer.materialize(outcome.groups, request);
    }

    // Each condition and leaf hangs off one lock, through conditions of that lock only
    void expectTree() {
        QHash<qulonglong, const LockCondition*> conditions;
        for (const LockCondition& condition : registry.lockConditions().rows()) {
            conditions.insert(condition.id, &condition);
        }

        auto reachesRoot = [&](qulonglong lockId, std::optional<qulonglong> parentId) {
            int steps = 0;
            while (parentId) {
                const LockCondition* parent = conditions.value(*parentId);
                if (!parent || parent->lockId != lockId || ++steps > conditions.size()) {
                    return false;
                }
                parentId = parent->parentId;
            }
            return true;
        };

        for (const LockCondition& condition : registry.lockConditions().rows()) {
            EXPECT_TRUE(reachesRoot(condition.lockId, condition.parentId)) << "condition " << condition.id;
        }
        for (const LockConditionObject& object : registry.lockConditionObjects().rows()) {
            EXPECT_TRUE(reachesRoot(object.lockId, object.parentId)) << "object " << object.id;
        }
    }

    InterlockingRegistry registry;
    CompilerConfig config;
    LockExpressionParser parser{"TH65", {"TH66S", "TH64"}};
    NameResolver resolver{registry, config};
    LockGraphMaterializer materializer{registry, resolver};
    qulonglong owner = 0;
    qulonglong machine21 = 0;
    qulonglong machine22 = 0;
};

TEST_F(LockGraphMaterializerTest, SingleLeafHangsOffLock) {
    ASSERT_TRUE(compile("11T", LockType::Lock, ResolveStrategy::General).isOk());

    ASSERT_EQ(registry.locks().size(), 1);
    const Lock& lock = registry.locks().rows().first();
    EXPECT_EQ(lock.objectId, owner);
    EXPECT_EQ(lock.type, LockType::Lock);
    EXPECT_EQ(lock.routeLockGroup, 1);

    EXPECT_EQ(registry.lockConditions().size(), 0);
    ASSERT_EQ(registry.lockConditionObjects().size(), 1);
    const LockConditionObject& leaf = registry.lockConditionObjects().rows().first();
    EXPECT_EQ(leaf.lockId, lock.id);
    EXPECT_FALSE(leaf.parentId.has_value());
    EXPECT_EQ(leaf.objectId, registry.findObject("TH65_11T")->id);
}

TEST_F(LockGraphMaterializerTest, NestedConditions) {
    ASSERT_TRUE(compile("11T 12T 但 13T", LockType::SignalControl, ResolveStrategy::General).isOk());

    ASSERT_EQ(registry.locks().size(), 1);
    // or(and(11T, 12T), not(13T))
    ASSERT_EQ(registry.lockConditions().size(), 3);
    const QList<LockCondition>& conditions = registry.lockConditions().rows();
    EXPECT_EQ(conditions[0].type, LockConditionType::Or);
    EXPECT_FALSE(conditions[0].parentId.has_value());
    EXPECT_EQ(conditions[1].type, LockConditionType::And);
    EXPECT_EQ(conditions[1].parentId.value_or(0), conditions[0].id);
    EXPECT_EQ(conditions[2].type, LockConditionType::Not);
    EXPECT_EQ(conditions[2].parentId.value_or(0), conditions[0].id);

    EXPECT_EQ(registry.lockConditionObjects().size(), 3);
    expectTree();
}

TEST_F(LockGraphMaterializerTest, TimerAndReverseCarriedToLeaf) {
    ASSERT_TRUE(compile("(21) 但 30秒", LockType::Lock, ResolveStrategy::SwitchingMachine).isOk());

    ASSERT_EQ(registry.lockConditionObjects().size(), 1);
    const LockConditionObject& leaf = registry.lockConditionObjects().rows().first();
    EXPECT_EQ(leaf.objectId, machine21);
    EXPECT_EQ(leaf.isReverse, ReverseState::Reversed);
    ASSERT_TRUE(leaf.timerSeconds.has_value());
    EXPECT_EQ(*leaf.timerSeconds, 30);
}

TEST_F(LockGraphMaterializerTest, EmptyExpressionGivesBareLock) {
    ASSERT_TRUE(compile("", LockType::Lock, ResolveStrategy::General).isOk());

    EXPECT_EQ(registry.locks().size(), 1);
    EXPECT_EQ(registry.lockConditions().size(), 0);
    EXPECT_EQ(registry.lockConditionObjects().size(), 0);
}

TEST_F(LockGraphMaterializerTest, LeverReferenceBecomesImplicitAnd) {
    ASSERT_TRUE(compile("16R", LockType::Lock, ResolveStrategy::General).isOk());

    ASSERT_EQ(registry.lockConditions().size(), 1);
    const LockCondition& group = registry.lockConditions().rows().first();
    EXPECT_EQ(group.type, LockConditionType::And);

    ASSERT_EQ(registry.lockConditionObjects().size(), 2);
    for (const LockConditionObject& leaf : registry.lockConditionObjects().rows()) {
        EXPECT_EQ(leaf.parentId.value_or(0), group.id);
    }
    expectTree();
}

TEST_F(LockGraphMaterializerTest, RouteLockGroupsAreNumbered) {
    ASSERT_TRUE(compile("(11T 12T) (13T)", LockType::RouteLock, ResolveStrategy::General,
                        ParseMode::RouteLock).isOk());

    ASSERT_EQ(registry.locks().size(), 2);
    EXPECT_EQ(registry.locks().rows()[0].routeLockGroup, 1);
    EXPECT_EQ(registry.locks().rows()[1].routeLockGroup, 2);
    EXPECT_EQ(registry.locks().rows()[1].type, LockType::RouteLock);

    EXPECT_EQ(registry.lockConditions().size(), 2);
    EXPECT_EQ(registry.lockConditionObjects().size(), 3);
    expectTree();
}

TEST_F(LockGraphMaterializerTest, SwitchingMachineRoutes) {
    ASSERT_TRUE(compile("21 (22)", LockType::Lock, ResolveStrategy::SwitchingMachine,
                        ParseMode::Default, true).isOk());

    ASSERT_EQ(registry.switchingMachineRoutes().size(), 2);
    const QList<SwitchingMachineRoute>& rows = registry.switchingMachineRoutes().rows();
    EXPECT_EQ(rows[0].routeId, owner);
    EXPECT_EQ(rows[0].switchingMachineId, machine21);
    EXPECT_EQ(rows[0].isReverse, ReverseState::Normal);
    EXPECT_EQ(rows[1].switchingMachineId, machine22);
    EXPECT_EQ(rows[1].isReverse, ReverseState::Reversed);
}

TEST_F(LockGraphMaterializerTest, SkippedLeafLeavesRestOfTree) {
    ASSERT_TRUE(compile("11T 15RZ", LockType::Lock, ResolveStrategy::General).isOk());

    EXPECT_EQ(materializer.skippedLeafCount(), 1);
    EXPECT_EQ(registry.lockConditions().size(), 1);
    EXPECT_EQ(registry.lockConditionObjects().size(), 1);
}

TEST_F(LockGraphMaterializerTest, UnresolvedWritesNothing) {
    CompileResult result = compile("11T 99T", LockType::Lock, ResolveStrategy::General);
    EXPECT_EQ(result.getStatus(), CompileResult::Status::UNRESOLVED_REFERENCE);
    EXPECT_EQ(result.getToken(), "99T");

    EXPECT_EQ(registry.locks().size(), 0);
    EXPECT_EQ(registry.lockConditions().size(), 0);
    EXPECT_EQ(registry.lockConditionObjects().size(), 0);
}
