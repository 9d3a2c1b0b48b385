#include "LockGraphMaterializer.h"
#include <QDebug>

namespace RailSeed::Locking {

LockGraphMaterializer::LockGraphMaterializer(InterlockingRegistry& registry, const NameResolver& resolver)
    : m_registry(registry), m_resolver(resolver) {}

CompileResult LockGraphMaterializer::materialize(const QList<LockItem>& groups, const MaterializeRequest& request) {
    // Resolution pass; leaves are visited in the same order as by writeItem
    QList<Resolution> resolutions;
    for (const LockItem& group : groups) {
        CompileResult result = resolveLeaves(group, request.strategy, resolutions);
        if (result.isFatal()) {
            return result;
        }
    }

    // Write pass
    for (int i = 0; i < groups.size(); ++i) {
        Lock lock;
        lock.objectId = request.objectId;
        lock.type = request.lockType;
        lock.routeLockGroup = i + 1;
        const qulonglong lockId = m_registry.addLock(lock);

        writeItem(groups.at(i), lockId, std::nullopt, request, resolutions);
    }

    return CompileResult::ok();
}

CompileResult LockGraphMaterializer::resolveLeaves(const LockItem& item, ResolveStrategy strategy,
                                                   QList<Resolution>& resolutions) {
    if (item.isCombinator()) {
        for (const LockItem& child : item.children) {
            CompileResult result = resolveLeaves(child, strategy, resolutions);
            if (result.isFatal()) {
                return result;
            }
        }
        return CompileResult::ok();
    }

    Resolution resolution = m_resolver.resolve(item, strategy);
    if (resolution.result.isFatal()) {
        return resolution.result;
    }
    if (resolution.result.isSkipped()) {
        qWarning() << " [LockGraphMaterializer] Skipping:" << resolution.result.describe();
        ++m_skippedLeafCount;
    }

    resolutions.append(resolution);
    return CompileResult::ok();
}

void LockGraphMaterializer::writeItem(const LockItem& item, qulonglong lockId, std::optional<qulonglong> parentId,
                                      const MaterializeRequest& request, QList<Resolution>& resolutions) {
    if (item.isCombinator()) {
        // Sparse table data leaves empty combinators behind
        if (item.children.empty()) {
            return;
        }

        LockCondition condition;
        condition.lockId = lockId;
        condition.type = conditionType(item);
        condition.parentId = parentId;
        const qulonglong conditionId = m_registry.addLockCondition(condition);

        for (const LockItem& child : item.children) {
            writeItem(child, lockId, conditionId, request, resolutions);
        }
        return;
    }

    const Resolution resolution = resolutions.takeFirst();
    if (resolution.objects.isEmpty()) {
        return;
    }

    if (resolution.objects.size() == 1) {
        writeLeafObject(item, *resolution.objects.first(), lockId, parentId, request);
        return;
    }

    // A lever standing for several routes: all of them must hold
    LockCondition group;
    group.lockId = lockId;
    group.type = LockConditionType::And;
    group.parentId = parentId;
    const qulonglong groupId = m_registry.addLockCondition(group);

    for (const InterlockingObject* target : resolution.objects) {
        writeLeafObject(item, *target, lockId, groupId, request);
    }
}

void LockGraphMaterializer::writeLeafObject(const LockItem& item, const InterlockingObject& target, qulonglong lockId,
                                            std::optional<qulonglong> parentId, const MaterializeRequest& request) {
    LockConditionObject conditionObject;
    conditionObject.lockId = lockId;
    conditionObject.objectId = target.id;
    conditionObject.parentId = parentId;
    conditionObject.timerSeconds = item.timerSeconds;
    conditionObject.isReverse = item.isReverse;
    m_registry.addLockConditionObject(conditionObject);

    if (request.emitSwitchingMachineRoutes && target.isSwitchingMachine()) {
        SwitchingMachineRoute switchingMachineRoute;
        switchingMachineRoute.routeId = request.objectId;
        switchingMachineRoute.switchingMachineId = target.id;
        switchingMachineRoute.isReverse = item.isReverse;
        m_registry.addSwitchingMachineRoute(switchingMachineRoute);
    }
}

LockConditionType LockGraphMaterializer::conditionType(const LockItem& item) {
    if (item.isOr()) return LockConditionType::Or;
    if (item.isNot()) return LockConditionType::Not;
    return LockConditionType::And;
}

} // namespace RailSeed::Locking
