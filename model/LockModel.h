#pragma once
#include <QString>
#include <optional>
#include "InterlockingObject.h"

namespace RailSeed {

enum class LockType { Lock, SignalControl, RouteLock, ApproachLock, Detector };
enum class LockConditionType { And, Or, Not };

struct Lock {
    qulonglong id = 0;
    qulonglong objectId = 0;
    LockType type = LockType::Lock;
    int routeLockGroup = 1;
};

struct LockCondition {
    qulonglong id = 0;
    qulonglong lockId = 0;
    LockConditionType type = LockConditionType::And;
    std::optional<qulonglong> parentId;   // none: directly under the lock
};

struct LockConditionObject {
    qulonglong id = 0;
    qulonglong lockId = 0;
    qulonglong objectId = 0;
    std::optional<qulonglong> parentId;
    std::optional<int> timerSeconds;
    ReverseState isReverse = ReverseState::Normal;
};

struct SwitchingMachineRoute {
    qulonglong routeId = 0;
    qulonglong switchingMachineId = 0;
    ReverseState isReverse = ReverseState::Normal;
};

struct NextSignal {
    QString signalName;
    QString sourceSignalName;
    QString targetSignalName;
    int depth = 1;
};

QString lockTypeName(LockType type);
std::optional<LockType> lockTypeFromName(const QString& name);

QString lockConditionTypeName(LockConditionType type);
std::optional<LockConditionType> lockConditionTypeFromName(const QString& name);

} // namespace RailSeed
