#include "LockModel.h"

namespace RailSeed {

QString lockTypeName(LockType type) {
    switch (type) {
    case LockType::Lock: return "LOCK";
    case LockType::SignalControl: return "SIGNAL_CONTROL";
    case LockType::RouteLock: return "ROUTE_LOCK";
    case LockType::ApproachLock: return "APPROACH_LOCK";
    case LockType::Detector: return "DETECTOR";
    }
    return QString();
}

std::optional<LockType> lockTypeFromName(const QString& name) {
    if (name == "LOCK") return LockType::Lock;
    if (name == "SIGNAL_CONTROL") return LockType::SignalControl;
    if (name == "ROUTE_LOCK") return LockType::RouteLock;
    if (name == "APPROACH_LOCK") return LockType::ApproachLock;
    if (name == "DETECTOR") return LockType::Detector;
    return std::nullopt;
}

QString lockConditionTypeName(LockConditionType type) {
    switch (type) {
    case LockConditionType::And: return "AND";
    case LockConditionType::Or: return "OR";
    case LockConditionType::Not: return "NOT";
    }
    return QString();
}

std::optional<LockConditionType> lockConditionTypeFromName(const QString& name) {
    if (name == "AND") return LockConditionType::And;
    if (name == "OR") return LockConditionType::Or;
    if (name == "NOT") return LockConditionType::Not;
    return std::nullopt;
}

} // namespace RailSeed
