#pragma once
#include <QString>
#include <optional>

namespace RailSeed {

enum class ObjectType { Route, SwitchingMachine, Signal, TrackCircuit, Lever, DestinationButton };
enum class RouteType { Arriving, Departure, Guide, SwitchSignal, SwitchRoute };
enum class LeverType { Route, SwitchingMachine };
enum class ReverseState { Normal, Reversed };

// One row of the interlocking_object table. The discriminant selects which of
// the attribute groups below carry meaning; the others keep their defaults.
struct InterlockingObject {
    qulonglong id = 0;
    ObjectType type = ObjectType::TrackCircuit;
    QString name;
    QString stationId;

    // Route, SwitchingMachine
    QString tcName;

    // Route
    RouteType routeType = RouteType::Arriving;
    QString indicator;
    std::optional<int> approachLockTime;

    // Lever
    LeverType leverType = LeverType::Route;
    std::optional<qulonglong> switchingMachineId;

    // TrackCircuit
    int protectionZone = 99;
    QString operationNotificationDisplayName;

    // Signal
    QString signalTypeName;
    std::optional<qulonglong> trackCircuitId;

    bool isRoute() const { return type == ObjectType::Route; }
    bool isSwitchingMachine() const { return type == ObjectType::SwitchingMachine; }
    bool isTrackCircuit() const { return type == ObjectType::TrackCircuit; }
};

QString objectTypeName(ObjectType type);
std::optional<ObjectType> objectTypeFromName(const QString& name);

QString routeTypeName(RouteType type);
std::optional<RouteType> routeTypeFromName(const QString& name);

QString leverTypeName(LeverType type);
std::optional<LeverType> leverTypeFromName(const QString& name);

} // namespace RailSeed
