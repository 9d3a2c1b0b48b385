#include "InterlockingObject.h"

namespace RailSeed {

QString objectTypeName(ObjectType type) {
    switch (type) {
    case ObjectType::Route: return "ROUTE";
    case ObjectType::SwitchingMachine: return "SWITCHING_MACHINE";
    case ObjectType::Signal: return "SIGNAL";
    case ObjectType::TrackCircuit: return "TRACK_CIRCUIT";
    case ObjectType::Lever: return "LEVER";
    case ObjectType::DestinationButton: return "DESTINATION_BUTTON";
    }
    return QString();
}

std::optional<ObjectType> objectTypeFromName(const QString& name) {
    if (name == "ROUTE") return ObjectType::Route;
    if (name == "SWITCHING_MACHINE") return ObjectType::SwitchingMachine;
    if (name == "SIGNAL") return ObjectType::Signal;
    if (name == "TRACK_CIRCUIT") return ObjectType::TrackCircuit;
    if (name == "LEVER") return ObjectType::Lever;
    if (name == "DESTINATION_BUTTON") return ObjectType::DestinationButton;
    return std::nullopt;
}

QString routeTypeName(RouteType type) {
    switch (type) {
    case RouteType::Arriving: return "ARRIVING";
    case RouteType::Departure: return "DEPARTURE";
    case RouteType::Guide: return "GUIDE";
    case RouteType::SwitchSignal: return "SWITCH_SIGNAL";
    case RouteType::SwitchRoute: return "SWITCH_ROUTE";
    }
    return QString();
}

std::optional<RouteType> routeTypeFromName(const QString& name) {
    if (name == "ARRIVING") return RouteType::Arriving;
    if (name == "DEPARTURE") return RouteType::Departure;
    if (name == "GUIDE") return RouteType::Guide;
    if (name == "SWITCH_SIGNAL") return RouteType::SwitchSignal;
    if (name == "SWITCH_ROUTE") return RouteType::SwitchRoute;
    return std::nullopt;
}

QString leverTypeName(LeverType type) {
    return type == LeverType::Route ? "ROUTE" : "SWITCHING_MACHINE";
}

std::optional<LeverType> leverTypeFromName(const QString& name) {
    if (name == "ROUTE") return LeverType::Route;
    if (name == "SWITCHING_MACHINE") return LeverType::SwitchingMachine;
    return std::nullopt;
}

} // namespace RailSeed
