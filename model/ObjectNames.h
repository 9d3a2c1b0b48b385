#pragma once
#include <QString>

namespace RailSeed::ObjectNames {

// Object names are "<station>_<local name>" throughout the registry.
QString objectName(const QString& stationId, const QString& localName);

QString switchingMachineName(const QString& stationId, const QString& start);  // <station>_W<start>
QString leverName(const QString& stationId, const QString& start);             // R / L removed
QString destinationButtonName(const QString& stationId, const QString& end);   // ( ) removed, P appended
QString routeName(const QString& stationId, const QString& start, const QString& end);

// ｲ -> イ, ﾛ -> ロ. Tables use the half-width forms, object names the full-width ones.
QString toFullWidth(const QString& text);

// "TH65_12T" -> "TH65"; empty when the name carries no station prefix.
QString stationIdFromName(const QString& name);

} // namespace RailSeed::ObjectNames
