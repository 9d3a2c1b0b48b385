#pragma once
#include <QString>
#include <optional>
#include <vector>
#include "../model/InterlockingObject.h"

namespace RailSeed::Locking {

// Keyword names of combinator items; any other name is a leaf token.
inline const QString NameAnd = QStringLiteral("and");
inline const QString NameOr = QStringLiteral("or");
inline const QString NameNot = QStringLiteral("not");

// Parse-time node of one lock expression, before name resolution.
struct LockItem {
    QString name;
    QString stationId;
    ReverseState isReverse = ReverseState::Normal;
    std::optional<int> timerSeconds;
    bool isTotalControl = false;
    std::vector<LockItem> children;

    bool isAnd() const { return name == NameAnd; }
    bool isOr() const { return name == NameOr; }
    bool isNot() const { return name == NameNot; }
    bool isCombinator() const { return isAnd() || isOr() || isNot(); }
};

} // namespace RailSeed::Locking
