#pragma once
#include <QList>
#include <QString>
#include <QStringList>
#include "LockItem.h"
#include "LockTokenizer.h"
#include "../compiler/CompileResult.h"

namespace RailSeed::Locking {

enum class ParseMode {
    Default,    // one group; several top-level items are joined by an implicit and
    RouteLock   // every top-level item is its own group, ( ) wraps a reversed and
};

struct ParseOutcome {
    QList<LockItem> groups;
    CompileResult result;
};

// Recursive-descent parser for one lock column of a station's table.
//
// [ ] and [[ ]] switch the station context to the first / second entry of the
// compiled station's adjacency list. { } only groups. (( )) is total control,
// which comes from a separate table and is dropped here. 但 N秒 attaches a
// timer to the preceding item; 但 X turns everything parsed so far into
// or(left, not(X)); 又は X into or(left, X), flattening a right-hand or.
class LockExpressionParser {
public:
    LockExpressionParser(const QString& stationId, const QStringList& adjacentStations);

    ParseOutcome parse(const QString& expression, ParseMode mode) const;
    ParseOutcome parseTokens(const QStringList& tokens, ParseMode mode) const;

    // x[0] when there is exactly one item, otherwise and(x)
    static LockItem groupByAndIfMultiple(const QList<LockItem>& items);

private:
    struct Context {
        QString stationId;
        ParseMode mode = ParseMode::Default;
        bool isReverse = false;
        bool isTotalControl = false;
    };

    struct SequenceResult {
        QList<LockItem> items;
        TokenCursor rest;
        CompileResult result;
    };

    SequenceResult parseSequence(TokenCursor cursor, const Context& context) const;
    SequenceResult expectClosing(const SequenceResult& inner, const QString& closing) const;

    LockItem makeCombinator(const QString& name, const Context& context, const QList<LockItem>& children) const;
    LockItem makeLeaf(const QString& token, const Context& context) const;

    QString m_stationId;
    QStringList m_adjacentStations;
};

} // namespace RailSeed::Locking
