#include "LockExpressionParser.h"

namespace RailSeed::Locking {

LockExpressionParser::LockExpressionParser(const QString& stationId, const QStringList& adjacentStations)
    : m_stationId(stationId), m_adjacentStations(adjacentStations) {}

ParseOutcome LockExpressionParser::parse(const QString& expression, ParseMode mode) const {
    TokenizeResult tokenized = LockTokenizer::tokenize(expression);
    if (!tokenized.result.isOk()) {
        ParseOutcome outcome;
        outcome.result = tokenized.result.setStationId(m_stationId);
        return outcome;
    }
    return parseTokens(tokenized.tokens, mode);
}

ParseOutcome LockExpressionParser::parseTokens(const QStringList& tokens, ParseMode mode) const {
    ParseOutcome outcome;

    Context context;
    context.stationId = m_stationId;
    context.mode = mode;

    SequenceResult sequence = parseSequence(TokenCursor(tokens), context);
    if (!sequence.result.isOk()) {
        outcome.result = sequence.result.setStationId(m_stationId);
        return outcome;
    }

    // The top level has no bracket of its own to close
    if (!sequence.rest.atEnd()) {
        outcome.result = CompileResult::malformedExpression(
            QString("Unbalanced closing bracket '%1'").arg(sequence.rest.current()))
            .setToken(sequence.rest.current())
            .setStationId(m_stationId);
        return outcome;
    }

    if (mode == ParseMode::RouteLock) {
        outcome.groups = sequence.items;
    } else {
        outcome.groups = {groupByAndIfMultiple(sequence.items)};
    }
    outcome.result = CompileResult::ok();
    return outcome;
}

LockItem LockExpressionParser::groupByAndIfMultiple(const QList<LockItem>& items) {
    if (items.size() == 1) {
        return items.first();
    }

    LockItem group;
    group.name = NameAnd;
    group.children.assign(items.begin(), items.end());
    return group;
}

LockItem LockExpressionParser::makeCombinator(const QString& name, const Context& context,
                                              const QList<LockItem>& children) const {
    LockItem item;
    item.name = name;
    item.stationId = context.stationId;
    item.isReverse = context.isReverse ? ReverseState::Reversed : ReverseState::Normal;
    item.children.assign(children.begin(), children.end());
    return item;
}

LockItem LockExpressionParser::makeLeaf(const QString& token, const Context& context) const {
    LockItem item;
    item.name = token;
    item.stationId = context.stationId;
    item.isReverse = context.isReverse ? ReverseState::Reversed : ReverseState::Normal;
    item.isTotalControl = context.isTotalControl;
    return item;
}

LockExpressionParser::SequenceResult LockExpressionParser::expectClosing(
    const SequenceResult& inner, const QString& closing) const {
    if (!inner.result.isOk()) {
        return inner;
    }

    if (inner.rest.atEnd() || inner.rest.current() != closing) {
        SequenceResult failed;
        failed.rest = inner.rest;
        failed.result = CompileResult::malformedExpression(
            QString("'%1' is not closed").arg(closing))
            .setToken(inner.rest.atEnd() ? QString() : inner.rest.current());
        return failed;
    }

    SequenceResult closed;
    closed.items = inner.items;
    closed.rest = inner.rest.next();
    closed.result = CompileResult::ok();
    return closed;
}

LockExpressionParser::SequenceResult LockExpressionParser::parseSequence(
    TokenCursor cursor, const Context& context) const {

    QList<LockItem> result;

    auto fail = [&cursor](const CompileResult& error) {
        SequenceResult failed;
        failed.rest = cursor;
        failed.result = error;
        return failed;
    };

    while (!cursor.atEnd()) {
        const QString token = cursor.current();

        // Closing brackets belong to the caller
        if (LockTokenizer::isClosingBracket(token)) {
            break;
        }

        if (token == "{") {
            SequenceResult inner = expectClosing(parseSequence(cursor.next(), context), "}");
            if (!inner.result.isOk()) return inner;
            result.append(inner.items);
            cursor = inner.rest;
        }
        else if (token == "((") {
            // Total control is sourced elsewhere; parse to stay in sync, then drop
            Context inner = context;
            inner.isTotalControl = true;
            SequenceResult dropped = expectClosing(parseSequence(cursor.next(), inner), "))");
            if (!dropped.result.isOk()) return dropped;
            cursor = dropped.rest;
        }
        else if (token.startsWith('[')) {
            const int depth = token.size();
            if (depth > m_adjacentStations.size()) {
                return fail(CompileResult::missingUpstreamData(
                    QString("Station %1 has no adjacent station #%2").arg(m_stationId).arg(depth))
                    .setToken(token));
            }

            Context inner = context;
            inner.stationId = m_adjacentStations.at(depth - 1);
            SequenceResult other = expectClosing(parseSequence(cursor.next(), inner), QString(depth, ']'));
            if (!other.result.isOk()) return other;
            result.append(other.items);
            cursor = other.rest;
        }
        else if (token == "(") {
            const bool isRouteLock = context.mode == ParseMode::RouteLock;

            // Route lock: a group of its own. Otherwise: the reversed position of one object
            Context inner = context;
            inner.isReverse = !isRouteLock;
            SequenceResult target = expectClosing(parseSequence(cursor.next(), inner), ")");
            if (!target.result.isOk()) return target;

            if (isRouteLock) {
                LockItem group = makeCombinator(NameAnd, context, target.items);
                group.isReverse = ReverseState::Reversed;
                result.append(group);
            } else {
                if (target.items.size() != 1) {
                    return fail(CompileResult::malformedExpression(
                        QString("Reverse group must hold exactly one item, found %1").arg(target.items.size()))
                        .setToken(token));
                }
                result.append(target.items.first());
            }
            cursor = target.rest;
        }
        else if (LockTokenizer::isTimerClause(token)) {
            if (result.isEmpty()) {
                return fail(CompileResult::malformedExpression("Timer clause without a preceding item")
                                .setToken(token));
            }
            bool ok = false;
            const int seconds = LockTokenizer::timerSeconds(token, &ok);
            if (!ok) {
                return fail(CompileResult::malformedExpression("Timer seconds out of range").setToken(token));
            }
            result.last().timerSeconds = seconds;
            cursor = cursor.next();
        }
        else if (token == LockTokenizer::TokenBut) {
            // left or not(right)
            SequenceResult right = parseSequence(cursor.next(), context);
            if (!right.result.isOk()) return right;

            LockItem negated = makeCombinator(NameNot, context, {groupByAndIfMultiple(right.items)});
            LockItem either = makeCombinator(NameOr, context, {groupByAndIfMultiple(result), negated});
            result = {either};
            cursor = right.rest;
        }
        else if (token == LockTokenizer::TokenOr) {
            SequenceResult right = parseSequence(cursor.next(), context);
            if (!right.result.isOk()) return right;

            QList<LockItem> children = {groupByAndIfMultiple(result)};
            if (right.items.size() == 1 && right.items.first().isOr()) {
                const auto& spliced = right.items.first().children;
                for (const LockItem& child : spliced) {
                    children.append(child);
                }
            } else {
                children.append(groupByAndIfMultiple(right.items));
            }

            result = {makeCombinator(NameOr, context, children)};
            cursor = right.rest;
        }
        else {
            result.append(makeLeaf(token, context));
            cursor = cursor.next();
        }
    }

    SequenceResult done;
    done.items = result;
    done.rest = cursor;
    done.result = CompileResult::ok();
    return done;
}

} // namespace RailSeed::Locking
