#pragma once
#include <QString>
#include <QStringList>
#include "../compiler/CompileResult.h"

namespace RailSeed::Locking {

struct TokenizeResult {
    QStringList tokens;
    CompileResult result;
};

// Splits one lock column into brackets, 但 / 但 N秒 / 又は keywords and
// object name tokens.
class LockTokenizer {
public:
    static TokenizeResult tokenize(const QString& expression);

    static bool isClosingBracket(const QString& token);
    static bool isTimerClause(const QString& token);
    // ok is false when the digits do not fit an int
    static int timerSeconds(const QString& token, bool* ok = nullptr);

    static const QString TokenBut;      // 但
    static const QString TokenOr;       // 又は
};

// Immutable position in a token list; advancing yields a new cursor.
class TokenCursor {
public:
    TokenCursor() = default;
    explicit TokenCursor(const QStringList& tokens, int position = 0)
        : m_tokens(tokens), m_position(position) {}

    bool atEnd() const { return m_position >= m_tokens.size(); }
    QString current() const { return atEnd() ? QString() : m_tokens.at(m_position); }
    TokenCursor next() const { return TokenCursor(m_tokens, m_position + 1); }
    int position() const { return m_position; }

private:
    QStringList m_tokens;
    int m_position = 0;
};

} // namespace RailSeed::Locking
