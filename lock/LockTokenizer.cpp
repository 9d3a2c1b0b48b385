#include "LockTokenizer.h"
#include <QRegularExpression>

namespace RailSeed::Locking {

const QString LockTokenizer::TokenBut = QStringLiteral("但");
const QString LockTokenizer::TokenOr = QStringLiteral("又は");

namespace {

// Alternatives are tried in order, so double brackets win over single ones and
// the timer clause wins over a bare 但.
const QRegularExpression& tokenPattern() {
    static const QRegularExpression pattern(
        QStringLiteral(R"(\[\[|\]\]|\(\(|\)\)|[\[\]{}()]|\x{4F46}[\s\x{3000}]+[0-9]+\x{79D2}|\x{4F46}|\x{53C8}\x{306F}|[A-Z0-9\x{FF72}\x{FF9B}]+)"));
    return pattern;
}

const QRegularExpression& digitsPattern() {
    static const QRegularExpression pattern(QStringLiteral("[0-9]+"));
    return pattern;
}

} // namespace

TokenizeResult LockTokenizer::tokenize(const QString& expression) {
    TokenizeResult tokenized;
    int position = 0;

    while (position < expression.size()) {
        if (expression.at(position).isSpace()) {
            ++position;
            continue;
        }

        QRegularExpressionMatch match = tokenPattern().match(
            expression, position, QRegularExpression::NormalMatch,
            QRegularExpression::AnchorAtOffsetMatchOption);

        if (!match.hasMatch() || match.capturedLength() == 0) {
            tokenized.tokens.clear();
            tokenized.result = CompileResult::malformedExpression(
                QString("Unexpected character '%1' at position %2 in \"%3\"")
                    .arg(expression.at(position)).arg(position).arg(expression))
                .setToken(expression.mid(position, 1));
            return tokenized;
        }

        tokenized.tokens.append(match.captured(0));
        position += match.capturedLength();
    }

    tokenized.result = CompileResult::ok();
    return tokenized;
}

bool LockTokenizer::isClosingBracket(const QString& token) {
    return token == ")" || token == "]" || token == "]]" || token == "}" || token == "))";
}

bool LockTokenizer::isTimerClause(const QString& token) {
    return token.size() > 1 && token.startsWith(TokenBut) && token.endsWith(QStringLiteral("秒"));
}

int LockTokenizer::timerSeconds(const QString& token, bool* ok) {
    return digitsPattern().match(token).captured(0).toInt(ok);
}

} // namespace RailSeed::Locking
