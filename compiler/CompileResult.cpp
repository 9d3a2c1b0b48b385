#include "CompileResult.h"
#include <QStringList>

namespace RailSeed {

CompileResult::CompileResult(Status status, const QString& reason)
    : m_status(status), m_reason(reason) {}

CompileResult& CompileResult::setStationId(const QString& stationId) {
    if (m_stationId.isEmpty()) m_stationId = stationId;
    return *this;
}

CompileResult& CompileResult::setLeverName(const QString& leverName) {
    if (m_leverName.isEmpty()) m_leverName = leverName;
    return *this;
}

CompileResult& CompileResult::setToken(const QString& token) {
    if (m_token.isEmpty()) m_token = token;
    return *this;
}

CompileResult CompileResult::ok() {
    return CompileResult(Status::OK, "OK");
}

CompileResult CompileResult::skipped(const QString& reason) {
    return CompileResult(Status::SKIPPED, reason);
}

CompileResult CompileResult::malformedExpression(const QString& reason) {
    return CompileResult(Status::MALFORMED_EXPRESSION, reason);
}

CompileResult CompileResult::unresolvedReference(const QString& reason) {
    return CompileResult(Status::UNRESOLVED_REFERENCE, reason);
}

CompileResult CompileResult::missingUpstreamData(const QString& reason) {
    return CompileResult(Status::MISSING_UPSTREAM_DATA, reason);
}

QString CompileResult::statusName(Status status) {
    switch (status) {
    case Status::OK: return "OK";
    case Status::SKIPPED: return "SKIPPED";
    case Status::MALFORMED_EXPRESSION: return "MALFORMED_EXPRESSION";
    case Status::UNRESOLVED_REFERENCE: return "UNRESOLVED_REFERENCE";
    case Status::MISSING_UPSTREAM_DATA: return "MISSING_UPSTREAM_DATA";
    }
    return "UNKNOWN";
}

QString CompileResult::describe() const {
    QStringList context;
    if (!m_stationId.isEmpty()) context << QString("station=%1").arg(m_stationId);
    if (!m_leverName.isEmpty()) context << QString("lever=%1").arg(m_leverName);
    if (!m_token.isEmpty()) context << QString("token=%1").arg(m_token);

    QString text = QString("%1: %2").arg(statusName(m_status), m_reason);
    if (!context.isEmpty()) {
        text += QString(" (%1)").arg(context.join(", "));
    }
    return text;
}

QVariantMap CompileResult::toVariantMap() const {
    QVariantMap map;
    map["status"] = statusName(m_status);
    map["reason"] = m_reason;
    map["stationId"] = m_stationId;
    map["leverName"] = m_leverName;
    map["token"] = m_token;
    return map;
}

} // namespace RailSeed
