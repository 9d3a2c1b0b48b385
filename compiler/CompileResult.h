#pragma once
#include <QString>
#include <QVariantMap>

namespace RailSeed {

class CompileResult {
public:
    enum class Status { OK, SKIPPED, MALFORMED_EXPRESSION, UNRESOLVED_REFERENCE, MISSING_UPSTREAM_DATA };

private:
    Status m_status = Status::OK;
    QString m_reason;
    QString m_stationId;
    QString m_leverName;
    QString m_token;

public:
    CompileResult(Status status = Status::OK, const QString& reason = QString());

    // Status checking
    bool isOk() const { return m_status == Status::OK; }
    bool isSkipped() const { return m_status == Status::SKIPPED; }
    bool isFatal() const { return !isOk() && !isSkipped(); }

    // Getters
    Status getStatus() const { return m_status; }
    QString getReason() const { return m_reason; }
    QString getStationId() const { return m_stationId; }
    QString getLeverName() const { return m_leverName; }
    QString getToken() const { return m_token; }

    // Builder pattern; context set first wins so inner frames keep their detail
    CompileResult& setStationId(const QString& stationId);
    CompileResult& setLeverName(const QString& leverName);
    CompileResult& setToken(const QString& token);

    // Factory methods
    static CompileResult ok();
    static CompileResult skipped(const QString& reason);
    static CompileResult malformedExpression(const QString& reason);
    static CompileResult unresolvedReference(const QString& reason);
    static CompileResult missingUpstreamData(const QString& reason);

    static QString statusName(Status status);
    QString describe() const;
    QVariantMap toVariantMap() const;
};

} // namespace RailSeed
