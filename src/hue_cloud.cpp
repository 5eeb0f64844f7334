#include "hue_cloud.h"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "hue_http.h"
#include "hue_log.h"
#include "hue_validator.h"

namespace hueconnect {

QList<BridgeCandidate> parseCloudResponse(const QByteArray &payload, QString *error)
{
    QJsonParseError err {};
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) {
        if (error)
            *error = err.error != QJsonParseError::NoError ? err.errorString()
                                                           : QStringLiteral("Expected a JSON array");
        return {};
    }

    QList<BridgeCandidate> out;
    const QDateTime now = QDateTime::currentDateTimeUtc();
    const QJsonArray records = doc.array();
    for (const QJsonValue &value : records) {
        const QJsonObject obj = value.toObject();
        const QString address = obj.value(QStringLiteral("internalipaddress")).toString().trimmed();
        if (address.isEmpty())
            continue;

        BridgeCandidate candidate;
        candidate.id = normalizeBridgeId(obj.value(QStringLiteral("id")).toString());
        candidate.address = address;
        candidate.port = obj.value(QStringLiteral("port")).toInt(443);
        candidate.source = QStringLiteral("cloud");
        candidate.discoveredAt = now;
        out.append(candidate);
    }
    if (error)
        error->clear();
    return out;
}

CloudDiscoveryStrategy::CloudDiscoveryStrategy(HttpTransport &http,
                                               const BridgeValidator &validator,
                                               QUrl endpoint,
                                               std::chrono::milliseconds timeout)
    : m_http(http)
    , m_validator(validator)
    , m_endpoint(std::move(endpoint))
    , m_timeout(timeout)
{
}

QUrl CloudDiscoveryStrategy::defaultEndpoint()
{
    return QUrl(QStringLiteral("https://discovery.meethue.com/"));
}

void CloudDiscoveryStrategy::run(DiscoveryCollector &collector, const CancellationToken &token)
{
    if (token.isCancelled())
        return;

    HttpRequest request;
    request.url = m_endpoint;
    request.setHeader("Accept", "application/json");
    request.timeoutMs = token.boundedTimeoutMs(static_cast<int>(m_timeout.count()));

    const HttpResult result = m_http.send(request);
    if (!result.ok) {
        qCInfo(discoveryLog) << "cloud discovery failed:" << result.error;
        return;
    }

    QString error;
    const QList<BridgeCandidate> candidates = parseCloudResponse(result.payload, &error);
    if (!error.isEmpty()) {
        qCWarning(discoveryLog) << "cloud discovery returned malformed JSON:" << error
                                << payloadSnippet(result.payload);
        return;
    }

    for (const BridgeCandidate &candidate : candidates) {
        if (token.isCancelled())
            return;
        if (!candidate.id.isEmpty() && collector.contains(candidate.id))
            continue;
        std::optional<ConfirmedBridge> bridge = m_validator.validate(candidate.address, token);
        if (!bridge || token.isCancelled())
            continue;
        bridge->source = tag();
        collector.report(*bridge);
    }
}

} // namespace hueconnect
