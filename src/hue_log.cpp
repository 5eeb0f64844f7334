#include "hue_log.h"

namespace hueconnect {

Q_LOGGING_CATEGORY(httpLog, "hueconnect.http")
Q_LOGGING_CATEGORY(discoveryLog, "hueconnect.discovery")
Q_LOGGING_CATEGORY(gatewayLog, "hueconnect.gateway")
Q_LOGGING_CATEGORY(eventStreamLog, "hueconnect.eventstream")
Q_LOGGING_CATEGORY(statusLog, "hueconnect.status")

QString payloadSnippet(const QByteArray &payload, int maxBytes)
{
    const QByteArray snippet = payload.left(maxBytes);
    QString text = QString::fromUtf8(snippet);
    if (payload.size() > snippet.size())
        text.append(QStringLiteral(" ..."));
    return text;
}

} // namespace hueconnect
