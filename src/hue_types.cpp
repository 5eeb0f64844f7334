#include "hue_types.h"

namespace hueconnect {

QUrl Session::baseUrl() const
{
    QUrl url;
    url.setScheme(useTls ? QStringLiteral("https") : QStringLiteral("http"));
    url.setHost(address.trimmed());
    if (port > 0)
        url.setPort(port);
    else
        url.setPort(useTls ? 443 : 80);
    return url;
}

QString toString(CommunicationStatus status)
{
    switch (status) {
    case CommunicationStatus::Online:
        return QStringLiteral("online");
    case CommunicationStatus::Offline:
        return QStringLiteral("offline");
    case CommunicationStatus::Issues:
        return QStringLiteral("issues");
    case CommunicationStatus::Unknown:
        break;
    }
    return QStringLiteral("unknown");
}

QString normalizeBridgeId(const QString &id)
{
    QString normalized = id.trimmed();
    normalized.remove(QLatin1Char(':'));
    normalized.remove(QLatin1Char('-'));
    return normalized.toUpper();
}

QString bridgeIdFromSerial(const QString &serial)
{
    const QString normalized = normalizeBridgeId(serial);
    if (normalized.size() != 12)
        return normalized;
    return normalized.left(6) + QStringLiteral("FFFE") + normalized.mid(6);
}

} // namespace hueconnect
