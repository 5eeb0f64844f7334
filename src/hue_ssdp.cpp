#include "hue_ssdp.h"

#include <QDateTime>
#include <QHostAddress>
#include <QRegularExpression>
#include <QSet>
#include <QUdpSocket>

#include "hue_log.h"
#include "hue_validator.h"

namespace hueconnect {

namespace {

const QHostAddress kMulticastGroup(QStringLiteral("239.255.255.250"));
constexpr quint16 kSsdpPort = 1900;
constexpr int kReadSliceMs = 200;

} // namespace

QByteArray buildSearchRequest(const QString &searchTarget)
{
    QByteArray request;
    request.append("M-SEARCH * HTTP/1.1\r\n");
    request.append("HOST: 239.255.255.250:1900\r\n");
    request.append("MAN: \"ssdp:discover\"\r\n");
    request.append("MX: 3\r\n");
    request.append("ST: ");
    request.append(searchTarget.toUtf8());
    request.append("\r\n\r\n");
    return request;
}

std::optional<QUrl> locationFromResponse(const QByteArray &datagram)
{
    const QString text = QString::fromUtf8(datagram);
    if (!text.contains(QStringLiteral("IpBridge"), Qt::CaseInsensitive)
        && !text.contains(QStringLiteral("hue"), Qt::CaseInsensitive))
        return std::nullopt;

    const QStringList lines = text.split(QRegularExpression(QStringLiteral("\r?\n")));
    for (const QString &line : lines) {
        const int colon = line.indexOf(QLatin1Char(':'));
        if (colon <= 0)
            continue;
        if (line.left(colon).trimmed().compare(QStringLiteral("location"), Qt::CaseInsensitive) != 0)
            continue;

        const QUrl url(line.mid(colon + 1).trimmed());
        if (!url.isValid() || url.host().isEmpty())
            return std::nullopt;
        return url;
    }
    return std::nullopt;
}

SsdpStrategy::SsdpStrategy(const BridgeValidator &validator, std::chrono::milliseconds window)
    : m_validator(validator)
    , m_window(window)
{
}

QStringList SsdpStrategy::searchTargets()
{
    return {
        QStringLiteral("urn:schemas-upnp-org:device:basic:1"),
        QStringLiteral("upnp:rootdevice"),
        QStringLiteral("urn:schemas-upnp-org:device:IpBridge:1"),
    };
}

void SsdpStrategy::run(DiscoveryCollector &collector, const CancellationToken &token)
{
    QUdpSocket socket;
    if (!socket.bind(QHostAddress(QHostAddress::AnyIPv4), 0, QUdpSocket::ShareAddress)) {
        qCWarning(discoveryLog) << "SSDP bind failed:" << socket.errorString();
        return;
    }

    for (const QString &target : searchTargets()) {
        if (token.isCancelled())
            return;
        const QByteArray request = buildSearchRequest(target);
        if (socket.writeDatagram(request, kMulticastGroup, kSsdpPort) < 0)
            qCDebug(discoveryLog) << "SSDP send failed for" << target << ":" << socket.errorString();
    }

    const CancellationToken window = token.child(m_window);
    QSet<QString> seenLocations;
    while (!window.isCancelled()) {
        if (!socket.hasPendingDatagrams() && !socket.waitForReadyRead(kReadSliceMs))
            continue;

        while (socket.hasPendingDatagrams() && !window.isCancelled()) {
            QByteArray datagram;
            datagram.resize(static_cast<int>(socket.pendingDatagramSize()));
            QHostAddress sender;
            if (socket.readDatagram(datagram.data(), datagram.size(), &sender) < 0)
                continue;

            const std::optional<QUrl> location = locationFromResponse(datagram);
            if (!location)
                continue;
            const QString key = location->toString();
            if (seenLocations.contains(key))
                continue;
            seenLocations.insert(key);

            qCDebug(discoveryLog) << "SSDP reply from" << sender.toString() << "location" << key;
            std::optional<ConfirmedBridge> bridge = m_validator.validateLocation(*location, token);
            if (!bridge || token.isCancelled())
                continue;
            bridge->source = tag();
            collector.report(*bridge);
        }
    }
}

} // namespace hueconnect
