#include "hue_validator.h"

#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>
#include <QXmlStreamReader>

#include "hue_log.h"

namespace hueconnect {

namespace {

const QString kDefaultBridgeName = QStringLiteral("Philips Hue Bridge");

bool isUsableAddress(const QString &address)
{
    const QString trimmed = address.trimmed();
    if (trimmed.isEmpty() || trimmed.contains(QLatin1Char(' ')) || trimmed.contains(QLatin1Char('/')))
        return false;

    QHostAddress literal;
    if (literal.setAddress(trimmed))
        return true;

    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(trimmed, QUrl::StrictMode);
    return url.isValid() && !url.host().isEmpty();
}

struct DescriptionFields {
    QString serialNumber;
    QString udn;
    QString friendlyName;
    QString modelDescription;
    QString modelName;
    QString modelNumber;
};

DescriptionFields readDescription(const QByteArray &xml)
{
    DescriptionFields fields;
    QXmlStreamReader reader(xml);
    while (!reader.atEnd()) {
        reader.readNext();
        if (!reader.isStartElement())
            continue;

        const QString name = reader.name().toString().toLower();
        QString *target = nullptr;
        if (name == QLatin1String("serialnumber"))
            target = &fields.serialNumber;
        else if (name == QLatin1String("udn"))
            target = &fields.udn;
        else if (name == QLatin1String("friendlyname"))
            target = &fields.friendlyName;
        else if (name == QLatin1String("modeldescription"))
            target = &fields.modelDescription;
        else if (name == QLatin1String("modelname"))
            target = &fields.modelName;
        else if (name == QLatin1String("modelnumber"))
            target = &fields.modelNumber;

        // Only the first device block counts; embedded devices repeat tags.
        if (target && target->isEmpty())
            *target = reader.readElementText(QXmlStreamReader::SkipChildElements).trimmed();
    }
    if (reader.hasError())
        qCDebug(discoveryLog) << "description.xml parse error:" << reader.errorString();
    return fields;
}

QString idFromDescription(const DescriptionFields &fields)
{
    if (!fields.serialNumber.isEmpty())
        return bridgeIdFromSerial(fields.serialNumber);

    QString udn = fields.udn;
    if (udn.startsWith(QStringLiteral("uuid:"), Qt::CaseInsensitive))
        udn = udn.mid(5);
    udn.remove(QLatin1Char('-'));
    if (udn.size() >= 12)
        return bridgeIdFromSerial(udn.right(12));
    return {};
}

} // namespace

BridgeValidator::BridgeValidator(HttpTransport &http)
    : m_http(http)
{
}

std::optional<ConfirmedBridge> BridgeValidator::validate(const QString &address,
                                                         const CancellationToken &token) const
{
    if (!isUsableAddress(address)) {
        qCDebug(discoveryLog) << "discarding malformed candidate address" << address;
        return std::nullopt;
    }
    if (token.isCancelled())
        return std::nullopt;

    if (auto bridge = probeConfig(address.trimmed(), token))
        return bridge;
    if (token.isCancelled())
        return std::nullopt;

    QString error;
    const QUrl descriptionUrl = buildUrl(address, 80, false, QStringLiteral("/description.xml"), &error);
    if (!descriptionUrl.isValid())
        return std::nullopt;
    return probeDescription(descriptionUrl, token);
}

std::optional<ConfirmedBridge> BridgeValidator::validateLocation(const QUrl &location,
                                                                 const CancellationToken &token) const
{
    if (!location.isValid() || location.host().isEmpty()
        || (location.scheme() != QStringLiteral("http") && location.scheme() != QStringLiteral("https"))) {
        qCDebug(discoveryLog) << "discarding malformed location" << location.toString();
        return std::nullopt;
    }
    if (token.isCancelled())
        return std::nullopt;
    return probeDescription(location, token);
}

std::optional<ConfirmedBridge> BridgeValidator::probeConfig(const QString &address,
                                                            const CancellationToken &token) const
{
    HttpRequest request;
    request.url = buildUrl(address, 80, false, QStringLiteral("/api/0/config"));
    request.setHeader("Accept", "application/json");
    request.timeoutMs = token.boundedTimeoutMs(kConfigTimeoutMs);

    const HttpResult result = m_http.send(request);
    if (token.isCancelled())
        return std::nullopt;
    if (!result.ok) {
        qCDebug(discoveryLog) << "/api/0/config on" << address << "failed:" << result.error;
        return std::nullopt;
    }
    return parseConfig(result.payload, address);
}

std::optional<ConfirmedBridge> BridgeValidator::probeDescription(const QUrl &url,
                                                                 const CancellationToken &token) const
{
    HttpRequest request;
    request.url = url;
    request.setHeader("Accept", "application/xml");
    request.timeoutMs = token.boundedTimeoutMs(kDescriptionTimeoutMs);

    const HttpResult result = m_http.send(request);
    if (token.isCancelled())
        return std::nullopt;
    if (!result.ok || result.payload.isEmpty()) {
        qCDebug(discoveryLog) << "description fetch" << url.toString() << "failed:" << result.error;
        return std::nullopt;
    }

    const int port = url.port(url.scheme() == QStringLiteral("https") ? 443 : 80);
    return parseDescription(result.payload, url.host(), port);
}

std::optional<ConfirmedBridge> BridgeValidator::parseConfig(const QByteArray &payload, const QString &address)
{
    QJsonParseError err {};
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return std::nullopt;

    const QJsonObject obj = doc.object();
    const QString bridgeId = normalizeBridgeId(obj.value(QStringLiteral("bridgeid")).toString());
    if (bridgeId.isEmpty())
        return std::nullopt;

    const QString modelId = obj.value(QStringLiteral("modelid")).toString();
    if (!modelId.isEmpty()
        && !modelId.contains(QStringLiteral("hue"), Qt::CaseInsensitive)
        && !modelId.contains(QStringLiteral("bsb"), Qt::CaseInsensitive)) {
        qCDebug(discoveryLog) << address << "reports model" << modelId << "- not a Hue bridge";
        return std::nullopt;
    }

    ConfirmedBridge bridge;
    bridge.id = bridgeId;
    bridge.address = address;
    bridge.port = 80;
    bridge.name = obj.value(QStringLiteral("name")).toString(kDefaultBridgeName);
    bridge.modelId = modelId;
    return bridge;
}

std::optional<ConfirmedBridge> BridgeValidator::parseDescription(const QByteArray &xml,
                                                                 const QString &address,
                                                                 int port)
{
    if (!looksLikeBridgeDescription(QString::fromUtf8(xml)))
        return std::nullopt;

    const DescriptionFields fields = readDescription(xml);
    const QString bridgeId = idFromDescription(fields);
    if (bridgeId.isEmpty()) {
        qCInfo(discoveryLog) << "bridge-like description on" << address << "carries no identity; ignoring";
        return std::nullopt;
    }

    ConfirmedBridge bridge;
    bridge.id = bridgeId;
    bridge.address = address;
    bridge.port = port > 0 ? port : 80;
    bridge.name = !fields.friendlyName.isEmpty() ? fields.friendlyName
        : (!fields.modelDescription.isEmpty() ? fields.modelDescription : kDefaultBridgeName);
    bridge.modelId = !fields.modelNumber.isEmpty() ? fields.modelNumber : fields.modelName;
    return bridge;
}

bool BridgeValidator::looksLikeBridgeDescription(const QString &xml)
{
    const QString lower = xml.toLower();
    return lower.contains(QStringLiteral("philips hue"))
        || lower.contains(QStringLiteral("royal philips"))
        || lower.contains(QStringLiteral("ipbridge"))
        || lower.contains(QStringLiteral("signify"));
}

} // namespace hueconnect
