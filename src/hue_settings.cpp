#include "hue_settings.h"

#include <algorithm>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

#include "hue_log.h"

namespace hueconnect {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

QString readString(const QJsonObject &obj, const QString &key, const QString &fallback)
{
    if (!obj.contains(key))
        return fallback;
    return obj.value(key).toString(fallback).trimmed();
}

QString resolvePath(const QString &path, const QDir &base)
{
    if (path.isEmpty() || QFileInfo(path).isAbsolute())
        return path;
    return base.absoluteFilePath(path);
}

} // namespace

StoredCredentials Settings::credentials() const
{
    StoredCredentials stored;
    stored.bridgeId = normalizeBridgeId(bridgeId);
    stored.address = host;
    stored.port = port;
    stored.appKey = appKey;
    stored.clientKey = clientKey;
    return stored;
}

bool parseSettings(const QByteArray &json, Settings *settings, QString *error)
{
    QJsonParseError err {};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error)
            *error = err.error != QJsonParseError::NoError ? err.errorString()
                                                           : QStringLiteral("Settings must be a JSON object");
        return false;
    }

    const QJsonObject obj = doc.object();
    Settings &s = *settings;
    s.host = readString(obj, QStringLiteral("host"), s.host);
    s.port = std::clamp(readInt(obj, QStringLiteral("port"), s.port), 0, 65535);
    if (obj.contains(QStringLiteral("useTls")))
        s.useTls = obj.value(QStringLiteral("useTls")).toBool(s.useTls);
    else if (s.port > 0)
        s.useTls = (s.port == 443);
    s.appKey = readString(obj, QStringLiteral("appKey"), s.appKey);
    s.clientKey = readString(obj, QStringLiteral("clientKey"), s.clientKey);
    s.bridgeId = normalizeBridgeId(readString(obj, QStringLiteral("bridgeId"), s.bridgeId));

    s.legacyCaPath = readString(obj, QStringLiteral("legacyCaPath"), s.legacyCaPath);
    s.publicRootCaPath = readString(obj, QStringLiteral("publicRootCaPath"), s.publicRootCaPath);
    if (obj.contains(QStringLiteral("allowPrivateNetworkFallback")))
        s.allowPrivateNetworkFallback = obj.value(QStringLiteral("allowPrivateNetworkFallback")).toBool(true);

    s.requestTimeoutMs = std::clamp(readInt(obj, QStringLiteral("requestTimeoutMs"), s.requestTimeoutMs), 1000, 120000);
    s.discoveryCeilingMs = std::clamp(readInt(obj, QStringLiteral("discoveryCeilingMs"), s.discoveryCeilingMs), 1000, 60000);
    s.ssdpWindowMs = std::clamp(readInt(obj, QStringLiteral("ssdpWindowMs"), s.ssdpWindowMs), 500, 30000);
    s.subnetScanCeilingMs = std::clamp(readInt(obj, QStringLiteral("subnetScanCeilingMs"), s.subnetScanCeilingMs), 1000, 60000);
    s.probeParallelism = std::clamp(readInt(obj, QStringLiteral("probeParallelism"), s.probeParallelism), 1, 64);
    if (obj.contains(QStringLiteral("cloudDiscoveryUrl"))) {
        const QUrl url(obj.value(QStringLiteral("cloudDiscoveryUrl")).toString().trimmed());
        if (url.isValid() && !url.host().isEmpty())
            s.cloudDiscoveryUrl = url;
        else
            qCWarning(gatewayLog) << "ignoring invalid cloudDiscoveryUrl" << url.toString();
    }

    s.eventStreamIdleTimeoutMs = std::clamp(readInt(obj, QStringLiteral("eventStreamIdleTimeoutMs"),
                                                    s.eventStreamIdleTimeoutMs), 5000, 600000);
    s.retryIntervalMs = std::clamp(readInt(obj, QStringLiteral("retryIntervalMs"), s.retryIntervalMs), 1000, 600000);
    s.maxInFlightDeviceWrites = std::clamp(readInt(obj, QStringLiteral("maxInFlightDeviceWrites"),
                                                   s.maxInFlightDeviceWrites), 1, 256);
    s.deviceWriteIntervalMs = std::clamp(readInt(obj, QStringLiteral("deviceWriteIntervalMs"),
                                                 s.deviceWriteIntervalMs), 0, 10000);
    s.groupWriteIntervalMs = std::clamp(readInt(obj, QStringLiteral("groupWriteIntervalMs"),
                                                s.groupWriteIntervalMs), 0, 10000);

    if (error)
        error->clear();
    return true;
}

bool loadSettings(const QString &path, Settings *settings, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QString parseError;
    if (!parseSettings(file.readAll(), settings, &parseError)) {
        if (error)
            *error = QStringLiteral("%1: %2").arg(path, parseError);
        return false;
    }

    const QDir base = QFileInfo(path).absoluteDir();
    settings->legacyCaPath = resolvePath(settings->legacyCaPath, base);
    settings->publicRootCaPath = resolvePath(settings->publicRootCaPath, base);
    return true;
}

void applyEnvironment(Settings *settings)
{
    const QByteArray host = qgetenv("HUECONNECT_HOST");
    if (!host.trimmed().isEmpty())
        settings->host = QString::fromUtf8(host).trimmed();
    const QByteArray appKey = qgetenv("HUECONNECT_APP_KEY");
    if (!appKey.trimmed().isEmpty())
        settings->appKey = QString::fromUtf8(appKey).trimmed();
    const QByteArray bridgeId = qgetenv("HUECONNECT_BRIDGE_ID");
    if (!bridgeId.trimmed().isEmpty())
        settings->bridgeId = normalizeBridgeId(QString::fromUtf8(bridgeId));
}

std::shared_ptr<HueTrustPolicy> makeTrustPolicy(const Settings &settings, QString *error)
{
    QList<QSslCertificate> anchors;
    const QStringList paths{settings.legacyCaPath, settings.publicRootCaPath};
    if (!HueTrustPolicy::loadAnchors(paths, &anchors, error))
        return nullptr;
    if (anchors.isEmpty())
        qCInfo(gatewayLog) << "no trust anchors configured; only the private network fallback applies";

    const PrivateNetworkFallback fallback = settings.allowPrivateNetworkFallback
        ? PrivateNetworkFallback::Enabled
        : PrivateNetworkFallback::Disabled;
    return std::make_shared<HueTrustPolicy>(anchors, fallback);
}

GatewayOptions toGatewayOptions(const Settings &settings, const QList<QSslCertificate> &anchors)
{
    GatewayOptions options;
    options.useTls = settings.useTls;
    options.requestTimeoutMs = settings.requestTimeoutMs;
    options.eventStreamIdleTimeoutMs = settings.eventStreamIdleTimeoutMs;
    options.retryIntervalMs = settings.retryIntervalMs;
    options.maxInFlightDeviceWrites = settings.maxInFlightDeviceWrites;
    options.deviceWriteInterval = std::chrono::milliseconds(settings.deviceWriteIntervalMs);
    options.groupWriteInterval = std::chrono::milliseconds(settings.groupWriteIntervalMs);
    options.caCertificates = anchors;
    return options;
}

} // namespace hueconnect
