#pragma once

#include <memory>

#include <QList>
#include <QSslCertificate>
#include <QString>
#include <QUrl>

#include "hue_gateway.h"
#include "hue_trust.h"
#include "hue_types.h"

namespace hueconnect {

struct Settings {
    QString host;
    int port = 0;
    bool useTls = true;
    QString appKey;
    QString clientKey;
    QString bridgeId;

    QString legacyCaPath;
    QString publicRootCaPath;
    bool allowPrivateNetworkFallback = true;

    int requestTimeoutMs = 30000;
    int discoveryCeilingMs = 20000;
    int ssdpWindowMs = 6000;
    int subnetScanCeilingMs = 15000;
    int probeParallelism = 8;
    QUrl cloudDiscoveryUrl = QUrl(QStringLiteral("https://discovery.meethue.com/"));

    int eventStreamIdleTimeoutMs = 120000;
    int retryIntervalMs = 10000;
    int maxInFlightDeviceWrites = 16;
    int deviceWriteIntervalMs = 100;
    int groupWriteIntervalMs = 1000;

    StoredCredentials credentials() const;
};

// Reads a JSON settings object. Missing keys keep their defaults; integer
// values are clamped. Relative certificate paths resolve against the
// directory of the file.
bool loadSettings(const QString &path, Settings *settings, QString *error = nullptr);
bool parseSettings(const QByteArray &json, Settings *settings, QString *error = nullptr);

// HUECONNECT_HOST, HUECONNECT_APP_KEY and HUECONNECT_BRIDGE_ID win over the
// file.
void applyEnvironment(Settings *settings);

// Loads the configured anchors and builds the trust policy.
std::shared_ptr<HueTrustPolicy> makeTrustPolicy(const Settings &settings, QString *error = nullptr);

GatewayOptions toGatewayOptions(const Settings &settings, const QList<QSslCertificate> &anchors);

} // namespace hueconnect
