#pragma once

#include <memory>

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QUrl>

namespace hueconnect {

class TrustValidator;

// Write targets are throttled per class: single devices and groups have
// different bridge-side limits.
enum class ResourceClass {
    Device,
    Group,
};

// An address suspected to host a bridge. Never used for requests until a
// BridgeValidator probe turned it into a ConfirmedBridge.
struct BridgeCandidate {
    QString id;
    QString address;
    int port = 0;
    QString source;
    QDateTime discoveredAt;
};

struct ConfirmedBridge {
    QString id;
    QString address;
    int port = 80;
    QString name;
    QString modelId;
    QString source;
};

// Record handed in by whoever persists pairings.
struct StoredCredentials {
    QString bridgeId;
    QString address;
    int port = 0;
    QString appKey;
    QString clientKey;
};

struct Session {
    QString bridgeId;
    QString address;
    int port = 443;
    bool useTls = true;
    QString appKey;
    QString clientKey;
    std::shared_ptr<const TrustValidator> trust;

    QUrl baseUrl() const;
};

struct EventEnvelope {
    QString eventId;
    QString eventType;
    QString resourceId;
    QString resourceType;
    QString ownerId;
    QString ownerType;
    QJsonObject payload;
    QDateTime arrivedAt;
};

enum class CommunicationStatus {
    Unknown,
    Online,
    Offline,
    Issues,
};

QString toString(CommunicationStatus status);

// Bridge ids arrive as "ECB5FAFFFE0A1B2C", "ec:b5:fa:..." or in lower case
// depending on the source; all comparisons use this form.
QString normalizeBridgeId(const QString &id);

// Hue bridges report their MAC as serial number in description.xml. The
// API bridge id is the EUI-64 form of that MAC (FFFE in the middle).
QString bridgeIdFromSerial(const QString &serial);

} // namespace hueconnect
