#pragma once

#include <chrono>

#include <QByteArray>
#include <QList>
#include <QString>
#include <QUrl>

#include "hue_discovery.h"

namespace hueconnect {

class BridgeValidator;
class HttpTransport;

// Parses the discovery endpoint answer [{id, internalipaddress, port}].
// Records without an address are skipped.
QList<BridgeCandidate> parseCloudResponse(const QByteArray &payload, QString *error = nullptr);

class CloudDiscoveryStrategy final : public DiscoveryStrategy
{
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{8000};

    CloudDiscoveryStrategy(HttpTransport &http,
                           const BridgeValidator &validator,
                           QUrl endpoint = defaultEndpoint(),
                           std::chrono::milliseconds timeout = kDefaultTimeout);

    QString tag() const override { return QStringLiteral("cloud"); }
    void run(DiscoveryCollector &collector, const CancellationToken &token) override;

    static QUrl defaultEndpoint();

private:
    HttpTransport &m_http;
    const BridgeValidator &m_validator;
    QUrl m_endpoint;
    std::chrono::milliseconds m_timeout;
};

} // namespace hueconnect
