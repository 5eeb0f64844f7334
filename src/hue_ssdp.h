#pragma once

#include <chrono>
#include <optional>

#include <QByteArray>
#include <QStringList>
#include <QUrl>

#include "hue_discovery.h"

namespace hueconnect {

class BridgeValidator;

QByteArray buildSearchRequest(const QString &searchTarget);

// LOCATION header of an SSDP reply that announces a Hue bridge; nullopt
// for replies from other devices or without a usable location.
std::optional<QUrl> locationFromResponse(const QByteArray &datagram);

class SsdpStrategy final : public DiscoveryStrategy
{
public:
    static constexpr std::chrono::milliseconds kDefaultWindow{6000};

    explicit SsdpStrategy(const BridgeValidator &validator,
                          std::chrono::milliseconds window = kDefaultWindow);

    QString tag() const override { return QStringLiteral("ssdp"); }
    void run(DiscoveryCollector &collector, const CancellationToken &token) override;

    static QStringList searchTargets();

private:
    const BridgeValidator &m_validator;
    std::chrono::milliseconds m_window;
};

} // namespace hueconnect
