#pragma once

#include <chrono>

#include <QString>
#include <QStringList>

#include "hue_discovery.h"

namespace hueconnect {

class BridgeValidator;

// Router-default addresses where bridges commonly end up.
QStringList commonRouterCandidates();

// Hosts .2-.20 of the /24 around deviceIp, without deviceIp itself.
QStringList subnetCandidates(const QString &deviceIp);

// First non-loopback IPv4 address of an interface that is up; empty when
// there is none.
QString localIPv4Address();

// Own subnet first, then the common list; duplicates dropped.
QStringList buildScanCandidates(const QString &deviceIp);

class SubnetScanStrategy final : public DiscoveryStrategy
{
public:
    struct Options {
        std::chrono::milliseconds ceiling{15000};
        int parallelism = 8;
        int attempts = 2;
        std::chrono::milliseconds backoff{500};
    };

    // An empty candidate list means: derive from the local interface.
    SubnetScanStrategy(const BridgeValidator &validator, Options options, QStringList candidates = {});

    QString tag() const override { return QStringLiteral("subnet"); }
    void run(DiscoveryCollector &collector, const CancellationToken &token) override;

    const QStringList &candidates() const { return m_candidates; }

private:
    const BridgeValidator &m_validator;
    Options m_options;
    QStringList m_candidates;
};

} // namespace hueconnect
