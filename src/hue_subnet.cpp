#include "hue_subnet.h"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

#include <QHostAddress>
#include <QNetworkInterface>
#include <QSet>

#include "hue_log.h"
#include "hue_validator.h"

namespace hueconnect {

namespace {

void appendRange(QStringList *out, const QString &prefix, int first, int last)
{
    for (int host = first; host <= last; ++host)
        out->append(prefix + QString::number(host));
}

} // namespace

QStringList commonRouterCandidates()
{
    QStringList out;
    appendRange(&out, QStringLiteral("192.168.1."), 2, 8);
    out.append(QStringLiteral("192.168.1.10"));
    appendRange(&out, QStringLiteral("192.168.0."), 2, 8);
    out.append(QStringLiteral("192.168.0.10"));
    appendRange(&out, QStringLiteral("192.168.100."), 2, 5);
    appendRange(&out, QStringLiteral("192.168.86."), 2, 5);
    appendRange(&out, QStringLiteral("10.0.0."), 2, 5);
    appendRange(&out, QStringLiteral("10.0.1."), 2, 3);
    appendRange(&out, QStringLiteral("172.16.0."), 2, 3);
    appendRange(&out, QStringLiteral("172.16.1."), 2, 3);
    return out;
}

QStringList subnetCandidates(const QString &deviceIp)
{
    QHostAddress address;
    if (!address.setAddress(deviceIp.trimmed()) || address.protocol() != QAbstractSocket::IPv4Protocol)
        return {};

    const QStringList octets = address.toString().split(QLatin1Char('.'));
    if (octets.size() != 4)
        return {};

    const QString prefix = octets.mid(0, 3).join(QLatin1Char('.')) + QLatin1Char('.');
    const QString own = address.toString();
    QStringList out;
    for (int host = 2; host <= 20; ++host) {
        const QString candidate = prefix + QString::number(host);
        if (candidate != own)
            out.append(candidate);
    }
    return out;
}

QString localIPv4Address()
{
    const auto interfaces = QNetworkInterface::allInterfaces();
    for (const QNetworkInterface &iface : interfaces) {
        const auto flags = iface.flags();
        if (!flags.testFlag(QNetworkInterface::IsUp) || !flags.testFlag(QNetworkInterface::IsRunning)
            || flags.testFlag(QNetworkInterface::IsLoopBack))
            continue;
        for (const QNetworkAddressEntry &entry : iface.addressEntries()) {
            const QHostAddress ip = entry.ip();
            if (ip.protocol() == QAbstractSocket::IPv4Protocol && !ip.isLoopback())
                return ip.toString();
        }
    }
    return {};
}

QStringList buildScanCandidates(const QString &deviceIp)
{
    QStringList out;
    QSet<QString> seen;
    const QStringList ordered = subnetCandidates(deviceIp) + commonRouterCandidates();
    for (const QString &candidate : ordered) {
        if (candidate == deviceIp || seen.contains(candidate))
            continue;
        seen.insert(candidate);
        out.append(candidate);
    }
    return out;
}

SubnetScanStrategy::SubnetScanStrategy(const BridgeValidator &validator, Options options, QStringList candidates)
    : m_validator(validator)
    , m_options(options)
    , m_candidates(std::move(candidates))
{
}

void SubnetScanStrategy::run(DiscoveryCollector &collector, const CancellationToken &token)
{
    QStringList candidates = m_candidates;
    if (candidates.isEmpty()) {
        const QString local = localIPv4Address();
        if (local.isEmpty())
            qCInfo(discoveryLog) << "no local IPv4 address; scanning common router ranges only";
        candidates = buildScanCandidates(local);
    }
    if (candidates.isEmpty())
        return;

    const CancellationToken scan = token.child(m_options.ceiling);
    std::atomic_int next{0};
    const int total = candidates.size();
    const int attempts = std::max(1, m_options.attempts);

    auto worker = [&]() {
        while (!scan.isCancelled()) {
            const int index = next.fetch_add(1);
            if (index >= total)
                return;
            const QString &candidate = candidates.at(index);

            for (int attempt = 1; attempt <= attempts; ++attempt) {
                if (scan.isCancelled())
                    return;
                std::optional<ConfirmedBridge> bridge = m_validator.validate(candidate, scan);
                if (bridge) {
                    if (!token.isCancelled()) {
                        bridge->source = tag();
                        collector.report(*bridge);
                    }
                    break;
                }
                if (attempt < attempts && !scan.sleepFor(m_options.backoff))
                    return;
            }
        }
    };

    const int poolSize = std::max(1, std::min(m_options.parallelism, total));
    qCDebug(discoveryLog) << "scanning" << total << "addresses with" << poolSize << "workers";

    std::vector<std::thread> pool;
    pool.reserve(static_cast<size_t>(poolSize));
    for (int i = 0; i < poolSize; ++i)
        pool.emplace_back(worker);
    for (std::thread &thread : pool)
        thread.join();
}

} // namespace hueconnect
