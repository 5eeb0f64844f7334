#include "hue_discovery.h"

#include <exception>

#include "hue_log.h"

namespace hueconnect {

bool DiscoveryCollector::report(const ConfirmedBridge &bridge)
{
    const QString id = normalizeBridgeId(bridge.id);
    if (id.isEmpty())
        return false;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_indexById.contains(id)) {
        ++m_duplicates;
        qCDebug(discoveryLog) << "bridge" << id << "already reported; dropping sighting from" << bridge.source;
        return false;
    }

    ConfirmedBridge stored = bridge;
    stored.id = id;
    m_indexById.insert(id, m_bridges.size());
    m_bridges.append(stored);
    qCInfo(discoveryLog) << "found bridge" << id << "at" << stored.address << "via" << stored.source;
    return true;
}

QList<ConfirmedBridge> DiscoveryCollector::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bridges;
}

int DiscoveryCollector::duplicateCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_duplicates;
}

bool DiscoveryCollector::contains(const QString &bridgeId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_indexById.contains(normalizeBridgeId(bridgeId));
}

DiscoveryOrchestrator::DiscoveryOrchestrator(std::chrono::milliseconds ceiling)
    : m_ceiling(ceiling)
{
}

DiscoveryOrchestrator::~DiscoveryOrchestrator()
{
    stopDiscovery();
    reapWorkers(true);
}

void DiscoveryOrchestrator::addStrategy(std::shared_ptr<DiscoveryStrategy> strategy)
{
    if (!strategy)
        return;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_strategies.push_back(std::move(strategy));
}

QList<ConfirmedBridge> DiscoveryOrchestrator::discoverBridges()
{
    std::shared_ptr<SessionState> session;
    std::vector<std::shared_ptr<DiscoveryStrategy>> strategies;
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) {
            qCWarning(discoveryLog) << "discovery already running; ignoring request";
            return {};
        }
        m_running = true;
        session = std::make_shared<SessionState>();
        session->pending = static_cast<int>(m_strategies.size());
        m_session = session;
        m_token = CancellationToken::withTimeout(m_ceiling);
        token = m_token;
        strategies = m_strategies;
    }

    // Threads of an earlier session that outlived its ceiling.
    reapWorkers(true);

    auto collector = std::make_shared<DiscoveryCollector>();
    qCInfo(discoveryLog) << "starting discovery with" << strategies.size() << "strategies, ceiling"
                         << m_ceiling.count() << "ms";

    for (const auto &strategy : strategies) {
        auto done = std::make_shared<std::atomic_bool>(false);
        std::thread thread([strategy, collector, token, session, done]() {
            try {
                strategy->run(*collector, token);
            } catch (const std::exception &e) {
                qCWarning(discoveryLog) << "strategy" << strategy->tag() << "failed:" << e.what();
            }
            qCDebug(discoveryLog) << "strategy" << strategy->tag() << "finished";
            {
                std::lock_guard<std::mutex> lock(session->mutex);
                --session->pending;
            }
            session->finished.notify_all();
            done->store(true);
        });
        std::lock_guard<std::mutex> lock(m_mutex);
        m_workers.push_back(Worker{std::move(thread), done});
    }

    {
        std::unique_lock<std::mutex> lock(session->mutex);
        session->finished.wait_for(lock, m_ceiling, [&session]() {
            return session->pending <= 0 || session->stopRequested;
        });
    }
    token.cancel();

    const QList<ConfirmedBridge> bridges = collector->snapshot();
    qCInfo(discoveryLog) << "discovery finished:" << bridges.size() << "bridge(s),"
                         << collector->duplicateCount() << "duplicate sighting(s)";

    reapWorkers(false);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_running = false;
    m_session.reset();
    return bridges;
}

void DiscoveryOrchestrator::stopDiscovery()
{
    std::shared_ptr<SessionState> session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;
        session = m_session;
        m_token.cancel();
    }
    if (!session)
        return;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->stopRequested = true;
    }
    session->finished.notify_all();
}

bool DiscoveryOrchestrator::isDiscovering() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

void DiscoveryOrchestrator::reapWorkers(bool all)
{
    std::vector<Worker> joinable;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_workers.begin(); it != m_workers.end();) {
            if (all || it->done->load()) {
                joinable.push_back(std::move(*it));
                it = m_workers.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (Worker &worker : joinable) {
        if (worker.thread.joinable())
            worker.thread.join();
    }
}

} // namespace hueconnect
