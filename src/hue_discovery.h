#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <QHash>
#include <QList>
#include <QString>

#include "hue_cancel.h"
#include "hue_types.h"

namespace hueconnect {

// Shared sink for all strategies of one discovery session.
class DiscoveryCollector
{
public:
    // Returns false when the bridge id was already reported (the first
    // sighting is kept) or the bridge carries no id.
    bool report(const ConfirmedBridge &bridge);

    QList<ConfirmedBridge> snapshot() const;
    int duplicateCount() const;
    bool contains(const QString &bridgeId) const;

private:
    mutable std::mutex m_mutex;
    QList<ConfirmedBridge> m_bridges;
    QHash<QString, int> m_indexById;
    int m_duplicates = 0;
};

class DiscoveryStrategy
{
public:
    virtual ~DiscoveryStrategy() = default;

    virtual QString tag() const = 0;

    // Runs until exhausted or the token is cancelled. Failures are logged,
    // never thrown.
    virtual void run(DiscoveryCollector &collector, const CancellationToken &token) = 0;
};

class DiscoveryOrchestrator
{
public:
    static constexpr std::chrono::milliseconds kDefaultCeiling{20000};

    explicit DiscoveryOrchestrator(std::chrono::milliseconds ceiling = kDefaultCeiling);
    ~DiscoveryOrchestrator();

    DiscoveryOrchestrator(const DiscoveryOrchestrator &) = delete;
    DiscoveryOrchestrator &operator=(const DiscoveryOrchestrator &) = delete;

    void addStrategy(std::shared_ptr<DiscoveryStrategy> strategy);

    // Blocks until all strategies finished, the ceiling passed or
    // stopDiscovery() was called. Returns an empty list while another
    // session is running.
    QList<ConfirmedBridge> discoverBridges();

    void stopDiscovery();
    bool isDiscovering() const;

    std::chrono::milliseconds ceiling() const { return m_ceiling; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    struct SessionState {
        std::mutex mutex;
        std::condition_variable finished;
        int pending = 0;
        bool stopRequested = false;
    };

    void reapWorkers(bool all);

    const std::chrono::milliseconds m_ceiling;
    std::vector<std::shared_ptr<DiscoveryStrategy>> m_strategies;
    std::vector<Worker> m_workers;

    mutable std::mutex m_mutex;
    bool m_running = false;
    std::shared_ptr<SessionState> m_session;
    CancellationToken m_token;
};

} // namespace hueconnect
