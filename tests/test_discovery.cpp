#include <catch2/catch.hpp>

#include <future>
#include <stdexcept>
#include <thread>

#include <QStringList>

#include "fake_transport.h"
#include "hue_cloud.h"
#include "hue_discovery.h"
#include "hue_ssdp.h"
#include "hue_subnet.h"
#include "hue_validator.h"

using namespace hueconnect;
using hueconnect::test::FakeTransport;
using namespace std::chrono_literals;

namespace {

ConfirmedBridge bridge(const QString &id, const QString &address, const QString &source)
{
    ConfirmedBridge out;
    out.id = id;
    out.address = address;
    out.source = source;
    return out;
}

// Reports its bridges, then optionally lingers until cancelled.
class ScriptedStrategy final : public DiscoveryStrategy
{
public:
    ScriptedStrategy(QString tag, QList<ConfirmedBridge> bridges, std::chrono::milliseconds linger = 0ms)
        : m_tag(std::move(tag))
        , m_bridges(std::move(bridges))
        , m_linger(linger)
    {
    }

    QString tag() const override { return m_tag; }

    void run(DiscoveryCollector &collector, const CancellationToken &token) override
    {
        for (const ConfirmedBridge &found : m_bridges)
            collector.report(found);
        if (m_linger > 0ms)
            token.sleepFor(m_linger);
        ++runs;
    }

    std::atomic_int runs{0};

private:
    QString m_tag;
    QList<ConfirmedBridge> m_bridges;
    std::chrono::milliseconds m_linger;
};

class ThrowingStrategy final : public DiscoveryStrategy
{
public:
    QString tag() const override { return QStringLiteral("broken"); }
    void run(DiscoveryCollector &, const CancellationToken &) override
    {
        throw std::runtime_error("socket exploded");
    }
};

} // namespace

TEST_CASE("Collector: first sighting wins", "[discovery][collector]") {
    DiscoveryCollector collector;
    REQUIRE(collector.report(bridge(QStringLiteral("ecb5fafffe000001"), QStringLiteral("10.0.0.6"), QStringLiteral("ssdp"))));
    REQUIRE_FALSE(collector.report(bridge(QStringLiteral("EC:B5:FA:FF:FE:00:00:01"), QStringLiteral("10.0.0.7"), QStringLiteral("cloud"))));
    REQUIRE_FALSE(collector.report(bridge(QString(), QStringLiteral("10.0.0.8"), QStringLiteral("subnet"))));

    const QList<ConfirmedBridge> bridges = collector.snapshot();
    REQUIRE(bridges.size() == 1);
    CHECK(bridges.first().id == QStringLiteral("ECB5FAFFFE000001"));
    CHECK(bridges.first().address == QStringLiteral("10.0.0.6"));
    CHECK(bridges.first().source == QStringLiteral("ssdp"));
    CHECK(collector.duplicateCount() == 1);
    CHECK(collector.contains(QStringLiteral("ecb5fafffe000001")));
}

TEST_CASE("Orchestrator: merges strategies without duplicates", "[discovery]") {
    DiscoveryOrchestrator orchestrator(5s);
    orchestrator.addStrategy(std::make_shared<ScriptedStrategy>(
        QStringLiteral("a"), QList<ConfirmedBridge>{bridge(QStringLiteral("ECB5FAFFFE000001"), QStringLiteral("10.0.0.6"), QStringLiteral("a"))}));
    orchestrator.addStrategy(std::make_shared<ScriptedStrategy>(
        QStringLiteral("b"), QList<ConfirmedBridge>{bridge(QStringLiteral("ecb5fafffe000001"), QStringLiteral("10.0.0.6"), QStringLiteral("b")),
                                                    bridge(QStringLiteral("001788FFFE000099"), QStringLiteral("10.0.0.9"), QStringLiteral("b"))}));
    orchestrator.addStrategy(std::make_shared<ThrowingStrategy>());

    const QList<ConfirmedBridge> bridges = orchestrator.discoverBridges();
    REQUIRE(bridges.size() == 2);
    QStringList ids;
    for (const ConfirmedBridge &found : bridges)
        ids.append(found.id);
    CHECK(ids.contains(QStringLiteral("ECB5FAFFFE000001")));
    CHECK(ids.contains(QStringLiteral("001788FFFE000099")));
    CHECK_FALSE(orchestrator.isDiscovering());
}

TEST_CASE("Orchestrator: returns at the ceiling", "[discovery][timing]") {
    DiscoveryOrchestrator orchestrator(300ms);
    orchestrator.addStrategy(std::make_shared<ScriptedStrategy>(
        QStringLiteral("quick"), QList<ConfirmedBridge>{bridge(QStringLiteral("ECB5FAFFFE000001"), QStringLiteral("10.0.0.6"), QStringLiteral("quick"))}));
    orchestrator.addStrategy(std::make_shared<ScriptedStrategy>(QStringLiteral("slow"), QList<ConfirmedBridge>{}, 30s));

    const auto start = std::chrono::steady_clock::now();
    const QList<ConfirmedBridge> bridges = orchestrator.discoverBridges();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(bridges.size() == 1);
    CHECK(elapsed >= 250ms);
    CHECK(elapsed < 3s);
}

TEST_CASE("Orchestrator: stopDiscovery aborts a running session", "[discovery][timing]") {
    DiscoveryOrchestrator orchestrator(20s);
    auto slow = std::make_shared<ScriptedStrategy>(QStringLiteral("slow"), QList<ConfirmedBridge>{}, 30s);
    orchestrator.addStrategy(slow);

    const auto start = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [&orchestrator]() { return orchestrator.discoverBridges(); });
    while (!orchestrator.isDiscovering())
        std::this_thread::sleep_for(5ms);

    SECTION("a concurrent session is refused") {
        CHECK(orchestrator.discoverBridges().isEmpty());
    }

    orchestrator.stopDiscovery();
    CHECK(pending.get().isEmpty());
    CHECK(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE("Orchestrator: sessions can run again", "[discovery]") {
    DiscoveryOrchestrator orchestrator(2s);
    auto strategy = std::make_shared<ScriptedStrategy>(
        QStringLiteral("a"), QList<ConfirmedBridge>{bridge(QStringLiteral("ECB5FAFFFE000001"), QStringLiteral("10.0.0.6"), QStringLiteral("a"))});
    orchestrator.addStrategy(strategy);

    REQUIRE(orchestrator.discoverBridges().size() == 1);
    REQUIRE(orchestrator.discoverBridges().size() == 1);
    CHECK(strategy->runs.load() == 2);
}

TEST_CASE("Subnet scan: confirms the bridge among candidates", "[discovery][subnet]") {
    FakeTransport http;
    http.respond(QStringLiteral("10.0.0.6/api/0/config"),
                 FakeTransport::json(200, R"({"name":"Hue Bridge","bridgeid":"ECB5FAFFFE000001","modelid":"BSB002"})"));
    BridgeValidator validator(http);

    SubnetScanStrategy::Options options;
    options.backoff = 10ms;
    DiscoveryOrchestrator orchestrator(5s);
    orchestrator.addStrategy(std::make_shared<SubnetScanStrategy>(
        validator, options, QStringList{QStringLiteral("10.0.0.5"), QStringLiteral("10.0.0.6")}));

    const QList<ConfirmedBridge> bridges = orchestrator.discoverBridges();
    REQUIRE(bridges.size() == 1);
    CHECK(bridges.first().id == QStringLiteral("ECB5FAFFFE000001"));
    CHECK(bridges.first().address == QStringLiteral("10.0.0.6"));
    CHECK(bridges.first().source == QStringLiteral("subnet"));

    // The dead address got both attempts, each with the XML fallback.
    CHECK(http.requestCount(QStringLiteral("10.0.0.5/api/0/config")) == 2);
    CHECK(http.requestCount(QStringLiteral("10.0.0.5/description.xml")) == 2);
    CHECK(http.requestCount(QStringLiteral("10.0.0.6/api/0/config")) == 1);
}

TEST_CASE("Subnet scan: candidate lists", "[discovery][subnet]") {
    const QStringList own = subnetCandidates(QStringLiteral("192.168.1.7"));
    CHECK(own.size() == 18);
    CHECK(own.first() == QStringLiteral("192.168.1.2"));
    CHECK(own.last() == QStringLiteral("192.168.1.20"));
    CHECK_FALSE(own.contains(QStringLiteral("192.168.1.7")));
    CHECK(subnetCandidates(QStringLiteral("fe80::1")).isEmpty());

    const QStringList common = commonRouterCandidates();
    CHECK(common.contains(QStringLiteral("192.168.1.10")));
    CHECK(common.contains(QStringLiteral("192.168.86.5")));
    CHECK(common.contains(QStringLiteral("172.16.1.3")));

    const QStringList merged = buildScanCandidates(QStringLiteral("192.168.1.7"));
    CHECK(merged.first() == QStringLiteral("192.168.1.2"));
    CHECK(merged.count(QStringLiteral("192.168.1.2")) == 1);
    CHECK_FALSE(merged.contains(QStringLiteral("192.168.1.7")));
    CHECK(merged.size() == own.size() + common.size() - 8);
}

TEST_CASE("Cloud discovery: records are validated before reporting", "[discovery][cloud]") {
    FakeTransport http;
    http.respond(QStringLiteral("discovery.meethue.com/"),
                 FakeTransport::json(200, R"([{"id":"ecb5fafffe000001","internalipaddress":"10.0.0.6","port":443},
                                               {"id":"001788fffe000099","internalipaddress":"10.0.0.99","port":443}])"));
    http.respond(QStringLiteral("10.0.0.6/api/0/config"),
                 FakeTransport::json(200, R"({"name":"Hue Bridge","bridgeid":"ECB5FAFFFE000001","modelid":"BSB002"})"));
    BridgeValidator validator(http);

    DiscoveryCollector collector;
    CloudDiscoveryStrategy cloud(http, validator);
    cloud.run(collector, CancellationToken::withTimeout(5s));

    const QList<ConfirmedBridge> bridges = collector.snapshot();
    REQUIRE(bridges.size() == 1);
    CHECK(bridges.first().id == QStringLiteral("ECB5FAFFFE000001"));
    CHECK(bridges.first().source == QStringLiteral("cloud"));
}

TEST_CASE("Cloud discovery: response parsing", "[discovery][cloud]") {
    QString error;
    const QList<BridgeCandidate> candidates = parseCloudResponse(
        R"([{"id":"ecb5fafffe000001","internalipaddress":"10.0.0.6","port":443},{"id":"x"}])", &error);
    REQUIRE(error.isEmpty());
    REQUIRE(candidates.size() == 1);
    CHECK(candidates.first().id == QStringLiteral("ECB5FAFFFE000001"));
    CHECK(candidates.first().port == 443);

    CHECK(parseCloudResponse("{\"error\":1}", &error).isEmpty());
    CHECK_FALSE(error.isEmpty());
}

TEST_CASE("SSDP: replies and requests", "[discovery][ssdp]") {
    const QByteArray request = buildSearchRequest(QStringLiteral("upnp:rootdevice"));
    CHECK(request.startsWith("M-SEARCH * HTTP/1.1\r\n"));
    CHECK(request.contains("ST: upnp:rootdevice\r\n"));
    CHECK(request.endsWith("\r\n\r\n"));
    CHECK(SsdpStrategy::searchTargets().size() == 3);

    const QByteArray reply = QByteArrayLiteral(
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age=100\r\n"
        "Location: http://10.0.0.6:80/description.xml\r\n"
        "SERVER: Hue/1.0 UPnP/1.0 IpBridge/1.60.0\r\n"
        "hue-bridgeid: ECB5FAFFFE000001\r\n"
        "ST: upnp:rootdevice\r\n\r\n");
    const auto location = locationFromResponse(reply);
    REQUIRE(location);
    CHECK(location->host() == QStringLiteral("10.0.0.6"));
    CHECK(location->path() == QStringLiteral("/description.xml"));

    const QByteArray other = QByteArrayLiteral(
        "HTTP/1.1 200 OK\r\nLOCATION: http://10.0.0.2:49152/rootDesc.xml\r\nSERVER: Linux UPnP/1.0 MiniUPnPd\r\n\r\n");
    CHECK_FALSE(locationFromResponse(other));
}
