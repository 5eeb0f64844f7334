#include <catch2/catch.hpp>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "hue_settings.h"

using namespace hueconnect;

TEST_CASE("Settings: defaults", "[settings]") {
    const Settings settings;
    CHECK(settings.useTls);
    CHECK(settings.allowPrivateNetworkFallback);
    CHECK(settings.requestTimeoutMs == 30000);
    CHECK(settings.discoveryCeilingMs == 20000);
    CHECK(settings.eventStreamIdleTimeoutMs == 120000);
    CHECK(settings.retryIntervalMs == 10000);
    CHECK(settings.maxInFlightDeviceWrites == 16);
    CHECK(settings.cloudDiscoveryUrl.host() == QStringLiteral("discovery.meethue.com"));
}

TEST_CASE("Settings: parsing and clamping", "[settings]") {
    Settings settings;
    QString error;
    REQUIRE(parseSettings(R"({
        "host": " 10.0.0.6 ",
        "appKey": "abc123",
        "bridgeId": "ec:b5:fa:ff:fe:00:00:01",
        "allowPrivateNetworkFallback": false,
        "probeParallelism": 1000,
        "retryIntervalMs": 5,
        "groupWriteIntervalMs": "1500",
        "cloudDiscoveryUrl": "not a url",
        "somethingElse": true
    })", &settings, &error));
    CHECK(error.isEmpty());
    CHECK(settings.host == QStringLiteral("10.0.0.6"));
    CHECK(settings.appKey == QStringLiteral("abc123"));
    CHECK(settings.bridgeId == QStringLiteral("ECB5FAFFFE000001"));
    CHECK_FALSE(settings.allowPrivateNetworkFallback);
    CHECK(settings.probeParallelism == 64);
    CHECK(settings.retryIntervalMs == 1000);
    CHECK(settings.groupWriteIntervalMs == 1500);
    CHECK(settings.cloudDiscoveryUrl.host() == QStringLiteral("discovery.meethue.com"));

    const StoredCredentials stored = settings.credentials();
    CHECK(stored.address == QStringLiteral("10.0.0.6"));
    CHECK(stored.appKey == QStringLiteral("abc123"));
}

TEST_CASE("Settings: port implies TLS unless given", "[settings]") {
    Settings plain;
    REQUIRE(parseSettings(R"({"port": 80})", &plain));
    CHECK_FALSE(plain.useTls);

    Settings explicitTls;
    REQUIRE(parseSettings(R"({"port": 8443, "useTls": true})", &explicitTls));
    CHECK(explicitTls.useTls);
}

TEST_CASE("Settings: malformed input is an error", "[settings]") {
    Settings settings;
    QString error;
    CHECK_FALSE(parseSettings("{\"host\": ", &settings, &error));
    CHECK_FALSE(error.isEmpty());
    CHECK_FALSE(parseSettings("[1,2,3]", &settings, &error));
    CHECK_FALSE(loadSettings(QStringLiteral("/nonexistent/hueconnect.json"), &settings, &error));
    CHECK(error.contains(QStringLiteral("/nonexistent/hueconnect.json")));
}

TEST_CASE("Settings: certificate paths resolve next to the file", "[settings][trust]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    REQUIRE(QFile::copy(QStringLiteral(HUECONNECT_TEST_DATA_DIR "/legacy_root.pem"), dir.filePath(QStringLiteral("legacy.pem"))));

    QFile file(dir.filePath(QStringLiteral("settings.json")));
    REQUIRE(file.open(QIODevice::WriteOnly));
    file.write(R"({"legacyCaPath": "legacy.pem", "publicRootCaPath": ""})");
    file.close();

    Settings settings;
    QString error;
    REQUIRE(loadSettings(file.fileName(), &settings, &error));
    CHECK(settings.legacyCaPath == QDir(dir.path()).absoluteFilePath(QStringLiteral("legacy.pem")));

    const std::shared_ptr<HueTrustPolicy> policy = makeTrustPolicy(settings, &error);
    REQUIRE(policy);
    CHECK(policy->anchors().size() == 1);
    CHECK(policy->fallback() == PrivateNetworkFallback::Enabled);

    const GatewayOptions options = toGatewayOptions(settings, policy->anchors());
    CHECK(options.caCertificates.size() == 1);
    CHECK(options.maxInFlightDeviceWrites == 16);

    settings.legacyCaPath = dir.filePath(QStringLiteral("missing.pem"));
    CHECK_FALSE(makeTrustPolicy(settings, &error));
    CHECK_FALSE(error.isEmpty());
}

TEST_CASE("Settings: environment overrides", "[settings]") {
    Settings settings;
    settings.host = QStringLiteral("10.0.0.6");
    qputenv("HUECONNECT_HOST", "192.168.1.50");
    qputenv("HUECONNECT_APP_KEY", "from-env");
    qputenv("HUECONNECT_BRIDGE_ID", "ecb5fafffe000002");
    applyEnvironment(&settings);
    qunsetenv("HUECONNECT_HOST");
    qunsetenv("HUECONNECT_APP_KEY");
    qunsetenv("HUECONNECT_BRIDGE_ID");

    CHECK(settings.host == QStringLiteral("192.168.1.50"));
    CHECK(settings.appKey == QStringLiteral("from-env"));
    CHECK(settings.bridgeId == QStringLiteral("ECB5FAFFFE000002"));
}
