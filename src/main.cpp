#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <thread>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QStringList>

#include "hue_cloud.h"
#include "hue_discovery.h"
#include "hue_gateway.h"
#include "hue_http.h"
#include "hue_settings.h"
#include "hue_ssdp.h"
#include "hue_status.h"
#include "hue_subnet.h"
#include "hue_validator.h"

namespace {

using namespace hueconnect;

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

int runDiscover(const Settings &settings, const QStringList &scanList)
{
    QtHttpTransport http;
    BridgeValidator validator(http);
    DiscoveryOrchestrator orchestrator(std::chrono::milliseconds(settings.discoveryCeilingMs));

    SubnetScanStrategy::Options scanOptions;
    scanOptions.ceiling = std::chrono::milliseconds(settings.subnetScanCeilingMs);
    scanOptions.parallelism = settings.probeParallelism;

    orchestrator.addStrategy(std::make_shared<SsdpStrategy>(validator, std::chrono::milliseconds(settings.ssdpWindowMs)));
    orchestrator.addStrategy(std::make_shared<SubnetScanStrategy>(validator, scanOptions, scanList));
    orchestrator.addStrategy(std::make_shared<CloudDiscoveryStrategy>(http, validator, settings.cloudDiscoveryUrl));

    std::cerr << "searching for bridges (up to " << settings.discoveryCeilingMs / 1000 << " s)" << '\n';
    std::future<QList<ConfirmedBridge>> pending =
        std::async(std::launch::async, [&orchestrator]() { return orchestrator.discoverBridges(); });
    while (pending.wait_for(std::chrono::milliseconds(250)) != std::future_status::ready) {
        if (!g_running.load())
            orchestrator.stopDiscovery();
    }

    const QList<ConfirmedBridge> bridges = pending.get();
    if (bridges.isEmpty()) {
        std::cerr << userFacingMessage(RequestStatus::InvalidAddress).toStdString() << '\n';
        return 2;
    }
    for (const ConfirmedBridge &bridge : bridges) {
        std::cout << bridge.id.toStdString() << ' ' << bridge.address.toStdString() << ' '
                  << bridge.name.toStdString() << '\n';
    }
    return 0;
}

int runPair(GatewayClient &client, const Settings &settings,
            const QString &appLabel, const QString &deviceLabel, int attempts, int intervalMs)
{
    client.setBridge(settings.host, settings.bridgeId, settings.port);
    std::cerr << "press the link button on the bridge at " << settings.host.toStdString() << '\n';

    for (int attempt = 1; attempt <= attempts && g_running.load(); ++attempt) {
        const PairingResult result = client.requestApplicationKey(appLabel, deviceLabel);
        if (result.ok()) {
            std::cout << "appKey " << result.appKey.toStdString() << '\n';
            if (!result.clientKey.isEmpty())
                std::cout << "clientKey " << result.clientKey.toStdString() << '\n';
            return 0;
        }
        if (result.status != RequestStatus::LinkButtonNotPressed) {
            std::cerr << userFacingMessage(result.status).toStdString() << ": "
                      << result.error.toStdString() << '\n';
            return 1;
        }
        std::cerr << "waiting for link button (" << attempt << '/' << attempts << ")" << '\n';
        std::this_thread::sleep_for(std::chrono::milliseconds(intervalMs));
    }
    std::cerr << userFacingMessage(RequestStatus::LinkButtonNotPressed).toStdString() << '\n';
    return 1;
}

int runGet(GatewayClient &client, const QString &path)
{
    const RequestResult result = client.request(path);
    if (!result.ok()) {
        std::cerr << userFacingMessage(result.status).toStdString() << " (" << toString(result.status).toStdString()
                  << "): " << result.error.toStdString() << '\n';
        return 1;
    }
    std::cout << result.body.toJson(QJsonDocument::Indented).toStdString();
    return 0;
}

int runEvents(GatewayClient &client, CommunicationStatusTracker &tracker, int seconds)
{
    client.events().subscribe([](const EventEnvelope &envelope) {
        std::cout << envelope.eventType.toStdString() << ' ' << envelope.resourceType.toStdString() << ' '
                  << envelope.resourceId.toStdString() << ' '
                  << QJsonDocument(envelope.payload).toJson(QJsonDocument::Compact).toStdString() << '\n';
    });
    tracker.subscribe([](const QString &deviceId, CommunicationStatus previous, CommunicationStatus current) {
        std::cout << "status " << deviceId.toStdString() << ' ' << toString(previous).toStdString() << " -> "
                  << toString(current).toStdString() << '\n';
    });

    QString error;
    if (!client.startEventStream(&error))
        std::cerr << "event stream not connected yet: " << error.toStdString() << '\n';

    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (g_running.load() && (seconds <= 0 || std::chrono::steady_clock::now() < until)) {
        client.tick();
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    client.stopEventStream();
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("hueconnect-cli"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Discover, pair with and talk to a Hue bridge."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("discover | pair | get <path> | events"));

    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("Settings file (JSON)."),
                                          QStringLiteral("file"));
    const QCommandLineOption scanOption(QStringLiteral("scan"),
                                        QStringLiteral("Comma separated addresses to probe instead of the local subnet."),
                                        QStringLiteral("addresses"));
    const QCommandLineOption appOption(QStringLiteral("app"), QStringLiteral("Application label for pairing."),
                                       QStringLiteral("label"), QStringLiteral("hueconnect"));
    const QCommandLineOption deviceOption(QStringLiteral("device"), QStringLiteral("Device label for pairing."),
                                          QStringLiteral("label"), QStringLiteral("cli"));
    const QCommandLineOption attemptsOption(QStringLiteral("attempts"), QStringLiteral("Pairing attempts."),
                                            QStringLiteral("n"), QStringLiteral("30"));
    const QCommandLineOption intervalOption(QStringLiteral("interval"), QStringLiteral("Delay between pairing attempts."),
                                            QStringLiteral("ms"), QStringLiteral("2000"));
    const QCommandLineOption secondsOption(QStringLiteral("seconds"),
                                           QStringLiteral("How long to listen for events; 0 runs until interrupted."),
                                           QStringLiteral("n"), QStringLiteral("0"));
    parser.addOptions({configOption, scanOption, appOption, deviceOption, attemptsOption, intervalOption, secondsOption});
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        std::cerr << parser.helpText().toStdString();
        return 64;
    }
    const QString command = positional.first();

    Settings settings;
    QString error;
    if (parser.isSet(configOption) && !loadSettings(parser.value(configOption), &settings, &error)) {
        std::cerr << "failed to load settings: " << error.toStdString() << '\n';
        return 1;
    }
    applyEnvironment(&settings);

    if (command == QStringLiteral("discover")) {
        QStringList scanList;
        if (parser.isSet(scanOption))
            scanList = parser.value(scanOption).split(QLatin1Char(','), Qt::SkipEmptyParts);
        return runDiscover(settings, scanList);
    }

    const std::shared_ptr<HueTrustPolicy> trust = makeTrustPolicy(settings, &error);
    if (!trust) {
        std::cerr << "failed to load trust anchors: " << error.toStdString() << '\n';
        return 1;
    }

    QtHttpTransport http;
    CommunicationStatusTracker tracker;
    GatewayClient client(http, trust, &tracker, toGatewayOptions(settings, trust->anchors()));

    if (command == QStringLiteral("pair")) {
        return runPair(client, settings, parser.value(appOption), parser.value(deviceOption),
                       std::max(1, parser.value(attemptsOption).toInt()),
                       std::max(100, parser.value(intervalOption).toInt()));
    }

    if (!client.resume(settings.credentials())) {
        std::cerr << userFacingMessage(RequestStatus::NotAuthenticated).toStdString()
                  << ": host and appKey are required (settings or HUECONNECT_HOST / HUECONNECT_APP_KEY)" << '\n';
        return 1;
    }

    if (command == QStringLiteral("get")) {
        if (positional.size() < 2) {
            std::cerr << "get needs a resource path, e.g. /clip/v2/resource/light" << '\n';
            return 64;
        }
        return runGet(client, positional.at(1));
    }
    if (command == QStringLiteral("events"))
        return runEvents(client, tracker, parser.value(secondsOption).toInt());

    std::cerr << "unknown command: " << command.toStdString() << '\n';
    return 64;
}
