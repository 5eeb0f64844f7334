#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QList>
#include <QSslCertificate>
#include <QString>

#include "hue_eventstream.h"
#include "hue_http.h"
#include "hue_ratelimit.h"
#include "hue_types.h"

namespace hueconnect {

class CommunicationStatusTracker;
class TrustValidator;

enum class RequestStatus {
    Success,
    NotAuthenticated,
    InvalidAddress,
    LinkButtonNotPressed,
    BufferFull,
    RateLimitExceeded,
    CapacityExceeded,
    HttpError,
    DecodeFailure,
    TransportError,
};

QString toString(RequestStatus status);

// One of the three messages shown to end users.
QString userFacingMessage(RequestStatus status);

struct RequestResult {
    RequestStatus status = RequestStatus::TransportError;
    int statusCode = 0;
    QJsonDocument body;
    QByteArray rawBody;
    QString error;

    bool ok() const { return status == RequestStatus::Success; }
};

struct PairingResult {
    RequestStatus status = RequestStatus::TransportError;
    QString appKey;
    QString clientKey;
    QString error;

    bool ok() const { return status == RequestStatus::Success; }
};

struct GatewayOptions {
    bool useTls = true;
    int requestTimeoutMs = 30000;
    int eventStreamIdleTimeoutMs = 120000;
    int quickRetryCount = 5;
    int quickRetryIntervalMs = 2000;
    int retryIntervalMs = 10000;
    int maxInFlightDeviceWrites = 16;
    std::chrono::milliseconds deviceWriteInterval = RateLimiter::kDefaultDeviceInterval;
    std::chrono::milliseconds groupWriteInterval = RateLimiter::kDefaultGroupInterval;
    QList<QSslCertificate> caCertificates;
};

// Pairing, authenticated CLIP v2 dispatch and the event stream of one
// bridge. All methods are thread-safe; writes are queued per resource
// class and spaced by the RateLimiter on worker threads.
class GatewayClient
{
public:
    GatewayClient(HttpTransport &http,
                  std::shared_ptr<const TrustValidator> trust,
                  CommunicationStatusTracker *tracker = nullptr,
                  GatewayOptions options = GatewayOptions());
    ~GatewayClient();

    GatewayClient(const GatewayClient &) = delete;
    GatewayClient &operator=(const GatewayClient &) = delete;

    // Target for pairing and bridgeConfig(). Switching to another address
    // or bridge drops the current session.
    void setBridge(const QString &address, const QString &bridgeId = QString(), int port = 0);

    // One pairing attempt. Callers poll while the result is
    // LinkButtonNotPressed.
    PairingResult requestApplicationKey(const QString &appLabel, const QString &deviceLabel);

    bool resume(const StoredCredentials &credentials);
    std::optional<Session> currentSession() const;
    bool hasValidConnection() const;
    void disconnect();

    RequestResult request(const QString &path,
                          const QByteArray &method = QByteArrayLiteral("GET"),
                          const QByteArray &body = QByteArray());
    std::future<RequestResult> requestAsync(const QString &path,
                                            const QByteArray &method = QByteArrayLiteral("GET"),
                                            const QByteArray &body = QByteArray());

    // Unauthenticated /api/0/config of the configured bridge.
    RequestResult bridgeConfig();
    RequestResult batchUpdate(const QJsonArray &updates);
    RequestResult deleteResource(const QString &type, const QString &id);

    bool startEventStream(QString *error = nullptr);
    void stopEventStream();
    bool isEventStreamOpen() const;
    EventStreamConsumer &events() { return m_events; }

    // Reconnects a lost event stream once its retry delay elapsed. The host
    // calls this periodically.
    void tick();

    int deviceWritesInFlight() const { return m_deviceWritesInFlight.load(); }
    const GatewayOptions &options() const { return m_options; }

    static QString buildDeviceType(const QString &appLabel, const QString &deviceLabel);
    static RequestResult classifyResponse(const HttpResult &result);
    static PairingResult parsePairingResponse(const HttpResult &result);
    static QString extractBridgeError(const QByteArray &payload);

private:
    class WriteQueue;
    using Clock = std::chrono::steady_clock;

    RequestResult dispatch(const QString &path, const QByteArray &method, const QByteArray &body);
    std::optional<RequestResult> precheck(const QString &path) const;
    HttpRequest makeRequest(const Session &session, const QUrl &url) const;
    bool openEventStream(QString *error);
    void closeEventStream();
    void onEventStreamLost(const QString &reason);
    void onEventStreamConnected();

    HttpTransport &m_http;
    std::shared_ptr<const TrustValidator> m_trust;
    CommunicationStatusTracker *m_tracker;
    const GatewayOptions m_options;
    RateLimiter m_limiter;

    mutable std::mutex m_mutex;
    QString m_bridgeAddress;
    QString m_bridgeId;
    int m_bridgePort = 0;
    std::optional<Session> m_session;

    std::atomic_int m_deviceWritesInFlight{0};

    EventStreamConsumer m_events;
    // Serializes start, stop and reconnect; taken before m_streamMutex.
    std::mutex m_streamLifecycleMutex;
    std::mutex m_streamMutex;
    bool m_streamWanted = false;
    bool m_streamLost = false;
    int m_streamRetryCount = 0;
    Clock::time_point m_nextStreamRetry;

    std::unique_ptr<WriteQueue> m_deviceQueue;
    std::unique_ptr<WriteQueue> m_groupQueue;
};

} // namespace hueconnect
