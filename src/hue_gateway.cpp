#include "hue_gateway.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <thread>

#include <QJsonObject>
#include <QStringList>

#include "hue_log.h"
#include "hue_status.h"
#include "hue_trust.h"

namespace hueconnect {

namespace {

constexpr int kLinkButtonErrorType = 101;
constexpr int kMaxDeviceLabelLength = 19;
constexpr int kMaxDeviceTypeLength = 40;

bool isWriteMethod(const QByteArray &method)
{
    return method == QByteArrayLiteral("PUT") || method == QByteArrayLiteral("POST")
        || method == QByteArrayLiteral("DELETE");
}

std::future<RequestResult> readyFuture(RequestResult result)
{
    std::promise<RequestResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

RequestResult failure(RequestStatus status, const QString &error)
{
    RequestResult result;
    result.status = status;
    result.error = error;
    return result;
}

} // namespace

QString toString(RequestStatus status)
{
    switch (status) {
    case RequestStatus::Success:
        return QStringLiteral("success");
    case RequestStatus::NotAuthenticated:
        return QStringLiteral("not-authenticated");
    case RequestStatus::InvalidAddress:
        return QStringLiteral("invalid-address");
    case RequestStatus::LinkButtonNotPressed:
        return QStringLiteral("link-button-not-pressed");
    case RequestStatus::BufferFull:
        return QStringLiteral("buffer-full");
    case RequestStatus::RateLimitExceeded:
        return QStringLiteral("rate-limit-exceeded");
    case RequestStatus::CapacityExceeded:
        return QStringLiteral("capacity-exceeded");
    case RequestStatus::HttpError:
        return QStringLiteral("http-error");
    case RequestStatus::DecodeFailure:
        return QStringLiteral("decode-failure");
    case RequestStatus::TransportError:
        break;
    }
    return QStringLiteral("transport-error");
}

QString userFacingMessage(RequestStatus status)
{
    switch (status) {
    case RequestStatus::LinkButtonNotPressed:
        return QStringLiteral("Press the link button on the bridge");
    case RequestStatus::InvalidAddress:
        return QStringLiteral("No bridge found");
    default:
        break;
    }
    return QStringLiteral("Connection problem");
}

// FIFO of writes for one resource class, drained by a single thread that
// waits for the rate limiter before every dispatch.
class GatewayClient::WriteQueue
{
public:
    using Job = std::function<void(bool cancelled)>;

    explicit WriteQueue(QString name)
        : m_name(std::move(name))
        , m_thread(&WriteQueue::run, this)
    {
    }

    ~WriteQueue()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_wake.notify_all();
        m_thread.join();
        qCDebug(gatewayLog) << m_name << "write queue stopped";
    }

    void post(Job job)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_jobs.push_back(std::move(job));
        }
        m_wake.notify_all();
    }

    // Interruptible wait used between admit() and dispatch.
    bool waitFor(std::chrono::milliseconds delay)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return !m_wake.wait_for(lock, delay, [this]() { return m_stopping; });
    }

private:
    void run()
    {
        for (;;) {
            Job job;
            bool stopping = false;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_wake.wait(lock, [this]() { return m_stopping || !m_jobs.empty(); });
                if (m_jobs.empty())
                    return;
                job = std::move(m_jobs.front());
                m_jobs.pop_front();
                stopping = m_stopping;
            }
            job(stopping);
        }
    }

    QString m_name;
    std::mutex m_mutex;
    std::condition_variable m_wake;
    std::deque<Job> m_jobs;
    bool m_stopping = false;
    std::thread m_thread;
};

GatewayClient::GatewayClient(HttpTransport &http,
                             std::shared_ptr<const TrustValidator> trust,
                             CommunicationStatusTracker *tracker,
                             GatewayOptions options)
    : m_http(http)
    , m_trust(std::move(trust))
    , m_tracker(tracker)
    , m_options(std::move(options))
    , m_limiter(m_options.deviceWriteInterval, m_options.groupWriteInterval)
    , m_events(http)
    , m_deviceQueue(std::make_unique<WriteQueue>(QStringLiteral("device")))
    , m_groupQueue(std::make_unique<WriteQueue>(QStringLiteral("group")))
{
    m_events.setConnectedHandler([this]() { onEventStreamConnected(); });
    m_events.setConnectionLostHandler([this](const QString &reason) { onEventStreamLost(reason); });
    if (m_tracker)
        m_events.subscribe([this](const EventEnvelope &envelope) { m_tracker->recordEvent(envelope); });
}

GatewayClient::~GatewayClient()
{
    stopEventStream();
    m_deviceQueue.reset();
    m_groupQueue.reset();
}

void GatewayClient::setBridge(const QString &address, const QString &bridgeId, int port)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const QString normalizedId = normalizeBridgeId(bridgeId);
    m_bridgeAddress = address.trimmed();
    m_bridgeId = normalizedId;
    m_bridgePort = port;

    if (m_session && (m_session->address != m_bridgeAddress
                      || (!normalizedId.isEmpty() && m_session->bridgeId != normalizedId))) {
        qCInfo(gatewayLog) << "bridge changed; dropping session for" << m_session->address;
        m_session.reset();
    }
}

QString GatewayClient::buildDeviceType(const QString &appLabel, const QString &deviceLabel)
{
    const QString app = appLabel.trimmed();
    const QString device = deviceLabel.trimmed().left(kMaxDeviceLabelLength);
    return (app + QLatin1Char('#') + device).left(kMaxDeviceTypeLength);
}

PairingResult GatewayClient::requestApplicationKey(const QString &appLabel, const QString &deviceLabel)
{
    QString address;
    QString bridgeId;
    int port = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        address = m_bridgeAddress;
        bridgeId = m_bridgeId;
        port = m_bridgePort;
    }

    PairingResult pairing;
    QString error;
    const QUrl url = buildUrl(address, port, m_options.useTls, QStringLiteral("/api"), &error);
    if (!url.isValid()) {
        pairing.status = RequestStatus::InvalidAddress;
        pairing.error = error;
        return pairing;
    }

    Session target;
    target.bridgeId = bridgeId;
    target.address = address;
    target.port = url.port();
    target.useTls = m_options.useTls;
    target.trust = m_trust;

    QJsonObject payload;
    payload.insert(QStringLiteral("devicetype"), buildDeviceType(appLabel, deviceLabel));
    payload.insert(QStringLiteral("generateclientkey"), true);

    HttpRequest request = makeRequest(target, url);
    request.method = QByteArrayLiteral("POST");
    request.body = QJsonDocument(payload).toJson(QJsonDocument::Compact);

    const HttpResult result = m_http.send(request);
    pairing = parsePairingResponse(result);
    if (pairing.status == RequestStatus::LinkButtonNotPressed) {
        qCInfo(gatewayLog) << "pairing with" << address << "waiting for link button";
        return pairing;
    }
    if (!pairing.ok()) {
        qCWarning(gatewayLog) << "pairing with" << address << "failed:" << toString(pairing.status) << pairing.error;
        return pairing;
    }

    target.appKey = pairing.appKey;
    target.clientKey = pairing.clientKey;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_session = target;
    }
    qCInfo(gatewayLog) << "paired with bridge" << (bridgeId.isEmpty() ? address : bridgeId);
    return pairing;
}

PairingResult GatewayClient::parsePairingResponse(const HttpResult &result)
{
    PairingResult pairing;
    if (result.statusCode == 0) {
        pairing.status = RequestStatus::TransportError;
        pairing.error = result.error;
        return pairing;
    }
    if (result.statusCode == 403) {
        pairing.status = RequestStatus::LinkButtonNotPressed;
        pairing.error = extractBridgeError(result.payload);
        return pairing;
    }
    if (!result.ok) {
        const RequestResult classified = classifyResponse(result);
        pairing.status = classified.status;
        pairing.error = classified.error;
        return pairing;
    }

    QJsonParseError err {};
    const QJsonDocument doc = QJsonDocument::fromJson(result.payload, &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) {
        pairing.status = RequestStatus::DecodeFailure;
        pairing.error = QStringLiteral("Unexpected pairing response");
        qCWarning(gatewayLog) << "unexpected pairing response:" << payloadSnippet(result.payload);
        return pairing;
    }

    const QJsonArray entries = doc.array();
    for (const QJsonValue &value : entries) {
        const QJsonObject entry = value.toObject();
        const QJsonObject success = entry.value(QStringLiteral("success")).toObject();
        const QString username = success.value(QStringLiteral("username")).toString();
        if (!username.isEmpty()) {
            pairing.status = RequestStatus::Success;
            pairing.appKey = username;
            pairing.clientKey = success.value(QStringLiteral("clientkey")).toString();
            pairing.error.clear();
            return pairing;
        }

        const QJsonObject error = entry.value(QStringLiteral("error")).toObject();
        if (error.isEmpty())
            continue;
        pairing.error = error.value(QStringLiteral("description")).toString();
        if (error.value(QStringLiteral("type")).toInt() == kLinkButtonErrorType) {
            pairing.status = RequestStatus::LinkButtonNotPressed;
            return pairing;
        }
        pairing.status = RequestStatus::HttpError;
    }

    if (pairing.status != RequestStatus::HttpError) {
        pairing.status = RequestStatus::DecodeFailure;
        pairing.error = QStringLiteral("Pairing response carried no key");
    }
    return pairing;
}

bool GatewayClient::resume(const StoredCredentials &credentials)
{
    if (credentials.address.trimmed().isEmpty() || credentials.appKey.isEmpty()) {
        qCWarning(gatewayLog) << "cannot resume: stored credentials lack address or key";
        return false;
    }

    Session session;
    session.bridgeId = normalizeBridgeId(credentials.bridgeId);
    session.address = credentials.address.trimmed();
    session.useTls = m_options.useTls;
    session.port = credentials.port > 0 ? credentials.port : (session.useTls ? 443 : 80);
    session.appKey = credentials.appKey;
    session.clientKey = credentials.clientKey;
    session.trust = m_trust;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_bridgeAddress = session.address;
    m_bridgeId = session.bridgeId;
    m_bridgePort = session.port;
    m_session = session;
    qCInfo(gatewayLog) << "resumed session with" << session.address;
    return true;
}

std::optional<Session> GatewayClient::currentSession() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session;
}

bool GatewayClient::hasValidConnection() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session && !m_session->appKey.isEmpty() && !m_session->address.isEmpty();
}

void GatewayClient::disconnect()
{
    // The session goes away before a reconnect can pick it up again.
    std::lock_guard<std::mutex> lifecycle(m_streamLifecycleMutex);
    closeEventStream();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_session)
        qCInfo(gatewayLog) << "disconnecting from" << m_session->address;
    m_session.reset();
}

std::optional<RequestResult> GatewayClient::precheck(const QString &path) const
{
    if (path.trimmed().isEmpty() || !path.trimmed().startsWith(QLatin1Char('/')))
        return failure(RequestStatus::InvalidAddress, QStringLiteral("Invalid resource path: %1").arg(path));
    if (!hasValidConnection())
        return failure(RequestStatus::NotAuthenticated, QStringLiteral("No application key"));
    return std::nullopt;
}

RequestResult GatewayClient::request(const QString &path, const QByteArray &method, const QByteArray &body)
{
    if (!isWriteMethod(method)) {
        if (auto rejected = precheck(path))
            return *rejected;
        return dispatch(path, method, body);
    }
    return requestAsync(path, method, body).get();
}

std::future<RequestResult> GatewayClient::requestAsync(const QString &path,
                                                       const QByteArray &method,
                                                       const QByteArray &body)
{
    if (auto rejected = precheck(path))
        return readyFuture(*rejected);

    if (!isWriteMethod(method))
        return std::async(std::launch::async, [this, path, method, body]() { return dispatch(path, method, body); });

    const ResourceClass resourceClass = resourceClassForPath(path);
    if (resourceClass == ResourceClass::Device) {
        const int inFlight = m_deviceWritesInFlight.fetch_add(1);
        if (inFlight >= m_options.maxInFlightDeviceWrites) {
            m_deviceWritesInFlight.fetch_sub(1);
            qCWarning(gatewayLog) << "rejecting write to" << path << "-" << inFlight << "device writes in flight";
            return readyFuture(failure(RequestStatus::CapacityExceeded,
                                       QStringLiteral("Too many device writes in flight")));
        }
    }

    auto promise = std::make_shared<std::promise<RequestResult>>();
    std::future<RequestResult> future = promise->get_future();
    WriteQueue *queue = resourceClass == ResourceClass::Group ? m_groupQueue.get() : m_deviceQueue.get();

    queue->post([this, queue, promise, resourceClass, path, method, body](bool cancelled) {
        RequestResult result;
        if (cancelled || !queue->waitFor(m_limiter.admit(resourceClass))) {
            result = failure(RequestStatus::TransportError, QStringLiteral("Gateway client shut down"));
        } else {
            result = dispatch(path, method, body);
        }

        if (resourceClass == ResourceClass::Device) {
            m_deviceWritesInFlight.fetch_sub(1);
            QString type;
            QString id;
            // Rejected writes (503, 429, 404...) say nothing about the device.
            if (m_tracker && result.status == RequestStatus::Success && parseResourcePath(path, &type, &id)
                && CommunicationStatusTracker::isDeviceOwnedType(type))
                m_tracker->recordWriteResponse(id, result.rawBody);
        }
        promise->set_value(std::move(result));
    });
    return future;
}

RequestResult GatewayClient::dispatch(const QString &path, const QByteArray &method, const QByteArray &body)
{
    std::optional<Session> session = currentSession();
    if (!session || session->appKey.isEmpty())
        return failure(RequestStatus::NotAuthenticated, QStringLiteral("No application key"));

    QString error;
    const QUrl url = buildUrl(session->address, session->port, session->useTls, path.trimmed(), &error);
    if (!url.isValid())
        return failure(RequestStatus::InvalidAddress, error);

    HttpRequest request = makeRequest(*session, url);
    request.method = method;
    request.body = body;
    request.setHeader("hue-application-key", session->appKey.toUtf8());

    const RequestResult result = classifyResponse(m_http.send(request));
    if (!result.ok())
        qCDebug(gatewayLog) << method << path << "->" << toString(result.status) << result.error;
    return result;
}

HttpRequest GatewayClient::makeRequest(const Session &session, const QUrl &url) const
{
    HttpRequest request;
    request.url = url;
    request.timeoutMs = m_options.requestTimeoutMs;
    request.setHeader("Accept", "application/json");
    if (session.useTls) {
        request.trust = session.trust ? session.trust : m_trust;
        request.caCertificates = m_options.caCertificates;
        request.expectedPeerName = session.bridgeId.toLower();
    }
    return request;
}

RequestResult GatewayClient::classifyResponse(const HttpResult &http)
{
    RequestResult result;
    result.statusCode = http.statusCode;
    result.rawBody = http.payload;

    if (http.statusCode == 0) {
        result.status = RequestStatus::TransportError;
        result.error = http.error.isEmpty() ? QStringLiteral("No response from bridge") : http.error;
        return result;
    }

    if (http.statusCode < 200 || http.statusCode >= 300) {
        switch (http.statusCode) {
        case 403:
            result.status = RequestStatus::LinkButtonNotPressed;
            break;
        case 503:
            result.status = RequestStatus::BufferFull;
            break;
        case 429:
            result.status = RequestStatus::RateLimitExceeded;
            break;
        default:
            result.status = RequestStatus::HttpError;
            break;
        }
        const QString bridgeError = extractBridgeError(http.payload);
        result.error = bridgeError.isEmpty() ? QStringLiteral("HTTP %1").arg(http.statusCode) : bridgeError;
        result.body = QJsonDocument::fromJson(http.payload);
        return result;
    }

    if (http.payload.trimmed().isEmpty()) {
        result.status = RequestStatus::Success;
        return result;
    }

    QJsonParseError err {};
    result.body = QJsonDocument::fromJson(http.payload, &err);
    if (err.error != QJsonParseError::NoError || result.body.isNull()) {
        result.status = RequestStatus::DecodeFailure;
        result.error = err.errorString();
        qCWarning(gatewayLog) << "undecodable bridge response:" << payloadSnippet(http.payload);
        return result;
    }

    // 207 and partially failed writes still count as success; the bridge's
    // error text is kept for the caller.
    result.status = RequestStatus::Success;
    result.error = extractBridgeError(http.payload);
    return result;
}

QString GatewayClient::extractBridgeError(const QByteArray &payload)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    QStringList descriptions;
    if (doc.isObject()) {
        const QJsonArray errors = doc.object().value(QStringLiteral("errors")).toArray();
        for (const QJsonValue &error : errors) {
            const QString description = error.toObject().value(QStringLiteral("description")).toString();
            if (!description.isEmpty())
                descriptions.append(description);
        }
    } else if (doc.isArray()) {
        const QJsonArray entries = doc.array();
        for (const QJsonValue &entry : entries) {
            const QJsonObject error = entry.toObject().value(QStringLiteral("error")).toObject();
            const QString description = error.value(QStringLiteral("description")).toString();
            if (!description.isEmpty())
                descriptions.append(description);
        }
    }
    return descriptions.join(QStringLiteral("; "));
}

RequestResult GatewayClient::bridgeConfig()
{
    QString address;
    QString bridgeId;
    int port = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        address = m_bridgeAddress;
        bridgeId = m_bridgeId;
        port = m_bridgePort;
    }

    QString error;
    const QUrl url = buildUrl(address, port, m_options.useTls, QStringLiteral("/api/0/config"), &error);
    if (!url.isValid())
        return failure(RequestStatus::InvalidAddress, error);

    Session target;
    target.bridgeId = bridgeId;
    target.address = address;
    target.useTls = m_options.useTls;
    target.trust = m_trust;
    return classifyResponse(m_http.send(makeRequest(target, url)));
}

RequestResult GatewayClient::batchUpdate(const QJsonArray &updates)
{
    QJsonObject payload;
    payload.insert(QStringLiteral("data"), updates);
    return request(QStringLiteral("/clip/v2/resource"), QByteArrayLiteral("PUT"),
                   QJsonDocument(payload).toJson(QJsonDocument::Compact));
}

RequestResult GatewayClient::deleteResource(const QString &type, const QString &id)
{
    if (type.trimmed().isEmpty() || id.trimmed().isEmpty())
        return failure(RequestStatus::InvalidAddress, QStringLiteral("Resource type and id are required"));
    return request(QStringLiteral("/clip/v2/resource/%1/%2").arg(type.trimmed(), id.trimmed()),
                   QByteArrayLiteral("DELETE"));
}

bool GatewayClient::startEventStream(QString *error)
{
    std::lock_guard<std::mutex> lifecycle(m_streamLifecycleMutex);
    return openEventStream(error);
}

bool GatewayClient::openEventStream(QString *error)
{
    if (m_events.isOpen())
        return true;

    const std::optional<Session> session = currentSession();
    if (!session || session->appKey.isEmpty()) {
        if (error)
            *error = QStringLiteral("No application key");
        qCWarning(gatewayLog) << "cannot start event stream without an application key";
        return false;
    }

    QString urlError;
    const QUrl url = buildUrl(session->address, session->port, session->useTls,
                              QStringLiteral("/eventstream/clip/v2"), &urlError);
    if (!url.isValid()) {
        if (error)
            *error = urlError;
        return false;
    }

    HttpRequest request = makeRequest(*session, url);
    request.setHeader("Accept", "text/event-stream");
    request.setHeader("hue-application-key", session->appKey.toUtf8());
    request.timeoutMs = 0;

    {
        std::lock_guard<std::mutex> lock(m_streamMutex);
        m_streamWanted = true;
        m_streamLost = false;
    }
    if (m_events.open(request, m_options.eventStreamIdleTimeoutMs, error))
        return true;

    // Still wanted: let tick() try again.
    std::lock_guard<std::mutex> lock(m_streamMutex);
    m_streamLost = true;
    m_nextStreamRetry = Clock::now() + std::chrono::milliseconds(m_options.quickRetryIntervalMs);
    return false;
}

void GatewayClient::stopEventStream()
{
    std::lock_guard<std::mutex> lifecycle(m_streamLifecycleMutex);
    closeEventStream();
}

void GatewayClient::closeEventStream()
{
    {
        std::lock_guard<std::mutex> lock(m_streamMutex);
        m_streamWanted = false;
        m_streamLost = false;
        m_streamRetryCount = 0;
    }
    m_events.close();
}

bool GatewayClient::isEventStreamOpen() const
{
    return m_events.isOpen();
}

void GatewayClient::tick()
{
    // Held until the reconnect finished so a concurrent stop cannot be
    // overtaken by it.
    std::lock_guard<std::mutex> lifecycle(m_streamLifecycleMutex);
    {
        std::lock_guard<std::mutex> lock(m_streamMutex);
        if (!m_streamWanted || !m_streamLost || Clock::now() < m_nextStreamRetry)
            return;
        m_streamLost = false;
    }
    qCInfo(gatewayLog) << "reconnecting event stream";
    QString error;
    if (!openEventStream(&error))
        qCWarning(gatewayLog) << "event stream reconnect failed:" << error;
}

void GatewayClient::onEventStreamConnected()
{
    std::lock_guard<std::mutex> lock(m_streamMutex);
    m_streamRetryCount = 0;
}

void GatewayClient::onEventStreamLost(const QString &reason)
{
    std::lock_guard<std::mutex> lock(m_streamMutex);
    if (!m_streamWanted)
        return;

    m_streamLost = true;
    int delayMs = m_options.retryIntervalMs;
    if (m_streamRetryCount < m_options.quickRetryCount) {
        ++m_streamRetryCount;
        delayMs = m_options.quickRetryIntervalMs;
        qCInfo(gatewayLog) << "event stream lost (" << reason << "); retry" << m_streamRetryCount << "of"
                           << m_options.quickRetryCount << "in" << delayMs << "ms";
    } else {
        qCWarning(gatewayLog) << "event stream lost (" << reason << ") after" << m_streamRetryCount
                              << "attempts; retrying in" << delayMs << "ms";
    }
    m_nextStreamRetry = Clock::now() + std::chrono::milliseconds(delayMs);
}

} // namespace hueconnect
