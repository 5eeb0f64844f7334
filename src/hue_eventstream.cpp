#include "hue_eventstream.h"

#include <vector>

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "hue_log.h"

namespace hueconnect {

namespace {

constexpr int kEventSnippetBytes = 2048;

void appendRecords(const QJsonObject &event, const QString &frameId, const QDateTime &arrivedAt,
                   QList<EventEnvelope> *out)
{
    const QString eventType = event.value(QStringLiteral("type")).toString();
    const QString eventId = event.value(QStringLiteral("id")).toString(frameId);
    const QJsonArray records = event.value(QStringLiteral("data")).toArray();
    for (const QJsonValue &value : records) {
        const QJsonObject record = value.toObject();
        if (record.isEmpty())
            continue;
        const QJsonObject owner = record.value(QStringLiteral("owner")).toObject();

        EventEnvelope envelope;
        envelope.eventId = eventId;
        envelope.eventType = eventType;
        envelope.resourceId = record.value(QStringLiteral("id")).toString();
        envelope.resourceType = record.value(QStringLiteral("type")).toString();
        envelope.ownerId = owner.value(QStringLiteral("rid")).toString();
        envelope.ownerType = owner.value(QStringLiteral("rtype")).toString();
        envelope.payload = record;
        envelope.arrivedAt = arrivedAt;
        out->append(envelope);
    }
}

} // namespace

QList<EventEnvelope> EventStreamParser::feed(const QByteArray &chunk)
{
    QList<EventEnvelope> out;
    m_buffer.append(chunk);

    int lineStart = 0;
    for (;;) {
        const int newline = m_buffer.indexOf('\n', lineStart);
        if (newline < 0)
            break;

        QByteArray line = m_buffer.mid(lineStart, newline - lineStart);
        lineStart = newline + 1;
        if (line.endsWith('\r'))
            line.chop(1);

        if (line.isEmpty()) {
            finishFrame(&out);
            continue;
        }
        if (line.startsWith(':'))
            continue;

        const int colon = line.indexOf(':');
        const QByteArray field = colon < 0 ? line : line.left(colon);
        QByteArray value = colon < 0 ? QByteArray() : line.mid(colon + 1);
        if (value.startsWith(' '))
            value.remove(0, 1);

        if (field == "data") {
            if (m_hasData)
                m_data.append('\n');
            m_data.append(value);
            m_hasData = true;
        } else if (field == "id") {
            m_frameId = QString::fromUtf8(value);
        } else if (field == "event") {
            m_frameEvent = QString::fromUtf8(value);
        }
    }
    m_buffer.remove(0, lineStart);

    if (m_buffer.size() + m_data.size() > kMaxBufferBytes) {
        ++m_overflows;
        qCWarning(eventStreamLog) << "event stream buffer exceeded" << kMaxBufferBytes << "bytes; discarding";
        reset();
    }
    return out;
}

void EventStreamParser::reset()
{
    m_buffer.clear();
    m_data.clear();
    m_frameId.clear();
    m_frameEvent.clear();
    m_hasData = false;
}

void EventStreamParser::finishFrame(QList<EventEnvelope> *out)
{
    if (m_hasData) {
        bool ok = false;
        const QList<EventEnvelope> envelopes = decodeFrame(m_data, m_frameId, &ok);
        if (ok) {
            for (EventEnvelope envelope : envelopes) {
                if (envelope.eventType.isEmpty())
                    envelope.eventType = m_frameEvent;
                out->append(envelope);
            }
        } else {
            ++m_malformedFrames;
            qCWarning(eventStreamLog) << "skipping undecodable event frame" << m_frameId
                                      << payloadSnippet(m_data, kEventSnippetBytes);
        }
    }
    m_data.clear();
    m_frameId.clear();
    m_frameEvent.clear();
    m_hasData = false;
}

QList<EventEnvelope> EventStreamParser::decodeFrame(const QByteArray &data, const QString &frameId, bool *ok)
{
    QList<EventEnvelope> out;
    QJsonParseError err {};
    const QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError || (!doc.isArray() && !doc.isObject())) {
        if (ok)
            *ok = false;
        return out;
    }

    const QDateTime arrivedAt = QDateTime::currentDateTimeUtc();
    if (doc.isObject()) {
        appendRecords(doc.object(), frameId, arrivedAt, &out);
    } else {
        const QJsonArray events = doc.array();
        for (const QJsonValue &event : events)
            appendRecords(event.toObject(), frameId, arrivedAt, &out);
    }
    if (ok)
        *ok = true;
    return out;
}

EventStreamConsumer::EventStreamConsumer(HttpTransport &http)
    : m_http(http)
{
}

EventStreamConsumer::~EventStreamConsumer()
{
    close();
}

int EventStreamConsumer::subscribe(EventHandler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const int id = m_nextHandlerId++;
    m_handlers.emplace(id, std::move(handler));
    return id;
}

void EventStreamConsumer::unsubscribe(int id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers.erase(id);
}

void EventStreamConsumer::setConnectedHandler(ConnectionHandler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connectedHandler = std::move(handler);
}

void EventStreamConsumer::setConnectionLostHandler(ConnectionLostHandler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lostHandler = std::move(handler);
}

bool EventStreamConsumer::open(const HttpRequest &request, int idleTimeoutMs, QString *error)
{
    std::lock_guard<std::mutex> lock(m_readerMutex);
    if (m_running.load()) {
        if (error)
            *error = QStringLiteral("Event stream already open");
        return false;
    }
    if (m_reader.joinable())
        m_reader.join();

    m_stop.store(false);
    m_running.store(true);
    m_reader = std::thread(&EventStreamConsumer::readLoop, this, request, idleTimeoutMs);
    return true;
}

void EventStreamConsumer::close()
{
    std::lock_guard<std::mutex> lock(m_readerMutex);
    m_stop.store(true);
    if (m_reader.joinable()) {
        if (m_reader.get_id() == std::this_thread::get_id())
            m_reader.detach();
        else
            m_reader.join();
    }
    m_running.store(false);
}

bool EventStreamConsumer::isOpen() const
{
    return m_running.load();
}

void EventStreamConsumer::readLoop(HttpRequest request, int idleTimeoutMs)
{
    EventStreamParser parser;
    bool connected = false;
    qCInfo(eventStreamLog) << "opening event stream" << request.url.toString();

    const HttpResult result = m_http.stream(
        request,
        [&](const QByteArray &chunk) {
            if (!connected) {
                connected = true;
                ConnectionHandler handler;
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    handler = m_connectedHandler;
                }
                if (handler)
                    handler();
            }
            publish(parser.feed(chunk));
        },
        m_stop,
        idleTimeoutMs);

    m_running.store(false);
    if (m_stop.load()) {
        qCDebug(eventStreamLog) << "event stream closed";
        return;
    }

    const QString reason = result.error.isEmpty() ? QStringLiteral("Stream ended") : result.error;
    qCWarning(eventStreamLog) << "event stream lost:" << reason;
    ConnectionLostHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handler = m_lostHandler;
    }
    if (handler)
        handler(reason);
}

void EventStreamConsumer::publish(const QList<EventEnvelope> &envelopes)
{
    if (envelopes.isEmpty())
        return;

    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &entry : m_handlers)
            handlers.push_back(entry.second);
    }
    for (const EventEnvelope &envelope : envelopes) {
        qCDebug(eventStreamLog) << "event" << envelope.eventType << envelope.resourceType << envelope.resourceId;
        for (const EventHandler &handler : handlers) {
            if (handler)
                handler(envelope);
        }
    }
}

} // namespace hueconnect
