#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

#include <QByteArray>
#include <QList>
#include <QString>

#include "hue_http.h"
#include "hue_types.h"

namespace hueconnect {

// Incremental text/event-stream decoder. Chunks may split lines and frames
// anywhere; only complete frames produce envelopes.
class EventStreamParser
{
public:
    static constexpr int kMaxBufferBytes = 1024 * 1024;

    QList<EventEnvelope> feed(const QByteArray &chunk);
    void reset();

    int malformedFrames() const { return m_malformedFrames; }
    int overflows() const { return m_overflows; }

    // One envelope per record of every event in a frame's data field.
    static QList<EventEnvelope> decodeFrame(const QByteArray &data,
                                            const QString &frameId,
                                            bool *ok = nullptr);

private:
    void finishFrame(QList<EventEnvelope> *out);

    QByteArray m_buffer;
    QByteArray m_data;
    QString m_frameId;
    QString m_frameEvent;
    bool m_hasData = false;
    int m_malformedFrames = 0;
    int m_overflows = 0;
};

class EventStreamConsumer
{
public:
    using EventHandler = std::function<void(const EventEnvelope &)>;
    using ConnectionHandler = std::function<void()>;
    using ConnectionLostHandler = std::function<void(const QString &reason)>;

    explicit EventStreamConsumer(HttpTransport &http);
    ~EventStreamConsumer();

    EventStreamConsumer(const EventStreamConsumer &) = delete;
    EventStreamConsumer &operator=(const EventStreamConsumer &) = delete;

    int subscribe(EventHandler handler);
    void unsubscribe(int id);

    // Called on the reader thread once the first chunk arrived.
    void setConnectedHandler(ConnectionHandler handler);
    // Called on the reader thread at most once per open().
    void setConnectionLostHandler(ConnectionLostHandler handler);

    // Starts the reader thread; fails if a stream is already open. Must not
    // be called from a handler.
    bool open(const HttpRequest &request, int idleTimeoutMs, QString *error = nullptr);
    void close();
    bool isOpen() const;

private:
    void readLoop(HttpRequest request, int idleTimeoutMs);
    void publish(const QList<EventEnvelope> &envelopes);

    HttpTransport &m_http;

    mutable std::mutex m_mutex;
    std::map<int, EventHandler> m_handlers;
    int m_nextHandlerId = 1;
    ConnectionHandler m_connectedHandler;
    ConnectionLostHandler m_lostHandler;

    std::mutex m_readerMutex;
    std::thread m_reader;
    std::atomic_bool m_stop{false};
    std::atomic_bool m_running{false};
};

} // namespace hueconnect
