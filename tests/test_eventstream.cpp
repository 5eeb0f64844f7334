#include <catch2/catch.hpp>

#include <atomic>
#include <mutex>
#include <thread>

#include <QStringList>

#include "fake_transport.h"
#include "hue_eventstream.h"

using namespace hueconnect;
using hueconnect::test::FakeTransport;
using namespace std::chrono_literals;

namespace {

const QByteArray kLightUpdate = QByteArrayLiteral(
    R"([{"creationtime":"2024-05-01T10:00:00Z","id":"evt-1","type":"update","data":[)"
    R"({"id":"light-1","type":"light","owner":{"rid":"dev-1","rtype":"device"},"on":{"on":true}},)"
    R"({"id":"zc-1","type":"zigbee_connectivity","owner":{"rid":"dev-1","rtype":"device"},"status":"connected"}]}])");

QByteArray frame(const QByteArray &data, const QByteArray &id = QByteArray())
{
    QByteArray out;
    if (!id.isEmpty())
        out += "id: " + id + "\n";
    out += "data: " + data + "\n\n";
    return out;
}

template <typename Predicate>
bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = 2s)
{
    const auto until = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < until) {
        if (predicate())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

} // namespace

TEST_CASE("Parser: one envelope per data record", "[eventstream][parser]") {
    EventStreamParser parser;
    const QList<EventEnvelope> envelopes = parser.feed(frame(kLightUpdate, "1714557600:0"));

    REQUIRE(envelopes.size() == 2);
    CHECK(envelopes.at(0).eventId == QStringLiteral("evt-1"));
    CHECK(envelopes.at(0).eventType == QStringLiteral("update"));
    CHECK(envelopes.at(0).resourceId == QStringLiteral("light-1"));
    CHECK(envelopes.at(0).resourceType == QStringLiteral("light"));
    CHECK(envelopes.at(0).ownerId == QStringLiteral("dev-1"));
    CHECK(envelopes.at(0).ownerType == QStringLiteral("device"));
    CHECK(envelopes.at(0).payload.value(QStringLiteral("on")).toObject().value(QStringLiteral("on")).toBool());
    CHECK(envelopes.at(1).resourceType == QStringLiteral("zigbee_connectivity"));
    CHECK(envelopes.at(1).arrivedAt.isValid());
}

TEST_CASE("Parser: frames split across arbitrary chunks", "[eventstream][parser]") {
    const QByteArray stream = ": hi\n\n" + frame(kLightUpdate, "1") + frame(kLightUpdate, "2");

    for (int chunkSize : {1, 3, 7, 64, 4096}) {
        EventStreamParser parser;
        QList<EventEnvelope> all;
        for (int offset = 0; offset < stream.size(); offset += chunkSize)
            all.append(parser.feed(stream.mid(offset, chunkSize)));
        INFO("chunk size " << chunkSize);
        CHECK(all.size() == 4);
        CHECK(parser.malformedFrames() == 0);
    }
}

TEST_CASE("Parser: incomplete frames emit nothing", "[eventstream][parser]") {
    EventStreamParser parser;
    const QByteArray full = frame(kLightUpdate);
    CHECK(parser.feed(full.left(full.size() - 1)).isEmpty());
    CHECK(parser.feed(full.right(1)).size() == 2);
}

TEST_CASE("Parser: CRLF line endings and multi-line data", "[eventstream][parser]") {
    EventStreamParser parser;
    const QByteArray payload = QByteArrayLiteral(
        "id: 7\r\n"
        "event: message\r\n"
        "data: [{\"id\":\"evt-2\",\"type\":\"add\",\r\n"
        "data: \"data\":[{\"id\":\"light-9\",\"type\":\"light\"}]}]\r\n"
        "\r\n");
    const QList<EventEnvelope> envelopes = parser.feed(payload);
    REQUIRE(envelopes.size() == 1);
    CHECK(envelopes.first().eventType == QStringLiteral("add"));
    CHECK(envelopes.first().resourceId == QStringLiteral("light-9"));
    CHECK(envelopes.first().ownerId.isEmpty());
}

TEST_CASE("Parser: malformed frames are skipped", "[eventstream][parser]") {
    EventStreamParser parser;
    const QList<EventEnvelope> envelopes = parser.feed(frame("{not json") + frame(kLightUpdate));
    CHECK(envelopes.size() == 2);
    CHECK(parser.malformedFrames() == 1);
}

TEST_CASE("Parser: oversized buffer is discarded", "[eventstream][parser]") {
    EventStreamParser parser;
    const QByteArray huge = "data: " + QByteArray(EventStreamParser::kMaxBufferBytes + 10, 'x');
    CHECK(parser.feed(huge).isEmpty());
    CHECK(parser.overflows() == 1);
    CHECK(parser.feed(frame(kLightUpdate)).size() == 2);
}

TEST_CASE("Consumer: delivers envelopes in arrival order", "[eventstream][consumer]") {
    FakeTransport http;
    FakeTransport::StreamScript script;
    script.chunks = {frame(kLightUpdate).left(20), frame(kLightUpdate).mid(20), frame(kLightUpdate)};
    script.holdOpen = true;
    http.addStream(script);

    EventStreamConsumer consumer(http);
    std::mutex mutex;
    QStringList seen;
    consumer.subscribe([&](const EventEnvelope &envelope) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.append(envelope.resourceId);
    });
    std::atomic_int lost{0};
    std::atomic_int connected{0};
    consumer.setConnectionLostHandler([&lost](const QString &) { ++lost; });
    consumer.setConnectedHandler([&connected]() { ++connected; });

    HttpRequest request;
    request.url = QUrl(QStringLiteral("https://10.0.0.6/eventstream/clip/v2"));
    REQUIRE(consumer.open(request, 1000));
    REQUIRE(consumer.isOpen());
    QString error;
    CHECK_FALSE(consumer.open(request, 1000, &error));
    CHECK_FALSE(error.isEmpty());

    REQUIRE(waitUntil([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return seen.size() == 4;
    }));
    consumer.close();

    CHECK_FALSE(consumer.isOpen());
    CHECK(seen == QStringList{QStringLiteral("light-1"), QStringLiteral("zc-1"),
                              QStringLiteral("light-1"), QStringLiteral("zc-1")});
    CHECK(connected.load() == 1);
    CHECK(lost.load() == 0);
}

TEST_CASE("Consumer: reports a lost connection once and stays closed", "[eventstream][consumer]") {
    FakeTransport http;
    FakeTransport::StreamScript script;
    script.chunks = {frame(kLightUpdate)};
    script.end.ok = true;
    script.end.statusCode = 200;
    script.end.error = QStringLiteral("Stream ended by server");
    http.addStream(script);

    EventStreamConsumer consumer(http);
    std::atomic_int lost{0};
    QString reason;
    std::mutex mutex;
    consumer.setConnectionLostHandler([&](const QString &why) {
        std::lock_guard<std::mutex> lock(mutex);
        reason = why;
        ++lost;
    });

    HttpRequest request;
    request.url = QUrl(QStringLiteral("https://10.0.0.6/eventstream/clip/v2"));
    REQUIRE(consumer.open(request, 1000));
    REQUIRE(waitUntil([&]() { return lost.load() == 1; }));
    std::this_thread::sleep_for(50ms);

    CHECK(lost.load() == 1);
    CHECK_FALSE(consumer.isOpen());
    CHECK(http.streamRequests().size() == 1);
    std::lock_guard<std::mutex> lock(mutex);
    CHECK(reason == QStringLiteral("Stream ended by server"));
}
