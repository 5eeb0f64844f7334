#pragma once

#include <atomic>
#include <functional>
#include <memory>

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QSslCertificate>
#include <QString>
#include <QUrl>

namespace hueconnect {

class TrustValidator;

struct HttpRequest {
    QByteArray method = QByteArrayLiteral("GET");
    QUrl url;
    QList<QPair<QByteArray, QByteArray>> headers;
    QByteArray body;
    int timeoutMs = 10000;

    // TLS only: anchors installed as CA list, the validator consulted on
    // handshake errors, and the identity the peer should present.
    QList<QSslCertificate> caCertificates;
    std::shared_ptr<const TrustValidator> trust;
    QString expectedPeerName;

    QByteArray header(const QByteArray &name) const;
    void setHeader(const QByteArray &name, const QByteArray &value);
};

// statusCode is 0 when no HTTP response was received (connect failure,
// timeout, TLS rejection); error then describes the transport failure.
struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

class HttpTransport
{
public:
    using ChunkHandler = std::function<void(const QByteArray &chunk)>;

    virtual ~HttpTransport() = default;

    // Blocking request/response. Must be callable from any thread.
    virtual HttpResult send(const HttpRequest &request) = 0;

    // Long-lived response delivered chunk by chunk until the server closes,
    // an error occurs, no data arrives for idleTimeoutMs, or stop is set.
    virtual HttpResult stream(const HttpRequest &request,
                              const ChunkHandler &onChunk,
                              const std::atomic_bool &stop,
                              int idleTimeoutMs) = 0;
};

// QNetworkAccessManager based transport. Every call creates its own manager
// and runs a local event loop, so the calling thread needs no Qt event loop
// of its own.
class QtHttpTransport final : public HttpTransport
{
public:
    QtHttpTransport() = default;

    HttpResult send(const HttpRequest &request) override;
    HttpResult stream(const HttpRequest &request,
                      const ChunkHandler &onChunk,
                      const std::atomic_bool &stop,
                      int idleTimeoutMs) override;
};

// Builds scheme://host:port/path; port 0 picks 443 or 80.
QUrl buildUrl(const QString &host, int port, bool useTls, const QString &path, QString *error = nullptr);

} // namespace hueconnect
