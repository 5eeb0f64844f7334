#include "hue_http.h"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

#include "hue_log.h"
#include "hue_trust.h"

namespace hueconnect {

namespace {

constexpr int kStreamPollIntervalMs = 100;

QNetworkRequest toNetworkRequest(const HttpRequest &request)
{
    QNetworkRequest out(request.url);
    out.setRawHeader("User-Agent", "hueconnect/1.0");
    for (const auto &header : request.headers)
        out.setRawHeader(header.first, header.second);
    if (!request.body.isEmpty() && request.header("Content-Type").isEmpty())
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

#if QT_CONFIG(ssl)
    if (request.url.scheme() == QStringLiteral("https") && request.trust) {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setCaCertificates(request.caCertificates);
        ssl.setPeerVerifyMode(QSslSocket::VerifyPeer);
        out.setSslConfiguration(ssl);
        if (!request.expectedPeerName.isEmpty())
            out.setPeerVerifyName(request.expectedPeerName);
    }
#endif
    return out;
}

void attachTrustValidator(QNetworkReply *reply, const HttpRequest &request)
{
#if QT_CONFIG(ssl)
    if (!request.trust)
        return;

    const std::shared_ptr<const TrustValidator> trust = request.trust;
    const QString host = request.url.host();
    const QString expected = request.expectedPeerName;
    QObject::connect(reply, &QNetworkReply::sslErrors, reply,
                     [reply, trust, host, expected](const QList<QSslError> &errors) {
        CertificateChain chain;
        chain.certificates = reply->sslConfiguration().peerCertificateChain();
        chain.handshakeErrors = errors;
        chain.expectedIdentity = expected;
        if (chain.certificates.isEmpty()) {
            for (const QSslError &error : errors) {
                if (!error.certificate().isNull()) {
                    chain.certificates.append(error.certificate());
                    break;
                }
            }
        }
        if (trust->shouldTrust(chain, host))
            reply->ignoreSslErrors(errors);
    });
#else
    Q_UNUSED(reply);
    Q_UNUSED(request);
#endif
}

QNetworkReply *dispatch(QNetworkAccessManager &manager, const HttpRequest &request)
{
    const QNetworkRequest requestObj = toNetworkRequest(request);
    if (request.method == QByteArrayLiteral("GET"))
        return manager.get(requestObj);
    if (request.method == QByteArrayLiteral("POST"))
        return manager.post(requestObj, request.body);
    if (request.method == QByteArrayLiteral("PUT"))
        return manager.put(requestObj, request.body);
    return manager.sendCustomRequest(requestObj, request.method, request.body);
}

bool checkUrl(const HttpRequest &request, HttpResult *result)
{
    if (request.url.isValid() && !request.url.host().isEmpty())
        return true;
    result->error = QStringLiteral("Invalid request URL: %1").arg(request.url.toString());
    return false;
}

} // namespace

QByteArray HttpRequest::header(const QByteArray &name) const
{
    for (const auto &entry : headers) {
        if (entry.first.compare(name, Qt::CaseInsensitive) == 0)
            return entry.second;
    }
    return {};
}

void HttpRequest::setHeader(const QByteArray &name, const QByteArray &value)
{
    for (auto &entry : headers) {
        if (entry.first.compare(name, Qt::CaseInsensitive) == 0) {
            entry.second = value;
            return;
        }
    }
    headers.append(qMakePair(name, value));
}

HttpResult QtHttpTransport::send(const HttpRequest &request)
{
    HttpResult result;
    if (!checkUrl(request, &result))
        return result;

    QNetworkAccessManager manager;
    QNetworkReply *reply = dispatch(manager, request);
    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }
    attachTrustValidator(reply, request);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(request.timeoutMs > 0 ? request.timeoutMs : 10000);
    loop.exec();

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.error = QStringLiteral("Request timed out");
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    if (reply->error() != QNetworkReply::NoError && result.statusCode == 0) {
        result.error = reply->errorString();
        qCDebug(httpLog) << request.method << request.url.toString() << "failed:" << result.error;
        reply->deleteLater();
        return result;
    }

    if (result.statusCode >= 200 && result.statusCode < 300)
        result.ok = true;
    else
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);

    reply->deleteLater();
    return result;
}

HttpResult QtHttpTransport::stream(const HttpRequest &request,
                                   const ChunkHandler &onChunk,
                                   const std::atomic_bool &stop,
                                   int idleTimeoutMs)
{
    HttpResult result;
    if (!checkUrl(request, &result))
        return result;

    QNetworkAccessManager manager;
    QNetworkReply *reply = dispatch(manager, request);
    if (!reply) {
        result.error = QStringLiteral("Failed to create eventstream request");
        return result;
    }
    attachTrustValidator(reply, request);

    QEventLoop loop;
    QTimer poll;
    QElapsedTimer idle;
    bool idledOut = false;
    bool stopped = false;
    idle.start();

    QObject::connect(reply, &QNetworkReply::readyRead, &loop, [&]() {
        idle.restart();
        const int statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const QByteArray chunk = reply->readAll();
        if (statusCode >= 300) {
            result.payload.append(chunk);
            return;
        }
        if (!chunk.isEmpty() && onChunk)
            onChunk(chunk);
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (stop.load()) {
            stopped = true;
            reply->abort();
        } else if (idleTimeoutMs > 0 && idle.elapsed() > idleTimeoutMs) {
            idledOut = true;
            reply->abort();
        }
    });

    poll.start(kStreamPollIntervalMs);
    if (!reply->isFinished())
        loop.exec();
    poll.stop();

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (stopped) {
        result.error = QStringLiteral("Stream closed by client");
    } else if (idledOut) {
        result.error = QStringLiteral("No data for %1 ms").arg(idleTimeoutMs);
    } else if (reply->error() != QNetworkReply::NoError) {
        result.error = reply->errorString();
    } else if (result.statusCode >= 300) {
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    } else {
        result.ok = true;
        result.error = QStringLiteral("Stream ended by server");
    }

    reply->deleteLater();
    return result;
}

QUrl buildUrl(const QString &host, int port, bool useTls, const QString &path, QString *error)
{
    const QString trimmedHost = host.trimmed();
    if (trimmedHost.isEmpty()) {
        if (error)
            *error = QStringLiteral("Bridge host is empty");
        return {};
    }

    QUrl url;
    url.setScheme(useTls ? QStringLiteral("https") : QStringLiteral("http"));
    url.setHost(trimmedHost);
    url.setPort(port > 0 ? port : (useTls ? 443 : 80));
    if (path.startsWith(QLatin1Char('/')))
        url.setPath(path);
    else
        url.setPath(QStringLiteral("/") + path);

    if (!url.isValid() || url.host().isEmpty()) {
        if (error)
            *error = QStringLiteral("Invalid bridge address: %1").arg(trimmedHost);
        return {};
    }
    if (error)
        error->clear();
    return url;
}

} // namespace hueconnect
