#include "hue_trust.h"

#include <QDateTime>
#include <QFile>
#include <QHostAddress>
#include <QSslKey>

#include "hue_log.h"
#include "hue_types.h"

namespace hueconnect {

namespace {

QString distinguishedName(const QSslCertificate &certificate, bool issuer)
{
    const QList<QByteArray> attributes = issuer
        ? certificate.issuerInfoAttributes()
        : certificate.subjectInfoAttributes();

    QStringList parts;
    for (const QByteArray &attribute : attributes) {
        const QStringList values = issuer
            ? certificate.issuerInfo(attribute)
            : certificate.subjectInfo(attribute);
        parts.append(QString::fromLatin1(attribute) + QLatin1Char('=') + values.join(QLatin1Char('+')));
    }
    parts.sort();
    return parts.join(QLatin1Char(','));
}

bool isCurrentlyValid(const QSslCertificate &certificate)
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    if (certificate.effectiveDate().isValid() && now < certificate.effectiveDate())
        return false;
    if (certificate.expiryDate().isValid() && now > certificate.expiryDate())
        return false;
    return true;
}

bool inSubnet(const QHostAddress &address, const char *network, int prefix)
{
    return address.isInSubnet(QHostAddress(QString::fromLatin1(network)), prefix);
}

} // namespace

HueTrustPolicy::HueTrustPolicy(QList<QSslCertificate> anchors, PrivateNetworkFallback fallback)
    : m_anchors(std::move(anchors))
    , m_fallback(fallback)
{
}

bool HueTrustPolicy::shouldTrust(const CertificateChain &chain, const QString &hostAddress) const
{
    if (chainsToAnchor(chain) && leafMatchesIdentity(chain)) {
        qCDebug(httpLog) << "trusting certificate chain from" << hostAddress;
        return true;
    }

    if (m_fallback == PrivateNetworkFallback::Enabled && isPrivateNetworkAddress(hostAddress)) {
        qCInfo(httpLog) << "accepting unverified certificate from private address" << hostAddress;
        return true;
    }

    QString subject;
    if (!chain.certificates.isEmpty())
        subject = chain.certificates.first().subjectInfo(QSslCertificate::CommonName).join(QLatin1Char(','));
    qCWarning(httpLog) << "rejecting certificate from" << hostAddress << "subject" << subject
                       << "handshake errors" << chain.handshakeErrors.size();
    return false;
}

bool HueTrustPolicy::chainsToAnchor(const CertificateChain &chain) const
{
    if (chain.certificates.isEmpty() || m_anchors.isEmpty())
        return false;

    // Name mismatches are checked against the bridge id below; a bridge
    // reached by IP never matches its own host name.
    for (const QSslError &error : chain.handshakeErrors) {
        if (error.error() != QSslError::HostNameMismatch)
            return false;
    }

    for (int i = 0; i < chain.certificates.size(); ++i) {
        const QSslCertificate &certificate = chain.certificates.at(i);
        if (certificate.isNull() || !isCurrentlyValid(certificate) || impersonatesAnchor(certificate))
            return false;
        if (isAnchorOrIssuedByAnchor(certificate))
            return true;
        if (i + 1 < chain.certificates.size()
            && distinguishedName(certificate, true) != distinguishedName(chain.certificates.at(i + 1), false)) {
            return false;
        }
    }
    return false;
}

bool HueTrustPolicy::leafMatchesIdentity(const CertificateChain &chain) const
{
    if (chain.expectedIdentity.trimmed().isEmpty())
        return true;
    if (chain.certificates.isEmpty())
        return false;

    const QString expected = normalizeBridgeId(chain.expectedIdentity);
    const QStringList names = chain.certificates.first().subjectInfo(QSslCertificate::CommonName);
    for (const QString &name : names) {
        if (normalizeBridgeId(name) == expected)
            return true;
    }
    return false;
}

bool HueTrustPolicy::impersonatesAnchor(const QSslCertificate &certificate) const
{
    const QString subject = distinguishedName(certificate, false);
    for (const QSslCertificate &anchor : m_anchors) {
        if (subject == distinguishedName(anchor, false) && certificate.publicKey() != anchor.publicKey()) {
            qCWarning(httpLog) << "presented certificate reuses anchor name" << subject << "with another key";
            return true;
        }
    }
    return false;
}

bool HueTrustPolicy::isAnchorOrIssuedByAnchor(const QSslCertificate &certificate) const
{
    const QString issuer = distinguishedName(certificate, true);
    for (const QSslCertificate &anchor : m_anchors) {
        if (certificate == anchor)
            return true;
        if (issuer == distinguishedName(anchor, false) && isCurrentlyValid(anchor))
            return true;
    }
    return false;
}

bool HueTrustPolicy::loadAnchors(const QStringList &pemPaths,
                                 QList<QSslCertificate> *anchors,
                                 QString *error)
{
    if (!anchors)
        return false;

    for (const QString &path : pemPaths) {
        if (path.trimmed().isEmpty())
            continue;
        if (!QFile::exists(path)) {
            if (error)
                *error = QStringLiteral("Certificate file not found: %1").arg(path);
            return false;
        }
        const QList<QSslCertificate> loaded = QSslCertificate::fromPath(path, QSsl::Pem);
        if (loaded.isEmpty()) {
            if (error)
                *error = QStringLiteral("No PEM certificate in %1").arg(path);
            return false;
        }
        anchors->append(loaded);
    }

    if (error)
        error->clear();
    return true;
}

bool isPrivateNetworkAddress(const QString &host)
{
    QHostAddress address;
    if (!address.setAddress(host.trimmed()))
        return false;

    if (address.protocol() == QAbstractSocket::IPv6Protocol) {
        bool mapped = false;
        const quint32 ipv4 = address.toIPv4Address(&mapped);
        if (mapped)
            address = QHostAddress(ipv4);
    }

    if (address.protocol() == QAbstractSocket::IPv4Protocol) {
        return inSubnet(address, "10.0.0.0", 8)
            || inSubnet(address, "172.16.0.0", 12)
            || inSubnet(address, "192.168.0.0", 16)
            || inSubnet(address, "169.254.0.0", 16);
    }

    return inSubnet(address, "fc00::", 7) || inSubnet(address, "fe80::", 10);
}

} // namespace hueconnect
