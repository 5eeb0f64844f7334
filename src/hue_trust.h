#pragma once

#include <QList>
#include <QSslCertificate>
#include <QSslError>
#include <QString>
#include <QStringList>

namespace hueconnect {

// What a TLS handshake presented: the peer chain (leaf first), the errors
// Qt reported after validating it against the configured anchors, and the
// identity the client expected (bridge id, may be empty).
//
// Signatures are not re-verified here. A chain built by hand must carry the
// errors of a real verification (QSslCertificate::verify) in
// handshakeErrors; an empty list asserts the signatures are sound.
struct CertificateChain {
    QList<QSslCertificate> certificates;
    QList<QSslError> handshakeErrors;
    QString expectedIdentity;
};

class TrustValidator
{
public:
    virtual ~TrustValidator() = default;

    virtual bool shouldTrust(const CertificateChain &chain, const QString &hostAddress) const = 0;
};

// Accepting unverifiable certificates from home-network addresses is a
// compatibility concession for bridges with self-signed certificates. It
// can be switched off per installation.
enum class PrivateNetworkFallback {
    Enabled,
    Disabled,
};

class HueTrustPolicy final : public TrustValidator
{
public:
    explicit HueTrustPolicy(QList<QSslCertificate> anchors,
                            PrivateNetworkFallback fallback = PrivateNetworkFallback::Enabled);

    bool shouldTrust(const CertificateChain &chain, const QString &hostAddress) const override;

    bool chainsToAnchor(const CertificateChain &chain) const;
    bool leafMatchesIdentity(const CertificateChain &chain) const;

    const QList<QSslCertificate> &anchors() const { return m_anchors; }
    PrivateNetworkFallback fallback() const { return m_fallback; }

    // Loads every PEM certificate found at the given paths. Missing files
    // are an error; an empty path is skipped.
    static bool loadAnchors(const QStringList &pemPaths,
                            QList<QSslCertificate> *anchors,
                            QString *error = nullptr);

private:
    bool isAnchorOrIssuedByAnchor(const QSslCertificate &certificate) const;
    // Same subject as an anchor but a different key.
    bool impersonatesAnchor(const QSslCertificate &certificate) const;

    QList<QSslCertificate> m_anchors;
    PrivateNetworkFallback m_fallback;
};

// True for IP literals inside private, link-local or unique-local ranges.
// Host names are never considered private.
bool isPrivateNetworkAddress(const QString &host);

} // namespace hueconnect
