#include <catch2/catch.hpp>

#include <QSslCertificate>
#include <QSslError>

#include "hue_trust.h"

using namespace hueconnect;

namespace {

QSslCertificate loadCertificate(const char *name)
{
    const QString path = QStringLiteral(HUECONNECT_TEST_DATA_DIR "/") + QString::fromLatin1(name);
    const QList<QSslCertificate> certificates = QSslCertificate::fromPath(path, QSsl::Pem);
    REQUIRE(certificates.size() == 1);
    return certificates.first();
}

CertificateChain chainOf(std::initializer_list<const char *> names, const QString &identity = QString())
{
    CertificateChain chain;
    for (const char *name : names)
        chain.certificates.append(loadCertificate(name));
    chain.expectedIdentity = identity;
    return chain;
}

HueTrustPolicy hueAnchors(PrivateNetworkFallback fallback)
{
    return HueTrustPolicy({loadCertificate("legacy_root.pem"), loadCertificate("public_root.pem")}, fallback);
}

const QString kBridgeId = QStringLiteral("ECB5FAFFFE000001");

} // namespace

TEST_CASE("Trust: chains issued by a configured anchor are trusted", "[trust]") {
    const HueTrustPolicy policy = hueAnchors(PrivateNetworkFallback::Disabled);

    SECTION("legacy root") {
        REQUIRE(policy.shouldTrust(chainOf({"legacy_leaf.pem"}, kBridgeId), QStringLiteral("203.0.113.7")));
    }
    SECTION("public root, leaf plus root presented") {
        REQUIRE(policy.shouldTrust(chainOf({"public_leaf.pem", "public_root.pem"}, kBridgeId),
                                   QStringLiteral("203.0.113.7")));
    }
    SECTION("identity compares case-insensitively and ignores separators") {
        REQUIRE(policy.shouldTrust(chainOf({"legacy_leaf.pem"}, QStringLiteral("ec:b5:fa:ff:fe:00:00:01")),
                                   QStringLiteral("203.0.113.7")));
    }
    SECTION("no known identity skips the common name check") {
        REQUIRE(policy.shouldTrust(chainOf({"other_bridge_leaf.pem"}), QStringLiteral("203.0.113.7")));
    }
    SECTION("host name mismatch alone is tolerated") {
        CertificateChain chain = chainOf({"legacy_leaf.pem"}, kBridgeId);
        chain.handshakeErrors.append(QSslError(QSslError::HostNameMismatch, chain.certificates.first()));
        REQUIRE(policy.shouldTrust(chain, QStringLiteral("203.0.113.7")));
    }
}

TEST_CASE("Trust: strict check rejections", "[trust]") {
    const HueTrustPolicy policy = hueAnchors(PrivateNetworkFallback::Disabled);

    SECTION("self-signed leaf") {
        REQUIRE_FALSE(policy.chainsToAnchor(chainOf({"self_signed.pem"}, kBridgeId)));
    }
    SECTION("unknown root with the same common name") {
        REQUIRE_FALSE(policy.chainsToAnchor(chainOf({"unknown_leaf.pem", "unknown_root.pem"}, kBridgeId)));
    }
    SECTION("presented root copies an anchor's name with its own key") {
        const CertificateChain chain = chainOf({"impostor_leaf.pem", "impostor_root.pem"}, kBridgeId);
        REQUIRE(chain.handshakeErrors.isEmpty());
        REQUIRE_FALSE(policy.chainsToAnchor(chain));
        REQUIRE_FALSE(policy.shouldTrust(chain, QStringLiteral("203.0.113.7")));
    }
    SECTION("a presented copy of the anchor itself is fine") {
        REQUIRE(policy.chainsToAnchor(chainOf({"legacy_leaf.pem", "legacy_root.pem"}, kBridgeId)));
    }
    SECTION("leaf of another bridge") {
        const CertificateChain chain = chainOf({"other_bridge_leaf.pem"}, kBridgeId);
        REQUIRE(policy.chainsToAnchor(chain));
        REQUIRE_FALSE(policy.leafMatchesIdentity(chain));
        REQUIRE_FALSE(policy.shouldTrust(chain, QStringLiteral("203.0.113.7")));
    }
    SECTION("other handshake errors") {
        CertificateChain chain = chainOf({"legacy_leaf.pem"}, kBridgeId);
        chain.handshakeErrors.append(QSslError(QSslError::CertificateUntrusted, chain.certificates.first()));
        REQUIRE_FALSE(policy.chainsToAnchor(chain));
    }
    SECTION("empty chain") {
        REQUIRE_FALSE(policy.shouldTrust(CertificateChain(), QStringLiteral("203.0.113.7")));
    }
}

TEST_CASE("Trust: private network fallback", "[trust][fallback]") {
    const CertificateChain selfSigned = chainOf({"self_signed.pem"}, kBridgeId);

    SECTION("enabled: private literals are accepted") {
        const HueTrustPolicy policy = hueAnchors(PrivateNetworkFallback::Enabled);
        CHECK(policy.shouldTrust(selfSigned, QStringLiteral("192.168.1.20")));
        CHECK(policy.shouldTrust(selfSigned, QStringLiteral("10.1.2.3")));
        CHECK(policy.shouldTrust(selfSigned, QStringLiteral("172.20.0.9")));
        CHECK(policy.shouldTrust(selfSigned, QStringLiteral("169.254.10.10")));
        CHECK(policy.shouldTrust(selfSigned, QStringLiteral("fd12:3456::1")));
        CHECK(policy.shouldTrust(selfSigned, QStringLiteral("fe80::1")));
    }

    SECTION("enabled: public addresses and host names stay rejected") {
        const HueTrustPolicy policy = hueAnchors(PrivateNetworkFallback::Enabled);
        CHECK_FALSE(policy.shouldTrust(selfSigned, QStringLiteral("203.0.113.7")));
        CHECK_FALSE(policy.shouldTrust(selfSigned, QStringLiteral("172.32.0.1")));
        CHECK_FALSE(policy.shouldTrust(selfSigned, QStringLiteral("2001:db8::1")));
        CHECK_FALSE(policy.shouldTrust(selfSigned, QStringLiteral("bridge.example.com")));
    }

    SECTION("disabled: private literals need a valid chain too") {
        const HueTrustPolicy policy = hueAnchors(PrivateNetworkFallback::Disabled);
        CHECK_FALSE(policy.shouldTrust(selfSigned, QStringLiteral("192.168.1.20")));
    }
}

TEST_CASE("Trust: private address classification", "[trust]") {
    CHECK(isPrivateNetworkAddress(QStringLiteral("192.168.0.1")));
    CHECK(isPrivateNetworkAddress(QStringLiteral("::ffff:10.0.0.5")));
    CHECK_FALSE(isPrivateNetworkAddress(QStringLiteral("8.8.8.8")));
    CHECK_FALSE(isPrivateNetworkAddress(QStringLiteral("localhost")));
    CHECK_FALSE(isPrivateNetworkAddress(QString()));
}

TEST_CASE("Trust: anchors load from PEM files", "[trust][settings]") {
    QList<QSslCertificate> anchors;
    QString error;
    REQUIRE(HueTrustPolicy::loadAnchors({QStringLiteral(HUECONNECT_TEST_DATA_DIR "/legacy_root.pem"), QString()},
                                        &anchors, &error));
    REQUIRE(anchors.size() == 1);
    REQUIRE(error.isEmpty());

    REQUIRE_FALSE(HueTrustPolicy::loadAnchors({QStringLiteral(HUECONNECT_TEST_DATA_DIR "/missing.pem")},
                                              &anchors, &error));
    REQUIRE(error.contains(QStringLiteral("missing.pem")));
}
