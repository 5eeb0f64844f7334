#pragma once

#include <optional>

#include <QByteArray>
#include <QString>
#include <QUrl>

#include "hue_cancel.h"
#include "hue_http.h"
#include "hue_types.h"

namespace hueconnect {

// Confirms that an address hosts a bridge and reads its identity. A
// negative answer is std::nullopt and means "keep scanning".
class BridgeValidator
{
public:
    static constexpr int kConfigTimeoutMs = 4000;
    static constexpr int kDescriptionTimeoutMs = 3000;

    explicit BridgeValidator(HttpTransport &http);

    // Tries /api/0/config first, then /description.xml.
    std::optional<ConfirmedBridge> validate(const QString &address,
                                            const CancellationToken &token = CancellationToken()) const;

    // Validates a device description URL announced via SSDP.
    std::optional<ConfirmedBridge> validateLocation(const QUrl &location,
                                                    const CancellationToken &token = CancellationToken()) const;

    static std::optional<ConfirmedBridge> parseConfig(const QByteArray &payload, const QString &address);
    static std::optional<ConfirmedBridge> parseDescription(const QByteArray &xml,
                                                           const QString &address,
                                                           int port);
    static bool looksLikeBridgeDescription(const QString &xml);

private:
    std::optional<ConfirmedBridge> probeConfig(const QString &address, const CancellationToken &token) const;
    std::optional<ConfirmedBridge> probeDescription(const QUrl &url, const CancellationToken &token) const;

    HttpTransport &m_http;
};

} // namespace hueconnect
