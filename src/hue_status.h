#pragma once

#include <functional>
#include <map>
#include <mutex>

#include <QByteArray>
#include <QHash>
#include <QString>

#include "hue_types.h"

namespace hueconnect {

// Per-device reachability derived from write responses and connectivity
// events. Devices never observed report Unknown; nothing degrades on a
// timer.
class CommunicationStatusTracker
{
public:
    using ChangeHandler = std::function<void(const QString &deviceId,
                                             CommunicationStatus previous,
                                             CommunicationStatus current)>;

    CommunicationStatus status(const QString &deviceId) const;
    QHash<QString, CommunicationStatus> snapshot() const;

    // resourceId may name the device itself or one of its services.
    void recordWriteResponse(const QString &resourceId, const QByteArray &body);
    void recordEvent(const EventEnvelope &envelope);

    void linkResource(const QString &resourceId, const QString &deviceId);
    QString deviceIdForResource(const QString &resourceId) const;

    int subscribe(ChangeHandler handler);
    void unsubscribe(int id);

    // Online when the body reports no errors or errors unrelated to
    // reachability, Issues when an error says the device did not answer.
    static CommunicationStatus classifyWriteResponse(const QByteArray &body);

    // True for the device resource and the services a device owns. Scenes,
    // automations and groups never carry a reachability state.
    static bool isDeviceOwnedType(const QString &resourceType);

private:
    void update(const QString &deviceId, CommunicationStatus status);

    mutable std::mutex m_mutex;
    QHash<QString, CommunicationStatus> m_status;
    QHash<QString, QString> m_ownerByResource;
    std::map<int, ChangeHandler> m_handlers;
    int m_nextHandlerId = 1;
};

} // namespace hueconnect
