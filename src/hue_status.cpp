#include "hue_status.h"

#include <vector>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

#include "hue_log.h"

namespace hueconnect {

namespace {

bool mentionsUnreachable(const QString &description)
{
    const QString lower = description.toLower();
    return lower.contains(QStringLiteral("communication issues"))
        || lower.contains(QStringLiteral("command may not have effect"))
        || lower.contains(QStringLiteral("unreachable"));
}

QStringList errorDescriptions(const QJsonDocument &doc)
{
    QStringList out;
    if (doc.isObject()) {
        const QJsonArray errors = doc.object().value(QStringLiteral("errors")).toArray();
        for (const QJsonValue &error : errors)
            out.append(error.toObject().value(QStringLiteral("description")).toString());
    } else if (doc.isArray()) {
        // v1 shaped answers: [{"error":{"type":..,"description":..}}]
        const QJsonArray entries = doc.array();
        for (const QJsonValue &entry : entries) {
            const QJsonObject error = entry.toObject().value(QStringLiteral("error")).toObject();
            if (!error.isEmpty())
                out.append(error.value(QStringLiteral("description")).toString());
        }
    }
    return out;
}

CommunicationStatus statusFromConnectivity(const QString &value)
{
    if (value == QLatin1String("connected"))
        return CommunicationStatus::Online;
    if (value == QLatin1String("disconnected"))
        return CommunicationStatus::Offline;
    if (value == QLatin1String("connectivity_issue") || value == QLatin1String("unidirectional_incoming"))
        return CommunicationStatus::Issues;
    return CommunicationStatus::Unknown;
}

} // namespace

CommunicationStatus CommunicationStatusTracker::status(const QString &deviceId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status.value(deviceId, CommunicationStatus::Unknown);
}

QHash<QString, CommunicationStatus> CommunicationStatusTracker::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

CommunicationStatus CommunicationStatusTracker::classifyWriteResponse(const QByteArray &body)
{
    const QJsonDocument doc = QJsonDocument::fromJson(body);
    const QStringList errors = errorDescriptions(doc);
    for (const QString &description : errors) {
        if (mentionsUnreachable(description))
            return CommunicationStatus::Issues;
    }
    return CommunicationStatus::Online;
}

bool CommunicationStatusTracker::isDeviceOwnedType(const QString &resourceType)
{
    static const QStringList kDeviceOwned = {
        QStringLiteral("device"),         QStringLiteral("light"),
        QStringLiteral("zigbee_connectivity"), QStringLiteral("zgp_connectivity"),
        QStringLiteral("motion"),         QStringLiteral("camera_motion"),
        QStringLiteral("temperature"),    QStringLiteral("light_level"),
        QStringLiteral("button"),         QStringLiteral("relative_rotary"),
        QStringLiteral("contact"),        QStringLiteral("tamper"),
        QStringLiteral("device_power"),   QStringLiteral("device_software_update"),
    };
    return kDeviceOwned.contains(resourceType);
}

void CommunicationStatusTracker::recordWriteResponse(const QString &resourceId, const QByteArray &body)
{
    if (resourceId.isEmpty())
        return;
    const CommunicationStatus status = classifyWriteResponse(body);
    if (status == CommunicationStatus::Issues)
        qCInfo(statusLog) << "write to" << resourceId << "reported unreachable device:" << payloadSnippet(body);
    update(deviceIdForResource(resourceId), status);
}

void CommunicationStatusTracker::recordEvent(const EventEnvelope &envelope)
{
    if (!envelope.resourceId.isEmpty() && !envelope.ownerId.isEmpty()
        && envelope.ownerType == QLatin1String("device"))
        linkResource(envelope.resourceId, envelope.ownerId);

    if (envelope.resourceType != QLatin1String("zigbee_connectivity"))
        return;

    const QString value = envelope.payload.value(QStringLiteral("status")).toString();
    const CommunicationStatus status = statusFromConnectivity(value);
    if (status == CommunicationStatus::Unknown) {
        if (!value.isEmpty())
            qCDebug(statusLog) << "ignoring zigbee_connectivity status" << value;
        return;
    }

    const QString deviceId = !envelope.ownerId.isEmpty() ? envelope.ownerId
                                                         : deviceIdForResource(envelope.resourceId);
    update(deviceId, status);
}

void CommunicationStatusTracker::linkResource(const QString &resourceId, const QString &deviceId)
{
    if (resourceId.isEmpty() || deviceId.isEmpty() || resourceId == deviceId)
        return;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_ownerByResource.insert(resourceId, deviceId);
}

QString CommunicationStatusTracker::deviceIdForResource(const QString &resourceId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ownerByResource.value(resourceId, resourceId);
}

int CommunicationStatusTracker::subscribe(ChangeHandler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const int id = m_nextHandlerId++;
    m_handlers.emplace(id, std::move(handler));
    return id;
}

void CommunicationStatusTracker::unsubscribe(int id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers.erase(id);
}

void CommunicationStatusTracker::update(const QString &deviceId, CommunicationStatus status)
{
    if (deviceId.isEmpty())
        return;

    CommunicationStatus previous = CommunicationStatus::Unknown;
    std::vector<ChangeHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_status.value(deviceId, CommunicationStatus::Unknown);
        if (previous == status)
            return;
        m_status.insert(deviceId, status);
        for (const auto &entry : m_handlers)
            handlers.push_back(entry.second);
    }

    qCInfo(statusLog) << "device" << deviceId << toString(previous) << "->" << toString(status);
    for (const ChangeHandler &handler : handlers) {
        if (handler)
            handler(deviceId, previous, status);
    }
}

} // namespace hueconnect
