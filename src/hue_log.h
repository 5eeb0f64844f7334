#pragma once

#include <QLoggingCategory>

namespace hueconnect {

Q_DECLARE_LOGGING_CATEGORY(httpLog)
Q_DECLARE_LOGGING_CATEGORY(discoveryLog)
Q_DECLARE_LOGGING_CATEGORY(gatewayLog)
Q_DECLARE_LOGGING_CATEGORY(eventStreamLog)
Q_DECLARE_LOGGING_CATEGORY(statusLog)

// Shortens a response body for log output; appends " ..." when cut.
QString payloadSnippet(const QByteArray &payload, int maxBytes = 256);

} // namespace hueconnect
