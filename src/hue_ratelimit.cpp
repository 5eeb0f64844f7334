#include "hue_ratelimit.h"

#include <algorithm>

#include <QStringList>

namespace hueconnect {

namespace {
const QString kResourcePrefix = QStringLiteral("/clip/v2/resource/");
}

RateLimiter::RateLimiter(std::chrono::milliseconds deviceInterval,
                         std::chrono::milliseconds groupInterval,
                         TimeSource now)
    : m_device{deviceInterval, {}, false}
    , m_group{groupInterval, {}, false}
    , m_now(now ? std::move(now) : TimeSource([] { return Clock::now(); }))
{
}

std::chrono::milliseconds RateLimiter::admit(ResourceClass resourceClass)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Bucket &bucket = bucketFor(resourceClass);

    const Clock::time_point now = m_now();
    Clock::time_point slot = now;
    if (bucket.used)
        slot = std::max(now, bucket.lastDispatch + bucket.interval);

    bucket.lastDispatch = slot;
    bucket.used = true;
    return std::chrono::ceil<std::chrono::milliseconds>(slot - now);
}

std::chrono::milliseconds RateLimiter::minimumInterval(ResourceClass resourceClass) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return resourceClass == ResourceClass::Group ? m_group.interval : m_device.interval;
}

RateLimiter::Bucket &RateLimiter::bucketFor(ResourceClass resourceClass)
{
    return resourceClass == ResourceClass::Group ? m_group : m_device;
}

bool parseResourcePath(const QString &resourcePath, QString *type, QString *id)
{
    QString path = resourcePath.trimmed();
    if (!path.startsWith(QLatin1Char('/')))
        path.prepend(QLatin1Char('/'));
    if (!path.startsWith(kResourcePrefix))
        return false;

    const QStringList parts = path.mid(kResourcePrefix.size()).split(QLatin1Char('/'), Qt::SkipEmptyParts);
    if (parts.isEmpty())
        return false;
    if (type)
        *type = parts.at(0);
    if (id)
        *id = parts.size() > 1 ? parts.at(1) : QString();
    return true;
}

ResourceClass resourceClassForPath(const QString &resourcePath)
{
    QString type;
    if (!parseResourcePath(resourcePath, &type, nullptr))
        return ResourceClass::Device;

    if (type == QLatin1String("grouped_light")
        || type == QLatin1String("room")
        || type == QLatin1String("zone")
        || type == QLatin1String("bridge_home")) {
        return ResourceClass::Group;
    }
    return ResourceClass::Device;
}

} // namespace hueconnect
