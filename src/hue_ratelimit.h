#pragma once

#include <chrono>
#include <functional>
#include <mutex>

#include <QString>

#include "hue_types.h"

namespace hueconnect {

// Per resource class dispatch spacing. admit() reserves the next slot and
// returns how long the caller has to wait before sending; concurrent
// callers receive successive slots.
class RateLimiter
{
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    static constexpr std::chrono::milliseconds kDefaultDeviceInterval{100};
    static constexpr std::chrono::milliseconds kDefaultGroupInterval{1000};

    explicit RateLimiter(std::chrono::milliseconds deviceInterval = kDefaultDeviceInterval,
                         std::chrono::milliseconds groupInterval = kDefaultGroupInterval,
                         TimeSource now = TimeSource());

    std::chrono::milliseconds admit(ResourceClass resourceClass);

    std::chrono::milliseconds minimumInterval(ResourceClass resourceClass) const;

private:
    struct Bucket {
        std::chrono::milliseconds interval;
        Clock::time_point lastDispatch;
        bool used = false;
    };

    Bucket &bucketFor(ResourceClass resourceClass);

    mutable std::mutex m_mutex;
    Bucket m_device;
    Bucket m_group;
    TimeSource m_now;
};

// Classifies a CLIP v2 path such as /clip/v2/resource/grouped_light/<id>.
// Grouped lights, rooms, zones and the home are group writes; everything
// else addresses a single device.
ResourceClass resourceClassForPath(const QString &resourcePath);

// Splits /clip/v2/resource/<type>/<id>; returns false for other shapes.
bool parseResourcePath(const QString &resourcePath, QString *type, QString *id);

} // namespace hueconnect
