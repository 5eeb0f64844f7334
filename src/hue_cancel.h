#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace hueconnect {

// Shared stop signal with an optional deadline. Copies observe the same
// state; a child is cancelled when its parent is.
class CancellationToken
{
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken();

    static CancellationToken withTimeout(std::chrono::milliseconds timeout);

    CancellationToken child(std::chrono::milliseconds timeout) const;

    void cancel() const;
    bool isCancelled() const;

    // Time left until the nearest deadline in the parent chain; nullopt
    // when no deadline is set.
    std::optional<std::chrono::milliseconds> remaining() const;

    // Clamps a per-request timeout to the time left before the deadline.
    int boundedTimeoutMs(int timeoutMs) const;

    // Sleeps in short slices; returns false if cancelled meanwhile.
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::atomic_bool cancelled{false};
        std::optional<Clock::time_point> deadline;
        std::shared_ptr<State> parent;
    };

    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> m_state;
};

} // namespace hueconnect
