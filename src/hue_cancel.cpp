#include "hue_cancel.h"

#include <algorithm>
#include <cstdint>
#include <thread>

namespace hueconnect {

namespace {
constexpr auto kSleepSlice = std::chrono::milliseconds(50);
}

CancellationToken::CancellationToken()
    : m_state(std::make_shared<State>())
{
}

CancellationToken::CancellationToken(std::shared_ptr<State> state)
    : m_state(std::move(state))
{
}

CancellationToken CancellationToken::withTimeout(std::chrono::milliseconds timeout)
{
    auto state = std::make_shared<State>();
    state->deadline = Clock::now() + timeout;
    return CancellationToken(std::move(state));
}

CancellationToken CancellationToken::child(std::chrono::milliseconds timeout) const
{
    auto state = std::make_shared<State>();
    state->deadline = Clock::now() + timeout;
    state->parent = m_state;
    return CancellationToken(std::move(state));
}

void CancellationToken::cancel() const
{
    m_state->cancelled.store(true);
}

bool CancellationToken::isCancelled() const
{
    const Clock::time_point now = Clock::now();
    for (const State *state = m_state.get(); state; state = state->parent.get()) {
        if (state->cancelled.load())
            return true;
        if (state->deadline && now >= *state->deadline)
            return true;
    }
    return false;
}

std::optional<std::chrono::milliseconds> CancellationToken::remaining() const
{
    std::optional<Clock::time_point> nearest;
    for (const State *state = m_state.get(); state; state = state->parent.get()) {
        if (state->deadline && (!nearest || *state->deadline < *nearest))
            nearest = state->deadline;
    }
    if (!nearest)
        return std::nullopt;

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*nearest - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

int CancellationToken::boundedTimeoutMs(int timeoutMs) const
{
    const auto left = remaining();
    if (!left)
        return timeoutMs;
    return static_cast<int>(std::min<std::int64_t>(timeoutMs, std::max<std::int64_t>(1, left->count())));
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const
{
    const Clock::time_point until = Clock::now() + duration;
    while (Clock::now() < until) {
        if (isCancelled())
            return false;
        std::this_thread::sleep_for(std::min<Clock::duration>(kSleepSlice, until - Clock::now()));
    }
    return !isCancelled();
}

} // namespace hueconnect
