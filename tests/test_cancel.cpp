#include <catch2/catch.hpp>

#include <thread>

#include "hue_cancel.h"

using namespace hueconnect;
using namespace std::chrono_literals;

TEST_CASE("CancellationToken: copies share state", "[cancel]") {
    CancellationToken token;
    const CancellationToken copy = token;
    REQUIRE_FALSE(copy.isCancelled());
    token.cancel();
    REQUIRE(copy.isCancelled());
    REQUIRE_FALSE(token.remaining().has_value());
}

TEST_CASE("CancellationToken: children follow their parent", "[cancel]") {
    CancellationToken parent;
    const CancellationToken child = parent.child(10s);
    REQUIRE_FALSE(child.isCancelled());
    parent.cancel();
    REQUIRE(child.isCancelled());

    const CancellationToken other = CancellationToken().child(10s);
    other.cancel();
    REQUIRE(other.isCancelled());
}

TEST_CASE("CancellationToken: deadlines bound timeouts and sleeps", "[cancel]") {
    const CancellationToken token = CancellationToken::withTimeout(150ms);
    REQUIRE(token.boundedTimeoutMs(4000) <= 150);
    REQUIRE(token.boundedTimeoutMs(20) == 20);

    REQUIRE_FALSE(token.sleepFor(5s));
    REQUIRE(token.isCancelled());
    REQUIRE(token.boundedTimeoutMs(4000) == 1);
}

TEST_CASE("CancellationToken: sleep is interrupted by cancel", "[cancel][threads]") {
    CancellationToken token;
    std::thread canceller([token]() {
        std::this_thread::sleep_for(50ms);
        token.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(token.sleepFor(5s));
    REQUIRE(std::chrono::steady_clock::now() - start < 2s);
    canceller.join();
}
