#pragma once

#include <chrono>
#include <cstdlib>
#include <functional>
#include <string>
#include <thread>

namespace SFR {
namespace Test {
namespace Utils {

// Common Test Timing Constants
constexpr auto POLL_INTERVAL_MS = std::chrono::milliseconds(5);     // Polling interval for state checks
constexpr auto STANDARD_WAIT_MS = std::chrono::milliseconds(2000);  // Upper bound for async pipelines
constexpr auto SHORT_WAIT_MS = std::chrono::milliseconds(50);       // Window for "nothing happened" checks

/**
 * @brief Check if running under ThreadSanitizer in CI
 *
 * @return true if IN_DOCKER_TSAN is set to a truthy value (non-empty, not "0", not "false")
 */
inline bool isInDockerTsan() {
    const char *env = std::getenv("IN_DOCKER_TSAN");
    if (!env) {
        return false;
    }

    std::string value(env);
    return !value.empty() && value != "0" && value != "false";
}

/**
 * @brief Scale a timeout for instrumented builds
 */
inline std::chrono::milliseconds scaled(std::chrono::milliseconds timeout) {
    return isInDockerTsan() ? timeout * 4 : timeout;
}

/**
 * @brief Poll until predicate holds or the timeout expires
 *
 * @return Final value of predicate
 */
inline bool waitFor(const std::function<bool()> &predicate,
                    std::chrono::milliseconds timeout = STANDARD_WAIT_MS) {
    auto deadline = std::chrono::steady_clock::now() + scaled(timeout);
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return predicate();
        }
        std::this_thread::sleep_for(POLL_INTERVAL_MS);
    }
    return true;
}

}  // namespace Utils
}  // namespace Test
}  // namespace SFR
