#pragma once

#include <chrono>
#include <stop_token>

namespace playback_monitor {
namespace utils {

// min(max_delay, initial * 2^attempt); attempt counts from zero.
std::chrono::milliseconds exponential_backoff(int attempt,
                                              std::chrono::milliseconds initial,
                                              std::chrono::milliseconds max_delay);

// Sleeps for the given duration or until stop is requested on the token.
// Returns false when the wait was interrupted.
bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token token);

} // namespace utils
} // namespace playback_monitor
