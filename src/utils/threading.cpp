#include "playback_monitor/utils/threading.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace playback_monitor {
namespace utils {

std::chrono::milliseconds exponential_backoff(int attempt,
                                              std::chrono::milliseconds initial,
                                              std::chrono::milliseconds max_delay) {
    if (initial.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    auto delay = initial;
    for (int i = 0; i < attempt && delay < max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay);
}

bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token token) {
    if (token.stop_requested()) {
        return false;
    }
    if (duration.count() <= 0) {
        return true;
    }

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, token, duration, [] { return false; });
    return !token.stop_requested();
}

} // namespace utils
} // namespace playback_monitor
