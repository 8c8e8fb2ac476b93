#include "playback_monitor/core/session_state.hpp"

#include <algorithm>
#include <cmath>

namespace playback_monitor::core {

bool is_legal_transition(SessionState from, SessionState to) {
    if (from == to) {
        return false;
    }

    switch (from) {
        case SessionState::Starting:
            return to != SessionState::Starting;
        case SessionState::Playing:
        case SessionState::Paused:
        case SessionState::Buffering:
            return to != SessionState::Starting;
        case SessionState::Error:
            return to == SessionState::Stopped;
        case SessionState::Stopped:
            return false;
    }
    return false;
}

bool is_terminal(SessionState state) {
    return state == SessionState::Stopped;
}

int compute_watched_percent(std::int64_t position_ms, std::int64_t duration_ms) {
    if (duration_ms <= 0 || position_ms <= 0) {
        return 0;
    }
    const double ratio = static_cast<double>(position_ms) / static_cast<double>(duration_ms);
    const auto percent = static_cast<int>(std::lround(ratio * 100.0));
    return std::clamp(percent, 0, 100);
}

std::uint64_t RevisionClock::next() {
    return next(Clock::now());
}

std::uint64_t RevisionClock::next(TimePoint now) {
    const auto wall = static_cast<std::uint64_t>(std::max<std::int64_t>(to_epoch_ms(now), 0));
    auto last = m_last.load();
    std::uint64_t candidate;
    do {
        candidate = std::max(wall, last + 1);
    } while (!m_last.compare_exchange_weak(last, candidate));
    return candidate;
}

} // namespace playback_monitor::core
