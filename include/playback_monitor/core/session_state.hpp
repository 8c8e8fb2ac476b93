#pragma once

#include "playback_monitor/core/models.hpp"
#include <atomic>
#include <cstdint>

namespace playback_monitor::core {

// Transition table of the session state machine. Self transitions are not
// edges; they are treated as touches by the reconciler.
//
//   starting  -> playing | paused | buffering | error | stopped
//   playing   -> paused | buffering | error | stopped
//   paused    -> playing | buffering | error | stopped
//   buffering -> playing | paused | error | stopped
//   error     -> stopped
//   stopped   -> (terminal)
bool is_legal_transition(SessionState from, SessionState to);

bool is_terminal(SessionState state);

// Percentage of the item covered by the final position, clamped to [0, 100].
// Unknown durations yield 0.
int compute_watched_percent(std::int64_t position_ms, std::int64_t duration_ms);

// Produces strictly increasing revisions for one producer, based on the
// wall clock in milliseconds so revisions from different producers compare.
class RevisionClock {
public:
    std::uint64_t next();
    std::uint64_t next(TimePoint now);

private:
    std::atomic<std::uint64_t> m_last{0};
};

} // namespace playback_monitor::core
