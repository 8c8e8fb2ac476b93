#pragma once

#define PLAYBACK_MONITOR_VERSION_MAJOR 1
#define PLAYBACK_MONITOR_VERSION_MINOR 0
#define PLAYBACK_MONITOR_VERSION_PATCH 0

#define PLAYBACK_MONITOR_STRINGIFY(x) #x
#define PLAYBACK_MONITOR_TOSTRING(x) PLAYBACK_MONITOR_STRINGIFY(x)

// "MAJOR.MINOR.PATCH"
#define PLAYBACK_MONITOR_VERSION_STRING \
    PLAYBACK_MONITOR_TOSTRING(PLAYBACK_MONITOR_VERSION_MAJOR) "." \
    PLAYBACK_MONITOR_TOSTRING(PLAYBACK_MONITOR_VERSION_MINOR) "." \
    PLAYBACK_MONITOR_TOSTRING(PLAYBACK_MONITOR_VERSION_PATCH)
